#pragma once

#include <string>
#include <vector>

#include "builtin.h"

ExecResult pwd_command(const std::vector<std::string>& args, BuiltinContext& ctx);
