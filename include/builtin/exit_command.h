#pragma once

#include <string>
#include <vector>

#include "builtin.h"

// exit [N]; N defaults to $?.
ExecResult exit_command(const std::vector<std::string>& args, BuiltinContext& ctx);
