#pragma once

#include <string>
#include <vector>

#include "builtin.h"

// unset [-v|-f] NAME ...
ExecResult unset_command(const std::vector<std::string>& args, BuiltinContext& ctx);
