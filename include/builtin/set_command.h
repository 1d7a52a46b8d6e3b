#pragma once

#include <string>
#include <vector>

#include "builtin.h"

// set [-+euxvC] [-+o option] [--] [ARG ...]
ExecResult set_command(const std::vector<std::string>& args, BuiltinContext& ctx);
