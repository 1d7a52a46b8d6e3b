#pragma once

#include <string>
#include <vector>

#include "builtin.h"

// break [N] / continue [N]. The executor ignores the signal outside any loop.
ExecResult break_command(const std::vector<std::string>& args, BuiltinContext& ctx);
ExecResult continue_command(const std::vector<std::string>& args, BuiltinContext& ctx);
