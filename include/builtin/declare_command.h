#pragma once

#include <string>
#include <vector>

#include "builtin.h"

// declare / typeset [-aAxp] [NAME[=VALUE] ...]
ExecResult declare_command(const std::vector<std::string>& args, BuiltinContext& ctx);
