#pragma once

#include <string>
#include <vector>

#include "builtin.h"

// echo [-n] [-e|-E] [STRING ...]
ExecResult echo_command(const std::vector<std::string>& args, BuiltinContext& ctx);

// Backslash escapes understood by `echo -e`. Sets stop_output at `\c`.
std::string process_escape_sequences(const std::string& input, bool& stop_output);
