#pragma once

#include <string>
#include <vector>

#include "builtin.h"

// cd [DIR]; `cd -` returns to OLDPWD and prints it. Updates PWD and OLDPWD.
ExecResult cd_command(const std::vector<std::string>& args, BuiltinContext& ctx);

// Absolute, symlink-resolved form of dir relative to current_directory.
std::string resolve_directory(const std::string& dir, const std::string& current_directory);
