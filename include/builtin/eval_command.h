#pragma once

#include <string>
#include <vector>

#include "builtin.h"

// eval [ARG ...]: joins the arguments with spaces and runs them in the current session.
ExecResult eval_command(const std::vector<std::string>& args, BuiltinContext& ctx);
