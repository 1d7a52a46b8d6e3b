#pragma once

#include <string>
#include <vector>

#include "builtin.h"

// test EXPRESSION / [ EXPRESSION ]
ExecResult test_command(const std::vector<std::string>& args, BuiltinContext& ctx);

// Evaluates the operands of a test expression (without the command word or closing `]`).
// Returns 0 for true, 1 for false and 2 for a malformed expression. env resolves `-v NAME` and
// may be null.
int evaluate_test_expression(const std::vector<std::string>& args, const Environment* env);
