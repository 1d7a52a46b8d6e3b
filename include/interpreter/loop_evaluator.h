/*
  loop_evaluator.h

  This file is part of esh, an embeddable shell

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "ast.h"
#include "exec_result.h"

namespace loop_evaluator {

using BlockRunner = std::function<ExecResult(const ast::BlockStatement&)>;

enum class LoopFlow : std::uint8_t {
    NONE,
    CONTINUE,
    BREAK
};

struct LoopCommandOutcome {
    LoopFlow flow;
    // Set when the result has to leave the loop: an exit, a failure, or a break/continue
    // aimed at an outer loop with one level already consumed.
    bool propagate;
    ExecResult result;
};

// Applies one body or condition result to the enclosing loop. Break and continue at level 1
// are consumed here; deeper levels leave the loop with one level fewer.
LoopCommandOutcome handle_loop_command_result(const ExecResult& result);

// Runs body once per item; assign binds the loop variable before each pass.
ExecResult execute_for(const std::vector<std::string>& items,
                       const std::function<void(const std::string&)>& assign,
                       const ast::BlockStatement& body, const BlockRunner& run_body);

// while/until. The condition runner is expected to suppress errexit; a failing condition ends
// a while loop normally.
ExecResult execute_condition_loop(const ast::WhileStatement& loop, const BlockRunner& run_condition,
                                  const BlockRunner& run_body);

}  // namespace loop_evaluator
