/*
  function_evaluator.h

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

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "ast.h"
#include "environment.h"
#include "exec_result.h"

namespace function_evaluator {

using FunctionBody = std::shared_ptr<const ast::BlockStatement>;
using FunctionMap = std::unordered_map<std::string, FunctionBody>;

bool has_function(const FunctionMap& functions, const std::string& name);

// Sorted.
std::vector<std::string> get_function_names(const FunctionMap& functions);

// Variable snapshot for one function call. On destruction every key present in the snapshot
// except $! and $? gets its snapshot value back and positional keys the snapshot lacked are
// removed. Keys first created inside the call stay set for the caller.
class FunctionScope {
   public:
    FunctionScope(Environment& env, const std::vector<std::string>& args);
    ~FunctionScope();

    FunctionScope(const FunctionScope&) = delete;
    FunctionScope& operator=(const FunctionScope&) = delete;

   private:
    Environment& env_;
    Environment::VariableMap snapshot_;
};

// args[0] is the function name; $1.. are bound to the rest for the duration of the body.
ExecResult invoke_function(
    const ast::BlockStatement& body, Environment& env, const std::vector<std::string>& args,
    const std::function<ExecResult(const ast::BlockStatement&)>& execute_block);

}  // namespace function_evaluator
