/*
  case_evaluator.h

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
#include <string>

#include "ast.h"
#include "exec_result.h"
#include "pattern_matcher.h"

namespace case_evaluator {

// Trims surrounding blanks. A trailing blank escaped with a backslash is kept.
std::string normalize_case_value(const std::string& value);
std::string normalize_case_pattern(const std::string& pattern);

// Runs the clauses selected by value. `;;` stops after a body, `;&` runs the next body without
// testing it, `;;&` resumes testing with the next clause. The status is the last body's, or 0
// when nothing matched.
ExecResult execute_case(const ast::CaseStatement& statement, const std::string& value,
                        const std::function<std::string(const ast::Word&)>& expand_pattern,
                        const PatternMatcher& matcher,
                        const std::function<ExecResult(const ast::BlockStatement&)>& run_body);

}  // namespace case_evaluator
