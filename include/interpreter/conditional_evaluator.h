#pragma once

#include <functional>
#include <string>
#include <vector>

#include "ast.h"
#include "exec_result.h"
#include "pattern_matcher.h"

namespace conditional_evaluator {

using BlockRunner = std::function<ExecResult(const ast::BlockStatement&)>;

ExecResult execute_if(const ast::IfStatement& statement, const BlockRunner& run_condition,
                      const BlockRunner& run_body);

// One expanded word between [[ and ]]. pattern keeps quoted characters escaped; operators are
// recognized only in unquoted words.
struct ConditionOperand {
    std::string text;
    std::string pattern;
    bool quoted = false;
};

using TestPrimary = std::function<int(const std::vector<std::string>&)>;

// Evaluates a [[ ... ]] expression: `!`, `&&`, `||` and parentheses, `==`/`!=` pattern
// matching, `=~` regular expressions and `<`/`>` string ordering. Every other primary goes to
// test_primary. Returns 0 for true and 1 for false; a malformed expression throws
// ExecutionError with status 2.
int evaluate_double_bracket(const std::vector<ConditionOperand>& operands,
                            const TestPrimary& test_primary, const PatternMatcher& matcher);

}  // namespace conditional_evaluator
