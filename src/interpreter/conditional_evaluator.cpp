#include "conditional_evaluator.h"

#include <regex>

#include "error_out.h"

namespace conditional_evaluator {

ExecResult execute_if(const ast::IfStatement& statement, const BlockRunner& run_condition,
                      const BlockRunner& run_body) {
    ExecResult condition = run_condition(statement.condition);
    if (!condition.is_normal()) {
        return condition;
    }
    if (condition.exit_status() == 0) {
        return run_body(statement.consequence);
    }

    for (const auto& clause : statement.elif_clauses) {
        ExecResult elif_condition = run_condition(clause.condition);
        if (!elif_condition.is_normal()) {
            return elif_condition;
        }
        if (elif_condition.exit_status() == 0) {
            return run_body(clause.consequence);
        }
    }

    if (statement.alternative.has_value()) {
        return run_body(*statement.alternative);
    }
    return ExecResult::normal(0);
}

namespace {

bool is_unary_test(const std::string& op) {
    static const char* const kUnary[] = {"-z", "-n", "-e", "-f", "-d", "-r", "-w", "-x",
                                         "-s", "-L", "-h", "-p", "-b", "-c", "-S", "-u",
                                         "-g", "-k", "-O", "-G", "-N", "-t", "-v"};
    for (const char* candidate : kUnary) {
        if (op == candidate) {
            return true;
        }
    }
    return false;
}

bool is_binary_test(const std::string& op) {
    return op == "==" || op == "=" || op == "!=" || op == "=~" || op == "<" || op == ">" ||
           op == "-eq" || op == "-ne" || op == "-lt" || op == "-le" || op == "-gt" ||
           op == "-ge" || op == "-ef" || op == "-nt" || op == "-ot";
}

class DoubleBracketParser {
   public:
    DoubleBracketParser(const std::vector<ConditionOperand>& operands, const TestPrimary& test,
                        const PatternMatcher& matcher)
        : operands_(operands), test_(test), matcher_(matcher) {
    }

    bool parse() {
        if (operands_.empty()) {
            fail("expression expected");
        }
        bool result = parse_or();
        if (pos_ < operands_.size()) {
            fail("unexpected argument `" + operands_[pos_].text + "'");
        }
        return result;
    }

   private:
    const std::vector<ConditionOperand>& operands_;
    const TestPrimary& test_;
    const PatternMatcher& matcher_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& message) const {
        throw ExecutionError(ErrorType::SYNTAX_ERROR, "[[", message, 2);
    }

    bool at_operator(const char* op) const {
        return pos_ < operands_.size() && !operands_[pos_].quoted && operands_[pos_].text == op;
    }

    const ConditionOperand& take() {
        if (pos_ >= operands_.size()) {
            fail("argument expected");
        }
        return operands_[pos_++];
    }

    bool parse_or() {
        bool result = parse_and();
        while (at_operator("||")) {
            ++pos_;
            bool rhs = parse_and();
            result = result || rhs;
        }
        return result;
    }

    bool parse_and() {
        bool result = parse_not();
        while (at_operator("&&")) {
            ++pos_;
            bool rhs = parse_not();
            result = result && rhs;
        }
        return result;
    }

    bool parse_not() {
        if (at_operator("!")) {
            ++pos_;
            return !parse_not();
        }
        return parse_primary();
    }

    bool parse_primary() {
        if (at_operator("(")) {
            ++pos_;
            bool result = parse_or();
            if (!at_operator(")")) {
                fail("expected `)'");
            }
            ++pos_;
            return result;
        }

        if (pos_ + 2 < operands_.size() && !operands_[pos_ + 1].quoted &&
            is_binary_test(operands_[pos_ + 1].text)) {
            const ConditionOperand& lhs = take();
            const std::string op = take().text;
            const ConditionOperand& rhs = take();
            return evaluate_binary(lhs, op, rhs);
        }

        const ConditionOperand& first = take();
        if (!first.quoted && is_unary_test(first.text) && pos_ < operands_.size()) {
            const ConditionOperand& arg = take();
            return test_({first.text, arg.text}) == 0;
        }
        return !first.text.empty();
    }

    bool evaluate_binary(const ConditionOperand& lhs, const std::string& op,
                         const ConditionOperand& rhs) {
        if (op == "==" || op == "=") {
            return matcher_.matches_single_pattern(lhs.text, rhs.pattern);
        }
        if (op == "!=") {
            return !matcher_.matches_single_pattern(lhs.text, rhs.pattern);
        }
        if (op == "=~") {
            try {
                std::regex expression(rhs.text, std::regex::extended);
                return std::regex_search(lhs.text, expression);
            } catch (const std::regex_error&) {
                throw ExecutionError(ErrorType::INVALID_EXPRESSION, "[[",
                                     rhs.text + ": invalid regular expression", 2);
            }
        }
        if (op == "<") {
            return lhs.text < rhs.text;
        }
        if (op == ">") {
            return lhs.text > rhs.text;
        }
        return test_({lhs.text, op, rhs.text}) == 0;
    }
};

}  // namespace

int evaluate_double_bracket(const std::vector<ConditionOperand>& operands,
                            const TestPrimary& test_primary, const PatternMatcher& matcher) {
    DoubleBracketParser parser(operands, test_primary, matcher);
    return parser.parse() ? 0 : 1;
}

}  // namespace conditional_evaluator
