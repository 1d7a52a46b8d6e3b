#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>

#include "arithmetic_evaluator.h"
#include "error_out.h"

namespace {

class ArithmeticTest : public ::testing::Test {
   protected:
    std::map<std::string, std::string> vars;
    ArithmeticEvaluator evaluator{
        [this](const std::string& name) -> std::optional<std::string> {
            auto it = vars.find(name);
            if (it == vars.end()) {
                return std::nullopt;
            }
            return it->second;
        },
        [this](const std::string& name, long long value) { vars[name] = std::to_string(value); }};
};

}  // namespace

TEST_F(ArithmeticTest, Precedence) {
    EXPECT_EQ(evaluator.evaluate("1 + 2 * 3"), 7);
    EXPECT_EQ(evaluator.evaluate("(1 + 2) * 3"), 9);
    EXPECT_EQ(evaluator.evaluate("2 ** 10"), 1024);
    EXPECT_EQ(evaluator.evaluate("2 ** 3 ** 2"), 512);
    EXPECT_EQ(evaluator.evaluate("-3 + 1"), -2);
    EXPECT_EQ(evaluator.evaluate("7 % 3 + 1 << 2"), 8);
}

TEST_F(ArithmeticTest, ComparisonAndLogic) {
    EXPECT_EQ(evaluator.evaluate("3 < 4"), 1);
    EXPECT_EQ(evaluator.evaluate("3 >= 4"), 0);
    EXPECT_EQ(evaluator.evaluate("1 && 0 || 1"), 1);
    EXPECT_EQ(evaluator.evaluate("!5"), 0);
    EXPECT_EQ(evaluator.evaluate("~0"), -1);
    EXPECT_EQ(evaluator.evaluate("6 & 3 | 8 ^ 1"), 11);
}

TEST_F(ArithmeticTest, TernaryOnlyEvaluatesChosenBranch) {
    EXPECT_EQ(evaluator.evaluate("1 ? 10 : 1 / 0"), 10);
    EXPECT_EQ(evaluator.evaluate("0 ? 1 / 0 : 20"), 20);
}

TEST_F(ArithmeticTest, ShortCircuitSkipsDivisionByZero) {
    EXPECT_EQ(evaluator.evaluate("0 && 1 / 0"), 0);
    EXPECT_EQ(evaluator.evaluate("1 || 1 / 0"), 1);
}

TEST_F(ArithmeticTest, DivisionByZeroThrows) {
    EXPECT_THROW(evaluator.evaluate("1 / 0"), ExecutionError);
    EXPECT_THROW(evaluator.evaluate("5 % 0"), ExecutionError);
    try {
        evaluator.evaluate("4 / 0");
        FAIL() << "expected an arithmetic error";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.type(), ErrorType::ARITHMETIC_ERROR);
    }
}

TEST_F(ArithmeticTest, VariablesReadAsNumbers) {
    vars["x"] = "5";
    vars["word"] = "hello";
    EXPECT_EQ(evaluator.evaluate("x * 2"), 10);
    EXPECT_EQ(evaluator.evaluate("missing + 1"), 1);
    EXPECT_EQ(evaluator.evaluate("word + 1"), 1);
}

TEST_F(ArithmeticTest, AssignmentWritesBack) {
    vars["n"] = "4";
    EXPECT_EQ(evaluator.evaluate("n += 3"), 7);
    EXPECT_EQ(vars["n"], "7");
    EXPECT_EQ(evaluator.evaluate("m = 2 * 8"), 16);
    EXPECT_EQ(vars["m"], "16");
}

TEST_F(ArithmeticTest, NumberBases) {
    EXPECT_EQ(evaluator.evaluate("0x1f"), 31);
    EXPECT_EQ(evaluator.evaluate("010"), 8);
    EXPECT_THROW(evaluator.evaluate("09"), ExecutionError);
}

TEST_F(ArithmeticTest, EmptyExpressionIsZero) {
    EXPECT_EQ(evaluator.evaluate(""), 0);
    EXPECT_EQ(evaluator.evaluate("   "), 0);
}

TEST_F(ArithmeticTest, SyntaxErrors) {
    EXPECT_THROW(evaluator.evaluate("1 +"), ExecutionError);
    EXPECT_THROW(evaluator.evaluate("(1 + 2"), ExecutionError);
    EXPECT_THROW(evaluator.evaluate("2 ** -1"), ExecutionError);
}

TEST_F(ArithmeticTest, BuiltinFunctions) {
    EXPECT_EQ(evaluator.evaluate("abs(-4)"), 4);
    EXPECT_EQ(evaluator.evaluate("min(3, 1, 2)"), 1);
    EXPECT_EQ(evaluator.evaluate("max(3, 9, 2)"), 9);
    EXPECT_EQ(evaluator.evaluate("length(-12345)"), 5);
    EXPECT_EQ(evaluator.evaluate("substr(\"hello\", 1, 3)"), 3);
    EXPECT_EQ(evaluator.evaluate("substr(\"hello\", 3, 10)"), 2);
    EXPECT_EQ(evaluator.evaluate("index(\"hello\", \"ll\")"), 3);
    EXPECT_EQ(evaluator.evaluate("index(\"hello\", \"z\")"), 0);
    EXPECT_THROW(evaluator.evaluate("nosuch(1)"), ExecutionError);
}

TEST(ArithmeticParseInteger, AcceptsSignsAndBases) {
    long long value = 0;
    EXPECT_TRUE(ArithmeticEvaluator::parse_integer("-42", value));
    EXPECT_EQ(value, -42);
    EXPECT_TRUE(ArithmeticEvaluator::parse_integer("0x10", value));
    EXPECT_EQ(value, 16);
    EXPECT_FALSE(ArithmeticEvaluator::parse_integer("12abc", value));
    EXPECT_FALSE(ArithmeticEvaluator::parse_integer("", value));
}
