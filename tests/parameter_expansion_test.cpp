#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "error_out.h"
#include "parameter_expansion_evaluator.h"

namespace {

class ParameterExpansionTest : public ::testing::Test {
   protected:
    std::map<std::string, std::string> vars;
    ParameterExpansionEvaluator evaluator{make_callbacks()};

    ParameterExpansionEvaluator::Callbacks make_callbacks() {
        ParameterExpansionEvaluator::Callbacks cb;
        cb.read_variable = [this](const std::string& name) -> std::optional<std::string> {
            auto it = vars.find(name);
            if (it == vars.end()) {
                return std::nullopt;
            }
            return it->second;
        };
        cb.write_variable = [this](const std::string& name, const std::string& value) {
            vars[name] = value;
        };
        cb.count_elements = [this](const std::string& name) -> std::size_t {
            auto it = vars.find(name);
            return it == vars.end() ? 0 : it->second.size();
        };
        cb.list_keys = [](const std::string&) { return std::vector<std::string>{}; };
        cb.expand_word = [](const std::string& text) { return text; };
        cb.expand_pattern = [](const std::string& text) { return text; };
        cb.evaluate_arithmetic = [](const std::string& text) { return std::stoll(text); };
        return cb;
    }

    std::string expand(const std::string& body) {
        return evaluator.expand(ParameterExpansionEvaluator::split(body));
    }
};

}  // namespace

TEST_F(ParameterExpansionTest, SplitsNameOperatorAndOperand) {
    auto expr = ParameterExpansionEvaluator::split("file%%.*");
    EXPECT_EQ(expr.var_name, "file");
    EXPECT_EQ(expr.op, "%%");
    EXPECT_EQ(expr.word, ".*");

    auto length = ParameterExpansionEvaluator::split("#name");
    EXPECT_EQ(length.var_name, "name");
    EXPECT_EQ(length.op, "length");

    EXPECT_THROW(ParameterExpansionEvaluator::split(""), ExecutionError);
    EXPECT_THROW(ParameterExpansionEvaluator::split("-oops"), ExecutionError);
}

TEST_F(ParameterExpansionTest, DefaultValues) {
    vars["empty"] = "";
    vars["set"] = "value";
    EXPECT_EQ(expand("unset:-fallback"), "fallback");
    EXPECT_EQ(expand("empty:-fallback"), "fallback");
    EXPECT_EQ(expand("empty-fallback"), "");
    EXPECT_EQ(expand("set:-fallback"), "value");
}

TEST_F(ParameterExpansionTest, AssignDefault) {
    EXPECT_EQ(expand("target:=assigned"), "assigned");
    EXPECT_EQ(vars["target"], "assigned");
    EXPECT_EQ(expand("target:=other"), "assigned");
}

TEST_F(ParameterExpansionTest, ErrorWhenNullOrUnset) {
    EXPECT_THROW(expand("missing:?need a value"), ExecutionError);
    try {
        expand("missing:?");
        FAIL() << "expected an error";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.type(), ErrorType::VARIABLE_ERROR);
        EXPECT_NE(e.info().message.find("parameter null or not set"), std::string::npos);
    }
}

TEST_F(ParameterExpansionTest, AlternateValue) {
    vars["set"] = "x";
    EXPECT_EQ(expand("set:+alt"), "alt");
    EXPECT_EQ(expand("missing:+alt"), "");
}

TEST_F(ParameterExpansionTest, PrefixAndSuffixRemoval) {
    vars["path"] = "/usr/local/lib/libfoo.so.1";
    EXPECT_EQ(expand("path#*/"), "usr/local/lib/libfoo.so.1");
    EXPECT_EQ(expand("path##*/"), "libfoo.so.1");
    EXPECT_EQ(expand("path%.*"), "/usr/local/lib/libfoo.so");
    EXPECT_EQ(expand("path%%.*"), "/usr/local/lib/libfoo");
}

TEST_F(ParameterExpansionTest, PatternSubstitution) {
    vars["s"] = "banana";
    EXPECT_EQ(expand("s/a/o"), "bonana");
    EXPECT_EQ(expand("s//a/o"), "bonono");
    EXPECT_EQ(expand("s/#b/B"), "Banana");
    EXPECT_EQ(expand("s/%a/A"), "bananA");
    EXPECT_EQ(expand("s//n"), "baaa");
}

TEST_F(ParameterExpansionTest, CaseConversion) {
    vars["w"] = "hello";
    EXPECT_EQ(expand("w^"), "Hello");
    EXPECT_EQ(expand("w^^"), "HELLO");
    vars["u"] = "WORLD";
    EXPECT_EQ(expand("u,"), "wORLD");
    EXPECT_EQ(expand("u,,"), "world");
}

TEST_F(ParameterExpansionTest, Substrings) {
    vars["s"] = "abcdef";
    EXPECT_EQ(expand("s:2"), "cdef");
    EXPECT_EQ(expand("s:1:3"), "bcd");
    EXPECT_EQ(expand("s: -2"), "ef");
    EXPECT_EQ(expand("s:1:-2"), "bcd");
    EXPECT_EQ(expand("s:4:-3"), "");
    EXPECT_EQ(expand("s: -10"), "");
    EXPECT_EQ(expand("s:10"), "");
}

TEST_F(ParameterExpansionTest, SubstringLengthAtInt64Limits) {
    vars["x"] = "hello";
    EXPECT_EQ(expand("x:1:9223372036854775807"), "ello");
    EXPECT_EQ(expand("x:0:9223372036854775807"), "hello");
    EXPECT_EQ(expand("x:1:-9223372036854775807"), "");
    EXPECT_EQ(expand("x: -9223372036854775807"), "");
}

TEST_F(ParameterExpansionTest, Length) {
    vars["s"] = "four";
    EXPECT_EQ(expand("#s"), "4");
}

TEST_F(ParameterExpansionTest, Indirection) {
    vars["ref"] = "target";
    vars["target"] = "value";
    EXPECT_EQ(expand("!ref"), "value");
}

TEST_F(ParameterExpansionTest, NounsetRejectsUnsetNames) {
    evaluator.set_nounset(true);
    EXPECT_THROW(expand("nothing"), ExecutionError);
    EXPECT_EQ(expand("nothing:-ok"), "ok");
    EXPECT_EQ(expand("?"), "");
}

TEST(ParameterExpansionStrip, EmptyPatternLeavesValue) {
    EXPECT_EQ(ParameterExpansionEvaluator::strip_prefix("abc", "", true), "abc");
    EXPECT_EQ(ParameterExpansionEvaluator::strip_suffix("abc", "c", false), "ab");
}
