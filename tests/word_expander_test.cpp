#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "environment.h"
#include "error_out.h"
#include "parser.h"
#include "shell_options.h"
#include "word_expander.h"

namespace {

class WordExpanderTest : public ::testing::Test {
   protected:
    Environment env{false};
    ShellOptions options;
    std::vector<std::string> commands_run;
    CommandSubstitutionEvaluator::CaptureResult next_capture{"one two", 3};
    WordExpander expander{env, options,
                          [this](const std::string& command) {
                              commands_run.push_back(command);
                              return next_capture;
                          },
                          [](const std::string& command, bool is_input) {
                              return std::string(is_input ? "/tmp/in-" : "/tmp/out-") + command;
                          }};

    std::vector<std::string> fields(const std::string& text) {
        return expander.expand_word_fields(Parser::parse_word(text));
    }

    std::string single(const std::string& text) {
        return expander.expand(Parser::parse_word(text));
    }
};

using Fields = std::vector<std::string>;

}  // namespace

TEST_F(WordExpanderTest, PlainWordsExpandToThemselves) {
    EXPECT_EQ(fields("plain-word"), Fields{"plain-word"});
    EXPECT_EQ(fields("'quoted text'"), Fields{"quoted text"});
    EXPECT_EQ(single("\"double quoted\""), "double quoted");
}

TEST_F(WordExpanderTest, QuotedAtKeepsParametersSeparate) {
    env.set_positional_parameters({"a b", "c"});
    EXPECT_EQ(fields("\"$@\""), (Fields{"a b", "c"}));
    EXPECT_EQ(fields("$@"), (Fields{"a", "b", "c"}));
    EXPECT_EQ(fields("\"x$@y\""), (Fields{"xa b", "cy"}));
}

TEST_F(WordExpanderTest, QuotedAtWithNoParametersIsNoFields) {
    env.set_positional_parameters({});
    EXPECT_TRUE(fields("\"$@\"").empty());
    EXPECT_EQ(fields("\"$*\""), Fields{""});
}

TEST_F(WordExpanderTest, QuotedStarJoinsWithFirstIfsCharacter) {
    env.set_positional_parameters({"a", "b"});
    env.set("IFS", ":");
    EXPECT_EQ(fields("\"$*\""), Fields{"a:b"});
}

TEST_F(WordExpanderTest, UnquotedExpansionIsSplitOnIfs) {
    env.set("list", "x  y\tz");
    EXPECT_EQ(fields("$list"), (Fields{"x", "y", "z"}));
    EXPECT_EQ(fields("\"$list\""), Fields{"x  y\tz"});

    env.set("IFS", "");
    EXPECT_EQ(fields("$list"), Fields{"x  y\tz"});
}

TEST_F(WordExpanderTest, EmptyUnquotedExpansionVanishes) {
    env.set("empty", "");
    EXPECT_TRUE(fields("$empty").empty());
    EXPECT_EQ(fields("\"$empty\""), Fields{""});
}

TEST_F(WordExpanderTest, TildeExpansion) {
    env.set("HOME", "/home/tester");
    EXPECT_EQ(single("~"), "/home/tester");
    EXPECT_EQ(single("~/src"), "/home/tester/src");
    EXPECT_EQ(single("'~'/src"), "~/src");
    EXPECT_EQ(expander.expand_assignment_value(Parser::parse_word("/bin:~/bin")),
              "/bin:/home/tester/bin");
}

TEST_F(WordExpanderTest, NounsetRejectsUnsetVariables) {
    options.nounset = true;
    try {
        fields("$never_set");
        FAIL() << "expected unbound variable error";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.type(), ErrorType::VARIABLE_ERROR);
        EXPECT_NE(e.info().message.find("never_set: unbound variable"), std::string::npos);
    }
    EXPECT_EQ(fields("${never_set:-fallback}"), Fields{"fallback"});
}

TEST_F(WordExpanderTest, CommandSubstitutionSplitsAndRecordsStatus) {
    EXPECT_EQ(fields("$(produce)"), (Fields{"one", "two"}));
    ASSERT_EQ(commands_run.size(), 1u);
    EXPECT_EQ(commands_run[0], "produce");
    ASSERT_TRUE(expander.last_substitution_status().has_value());
    EXPECT_EQ(*expander.last_substitution_status(), 3);

    EXPECT_EQ(fields("\"$(produce)\""), Fields{"one two"});
    EXPECT_EQ(fields("`produce`"), (Fields{"one", "two"}));
}

TEST_F(WordExpanderTest, ProcessSubstitutionYieldsPath) {
    Parser parser;
    auto program = parser.parse("diff <(list) >(sink)");
    const auto& command = std::get<ast::CommandStatement>(program.statements.front()->node);
    ASSERT_EQ(command.args.size(), 2u);
    EXPECT_EQ(expander.expand(command.args[0]), "/tmp/in-list");
    EXPECT_EQ(expander.expand(command.args[1]), "/tmp/out-sink");
}

TEST_F(WordExpanderTest, ArithmeticExpansion) {
    env.set("n", "4");
    EXPECT_EQ(single("$((n * 2 + 1))"), "9");
    EXPECT_EQ(single("$((10 / 0))"), "0");
}

TEST_F(WordExpanderTest, ArithmeticFailuresGoToErrorSink) {
    std::vector<ErrorInfo> reported;
    expander.set_error_sink([&reported](const ErrorInfo& info) { reported.push_back(info); });
    EXPECT_EQ(single("$((10 / 0))"), "0");
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].type, ErrorType::ARITHMETIC_ERROR);
}

TEST_F(WordExpanderTest, ArraysAndSubscripts) {
    expander.assign("arr", std::string("0"), "first");
    expander.assign("arr", std::string("2"), "third");
    EXPECT_EQ(expander.lookup("arr[2]").value_or(""), "third");
    EXPECT_EQ(single("${#arr[@]}"), "3");
    EXPECT_EQ(fields("\"${arr[@]}\""), (Fields{"first", "", "third"}));

    expander.assign("arr", std::nullopt, "more", true);
    EXPECT_EQ(env.get_array("arr")->size(), 4u);
}

TEST_F(WordExpanderTest, AssociativeArrayKeys) {
    env.declare_assoc("map");
    expander.assign("map", std::string("beta"), "2");
    expander.assign("map", std::string("alpha"), "1");
    EXPECT_EQ(single("${map[alpha]}"), "1");
    EXPECT_EQ(fields("${!map[@]}"), (Fields{"alpha", "beta"}));
}

TEST_F(WordExpanderTest, ScalarBecomesArrayOnIndexedAssignment) {
    env.set("value", "a");
    expander.assign("value", std::string("1"), "b");
    EXPECT_EQ(env.kind_of("value"), VariableKind::ARRAY);
    EXPECT_EQ(fields("\"${value[@]}\""), (Fields{"a", "b"}));
}

TEST_F(WordExpanderTest, QuotedGlobCharactersAreEscapedInPatterns) {
    EXPECT_EQ(expander.expand_pattern(Parser::parse_word("\"*\"")), "\\*");
    EXPECT_EQ(expander.expand_pattern(Parser::parse_word("a*")), "a*");
}

TEST_F(WordExpanderTest, HereDocumentBodies) {
    env.set("who", "world");
    EXPECT_EQ(expander.expand_here_document("hello $who \"quoted\"\n"),
              "hello world \"quoted\"\n");
    EXPECT_EQ(expander.expand_here_document("cost \\$5\n"), "cost $5\n");
}

TEST_F(WordExpanderTest, ExpandsVariablesInsidePlainText) {
    env.set("a", "1");
    EXPECT_EQ(expander.expand_variables_in_string("a=$a ${a}x"), "a=1 1x");
}
