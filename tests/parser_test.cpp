#include <gtest/gtest.h>

#include <string>

#include "ast.h"
#include "error_out.h"
#include "parser.h"

namespace {

ast::Program parse(const std::string& text) {
    Parser parser;
    return parser.parse(text);
}

template <typename T>
const T& only_statement(const ast::Program& program) {
    EXPECT_EQ(program.statements.size(), 1u);
    const T* node = std::get_if<T>(&program.statements.front()->node);
    if (node == nullptr) {
        throw std::runtime_error("unexpected statement kind");
    }
    return *node;
}

void expect_syntax_error(const std::string& text) {
    try {
        parse(text);
        ADD_FAILURE() << "no syntax error for: " << text;
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.type(), ErrorType::SYNTAX_ERROR) << text;
        EXPECT_EQ(e.exit_code(), 2) << text;
    }
}

}  // namespace

TEST(Parser, SimpleCommandWords) {
    auto program = parse("echo hello world");
    const auto& command = only_statement<ast::CommandStatement>(program);
    ASSERT_TRUE(command.command.has_value());
    EXPECT_TRUE(command.command->is_literal("echo"));
    ASSERT_EQ(command.args.size(), 2u);
    EXPECT_TRUE(command.args[0].is_literal("hello"));
    EXPECT_TRUE(command.args[1].is_literal("world"));
}

TEST(Parser, StatementsSeparatedBySemicolonsAndNewlines) {
    auto program = parse("a; b\nc\n\n");
    EXPECT_EQ(program.statements.size(), 3u);
}

TEST(Parser, PrefixAssignments) {
    auto program = parse("A=1 B+=2 env");
    const auto& command = only_statement<ast::CommandStatement>(program);
    ASSERT_EQ(command.assignments.size(), 2u);
    EXPECT_EQ(command.assignments[0].name, "A");
    EXPECT_FALSE(command.assignments[0].append);
    EXPECT_EQ(command.assignments[1].name, "B");
    EXPECT_TRUE(command.assignments[1].append);
    EXPECT_TRUE(command.command->is_literal("env"));
}

TEST(Parser, IndexedAssignment) {
    auto word = Parser::parse_word("arr[3]=value");
    auto assignment = Parser::split_assignment(word);
    ASSERT_TRUE(assignment.has_value());
    EXPECT_EQ(assignment->name, "arr");
    ASSERT_TRUE(assignment->index.has_value());
    EXPECT_EQ(*assignment->index, "3");
    EXPECT_FALSE(Parser::split_assignment(Parser::parse_word("3x=1")).has_value());
}

TEST(Parser, PipelineChain) {
    auto program = parse("a | b | c");
    const auto& first = only_statement<ast::CommandStatement>(program);
    ASSERT_TRUE(first.pipe);
    ASSERT_TRUE(first.pipe->pipe);
    EXPECT_TRUE(first.pipe->pipe->command->is_literal("c"));
    EXPECT_FALSE(first.pipe->pipe->pipe);
}

TEST(Parser, NegatedPipeline) {
    auto program = parse("! grep x file");
    const auto& command = only_statement<ast::CommandStatement>(program);
    EXPECT_TRUE(command.negated);
}

TEST(Parser, AndOrList) {
    auto program = parse("a && b || c");
    const auto& list = only_statement<ast::AndOrStatement>(program);
    ASSERT_EQ(list.rest.size(), 2u);
    EXPECT_EQ(list.rest[0].first, ast::AndOrOperator::AND);
    EXPECT_EQ(list.rest[1].first, ast::AndOrOperator::OR);
    EXPECT_FALSE(list.background);
}

TEST(Parser, BackgroundMarkers) {
    auto single = parse("sleep 1 &");
    EXPECT_TRUE(only_statement<ast::CommandStatement>(single).background);

    auto list = parse("a && b &");
    EXPECT_TRUE(only_statement<ast::AndOrStatement>(list).background);
}

TEST(Parser, IfElifElse) {
    auto program = parse("if a; then b; elif c; then d; else e; fi");
    const auto& statement = only_statement<ast::IfStatement>(program);
    EXPECT_EQ(statement.condition.statements.size(), 1u);
    EXPECT_EQ(statement.elif_clauses.size(), 1u);
    ASSERT_TRUE(statement.alternative.has_value());
    EXPECT_EQ(statement.alternative->statements.size(), 1u);
}

TEST(Parser, ForLoops) {
    auto with_list = parse("for i in a b c; do echo $i; done");
    const auto& loop = only_statement<ast::ForStatement>(with_list);
    EXPECT_EQ(loop.variable, "i");
    ASSERT_TRUE(loop.in_list.has_value());
    EXPECT_EQ(loop.in_list->size(), 3u);

    auto positional = parse("for arg\ndo\n  echo $arg\ndone");
    EXPECT_FALSE(only_statement<ast::ForStatement>(positional).in_list.has_value());
}

TEST(Parser, WhileAndUntil) {
    auto program = parse("while a; do b; done\nuntil c; do d; done");
    ASSERT_EQ(program.statements.size(), 2u);
    const auto* loop = std::get_if<ast::WhileStatement>(&program.statements[0]->node);
    ASSERT_NE(loop, nullptr);
    EXPECT_FALSE(loop->until);
    const auto* until = std::get_if<ast::WhileStatement>(&program.statements[1]->node);
    ASSERT_NE(until, nullptr);
    EXPECT_TRUE(until->until);
}

TEST(Parser, CaseTerminators) {
    auto program = parse(
        "case $x in\n"
        "  a|b) one ;;\n"
        "  c) two ;&\n"
        "  d) three ;;&\n"
        "  *) four\n"
        "esac");
    const auto& statement = only_statement<ast::CaseStatement>(program);
    ASSERT_EQ(statement.clauses.size(), 4u);
    EXPECT_EQ(statement.clauses[0].patterns.size(), 2u);
    EXPECT_EQ(statement.clauses[0].terminator, ast::CaseTerminator::BREAK);
    EXPECT_EQ(statement.clauses[1].terminator, ast::CaseTerminator::FALLTHROUGH);
    EXPECT_EQ(statement.clauses[2].terminator, ast::CaseTerminator::CONTINUE_TEST);
    EXPECT_EQ(statement.clauses[3].terminator, ast::CaseTerminator::BREAK);
}

TEST(Parser, FunctionDefinitions) {
    auto program = parse("greet() { echo hi; }\nfunction other { :; }");
    ASSERT_EQ(program.statements.size(), 2u);
    const auto* first = std::get_if<ast::FunctionStatement>(&program.statements[0]->node);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->name, "greet");
    ASSERT_TRUE(first->body);
    EXPECT_EQ(first->body->statements.size(), 1u);
    const auto* second = std::get_if<ast::FunctionStatement>(&program.statements[1]->node);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->name, "other");
}

TEST(Parser, LoopControlStatements) {
    auto program = parse("break 2\ncontinue\nbreak");
    ASSERT_EQ(program.statements.size(), 3u);
    const auto* brk = std::get_if<ast::BreakStatement>(&program.statements[0]->node);
    ASSERT_NE(brk, nullptr);
    EXPECT_EQ(brk->level, 2);
    const auto* cont = std::get_if<ast::ContinueStatement>(&program.statements[1]->node);
    ASSERT_NE(cont, nullptr);
    EXPECT_EQ(cont->level, 1);
    EXPECT_NE(std::get_if<ast::BreakStatement>(&program.statements[2]->node), nullptr);
}

TEST(Parser, Redirections) {
    auto program = parse("cmd > out 2>&1 < in");
    const auto& command = only_statement<ast::CommandStatement>(program);
    ASSERT_EQ(command.redirects.size(), 3u);
    EXPECT_EQ(command.redirects[0].type, ast::RedirectType::OUTPUT);
    EXPECT_EQ(command.redirects[0].fd, 1);
    EXPECT_EQ(command.redirects[1].type, ast::RedirectType::DUP_OUT);
    EXPECT_EQ(command.redirects[1].fd, 2);
    EXPECT_EQ(command.redirects[2].type, ast::RedirectType::INPUT);
    EXPECT_EQ(command.redirects[2].fd, 0);
}

TEST(Parser, HereDocumentBodies) {
    auto program = parse("cat <<EOF\nhello $name\nEOF\necho after\n");
    ASSERT_EQ(program.statements.size(), 2u);
    const auto* command = std::get_if<ast::CommandStatement>(&program.statements[0]->node);
    ASSERT_NE(command, nullptr);
    ASSERT_EQ(command->redirects.size(), 1u);
    const auto& here_doc = command->redirects[0].here_doc;
    EXPECT_EQ(here_doc.content, "hello $name\n");
    EXPECT_EQ(here_doc.delimiter, "EOF");
    EXPECT_FALSE(here_doc.quoted);
    EXPECT_TRUE(here_doc.collected);
}

TEST(Parser, QuotedAndStrippedHereDocuments) {
    auto quoted = parse("cat <<'END'\n$literal\nEND\n");
    const auto& command = only_statement<ast::CommandStatement>(quoted);
    EXPECT_TRUE(command.redirects[0].here_doc.quoted);

    auto stripped = parse("cat <<-END\n\t\tindented\n\tEND\n");
    const auto& strip = only_statement<ast::CommandStatement>(stripped);
    EXPECT_EQ(strip.redirects[0].type, ast::RedirectType::HEREDOC_STRIP);
    EXPECT_EQ(strip.redirects[0].here_doc.content, "indented\n");
}

TEST(Parser, ArrayAssignment) {
    auto program = parse("arr=(one two [5]=five)");
    const auto& array = only_statement<ast::ArrayAssignment>(program);
    EXPECT_EQ(array.name, "arr");
    ASSERT_EQ(array.elements.size(), 3u);
    EXPECT_FALSE(array.elements[0].key.has_value());
    ASSERT_TRUE(array.elements[2].key.has_value());
    EXPECT_EQ(*array.elements[2].key, "5");
}

TEST(Parser, DoubleBracketCollectsOperands) {
    auto program = parse("[[ $a == b* && -n $c ]]");
    const auto& command = only_statement<ast::CommandStatement>(program);
    EXPECT_TRUE(command.command->is_literal("[["));
    EXPECT_EQ(command.args.size(), 6u);
}

TEST(Parser, SyntaxErrors) {
    expect_syntax_error("if true; then echo");
    expect_syntax_error("( echo sub )");
    expect_syntax_error("echo |");
    expect_syntax_error("fi");
    expect_syntax_error("for 1x in a; do :; done");
    expect_syntax_error("case x in a) echo");
}
