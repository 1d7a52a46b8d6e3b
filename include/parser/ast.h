#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ast {

// Word parts. A word is the concatenation of its parts after expansion.

struct Identifier {
    std::string value;
};

// is_quote: double-quoted (expanded) when true, single-quoted (literal) when false.
struct StringLiteral {
    std::string value;
    bool is_quote = false;
};

struct Variable {
    std::string name;
};

// op is one of: "" (plain), ":-", "-", ":=", "=", ":?", "?", ":+", "+", "#", "##", "%",
// "%%", "/", "//", "^", "^^", ",", ",,", ":" (substring), "length" (${#name}) and
// "indirect" (${!name}). var_name may carry an array subscript such as "arr[@]".
struct ParamExpandExpression {
    std::string var_name;
    std::string op;
    std::string word;
};

struct CommandSubstitution {
    std::string command;
};

struct ArithmeticExpansion {
    std::string expression;
};

struct ProcessSubstitution {
    std::string command;
    bool is_input = true;
};

using Expression = std::variant<Identifier, StringLiteral, Variable, ParamExpandExpression,
                                CommandSubstitution, ArithmeticExpansion, ProcessSubstitution>;

struct Word {
    std::vector<Expression> parts;

    bool empty() const {
        return parts.empty();
    }
    // Source-like rendering used for traces and job command lines.
    std::string to_string() const;
    // True when the word is a single unquoted literal equal to text.
    bool is_literal(const std::string& text) const;
};

enum class RedirectType : std::uint8_t {
    INPUT,
    OUTPUT,
    APPEND,
    HEREDOC,
    HEREDOC_STRIP,
    HERE_STRING,
    DUP_IN,
    DUP_OUT,
    CLOBBER,
    READ_WRITE
};

struct HereDoc {
    std::string content;
    std::string delimiter;
    bool quoted = false;
    bool strip_tabs = false;
    // False when the script ended before the body; the body is then read from stdin.
    bool collected = false;
};

struct Redirect {
    RedirectType type = RedirectType::OUTPUT;
    int fd = 1;
    Word target;
    HereDoc here_doc;
};

struct Assignment {
    std::string name;
    std::optional<std::string> index;
    Word value;
    bool append = false;
};

struct Statement;
using StatementPtr = std::unique_ptr<Statement>;
using StatementList = std::vector<StatementPtr>;

struct BlockStatement {
    StatementList statements;
};

// A pipeline stage. Either a simple command (command, args, assignments) or, when compound
// is set, a compound statement such as a loop or brace group with its own redirects.
struct CommandStatement {
    std::optional<Word> command;
    std::vector<Word> args;
    std::vector<Assignment> assignments;
    std::vector<Redirect> redirects;
    StatementPtr compound;
    bool background = false;
    bool negated = false;
    std::unique_ptr<CommandStatement> pipe;
};

enum class AndOrOperator : std::uint8_t {
    AND,
    OR
};

struct AndOrStatement {
    std::unique_ptr<CommandStatement> first;
    std::vector<std::pair<AndOrOperator, std::unique_ptr<CommandStatement>>> rest;
    bool background = false;
};

struct ElifClause {
    BlockStatement condition;
    BlockStatement consequence;
};

struct IfStatement {
    BlockStatement condition;
    BlockStatement consequence;
    std::vector<ElifClause> elif_clauses;
    std::optional<BlockStatement> alternative;
};

struct ForStatement {
    std::string variable;
    std::optional<std::vector<Word>> in_list;
    BlockStatement body;
};

struct WhileStatement {
    BlockStatement condition;
    BlockStatement body;
    bool until = false;
};

enum class CaseTerminator : std::uint8_t {
    BREAK,         // ;;
    FALLTHROUGH,   // ;&
    CONTINUE_TEST  // ;;&
};

struct CaseClause {
    std::vector<Word> patterns;
    BlockStatement body;
    CaseTerminator terminator = CaseTerminator::BREAK;
};

struct CaseStatement {
    Word value;
    std::vector<CaseClause> clauses;
};

struct FunctionStatement {
    std::string name;
    std::shared_ptr<const BlockStatement> body;
};

struct BreakStatement {
    int level = 1;
};

struct ContinueStatement {
    int level = 1;
};

struct ArrayElement {
    std::optional<std::string> key;
    Word value;
};

struct ArrayAssignment {
    std::string name;
    std::vector<ArrayElement> elements;
    bool append = false;
};

using StatementNode =
    std::variant<CommandStatement, AndOrStatement, IfStatement, ForStatement, WhileStatement,
                 CaseStatement, FunctionStatement, BlockStatement, BreakStatement,
                 ContinueStatement, ArrayAssignment>;

struct Statement {
    StatementNode node;

    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Statement>>>
    explicit Statement(T&& value) : node(std::forward<T>(value)) {
    }
};

template <typename T>
StatementPtr make_statement(T&& value) {
    return std::make_unique<Statement>(std::forward<T>(value));
}

struct Program {
    StatementList statements;
};

}  // namespace ast
