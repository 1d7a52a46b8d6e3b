#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ast.h"
#include "tokenizer.h"

// Recursive-descent parser from script text to ast::Program. Errors are thrown as
// ExecutionError with type SYNTAX_ERROR.
class Parser {
   public:
    ast::Program parse(const std::string& text);

    // Parses text as a single word (used for operands and here-document bodies).
    static ast::Word parse_word(const std::string& text);

    // Splits `name=value`, `name+=value` and `name[sub]=value` out of an unquoted word.
    static std::optional<ast::Assignment> split_assignment(const ast::Word& word);

   private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    const Token& current() const {
        return tokens_[pos_];
    }
    bool at(TokenType type) const {
        return current().type == type;
    }
    bool at_keyword(const std::string& keyword) const;
    bool at_any_keyword(const std::vector<std::string>& keywords) const;
    bool at_list_end() const;
    void advance();
    void expect(TokenType type);
    void expect_keyword(const std::string& keyword);
    [[noreturn]] void unexpected() const;

    void skip_newlines();

    ast::StatementList parse_list(const std::vector<std::string>& terminators);
    ast::BlockStatement parse_compound_list(const std::vector<std::string>& terminators);
    ast::StatementPtr parse_and_or();
    std::unique_ptr<ast::CommandStatement> parse_pipeline();
    std::unique_ptr<ast::CommandStatement> parse_command();
    void parse_simple_command(ast::CommandStatement& command);
    void parse_redirect(std::vector<ast::Redirect>& redirects);
    void parse_double_bracket(ast::CommandStatement& command);

    bool at_compound_start() const;
    ast::StatementPtr parse_compound();
    ast::StatementPtr parse_if();
    ast::StatementPtr parse_for();
    ast::StatementPtr parse_while(bool until);
    ast::StatementPtr parse_case();
    ast::StatementPtr parse_brace_group();
    ast::StatementPtr parse_function(bool keyword_form);

    static ast::StatementPtr simplify(std::unique_ptr<ast::CommandStatement> command);
};
