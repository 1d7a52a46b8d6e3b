#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ast.h"

enum class TokenType : std::uint8_t {
    WORD,
    ARRAY_ASSIGN,
    NEWLINE,
    SEMI,
    AMP,
    PIPE,
    AND_IF,
    OR_IF,
    DSEMI,
    SEMI_AND,
    DSEMI_AND,
    LPAREN,
    RPAREN,
    REDIRECT,
    END
};

struct Token {
    TokenType type = TokenType::END;
    // Source text of the token, used for keyword recognition and diagnostics.
    std::string text;
    ast::Word word;
    // Any quoting or escaping inside a WORD; quoted words are never keywords.
    bool quoted = false;

    ast::RedirectType redirect_type = ast::RedirectType::OUTPUT;
    int fd = -1;
    // &> and &>> redirect stdout and stderr together.
    bool both_streams = false;
    ast::HereDoc here_doc;

    ast::ArrayAssignment array;
    size_t line = 1;
};

// Splits script text into tokens. Words are decomposed into AST word parts as they are read;
// here-document bodies are attached to their redirect tokens when the line ends.
class Tokenizer {
   public:
    explicit Tokenizer(const std::string& input);

    std::vector<Token> tokenize();

    // Reads the whole text as one word: blanks and operators are literal, quotes and
    // expansions keep their meaning.
    static ast::Word parse_word_text(const std::string& text);

   private:
    struct WordBuilder;

    std::string input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    std::vector<Token> tokens_;
    std::vector<size_t> pending_here_docs_;

    [[noreturn]] void fail(const std::string& message) const;

    bool at_end() const {
        return pos_ >= input_.size();
    }
    char peek(size_t ahead = 0) const {
        return pos_ + ahead < input_.size() ? input_[pos_ + ahead] : '\0';
    }

    void skip_blanks_and_comments();
    bool try_lex_operator();
    bool try_lex_redirect();
    void lex_word();
    void lex_array_literal(const std::string& name, bool append, size_t start);

    void read_word_into(WordBuilder& builder, bool literal_metachars);
    void read_dollar(WordBuilder& builder);
    void read_double_quoted(WordBuilder& builder);
    void read_single_quoted(WordBuilder& builder);
    void read_ansi_c_quoted(WordBuilder& builder);
    void read_backtick(WordBuilder& builder);
    void read_assignment_prefix(WordBuilder& builder);

    void read_here_doc_delimiter(Token& token);
    void read_pending_here_doc_bodies();

    size_t find_matching_brace(size_t start) const;
    void count_lines(size_t from, size_t to);

    static bool is_metachar(char c);
};
