#include "tokenizer.h"

#include <cctype>
#include <string>
#include <utility>

#include "command_substitution_evaluator.h"
#include "error_out.h"
#include "parameter_expansion_evaluator.h"

struct Tokenizer::WordBuilder {
    ast::Word word;
    std::string literal;
    bool quoted = false;

    void add_literal(char c) {
        literal += c;
    }
    void add_literal(const std::string& text) {
        literal += text;
    }
    void flush() {
        if (!literal.empty()) {
            word.parts.emplace_back(ast::Identifier{literal});
            literal.clear();
        }
    }
    void add_part(ast::Expression part) {
        flush();
        word.parts.push_back(std::move(part));
    }
};

namespace {

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_special_parameter_char(char c) {
    return c == '@' || c == '*' || c == '#' || c == '?' || c == '$' || c == '!' || c == '-';
}

// Removes quoting from a here-document delimiter word.
std::string remove_delimiter_quotes(const std::string& raw, bool& quoted) {
    std::string result;
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\\' && i + 1 < raw.size()) {
            quoted = true;
            result += raw[++i];
        } else if (c == '\'' || c == '"') {
            quoted = true;
        } else {
            result += c;
        }
    }
    return result;
}

}  // namespace

Tokenizer::Tokenizer(const std::string& input) : input_(input) {
}

void Tokenizer::fail(const std::string& message) const {
    throw ExecutionError(ErrorType::SYNTAX_ERROR, "line " + std::to_string(line_), message, 2);
}

bool Tokenizer::is_metachar(char c) {
    switch (c) {
        case ' ':
        case '\t':
        case '\n':
        case ';':
        case '&':
        case '|':
        case '<':
        case '>':
        case '(':
        case ')':
            return true;
        default:
            return false;
    }
}

std::vector<Token> Tokenizer::tokenize() {
    tokens_.clear();
    pending_here_docs_.clear();

    while (true) {
        skip_blanks_and_comments();
        if (at_end()) {
            break;
        }

        if (peek() == '\n') {
            Token token;
            token.type = TokenType::NEWLINE;
            token.text = "\n";
            token.line = line_;
            tokens_.push_back(std::move(token));
            ++pos_;
            ++line_;
            read_pending_here_doc_bodies();
            continue;
        }

        if (try_lex_redirect() || try_lex_operator()) {
            continue;
        }
        lex_word();
    }

    Token end;
    end.type = TokenType::END;
    end.line = line_;
    tokens_.push_back(std::move(end));
    return std::move(tokens_);
}

ast::Word Tokenizer::parse_word_text(const std::string& text) {
    Tokenizer tokenizer(text);
    WordBuilder builder;
    tokenizer.read_word_into(builder, true);
    builder.flush();
    return std::move(builder.word);
}

void Tokenizer::skip_blanks_and_comments() {
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r') {
            ++pos_;
        } else if (c == '\\' && peek(1) == '\n') {
            pos_ += 2;
            ++line_;
        } else if (c == '#') {
            while (!at_end() && peek() != '\n') {
                ++pos_;
            }
        } else {
            break;
        }
    }
}

bool Tokenizer::try_lex_operator() {
    Token token;
    token.line = line_;
    char c = peek();

    auto emit = [&](TokenType type, size_t length) {
        token.type = type;
        token.text = input_.substr(pos_, length);
        pos_ += length;
        tokens_.push_back(std::move(token));
        return true;
    };

    switch (c) {
        case ';':
            if (peek(1) == ';' && peek(2) == '&') {
                return emit(TokenType::DSEMI_AND, 3);
            }
            if (peek(1) == ';') {
                return emit(TokenType::DSEMI, 2);
            }
            if (peek(1) == '&') {
                return emit(TokenType::SEMI_AND, 2);
            }
            return emit(TokenType::SEMI, 1);
        case '&':
            if (peek(1) == '&') {
                return emit(TokenType::AND_IF, 2);
            }
            if (peek(1) == '>') {
                bool append = peek(2) == '>';
                token.redirect_type = append ? ast::RedirectType::APPEND
                                             : ast::RedirectType::OUTPUT;
                token.fd = 1;
                token.both_streams = true;
                return emit(TokenType::REDIRECT, append ? 3 : 2);
            }
            return emit(TokenType::AMP, 1);
        case '|':
            if (peek(1) == '|') {
                return emit(TokenType::OR_IF, 2);
            }
            return emit(TokenType::PIPE, 1);
        case '(':
            return emit(TokenType::LPAREN, 1);
        case ')':
            return emit(TokenType::RPAREN, 1);
        default:
            return false;
    }
}

bool Tokenizer::try_lex_redirect() {
    size_t p = pos_;
    int fd = -1;

    if (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
        size_t q = p;
        while (q < input_.size() && std::isdigit(static_cast<unsigned char>(input_[q])) != 0) {
            ++q;
        }
        if (q >= input_.size() || (input_[q] != '<' && input_[q] != '>') ||
            (q + 1 < input_.size() && input_[q + 1] == '(') || q - p > 4) {
            return false;
        }
        fd = std::stoi(input_.substr(p, q - p));
        p = q;
    }

    if (p >= input_.size()) {
        return false;
    }
    char c = input_[p];
    if (c != '<' && c != '>') {
        return false;
    }
    char next = p + 1 < input_.size() ? input_[p + 1] : '\0';
    if (next == '(') {
        // <(cmd) and >(cmd) are process substitution words.
        return false;
    }
    char after = p + 2 < input_.size() ? input_[p + 2] : '\0';

    std::string op;
    ast::RedirectType type = ast::RedirectType::OUTPUT;
    if (c == '<') {
        if (next == '<' && after == '<') {
            op = "<<<";
            type = ast::RedirectType::HERE_STRING;
        } else if (next == '<' && after == '-') {
            op = "<<-";
            type = ast::RedirectType::HEREDOC_STRIP;
        } else if (next == '<') {
            op = "<<";
            type = ast::RedirectType::HEREDOC;
        } else if (next == '&') {
            op = "<&";
            type = ast::RedirectType::DUP_IN;
        } else if (next == '>') {
            op = "<>";
            type = ast::RedirectType::READ_WRITE;
        } else {
            op = "<";
            type = ast::RedirectType::INPUT;
        }
    } else {
        if (next == '>') {
            op = ">>";
            type = ast::RedirectType::APPEND;
        } else if (next == '&') {
            op = ">&";
            type = ast::RedirectType::DUP_OUT;
        } else if (next == '|') {
            op = ">|";
            type = ast::RedirectType::CLOBBER;
        } else {
            op = ">";
            type = ast::RedirectType::OUTPUT;
        }
    }

    Token token;
    token.type = TokenType::REDIRECT;
    token.text = input_.substr(pos_, p + op.size() - pos_);
    token.redirect_type = type;
    token.fd = fd;
    token.line = line_;
    pos_ = p + op.size();

    if (type == ast::RedirectType::HEREDOC || type == ast::RedirectType::HEREDOC_STRIP) {
        read_here_doc_delimiter(token);
        pending_here_docs_.push_back(tokens_.size());
    }
    tokens_.push_back(std::move(token));
    return true;
}

void Tokenizer::lex_word() {
    size_t start = pos_;
    size_t start_line = line_;
    WordBuilder builder;

    read_assignment_prefix(builder);
    if (pos_ < input_.size() && input_[pos_] == '(' && !builder.literal.empty() &&
        builder.literal.back() == '=') {
        std::string prefix = builder.literal;
        bool append = prefix.size() > 1 && prefix[prefix.size() - 2] == '+';
        std::string name = prefix.substr(0, prefix.size() - (append ? 2 : 1));
        if (name.find('[') == std::string::npos) {
            lex_array_literal(name, append, start);
            return;
        }
    }

    read_word_into(builder, false);
    builder.flush();

    Token token;
    token.type = TokenType::WORD;
    token.text = input_.substr(start, pos_ - start);
    token.word = std::move(builder.word);
    token.quoted = builder.quoted;
    token.line = start_line;
    tokens_.push_back(std::move(token));
}

void Tokenizer::read_assignment_prefix(WordBuilder& builder) {
    if (!is_name_start(peek())) {
        return;
    }
    size_t p = pos_;
    while (p < input_.size() && is_name_char(input_[p])) {
        ++p;
    }
    if (p < input_.size() && input_[p] == '[') {
        int depth = 0;
        size_t q = p;
        for (; q < input_.size(); ++q) {
            if (input_[q] == '[') {
                ++depth;
            } else if (input_[q] == ']' && --depth == 0) {
                break;
            } else if (input_[q] == '\n') {
                return;
            }
        }
        if (q >= input_.size()) {
            return;
        }
        p = q + 1;
    }
    if (p < input_.size() && input_[p] == '+') {
        ++p;
    }
    if (p >= input_.size() || input_[p] != '=') {
        return;
    }
    ++p;
    builder.add_literal(input_.substr(pos_, p - pos_));
    pos_ = p;
}

void Tokenizer::lex_array_literal(const std::string& name, bool append, size_t start) {
    size_t start_line = line_;
    ++pos_;  // (

    ast::ArrayAssignment array;
    array.name = name;
    array.append = append;

    while (true) {
        while (!at_end()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r') {
                ++pos_;
            } else if (c == '\n') {
                ++pos_;
                ++line_;
            } else if (c == '#') {
                while (!at_end() && peek() != '\n') {
                    ++pos_;
                }
            } else {
                break;
            }
        }
        if (at_end()) {
            fail("unexpected EOF while looking for matching `)'");
        }
        if (peek() == ')') {
            ++pos_;
            break;
        }

        ast::ArrayElement element;
        if (peek() == '[') {
            size_t close = input_.find(']', pos_);
            if (close != std::string::npos && close + 1 < input_.size() &&
                input_[close + 1] == '=') {
                element.key = input_.substr(pos_ + 1, close - pos_ - 1);
                pos_ = close + 2;
            }
        }
        WordBuilder builder;
        read_word_into(builder, false);
        builder.flush();
        if (!element.key.has_value() && builder.word.empty()) {
            fail("syntax error near unexpected token `" + std::string(1, peek()) + "'");
        }
        element.value = std::move(builder.word);
        array.elements.push_back(std::move(element));
    }

    Token token;
    token.type = TokenType::ARRAY_ASSIGN;
    token.text = input_.substr(start, pos_ - start);
    token.array = std::move(array);
    token.line = start_line;
    tokens_.push_back(std::move(token));
}

void Tokenizer::read_word_into(WordBuilder& builder, bool literal_metachars) {
    while (!at_end()) {
        char c = peek();

        if (!literal_metachars) {
            if ((c == '<' || c == '>') && peek(1) == '(') {
                auto close = CommandSubstitutionEvaluator::find_matching_paren(input_, pos_ + 2);
                if (!close.has_value()) {
                    fail("unexpected EOF while looking for matching `)'");
                }
                std::string command = input_.substr(pos_ + 2, *close - pos_ - 2);
                count_lines(pos_, *close);
                builder.add_part(ast::ProcessSubstitution{command, c == '<'});
                pos_ = *close + 1;
                continue;
            }
            if (is_metachar(c)) {
                break;
            }
        }

        switch (c) {
            case '\\':
                if (peek(1) == '\n') {
                    pos_ += 2;
                    ++line_;
                } else if (pos_ + 1 >= input_.size()) {
                    builder.add_literal('\\');
                    ++pos_;
                } else {
                    builder.quoted = true;
                    builder.add_part(ast::StringLiteral{std::string(1, peek(1)), false});
                    pos_ += 2;
                }
                break;
            case '\'':
                read_single_quoted(builder);
                break;
            case '"':
                read_double_quoted(builder);
                break;
            case '`':
                read_backtick(builder);
                break;
            case '$':
                read_dollar(builder);
                break;
            default:
                if (c == '\n') {
                    ++line_;
                }
                builder.add_literal(c);
                ++pos_;
                break;
        }
    }
}

void Tokenizer::read_single_quoted(WordBuilder& builder) {
    size_t end = input_.find('\'', pos_ + 1);
    if (end == std::string::npos) {
        fail("unexpected EOF while looking for matching `''");
    }
    std::string content = input_.substr(pos_ + 1, end - pos_ - 1);
    count_lines(pos_, end);
    builder.quoted = true;
    builder.add_part(ast::StringLiteral{content, false});
    pos_ = end + 1;
}

void Tokenizer::read_double_quoted(WordBuilder& builder) {
    size_t i = pos_ + 1;
    while (i < input_.size() && input_[i] != '"') {
        char c = input_[i];
        if (c == '\\') {
            i += 2;
        } else if (c == '`') {
            size_t close = CommandSubstitutionEvaluator::find_closing_backtick(input_, i + 1);
            if (close == std::string::npos) {
                fail("unexpected EOF while looking for matching ``'");
            }
            i = close + 1;
        } else if (c == '$' && i + 1 < input_.size() && input_[i + 1] == '(') {
            auto close = CommandSubstitutionEvaluator::find_matching_paren(input_, i + 2);
            if (!close.has_value()) {
                fail("unexpected EOF while looking for matching `)'");
            }
            i = *close + 1;
        } else if (c == '$' && i + 1 < input_.size() && input_[i + 1] == '{') {
            size_t close = find_matching_brace(i + 2);
            if (close == std::string::npos) {
                fail("unexpected EOF while looking for matching `}'");
            }
            i = close + 1;
        } else {
            ++i;
        }
    }
    if (i >= input_.size()) {
        fail("unexpected EOF while looking for matching `\"'");
    }

    std::string content = input_.substr(pos_ + 1, i - pos_ - 1);
    count_lines(pos_, i);
    builder.quoted = true;
    builder.add_part(ast::StringLiteral{content, true});
    pos_ = i + 1;
}

void Tokenizer::read_ansi_c_quoted(WordBuilder& builder) {
    // pos_ is at the opening quote after '$'.
    std::string content;
    size_t i = pos_ + 1;
    for (; i < input_.size() && input_[i] != '\''; ++i) {
        char c = input_[i];
        if (c != '\\' || i + 1 >= input_.size()) {
            if (c == '\n') {
                ++line_;
            }
            content += c;
            continue;
        }
        char next = input_[++i];
        switch (next) {
            case 'n':
                content += '\n';
                break;
            case 't':
                content += '\t';
                break;
            case 'r':
                content += '\r';
                break;
            case 'a':
                content += '\a';
                break;
            case 'b':
                content += '\b';
                break;
            case 'e':
            case 'E':
                content += '\x1b';
                break;
            case '\\':
            case '\'':
            case '"':
                content += next;
                break;
            default:
                content += '\\';
                content += next;
                break;
        }
    }
    if (i >= input_.size()) {
        fail("unexpected EOF while looking for matching `''");
    }
    builder.quoted = true;
    builder.add_part(ast::StringLiteral{content, false});
    pos_ = i + 1;
}

void Tokenizer::read_backtick(WordBuilder& builder) {
    size_t close = CommandSubstitutionEvaluator::find_closing_backtick(input_, pos_ + 1);
    if (close == std::string::npos) {
        fail("unexpected EOF while looking for matching ``'");
    }
    std::string raw = input_.substr(pos_ + 1, close - pos_ - 1);
    count_lines(pos_, close);
    builder.add_part(
        ast::CommandSubstitution{CommandSubstitutionEvaluator::unescape_backtick_command(raw)});
    pos_ = close + 1;
}

void Tokenizer::read_dollar(WordBuilder& builder) {
    char next = peek(1);

    if (next == '(' && peek(2) == '(') {
        auto close = CommandSubstitutionEvaluator::find_matching_paren(input_, pos_ + 3);
        if (close.has_value() && *close + 1 < input_.size() && input_[*close + 1] == ')') {
            std::string expression = input_.substr(pos_ + 3, *close - pos_ - 3);
            count_lines(pos_, *close);
            builder.add_part(ast::ArithmeticExpansion{expression});
            pos_ = *close + 2;
            return;
        }
    }

    if (next == '(') {
        auto close = CommandSubstitutionEvaluator::find_matching_paren(input_, pos_ + 2);
        if (!close.has_value()) {
            fail("unexpected EOF while looking for matching `)'");
        }
        std::string command = input_.substr(pos_ + 2, *close - pos_ - 2);
        count_lines(pos_, *close);
        builder.add_part(ast::CommandSubstitution{command});
        pos_ = *close + 1;
        return;
    }

    if (next == '{') {
        size_t close = find_matching_brace(pos_ + 2);
        if (close == std::string::npos) {
            fail("unexpected EOF while looking for matching `}'");
        }
        std::string body = input_.substr(pos_ + 2, close - pos_ - 2);
        try {
            builder.add_part(ParameterExpansionEvaluator::split(body));
        } catch (const ExecutionError& e) {
            fail("${" + body + "}: " + e.info().message);
        }
        count_lines(pos_, close);
        pos_ = close + 1;
        return;
    }

    if (next == '\'') {
        ++pos_;
        read_ansi_c_quoted(builder);
        return;
    }

    if (next == '"') {
        ++pos_;
        read_double_quoted(builder);
        return;
    }

    if (is_name_start(next)) {
        size_t end = pos_ + 1;
        while (end < input_.size() && is_name_char(input_[end])) {
            ++end;
        }
        builder.add_part(ast::Variable{input_.substr(pos_ + 1, end - pos_ - 1)});
        pos_ = end;
        return;
    }

    if (std::isdigit(static_cast<unsigned char>(next)) != 0 || is_special_parameter_char(next)) {
        builder.add_part(ast::Variable{std::string(1, next)});
        pos_ += 2;
        return;
    }

    builder.add_literal('$');
    ++pos_;
}

void Tokenizer::read_here_doc_delimiter(Token& token) {
    while (!at_end() && (peek() == ' ' || peek() == '\t')) {
        ++pos_;
    }
    if (at_end() || is_metachar(peek())) {
        fail("here-document delimiter expected");
    }

    size_t start = pos_;
    WordBuilder discard;
    read_word_into(discard, false);
    std::string raw = input_.substr(start, pos_ - start);

    bool quoted = false;
    token.here_doc.delimiter = remove_delimiter_quotes(raw, quoted);
    token.here_doc.quoted = quoted;
    token.here_doc.strip_tabs = token.redirect_type == ast::RedirectType::HEREDOC_STRIP;
    token.word = ast::Word{{ast::Identifier{token.here_doc.delimiter}}};
}

void Tokenizer::read_pending_here_doc_bodies() {
    for (size_t index : pending_here_docs_) {
        ast::HereDoc& here_doc = tokens_[index].here_doc;
        std::string body;

        while (!at_end()) {
            size_t eol = input_.find('\n', pos_);
            std::string line = input_.substr(
                pos_, eol == std::string::npos ? std::string::npos : eol - pos_);
            pos_ = eol == std::string::npos ? input_.size() : eol + 1;
            ++line_;

            if (here_doc.strip_tabs) {
                size_t first = line.find_first_not_of('\t');
                line.erase(0, first == std::string::npos ? line.size() : first);
            }
            if (line == here_doc.delimiter) {
                break;
            }
            body += line;
            body += '\n';
        }

        here_doc.content = std::move(body);
        here_doc.collected = true;
    }
    pending_here_docs_.clear();
}

size_t Tokenizer::find_matching_brace(size_t start) const {
    int depth = 1;
    char quote = '\0';
    for (size_t i = start; i < input_.size(); ++i) {
        char c = input_[i];
        if (c == '\\' && quote != '\'') {
            ++i;
            continue;
        }
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}' && --depth == 0) {
            return i;
        }
    }
    return std::string::npos;
}

void Tokenizer::count_lines(size_t from, size_t to) {
    for (size_t i = from; i < to && i < input_.size(); ++i) {
        if (input_[i] == '\n') {
            ++line_;
        }
    }
}
