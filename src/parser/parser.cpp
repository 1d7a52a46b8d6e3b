#include "parser.h"

#include <cctype>
#include <utility>

#include "error_out.h"

namespace {

const std::vector<std::string> kReservedTerminators = {"then", "elif", "else", "fi",
                                                       "do",   "done", "esac", "}"};

bool is_valid_name(const std::string& name) {
    if (name.empty() ||
        (std::isalpha(static_cast<unsigned char>(name[0])) == 0 && name[0] != '_')) {
        return false;
    }
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

int default_fd(ast::RedirectType type) {
    switch (type) {
        case ast::RedirectType::INPUT:
        case ast::RedirectType::HEREDOC:
        case ast::RedirectType::HEREDOC_STRIP:
        case ast::RedirectType::HERE_STRING:
        case ast::RedirectType::DUP_IN:
        case ast::RedirectType::READ_WRITE:
            return 0;
        case ast::RedirectType::OUTPUT:
        case ast::RedirectType::APPEND:
        case ast::RedirectType::DUP_OUT:
        case ast::RedirectType::CLOBBER:
            return 1;
    }
    return 1;
}

ast::Word literal_word(const std::string& text) {
    ast::Word word;
    word.parts.emplace_back(ast::Identifier{text});
    return word;
}

// The loop level of `break 2`, or 0 when the argument is not a plain number.
int literal_level(const ast::Word& word) {
    if (word.parts.size() != 1 || !std::holds_alternative<ast::Identifier>(word.parts[0])) {
        return 0;
    }
    const std::string& text = std::get<ast::Identifier>(word.parts[0]).value;
    if (text.empty() || text.size() > 9) {
        return 0;
    }
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return 0;
        }
    }
    return std::stoi(text);
}

}  // namespace

ast::Program Parser::parse(const std::string& text) {
    Tokenizer tokenizer(text);
    tokens_ = tokenizer.tokenize();
    pos_ = 0;

    ast::Program program;
    program.statements = parse_list(kReservedTerminators);
    if (!at(TokenType::END)) {
        unexpected();
    }
    return program;
}

ast::Word Parser::parse_word(const std::string& text) {
    return Tokenizer::parse_word_text(text);
}

std::optional<ast::Assignment> Parser::split_assignment(const ast::Word& word) {
    if (word.parts.empty() || !std::holds_alternative<ast::Identifier>(word.parts[0])) {
        return std::nullopt;
    }
    const std::string& text = std::get<ast::Identifier>(word.parts[0]).value;

    size_t p = 0;
    while (p < text.size() &&
           (std::isalnum(static_cast<unsigned char>(text[p])) != 0 || text[p] == '_')) {
        ++p;
    }
    ast::Assignment assignment;
    assignment.name = text.substr(0, p);
    if (!is_valid_name(assignment.name)) {
        return std::nullopt;
    }

    if (p < text.size() && text[p] == '[') {
        int depth = 0;
        size_t close = p;
        for (; close < text.size(); ++close) {
            if (text[close] == '[') {
                ++depth;
            } else if (text[close] == ']' && --depth == 0) {
                break;
            }
        }
        if (close >= text.size()) {
            return std::nullopt;
        }
        assignment.index = text.substr(p + 1, close - p - 1);
        p = close + 1;
    }
    if (p < text.size() && text[p] == '+') {
        assignment.append = true;
        ++p;
    }
    if (p >= text.size() || text[p] != '=') {
        return std::nullopt;
    }

    std::string rest = text.substr(p + 1);
    if (!rest.empty()) {
        assignment.value.parts.emplace_back(ast::Identifier{rest});
    }
    for (size_t i = 1; i < word.parts.size(); ++i) {
        assignment.value.parts.push_back(word.parts[i]);
    }
    return assignment;
}

bool Parser::at_keyword(const std::string& keyword) const {
    const Token& token = current();
    return token.type == TokenType::WORD && !token.quoted && token.text == keyword;
}

bool Parser::at_any_keyword(const std::vector<std::string>& keywords) const {
    for (const auto& keyword : keywords) {
        if (at_keyword(keyword)) {
            return true;
        }
    }
    return false;
}

bool Parser::at_list_end() const {
    switch (current().type) {
        case TokenType::END:
        case TokenType::RPAREN:
        case TokenType::DSEMI:
        case TokenType::SEMI_AND:
        case TokenType::DSEMI_AND:
            return true;
        default:
            return false;
    }
}

void Parser::advance() {
    if (pos_ + 1 < tokens_.size()) {
        ++pos_;
    }
}

void Parser::expect(TokenType type) {
    if (!at(type)) {
        unexpected();
    }
    advance();
}

void Parser::expect_keyword(const std::string& keyword) {
    if (!at_keyword(keyword)) {
        unexpected();
    }
    advance();
}

void Parser::unexpected() const {
    const Token& token = current();
    std::string message;
    if (token.type == TokenType::END) {
        message = "unexpected end of file";
    } else if (token.type == TokenType::NEWLINE) {
        message = "near unexpected token `newline'";
    } else {
        message = "near unexpected token `" + token.text + "'";
    }
    throw ExecutionError(ErrorType::SYNTAX_ERROR, "line " + std::to_string(token.line), message,
                         2);
}

void Parser::skip_newlines() {
    while (at(TokenType::NEWLINE)) {
        advance();
    }
}

ast::StatementList Parser::parse_list(const std::vector<std::string>& terminators) {
    ast::StatementList list;
    while (true) {
        while (at(TokenType::NEWLINE) || at(TokenType::SEMI)) {
            advance();
        }
        if (at_list_end() || at_any_keyword(terminators)) {
            break;
        }

        list.push_back(parse_and_or());

        if (at(TokenType::NEWLINE) || at(TokenType::SEMI)) {
            continue;
        }
        if (pos_ > 0 && tokens_[pos_ - 1].type == TokenType::AMP) {
            continue;
        }
        if (at_list_end() || at_any_keyword(terminators)) {
            break;
        }
        unexpected();
    }
    return list;
}

ast::BlockStatement Parser::parse_compound_list(const std::vector<std::string>& terminators) {
    ast::BlockStatement block;
    block.statements = parse_list(terminators);
    if (block.statements.empty()) {
        unexpected();
    }
    return block;
}

ast::StatementPtr Parser::parse_and_or() {
    auto first = parse_pipeline();
    if (!at(TokenType::AND_IF) && !at(TokenType::OR_IF)) {
        if (at(TokenType::AMP)) {
            advance();
            first->background = true;
        }
        return simplify(std::move(first));
    }

    ast::AndOrStatement list;
    list.first = std::move(first);
    while (at(TokenType::AND_IF) || at(TokenType::OR_IF)) {
        auto op = at(TokenType::AND_IF) ? ast::AndOrOperator::AND : ast::AndOrOperator::OR;
        advance();
        skip_newlines();
        list.rest.emplace_back(op, parse_pipeline());
    }
    if (at(TokenType::AMP)) {
        advance();
        list.background = true;
    }
    return ast::make_statement(std::move(list));
}

std::unique_ptr<ast::CommandStatement> Parser::parse_pipeline() {
    bool negated = false;
    if (at_keyword("!")) {
        negated = true;
        advance();
    }

    auto first = parse_command();
    ast::CommandStatement* tail = first.get();
    while (at(TokenType::PIPE)) {
        advance();
        skip_newlines();
        tail->pipe = parse_command();
        tail = tail->pipe.get();
    }
    first->negated = negated;
    return first;
}

std::unique_ptr<ast::CommandStatement> Parser::parse_command() {
    auto command = std::make_unique<ast::CommandStatement>();

    if (at_compound_start()) {
        command->compound = parse_compound();
        while (at(TokenType::REDIRECT)) {
            parse_redirect(command->redirects);
        }
        return command;
    }
    if (at(TokenType::LPAREN)) {
        // Subshell groups are not part of the language.
        unexpected();
    }

    parse_simple_command(*command);
    return command;
}

void Parser::parse_simple_command(ast::CommandStatement& command) {
    std::vector<ast::ArrayAssignment> arrays;
    bool consumed = false;

    while (true) {
        if (at(TokenType::REDIRECT)) {
            parse_redirect(command.redirects);
        } else if (at(TokenType::ARRAY_ASSIGN)) {
            arrays.push_back(current().array);
            advance();
        } else if (at(TokenType::WORD)) {
            const Token& token = current();
            if (command.command.has_value()) {
                command.args.push_back(token.word);
                advance();
            } else if (auto assignment = split_assignment(token.word)) {
                command.assignments.push_back(std::move(*assignment));
                advance();
            } else {
                bool double_bracket = !token.quoted && token.text == "[[";
                command.command = token.word;
                advance();
                if (double_bracket) {
                    parse_double_bracket(command);
                }
            }
        } else {
            break;
        }
        consumed = true;
    }

    if (!consumed) {
        unexpected();
    }
    if (arrays.empty()) {
        return;
    }

    bool declares = command.command.has_value() &&
                    (command.command->is_literal("declare") ||
                     command.command->is_literal("typeset"));
    if (command.command.has_value() && !declares) {
        throw ExecutionError(ErrorType::SYNTAX_ERROR, "line " + std::to_string(current().line),
                             "near unexpected token `('", 2);
    }

    ast::CommandStatement inner;
    inner.command = std::move(command.command);
    inner.args = std::move(command.args);
    inner.assignments = std::move(command.assignments);
    inner.redirects = std::move(command.redirects);
    command.command.reset();
    command.args.clear();
    command.assignments.clear();
    command.redirects.clear();

    if (!declares && inner.assignments.empty() && inner.redirects.empty() &&
        arrays.size() == 1) {
        command.compound = ast::make_statement(std::move(arrays.front()));
        return;
    }

    ast::BlockStatement block;
    if (declares) {
        for (const auto& array : arrays) {
            inner.args.push_back(literal_word(array.name));
        }
        block.statements.push_back(ast::make_statement(std::move(inner)));
    }
    for (auto& array : arrays) {
        block.statements.push_back(ast::make_statement(std::move(array)));
    }
    if (!declares && (!inner.assignments.empty() || !inner.redirects.empty())) {
        block.statements.push_back(ast::make_statement(std::move(inner)));
    }
    command.compound = ast::make_statement(std::move(block));
}

void Parser::parse_redirect(std::vector<ast::Redirect>& redirects) {
    Token token = current();
    advance();

    ast::Redirect redirect;
    redirect.type = token.redirect_type;
    redirect.fd = token.fd >= 0 ? token.fd : default_fd(token.redirect_type);

    if (token.redirect_type == ast::RedirectType::HEREDOC ||
        token.redirect_type == ast::RedirectType::HEREDOC_STRIP) {
        redirect.here_doc = token.here_doc;
        redirect.target = token.word;
    } else {
        if (!at(TokenType::WORD)) {
            unexpected();
        }
        redirect.target = current().word;
        advance();
    }
    redirects.push_back(std::move(redirect));

    if (token.both_streams) {
        ast::Redirect duplicate;
        duplicate.type = ast::RedirectType::DUP_OUT;
        duplicate.fd = 2;
        duplicate.target = literal_word("1");
        redirects.push_back(std::move(duplicate));
    }
}

void Parser::parse_double_bracket(ast::CommandStatement& command) {
    while (true) {
        const Token& token = current();
        switch (token.type) {
            case TokenType::WORD:
                if (!token.quoted && token.text == "]]") {
                    advance();
                    return;
                }
                command.args.push_back(token.word);
                break;
            case TokenType::AND_IF:
            case TokenType::OR_IF:
            case TokenType::LPAREN:
            case TokenType::RPAREN:
                command.args.push_back(literal_word(token.text));
                break;
            case TokenType::REDIRECT:
                if (token.text != "<" && token.text != ">") {
                    unexpected();
                }
                command.args.push_back(literal_word(token.text));
                break;
            case TokenType::NEWLINE:
                break;
            default:
                unexpected();
        }
        advance();
    }
}

bool Parser::at_compound_start() const {
    if (at_keyword("if") || at_keyword("for") || at_keyword("while") || at_keyword("until") ||
        at_keyword("case") || at_keyword("{") || at_keyword("function")) {
        return true;
    }
    return current().type == TokenType::WORD && !current().quoted &&
           pos_ + 2 < tokens_.size() && tokens_[pos_ + 1].type == TokenType::LPAREN &&
           tokens_[pos_ + 2].type == TokenType::RPAREN;
}

ast::StatementPtr Parser::parse_compound() {
    if (at_keyword("if")) {
        return parse_if();
    }
    if (at_keyword("for")) {
        return parse_for();
    }
    if (at_keyword("while") || at_keyword("until")) {
        return parse_while(at_keyword("until"));
    }
    if (at_keyword("case")) {
        return parse_case();
    }
    if (at_keyword("{")) {
        return parse_brace_group();
    }
    return parse_function(at_keyword("function"));
}

ast::StatementPtr Parser::parse_if() {
    advance();
    ast::IfStatement statement;
    statement.condition = parse_compound_list({"then"});
    expect_keyword("then");
    statement.consequence = parse_compound_list({"elif", "else", "fi"});

    while (at_keyword("elif")) {
        advance();
        ast::ElifClause clause;
        clause.condition = parse_compound_list({"then"});
        expect_keyword("then");
        clause.consequence = parse_compound_list({"elif", "else", "fi"});
        statement.elif_clauses.push_back(std::move(clause));
    }
    if (at_keyword("else")) {
        advance();
        statement.alternative = parse_compound_list({"fi"});
    }
    expect_keyword("fi");
    return ast::make_statement(std::move(statement));
}

ast::StatementPtr Parser::parse_for() {
    advance();
    if (!at(TokenType::WORD)) {
        unexpected();
    }
    ast::ForStatement statement;
    statement.variable = current().text;
    if (current().quoted || !is_valid_name(statement.variable)) {
        throw ExecutionError(ErrorType::SYNTAX_ERROR, "for",
                             "`" + statement.variable + "': not a valid identifier", 2);
    }
    advance();
    skip_newlines();

    if (at_keyword("in")) {
        advance();
        std::vector<ast::Word> items;
        while (at(TokenType::WORD)) {
            items.push_back(current().word);
            advance();
        }
        if (!at(TokenType::SEMI) && !at(TokenType::NEWLINE)) {
            unexpected();
        }
        statement.in_list = std::move(items);
    }
    while (at(TokenType::SEMI) || at(TokenType::NEWLINE)) {
        advance();
    }

    expect_keyword("do");
    statement.body = parse_compound_list({"done"});
    expect_keyword("done");
    return ast::make_statement(std::move(statement));
}

ast::StatementPtr Parser::parse_while(bool until) {
    advance();
    ast::WhileStatement statement;
    statement.until = until;
    statement.condition = parse_compound_list({"do"});
    expect_keyword("do");
    statement.body = parse_compound_list({"done"});
    expect_keyword("done");
    return ast::make_statement(std::move(statement));
}

ast::StatementPtr Parser::parse_case() {
    advance();
    if (!at(TokenType::WORD)) {
        unexpected();
    }
    ast::CaseStatement statement;
    statement.value = current().word;
    advance();
    skip_newlines();
    expect_keyword("in");

    while (true) {
        skip_newlines();
        if (at_keyword("esac")) {
            break;
        }
        if (at(TokenType::LPAREN)) {
            advance();
        }

        ast::CaseClause clause;
        if (!at(TokenType::WORD)) {
            unexpected();
        }
        clause.patterns.push_back(current().word);
        advance();
        while (at(TokenType::PIPE)) {
            advance();
            if (!at(TokenType::WORD)) {
                unexpected();
            }
            clause.patterns.push_back(current().word);
            advance();
        }
        expect(TokenType::RPAREN);

        clause.body.statements = parse_list({"esac"});
        if (at(TokenType::DSEMI)) {
            clause.terminator = ast::CaseTerminator::BREAK;
            advance();
        } else if (at(TokenType::SEMI_AND)) {
            clause.terminator = ast::CaseTerminator::FALLTHROUGH;
            advance();
        } else if (at(TokenType::DSEMI_AND)) {
            clause.terminator = ast::CaseTerminator::CONTINUE_TEST;
            advance();
        } else if (!at_keyword("esac")) {
            unexpected();
        }
        statement.clauses.push_back(std::move(clause));
    }
    expect_keyword("esac");
    return ast::make_statement(std::move(statement));
}

ast::StatementPtr Parser::parse_brace_group() {
    advance();
    ast::BlockStatement block = parse_compound_list({"}"});
    expect_keyword("}");
    return ast::make_statement(std::move(block));
}

ast::StatementPtr Parser::parse_function(bool keyword_form) {
    if (keyword_form) {
        advance();
    }
    if (!at(TokenType::WORD) || current().quoted) {
        unexpected();
    }
    ast::FunctionStatement statement;
    statement.name = current().text;
    advance();

    if (keyword_form) {
        if (at(TokenType::LPAREN)) {
            advance();
            expect(TokenType::RPAREN);
        }
    } else {
        expect(TokenType::LPAREN);
        expect(TokenType::RPAREN);
    }
    skip_newlines();

    if (!at_compound_start() || at_keyword("function")) {
        unexpected();
    }
    ast::StatementPtr body = parse_compound();
    if (auto* block = std::get_if<ast::BlockStatement>(&body->node)) {
        statement.body = std::make_shared<const ast::BlockStatement>(std::move(*block));
    } else {
        ast::BlockStatement wrapper;
        wrapper.statements.push_back(std::move(body));
        statement.body = std::make_shared<const ast::BlockStatement>(std::move(wrapper));
    }
    return ast::make_statement(std::move(statement));
}

ast::StatementPtr Parser::simplify(std::unique_ptr<ast::CommandStatement> command) {
    bool plain = !command->pipe && !command->negated && !command->background &&
                 command->redirects.empty();
    if (plain && command->compound) {
        return std::move(command->compound);
    }

    if (plain && command->command.has_value() && command->assignments.empty() &&
        command->args.size() <= 1) {
        bool is_break = command->command->is_literal("break");
        bool is_continue = command->command->is_literal("continue");
        if (is_break || is_continue) {
            int level = command->args.empty() ? 1 : literal_level(command->args.front());
            // Anything but a positive literal count is left to the builtin to report.
            if (level >= 1) {
                if (is_break) {
                    return ast::make_statement(ast::BreakStatement{level});
                }
                return ast::make_statement(ast::ContinueStatement{level});
            }
        }
    }
    return ast::make_statement(std::move(*command));
}
