#include "arithmetic_evaluator.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <ctime>
#include <utility>

#include "error_out.h"

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

long long wrap_add(long long a, long long b) {
    return static_cast<long long>(static_cast<unsigned long long>(a) +
                                  static_cast<unsigned long long>(b));
}

long long wrap_sub(long long a, long long b) {
    return static_cast<long long>(static_cast<unsigned long long>(a) -
                                  static_cast<unsigned long long>(b));
}

long long wrap_mul(long long a, long long b) {
    return static_cast<long long>(static_cast<unsigned long long>(a) *
                                  static_cast<unsigned long long>(b));
}

long long fast_pow(long long base, long long exp) {
    unsigned long long result = 1;
    auto current = static_cast<unsigned long long>(base);
    while (exp > 0) {
        if ((exp & 1) != 0) {
            result *= current;
        }
        current *= current;
        exp >>= 1;
    }
    return static_cast<long long>(result);
}

// Finds the end of a balanced region opened at expr[start] by `open`.
size_t find_closing(const std::string& expr, size_t start, char open, char close) {
    int depth = 0;
    for (size_t i = start; i < expr.size(); ++i) {
        char c = expr[i];
        if (c == '\\' && i + 1 < expr.size()) {
            ++i;
            continue;
        }
        if (c == '\'') {
            size_t end = expr.find('\'', i + 1);
            if (end == std::string::npos) {
                return std::string::npos;
            }
            i = end;
            continue;
        }
        if (c == open) {
            ++depth;
        } else if (c == close) {
            --depth;
            if (depth == 0) {
                return i;
            }
        }
    }
    return std::string::npos;
}

const char* const kOperators[] = {"**", "<<", ">>", "<=", ">=", "==", "!=", "&&", "||", "+=",
                                  "-=", "*=", "/=", "%=", "+",  "-",  "*",  "/",  "%",  "<",
                                  ">",  "&",  "|",  "^",  "~",  "!",  "="};

}  // namespace

ArithmeticEvaluator::ArithmeticEvaluator(VariableReader var_reader, VariableWriter var_writer,
                                         StringResolver resolver)
    : read_variable(std::move(var_reader)),
      write_variable(std::move(var_writer)),
      resolve_string(std::move(resolver)),
      random_engine(static_cast<std::minstd_rand::result_type>(std::time(nullptr))) {
}

bool ArithmeticEvaluator::parse_integer(const std::string& text, long long& out) {
    size_t i = 0;
    while (i < text.size() && is_space(text[i])) {
        ++i;
    }
    bool negative = false;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        negative = text[i] == '-';
        ++i;
    }
    if (i >= text.size()) {
        return false;
    }

    unsigned base = 10;
    if (text[i] == '0' && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
        base = 16;
        i += 2;
        if (i >= text.size()) {
            return false;
        }
    } else if (text[i] == '0' && i + 1 < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[i + 1])) != 0) {
        base = 8;
        ++i;
    }

    unsigned long long value = 0;
    size_t digits = 0;
    for (; i < text.size(); ++i) {
        char c = text[i];
        unsigned digit = 0;
        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            digit = static_cast<unsigned>(c - '0');
        } else if (base == 16 && std::isxdigit(static_cast<unsigned char>(c)) != 0) {
            digit = static_cast<unsigned>(std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
        } else {
            break;
        }
        if (digit >= base) {
            return false;
        }
        value = value * base + digit;
        ++digits;
    }
    while (i < text.size() && is_space(text[i])) {
        ++i;
    }
    if (digits == 0 || i != text.size()) {
        return false;
    }
    out = negative ? static_cast<long long>(0ULL - value) : static_cast<long long>(value);
    return true;
}

long long ArithmeticEvaluator::evaluate(const std::string& expr) {
    // Substitutions may re-enter this evaluator, so the parse state is saved around the call.
    auto saved_tokens = std::move(tokens);
    auto saved_source = std::move(source);
    size_t saved_pos = pos;
    int saved_skip = skip_depth;

    auto restore = [&]() {
        tokens = std::move(saved_tokens);
        source = std::move(saved_source);
        pos = saved_pos;
        skip_depth = saved_skip;
    };

    long long result = 0;
    try {
        source = expr;
        pos = 0;
        skip_depth = 0;
        tokens = tokenize(expr);
        if (peek().type != TokenType::END) {
            result = parse_assignment();
            if (peek().type != TokenType::END) {
                fail("syntax error in expression (error token is \"" + peek().text + "\")");
            }
        }
    } catch (...) {
        restore();
        throw;
    }
    restore();
    return result;
}

std::vector<ArithmeticEvaluator::Token> ArithmeticEvaluator::tokenize(
    const std::string& expr) const {
    std::vector<Token> result;
    result.reserve(expr.size() / 2 + 1);

    size_t i = 0;
    while (i < expr.size()) {
        char c = expr[i];
        if (is_space(c)) {
            ++i;
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            size_t j = i;
            while (j < expr.size() && is_identifier_char(expr[j])) {
                ++j;
            }
            Token token{TokenType::NUMBER, 0, expr.substr(i, j - i)};
            if (!parse_integer(token.text, token.value)) {
                fail("value too great for base (error token is \"" + token.text + "\")");
            }
            result.push_back(std::move(token));
            i = j;
            continue;
        }

        if (is_identifier_start(c)) {
            size_t j = i;
            while (j < expr.size() && is_identifier_char(expr[j])) {
                ++j;
            }
            if (j < expr.size() && expr[j] == '[') {
                size_t close = find_closing(expr, j, '[', ']');
                if (close == std::string::npos) {
                    fail("unterminated array subscript");
                }
                j = close + 1;
            }
            result.push_back({TokenType::IDENTIFIER, 0, expr.substr(i, j - i)});
            i = j;
            continue;
        }

        if (c == '$') {
            size_t j = i + 1;
            if (j < expr.size() && expr[j] == '(') {
                size_t close = find_closing(expr, j, '(', ')');
                if (close == std::string::npos) {
                    fail("unterminated substitution");
                }
                j = close + 1;
            } else if (j < expr.size() && expr[j] == '{') {
                size_t close = find_closing(expr, j, '{', '}');
                if (close == std::string::npos) {
                    fail("unterminated parameter expansion");
                }
                j = close + 1;
            } else if (j < expr.size() && is_identifier_start(expr[j])) {
                while (j < expr.size() && is_identifier_char(expr[j])) {
                    ++j;
                }
            } else if (j < expr.size() && std::isdigit(static_cast<unsigned char>(expr[j])) != 0) {
                ++j;
            } else if (j < expr.size() &&
                       std::string("#@*?!$-").find(expr[j]) != std::string::npos) {
                ++j;
            } else {
                fail("invalid variable reference");
            }
            result.push_back({TokenType::DOLLAR, 0, expr.substr(i, j - i)});
            i = j;
            continue;
        }

        if (c == '"' || c == '\'') {
            size_t j = i + 1;
            std::string content;
            while (j < expr.size() && expr[j] != c) {
                if (expr[j] == '\\' && j + 1 < expr.size()) {
                    content += expr[j + 1];
                    j += 2;
                    continue;
                }
                content += expr[j++];
            }
            if (j >= expr.size()) {
                fail("unclosed string literal");
            }
            result.push_back({TokenType::STRING, 0, content});
            i = j + 1;
            continue;
        }

        switch (c) {
            case '(':
                result.push_back({TokenType::LPAREN, 0, "("});
                ++i;
                continue;
            case ')':
                result.push_back({TokenType::RPAREN, 0, ")"});
                ++i;
                continue;
            case ',':
                result.push_back({TokenType::COMMA, 0, ","});
                ++i;
                continue;
            case '?':
                result.push_back({TokenType::QUESTION, 0, "?"});
                ++i;
                continue;
            case ':':
                result.push_back({TokenType::COLON, 0, ":"});
                ++i;
                continue;
            default:
                break;
        }

        bool matched = false;
        for (const char* op : kOperators) {
            std::string candidate(op);
            if (expr.compare(i, candidate.size(), candidate) == 0) {
                result.push_back({TokenType::OPERATOR, 0, candidate});
                i += candidate.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            fail(std::string("syntax error: invalid arithmetic operator (error token is \"") +
                 expr.substr(i) + "\")");
        }
    }

    result.push_back({TokenType::END, 0, ""});
    return result;
}

const ArithmeticEvaluator::Token& ArithmeticEvaluator::peek(size_t ahead) const {
    size_t index = pos + ahead;
    if (index >= tokens.size()) {
        return tokens.back();
    }
    return tokens[index];
}

bool ArithmeticEvaluator::match_operator(const std::string& op) {
    if (peek().type == TokenType::OPERATOR && peek().text == op) {
        ++pos;
        return true;
    }
    return false;
}

void ArithmeticEvaluator::expect(TokenType type, const char* what) {
    if (peek().type != type) {
        fail(std::string("syntax error: expected ") + what);
    }
    ++pos;
}

void ArithmeticEvaluator::fail(const std::string& message) const {
    throw ExecutionError(ErrorType::ARITHMETIC_ERROR, source.empty() ? "arithmetic" : source,
                         message);
}

long long ArithmeticEvaluator::parse_assignment() {
    if (peek().type == TokenType::IDENTIFIER && peek(1).type == TokenType::OPERATOR) {
        const std::string& op = peek(1).text;
        if (op == "=" || op == "+=" || op == "-=" || op == "*=" || op == "/=" || op == "%=") {
            std::string name = peek().text;
            std::string assign_op = op;
            pos += 2;
            long long rhs = parse_assignment();
            long long value = rhs;
            if (assign_op != "=") {
                long long current = variable_value(name);
                if (assign_op == "+=") {
                    value = wrap_add(current, rhs);
                } else if (assign_op == "-=") {
                    value = wrap_sub(current, rhs);
                } else if (assign_op == "*=") {
                    value = wrap_mul(current, rhs);
                } else if (rhs == 0) {
                    if (skip_depth == 0) {
                        fail("division by 0 (error token is \"" + name + "\")");
                    }
                    value = 0;
                } else if (current == LLONG_MIN && rhs == -1) {
                    value = assign_op == "/=" ? LLONG_MIN : 0;
                } else {
                    value = assign_op == "/=" ? current / rhs : current % rhs;
                }
            }
            if (skip_depth == 0 && write_variable) {
                write_variable(name, value);
            }
            return value;
        }
    }
    return parse_ternary();
}

long long ArithmeticEvaluator::parse_ternary() {
    long long condition = parse_logical_or();
    if (peek().type != TokenType::QUESTION) {
        return condition;
    }
    ++pos;

    if (condition == 0) {
        ++skip_depth;
    }
    long long when_true = parse_assignment();
    if (condition == 0) {
        --skip_depth;
    }
    expect(TokenType::COLON, "`:' in conditional expression");
    if (condition != 0) {
        ++skip_depth;
    }
    long long when_false = parse_ternary();
    if (condition != 0) {
        --skip_depth;
    }
    return condition != 0 ? when_true : when_false;
}

long long ArithmeticEvaluator::parse_logical_or() {
    long long left = parse_logical_and();
    while (match_operator("||")) {
        bool short_circuit = left != 0;
        if (short_circuit) {
            ++skip_depth;
        }
        long long right = parse_logical_and();
        if (short_circuit) {
            --skip_depth;
        }
        left = (short_circuit || right != 0) ? 1 : 0;
    }
    return left;
}

long long ArithmeticEvaluator::parse_logical_and() {
    long long left = parse_comparison();
    while (match_operator("&&")) {
        bool short_circuit = left == 0;
        if (short_circuit) {
            ++skip_depth;
        }
        long long right = parse_comparison();
        if (short_circuit) {
            --skip_depth;
        }
        left = (!short_circuit && right != 0) ? 1 : 0;
    }
    return left;
}

long long ArithmeticEvaluator::parse_comparison() {
    long long left = parse_bit_or();
    while (true) {
        if (match_operator("==")) {
            left = left == parse_bit_or() ? 1 : 0;
        } else if (match_operator("!=")) {
            left = left != parse_bit_or() ? 1 : 0;
        } else if (match_operator("<=")) {
            left = left <= parse_bit_or() ? 1 : 0;
        } else if (match_operator(">=")) {
            left = left >= parse_bit_or() ? 1 : 0;
        } else if (match_operator("<")) {
            left = left < parse_bit_or() ? 1 : 0;
        } else if (match_operator(">")) {
            left = left > parse_bit_or() ? 1 : 0;
        } else {
            return left;
        }
    }
}

long long ArithmeticEvaluator::parse_bit_or() {
    long long left = parse_bit_xor();
    while (match_operator("|")) {
        left |= parse_bit_xor();
    }
    return left;
}

long long ArithmeticEvaluator::parse_bit_xor() {
    long long left = parse_bit_and();
    while (match_operator("^")) {
        left ^= parse_bit_and();
    }
    return left;
}

long long ArithmeticEvaluator::parse_bit_and() {
    long long left = parse_shift();
    while (match_operator("&")) {
        left &= parse_shift();
    }
    return left;
}

long long ArithmeticEvaluator::parse_shift() {
    long long left = parse_additive();
    while (true) {
        if (match_operator("<<")) {
            long long count = parse_additive() & 63;
            left = static_cast<long long>(static_cast<unsigned long long>(left) << count);
        } else if (match_operator(">>")) {
            long long count = parse_additive() & 63;
            left >>= count;
        } else {
            return left;
        }
    }
}

long long ArithmeticEvaluator::parse_additive() {
    long long left = parse_multiplicative();
    while (true) {
        if (match_operator("+")) {
            left = wrap_add(left, parse_multiplicative());
        } else if (match_operator("-")) {
            left = wrap_sub(left, parse_multiplicative());
        } else {
            return left;
        }
    }
}

long long ArithmeticEvaluator::parse_multiplicative() {
    long long left = parse_power();
    while (true) {
        std::string op;
        if (match_operator("*")) {
            op = "*";
        } else if (match_operator("/")) {
            op = "/";
        } else if (match_operator("%")) {
            op = "%";
        } else {
            return left;
        }

        long long right = parse_power();
        if (op == "*") {
            left = wrap_mul(left, right);
            continue;
        }
        if (right == 0) {
            if (skip_depth == 0) {
                fail("division by 0 (error token is \"0\")");
            }
            left = 0;
        } else if (left == LLONG_MIN && right == -1) {
            left = op == "/" ? LLONG_MIN : 0;
        } else {
            left = op == "/" ? left / right : left % right;
        }
    }
}

long long ArithmeticEvaluator::parse_power() {
    long long base = parse_unary();
    if (!match_operator("**")) {
        return base;
    }
    long long exponent = parse_power();
    if (exponent < 0) {
        if (skip_depth == 0) {
            fail("exponent less than 0");
        }
        return 0;
    }
    return fast_pow(base, exponent);
}

long long ArithmeticEvaluator::parse_unary() {
    if (match_operator("-")) {
        return wrap_sub(0, parse_unary());
    }
    if (match_operator("+")) {
        return parse_unary();
    }
    if (match_operator("!")) {
        return parse_unary() == 0 ? 1 : 0;
    }
    if (match_operator("~")) {
        return ~parse_unary();
    }
    return parse_primary();
}

long long ArithmeticEvaluator::parse_primary() {
    const Token& token = peek();
    switch (token.type) {
        case TokenType::NUMBER:
            ++pos;
            return token.value;
        case TokenType::IDENTIFIER: {
            std::string name = token.text;
            ++pos;
            if (peek().type == TokenType::LPAREN) {
                ++pos;
                return call_function(name);
            }
            return variable_value(name);
        }
        case TokenType::DOLLAR: {
            std::string raw = token.text;
            ++pos;
            return text_value(resolve_dollar(raw));
        }
        case TokenType::LPAREN: {
            ++pos;
            long long value = parse_assignment();
            expect(TokenType::RPAREN, "`)'");
            return value;
        }
        case TokenType::END:
            fail("syntax error: operand expected");
        default:
            fail("syntax error: operand expected (error token is \"" + token.text + "\")");
    }
}

std::string ArithmeticEvaluator::parse_string_argument() {
    const Token& token = peek();
    switch (token.type) {
        case TokenType::STRING:
        case TokenType::IDENTIFIER: {
            std::string text = token.text;
            ++pos;
            return text;
        }
        case TokenType::DOLLAR: {
            std::string raw = token.text;
            ++pos;
            return resolve_dollar(raw);
        }
        default:
            fail("expected string argument (variable or string literal)");
    }
}

long long ArithmeticEvaluator::call_function(const std::string& name) {
    static const char* const known[] = {"abs", "min",  "max",    "length", "int",
                                        "rand", "srand", "substr", "index"};
    bool is_known = false;
    for (const char* candidate : known) {
        if (name == candidate) {
            is_known = true;
            break;
        }
    }
    if (!is_known) {
        fail("unknown arithmetic function: " + name);
    }

    std::vector<long long> numbers;
    std::vector<std::string> strings;
    size_t string_slots = name == "index" ? 2 : (name == "substr" ? 1 : 0);

    if (peek().type != TokenType::RPAREN) {
        size_t index = 0;
        while (true) {
            if (index < string_slots) {
                strings.push_back(parse_string_argument());
            } else {
                numbers.push_back(parse_assignment());
            }
            ++index;
            if (peek().type == TokenType::COMMA) {
                ++pos;
                continue;
            }
            break;
        }
    }
    expect(TokenType::RPAREN, "`)' after function arguments");

    auto arity_error = [&](const std::string& requirement, size_t got) {
        fail(name + " requires " + requirement + ", got " + std::to_string(got));
    };

    if (name == "abs") {
        if (numbers.size() != 1) {
            arity_error("1 argument", numbers.size());
        }
        return numbers[0] < 0 ? wrap_sub(0, numbers[0]) : numbers[0];
    }
    if (name == "min" || name == "max") {
        if (numbers.empty()) {
            arity_error("at least 1 argument", 0);
        }
        long long best = numbers[0];
        for (long long value : numbers) {
            best = name == "min" ? std::min(best, value) : std::max(best, value);
        }
        return best;
    }
    if (name == "length") {
        if (numbers.size() != 1) {
            arity_error("1 argument", numbers.size());
        }
        std::string digits = std::to_string(numbers[0]);
        if (!digits.empty() && digits[0] == '-') {
            digits.erase(0, 1);
        }
        return static_cast<long long>(digits.size());
    }
    if (name == "int") {
        if (numbers.size() != 1) {
            arity_error("1 argument", numbers.size());
        }
        return numbers[0];
    }
    if (name == "rand") {
        if (!numbers.empty()) {
            arity_error("no arguments", numbers.size());
        }
        return static_cast<long long>(random_engine() % 32768);
    }
    if (name == "srand") {
        if (numbers.size() > 1) {
            arity_error("0 or 1 argument", numbers.size());
        }
        auto seed = numbers.empty() ? static_cast<long long>(std::time(nullptr)) : numbers[0];
        random_engine.seed(static_cast<std::minstd_rand::result_type>(seed));
        return 0;
    }
    if (name == "substr") {
        if (strings.size() != 1 || numbers.size() != 2) {
            fail("substr requires a string and 2 numeric arguments (start, length)");
        }
        auto size = static_cast<long long>(strings[0].size());
        long long start = numbers[0];
        if (start < 0) {
            start += size;
        }
        if (start < 0) {
            start = 0;
        }
        if (start >= size) {
            return 0;
        }
        long long end = std::min(wrap_add(start, numbers[1]), size);
        return std::max(0LL, end - start);
    }
    // index
    if (strings.size() != 2 || !numbers.empty()) {
        fail("index requires 2 string arguments");
    }
    size_t found = strings[0].find(strings[1]);
    return found == std::string::npos ? 0 : static_cast<long long>(found + 1);
}

long long ArithmeticEvaluator::text_value(const std::string& text) const {
    long long value = 0;
    if (parse_integer(text, value)) {
        return value;
    }
    return 0;
}

long long ArithmeticEvaluator::variable_value(const std::string& name) const {
    if (!read_variable) {
        return 0;
    }
    auto value = read_variable(name);
    if (!value.has_value()) {
        return 0;
    }
    return text_value(*value);
}

std::string ArithmeticEvaluator::resolve_dollar(const std::string& raw) const {
    if (resolve_string) {
        return resolve_string(raw);
    }
    std::string name;
    if (raw.size() > 3 && raw[1] == '{' && raw.back() == '}') {
        name = raw.substr(2, raw.size() - 3);
    } else if (raw.size() > 1 && raw[1] != '(') {
        name = raw.substr(1);
    } else {
        fail("command substitution is not available here");
    }
    if (!read_variable) {
        return std::string();
    }
    auto value = read_variable(name);
    return value.has_value() ? *value : std::string();
}
