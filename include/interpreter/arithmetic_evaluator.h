#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

// Evaluates $(( ... )) expressions over signed 64-bit integers. Errors are thrown as
// ExecutionError with type ARITHMETIC_ERROR.
class ArithmeticEvaluator {
   public:
    using VariableReader = std::function<std::optional<std::string>(const std::string&)>;
    using VariableWriter = std::function<void(const std::string&, long long)>;
    // Expands a `$...` reference found inside the expression to its text.
    using StringResolver = std::function<std::string(const std::string&)>;

    ArithmeticEvaluator(VariableReader var_reader, VariableWriter var_writer,
                        StringResolver resolver = nullptr);

    long long evaluate(const std::string& expr);

    // Parses decimal, 0x hex and leading-zero octal text with an optional sign.
    static bool parse_integer(const std::string& text, long long& out);

   private:
    enum class TokenType : std::uint8_t {
        NUMBER,
        IDENTIFIER,
        DOLLAR,
        STRING,
        OPERATOR,
        LPAREN,
        RPAREN,
        COMMA,
        QUESTION,
        COLON,
        END
    };

    struct Token {
        TokenType type{};
        long long value{};
        std::string text;
    };

    VariableReader read_variable;
    VariableWriter write_variable;
    StringResolver resolve_string;
    std::minstd_rand random_engine;

    std::vector<Token> tokens;
    size_t pos = 0;
    int skip_depth = 0;
    std::string source;

    std::vector<Token> tokenize(const std::string& expr) const;

    const Token& peek(size_t ahead = 0) const;
    bool match_operator(const std::string& op);
    void expect(TokenType type, const char* what);
    [[noreturn]] void fail(const std::string& message) const;

    long long parse_assignment();
    long long parse_ternary();
    long long parse_logical_or();
    long long parse_logical_and();
    long long parse_comparison();
    long long parse_bit_or();
    long long parse_bit_xor();
    long long parse_bit_and();
    long long parse_shift();
    long long parse_additive();
    long long parse_multiplicative();
    long long parse_power();
    long long parse_unary();
    long long parse_primary();

    long long call_function(const std::string& name);
    std::string parse_string_argument();
    long long variable_value(const std::string& name) const;
    long long text_value(const std::string& text) const;
    std::string resolve_dollar(const std::string& raw) const;
};
