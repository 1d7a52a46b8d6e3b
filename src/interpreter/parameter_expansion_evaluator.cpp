#include "parameter_expansion_evaluator.h"

#include <algorithm>
#include <cctype>

#include "error_out.h"
#include "pattern_matcher.h"

namespace {

bool is_list_subscript(const std::string& name) {
    return name.size() > 3 && (name.compare(name.size() - 3, 3, "[@]") == 0 ||
                               name.compare(name.size() - 3, 3, "[*]") == 0);
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Length of the parameter name at the start of text, including an array subscript.
size_t scan_name(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    char first = text[0];
    if (std::string("@*#?$!-0").find(first) != std::string::npos) {
        return 1;
    }
    size_t end = 0;
    if (std::isdigit(static_cast<unsigned char>(first)) != 0) {
        while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end])) != 0) {
            ++end;
        }
        return end;
    }
    if (std::isalpha(static_cast<unsigned char>(first)) == 0 && first != '_') {
        return 0;
    }
    while (end < text.size() && is_identifier_char(text[end])) {
        ++end;
    }
    if (end < text.size() && text[end] == '[') {
        int depth = 0;
        for (size_t i = end; i < text.size(); ++i) {
            if (text[i] == '[') {
                ++depth;
            } else if (text[i] == ']' && --depth == 0) {
                return i + 1;
            }
        }
    }
    return end;
}

// Index of the first unescaped, unquoted `sep` at nesting depth zero.
size_t find_top_level(const std::string& text, char sep) {
    int depth = 0;
    char quote = '\0';
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
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
        } else if (c == '(' || c == '{' || c == '[') {
            ++depth;
        } else if ((c == ')' || c == '}' || c == ']') && depth > 0) {
            --depth;
        } else if (c == sep && depth == 0) {
            return i;
        }
    }
    return std::string::npos;
}

char convert_case(char c, bool uppercase) {
    auto uc = static_cast<unsigned char>(c);
    return static_cast<char>(uppercase ? std::toupper(uc) : std::tolower(uc));
}

}  // namespace

ParameterExpansionEvaluator::ParameterExpansionEvaluator(Callbacks callbacks)
    : cb(std::move(callbacks)) {
}

bool ParameterExpansionEvaluator::is_special_parameter(const std::string& name) {
    return name == "?" || name == "$" || name == "#" || name == "@" || name == "*" ||
           name == "!" || name == "0" || name == "-";
}

ast::ParamExpandExpression ParameterExpansionEvaluator::split(const std::string& body) {
    auto bad_substitution = [&body]() {
        return ExecutionError(ErrorType::VARIABLE_ERROR, "${" + body + "}", "bad substitution");
    };

    if (body.empty()) {
        throw bad_substitution();
    }

    if ((body[0] == '#' || body[0] == '!') && body.size() > 1) {
        std::string rest = body.substr(1);
        size_t end = scan_name(rest);
        if (end > 0 && end == rest.size()) {
            return {rest, body[0] == '#' ? "length" : "indirect", ""};
        }
    }

    size_t end = scan_name(body);
    if (end == 0) {
        throw bad_substitution();
    }

    std::string name = body.substr(0, end);
    std::string rest = body.substr(end);
    if (rest.empty()) {
        return {name, "", ""};
    }

    static const char* const operators[] = {":-", ":=", ":?", ":+", ":",  "##", "#",
                                            "%%", "%",  "//", "/",  "^^", "^",  ",,",
                                            ",",  "-",  "=",  "?",  "+"};
    for (const char* op : operators) {
        std::string candidate(op);
        if (rest.compare(0, candidate.size(), candidate) == 0) {
            return {name, candidate, rest.substr(candidate.size())};
        }
    }
    throw bad_substitution();
}

std::optional<std::string> ParameterExpansionEvaluator::read_checked(
    const std::string& name) const {
    auto value = cb.read_variable(name);
    if (!value.has_value() && nounset && !is_special_parameter(name)) {
        throw ExecutionError(ErrorType::VARIABLE_ERROR, name, name + ": unbound variable");
    }
    return value;
}

std::string ParameterExpansionEvaluator::expand(const ast::ParamExpandExpression& expr) const {
    const std::string& name = expr.var_name;
    const std::string& op = expr.op;
    const std::string& operand = expr.word;

    if (op == "length") {
        if (!is_list_subscript(name)) {
            read_checked(name);
        }
        return std::to_string(cb.count_elements(name));
    }

    if (op == "indirect") {
        if (is_list_subscript(name)) {
            std::string joined;
            for (const auto& key : cb.list_keys(name.substr(0, name.size() - 3))) {
                if (!joined.empty()) {
                    joined += ' ';
                }
                joined += key;
            }
            return joined;
        }
        auto target = read_checked(name);
        if (!target.has_value() || target->empty()) {
            return "";
        }
        auto value = read_checked(*target);
        return value.value_or("");
    }

    if (op.empty()) {
        return read_checked(name).value_or("");
    }

    auto value = cb.read_variable(name);
    bool is_set = value.has_value();
    bool is_null = !is_set || value->empty();

    if (op == ":-") {
        return is_null ? cb.expand_word(operand) : *value;
    }
    if (op == "-") {
        return is_set ? *value : cb.expand_word(operand);
    }
    if (op == ":=" || op == "=") {
        if (op == ":=" ? is_null : !is_set) {
            std::string assigned = cb.expand_word(operand);
            cb.write_variable(name, assigned);
            return assigned;
        }
        return *value;
    }
    if (op == ":?" || op == "?") {
        if (op == ":?" ? is_null : !is_set) {
            std::string message = operand.empty()
                                      ? (op == ":?" ? "parameter null or not set"
                                                    : "parameter not set")
                                      : cb.expand_word(operand);
            throw ExecutionError(ErrorType::VARIABLE_ERROR, name, message);
        }
        return *value;
    }
    if (op == ":+") {
        return is_null ? "" : cb.expand_word(operand);
    }
    if (op == "+") {
        return is_set ? cb.expand_word(operand) : "";
    }

    std::string current = read_checked(name).value_or("");

    if (op == "#" || op == "##") {
        return strip_prefix(current, cb.expand_pattern(operand), op == "##");
    }
    if (op == "%" || op == "%%") {
        return strip_suffix(current, cb.expand_pattern(operand), op == "%%");
    }
    if (op == "/" || op == "//") {
        return pattern_substitute(current, operand, op == "//");
    }
    if (op == "^" || op == "^^") {
        return case_convert(current, operand, true, op == "^^");
    }
    if (op == "," || op == ",,") {
        return case_convert(current, operand, false, op == ",,");
    }
    if (op == ":") {
        return substring(current, operand);
    }

    throw ExecutionError(ErrorType::VARIABLE_ERROR, "${" + name + op + operand + "}",
                         "bad substitution");
}

std::string ParameterExpansionEvaluator::strip_prefix(const std::string& value,
                                                      const std::string& pattern, bool longest) {
    if (value.empty() || pattern.empty()) {
        return value;
    }

    PatternMatcher matcher;
    if (longest) {
        for (size_t i = value.length() + 1; i-- > 0;) {
            if (matcher.matches_single_pattern(value.substr(0, i), pattern)) {
                return value.substr(i);
            }
        }
        return value;
    }
    for (size_t i = 0; i <= value.length(); ++i) {
        if (matcher.matches_single_pattern(value.substr(0, i), pattern)) {
            return value.substr(i);
        }
    }
    return value;
}

std::string ParameterExpansionEvaluator::strip_suffix(const std::string& value,
                                                      const std::string& pattern, bool longest) {
    if (value.empty() || pattern.empty()) {
        return value;
    }

    PatternMatcher matcher;
    if (longest) {
        for (size_t start = 0; start <= value.length(); ++start) {
            if (matcher.matches_single_pattern(value.substr(start), pattern)) {
                return value.substr(0, start);
            }
        }
        return value;
    }
    for (size_t start = value.length() + 1; start-- > 0;) {
        if (matcher.matches_single_pattern(value.substr(start), pattern)) {
            return value.substr(0, start);
        }
    }
    return value;
}

std::string ParameterExpansionEvaluator::pattern_substitute(const std::string& value,
                                                            const std::string& operand,
                                                            bool global) const {
    size_t slash = std::string::npos;
    for (size_t i = 0; i < operand.size(); ++i) {
        if (operand[i] == '\\') {
            ++i;
        } else if (operand[i] == '/') {
            slash = i;
            break;
        }
    }

    std::string raw_pattern = operand.substr(0, slash);
    std::string replacement =
        slash == std::string::npos ? std::string() : cb.expand_word(operand.substr(slash + 1));

    bool anchor_prefix = false;
    bool anchor_suffix = false;
    if (!raw_pattern.empty() && (raw_pattern[0] == '#' || raw_pattern[0] == '%')) {
        anchor_prefix = raw_pattern[0] == '#';
        anchor_suffix = raw_pattern[0] == '%';
        raw_pattern.erase(0, 1);
    }

    std::string pattern = cb.expand_pattern(raw_pattern);
    if (pattern.empty() || value.empty()) {
        return value;
    }

    PatternMatcher matcher;
    if (anchor_prefix) {
        for (size_t len = value.length(); len > 0; --len) {
            if (matcher.matches_single_pattern(value.substr(0, len), pattern)) {
                return replacement + value.substr(len);
            }
        }
        return value;
    }
    if (anchor_suffix) {
        for (size_t start = 0; start < value.length(); ++start) {
            if (matcher.matches_single_pattern(value.substr(start), pattern)) {
                return value.substr(0, start) + replacement;
            }
        }
        return value;
    }

    std::string result;
    size_t i = 0;
    bool replaced = false;
    while (i < value.length()) {
        size_t match_len = 0;
        if (!replaced || global) {
            for (size_t len = value.length() - i; len > 0; --len) {
                if (matcher.matches_single_pattern(value.substr(i, len), pattern)) {
                    match_len = len;
                    break;
                }
            }
        }
        if (match_len > 0) {
            result += replacement;
            i += match_len;
            replaced = true;
        } else {
            result += value[i];
            ++i;
        }
    }
    return result;
}

std::string ParameterExpansionEvaluator::case_convert(const std::string& value,
                                                      const std::string& operand,
                                                      bool uppercase, bool all_chars) const {
    if (value.empty()) {
        return value;
    }

    std::string pattern = operand.empty() ? "?" : cb.expand_pattern(operand);
    PatternMatcher matcher;
    std::string result = value;
    size_t limit = all_chars ? result.size() : 1;
    for (size_t i = 0; i < limit; ++i) {
        if (matcher.matches_single_pattern(std::string(1, result[i]), pattern)) {
            result[i] = convert_case(result[i], uppercase);
        }
    }
    return result;
}

std::string ParameterExpansionEvaluator::substring(const std::string& value,
                                                   const std::string& operand) const {
    size_t colon = find_top_level(operand, ':');
    std::string offset_text = operand.substr(0, colon);
    bool has_length = colon != std::string::npos;

    auto evaluate = [this](const std::string& text) -> long long {
        for (char c : text) {
            if (std::isspace(static_cast<unsigned char>(c)) == 0) {
                return cb.evaluate_arithmetic(text);
            }
        }
        return 0;
    };

    auto size = static_cast<long long>(value.size());
    long long start = evaluate(offset_text);
    if (start < 0) {
        start += size;
        if (start < 0) {
            return "";
        }
    }
    if (start > size) {
        return "";
    }

    if (!has_length) {
        return value.substr(static_cast<size_t>(start));
    }

    long long length = evaluate(operand.substr(colon + 1));
    long long end = 0;
    if (length >= 0) {
        end = length >= size - start ? size : start + length;
    } else {
        end = size + length;
    }
    if (end <= start) {
        return "";
    }
    return value.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
}
