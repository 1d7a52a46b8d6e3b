#include "word_expander.h"

#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <type_traits>
#include <utility>

#include "debug.h"
#include "error_out.h"
#include "glob_expander.h"
#include "parser.h"
#include "pattern_matcher.h"
#include "word_splitter.h"

namespace {

template <class>
inline constexpr bool always_false_v = false;

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_list_reference(const std::string& name) {
    return name.size() > 3 && (name.compare(name.size() - 3, 3, "[@]") == 0 ||
                               name.compare(name.size() - 3, 3, "[*]") == 0);
}

// Splits "name[sub]" into its parts. False for a plain name.
bool split_subscript(const std::string& reference, std::string& base, std::string& subscript) {
    size_t open = reference.find('[');
    if (open == std::string::npos || open == 0 || reference.back() != ']') {
        return false;
    }
    base = reference.substr(0, open);
    subscript = reference.substr(open + 1, reference.size() - open - 2);
    return true;
}

size_t find_closing_brace(const std::string& text, size_t start) {
    int depth = 1;
    char quote = '\0';
    for (size_t i = start; i < text.size(); ++i) {
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
        } else if (c == '{') {
            ++depth;
        } else if (c == '}' && --depth == 0) {
            return i;
        }
    }
    return std::string::npos;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += items[i];
    }
    return out;
}

bool is_glob_char(char c) {
    return c == '*' || c == '?' || c == '[';
}

}  // namespace

// Accumulates expansion output into fields. Unquoted text keeps its glob characters active
// in the pattern; quoted text is escaped there. Splitting applies only to expansion results.
class WordExpander::FieldBuilder {
   public:
    struct Field {
        std::string text;
        std::string pattern;
        bool globbable = false;
    };

    FieldBuilder(bool split, const std::optional<std::string>& ifs)
        : split_(split),
          ifs_(ifs.has_value() ? *ifs : word_splitter::DEFAULT_IFS),
          no_split_(ifs.has_value() && ifs->empty()) {
    }

    void add_literal(const std::string& text) {
        if (text.empty()) {
            return;
        }
        resolve_pending();
        current_.text += text;
        current_.pattern += text;
        if (PatternMatcher::has_glob_chars(text)) {
            current_.globbable = true;
        }
        has_content_ = true;
    }

    void add_quoted(const std::string& text) {
        resolve_pending();
        current_.text += text;
        current_.pattern += PatternMatcher::escape(text);
        has_content_ = true;
    }

    void add_expansion(const std::string& value) {
        if (!split_ || no_split_) {
            add_literal(value);
            return;
        }
        for (char c : value) {
            if (ifs_.find(c) == std::string::npos) {
                resolve_pending();
                current_.text += c;
                current_.pattern += c;
                if (is_glob_char(c)) {
                    current_.globbable = true;
                }
                has_content_ = true;
            } else if (word_splitter::is_ifs_whitespace(c)) {
                if (has_content_) {
                    pending_break_ = true;
                }
            } else {
                push();
                pending_break_ = false;
            }
        }
    }

    // Ends the current field unconditionally, as between the elements of "$@".
    void break_field() {
        if (!split_) {
            current_.text += ' ';
            current_.pattern += ' ';
            return;
        }
        pending_break_ = false;
        push();
    }

    // Ends the current field before the next content, as between the elements of $@.
    void soft_break() {
        if (!split_) {
            if (has_content_) {
                current_.text += ' ';
                current_.pattern += ' ';
            }
            return;
        }
        if (has_content_) {
            pending_break_ = true;
        }
    }

    std::vector<Field> finish() {
        if (has_content_) {
            push();
        }
        return std::move(fields_);
    }

   private:
    bool split_;
    std::string ifs_;
    bool no_split_;
    Field current_;
    bool has_content_ = false;
    bool pending_break_ = false;
    std::vector<Field> fields_;

    void resolve_pending() {
        if (pending_break_) {
            pending_break_ = false;
            push();
        }
    }

    void push() {
        fields_.push_back(std::move(current_));
        current_ = Field{};
        has_content_ = false;
    }
};

WordExpander::WordExpander(Environment& env, const ShellOptions& options,
                           CommandRunner run_command, ProcessSubstituter substitute_process)
    : env_(env),
      options_(options),
      run_command_(std::move(run_command)),
      substitute_process_(std::move(substitute_process)),
      arithmetic_([this](const std::string& name) { return lookup(name); },
                  [this](const std::string& name, long long value) {
                      assign_reference(name, std::to_string(value));
                  },
                  [this](const std::string& raw) { return expand_variables_in_string(raw); }),
      parameters_(ParameterExpansionEvaluator::Callbacks{
          [this](const std::string& name) { return lookup(name); },
          [this](const std::string& name, const std::string& value) {
              assign_reference(name, value);
          },
          [this](const std::string& name) { return count_elements(name); },
          [this](const std::string& base) { return list_keys(base); },
          [this](const std::string& text) { return expand(Parser::parse_word(text)); },
          [this](const std::string& text) { return expand_pattern(Parser::parse_word(text)); },
          [this](const std::string& text) { return evaluate_arithmetic(text); }}) {
}

std::string WordExpander::expand(const ast::Word& word) {
    FieldBuilder builder(false, env_.get("IFS"));
    expand_parts(word, Mode{}, builder);
    auto fields = builder.finish();
    return fields.empty() ? std::string() : fields.front().text;
}

std::vector<std::string> WordExpander::expand_word_fields(const ast::Word& word) {
    FieldBuilder builder(true, env_.get("IFS"));
    expand_parts(word, Mode{true, false}, builder);

    std::vector<std::string> result;
    for (auto& field : builder.finish()) {
        if (field.globbable) {
            auto matches = glob_expander::match_paths(field.pattern, options_.globstar);
            if (!matches.empty()) {
                result.insert(result.end(), matches.begin(), matches.end());
                continue;
            }
        }
        result.push_back(std::move(field.text));
    }
    return result;
}

std::vector<std::string> WordExpander::expand_words(const std::vector<ast::Word>& words) {
    std::vector<std::string> result;
    for (const auto& word : words) {
        auto fields = expand_word_fields(word);
        result.insert(result.end(), std::make_move_iterator(fields.begin()),
                      std::make_move_iterator(fields.end()));
    }
    return result;
}

std::string WordExpander::expand_assignment_value(const ast::Word& word) {
    FieldBuilder builder(false, env_.get("IFS"));
    expand_parts(word, Mode{false, true}, builder);
    auto fields = builder.finish();
    return fields.empty() ? std::string() : fields.front().text;
}

std::string WordExpander::expand_pattern(const ast::Word& word) {
    FieldBuilder builder(false, env_.get("IFS"));
    expand_parts(word, Mode{}, builder);
    auto fields = builder.finish();
    return fields.empty() ? std::string() : fields.front().pattern;
}

void WordExpander::expand_parts(const ast::Word& word, Mode mode, FieldBuilder& builder) {
    for (size_t i = 0; i < word.parts.size(); ++i) {
        std::visit(
            [&](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, ast::Identifier>) {
                    std::string text = node.value;
                    if (i == 0 && !text.empty() && text[0] == '~') {
                        size_t end = text.find('/');
                        if (mode.assignment) {
                            end = std::min(end, text.find(':'));
                        }
                        bool whole = end == std::string::npos;
                        if (!whole || word.parts.size() == 1) {
                            auto home = expand_tilde_prefix(text.substr(1, end - 1));
                            if (home.has_value()) {
                                builder.add_quoted(*home);
                                text = whole ? std::string() : text.substr(end);
                            }
                        }
                    }
                    if (mode.assignment) {
                        text = tilde_expand_after_colons(text);
                    }
                    builder.add_literal(text);
                } else if constexpr (std::is_same_v<T, ast::StringLiteral>) {
                    if (node.is_quote) {
                        add_double_quoted(node.value, builder);
                    } else {
                        builder.add_quoted(node.value);
                    }
                } else if constexpr (std::is_same_v<T, ast::Variable>) {
                    add_unquoted(variable_segment(node.name), builder);
                } else if constexpr (std::is_same_v<T, ast::ParamExpandExpression>) {
                    add_unquoted(evaluate_parameter(node), builder);
                } else if constexpr (std::is_same_v<T, ast::CommandSubstitution>) {
                    builder.add_expansion(command_substitute(node.command));
                } else if constexpr (std::is_same_v<T, ast::ArithmeticExpansion>) {
                    builder.add_expansion(std::to_string(evaluate_arithmetic(node.expression)));
                } else if constexpr (std::is_same_v<T, ast::ProcessSubstitution>) {
                    builder.add_quoted(substitute_process_(node.command, node.is_input));
                } else {
                    static_assert(always_false_v<T>, "unhandled word part");
                }
            },
            word.parts[i]);
    }
}

void WordExpander::add_double_quoted(const std::string& text, FieldBuilder& builder) {
    auto segments = scan_double_quoted(text, false);
    if (segments.empty()) {
        builder.add_quoted("");
        return;
    }
    for (const auto& segment : segments) {
        if (!segment.is_list) {
            builder.add_quoted(segment.text);
        } else if (segment.star) {
            builder.add_quoted(join(segment.items, ifs_join_separator()));
        } else {
            for (size_t k = 0; k < segment.items.size(); ++k) {
                if (k > 0) {
                    builder.break_field();
                }
                builder.add_quoted(segment.items[k]);
            }
        }
    }
}

void WordExpander::add_unquoted(const Segment& segment, FieldBuilder& builder) {
    if (!segment.is_list) {
        builder.add_expansion(segment.text);
        return;
    }
    for (size_t k = 0; k < segment.items.size(); ++k) {
        if (k > 0) {
            builder.soft_break();
        }
        builder.add_expansion(segment.items[k]);
    }
}

std::vector<WordExpander::Segment> WordExpander::scan_double_quoted(const std::string& text,
                                                                    bool here_document) {
    std::vector<Segment> segments;
    Segment current;
    auto flush = [&]() {
        if (!current.text.empty()) {
            segments.push_back(std::move(current));
        }
        current = Segment{};
    };

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size()) {
            char next = text[i + 1];
            if (next == '$' || next == '`' || next == '\\' || (next == '"' && !here_document)) {
                current.text += next;
                i += 2;
            } else if (next == '\n') {
                i += 2;
            } else {
                current.text += c;
                ++i;
            }
            continue;
        }
        if (c == '`') {
            size_t close = CommandSubstitutionEvaluator::find_closing_backtick(text, i + 1);
            if (close == std::string::npos) {
                current.text += text.substr(i);
                break;
            }
            current.text += command_substitute(CommandSubstitutionEvaluator::unescape_backtick_command(
                text.substr(i + 1, close - i - 1)));
            i = close + 1;
            continue;
        }
        if (c == '$') {
            Segment expansion;
            i = expand_dollar(text, i, expansion);
            if (expansion.is_list) {
                flush();
                segments.push_back(std::move(expansion));
            } else {
                current.text += expansion.text;
            }
            continue;
        }
        current.text += c;
        ++i;
    }
    flush();
    return segments;
}

size_t WordExpander::expand_dollar(const std::string& text, size_t index, Segment& out) {
    char next = index + 1 < text.size() ? text[index + 1] : '\0';

    if (next == '(' && index + 2 < text.size() && text[index + 2] == '(') {
        auto close = CommandSubstitutionEvaluator::find_matching_paren(text, index + 3);
        if (close.has_value() && *close + 1 < text.size() && text[*close + 1] == ')') {
            out.text = std::to_string(
                evaluate_arithmetic(text.substr(index + 3, *close - index - 3)));
            return *close + 2;
        }
    }

    if (next == '(') {
        auto close = CommandSubstitutionEvaluator::find_matching_paren(text, index + 2);
        if (!close.has_value()) {
            out.text = "$";
            return index + 1;
        }
        out.text = command_substitute(text.substr(index + 2, *close - index - 2));
        return *close + 1;
    }

    if (next == '{') {
        size_t close = find_closing_brace(text, index + 2);
        if (close == std::string::npos) {
            out.text = "$";
            return index + 1;
        }
        out = evaluate_parameter(
            ParameterExpansionEvaluator::split(text.substr(index + 2, close - index - 2)));
        return close + 1;
    }

    if (is_name_start(next)) {
        size_t end = index + 1;
        while (end < text.size() && is_name_char(text[end])) {
            ++end;
        }
        out = variable_segment(text.substr(index + 1, end - index - 1));
        return end;
    }

    if (std::isdigit(static_cast<unsigned char>(next)) != 0 ||
        std::string("@*#?$!-").find(next) != std::string::npos) {
        if (next != '\0') {
            out = variable_segment(std::string(1, next));
            return index + 2;
        }
    }

    out.text = "$";
    return index + 1;
}

WordExpander::Segment WordExpander::variable_segment(const std::string& name) {
    Segment segment;
    if (name == "@" || name == "*") {
        segment.is_list = true;
        segment.star = name == "*";
        segment.items = env_.positional_parameters();
        return segment;
    }
    segment.text = lookup_checked(name).value_or("");
    return segment;
}

WordExpander::Segment WordExpander::evaluate_parameter(const ast::ParamExpandExpression& expr) {
    if (expr.op.empty()) {
        if (expr.var_name == "@" || expr.var_name == "*") {
            return variable_segment(expr.var_name);
        }
        if (is_list_reference(expr.var_name)) {
            Segment segment;
            segment.is_list = true;
            segment.star = expr.var_name.back() == ']' &&
                           expr.var_name[expr.var_name.size() - 2] == '*';
            segment.items = lookup_list(expr.var_name.substr(0, expr.var_name.size() - 3));
            return segment;
        }
    }

    parameters_.set_nounset(options_.nounset);
    Segment segment;
    segment.text = parameters_.expand(expr);
    return segment;
}

std::string WordExpander::command_substitute(const std::string& command) {
    auto result = run_command_(command);
    last_substitution_status_ = result.exit_code;
    debug_msg("command substitution exited with %d", result.exit_code);
    return result.output;
}

std::string WordExpander::expand_variables_in_string(const std::string& text) {
    std::string out;
    for (const auto& segment : scan_double_quoted(text, false)) {
        if (segment.is_list) {
            out += join(segment.items, segment.star ? ifs_join_separator() : " ");
        } else {
            out += segment.text;
        }
    }
    return out;
}

std::string WordExpander::expand_here_document(const std::string& body) {
    std::string out;
    for (const auto& segment : scan_double_quoted(body, true)) {
        if (segment.is_list) {
            out += join(segment.items, segment.star ? ifs_join_separator() : " ");
        } else {
            out += segment.text;
        }
    }
    return out;
}

long long WordExpander::evaluate_arithmetic(const std::string& expression) {
    try {
        return arithmetic_.evaluate(expression);
    } catch (const ExecutionError& e) {
        if (e.type() != ErrorType::ARITHMETIC_ERROR) {
            throw;
        }
        if (error_sink_) {
            error_sink_(e.info());
        } else {
            print_error(e.info());
        }
        return 0;
    }
}

std::optional<std::string> WordExpander::expand_tilde_prefix(const std::string& user) const {
    if (user.empty()) {
        auto home = env_.get("HOME");
        if (home.has_value()) {
            return home;
        }
        struct passwd* pw = getpwuid(getuid());
        if (pw != nullptr && pw->pw_dir != nullptr) {
            return std::string(pw->pw_dir);
        }
        return std::nullopt;
    }
    if (user == "+") {
        return env_.get("PWD");
    }
    if (user == "-") {
        return env_.get("OLDPWD");
    }
    struct passwd* pw = getpwnam(user.c_str());
    if (pw != nullptr && pw->pw_dir != nullptr) {
        return std::string(pw->pw_dir);
    }
    return std::nullopt;
}

std::string WordExpander::tilde_expand_after_colons(const std::string& text) const {
    std::string result;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == ':' && i + 1 < text.size() && text[i + 1] == '~') {
            result += ':';
            size_t end = text.find_first_of("/:", i + 2);
            std::string user =
                text.substr(i + 2, end == std::string::npos ? std::string::npos : end - i - 2);
            auto home = expand_tilde_prefix(user);
            if (home.has_value()) {
                result += *home;
                i = end == std::string::npos ? text.size() : end;
            } else {
                ++i;
            }
            continue;
        }
        result += text[i];
        ++i;
    }
    return result;
}

std::string WordExpander::ifs_join_separator() const {
    auto ifs = env_.get("IFS");
    if (!ifs.has_value()) {
        return " ";
    }
    return ifs->empty() ? std::string() : std::string(1, ifs->front());
}

long long WordExpander::evaluate_index(const std::string& subscript) {
    return evaluate_arithmetic(subscript);
}

std::optional<std::string> WordExpander::lookup_checked(const std::string& name) {
    auto value = lookup(name);
    if (!value.has_value() && options_.nounset &&
        !ParameterExpansionEvaluator::is_special_parameter(name)) {
        throw ExecutionError(ErrorType::VARIABLE_ERROR, name, name + ": unbound variable");
    }
    return value;
}

std::optional<std::string> WordExpander::lookup(const std::string& name) {
    std::string base;
    std::string subscript;
    if (split_subscript(name, base, subscript)) {
        if (subscript == "@" || subscript == "*") {
            if (env_.kind_of(base) == VariableKind::SCALAR && !env_.get(base).has_value()) {
                return std::nullopt;
            }
            return join(lookup_list(base), subscript == "*" ? ifs_join_separator() : " ");
        }
        switch (env_.kind_of(base)) {
            case VariableKind::ASSOC: {
                const auto* assoc = env_.get_assoc(base);
                std::string key = expand(Parser::parse_word(subscript));
                if (assoc == nullptr) {
                    return std::nullopt;
                }
                auto it = assoc->find(key);
                if (it == assoc->end()) {
                    return std::nullopt;
                }
                return it->second;
            }
            case VariableKind::ARRAY: {
                long long index = evaluate_index(subscript);
                const auto* array = env_.get_array(base);
                if (array == nullptr) {
                    return std::nullopt;
                }
                auto size = static_cast<long long>(array->size());
                if (index < 0) {
                    index += size;
                }
                if (index < 0 || index >= size) {
                    return std::nullopt;
                }
                return (*array)[static_cast<size_t>(index)];
            }
            case VariableKind::SCALAR:
                if (evaluate_index(subscript) != 0) {
                    return std::nullopt;
                }
                return env_.get(base);
        }
        return std::nullopt;
    }

    if (name == "-") {
        return options_.flags_string();
    }
    if (name == "@") {
        return join(env_.positional_parameters(), " ");
    }
    if (name == "*") {
        return join(env_.positional_parameters(), ifs_join_separator());
    }

    switch (env_.kind_of(name)) {
        case VariableKind::ARRAY: {
            const auto* array = env_.get_array(name);
            if (array == nullptr || array->empty()) {
                return std::nullopt;
            }
            return array->front();
        }
        case VariableKind::ASSOC: {
            const auto* assoc = env_.get_assoc(name);
            if (assoc == nullptr) {
                return std::nullopt;
            }
            auto it = assoc->find("0");
            if (it == assoc->end()) {
                return std::nullopt;
            }
            return it->second;
        }
        case VariableKind::SCALAR:
            return env_.get(name);
    }
    return std::nullopt;
}

std::vector<std::string> WordExpander::lookup_list(const std::string& base) {
    if (base == "@" || base == "*") {
        return env_.positional_parameters();
    }
    switch (env_.kind_of(base)) {
        case VariableKind::ARRAY: {
            const auto* array = env_.get_array(base);
            return array == nullptr ? std::vector<std::string>{} : *array;
        }
        case VariableKind::ASSOC: {
            std::vector<std::string> values;
            if (const auto* assoc = env_.get_assoc(base)) {
                for (const auto& entry : *assoc) {
                    values.push_back(entry.second);
                }
            }
            return values;
        }
        case VariableKind::SCALAR: {
            auto value = env_.get(base);
            if (value.has_value()) {
                return {*value};
            }
            return {};
        }
    }
    return {};
}

std::size_t WordExpander::count_elements(const std::string& name) {
    if (name == "@" || name == "*") {
        return env_.positional_parameters().size();
    }
    if (is_list_reference(name)) {
        return lookup_list(name.substr(0, name.size() - 3)).size();
    }
    return lookup(name).value_or("").size();
}

std::vector<std::string> WordExpander::list_keys(const std::string& base) {
    std::vector<std::string> keys;
    switch (env_.kind_of(base)) {
        case VariableKind::ARRAY:
            if (const auto* array = env_.get_array(base)) {
                for (size_t i = 0; i < array->size(); ++i) {
                    keys.push_back(std::to_string(i));
                }
            }
            break;
        case VariableKind::ASSOC:
            if (const auto* assoc = env_.get_assoc(base)) {
                for (const auto& entry : *assoc) {
                    keys.push_back(entry.first);
                }
            }
            break;
        case VariableKind::SCALAR:
            if (env_.get(base).has_value()) {
                keys.emplace_back("0");
            }
            break;
    }
    return keys;
}

void WordExpander::assign_reference(const std::string& reference, const std::string& value) {
    std::string base;
    std::string subscript;
    if (split_subscript(reference, base, subscript)) {
        assign(base, subscript, value);
    } else {
        assign(reference, std::nullopt, value);
    }
}

void WordExpander::assign(const std::string& name, const std::optional<std::string>& index,
                          const std::string& value, bool append) {
    VariableKind kind = env_.kind_of(name);

    if (!index.has_value()) {
        if (append && kind == VariableKind::ARRAY) {
            env_.append_array(name, {value});
            return;
        }
        env_.set(name, append ? lookup(name).value_or("") + value : value);
        return;
    }

    if (kind == VariableKind::ASSOC) {
        std::string key = expand(Parser::parse_word(*index));
        std::string stored = value;
        const auto* assoc = env_.get_assoc(name);
        if (append && assoc != nullptr) {
            auto it = assoc->find(key);
            if (it != assoc->end()) {
                stored = it->second + value;
            }
        }
        env_.set_assoc_element(name, key, stored);
        return;
    }

    long long position = evaluate_index(*index);
    if (kind == VariableKind::SCALAR) {
        auto scalar = env_.get(name);
        env_.set_array(name, scalar.has_value() ? std::vector<std::string>{*scalar}
                                                : std::vector<std::string>{});
    }
    const auto* array = env_.get_array(name);
    auto size = static_cast<long long>(array == nullptr ? 0 : array->size());
    if (position < 0) {
        position += size;
        if (position < 0) {
            throw ExecutionError(ErrorType::VARIABLE_ERROR, name + "[" + *index + "]",
                                 "bad array subscript");
        }
    }
    if (static_cast<unsigned long long>(position) > Environment::kMaxArrayIndex) {
        throw ExecutionError(ErrorType::VARIABLE_ERROR, name + "[" + *index + "]",
                             "bad array subscript");
    }
    std::string stored = value;
    if (append && position < size) {
        stored = (*array)[static_cast<size_t>(position)] + value;
    }
    env_.set_array_element(name, static_cast<size_t>(position), stored);
}
