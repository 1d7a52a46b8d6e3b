#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ast.h"

class ParameterExpansionEvaluator {
   public:
    // Returns nullopt when the (possibly subscripted) name is unset.
    using VariableReader = std::function<std::optional<std::string>(const std::string&)>;
    using VariableWriter = std::function<void(const std::string&, const std::string&)>;
    // Number of elements behind name[@], or the value length for a scalar.
    using ElementCounter = std::function<std::size_t(const std::string&)>;
    // Keys of an array, for ${!name[@]}.
    using KeyLister = std::function<std::vector<std::string>(const std::string&)>;
    // Expands operand text as a word (tilde, parameters, substitutions, quote removal).
    using OperandExpander = std::function<std::string(const std::string&)>;
    // Expands operand text into a glob pattern; quoted characters come back escaped.
    using PatternExpander = std::function<std::string(const std::string&)>;
    using ArithmeticFunction = std::function<long long(const std::string&)>;

    struct Callbacks {
        VariableReader read_variable;
        VariableWriter write_variable;
        ElementCounter count_elements;
        KeyLister list_keys;
        OperandExpander expand_word;
        PatternExpander expand_pattern;
        ArithmeticFunction evaluate_arithmetic;
    };

    explicit ParameterExpansionEvaluator(Callbacks callbacks);

    std::string expand(const ast::ParamExpandExpression& expr) const;

    void set_nounset(bool enabled) {
        nounset = enabled;
    }

    // Splits the body of ${...} into name, operator and operand. Throws ExecutionError
    // (VARIABLE_ERROR, "bad substitution") when the body does not start with a name.
    static ast::ParamExpandExpression split(const std::string& body);

    static bool is_special_parameter(const std::string& name);

    static std::string strip_prefix(const std::string& value, const std::string& pattern,
                                    bool longest);
    static std::string strip_suffix(const std::string& value, const std::string& pattern,
                                    bool longest);

   private:
    Callbacks cb;
    bool nounset = false;

    std::optional<std::string> read_checked(const std::string& name) const;
    std::string pattern_substitute(const std::string& value, const std::string& operand,
                                   bool global) const;
    std::string case_convert(const std::string& value, const std::string& operand,
                             bool uppercase, bool all_chars) const;
    std::string substring(const std::string& value, const std::string& operand) const;
};
