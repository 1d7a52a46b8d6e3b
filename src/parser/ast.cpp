#include "ast.h"

#include <type_traits>

namespace ast {

namespace {

template <class>
inline constexpr bool always_false_v = false;

std::string quote_single(const std::string& value) {
    return "'" + value + "'";
}

}  // namespace

std::string Word::to_string() const {
    std::string out;
    for (const auto& part : parts) {
        std::visit(
            [&out](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, Identifier>) {
                    out += node.value;
                } else if constexpr (std::is_same_v<T, StringLiteral>) {
                    out += node.is_quote ? "\"" + node.value + "\"" : quote_single(node.value);
                } else if constexpr (std::is_same_v<T, Variable>) {
                    out += "$" + node.name;
                } else if constexpr (std::is_same_v<T, ParamExpandExpression>) {
                    if (node.op == "length") {
                        out += "${#" + node.var_name + "}";
                    } else if (node.op == "indirect") {
                        out += "${!" + node.var_name + "}";
                    } else {
                        out += "${" + node.var_name + node.op + node.word + "}";
                    }
                } else if constexpr (std::is_same_v<T, CommandSubstitution>) {
                    out += "$(" + node.command + ")";
                } else if constexpr (std::is_same_v<T, ArithmeticExpansion>) {
                    out += "$((" + node.expression + "))";
                } else if constexpr (std::is_same_v<T, ProcessSubstitution>) {
                    out += (node.is_input ? "<(" : ">(") + node.command + ")";
                } else {
                    static_assert(always_false_v<T>, "unhandled word part");
                }
            },
            part);
    }
    return out;
}

bool Word::is_literal(const std::string& text) const {
    if (parts.size() != 1) {
        return false;
    }
    const auto* ident = std::get_if<Identifier>(&parts.front());
    return ident != nullptr && ident->value == text;
}

}  // namespace ast
