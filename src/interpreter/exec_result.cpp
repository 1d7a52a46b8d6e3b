#include "exec_result.h"

#include <type_traits>

namespace {

template <class>
inline constexpr bool always_false_v = false;

}  // namespace

int ExecResult::exit_status() const {
    return std::visit(
        [](const auto& value) -> int {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, NormalCompletion>) {
                return value.status;
            } else if constexpr (std::is_same_v<T, BreakSignal> ||
                                 std::is_same_v<T, ContinueSignal>) {
                return 0;
            } else if constexpr (std::is_same_v<T, ExitSignal>) {
                return value.code;
            } else if constexpr (std::is_same_v<T, Failure>) {
                return value.error.exit_code();
            } else {
                static_assert(always_false_v<T>, "unhandled outcome");
            }
        },
        outcome_);
}

int ExecResult::levels() const {
    if (const auto* brk = std::get_if<BreakSignal>(&outcome_)) {
        return brk->levels;
    }
    if (const auto* cont = std::get_if<ContinueSignal>(&outcome_)) {
        return cont->levels;
    }
    return 0;
}
