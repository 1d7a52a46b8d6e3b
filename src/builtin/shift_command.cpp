#include "shift_command.h"

#include <cctype>

ExecResult shift_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    if (args.size() > 2) {
        return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "shift", "too many arguments");
    }

    std::size_t count = 1;
    if (args.size() == 2) {
        const std::string& value = args[1];
        if (value.empty() || value.size() > 9) {
            return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "shift",
                                 value + ": numeric argument required");
        }
        for (char c : value) {
            if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
                return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "shift",
                                     value + ": numeric argument required");
            }
        }
        count = static_cast<std::size_t>(std::stoul(value));
    }

    if (!ctx.env.shift(count)) {
        return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "shift",
                             "shift count out of range");
    }
    return ExecResult::normal(0);
}
