#include "exit_command.h"

#include <cerrno>
#include <cstdlib>

ExecResult exit_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    if (args.size() > 2) {
        return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "exit", "too many arguments");
    }

    int exit_code = ctx.env.last_status();
    if (args.size() > 1) {
        const std::string& value = args[1];
        errno = 0;
        char* end = nullptr;
        long long parsed = std::strtoll(value.c_str(), &end, 10);
        if (value.empty() || errno != 0 || end == nullptr || *end != '\0') {
            print_error({ErrorType::INVALID_ARGUMENT, "exit", value + ": numeric argument required",
                         {}},
                        ctx.io.err);
            return ExecResult::exit(2);
        }
        exit_code = static_cast<int>(parsed & 0xff);
    }
    return ExecResult::exit(exit_code);
}
