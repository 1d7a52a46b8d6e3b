#include "loop_control_commands.h"

#include <cerrno>
#include <cstdlib>

namespace {

// Parsed loop level, or 0 after reporting an invalid one.
int parse_level(const std::vector<std::string>& args, BuiltinContext& ctx) {
    const std::string& name = args[0];
    if (args.size() > 2) {
        builtin_error(ctx, ErrorType::INVALID_ARGUMENT, name, "too many arguments");
        return 0;
    }
    if (args.size() == 1) {
        return 1;
    }

    const std::string& value = args[1];
    errno = 0;
    char* end = nullptr;
    long level = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || errno != 0 || end == nullptr || *end != '\0') {
        builtin_error(ctx, ErrorType::INVALID_ARGUMENT, name, value + ": numeric argument required");
        return 0;
    }
    if (level < 1) {
        builtin_error(ctx, ErrorType::INVALID_ARGUMENT, name, value + ": loop count out of range");
        return 0;
    }
    return level > 1000000 ? 1000000 : static_cast<int>(level);
}

}  // namespace

ExecResult break_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    int level = parse_level(args, ctx);
    if (level == 0) {
        return ExecResult::normal(1);
    }
    return ExecResult::break_loop(level);
}

ExecResult continue_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    int level = parse_level(args, ctx);
    if (level == 0) {
        return ExecResult::normal(1);
    }
    return ExecResult::continue_loop(level);
}
