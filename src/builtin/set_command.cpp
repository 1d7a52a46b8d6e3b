#include "set_command.h"

#include <algorithm>

namespace {

bool is_special_parameter(const std::string& name) {
    return name == "#" || name == "@" || name == "*" || name == "?" ||
           Environment::is_positional_name(name);
}

void print_variables(BuiltinContext& ctx) {
    std::vector<std::pair<std::string, std::string>> entries;
    for (const auto& entry : ctx.env.get_env_map()) {
        if (!is_special_parameter(entry.first)) {
            entries.emplace_back(entry.first, entry.second);
        }
    }
    std::sort(entries.begin(), entries.end());

    std::string output;
    for (const auto& entry : entries) {
        output += entry.first + "=" + shell_quote(entry.second) + "\n";
    }
    builtin_write(ctx, output);
}

void print_options(BuiltinContext& ctx, bool as_commands) {
    std::string output;
    for (const auto& option : ctx.options.list()) {
        if (as_commands) {
            output += std::string("set ") + (option.second ? "-o " : "+o ") + option.first + "\n";
        } else {
            std::string name = option.first;
            name.resize(std::max<size_t>(name.size(), 15), ' ');
            output += name + (option.second ? "on" : "off") + "\n";
        }
    }
    builtin_write(ctx, output);
}

}  // namespace

ExecResult set_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    if (args.size() == 1) {
        print_variables(ctx);
        return ExecResult::normal(0);
    }

    size_t i = 1;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            ++i;
            ctx.env.set_positional_parameters(
                std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(i), args.end()));
            return ExecResult::normal(0);
        }
        if (arg.size() < 2 || (arg[0] != '-' && arg[0] != '+')) {
            break;
        }

        bool enable = arg[0] == '-';
        if (arg == "-o" || arg == "+o") {
            if (i + 1 >= args.size()) {
                print_options(ctx, !enable);
                return ExecResult::normal(0);
            }
            const std::string& name = args[++i];
            if (!ctx.options.set_long(name, enable)) {
                return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "set",
                                     name + ": invalid option name", 2);
            }
            continue;
        }

        for (size_t j = 1; j < arg.size(); ++j) {
            if (!ctx.options.set_short(arg[j], enable)) {
                return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "set",
                                     std::string(1, arg[0]) + arg[j] + ": invalid option", 2);
            }
        }
    }

    // Remaining words replace the positional parameters.
    if (i < args.size()) {
        ctx.env.set_positional_parameters(
            std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(i), args.end()));
    }
    return ExecResult::normal(0);
}
