#include "declare_command.h"

#include <algorithm>
#include <cstdlib>

namespace {

std::string describe_variable(const Environment& env, const std::string& name) {
    switch (env.kind_of(name)) {
        case VariableKind::ARRAY: {
            std::string text = "declare -a " + name + "=(";
            const auto* values = env.get_array(name);
            if (values != nullptr) {
                for (size_t i = 0; i < values->size(); ++i) {
                    if (i > 0) {
                        text += ' ';
                    }
                    text += "[" + std::to_string(i) + "]=" + shell_quote((*values)[i]);
                }
            }
            return text + ")";
        }
        case VariableKind::ASSOC: {
            std::string text = "declare -A " + name + "=(";
            const auto* values = env.get_assoc(name);
            if (values != nullptr) {
                bool first = true;
                for (const auto& entry : *values) {
                    if (!first) {
                        text += ' ';
                    }
                    first = false;
                    text += "[" + entry.first + "]=" + shell_quote(entry.second);
                }
            }
            return text + ")";
        }
        case VariableKind::SCALAR:
            break;
    }
    const bool exported = std::getenv(name.c_str()) != nullptr;
    return std::string("declare ") + (exported ? "-x " : "-- ") + name + "=" +
           shell_quote(env.get_or_empty(name));
}

void print_all(BuiltinContext& ctx) {
    std::vector<std::string> names;
    for (const auto& entry : ctx.env.get_env_map()) {
        if (Environment::is_valid_identifier(entry.first)) {
            names.push_back(entry.first);
        }
    }
    for (const auto& name : ctx.env.array_names()) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());

    std::string output;
    for (const auto& name : names) {
        output += describe_variable(ctx.env, name) + "\n";
    }
    builtin_write(ctx, output);
}

}  // namespace

ExecResult declare_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    const std::string& command = args[0];
    bool indexed = false;
    bool associative = false;
    bool exported = false;
    bool print = false;

    size_t i = 1;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') {
            break;
        }
        for (size_t j = 1; j < arg.size(); ++j) {
            switch (arg[j]) {
                case 'a':
                    indexed = true;
                    break;
                case 'A':
                    associative = true;
                    break;
                case 'x':
                    exported = true;
                    break;
                case 'p':
                    print = true;
                    break;
                default:
                    return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, command,
                                         std::string("-") + arg[j] + ": invalid option", 2);
            }
        }
    }

    if (i >= args.size()) {
        print_all(ctx);
        return ExecResult::normal(0);
    }

    int status = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        size_t eq = arg.find('=');
        std::string name = arg.substr(0, eq);

        if (!Environment::is_valid_identifier(name)) {
            print_error({ErrorType::INVALID_ARGUMENT, command,
                         "`" + arg + "': not a valid identifier", {}},
                        ctx.io.err);
            status = 1;
            continue;
        }

        if (print) {
            if (!ctx.env.is_set(name)) {
                print_error({ErrorType::VARIABLE_ERROR, command, name + ": not found", {}},
                            ctx.io.err);
                status = 1;
                continue;
            }
            builtin_write(ctx, describe_variable(ctx.env, name) + "\n");
            continue;
        }

        if (associative) {
            ctx.env.declare_assoc(name);
            if (eq != std::string::npos) {
                ctx.env.set_assoc_element(name, "0", arg.substr(eq + 1));
            }
        } else if (indexed) {
            ctx.env.declare_array(name);
            if (eq != std::string::npos) {
                ctx.env.set_array_element(name, 0, arg.substr(eq + 1));
            }
        } else if (eq != std::string::npos) {
            ctx.env.set(name, arg.substr(eq + 1));
        } else if (!ctx.env.is_set(name)) {
            ctx.env.set(name, "");
        }

        if (exported && ctx.env.kind_of(name) == VariableKind::SCALAR) {
            setenv(name.c_str(), ctx.env.get_or_empty(name).c_str(), 1);
        }
    }
    return ExecResult::normal(status);
}
