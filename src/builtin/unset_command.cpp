#include "unset_command.h"

#include "shell_script_interpreter.h"

ExecResult unset_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    bool functions = false;
    size_t i = 1;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-f") {
            functions = true;
        } else if (arg == "-v") {
            functions = false;
        } else if (arg == "--") {
            ++i;
            break;
        } else {
            break;
        }
    }

    int status = 0;
    for (; i < args.size(); ++i) {
        const std::string& name = args[i];
        if (functions) {
            ctx.interpreter.remove_function(name);
            continue;
        }
        if (!Environment::is_valid_identifier(name)) {
            print_error({ErrorType::INVALID_ARGUMENT, "unset",
                         "`" + name + "': not a valid identifier", {}},
                        ctx.io.err);
            status = 1;
            continue;
        }
        ctx.env.unset(name);
    }
    return ExecResult::normal(status);
}
