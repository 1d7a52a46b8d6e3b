#include "eval_command.h"

#include "exec.h"
#include "shell_script_interpreter.h"

ExecResult eval_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    if (args.size() < 2) {
        return ExecResult::normal(0);
    }
    std::vector<std::string> words(args.begin() + 1, args.end());
    return ctx.interpreter.evaluate(join_arguments(words), ctx.io);
}
