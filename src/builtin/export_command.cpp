#include "export_command.h"

#include <algorithm>
#include <cstdlib>

extern char** environ;

namespace {

void list_exports(BuiltinContext& ctx) {
    std::vector<std::string> lines;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string text(*entry);
        size_t eq = text.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        lines.push_back("export " + text.substr(0, eq) + "=" + shell_quote(text.substr(eq + 1)));
    }
    std::sort(lines.begin(), lines.end());

    std::string output;
    for (const auto& line : lines) {
        output += line + "\n";
    }
    builtin_write(ctx, output);
}

}  // namespace

ExecResult export_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    size_t start = 1;
    if (start < args.size() && args[start] == "-p") {
        ++start;
    }
    if (start >= args.size()) {
        list_exports(ctx);
        return ExecResult::normal(0);
    }

    int status = 0;
    for (size_t i = start; i < args.size(); ++i) {
        const std::string& arg = args[i];
        size_t eq = arg.find('=');
        std::string name = arg.substr(0, eq);

        if (!Environment::is_valid_identifier(name)) {
            print_error({ErrorType::INVALID_ARGUMENT, "export",
                         "`" + arg + "': not a valid identifier", {}},
                        ctx.io.err);
            status = 1;
            continue;
        }

        if (eq != std::string::npos) {
            ctx.env.set(name, arg.substr(eq + 1));
        } else if (auto value = ctx.env.get(name)) {
            setenv(name.c_str(), value->c_str(), 1);
        }
    }
    return ExecResult::normal(status);
}
