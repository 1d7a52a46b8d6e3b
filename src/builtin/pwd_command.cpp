#include "pwd_command.h"

#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>

ExecResult pwd_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    (void)args;
    char cwd[PATH_MAX];
    if (getcwd(cwd, sizeof(cwd)) == nullptr) {
        return builtin_error(ctx, ErrorType::RUNTIME_ERROR, "pwd", std::strerror(errno));
    }
    builtin_write(ctx, std::string(cwd) + "\n");
    return ExecResult::normal(0);
}
