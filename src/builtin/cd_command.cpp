#include "cd_command.h"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>

#include "debug.h"
#include "error_out.h"

std::string resolve_directory(const std::string& dir, const std::string& current_directory) {
    std::filesystem::path dir_path(dir);
    if (!dir_path.is_absolute()) {
        dir_path = std::filesystem::path(current_directory) / dir_path;
    }
    std::error_code ec;
    std::filesystem::path canonical_path = std::filesystem::canonical(dir_path, ec);
    if (ec) {
        return dir_path.lexically_normal().string();
    }
    return canonical_path.string();
}

ExecResult cd_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    if (args.size() > 2) {
        return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "cd", "too many arguments");
    }

    std::string target_dir = args.size() > 1 ? args[1] : "";
    bool print_new_directory = false;

    if (target_dir.empty()) {
        auto home = ctx.env.get("HOME");
        if (!home.has_value() || home->empty()) {
            return builtin_error(ctx, ErrorType::RUNTIME_ERROR, "cd", "HOME not set");
        }
        target_dir = *home;
    } else if (target_dir == "-") {
        auto previous = ctx.env.get("OLDPWD");
        if (!previous.has_value() || previous->empty()) {
            return builtin_error(ctx, ErrorType::RUNTIME_ERROR, "cd", "OLDPWD not set");
        }
        target_dir = *previous;
        print_new_directory = true;
    }

    std::string old_directory = ctx.env.get_or_empty("PWD");
    if (old_directory.empty()) {
        std::error_code ec;
        old_directory = std::filesystem::current_path(ec).string();
    }

    std::error_code ec;
    std::filesystem::path dir_path(resolve_directory(target_dir, old_directory));
    if (!std::filesystem::exists(dir_path, ec)) {
        return builtin_error(ctx, ErrorType::FILE_NOT_FOUND, "cd",
                             target_dir + ": no such file or directory");
    }
    if (!std::filesystem::is_directory(dir_path, ec)) {
        return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "cd",
                             target_dir + ": not a directory");
    }

    std::string new_directory = dir_path.string();
    if (chdir(new_directory.c_str()) != 0) {
        return builtin_error(ctx, ErrorType::PERMISSION_DENIED, "cd",
                             target_dir + ": " + std::strerror(errno));
    }

    ctx.env.set("OLDPWD", old_directory);
    ctx.env.set("PWD", new_directory);
    debug_msg("cd: %s -> %s", old_directory.c_str(), new_directory.c_str());

    if (print_new_directory) {
        builtin_write(ctx, new_directory + "\n");
    }
    return ExecResult::normal(0);
}
