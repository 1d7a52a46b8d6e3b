#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "environment.h"
#include "error_out.h"
#include "exec_result.h"
#include "io_context.h"
#include "shell_options.h"

class JobManager;
class ShellScriptInterpreter;

// What a builtin may touch: the session's variables, options and jobs, the descriptors of the
// current command, and the interpreter for builtins that run or define code.
struct BuiltinContext {
    Environment& env;
    ShellOptions& options;
    JobManager& jobs;
    IoContext io;
    ShellScriptInterpreter& interpreter;
};

using BuiltinFunction =
    std::function<ExecResult(const std::vector<std::string>& args, BuiltinContext& ctx)>;

class Built_ins {
   public:
    Built_ins();
    ~Built_ins() = default;

    bool is_builtin_command(const std::string& cmd) const;
    // args[0] names the builtin.
    ExecResult builtin_command(const std::vector<std::string>& args, BuiltinContext& ctx) const;

    void register_builtin(const std::string& name, BuiltinFunction function);
    // Sorted.
    std::vector<std::string> get_builtin_commands() const;

   private:
    std::unordered_map<std::string, BuiltinFunction> builtins;
};

// Output helpers for builtin implementations.
void builtin_write(const BuiltinContext& ctx, const std::string& text);
// Single-quoted form that reads back as value.
std::string shell_quote(const std::string& value);
// Prints "esh: name: message" on the context's error stream and returns status.
ExecResult builtin_error(const BuiltinContext& ctx, ErrorType type, const std::string& name,
                         const std::string& message, int status = 1);
