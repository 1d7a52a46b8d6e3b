/*
  builtin.cpp

  This file is part of esh, an embeddable shell

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#include "builtin.h"

#include <algorithm>

#include "cd_command.h"
#include "declare_command.h"
#include "echo_command.h"
#include "esh_filesystem.h"
#include "eval_command.h"
#include "exit_command.h"
#include "export_command.h"
#include "job_control_commands.h"
#include "loop_control_commands.h"
#include "pwd_command.h"
#include "set_command.h"
#include "shift_command.h"
#include "test_command.h"
#include "unset_command.h"

Built_ins::Built_ins() {
    builtins.reserve(32);

    builtins = {
        {"echo", echo_command},
        {"pwd", pwd_command},
        {"cd", cd_command},
        {"exit", exit_command},
        {"set", set_command},
        {"shift", shift_command},
        {"export", export_command},
        {"unset", unset_command},
        {"declare", declare_command},
        {"typeset", declare_command},
        {"test", test_command},
        {"[", test_command},
        {"eval", eval_command},
        {"break", break_command},
        {"continue", continue_command},
        {"jobs", jobs_command},
        {"wait", wait_command},
        {"fg", fg_command},
        {"bg", bg_command},
        {":", [](const std::vector<std::string>&, BuiltinContext&) { return ExecResult::normal(0); }},
        {"true",
         [](const std::vector<std::string>&, BuiltinContext&) { return ExecResult::normal(0); }},
        {"false",
         [](const std::vector<std::string>&, BuiltinContext&) { return ExecResult::normal(1); }},
    };
}

bool Built_ins::is_builtin_command(const std::string& cmd) const {
    return builtins.find(cmd) != builtins.end();
}

ExecResult Built_ins::builtin_command(const std::vector<std::string>& args,
                                      BuiltinContext& ctx) const {
    if (args.empty()) {
        return ExecResult::normal(0);
    }
    auto it = builtins.find(args[0]);
    if (it == builtins.end()) {
        return ExecResult::failure(ErrorType::COMMAND_NOT_FOUND, args[0], "command not found",
                                   127);
    }
    return it->second(args, ctx);
}

void Built_ins::register_builtin(const std::string& name, BuiltinFunction function) {
    builtins[name] = std::move(function);
}

std::vector<std::string> Built_ins::get_builtin_commands() const {
    std::vector<std::string> names;
    names.reserve(builtins.size());
    for (const auto& entry : builtins) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void builtin_write(const BuiltinContext& ctx, const std::string& text) {
    auto result = esh_filesystem::write_all(ctx.io.out, text);
    if (result.is_error() && !esh_filesystem::error_indicates_broken_pipe(result.error())) {
        print_error({ErrorType::RUNTIME_ERROR, "write", result.error(), {}}, ctx.io.err);
    }
}

ExecResult builtin_error(const BuiltinContext& ctx, ErrorType type, const std::string& name,
                         const std::string& message, int status) {
    print_error({type, name, message, {}}, ctx.io.err);
    return ExecResult::normal(status);
}

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}
