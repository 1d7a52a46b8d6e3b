/*
  job_control_commands.cpp

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

#include "job_control_commands.h"

#include <signal.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "debug.h"
#include "job_control.h"

namespace job_control_helpers {

namespace {

bool is_number(const std::string& text) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<int> parse_job_specifier(const std::string& text, const JobManager& jobs) {
    if (text.empty() || text[0] != '%') {
        return std::nullopt;
    }
    std::string spec = text.substr(1);
    int job_id = -1;
    if (spec.empty() || spec == "%" || spec == "+") {
        job_id = jobs.get_current_job();
    } else if (spec == "-") {
        job_id = jobs.get_previous_job();
    } else if (is_number(spec)) {
        job_id = std::atoi(spec.c_str());
    } else {
        return std::nullopt;
    }
    if (job_id < 0 || !jobs.get_job(job_id)) {
        return std::nullopt;
    }
    return job_id;
}

std::shared_ptr<Job> resolve_job(const std::string& target, const JobManager& jobs) {
    if (!target.empty() && target[0] == '%') {
        auto job_id = parse_job_specifier(target, jobs);
        return job_id.has_value() ? jobs.get_job(*job_id) : nullptr;
    }
    if (!is_number(target)) {
        return nullptr;
    }
    int value = std::atoi(target.c_str());
    if (auto job = jobs.find_job_by_pid(static_cast<pid_t>(value))) {
        return job;
    }
    return jobs.get_job(value);
}

}  // namespace job_control_helpers

ExecResult jobs_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    bool long_format = false;
    bool pid_only = false;
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "-l") {
            long_format = true;
        } else if (args[i] == "-p") {
            pid_only = true;
        } else {
            return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "jobs",
                                 args[i] + ": invalid option", 2);
        }
    }

    auto& job_manager = ctx.jobs;
    int current = job_manager.get_current_job();
    int previous = job_manager.get_previous_job();

    std::string output;
    for (const auto& job : job_manager.get_all_jobs()) {
        if (pid_only) {
            output += std::to_string(job->pid()) + "\n";
            continue;
        }
        char marker = ' ';
        if (job->id() == current) {
            marker = '+';
        } else if (job->id() == previous) {
            marker = '-';
        }

        std::string line = "[" + std::to_string(job->id()) + "]" + marker + "  ";
        if (long_format) {
            line += std::to_string(job->pid()) + " ";
        }
        std::string state = job_status_text(job->status());
        if (job->is_done() && job->exit_status() != 0) {
            state = "Exit " + std::to_string(job->exit_status());
        }
        state.resize(std::max<size_t>(state.size(), 24), ' ');
        output += line + state + job->command() + "\n";
    }
    builtin_write(ctx, output);

    for (const auto& job : job_manager.cleanup_finished_jobs()) {
        debug_msg("jobs: dropped finished job %d", job->id());
    }
    return ExecResult::normal(0);
}

ExecResult wait_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    auto& job_manager = ctx.jobs;
    if (args.size() == 1) {
        int status = job_manager.wait_for_all();
        if (status >= 128 && !job_manager.get_active_jobs().empty()) {
            return ExecResult::normal(status);
        }
        job_manager.cleanup_finished_jobs();
        return ExecResult::normal(0);
    }

    int last_status = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& target = args[i];
        auto job = job_control_helpers::resolve_job(target, job_manager);
        if (!job) {
            print_error({ErrorType::INVALID_ARGUMENT, "wait", target + ": no such job", {}},
                        ctx.io.err);
            last_status = 127;
            continue;
        }
        auto status = job_manager.wait_for_job(job->id());
        if (!status.has_value()) {
            last_status = 127;
            continue;
        }
        last_status = *status;
        if (job->is_done()) {
            job_manager.remove_job(job->id());
        } else {
            // Interrupted by a signal before the job finished.
            return ExecResult::normal(last_status);
        }
    }
    return ExecResult::normal(last_status);
}

ExecResult fg_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    auto& job_manager = ctx.jobs;
    if (args.size() > 2) {
        return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "fg", "too many arguments");
    }

    std::shared_ptr<Job> job;
    if (args.size() == 2) {
        job = job_control_helpers::resolve_job(args[1], job_manager);
        if (!job) {
            return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "fg",
                                 args[1] + ": no such job");
        }
    } else {
        job = job_manager.get_job(job_manager.get_current_job());
        if (!job) {
            return builtin_error(ctx, ErrorType::RUNTIME_ERROR, "fg", "current: no such job");
        }
    }

    job_manager.set_current_job(job->id());
    builtin_write(ctx, job->command() + "\n");
    auto status = job_manager.wait_for_job(job->id());
    if (!status.has_value()) {
        return builtin_error(ctx, ErrorType::RUNTIME_ERROR, "fg", "job has terminated");
    }
    if (job->is_done()) {
        job_manager.remove_job(job->id());
    }
    return ExecResult::normal(*status);
}

ExecResult bg_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    auto& job_manager = ctx.jobs;
    if (args.size() > 2) {
        return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "bg", "too many arguments");
    }

    std::shared_ptr<Job> job;
    if (args.size() == 2) {
        job = job_control_helpers::resolve_job(args[1], job_manager);
        if (!job) {
            return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, "bg",
                                 args[1] + ": no such job");
        }
    } else {
        job = job_manager.get_job(job_manager.get_current_job());
        if (!job) {
            auto all = job_manager.get_all_jobs();
            if (all.empty()) {
                return builtin_error(ctx, ErrorType::RUNTIME_ERROR, "bg", "current: no such job");
            }
            job = all.back();
        }
    }

    if (job->is_done()) {
        return builtin_error(ctx, ErrorType::RUNTIME_ERROR, "bg",
                             "job " + std::to_string(job->id()) + " has terminated");
    }

    job_manager.set_current_job(job->id());
    if (killpg(job->pgid(), SIGCONT) < 0) {
        debug_msg("bg: killpg(%d) failed: %s", static_cast<int>(job->pgid()),
                  std::strerror(errno));
        for (pid_t pid : job->pids()) {
            if (kill(pid, SIGCONT) < 0 && errno != ESRCH) {
                return builtin_error(ctx, ErrorType::RUNTIME_ERROR, "bg",
                                     std::string("kill: ") + std::strerror(errno));
            }
        }
    }

    builtin_write(ctx, "[" + std::to_string(job->id()) + "]+ " + job->command() + " &\n");
    return ExecResult::normal(0);
}
