#include "exec.h"

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>

#include "debug.h"
#include "error_out.h"
#include "job_control.h"
#include "signal_handler.h"

namespace {

constexpr auto kInterruptGracePeriod = std::chrono::milliseconds(200);
constexpr int kFallbackPollMs = 10;

bool is_all_digits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

bool descriptor_is_open(int fd) {
    return fd >= 0 && fcntl(fd, F_GETFD) != -1;
}

std::vector<int> here_document_writer_signals() {
    std::vector<int> signals = SignalHandler::worker_blocked_signals();
    signals.push_back(SIGPIPE);
    return signals;
}

// Writes as much of data as the pipe accepts without blocking and returns the byte count.
size_t write_without_blocking(int fd, const std::string& data) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        return 0;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t result = ::write(fd, data.data() + written, data.size() - written);
        if (result > 0) {
            written += static_cast<size_t>(result);
            continue;
        }
        if (result == -1 && errno == EINTR) {
            continue;
        }
        break;
    }

    (void)fcntl(fd, F_SETFL, flags);
    return written;
}

[[noreturn]] void report_exec_failure(const std::vector<std::string>& args, int saved_errno) {
    const std::string command_name = args.empty() ? std::string{} : args[0];

    if (saved_errno == ENOENT) {
        print_error(ErrorInfo{ErrorType::COMMAND_NOT_FOUND, command_name, ""});
        _exit(127);
    }

    const bool permission_error = (saved_errno == EACCES || saved_errno == EISDIR);
    const bool exec_format_error = (saved_errno == ENOEXEC);
    const int exit_code = (permission_error || exec_format_error) ? 126 : 127;

    if (permission_error) {
        print_error(ErrorInfo{ErrorType::PERMISSION_DENIED, command_name, ""});
    } else if (exec_format_error) {
        print_error(ErrorInfo{ErrorType::COMMAND_FAILED, command_name, "exec format error"});
    } else {
        print_error(ErrorInfo{ErrorType::COMMAND_FAILED, command_name,
                              std::string("execution failed: ") + std::strerror(saved_errno)});
    }
    _exit(exit_code);
}

[[noreturn]] void exec_external_child(const std::vector<std::string>& args) {
    std::vector<char*> c_args;
    c_args.reserve(args.size() + 1);
    for (const auto& arg : args) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    execvp(args[0].c_str(), c_args.data());
    int saved_errno = errno;
    report_exec_failure(args, saved_errno);
}

struct FdMove {
    int target;
    int source;
};

[[noreturn]] void handle_fd_setup_error_and_exit(int target, int source, int saved_errno) {
    std::cerr << "esh: redirection error: cannot set up fd " << target << " from " << source
              << ": " << std::strerror(saved_errno) << '\n';
    _exit(EXIT_FAILURE);
}

// Moves every source descriptor onto its target in the child. Sources are first copied above
// every target so that one move never clobbers the source of another.
void setup_child_fds(const IoContext& io, const std::vector<int>& close_in_child) {
    std::vector<FdMove> moves = {
        {STDIN_FILENO, io.in}, {STDOUT_FILENO, io.out}, {STDERR_FILENO, io.err}};
    for (const auto& entry : io.extra) {
        moves.push_back({entry.first, entry.second});
    }

    int floor = 10;
    for (const auto& move : moves) {
        floor = std::max(floor, move.target + 1);
    }

    std::vector<int> temps;
    temps.reserve(moves.size());
    for (const auto& move : moves) {
        if (move.source < 0) {
            temps.push_back(-1);
            continue;
        }
        int temp = fcntl(move.source, F_DUPFD, floor);
        if (temp == -1) {
            handle_fd_setup_error_and_exit(move.target, move.source, errno);
        }
        temps.push_back(temp);
    }

    for (size_t i = 0; i < moves.size(); ++i) {
        if (temps[i] == -1) {
            ::close(moves[i].target);
            continue;
        }
        if (::dup2(temps[i], moves[i].target) == -1) {
            handle_fd_setup_error_and_exit(moves[i].target, moves[i].source, errno);
        }
    }

    auto is_target = [&moves](int fd) {
        return std::any_of(moves.begin(), moves.end(),
                           [fd](const FdMove& move) { return move.target == fd; });
    };
    for (int temp : temps) {
        if (temp != -1) {
            ::close(temp);
        }
    }
    for (int fd : close_in_child) {
        if (!is_target(fd)) {
            ::close(fd);
        }
    }
}

IoContext child_io_context(const IoContext& io) {
    IoContext child;
    for (const auto& entry : io.extra) {
        child.extra.emplace_back(entry.first, entry.second < 0 ? -1 : entry.first);
    }
    if (io.in < 0) {
        child.in = -1;
    }
    if (io.out < 0) {
        child.out = -1;
    }
    if (io.err < 0) {
        child.err = -1;
    }
    return child;
}

void kill_pids(const std::vector<pid_t>& pids, const std::vector<bool>& reaped, int signum) {
    for (size_t i = 0; i < pids.size(); ++i) {
        if (!reaped[i]) {
            (void)kill(pids[i], signum);
        }
    }
}

}  // namespace

std::string join_arguments(const std::vector<std::string>& args) {
    std::string result;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            result += " ";
        }
        result += args[i];
    }
    return result;
}

RedirectScope::RedirectScope(const IoContext& base, const std::vector<ResolvedRedirect>& redirects,
                             bool noclobber)
    : io_(base) {
    try {
        for (const auto& redirect : redirects) {
            apply(redirect, noclobber);
        }
    } catch (...) {
        release();
        throw;
    }
}

RedirectScope::~RedirectScope() {
    release();
}

void RedirectScope::release() {
    // Read ends go first so a writer blocked on a full pipe sees EPIPE.
    owned_.clear();
    for (auto& writer : writers_) {
        if (writer.joinable()) {
            writer.join();
        }
    }
    writers_.clear();
}

int RedirectScope::open_target(const ResolvedRedirect& redirect, int flags) {
    if (redirect.target.empty()) {
        throw ExecutionError(ErrorType::REDIRECT_ERROR, redirect.target, "ambiguous redirect");
    }
    auto result = esh_filesystem::safe_open(redirect.target, flags | O_CLOEXEC, 0644);
    if (result.is_error()) {
        throw ExecutionError(ErrorType::REDIRECT_ERROR, redirect.target, result.error());
    }
    owned_.emplace_back(result.value());
    return result.value();
}

int RedirectScope::open_here_document(const std::string& body) {
    int pipe_fds[2] = {-1, -1};
    auto pipe_result = esh_filesystem::create_pipe_cloexec(pipe_fds);
    if (pipe_result.is_error()) {
        throw ExecutionError(ErrorType::PIPE_ERROR, "here-document", pipe_result.error());
    }
    esh_filesystem::FdGuard read_end(pipe_fds[0]);
    esh_filesystem::FdGuard write_end(pipe_fds[1]);

    // Whatever fits in the pipe is written now, so the write end is normally closed before
    // any child is forked; a helper thread delivers the rest.
    size_t written = write_without_blocking(write_end.get(), body);
    if (written < body.size()) {
        SignalMask blocked(here_document_writer_signals());
        writers_.emplace_back([fd = write_end.release(), rest = body.substr(written)]() {
            esh_filesystem::FdGuard guard(fd);
            auto result = esh_filesystem::write_all(fd, rest);
            if (result.is_error() && !esh_filesystem::error_indicates_broken_pipe(result.error())) {
                debug_msg("here-document writer failed: %s", result.error().c_str());
            }
        });
    }

    int fd = read_end.get();
    owned_.push_back(std::move(read_end));
    return fd;
}

void RedirectScope::apply(const ResolvedRedirect& redirect, bool noclobber) {
    using ast::RedirectType;

    switch (redirect.type) {
        case RedirectType::INPUT:
            io_.assign(redirect.fd, open_target(redirect, O_RDONLY));
            break;
        case RedirectType::OUTPUT:
            if (noclobber && esh_filesystem::should_noclobber_prevent_overwrite(redirect.target)) {
                throw ExecutionError(ErrorType::REDIRECT_ERROR, redirect.target,
                                     "cannot overwrite existing file (noclobber is set)");
            }
            io_.assign(redirect.fd, open_target(redirect, O_WRONLY | O_CREAT | O_TRUNC));
            break;
        case RedirectType::CLOBBER:
            io_.assign(redirect.fd, open_target(redirect, O_WRONLY | O_CREAT | O_TRUNC));
            break;
        case RedirectType::APPEND:
            io_.assign(redirect.fd, open_target(redirect, O_WRONLY | O_CREAT | O_APPEND));
            break;
        case RedirectType::READ_WRITE:
            io_.assign(redirect.fd, open_target(redirect, O_RDWR | O_CREAT));
            break;
        case RedirectType::HEREDOC:
        case RedirectType::HEREDOC_STRIP:
            io_.assign(redirect.fd, open_here_document(redirect.body));
            break;
        case RedirectType::HERE_STRING:
            io_.assign(redirect.fd, open_here_document(redirect.body + "\n"));
            break;
        case RedirectType::DUP_IN:
        case RedirectType::DUP_OUT: {
            if (redirect.target == "-") {
                io_.assign(redirect.fd, -1);
                break;
            }
            if (is_all_digits(redirect.target)) {
                int source = io_.fd_for(std::stoi(redirect.target));
                if (!descriptor_is_open(source)) {
                    throw ExecutionError(ErrorType::REDIRECT_ERROR, redirect.target,
                                         "bad file descriptor");
                }
                io_.assign(redirect.fd, source);
                break;
            }
            if (redirect.type == RedirectType::DUP_IN) {
                throw ExecutionError(ErrorType::REDIRECT_ERROR, redirect.target,
                                     "ambiguous redirect");
            }
            // >&file sends both output streams to file.
            if (noclobber && esh_filesystem::should_noclobber_prevent_overwrite(redirect.target)) {
                throw ExecutionError(ErrorType::REDIRECT_ERROR, redirect.target,
                                     "cannot overwrite existing file (noclobber is set)");
            }
            int fd = open_target(redirect, O_WRONLY | O_CREAT | O_TRUNC);
            io_.assign(redirect.fd, fd);
            if (redirect.fd == STDOUT_FILENO) {
                io_.assign(STDERR_FILENO, fd);
            }
            break;
        }
    }
}

PipelineFds::PipelineFds(std::size_t stage_count) {
    if (stage_count < 2) {
        return;
    }
    ends_.reserve((stage_count - 1) * 2);
    for (std::size_t i = 0; i + 1 < stage_count; ++i) {
        int pipe_fds[2] = {-1, -1};
        auto result = esh_filesystem::create_pipe_cloexec(pipe_fds);
        if (result.is_error()) {
            throw ExecutionError(ErrorType::PIPE_ERROR, "pipeline", result.error());
        }
        ends_.emplace_back(pipe_fds[0]);
        ends_.emplace_back(pipe_fds[1]);
    }
}

std::vector<int> PipelineFds::all() const {
    std::vector<int> fds;
    fds.reserve(ends_.size());
    for (const auto& end : ends_) {
        if (end.get() >= 0) {
            fds.push_back(end.get());
        }
    }
    return fds;
}

void PipelineFds::close_all() {
    for (auto& end : ends_) {
        end.reset();
    }
}

Exec::Exec(JobManager& jobs) : jobs_(jobs) {
}

pid_t Exec::spawn_stage(ProcessSpec& spec, const std::vector<int>& close_in_child, pid_t pgid,
                        bool background) {
    pid_t pid = fork();
    if (pid == -1) {
        return -1;
    }

    if (pid == 0) {
        reset_child_signals();
        if (background) {
            (void)setpgid(0, pgid);
        }
        setup_child_fds(spec.io, close_in_child);

        for (const auto& entry : spec.env) {
            setenv(entry.first.c_str(), entry.second.c_str(), 1);
        }

        if (spec.run_in_child) {
            int exit_code = 1;
            try {
                exit_code = spec.run_in_child(child_io_context(spec.io));
            } catch (const ExecutionError& e) {
                print_error(e.info(), STDERR_FILENO);
                exit_code = e.exit_code();
            } catch (const std::exception& e) {
                print_error(ErrorInfo{ErrorType::RUNTIME_ERROR, "", e.what()}, STDERR_FILENO);
                exit_code = 1;
            }
            _exit(exit_code & 0xff);
        }

        if (spec.args.empty()) {
            _exit(0);
        }
        exec_external_child(spec.args);
    }

    if (background) {
        if (setpgid(pid, pgid == 0 ? pid : pgid) < 0 && errno != EACCES && errno != ESRCH) {
            debug_msg("setpgid(%d) failed: %s", static_cast<int>(pid), std::strerror(errno));
        }
    }
    debug_msg("spawned pid %d for '%s'", static_cast<int>(pid),
              spec.args.empty() ? "<in-process>" : spec.args[0].c_str());
    return pid;
}

std::vector<pid_t> Exec::spawn(std::vector<ProcessSpec>& stages, PipelineFds& pipes,
                               bool background) {
    const std::vector<int> close_in_child = pipes.all();
    std::vector<pid_t> pids(stages.size(), -1);
    pid_t pgid = 0;

    // Right to left, so every reader exists before its writer starts.
    for (size_t i = stages.size(); i-- > 0;) {
        pid_t pid = spawn_stage(stages[i], close_in_child, pgid, background);
        if (pid == -1) {
            int saved_errno = errno;
            pipes.close_all();
            for (pid_t started : pids) {
                if (started > 0) {
                    (void)kill(started, SIGTERM);
                    int status = 0;
                    while (waitpid(started, &status, 0) == -1 && errno == EINTR) {
                    }
                }
            }
            throw ExecutionError(ErrorType::RUNTIME_ERROR, "fork", std::strerror(saved_errno));
        }
        if (background && pgid == 0) {
            pgid = pid;
        }
        pids[i] = pid;
    }

    pipes.close_all();
    return pids;
}

ExecResult Exec::wait_foreground(const std::vector<pid_t>& pids,
                                 const std::string& command_line) {
    std::vector<int> statuses(pids.size(), 0);
    std::vector<bool> reaped(pids.size(), false);
    size_t remaining = pids.size();
    int forwarded_signal = 0;
    bool killed = false;
    auto deadline = std::chrono::steady_clock::now();

    auto forward = [&](int signum) {
        forwarded_signal = signum;
        deadline = std::chrono::steady_clock::now() + kInterruptGracePeriod;
        debug_msg("forwarding signal %d to '%s'", signum, command_line.c_str());
        kill_pids(pids, reaped, signum);
    };

    const int wake_fd = SignalHandler::wake_fd();
    while (remaining > 0) {
        // Drained before the checks below, so any later signal or exit leaves a byte to poll.
        SignalHandler::drain_wakeups();

        for (size_t i = 0; i < pids.size(); ++i) {
            if (reaped[i]) {
                continue;
            }
            int status = 0;
            pid_t result = waitpid(pids[i], &status, WNOHANG);
            if (result == pids[i]) {
                reaped[i] = true;
                statuses[i] = extract_exit_code(status);
                --remaining;
                debug_msg("reaped pid %d with status %d", static_cast<int>(pids[i]),
                          statuses[i]);
            } else if (result == -1 && errno != EINTR) {
                debug_msg("waitpid(%d) failed: %s", static_cast<int>(pids[i]),
                          std::strerror(errno));
                reaped[i] = true;
                statuses[i] = 127;
                --remaining;
            }
        }
        if (remaining == 0) {
            break;
        }

        if (forwarded_signal == 0 && SignalHandler::has_pending_signal()) {
            forward(SignalHandler::take_pending_signal());
        }

        int timeout_ms = -1;
        if (forwarded_signal != 0 && !killed) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                debug_msg("grace period over, killing '%s'", command_line.c_str());
                kill_pids(pids, reaped, SIGKILL);
                killed = true;
                continue;
            }
            timeout_ms = static_cast<int>(
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1);
        }
        if (wake_fd < 0) {
            // No self-pipe; fall back to short sleeps between checks.
            timeout_ms = timeout_ms < 0 ? kFallbackPollMs : std::min(timeout_ms, kFallbackPollMs);
        }

        struct pollfd wake{wake_fd, POLLIN, 0};
        if (poll(&wake, wake_fd < 0 ? 0 : 1, timeout_ms) == -1 && errno != EINTR) {
            debug_msg("poll on wake pipe failed: %s", std::strerror(errno));
        }
    }

    if (forwarded_signal != 0) {
        return ExecResult::failure(ErrorType::INTERRUPTED, command_line,
                                   std::string("SIG") +
                                       SignalHandler::get_signal_name(forwarded_signal),
                                   130);
    }
    return ExecResult::normal(statuses.back());
}

ExecResult Exec::run_foreground(std::vector<ProcessSpec>& stages, PipelineFds& pipes,
                                const std::string& command_line) {
    if (stages.empty()) {
        return ExecResult::normal(0);
    }
    PerformanceTracker tracker("run_foreground");
    std::vector<pid_t> pids = spawn(stages, pipes, false);
    return wait_foreground(pids, command_line);
}

BackgroundJob Exec::run_background(std::vector<ProcessSpec>& stages, PipelineFds& pipes,
                                   const std::string& command_line, int notify_fd) {
    BackgroundJob job;
    if (stages.empty()) {
        return job;
    }

    std::vector<pid_t> pids = spawn(stages, pipes, true);
    job.job_id = jobs_.add_job(pids, command_line);
    job.pid = pids.back();

    std::string notice =
        "[" + std::to_string(job.job_id) + "] " + std::to_string(static_cast<int>(job.pid)) + "\n";
    auto write_result = esh_filesystem::write_all(notify_fd, notice);
    if (write_result.is_error()) {
        debug_msg("could not print job notice: %s", write_result.error().c_str());
    }
    return job;
}
