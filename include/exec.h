#pragma once

#include <sys/types.h>

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "ast.h"
#include "esh_filesystem.h"
#include "exec_result.h"
#include "io_context.h"

class JobManager;

// A redirect after expansion: target is a path, a descriptor number or "-", body holds the
// here-document or here-string text.
struct ResolvedRedirect {
    ast::RedirectType type = ast::RedirectType::OUTPUT;
    int fd = 1;
    std::string target;
    std::string body;
};

// Opens redirect targets in the calling process and yields the descriptors a command should
// use. Throws ExecutionError(REDIRECT_ERROR) when a target cannot be opened; nothing leaks.
class RedirectScope {
   public:
    RedirectScope(const IoContext& base, const std::vector<ResolvedRedirect>& redirects,
                  bool noclobber);
    ~RedirectScope();

    RedirectScope(const RedirectScope&) = delete;
    RedirectScope& operator=(const RedirectScope&) = delete;

    const IoContext& io() const {
        return io_;
    }

   private:
    IoContext io_;
    std::vector<esh_filesystem::FdGuard> owned_;
    std::vector<std::thread> writers_;

    void apply(const ResolvedRedirect& redirect, bool noclobber);
    int open_target(const ResolvedRedirect& redirect, int flags);
    int open_here_document(const std::string& body);
    void release();
};

// Pipes joining adjacent pipeline stages; pipe i carries stage i's output to stage i + 1.
class PipelineFds {
   public:
    explicit PipelineFds(std::size_t stage_count);

    PipelineFds(const PipelineFds&) = delete;
    PipelineFds& operator=(const PipelineFds&) = delete;

    int read_end(std::size_t index) const {
        return ends_[index * 2].get();
    }
    int write_end(std::size_t index) const {
        return ends_[index * 2 + 1].get();
    }
    std::vector<int> all() const;
    void close_all();

   private:
    std::vector<esh_filesystem::FdGuard> ends_;
};

// One process to start. External commands set args; builtins, functions and compound
// statements set run_in_child and run in the forked copy of the shell, where the descriptors
// have already been moved onto their target numbers.
struct ProcessSpec {
    std::vector<std::string> args;
    IoContext io;
    std::function<int(const IoContext&)> run_in_child;
    // Exported in the child only, as for `VAR=x cmd`.
    std::vector<std::pair<std::string, std::string>> env;
};

struct BackgroundJob {
    int job_id = 0;
    pid_t pid = -1;
};

// Starts processes, wires their descriptors and waits for them.
class Exec {
   public:
    explicit Exec(JobManager& jobs);

    Exec(const Exec&) = delete;
    Exec& operator=(const Exec&) = delete;

    // Starts every stage right to left and waits for all of them. The status is the last
    // stage's. SIGINT or SIGTERM received while waiting is forwarded to the stages, which are
    // killed after a grace period; the result is then an INTERRUPTED failure.
    ExecResult run_foreground(std::vector<ProcessSpec>& stages, PipelineFds& pipes,
                              const std::string& command_line);

    // Starts the stages in their own process group and registers them as a job. The
    // `[id] pid` notice goes to notify_fd.
    BackgroundJob run_background(std::vector<ProcessSpec>& stages, PipelineFds& pipes,
                                 const std::string& command_line, int notify_fd);

   private:
    JobManager& jobs_;

    std::vector<pid_t> spawn(std::vector<ProcessSpec>& stages, PipelineFds& pipes,
                             bool background);
    pid_t spawn_stage(ProcessSpec& spec, const std::vector<int>& close_in_child, pid_t pgid,
                      bool background);
    ExecResult wait_foreground(const std::vector<pid_t>& pids, const std::string& command_line);
};

std::string join_arguments(const std::vector<std::string>& args);
