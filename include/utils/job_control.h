#pragma once

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class JobStatus : std::uint8_t {
    RUNNING,
    STOPPED,
    DONE
};

const char* job_status_text(JobStatus status);

// A backgrounded pipeline. Its status moves to DONE exactly once, from the waiter thread that
// reaps its processes.
class Job {
   public:
    Job(int id, std::vector<pid_t> pids, std::string command);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    int id() const {
        return id_;
    }
    // Pid of the last pipeline stage, the one whose status the job reports.
    pid_t pid() const {
        return pids_.back();
    }
    // Background pipelines start right to left, so the last stage leads the process group.
    pid_t pgid() const {
        return pids_.back();
    }
    const std::vector<pid_t>& pids() const {
        return pids_;
    }
    const std::string& command() const {
        return command_;
    }

    JobStatus status() const;
    int exit_status() const;
    bool is_done() const;

    void mark_done(int exit_status);

    // Blocks until the job is done and returns its exit status.
    int wait() const;
    // False on timeout.
    bool wait_for(std::chrono::milliseconds timeout) const;

   private:
    const int id_;
    const std::vector<pid_t> pids_;
    const std::string command_;

    mutable std::mutex mutex_;
    mutable std::condition_variable done_cv_;
    JobStatus status_ = JobStatus::RUNNING;
    int exit_status_ = 0;
};

// Registry of background jobs for one executor. Ids are monotonic from 1. Jobs stay
// registered after completion until removed explicitly.
class JobManager {
   public:
    JobManager() = default;

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    // Registers the job, makes it current and records its pid as $!. A detached thread reaps
    // the pids and marks the job done.
    int add_job(const std::vector<pid_t>& pids, const std::string& command);

    void remove_job(int job_id);

    std::shared_ptr<Job> get_job(int job_id) const;
    std::shared_ptr<Job> find_job_by_pid(pid_t pid) const;

    // Sorted by id.
    std::vector<std::shared_ptr<Job>> get_all_jobs() const;
    std::vector<std::shared_ptr<Job>> get_active_jobs() const;

    void set_current_job(int job_id);
    int get_current_job() const;
    int get_previous_job() const;

    // Exit status of the job once done; nullopt when no such job exists. A signal delivered
    // to the shell while waiting ends the wait with 128 + signal.
    std::optional<int> wait_for_job(int job_id);
    // Waits for every registered job and returns the status of the last one waited on.
    int wait_for_all();

    // Removes finished jobs and returns them in id order.
    std::vector<std::shared_ptr<Job>> cleanup_finished_jobs();

    pid_t last_background_pid() const;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<int, std::shared_ptr<Job>> jobs;
    int next_job_id = 1;
    int current_job = -1;
    int previous_job = -1;
    pid_t last_background_pid_ = -1;

    void update_current_previous(int new_current);
};

// Maps a wait(2) status to a shell exit code.
int extract_exit_code(int status);
