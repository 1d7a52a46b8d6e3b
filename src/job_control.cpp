#include "job_control.h"

#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <thread>
#include <utility>

#include "debug.h"
#include "signal_handler.h"

int extract_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

const char* job_status_text(JobStatus status) {
    switch (status) {
        case JobStatus::RUNNING:
            return "Running";
        case JobStatus::STOPPED:
            return "Stopped";
        case JobStatus::DONE:
            return "Done";
    }
    return "Unknown";
}

namespace {

// Reaps every pid of the job; the last one's status is the job's.
int reap_job_processes(const std::vector<pid_t>& pids) {
    int exit_code = 0;
    for (pid_t pid : pids) {
        int status = 0;
        pid_t result = 0;
        do {
            result = waitpid(pid, &status, 0);
        } while (result == -1 && errno == EINTR);

        if (result == pid) {
            exit_code = extract_exit_code(status);
        } else {
            debug_msg("waitpid(%d) failed with errno %d", static_cast<int>(pid), errno);
            exit_code = 127;
        }
    }
    return exit_code;
}

}  // namespace

Job::Job(int id, std::vector<pid_t> pids, std::string command)
    : id_(id),
      pids_(std::move(pids)), command_(std::move(command)) {
}

JobStatus Job::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

int Job::exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_status_;
}

bool Job::is_done() const {
    return status() == JobStatus::DONE;
}

void Job::mark_done(int exit_status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == JobStatus::DONE) {
            return;
        }
        status_ = JobStatus::DONE;
        exit_status_ = exit_status;
    }
    done_cv_.notify_all();
}

int Job::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return status_ == JobStatus::DONE; });
    return exit_status_;
}

bool Job::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return status_ == JobStatus::DONE; });
}

int JobManager::add_job(const std::vector<pid_t>& pids, const std::string& command) {
    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int job_id = next_job_id++;
        job = std::make_shared<Job>(job_id, pids, command);
        jobs[job_id] = job;
        update_current_previous(job_id);
        last_background_pid_ = job->pid();
    }

    {
        SignalMask blocked(SignalHandler::worker_blocked_signals());
        std::thread([job]() {
            int exit_code = reap_job_processes(job->pids());
            job->mark_done(exit_code);
            debug_msg("job %d (%s) done with status %d", job->id(), job->command().c_str(),
                      exit_code);
        }).detach();
    }

    debug_msg("job %d started: pid %d: %s", job->id(), static_cast<int>(job->pid()),
              command.c_str());
    return job->id();
}

void JobManager::remove_job(int job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs.find(job_id);
    if (it != jobs.end()) {
        if (current_job == job_id) {
            current_job = previous_job;
            previous_job = -1;
        } else if (previous_job == job_id) {
            previous_job = -1;
        }

        jobs.erase(it);
    }
}

std::shared_ptr<Job> JobManager::get_job(int job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs.find(job_id);
    return it != jobs.end() ? it->second : nullptr;
}

std::shared_ptr<Job> JobManager::find_job_by_pid(pid_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& pair : jobs) {
        const auto& pids = pair.second->pids();
        if (std::find(pids.begin(), pids.end(), pid) != pids.end()) {
            return pair.second;
        }
    }
    return nullptr;
}

std::vector<std::shared_ptr<Job>> JobManager::get_all_jobs() const {
    std::vector<std::shared_ptr<Job>> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(jobs.size());
        for (const auto& pair : jobs) {
            result.push_back(pair.second);
        }
    }

    std::sort(result.begin(), result.end(),
              [](const std::shared_ptr<Job>& a, const std::shared_ptr<Job>& b) {
                  return a->id() < b->id();
              });

    return result;
}

std::vector<std::shared_ptr<Job>> JobManager::get_active_jobs() const {
    auto all = get_all_jobs();
    all.erase(std::remove_if(all.begin(), all.end(),
                             [](const std::shared_ptr<Job>& job) { return job->is_done(); }),
              all.end());
    return all;
}

void JobManager::set_current_job(int job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_current_previous(job_id);
}

int JobManager::get_current_job() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_job;
}

int JobManager::get_previous_job() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return previous_job;
}

void JobManager::update_current_previous(int new_current) {
    if (current_job != new_current) {
        previous_job = current_job;
        current_job = new_current;
    }
}

std::optional<int> JobManager::wait_for_job(int job_id) {
    auto job = get_job(job_id);
    if (!job) {
        return std::nullopt;
    }

    while (!job->wait_for(std::chrono::milliseconds(50))) {
        if (SignalHandler::has_pending_signal()) {
            int signum = SignalHandler::take_pending_signal();
            debug_msg("wait for job %d interrupted by signal %d", job_id, signum);
            return 128 + signum;
        }
    }
    return job->exit_status();
}

int JobManager::wait_for_all() {
    int status = 0;
    for (const auto& job : get_all_jobs()) {
        auto result = wait_for_job(job->id());
        if (result.has_value()) {
            status = *result;
            if (status > 128 && !job->is_done()) {
                break;
            }
        }
    }
    return status;
}

std::vector<std::shared_ptr<Job>> JobManager::cleanup_finished_jobs() {
    std::vector<std::shared_ptr<Job>> finished;
    for (const auto& job : get_all_jobs()) {
        if (job->is_done()) {
            finished.push_back(job);
        }
    }

    for (const auto& job : finished) {
        remove_job(job->id());
    }
    return finished;
}

pid_t JobManager::last_background_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_background_pid_;
}
