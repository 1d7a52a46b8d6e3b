#include <gtest/gtest.h>

#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <vector>

#include "job_control.h"

namespace {

// Child that sleeps for delay_ms and then exits with code.
pid_t spawn_child(int code, int delay_ms = 0) {
    pid_t pid = fork();
    if (pid == 0) {
        if (delay_ms > 0) {
            usleep(static_cast<useconds_t>(delay_ms) * 1000);
        }
        _exit(code);
    }
    return pid;
}

}  // namespace

TEST(JobControl, ExitCodeExtraction) {
    int status = 0;
    pid_t pid = spawn_child(7);
    ASSERT_GT(pid, 0);
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    EXPECT_EQ(extract_exit_code(status), 7);
}

TEST(JobControl, FirstJobGetsIdOneAndFinishes) {
    JobManager jobs;
    pid_t pid = spawn_child(0, 200);
    ASSERT_GT(pid, 0);

    int id = jobs.add_job({pid}, "sleep 0.2");
    EXPECT_EQ(id, 1);
    EXPECT_EQ(jobs.last_background_pid(), pid);
    EXPECT_EQ(jobs.get_current_job(), 1);

    auto job = jobs.get_job(id);
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->status(), JobStatus::RUNNING);
    EXPECT_EQ(job->command(), "sleep 0.2");

    auto status = jobs.wait_for_job(id);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, 0);
    EXPECT_EQ(job->status(), JobStatus::DONE);
    EXPECT_TRUE(job->is_done());
}

TEST(JobControl, IdsAreMonotonic) {
    JobManager jobs;
    int first = jobs.add_job({spawn_child(0)}, "a");
    int second = jobs.add_job({spawn_child(0)}, "b");
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 2);
    EXPECT_EQ(jobs.get_current_job(), 2);
    EXPECT_EQ(jobs.get_previous_job(), 1);

    jobs.wait_for_all();
    jobs.remove_job(second);
    int third = jobs.add_job({spawn_child(0)}, "c");
    EXPECT_EQ(third, 3);
    jobs.wait_for_all();
}

TEST(JobControl, ReportsStatusOfLastStage) {
    JobManager jobs;
    pid_t left = spawn_child(1);
    pid_t right = spawn_child(4);
    int id = jobs.add_job({left, right}, "left | right");
    auto job = jobs.get_job(id);
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->pid(), right);
    EXPECT_EQ(job->wait(), 4);
    EXPECT_EQ(jobs.find_job_by_pid(left), job);
}

TEST(JobControl, WaitForAllReturnsLastStatus) {
    JobManager jobs;
    jobs.add_job({spawn_child(0)}, "ok");
    jobs.add_job({spawn_child(5)}, "fails");
    EXPECT_EQ(jobs.wait_for_all(), 5);
    EXPECT_TRUE(jobs.get_active_jobs().empty());
}

TEST(JobControl, CleanupDropsFinishedJobs) {
    JobManager jobs;
    int done = jobs.add_job({spawn_child(0)}, "quick");
    int running = jobs.add_job({spawn_child(0, 500)}, "slow");
    ASSERT_TRUE(jobs.wait_for_job(done).has_value());

    auto removed = jobs.cleanup_finished_jobs();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0]->id(), done);
    EXPECT_EQ(jobs.get_job(done), nullptr);
    ASSERT_NE(jobs.get_job(running), nullptr);

    jobs.wait_for_all();
    EXPECT_EQ(jobs.cleanup_finished_jobs().size(), 1u);
    EXPECT_TRUE(jobs.get_all_jobs().empty());
}

TEST(JobControl, UnknownJob) {
    JobManager jobs;
    EXPECT_EQ(jobs.get_job(42), nullptr);
    EXPECT_FALSE(jobs.wait_for_job(42).has_value());
}

TEST(JobControl, TimedWait) {
    Job job(1, {getpid()}, "self");
    EXPECT_FALSE(job.wait_for(std::chrono::milliseconds(10)));
    job.mark_done(3);
    EXPECT_TRUE(job.wait_for(std::chrono::milliseconds(10)));
    EXPECT_EQ(job.exit_status(), 3);
    EXPECT_STREQ(job_status_text(JobStatus::DONE), "Done");
}
