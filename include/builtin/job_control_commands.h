#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "builtin.h"

class Job;
class JobManager;

namespace job_control_helpers {

// Job id named by %N, %%, %+ or %-. Nullopt when the specifier is malformed or names no job.
std::optional<int> parse_job_specifier(const std::string& text, const JobManager& jobs);
// Job named by a bare job id, a %specifier or a process id.
std::shared_ptr<Job> resolve_job(const std::string& target, const JobManager& jobs);

}  // namespace job_control_helpers

// jobs [-l|-p]
ExecResult jobs_command(const std::vector<std::string>& args, BuiltinContext& ctx);
// wait [ID|%ID|PID ...]
ExecResult wait_command(const std::vector<std::string>& args, BuiltinContext& ctx);
// fg [%ID]; waits for the job without handing over the terminal.
ExecResult fg_command(const std::vector<std::string>& args, BuiltinContext& ctx);
// bg [%ID]; sends SIGCONT to the job and leaves it running in the background.
ExecResult bg_command(const std::vector<std::string>& args, BuiltinContext& ctx);
