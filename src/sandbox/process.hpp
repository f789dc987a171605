#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace sciclaw {

// Applied in the child between fork and exec. Zero means unlimited.
struct ProcessLimits {
    uint64_t cpu_seconds = 0;
    uint64_t memory_bytes = 0;  // RLIMIT_AS
};

struct ProcessOutput {
    int exit_code = -1;   // valid when term_signal == 0
    int term_signal = 0;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;

    bool ok() const { return !timed_out && term_signal == 0 && exit_code == 0; }
};

using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

// Absolute path of an executable: name itself if it contains '/', else a
// PATH lookup. Empty if not found.
std::string find_executable(const std::string& name);

// argv[0] must be an absolute path (see find_executable). The child runs in
// its own process group; on timeout the whole group is killed.
// Throws SandboxCrashError if the process cannot be started.
ProcessOutput run_process(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          const EnvOverrides& env,
                          uint32_t timeout_seconds,
                          const ProcessLimits& limits = {});

// Pre-built argv/envp arrays, so the child allocates nothing after fork.
class ExecImage {
public:
    ExecImage(const std::vector<std::string>& argv, const EnvOverrides& env);
    ExecImage(const ExecImage&) = delete;
    ExecImage& operator=(const ExecImage&) = delete;
    char* const* argv() { return argv_ptrs_.data(); }
    char* const* envp() { return env_ptrs_.data(); }
    const char* path() const { return argv_store_.front().c_str(); }

private:
    std::vector<std::string> argv_store_;
    std::vector<std::string> env_store_;
    std::vector<char*> argv_ptrs_;
    std::vector<char*> env_ptrs_;
};

// Child side: setrlimit for the given limits. Async-signal-safe.
void apply_limits_in_child(const ProcessLimits& limits);

// SIGKILL the process group of pid and reap pid.
void kill_process_group(pid_t pid);

} // namespace sciclaw
