#pragma once
#include "result.hpp"
#include "../config.hpp"
#include <atomic>
#include <string>
#include <vector>
#include <sys/types.h>

namespace sciclaw {

// Runs Python code in a fresh, resource-limited worker process per call.
// The worker gets a serialized copy of the datasets and reports back through
// a pipe that the parent polls, so a large result cannot deadlock the pair.
class PythonExecutor : public CodeExecutor {
public:
    PythonExecutor(SandboxConfig config, std::string sessions_dir);

    SandboxResult execute(const SandboxRequest& request) override;
    std::string language() const override { return "python"; }

    // Pid of the most recent worker (0 before the first call)
    pid_t last_worker_pid() const { return last_pid_.load(); }

    // Root modules user code may import
    static const std::vector<std::string>& allowed_imports();
    // Builtin names user code may not call
    static const std::vector<std::string>& banned_calls();

private:
    SandboxResult run_worker(const SandboxRequest& request,
                             const std::string& python,
                             const std::string& scratch_dir);
    // Polls fd until EOF. Throws SandboxTimeoutError / SandboxCrashError.
    std::string collect_result(pid_t pid, int fd);

    SandboxConfig config_;
    std::string sessions_dir_;
    std::atomic<pid_t> last_pid_{0};
};

} // namespace sciclaw
