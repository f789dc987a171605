#include "process.hpp"
#include "../errors.hpp"
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace sciclaw {

static constexpr size_t kMaxCapture = 4 * 1024 * 1024;

std::string find_executable(const std::string& name) {
    if (name.empty()) return "";
    auto is_exec = [](const std::string& p) {
        struct stat st;
        return stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(p.c_str(), X_OK) == 0;
    };
    if (name.find('/') != std::string::npos) {
        return is_exec(name) ? name : "";
    }
    const char* path = std::getenv("PATH");
    std::string dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_exec(candidate)) return candidate;
        start = end + 1;
    }
    return "";
}

ExecImage::ExecImage(const std::vector<std::string>& argv, const EnvOverrides& env)
    : argv_store_(argv) {
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        bool overridden = false;
        for (const auto& [k, _] : env) {
            if (k == key) overridden = true;
        }
        if (!overridden) env_store_.push_back(std::move(entry));
    }
    for (const auto& [k, v] : env) env_store_.push_back(k + "=" + v);

    for (auto& a : argv_store_) argv_ptrs_.push_back(const_cast<char*>(a.c_str()));
    argv_ptrs_.push_back(nullptr);
    for (auto& e : env_store_) env_ptrs_.push_back(const_cast<char*>(e.c_str()));
    env_ptrs_.push_back(nullptr);
}

void apply_limits_in_child(const ProcessLimits& limits) {
    if (limits.cpu_seconds > 0) {
        struct rlimit rl;
        rl.rlim_cur = static_cast<rlim_t>(limits.cpu_seconds);
        rl.rlim_max = static_cast<rlim_t>(limits.cpu_seconds);
        setrlimit(RLIMIT_CPU, &rl);
    }
    if (limits.memory_bytes > 0) {
        struct rlimit rl;
        rl.rlim_cur = static_cast<rlim_t>(limits.memory_bytes);
        rl.rlim_max = static_cast<rlim_t>(limits.memory_bytes);
        setrlimit(RLIMIT_AS, &rl);
    }
}

void kill_process_group(pid_t pid) {
    if (pid <= 0) return;
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

ProcessOutput run_process(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          const EnvOverrides& env,
                          uint32_t timeout_seconds,
                          const ProcessLimits& limits) {
    if (argv.empty()) throw SandboxCrashError("empty command line");

    ExecImage image(argv, env);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports exec errno, closed on success
    // Close-on-exec everywhere so children forked by other threads never hold
    // these ends; dup2 onto fds 1 and 2 clears the flag in our own child.
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        throw SandboxCrashError(std::string("Failed to create pipes: ") + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        throw SandboxCrashError(std::string("Failed to fork process: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: own process group so a timeout can take down grandchildren too
        setsid();
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        close(exec_pipe[0]);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        apply_limits_in_child(limits);
        execve(image.path(), image.argv(), image.envp());
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n = 0;
    while ((n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {}
    close_fd(exec_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        throw SandboxCrashError("Failed to start " + argv[0] + ": " + std::strerror(exec_errno));
    }

    ProcessOutput result;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    std::array<char, 4096> buffer;
    int fds[2] = {out_pipe[0], err_pipe[0]};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};

    while (fds[0] >= 0 || fds[1] >= 0) {
        auto now = std::chrono::steady_clock::now();
        if (timeout_seconds > 0 && now >= deadline) {
            result.timed_out = true;
            break;
        }
        int wait_ms = 200;
        if (timeout_seconds > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            if (left < wait_ms) wait_ms = static_cast<int>(left) + 1;
        }

        struct pollfd pfds[2];
        nfds_t count = 0;
        int index_of[2];
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            pfds[count].fd = fds[i];
            pfds[count].events = POLLIN;
            pfds[count].revents = 0;
            index_of[count] = i;
            ++count;
        }
        int ret = poll(pfds, count, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t k = 0; k < count; ++k) {
            if ((pfds[k].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            int i = index_of[k];
            ssize_t got = read(fds[i], buffer.data(), buffer.size());
            if (got > 0) {
                if (sinks[i]->size() < kMaxCapture) {
                    sinks[i]->append(buffer.data(), static_cast<size_t>(got));
                }
            } else if (got == 0 || errno != EINTR) {
                close_fd(fds[i]);
            }
        }
    }
    close_fd(fds[0]);
    close_fd(fds[1]);

    if (result.timed_out) {
        kill_process_group(pid);
        return result;
    }

    // Pipes closed; the child may still be exiting
    int status = 0;
    for (;;) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) break;
        if (timeout_seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            kill_process_group(pid);
            return result;
        }
        usleep(10 * 1000);
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    // Leftover grandchildren holding no pipes
    kill(-pid, SIGKILL);
    return result;
}

} // namespace sciclaw
