#include "python_executor.hpp"
#include "process.hpp"
#include "python_worker.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include "../workspace.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sciclaw {

namespace {

constexpr uint64_t kMemoryFloorMb = 128;
constexpr int kPollIntervalMs = 50;
constexpr int kJoinTimeoutMs = 1000;
constexpr int kResultFd = 3;

// Removes a file when the scope ends
struct FileGuard {
    std::string path;
    ~FileGuard() {
        if (!path.empty()) std::remove(path.c_str());
    }
};

struct FdGuard {
    int fd = -1;
    ~FdGuard() {
        if (fd >= 0) close(fd);
    }
};

std::string log_tail(const std::string& path, size_t max_bytes) {
    std::string text;
    try {
        text = read_file(path);
    } catch (const std::runtime_error&) {
        return "";
    }
    if (text.size() > max_bytes) text = text.substr(text.size() - max_bytes);
    return text;
}

void write_private_file(const std::string& path, const std::string& content) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw std::runtime_error("Failed to create " + path + ": " + std::strerror(errno));
    }
    FdGuard guard{fd};
    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) throw std::runtime_error("Failed to write " + path);
        written += static_cast<size_t>(n);
    }
}

} // namespace

PythonExecutor::PythonExecutor(SandboxConfig config, std::string sessions_dir)
    : config_(std::move(config)), sessions_dir_(expand_home(sessions_dir)) {}

const std::vector<std::string>& PythonExecutor::allowed_imports() {
    static const std::vector<std::string> modules = {
        // pure computation
        "math", "statistics", "random", "decimal", "fractions", "cmath",
        // standard library data handling
        "datetime", "time", "calendar", "collections", "itertools", "functools",
        "operator", "heapq", "bisect", "array", "copy", "json", "csv", "re",
        "string", "textwrap", "unicodedata",
        // scientific stack
        "pandas", "numpy", "scipy", "statsmodels", "sklearn", "matplotlib",
        "plotly", "seaborn",
    };
    return modules;
}

const std::vector<std::string>& PythonExecutor::banned_calls() {
    static const std::vector<std::string> names = {
        "__import__", "eval", "exec", "compile", "open", "input", "getattr",
        "setattr", "delattr", "globals", "locals", "vars", "dir", "type",
        "breakpoint", "help", "exit", "quit",
    };
    return names;
}

SandboxResult PythonExecutor::execute(const SandboxRequest& request) {
    std::string python = find_executable(config_.python);
    if (python.empty()) {
        return SandboxResult::failure(SandboxErrorKind::Configuration,
                                      "Python interpreter not found: " + config_.python);
    }

    std::string scratch = sessions_dir_ + "/" +
                          Workspace::sanitize_filename(request.session_id, "session") +
                          "/sandbox_tmp";
    try {
        std::error_code ec;
        std::filesystem::create_directories(scratch, ec);
        if (ec) throw std::runtime_error("Failed to create " + scratch + ": " + ec.message());
        return run_worker(request, python, scratch);
    } catch (const SandboxTimeoutError& e) {
        return SandboxResult::failure(SandboxErrorKind::Timeout, e.what());
    } catch (const SandboxCrashError& e) {
        SandboxResult r = SandboxResult::failure(SandboxErrorKind::Crash, e.what());
        r.stderr_text = log_tail(scratch + "/worker.log", 4096);
        return r;
    } catch (const std::exception& e) {
        return SandboxResult::failure(SandboxErrorKind::Crash,
                                      std::string("sandbox setup failed: ") + e.what());
    }
}

SandboxResult PythonExecutor::run_worker(const SandboxRequest& request,
                                         const std::string& python,
                                         const std::string& scratch_dir) {
    nlohmann::json req;
    req["code"] = request.code;
    req["datasets"] = nlohmann::json::object();
    for (const auto& [name, ds] : request.datasets) req["datasets"][name] = ds.to_json();
    req["active_dataset"] = request.active_dataset ? nlohmann::json(*request.active_dataset)
                                                   : nlohmann::json();
    req["persist"] = request.persist;
    req["allowed_imports"] = allowed_imports();
    req["banned_calls"] = banned_calls();

    FileGuard request_file{scratch_dir + "/.request_" + generate_id() + ".json"};
    write_private_file(request_file.path, req.dump());

    std::string log_path = scratch_dir + "/worker.log";
    FdGuard log_fd{open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600)};
    if (log_fd.fd < 0) {
        throw std::runtime_error("Failed to open " + log_path + ": " + std::strerror(errno));
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw SandboxCrashError(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    FdGuard read_end{fds[0]};
    FdGuard write_end{fds[1]};

    ExecImage image({python, "-I", "-c", python_worker_source(), request_file.path,
                     std::to_string(kResultFd)},
                    {{"PYTHONDONTWRITEBYTECODE", "1"},
                     {"PYTHONIOENCODING", "utf-8"},
                     {"MPLBACKEND", "Agg"},
                     {"MPLCONFIGDIR", scratch_dir + "/.mpl"},
                     {"OPENBLAS_NUM_THREADS", "1"},
                     {"OMP_NUM_THREADS", "1"},
                     {"MKL_NUM_THREADS", "1"}});

    uint64_t memory_mb = std::max<uint64_t>(config_.max_memory_mb, kMemoryFloorMb);
    ProcessLimits limits;
    limits.cpu_seconds = static_cast<uint64_t>(config_.timeout) + 1;
    limits.memory_bytes = memory_mb * 1024 * 1024;

    pid_t pid = fork();
    if (pid < 0) {
        throw SandboxCrashError(std::string("Failed to fork worker: ") + std::strerror(errno));
    }

    if (pid == 0) {
        setsid();
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(log_fd.fd, STDOUT_FILENO);
        dup2(log_fd.fd, STDERR_FILENO);
        if (write_end.fd == kResultFd) {
            fcntl(kResultFd, F_SETFD, 0);
        } else {
            dup2(write_end.fd, kResultFd);
        }
        if (chdir(scratch_dir.c_str()) != 0) _exit(126);
        apply_limits_in_child(limits);
        execve(image.path(), image.argv(), image.envp());
        static const char msg[] = "sandbox: exec failed\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    last_pid_.store(pid);
    close(write_end.fd);
    write_end.fd = -1;

    std::string payload = collect_result(pid, read_end.fd);

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw SandboxCrashError(std::string("malformed worker result: ") + e.what());
    }
    if (!response.is_object()) throw SandboxCrashError("malformed worker result");

    SandboxResult result;
    result.success = response.value("success", false);
    result.stdout_text = response.value("stdout", "");
    result.stderr_text = response.value("stderr", "");
    result.error = response.value("error", "");
    result.traceback = response.value("traceback", "");
    result.error_kind = result.success
        ? SandboxErrorKind::None
        : sandbox_error_kind_from_string(response.value("error_kind", "code"));
    if (!result.success && result.error_kind == SandboxErrorKind::None) {
        result.error_kind = SandboxErrorKind::Code;
    }
    if (response.contains("result")) {
        result.result = ResultValue::from_envelope(response["result"]);
    }
    if (request.persist && response.contains("datasets") && response["datasets"].is_object()) {
        for (auto& [name, table] : response["datasets"].items()) {
            try {
                result.updated_datasets[name] = Dataset::from_json(table);
            } catch (const std::invalid_argument& e) {
                std::cerr << "[sandbox] Dropping unreadable dataset " << name << ": "
                          << e.what() << "\n";
            }
        }
    }
    if (response.contains("figures") && response["figures"].is_array()) {
        for (const auto& f : response["figures"]) {
            if (!f.is_object()) continue;
            Figure fig;
            fig.library = f.value("library", "");
            fig.title = f.value("title", "");
            fig.var_name = f.value("var_name", "");
            fig.plotly_json = f.value("plotly_json", "");
            fig.svg_base64 = f.value("svg_base64", "");
            fig.png_base64 = f.value("png_base64", "");
            result.figures.push_back(std::move(fig));
        }
    }
    return result;
}

std::string PythonExecutor::collect_result(pid_t pid, int fd) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::seconds(config_.timeout);
    std::string data;
    std::array<char, 65536> buffer;
    bool eof = false;
    bool exited = false;

    while (!eof) {
        if (clock::now() >= deadline) {
            kill_process_group(pid);
            std::cerr << "[sandbox] Worker " << pid << " killed after "
                      << config_.timeout << "s timeout\n";
            throw SandboxTimeoutError("code execution timed out (>" +
                                      std::to_string(config_.timeout) + "s)");
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ret = poll(&pfd, 1, kPollIntervalMs);
        if (ret < 0 && errno != EINTR) {
            kill_process_group(pid);
            throw SandboxCrashError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (ret > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            ssize_t n = read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                data.append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                eof = true;
            }
            continue;
        }

        // Quiet interval: is the worker still alive?
        if (!exited) {
            int status = 0;
            if (waitpid(pid, &status, WNOHANG) == pid) {
                exited = true;
                // One last non-blocking drain
                fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
                for (;;) {
                    ssize_t n = read(fd, buffer.data(), buffer.size());
                    if (n > 0) {
                        data.append(buffer.data(), static_cast<size_t>(n));
                        continue;
                    }
                    if (n < 0 && errno == EINTR) continue;
                    break;
                }
                eof = true;
            }
        }
    }

    // Bounded join
    if (!exited) {
        auto join_deadline = clock::now() + std::chrono::milliseconds(kJoinTimeoutMs);
        for (;;) {
            int status = 0;
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid || (r < 0 && errno != EINTR)) {
                exited = true;
                break;
            }
            if (clock::now() >= join_deadline) break;
            usleep(10 * 1000);
        }
        if (!exited) {
            std::cerr << "[sandbox] Worker " << pid << " did not exit after replying, killing\n";
            kill_process_group(pid);
        }
    }
    kill(-pid, SIGKILL);

    if (data.empty()) {
        throw SandboxCrashError("sandbox process exited abnormally without returning a result");
    }
    return data;
}

} // namespace sciclaw
