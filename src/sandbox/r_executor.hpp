#pragma once
#include "result.hpp"
#include "../config.hpp"
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace sciclaw {

// Runs R code through Rscript in a per-call run directory. Datasets go in as
// CSV files with a manifest; results, updated datasets and plots come back as
// files the wrapper script writes.
class RExecutor : public CodeExecutor {
public:
    RExecutor(RSandboxConfig config, std::string sessions_dir, std::string r_libs_dir);

    SandboxResult execute(const SandboxRequest& request) override;
    std::string language() const override { return "r"; }

    // Writes datasets/NNN_<stem>.csv under run_dir and returns the manifest
    // [{name, path}, ...]
    static nlohmann::json write_datasets(const std::map<std::string, Dataset>& datasets,
                                         const std::string& run_dir);

    static std::string build_wrapper_script(const std::string& manifest_path,
                                            const std::string& user_code_path,
                                            const std::string& active_dataset,
                                            bool persist);

    // Reads the files a finished run left behind
    static SandboxResult collect_outputs(const std::string& run_dir, bool persist);

    std::string last_run_dir() const;

private:
    std::string make_run_dir(const std::string& session_id) const;

    RSandboxConfig config_;
    std::string sessions_dir_;
    std::string r_libs_dir_;
    mutable std::mutex mutex_;
    std::string last_run_dir_;
};

} // namespace sciclaw
