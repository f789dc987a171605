#pragma once
#include "provider.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sciclaw {

// Per-session directory tree under <sessions_dir>/<session_id>/:
//   artifacts/ (+ artifacts.json index), executions/, archive/,
//   sandbox_tmp/, r_sandbox_tmp/
// Writers throw std::runtime_error when the file system refuses.
class Workspace {
public:
    Workspace(const std::string& sessions_dir, const std::string& session_id);

    const std::string& session_id() const { return session_id_; }
    const std::string& root() const { return root_; }
    std::string artifacts_dir() const { return root_ + "/artifacts"; }
    std::string executions_dir() const { return root_ + "/executions"; }
    std::string archive_dir() const { return root_ + "/archive"; }
    std::string sandbox_tmp_dir() const { return root_ + "/sandbox_tmp"; }
    std::string r_sandbox_tmp_dir() const { return root_ + "/r_sandbox_tmp"; }

    void ensure_dirs() const;

    // Strips any directory part and characters outside [A-Za-z0-9._-]
    static std::string sanitize_filename(const std::string& name,
                                         const std::string& default_name = "file");

    // "/api/artifacts/<sid>/<percent-encoded filename>"
    std::string download_url(const std::string& filename) const;

    // Write artifacts/<name> and record it. Returns the index record.
    nlohmann::json save_artifact(const std::string& name,
                                 const std::string& content,
                                 const std::string& type,
                                 const std::string& format,
                                 const std::string& visibility = "deliverable");

    // Upsert by path (or by name/type/format) into artifacts.json.
    nlohmann::json add_artifact_record(const std::string& name,
                                       const std::string& type,
                                       const std::string& path,
                                       const std::string& format,
                                       const std::string& visibility = "deliverable");

    // Newest first
    nlohmann::json list_artifacts() const;

    // executions/<id>.json; returns the record (with "id")
    nlohmann::json save_code_execution(const std::string& code,
                                       const std::string& output,
                                       const std::string& status,
                                       const std::string& language,
                                       const std::string& tool_name,
                                       const nlohmann::json& tool_args,
                                       const std::string& intent = "");

    // archive/compressed_<ts>.json holding exactly these messages. Returns the path.
    std::string archive_messages(const std::vector<ChatMessage>& messages);

private:
    nlohmann::json load_index() const;
    void save_index(const nlohmann::json& index) const;

    std::string session_id_;
    std::string root_;
};

} // namespace sciclaw
