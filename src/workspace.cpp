#include "workspace.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sciclaw {

Workspace::Workspace(const std::string& sessions_dir, const std::string& session_id)
    : session_id_(session_id),
      root_(expand_home(sessions_dir) + "/" + sanitize_filename(session_id, "session")) {}

void Workspace::ensure_dirs() const {
    for (const auto& dir : {artifacts_dir(), executions_dir(), archive_dir()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create " + dir + ": " + ec.message());
        }
    }
}

std::string Workspace::sanitize_filename(const std::string& name,
                                         const std::string& default_name) {
    std::string raw = name;
    size_t slash = raw.find_last_of("/\\");
    if (slash != std::string::npos) raw = raw.substr(slash + 1);
    raw = trim(raw);

    std::string cleaned;
    cleaned.reserve(raw.size());
    for (char c : raw) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        cleaned += safe ? c : '_';
    }
    // No leading/trailing dots: rules out "." and ".."
    while (!cleaned.empty() && cleaned.front() == '.') cleaned.erase(0, 1);
    while (!cleaned.empty() && cleaned.back() == '.') cleaned.pop_back();
    return cleaned.empty() ? default_name : cleaned;
}

std::string Workspace::download_url(const std::string& filename) const {
    static const char* hex = "0123456789ABCDEF";
    std::string encoded;
    for (unsigned char c : filename) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }
    return "/api/artifacts/" + session_id_ + "/" + encoded;
}

nlohmann::json Workspace::load_index() const {
    std::string path = artifacts_dir() + "/artifacts.json";
    nlohmann::json index;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        try {
            index = nlohmann::json::parse(read_file(path));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[workspace] Ignoring malformed " << path << ": " << e.what() << "\n";
        }
    }
    if (!index.is_object()) index = nlohmann::json::object();
    if (!index.contains("artifacts") || !index["artifacts"].is_array()) {
        index["artifacts"] = nlohmann::json::array();
    }
    index["session_id"] = session_id_;
    return index;
}

void Workspace::save_index(const nlohmann::json& index) const {
    nlohmann::json out = index;
    out["updated_at"] = timestamp_now();
    atomic_write_file(artifacts_dir() + "/artifacts.json", out.dump(2));
}

nlohmann::json Workspace::save_artifact(const std::string& name,
                                        const std::string& content,
                                        const std::string& type,
                                        const std::string& format,
                                        const std::string& visibility) {
    ensure_dirs();
    std::string safe = sanitize_filename(name, "artifact");
    std::string path = artifacts_dir() + "/" + safe;
    atomic_write_file(path, content);
    return add_artifact_record(safe, type, path, format, visibility);
}

nlohmann::json Workspace::add_artifact_record(const std::string& name,
                                              const std::string& type,
                                              const std::string& path,
                                              const std::string& format,
                                              const std::string& visibility) {
    ensure_dirs();
    nlohmann::json index = load_index();
    nlohmann::json record = {
        {"id", generate_id().substr(0, 12)},
        {"session_id", session_id_},
        {"name", name},
        {"type", type},
        {"format", format},
        {"path", path},
        {"download_url", download_url(name)},
        {"created_at", timestamp_now()},
        {"visibility", visibility},
    };

    bool matched = false;
    for (auto& item : index["artifacts"]) {
        if (!item.is_object()) continue;
        bool same_path = item.value("path", "") == path;
        bool same_identity = item.value("name", "") == name &&
                             item.value("type", "") == type &&
                             item.value("format", "") == format;
        if (!same_path && !same_identity) continue;
        record["id"] = item.value("id", record["id"].get<std::string>());
        item = record;
        matched = true;
        break;
    }
    if (!matched) index["artifacts"].push_back(record);

    save_index(index);
    return record;
}

nlohmann::json Workspace::list_artifacts() const {
    nlohmann::json artifacts = load_index()["artifacts"];
    std::vector<nlohmann::json> items;
    for (const auto& item : artifacts) {
        if (item.is_object()) items.push_back(item);
    }
    std::stable_sort(items.begin(), items.end(),
                     [](const nlohmann::json& a, const nlohmann::json& b) {
                         return a.value("created_at", "") > b.value("created_at", "");
                     });
    return nlohmann::json(items);
}

nlohmann::json Workspace::save_code_execution(const std::string& code,
                                              const std::string& output,
                                              const std::string& status,
                                              const std::string& language,
                                              const std::string& tool_name,
                                              const nlohmann::json& tool_args,
                                              const std::string& intent) {
    ensure_dirs();
    std::string exec_id = generate_id().substr(0, 12);
    nlohmann::json record = {
        {"id", exec_id},
        {"session_id", session_id_},
        {"code", code},
        {"output", output},
        {"status", status},
        {"language", language},
        {"created_at", timestamp_now()},
    };
    if (!tool_name.empty()) record["tool_name"] = tool_name;
    if (!tool_args.is_null()) record["tool_args"] = tool_args;
    if (!intent.empty()) record["intent"] = intent;
    atomic_write_file(executions_dir() + "/" + exec_id + ".json", record.dump(2));
    return record;
}

std::string Workspace::archive_messages(const std::vector<ChatMessage>& messages) {
    ensure_dirs();
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& msg : messages) arr.push_back(message_to_json(msg));

    std::string base = archive_dir() + "/compressed_" + compact_timestamp();
    std::string path = base + ".json";
    std::error_code ec;
    // Two compressions within the same second
    for (int n = 1; fs::exists(path, ec); ++n) {
        path = base + "_" + std::to_string(n) + ".json";
    }
    atomic_write_file(path, arr.dump(2));
    return path;
}

} // namespace sciclaw
