#pragma once
#include "provider.hpp"
#include "dataset.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace sciclaw {

// Conversation state for one analysis session. Owned by the runner for the
// duration of a turn; tool executions on it go through the session's lane.
struct Session {
    std::string id;
    // Held by AgentRunner::run for a whole turn, so concurrent requests on one
    // session never read datasets or history while another turn writes them.
    std::mutex turn_mutex;
    std::vector<ChatMessage> messages;
    std::map<std::string, Dataset> datasets;
    std::string compressed_context;
    uint32_t compressed_rounds = 0;
    std::string last_compressed_at;
    uint64_t last_active = 0;

    explicit Session(std::string session_id = {});

    void add_message(Role role, const std::string& content);

    // Non-dialog UI note (chart, artifact, ...). Never sent to the model.
    void add_assistant_event(const std::string& event_type,
                             const std::string& content,
                             const nlohmann::json& extra = nlohmann::json::object());

    void add_tool_result(const std::string& tool_call_id,
                         const std::string& content,
                         const std::string& tool_name,
                         const std::string& status,
                         const std::string& intent = "",
                         const std::string& execution_id = "");

    // Appends a summary segment; oldest segments are dropped past max_chars.
    void set_compressed_context(const std::string& summary, size_t max_chars);
};

class SessionManager {
public:
    // Get or create a session
    std::shared_ptr<Session> get_or_create(const std::string& session_id);

    // nullptr if unknown
    std::shared_ptr<Session> get(const std::string& session_id) const;

    void remove(const std::string& session_id);

    // Evict idle sessions (older than max_idle_seconds); returns their ids
    std::vector<std::string> evict_idle(uint64_t max_idle_seconds = 3600);

    // List active session IDs
    std::vector<std::string> list() const;

private:
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    mutable std::mutex mutex_;
};

} // namespace sciclaw
