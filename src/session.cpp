#include "session.hpp"
#include "util.hpp"
#include <algorithm>

namespace sciclaw {

static const char* kSegmentSeparator = "\n\n---\n\n";

Session::Session(std::string session_id) : id(std::move(session_id)) {
    if (id.empty()) id = generate_id();
    last_active = epoch_seconds();
}

void Session::add_message(Role role, const std::string& content) {
    messages.push_back(ChatMessage{role, content, std::nullopt, std::nullopt, {},
                                   std::nullopt, nlohmann::json::object()});
}

void Session::add_assistant_event(const std::string& event_type,
                                  const std::string& content,
                                  const nlohmann::json& extra) {
    ChatMessage msg{Role::Assistant, content, std::nullopt, std::nullopt, {},
                    event_type, nlohmann::json::object()};
    if (extra.is_object()) msg.extra = extra;
    messages.push_back(std::move(msg));
}

void Session::add_tool_result(const std::string& tool_call_id,
                              const std::string& content,
                              const std::string& tool_name,
                              const std::string& status,
                              const std::string& intent,
                              const std::string& execution_id) {
    ChatMessage msg{Role::Tool, content, tool_name, tool_call_id, {}, std::nullopt,
                    nlohmann::json::object()};
    msg.extra["status"] = status;
    if (!intent.empty()) msg.extra["intent"] = intent;
    if (!execution_id.empty()) msg.extra["execution_id"] = execution_id;
    messages.push_back(std::move(msg));
}

void Session::set_compressed_context(const std::string& summary, size_t max_chars) {
    std::string incoming = trim(summary);
    if (incoming.empty()) return;

    std::vector<std::string> segments;
    if (!compressed_context.empty()) {
        std::string rest = compressed_context;
        std::string sep = kSegmentSeparator;
        size_t pos;
        while ((pos = rest.find(sep)) != std::string::npos) {
            segments.push_back(rest.substr(0, pos));
            rest.erase(0, pos + sep.size());
        }
        segments.push_back(rest);
    }
    segments.push_back(incoming);

    auto join = [&]() {
        std::string out;
        for (size_t i = 0; i < segments.size(); ++i) {
            if (i) out += kSegmentSeparator;
            out += segments[i];
        }
        return out;
    };

    std::string merged = join();
    while (max_chars > 0 && merged.size() > max_chars && segments.size() > 1) {
        segments.erase(segments.begin());
        merged = join();
    }
    if (max_chars > 0 && merged.size() > max_chars) {
        // Single segment still too long: keep its tail
        size_t cut = merged.size() - max_chars;
        while (cut < merged.size() && (static_cast<unsigned char>(merged[cut]) & 0xC0) == 0x80) {
            ++cut;
        }
        merged = merged.substr(cut);
    }

    compressed_context = merged;
    compressed_rounds++;
    last_compressed_at = timestamp_now();
}

std::shared_ptr<Session> SessionManager::get_or_create(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second->last_active = epoch_seconds();
        return it->second;
    }
    auto session = std::make_shared<Session>(session_id);
    sessions_.emplace(session->id, session);
    return session;
}

std::shared_ptr<Session> SessionManager::get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

void SessionManager::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

std::vector<std::string> SessionManager::evict_idle(uint64_t max_idle_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = epoch_seconds();
    std::vector<std::string> evicted;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second->last_active > max_idle_seconds) {
            evicted.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<std::string> SessionManager::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace sciclaw
