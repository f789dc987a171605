#pragma once
#include "session.hpp"
#include "workspace.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace sciclaw {

struct CompressionResult {
    bool success = false;
    std::string message;
    std::string summary;
    std::string archive_path;
    size_t archived_count = 0;
    size_t remaining_count = 0;
};

// Archives the oldest max(min_messages, total*ratio) messages (never all of
// them) to the workspace and folds a line summary into the session's
// compressed context. Throws std::runtime_error if the archive cannot be written.
CompressionResult compress_session_history(Session& session,
                                           Workspace& workspace,
                                           double ratio = 0.5,
                                           size_t min_messages = 4,
                                           size_t max_context_chars = 6000);

// "- [role] text" lines for at most max_items messages
std::string summarize_messages(const std::vector<ChatMessage>& messages,
                               size_t max_items = 20);

} // namespace sciclaw
