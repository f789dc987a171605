#include "compression.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace sciclaw {

static std::string one_line(const std::string& value, size_t max_len) {
    std::string text = value;
    for (auto& c : text) {
        if (c == '\r' || c == '\n') c = ' ';
    }
    text = trim(text);
    if (text.size() > max_len) return utf8_truncate(text, max_len) + "...";
    return text;
}

std::string summarize_messages(const std::vector<ChatMessage>& messages, size_t max_items) {
    std::vector<std::string> lines;
    size_t n = std::min(max_items, messages.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& msg = messages[i];
        std::string content = one_line(msg.content, 140);

        if (msg.role == Role::Tool) {
            std::string label = msg.name ? *msg.name : msg.tool_call_id.value_or("");
            lines.push_back("- [tool:" + one_line(label, 32) + "] " + content);
            continue;
        }
        if (msg.role == Role::Assistant && !msg.tool_calls.empty()) {
            std::string names;
            for (size_t k = 0; k < msg.tool_calls.size() && k < 4; ++k) {
                if (msg.tool_calls[k].name.empty()) continue;
                if (!names.empty()) names += ", ";
                names += msg.tool_calls[k].name;
            }
            if (!names.empty()) {
                lines.push_back("- [assistant] called tools: " + names);
                if (!content.empty()) lines.push_back("- [assistant] " + content);
                continue;
            }
        }
        lines.push_back(std::string("- [") + role_to_string(msg.role) + "] " + content);
    }
    if (messages.size() > max_items) {
        lines.push_back("- ... " + std::to_string(messages.size() - max_items) +
                        " more omitted");
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return trim(out);
}

CompressionResult compress_session_history(Session& session,
                                           Workspace& workspace,
                                           double ratio,
                                           size_t min_messages,
                                           size_t max_context_chars) {
    CompressionResult result;
    size_t total = session.messages.size();
    result.remaining_count = total;

    if (total < min_messages || total < 2) {
        result.message = "Not enough messages to compress (need at least " +
                         std::to_string(std::max<size_t>(min_messages, 2)) + ")";
        return result;
    }

    ratio = std::min(std::max(ratio, 0.1), 0.9);
    size_t cut = std::max(min_messages, static_cast<size_t>(static_cast<double>(total) * ratio));
    if (cut >= total) cut = total - 1;
    if (cut == 0) cut = 1;

    // Don't leave tool results whose calls were archived at the head
    size_t advanced = cut;
    while (advanced < total && session.messages[advanced].role == Role::Tool) ++advanced;
    if (advanced < total) cut = advanced;

    std::vector<ChatMessage> archived(session.messages.begin(),
                                      session.messages.begin() + static_cast<long>(cut));
    std::vector<ChatMessage> remaining(session.messages.begin() + static_cast<long>(cut),
                                       session.messages.end());

    result.summary = summarize_messages(archived);
    result.archive_path = workspace.archive_messages(archived);

    session.messages = std::move(remaining);
    session.set_compressed_context(result.summary, max_context_chars);

    result.success = true;
    result.message = "History compressed";
    result.archived_count = archived.size();
    result.remaining_count = session.messages.size();
    std::cerr << "[compress] archived " << result.archived_count << " messages to "
              << result.archive_path << ", " << result.remaining_count << " remain\n";
    return result;
}

} // namespace sciclaw
