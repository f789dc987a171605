#include "context.hpp"
#include "util.hpp"
#include <iostream>
#include <map>
#include <set>

namespace sciclaw {

namespace {

const char* const kContextLimitPatterns[] = {
    "maximum context length",
    "context length",
    "context_length_exceeded",
    "context window",
    "maximum context",
    "too many tokens",
    "token limit",
    "prompt is too long",
    "exceeds the context",
    "input is too long",
    "reduce the length",
    "超出上下文",
    "上下文长度",
    "超过最大 token",
    "超过最大token",
};

const char* const kSuspiciousPatterns[] = {
    "ignore previous",
    "ignore all previous",
    "reveal system",
    "show system prompt",
    "print env",
    "developer message",
    "system prompt",
    "api key",
    "token",
    "忽略以上",
    "忽略之前",
    "系统提示词",
    "开发者指令",
    "环境变量",
    "密钥",
};

nlohmann::json summarize_nested(const nlohmann::json& data) {
    nlohmann::json summary = nlohmann::json::object();
    for (const char* key : {"name", "dataset_name", "chart_type", "save_as"}) {
        if (data.contains(key)) summary[key] = data[key];
    }
    if (data.contains("shape") && data["shape"].is_object()) {
        const auto& shape = data["shape"];
        summary["shape"] = {{"rows", shape.value("rows", nlohmann::json())},
                            {"columns", shape.value("columns", nlohmann::json())}};
    }
    for (const char* key : {"rows", "preview_rows", "total_rows"}) {
        if (data.contains(key) && data[key].is_number_integer()) summary[key] = data[key];
    }
    // Column names only, never the cells
    if (data.contains("columns")) {
        const auto& cols = data["columns"];
        if (cols.is_number_integer()) {
            summary["columns"] = cols;
        } else if (cols.is_array()) {
            nlohmann::json names = nlohmann::json::array();
            for (const auto& c : cols) {
                if (c.is_string()) names.push_back(c);
                else if (c.is_object() && c.contains("name")) names.push_back(c["name"]);
                if (names.size() >= 20) break;
            }
            summary["column_names"] = names;
        }
    }
    nlohmann::json keys = nlohmann::json::array();
    for (auto it = data.begin(); it != data.end() && keys.size() < 10; ++it) {
        keys.push_back(it.key());
    }
    summary["keys"] = keys;
    return summary;
}

} // namespace

std::vector<ChatMessage> filter_valid_messages(const std::vector<ChatMessage>& messages) {
    std::set<std::string> responded;
    for (const auto& msg : messages) {
        if (msg.role == Role::Tool && msg.tool_call_id) responded.insert(*msg.tool_call_id);
    }

    std::vector<ChatMessage> kept;
    std::set<std::string> kept_calls;
    size_t dropped = 0;
    for (const auto& msg : messages) {
        if (msg.role == Role::Assistant && !msg.tool_calls.empty()) {
            bool complete = true;
            for (const auto& tc : msg.tool_calls) {
                if (!tc.id.empty() && responded.count(tc.id) == 0) complete = false;
            }
            if (!complete) {
                ++dropped;
                continue;
            }
            for (const auto& tc : msg.tool_calls) kept_calls.insert(tc.id);
        } else if (msg.role == Role::Tool) {
            if (!msg.tool_call_id || kept_calls.count(*msg.tool_call_id) == 0) {
                ++dropped;
                continue;
            }
        }
        kept.push_back(msg);
    }
    if (dropped > 0) {
        std::cerr << "[agent] Filtered " << dropped << " incomplete tool-call messages\n";
    }
    return kept;
}

nlohmann::json summarize_tool_result(const nlohmann::json& result) {
    nlohmann::json compact = nlohmann::json::object();
    if (!result.is_object()) return compact;

    for (const char* key : {"success", "message", "error", "status"}) {
        if (result.contains(key)) compact[key] = result[key];
    }
    for (const char* key : {"has_chart", "has_dataframe"}) {
        if (result.contains(key)) {
            const auto& v = result[key];
            compact[key] = v.is_boolean() ? v.get<bool>() : !v.is_null();
        }
    }
    if (result.contains("data") && result["data"].is_object()) {
        compact["data_summary"] = summarize_nested(result["data"]);
    }
    if (result.contains("dataframe_preview") && result["dataframe_preview"].is_object()) {
        const auto& preview = result["dataframe_preview"];
        if (preview.contains("total_rows")) compact["total_rows"] = preview["total_rows"];
        if (preview.contains("columns") && preview["columns"].is_array()) {
            nlohmann::json names = nlohmann::json::array();
            for (const auto& c : preview["columns"]) {
                if (c.is_object() && c.contains("name")) names.push_back(c["name"]);
                else if (c.is_string()) names.push_back(c);
            }
            compact["columns"] = names;
        }
    }
    if (result.contains("artifacts") && result["artifacts"].is_array()) {
        const auto& artifacts = result["artifacts"];
        compact["artifact_count"] = artifacts.size();
        nlohmann::json names = nlohmann::json::array();
        for (const auto& item : artifacts) {
            if (names.size() >= 5) break;
            if (item.is_object() && item.contains("name")) names.push_back(item["name"]);
        }
        if (!names.empty()) compact["artifact_names"] = names;
    }
    if (result.contains("images")) {
        const auto& images = result["images"];
        if (images.is_array()) compact["image_count"] = images.size();
        else if (images.is_string() && !images.get<std::string>().empty()) compact["image_count"] = 1;
    }
    if (compact.empty()) compact["message"] = "tool finished";
    return compact;
}

std::string compact_tool_content(const std::string& content, size_t max_chars) {
    std::string text = content;
    std::string stripped = trim(content);
    if (!stripped.empty() && stripped.front() == '{' && stripped.back() == '}') {
        try {
            auto parsed = nlohmann::json::parse(stripped);
            if (parsed.is_object()) text = summarize_tool_result(parsed).dump();
        } catch (const nlohmann::json::parse_error&) {
            // Not JSON after all; cap the raw text
        }
    }
    if (text.size() > max_chars) {
        return utf8_truncate(text, max_chars) + "...(truncated)";
    }
    return text;
}

std::string serialize_tool_result_for_history(const nlohmann::json& result) {
    if (result.is_object()) return summarize_tool_result(result).dump();
    if (result.is_string()) return compact_tool_content(result.get<std::string>(), kToolContentMaxChars);
    return compact_tool_content(result.dump(), kToolContentMaxChars);
}

std::vector<ChatMessage> prepare_messages_for_llm(const std::vector<ChatMessage>& messages) {
    std::vector<ChatMessage> prepared;
    prepared.reserve(messages.size());
    for (const auto& msg : messages) {
        if (msg.role == Role::Assistant && msg.event_type) continue;

        ChatMessage cleaned = msg;
        cleaned.event_type.reset();
        cleaned.extra = nlohmann::json::object();
        if (msg.role == Role::Tool) {
            cleaned.content = compact_tool_content(msg.content, kToolContentMaxChars);
        }
        prepared.push_back(std::move(cleaned));
    }
    return prepared;
}

uint32_t estimate_message_tokens(const ChatMessage& message) {
    uint32_t tokens = 4 + estimate_tokens(message.content);
    for (const auto& tc : message.tool_calls) {
        tokens += estimate_tokens(tc.name) + estimate_tokens(tc.arguments);
    }
    return tokens;
}

uint32_t estimate_messages_tokens(const std::vector<ChatMessage>& messages) {
    uint32_t total = 0;
    for (const auto& msg : messages) total += estimate_message_tokens(msg);
    return total;
}

std::vector<ChatMessage> sliding_window_trim(const std::vector<ChatMessage>& messages,
                                             uint32_t token_budget,
                                             uint32_t base_tokens,
                                             size_t min_recent) {
    if (messages.empty()) return messages;

    // tool_call_id -> indices that must go together
    std::map<std::string, std::set<size_t>> pairs;
    for (size_t i = 0; i < messages.size(); ++i) {
        const auto& msg = messages[i];
        if (msg.role == Role::Assistant) {
            for (const auto& tc : msg.tool_calls) {
                if (!tc.id.empty()) pairs[tc.id].insert(i);
            }
        } else if (msg.role == Role::Tool && msg.tool_call_id) {
            pairs[*msg.tool_call_id].insert(i);
        }
    }
    std::map<size_t, std::set<size_t>> groups;
    for (const auto& [id, indices] : pairs) {
        for (size_t idx : indices) {
            groups[idx].insert(indices.begin(), indices.end());
        }
    }

    size_t total = messages.size();
    size_t protected_from = total > min_recent ? total - min_recent : 0;

    std::vector<uint32_t> cost(total);
    uint32_t current = base_tokens;
    for (size_t i = 0; i < total; ++i) {
        cost[i] = estimate_message_tokens(messages[i]);
        current += cost[i];
    }

    std::vector<bool> removed(total, false);
    for (size_t i = 0; i < protected_from && current > token_budget; ++i) {
        if (removed[i]) continue;
        std::set<size_t> group = groups.count(i) ? groups[i] : std::set<size_t>{i};
        bool touches_protected = false;
        for (size_t idx : group) {
            if (idx >= protected_from) touches_protected = true;
        }
        if (touches_protected) continue;
        for (size_t idx : group) {
            if (!removed[idx]) {
                removed[idx] = true;
                current -= cost[idx];
            }
        }
    }

    std::vector<ChatMessage> kept;
    for (size_t i = 0; i < total; ++i) {
        if (!removed[i]) kept.push_back(messages[i]);
    }
    return kept;
}

bool default_context_limit_classifier(const std::string& error_text) {
    std::string lower = to_lower(error_text);
    for (const char* pattern : kContextLimitPatterns) {
        if (lower.find(pattern) != std::string::npos) return true;
    }
    return false;
}

std::string sanitize_for_system_context(const std::string& value, size_t max_len) {
    std::string collapsed;
    bool in_space = false;
    for (char c : value) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            in_space = true;
            continue;
        }
        if (in_space && !collapsed.empty()) collapsed += ' ';
        in_space = false;
        collapsed += c;
    }

    std::string escaped;
    escaped.reserve(collapsed.size());
    for (char c : collapsed) {
        if (c == '\\' || c == '`' || c == '{' || c == '}' || c == '<' || c == '>') {
            escaped += '\\';
        }
        escaped += c;
    }
    if (escaped.empty()) return "(empty)";
    if (escaped.size() > max_len) return utf8_truncate(escaped, max_len) + "...";
    return escaped;
}

std::string sanitize_reference_text(const std::string& text, size_t max_len) {
    std::vector<std::string> safe_lines;
    size_t filtered = 0;
    for (const auto& raw : split(text, '\n')) {
        std::string line = sanitize_for_system_context(raw, 240);
        std::string lower = to_lower(line);
        bool suspicious = false;
        for (const char* pattern : kSuspiciousPatterns) {
            if (lower.find(pattern) != std::string::npos) {
                suspicious = true;
                break;
            }
        }
        if (suspicious) {
            ++filtered;
            continue;
        }
        if (line == "(empty)") line.clear();
        safe_lines.push_back(line);
    }
    if (filtered > 0) {
        safe_lines.push_back("[filtered " + std::to_string(filtered) + " suspicious lines]");
    }

    std::string merged;
    for (size_t i = 0; i < safe_lines.size(); ++i) {
        if (i) merged += '\n';
        merged += safe_lines[i];
    }
    merged = trim(merged);
    if (merged.empty()) return "[reference text empty]";
    if (merged.size() > max_len) return utf8_truncate(merged, max_len) + "...";
    return merged;
}

} // namespace sciclaw
