#pragma once
#include "provider.hpp"
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sciclaw {

// Tool-result bodies sent to the model are capped at this many bytes.
constexpr size_t kToolContentMaxChars = 2000;

// Drops assistant tool-call messages missing any tool result, and tool
// results whose owning call was not kept.
std::vector<ChatMessage> filter_valid_messages(const std::vector<ChatMessage>& messages);

// Drops UI notes (event_type set), strips bookkeeping fields and
// summarizes/caps tool-result bodies.
std::vector<ChatMessage> prepare_messages_for_llm(const std::vector<ChatMessage>& messages);

// Status/message/shape-level fields of a tool result dict; payloads elided.
nlohmann::json summarize_tool_result(const nlohmann::json& result);

// Summarizes JSON-object content, then caps at max_chars.
std::string compact_tool_content(const std::string& content, size_t max_chars);

// History form of a tool result (summary JSON string).
std::string serialize_tool_result_for_history(const nlohmann::json& result);

// chars/4 per content plus tool call names/arguments, plus 4 per message
uint32_t estimate_message_tokens(const ChatMessage& message);
uint32_t estimate_messages_tokens(const std::vector<ChatMessage>& messages);

// Removes whole messages from the oldest end until base_tokens + estimate
// fits token_budget. Tool calls and their results are removed together;
// the last min_recent messages are never touched.
std::vector<ChatMessage> sliding_window_trim(const std::vector<ChatMessage>& messages,
                                             uint32_t token_budget,
                                             uint32_t base_tokens = 0,
                                             size_t min_recent = 4);

// Decides whether a provider error means the prompt was too large.
using ContextLimitClassifier = std::function<bool(const std::string& error_text)>;

// Case-insensitive phrase match over common vendor wordings.
bool default_context_limit_classifier(const std::string& error_text);

// Collapses whitespace, escapes \ ` { } < >, caps length. Empty -> "(empty)".
std::string sanitize_for_system_context(const std::string& value, size_t max_len = 120);

// Line-wise sanitize; drops instruction-like lines.
std::string sanitize_reference_text(const std::string& text, size_t max_len);

} // namespace sciclaw
