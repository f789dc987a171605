#include "anthropic.hpp"
#include "sse.hpp"
#include "stream_text.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <thread>

static sciclaw::ProviderRegistrar reg_anthropic("anthropic",
    [](const sciclaw::ProviderEntry& entry, sciclaw::HttpClient& http) {
        return std::make_unique<sciclaw::AnthropicProvider>(entry, http);
    });

using json = nlohmann::json;

namespace sciclaw {

AnthropicProvider::AnthropicProvider(const ProviderEntry& entry, HttpClient& http)
    : api_key_(entry.api_key), http_(http),
      base_url_(entry.base_url.empty() ? "https://api.anthropic.com" : entry.base_url),
      model_(entry.model.empty() ? "claude-sonnet-4-20250514" : entry.model) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    if (base_url_.size() < 3 || base_url_.compare(base_url_.size() - 3, 3, "/v1") != 0) {
        base_url_ += "/v1";
    }
}

bool AnthropicProvider::is_retryable(long status_code) {
    return status_code == 429 || status_code == 408 || status_code == 409 ||
           (status_code >= 500 && status_code < 600);
}

void AnthropicProvider::backoff_sleep(uint32_t attempt) {
    double delay = std::min(INITIAL_DELAY_S * std::pow(2.0, static_cast<double>(attempt)),
                            MAX_DELAY_S);
    auto ms = static_cast<long>(delay * 1000);
    std::cerr << "[anthropic] Rate limited, retrying in " << ms << "ms...\n";
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

static json parse_tool_input(const std::string& arguments) {
    if (arguments.empty()) return json::object();
    try {
        json input = json::parse(arguments);
        if (input.is_object()) return input;
    } catch (const json::parse_error&) {
        // fall through: wrap the raw text so the call is still replayable
    }
    return json{{"_raw", arguments}};
}

json AnthropicProvider::build_request(const std::vector<ChatMessage>& messages,
                                       const std::vector<ToolSpec>& tools,
                                       const ChatOptions& options) const {
    json request;
    request["model"] = model_;
    request["max_tokens"] = options.max_tokens;
    request["temperature"] = options.temperature;
    request["stream"] = true;

    // System prompt is a top-level field
    std::string system_text;
    for (const auto& msg : messages) {
        if (msg.role == Role::System) {
            if (!system_text.empty()) {
                system_text += "\n\n";
            }
            system_text += msg.content;
        }
    }
    if (!system_text.empty()) {
        request["system"] = system_text;
    }

    json msgs = json::array();
    for (size_t i = 0; i < messages.size(); i++) {
        const auto& msg = messages[i];
        if (msg.role == Role::System) continue;

        json m;
        if (msg.role == Role::Tool) {
            // Collect consecutive Tool messages into a single user message
            json tool_results = json::array();
            while (i < messages.size() && messages[i].role == Role::Tool) {
                json tool_result;
                tool_result["type"] = "tool_result";
                tool_result["tool_use_id"] = messages[i].tool_call_id.value_or("");
                tool_result["content"] = messages[i].content;
                tool_results.push_back(tool_result);
                i++;
            }
            i--; // adjust for outer loop increment
            m["role"] = "user";
            m["content"] = tool_results;
        } else if (msg.role == Role::Assistant && !msg.tool_calls.empty()) {
            m["role"] = "assistant";
            json content_blocks = json::array();
            if (!msg.content.empty()) {
                content_blocks.push_back({{"type", "text"}, {"text", msg.content}});
            }
            for (const auto& tc : msg.tool_calls) {
                content_blocks.push_back({
                    {"type", "tool_use"},
                    {"id", tc.id},
                    {"name", tc.name},
                    {"input", parse_tool_input(tc.arguments)}
                });
            }
            m["content"] = content_blocks;
        } else {
            m["role"] = role_to_string(msg.role);
            m["content"] = msg.content;
        }
        msgs.push_back(m);
    }
    request["messages"] = msgs;

    if (!tools.empty()) {
        json tools_arr = json::array();
        for (const auto& tool : tools) {
            json t;
            t["name"] = tool.name;
            t["description"] = tool.description;
            t["input_schema"] = json::parse(tool.parameters_json);
            tools_arr.push_back(t);
        }
        request["tools"] = tools_arr;
    }

    return request;
}

static std::string normalize_stop_reason(const std::string& reason) {
    if (reason == "tool_use") return "tool_calls";
    if (reason == "end_turn" || reason == "stop_sequence") return "stop";
    if (reason == "max_tokens") return "length";
    return reason;
}

void AnthropicProvider::stream_chat(const std::vector<ChatMessage>& messages,
                                    const std::vector<ToolSpec>& tools,
                                    const ChatOptions& options,
                                    const ChunkCallback& on_chunk) {
    std::string body = build_request(messages, tools, options).dump();

    std::vector<Header> headers = {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION},
        {"content-type", "application/json"}
    };

    for (uint32_t attempt = 0; attempt <= MAX_RETRIES; ++attempt) {
        SSEParser parser;
        ThinkTagParser think;
        ToolCallAccumulator pending_calls;
        TokenUsage usage;
        int block_index = -1;

        bool stopped = false;
        bool got_stream_data = false;
        std::string stream_error;
        std::string raw_body;
        std::exception_ptr callback_error;

        auto emit = [&](const LLMChunk& chunk) -> bool {
            if (!on_chunk(chunk)) {
                stopped = true;
                return false;
            }
            return true;
        };

        auto handle_event = [&](const SSEEvent& sse) -> bool {
            if (sse.event == "error") {
                stream_error = sse.data;
                return false;
            }
            if (sse.data.empty() || sse.data == "[DONE]") return true;

            json payload;
            try {
                payload = json::parse(sse.data);
            } catch (const json::parse_error&) {
                return true;
            }
            got_stream_data = true;

            if (sse.event == "message_start") {
                if (payload.contains("message") && payload["message"].contains("usage")) {
                    usage.input_tokens = payload["message"]["usage"].value("input_tokens", 0u);
                }
            } else if (sse.event == "content_block_start") {
                block_index = payload.value("index", block_index + 1);
                if (payload.contains("content_block")) {
                    const auto& block = payload["content_block"];
                    if (block.value("type", "") == "tool_use") {
                        pending_calls.add(block_index, block.value("id", ""),
                                          block.value("name", ""), "");
                    }
                }
            } else if (sse.event == "content_block_delta") {
                if (!payload.contains("delta")) return true;
                const auto& delta = payload["delta"];
                std::string delta_type = delta.value("type", "");
                int idx = payload.value("index", block_index);
                LLMChunk chunk;
                if (delta_type == "text_delta") {
                    chunk.raw_text = delta.value("text", "");
                    auto split = think.feed(chunk.raw_text);
                    chunk.text = split.visible;
                    chunk.reasoning = split.reasoning;
                } else if (delta_type == "thinking_delta") {
                    chunk.reasoning = delta.value("thinking", "");
                } else if (delta_type == "input_json_delta") {
                    pending_calls.add(idx, "", "", delta.value("partial_json", ""));
                }
                if (!chunk.text.empty() || !chunk.reasoning.empty() || !chunk.raw_text.empty()) {
                    return emit(chunk);
                }
            } else if (sse.event == "message_delta") {
                LLMChunk chunk;
                if (payload.contains("usage")) {
                    usage.output_tokens = payload["usage"].value("output_tokens", 0u);
                    chunk.usage = usage;
                }
                if (payload.contains("delta") && payload["delta"].contains("stop_reason") &&
                    payload["delta"]["stop_reason"].is_string()) {
                    std::string reason = normalize_stop_reason(
                        payload["delta"]["stop_reason"].get<std::string>());
                    auto rest = think.flush();
                    chunk.text = rest.visible;
                    chunk.reasoning = rest.reasoning;
                    chunk.finish_reason = reason;
                    if (reason == "tool_calls") chunk.tool_calls = pending_calls.take();
                }
                return emit(chunk);
            }

            return true;
        };

        auto http_response = http_.stream_post_raw(
            base_url_ + "/messages", body, headers,
            [&](const char* data, size_t len) -> bool {
                if (raw_body.size() < 8192) raw_body.append(data, len);
                try {
                    return parser.feed(std::string(data, len), handle_event);
                } catch (...) {
                    callback_error = std::current_exception();
                    return false;
                }
            },
            options.timeout_seconds);

        if (callback_error) std::rethrow_exception(callback_error);
        if (stopped) return;

        // Error statuses arrive through the chunk callback too; only a parsed
        // event counts as stream data, so 429 and 5xx bodies stay retryable.
        if (http_response.status_code != 0 &&
            (http_response.status_code < 200 || http_response.status_code >= 300)) {
            if (!got_stream_data && is_retryable(http_response.status_code) &&
                attempt < MAX_RETRIES) {
                backoff_sleep(attempt);
                continue;
            }
            std::string err_body = http_response.body.empty() ? raw_body : http_response.body;
            std::string message = "Anthropic API error (HTTP " +
                std::to_string(http_response.status_code) + "): " + err_body;
            if (err_body.find("prompt is too long") != std::string::npos) {
                throw ContextOverflowError(message);
            }
            throw ProviderError(message);
        }
        if (!stream_error.empty()) {
            throw ProviderError("Anthropic streaming error: " + stream_error);
        }
        if (http_response.status_code == 0) {
            throw ProviderError("Anthropic request failed: " +
                (http_response.error.empty() ? "no response" : http_response.error));
        }

        parser.finish(handle_event);
        if (stopped) return;

        LLMChunk tail;
        auto rest = think.flush();
        tail.text = rest.visible;
        tail.reasoning = rest.reasoning;
        if (!pending_calls.empty()) {
            tail.tool_calls = pending_calls.take();
            tail.finish_reason = "tool_calls";
        }
        if (!tail.text.empty() || !tail.reasoning.empty() || !tail.tool_calls.empty()) {
            emit(tail);
        }
        return;
    }

    throw ProviderError("Anthropic API error: max retries exceeded");
}

} // namespace sciclaw
