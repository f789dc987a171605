#include "openai.hpp"
#include "sse.hpp"
#include "stream_text.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <exception>

static sciclaw::ProviderRegistrar reg_openai("openai",
    [](const sciclaw::ProviderEntry& entry, sciclaw::HttpClient& http) {
        return std::make_unique<sciclaw::OpenAIProvider>(entry, http);
    });

using json = nlohmann::json;

namespace sciclaw {

static constexpr size_t kMaxErrorBody = 8192;

OpenAIProvider::OpenAIProvider(const ProviderEntry& entry, HttpClient& http)
    : OpenAIProvider(entry, http, "https://api.openai.com/v1", "gpt-4o") {}

OpenAIProvider::OpenAIProvider(const ProviderEntry& entry, HttpClient& http,
                               const std::string& default_base_url,
                               const std::string& default_model)
    : api_key_(entry.api_key), http_(http),
      base_url_(entry.base_url.empty() ? default_base_url : entry.base_url),
      model_(entry.model.empty() ? default_model : entry.model) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json OpenAIProvider::build_request(const std::vector<ChatMessage>& messages,
                                   const std::vector<ToolSpec>& tools,
                                   const ChatOptions& options) const {
    json request;
    request["model"] = model_;
    request["temperature"] = effective_temperature(options.temperature);
    request["max_tokens"] = options.max_tokens;
    request["stream"] = true;
    if (include_stream_usage()) {
        request["stream_options"] = {{"include_usage", true}};
    }

    json msgs = json::array();
    for (const auto& msg : messages) {
        json m;
        m["role"] = role_to_string(msg.role);
        m["content"] = msg.content;

        if (msg.role == Role::Tool && msg.tool_call_id.has_value()) {
            m["tool_call_id"] = msg.tool_call_id.value();
        }

        if (msg.role == Role::Assistant && !msg.tool_calls.empty()) {
            json tool_calls = json::array();
            for (const auto& tc : msg.tool_calls) {
                tool_calls.push_back({
                    {"id", tc.id},
                    {"type", "function"},
                    {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
                });
            }
            m["tool_calls"] = tool_calls;
        }

        msgs.push_back(m);
    }
    request["messages"] = msgs;

    if (!tools.empty()) {
        json tools_arr = json::array();
        for (const auto& tool : tools) {
            json t;
            t["type"] = "function";
            t["function"] = {
                {"name", tool.name},
                {"description", tool.description},
                {"parameters", json::parse(tool.parameters_json)}
            };
            tools_arr.push_back(t);
        }
        request["tools"] = tools_arr;
        request["tool_choice"] = "auto";
    }

    return request;
}

std::vector<Header> OpenAIProvider::build_headers() const {
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (!api_key_.empty()) {
        headers.emplace_back("Authorization", "Bearer " + api_key_);
    }
    return headers;
}

static std::string string_field(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return {};
}

static uint32_t uint_field(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_number()) return obj[key].get<uint32_t>();
    return 0;
}

void OpenAIProvider::stream_chat(const std::vector<ChatMessage>& messages,
                                 const std::vector<ToolSpec>& tools,
                                 const ChatOptions& options,
                                 const ChunkCallback& on_chunk) {
    json request = build_request(messages, tools, options);

    SSEParser parser;
    ThinkTagParser think;
    DeltaReconciler text_delta;
    DeltaReconciler reasoning_delta;
    ToolCallAccumulator pending_calls;

    bool stopped = false;
    std::string raw_body;
    std::string stream_error;
    std::exception_ptr callback_error;

    auto emit = [&](const LLMChunk& chunk) -> bool {
        if (!on_chunk(chunk)) {
            stopped = true;
            return false;
        }
        return true;
    };

    auto handle_event = [&](const SSEEvent& sse) -> bool {
        if (sse.data.empty() || sse.data == "[DONE]") return true;

        json payload;
        try {
            payload = json::parse(sse.data);
        } catch (const json::parse_error&) {
            return true;  // keep-alive noise
        }
        if (!payload.is_object()) return true;

        if (payload.contains("error") && !payload["error"].is_null()) {
            const auto& err = payload["error"];
            stream_error = err.is_object() ? err.value("message", err.dump()) : err.dump();
            return false;
        }

        LLMChunk chunk;
        if (payload.contains("choices") && payload["choices"].is_array() &&
            !payload["choices"].empty()) {
            const auto& choice = payload["choices"][0];
            if (choice.contains("delta") && choice["delta"].is_object()) {
                const auto& delta = choice["delta"];

                std::string reasoning = string_field(delta, "reasoning_content");
                if (reasoning.empty()) reasoning = string_field(delta, "reasoning");
                chunk.reasoning = reasoning_delta.next(reasoning);

                std::string raw = text_delta.next(string_field(delta, "content"));
                if (!raw.empty()) {
                    chunk.raw_text = raw;
                    auto split = think.feed(raw);
                    chunk.text = split.visible;
                    chunk.reasoning += split.reasoning;
                }

                if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
                    for (const auto& tc : delta["tool_calls"]) {
                        int idx = tc.contains("index") && tc["index"].is_number_integer()
                            ? tc["index"].get<int>() : 0;
                        std::string name;
                        std::string args;
                        if (tc.contains("function") && tc["function"].is_object()) {
                            name = string_field(tc["function"], "name");
                            args = string_field(tc["function"], "arguments");
                        }
                        pending_calls.add(idx, string_field(tc, "id"), name, args);
                    }
                }
            }

            std::string finish = string_field(choice, "finish_reason");
            if (!finish.empty()) {
                chunk.finish_reason = finish;
                if (finish == "tool_calls") {
                    chunk.tool_calls = pending_calls.take();
                }
            }
        }

        // Usage (final chunk with stream_options, or inline on some vendors)
        if (payload.contains("usage") && payload["usage"].is_object()) {
            const auto& usage = payload["usage"];
            TokenUsage u;
            u.input_tokens = usage.contains("prompt_tokens")
                ? uint_field(usage, "prompt_tokens") : uint_field(usage, "input_tokens");
            u.output_tokens = usage.contains("completion_tokens")
                ? uint_field(usage, "completion_tokens") : uint_field(usage, "output_tokens");
            chunk.usage = u;
        }

        bool has_content = !chunk.text.empty() || !chunk.reasoning.empty() ||
                           !chunk.raw_text.empty() || !chunk.tool_calls.empty() ||
                           chunk.finish_reason || chunk.usage;
        if (!has_content) return true;
        return emit(chunk);
    };

    auto http_response = http_.stream_post_raw(
        chat_url(), request.dump(), build_headers(),
        [&](const char* data, size_t len) -> bool {
            if (raw_body.size() < kMaxErrorBody) raw_body.append(data, len);
            try {
                return parser.feed(std::string(data, len), handle_event);
            } catch (...) {
                // Never unwind through curl; rethrown below
                callback_error = std::current_exception();
                return false;
            }
        },
        options.timeout_seconds);

    if (callback_error) std::rethrow_exception(callback_error);
    if (stopped) return;

    if (http_response.status_code != 0 &&
        (http_response.status_code < 200 || http_response.status_code >= 300)) {
        std::string body = http_response.body.empty() ? raw_body : http_response.body;
        std::string message = provider_id() + " API error (HTTP " +
            std::to_string(http_response.status_code) + "): " + body;
        if (body.find("context_length_exceeded") != std::string::npos) {
            throw ContextOverflowError(message);
        }
        throw ProviderError(message);
    }
    if (!stream_error.empty()) {
        throw ProviderError(provider_id() + " streaming error: " + stream_error);
    }
    if (http_response.status_code == 0) {
        throw ProviderError(provider_id() + " request failed: " +
            (http_response.error.empty() ? "no response" : http_response.error));
    }

    parser.finish(handle_event);
    if (stopped) return;

    LLMChunk tail;
    auto rest = think.flush();
    tail.text = rest.visible;
    tail.reasoning = rest.reasoning;
    if (!pending_calls.empty()) {
        // Vendor ended the stream without a tool_calls finish reason
        tail.tool_calls = pending_calls.take();
        tail.finish_reason = "tool_calls";
    }
    if (!tail.text.empty() || !tail.reasoning.empty() || !tail.tool_calls.empty()) {
        emit(tail);
    }
}

} // namespace sciclaw
