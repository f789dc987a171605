#include "provider.hpp"
#include "plugin.hpp"
#include "config.hpp"

namespace sciclaw {

Role role_from_string(const std::string& s) {
    if (s == "system") return Role::System;
    if (s == "assistant") return Role::Assistant;
    if (s == "tool") return Role::Tool;
    return Role::User;
}

nlohmann::json message_to_json(const ChatMessage& msg) {
    nlohmann::json j = nlohmann::json::object();
    if (msg.extra.is_object()) {
        for (auto& [key, value] : msg.extra.items()) j[key] = value;
    }
    j["role"] = role_to_string(msg.role);
    j["content"] = msg.content;
    if (!msg.tool_calls.empty()) {
        nlohmann::json calls = nlohmann::json::array();
        for (const auto& tc : msg.tool_calls) {
            calls.push_back({
                {"id", tc.id},
                {"type", "function"},
                {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
            });
        }
        j["tool_calls"] = std::move(calls);
    }
    if (msg.tool_call_id) j["tool_call_id"] = *msg.tool_call_id;
    if (msg.name) j["name"] = *msg.name;
    if (msg.event_type) j["event_type"] = *msg.event_type;
    return j;
}

ChatMessage message_from_json(const nlohmann::json& j) {
    ChatMessage msg{Role::User, "", std::nullopt, std::nullopt, {}, std::nullopt,
                    nlohmann::json::object()};
    for (auto& [key, value] : j.items()) {
        if (key == "role") {
            if (value.is_string()) msg.role = role_from_string(value.get<std::string>());
        } else if (key == "content") {
            if (value.is_string()) msg.content = value.get<std::string>();
            else if (!value.is_null()) msg.content = value.dump();
        } else if (key == "tool_calls") {
            if (!value.is_array()) continue;
            for (const auto& tc : value) {
                ToolCall call;
                call.id = tc.value("id", "");
                if (tc.contains("function") && tc["function"].is_object()) {
                    const auto& fn = tc["function"];
                    call.name = fn.value("name", "");
                    if (fn.contains("arguments")) {
                        call.arguments = fn["arguments"].is_string()
                            ? fn["arguments"].get<std::string>()
                            : fn["arguments"].dump();
                    }
                }
                msg.tool_calls.push_back(std::move(call));
            }
        } else if (key == "tool_call_id") {
            if (value.is_string()) msg.tool_call_id = value.get<std::string>();
        } else if (key == "name") {
            if (value.is_string()) msg.name = value.get<std::string>();
        } else if (key == "event_type") {
            if (value.is_string()) msg.event_type = value.get<std::string>();
        } else {
            msg.extra[key] = value;
        }
    }
    return msg;
}

void LLMResponse::absorb(const LLMChunk& chunk) {
    text += chunk.text;
    reasoning += chunk.reasoning;
    raw_text += chunk.raw_text;
    for (const auto& tc : chunk.tool_calls) tool_calls.push_back(tc);
    if (chunk.usage) usage = chunk.usage;
    if (chunk.finish_reason) finish_reasons.insert(*chunk.finish_reason);
}

void ToolCallAccumulator::add(int index, const std::string& id, const std::string& name,
                              const std::string& arguments_fragment) {
    auto& tc = calls_[index];
    if (!id.empty()) tc.id = id;
    if (!name.empty()) tc.name = name;
    tc.arguments += arguments_fragment;
}

std::vector<ToolCall> ToolCallAccumulator::take() {
    std::vector<ToolCall> out;
    out.reserve(calls_.size());
    for (auto& [index, tc] : calls_) {
        if (tc.arguments.empty()) tc.arguments = "{}";
        out.push_back(std::move(tc));
    }
    calls_.clear();
    return out;
}

std::unique_ptr<ProviderClient> create_provider(const std::string& provider_id,
                                                const ProviderEntry& entry,
                                                HttpClient& http) {
    return PluginRegistry::instance().create_provider(provider_id, entry, http);
}

} // namespace sciclaw
