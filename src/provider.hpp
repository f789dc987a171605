#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <memory>
#include <functional>
#include <map>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace sciclaw {

struct ProviderEntry;
class HttpClient;

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

Role role_from_string(const std::string& s);

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // raw JSON string
};

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON Schema as string
};

struct ChatMessage {
    Role role;
    std::string content;
    std::optional<std::string> name;          // tool name on Tool messages
    std::optional<std::string> tool_call_id;
    std::vector<ToolCall> tool_calls;         // Assistant messages only
    std::optional<std::string> event_type;    // chart/data/artifact/image notes
    nlohmann::json extra = nlohmann::json::object();
};

// {role, content, tool_calls:[{id,type,function:{name,arguments}}], tool_call_id, name, event_type, ...extra}
nlohmann::json message_to_json(const ChatMessage& msg);
ChatMessage message_from_json(const nlohmann::json& j);

struct TokenUsage {
    uint32_t input_tokens = 0;
    uint32_t output_tokens = 0;
};

// One streaming delta, already normalized across vendors.
struct LLMChunk {
    std::string text;       // visible text (think tags stripped)
    std::string reasoning;  // reasoning / thinking delta
    std::string raw_text;   // provider text delta before tag stripping
    std::vector<ToolCall> tool_calls;  // completed calls, sent with finish_reason "tool_calls"
    std::optional<std::string> finish_reason;
    std::optional<TokenUsage> usage;
};

// Fold of a chunk stream
struct LLMResponse {
    std::string text;
    std::string reasoning;
    std::string raw_text;
    std::vector<ToolCall> tool_calls;
    std::optional<TokenUsage> usage;  // last seen
    std::set<std::string> finish_reasons;

    void absorb(const LLMChunk& chunk);
    bool has_tool_calls() const { return !tool_calls.empty(); }
};

// Receives each chunk. Return false to stop the stream.
using ChunkCallback = std::function<bool(const LLMChunk& chunk)>;

struct ChatOptions {
    double temperature = 0.3;
    uint32_t max_tokens = 4096;
    long timeout_seconds = 300;
};

// Accumulates tool-call fragments keyed by the vendor's index.
class ToolCallAccumulator {
public:
    void add(int index, const std::string& id, const std::string& name,
             const std::string& arguments_fragment);
    bool empty() const { return calls_.empty(); }
    // Completed calls in index order; resets the accumulator.
    std::vector<ToolCall> take();

private:
    std::map<int, ToolCall> calls_;
};

// One vendor backend. Immutable once constructed.
class ProviderClient {
public:
    virtual ~ProviderClient() = default;

    // Streams one completion into on_chunk. Throws ProviderError on failure.
    virtual void stream_chat(const std::vector<ChatMessage>& messages,
                             const std::vector<ToolSpec>& tools,
                             const ChatOptions& options,
                             const ChunkCallback& on_chunk) = 0;

    virtual bool is_available() const = 0;
    virtual std::string provider_id() const = 0;
    virtual std::string display_name() const = 0;
    virtual std::string model() const = 0;

    // Release connections. Called when a one-shot client is done.
    virtual void close() {}
};

// Factory: create a vendor client through the plugin registry
std::unique_ptr<ProviderClient> create_provider(const std::string& provider_id,
                                                const ProviderEntry& entry,
                                                HttpClient& http);

} // namespace sciclaw
