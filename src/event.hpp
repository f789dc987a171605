#pragma once
#include <string>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace sciclaw {

// Kinds of events a turn produces, in the order a consumer typically sees them.
enum class EventType {
    IterationStart,
    Text,
    Reasoning,
    Retrieval,
    ToolCall,
    ToolResult,
    Chart,
    Data,
    Artifact,
    Image,
    AnalysisPlan,
    PlanStepUpdate,
    ContextCompressed,
    Error,
    Done,
};

// Wire name: "iteration_start", "tool_result", ...
const char* event_type_name(EventType type);

struct AgentEvent {
    EventType type = EventType::Text;
    std::string turn_id;
    std::optional<std::string> tool_call_id;
    std::optional<std::string> tool_name;
    nlohmann::json data;
    nlohmann::json metadata = nlohmann::json::object();

    bool is_terminal() const {
        return type == EventType::Done || type == EventType::Error;
    }

    // {type, turn_id, tool_call_id?, tool_name?, data, metadata}
    nlohmann::json to_json() const;
};

// Receives every event of a turn, in order. Called on the runner's thread.
using EventSink = std::function<void(const AgentEvent& event)>;

} // namespace sciclaw
