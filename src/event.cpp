#include "event.hpp"

namespace sciclaw {

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::IterationStart:    return "iteration_start";
        case EventType::Text:              return "text";
        case EventType::Reasoning:         return "reasoning";
        case EventType::Retrieval:         return "retrieval";
        case EventType::ToolCall:          return "tool_call";
        case EventType::ToolResult:        return "tool_result";
        case EventType::Chart:             return "chart";
        case EventType::Data:              return "data";
        case EventType::Artifact:          return "artifact";
        case EventType::Image:             return "image";
        case EventType::AnalysisPlan:      return "analysis_plan";
        case EventType::PlanStepUpdate:    return "plan_step_update";
        case EventType::ContextCompressed: return "context_compressed";
        case EventType::Error:             return "error";
        case EventType::Done:              return "done";
    }
    return "unknown";
}

nlohmann::json AgentEvent::to_json() const {
    nlohmann::json j;
    j["type"] = event_type_name(type);
    j["turn_id"] = turn_id;
    if (tool_call_id) j["tool_call_id"] = *tool_call_id;
    if (tool_name) j["tool_name"] = *tool_name;
    j["data"] = data;
    j["metadata"] = metadata;
    return j;
}

} // namespace sciclaw
