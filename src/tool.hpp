#pragma once
#include "provider.hpp"
#include "lane_queue.hpp"
#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace sciclaw {

struct Session;
struct Config;

struct ToolResult {
    bool success = true;
    std::string message;
    nlohmann::json data;                 // null when absent
    std::optional<std::string> error;
    bool has_chart = false;
    nlohmann::json chart_data;
    bool has_dataframe = false;
    nlohmann::json dataframe_preview;
    nlohmann::json artifacts = nlohmann::json::array();
    std::vector<std::string> images;
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json to_json() const;

    static ToolResult failure(const std::string& message,
                              nlohmann::json data = nullptr) {
        ToolResult r;
        r.success = false;
        r.message = message;
        r.data = std::move(data);
        return r;
    }
};

// One named capability the model can call.
class Tool {
public:
    virtual ~Tool() = default;
    // Throws ToolExecutionError (or anything else) on failure; the registry
    // converts exceptions into error results.
    virtual ToolResult execute(Session& session, const nlohmann::json& args) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Dispatch by name. Executions for one session are serialized through the
// session's lane. execute() only lets ConfigurationError through; every other
// failure becomes an error result.
class ToolRegistry {
public:
    ToolRegistry() = default;
    explicit ToolRegistry(std::vector<std::unique_ptr<Tool>> tools);

    // All tools registered in the plugin registry
    static std::unique_ptr<ToolRegistry> from_config(const Config& config);

    void add(std::unique_ptr<Tool> tool);
    bool has(const std::string& name) const;
    std::vector<ToolSpec> specs() const;
    std::vector<std::string> names() const;

    // Returns the result dict; failures come back as {"error": ...}
    nlohmann::json execute(const std::string& name, Session& session,
                           const std::string& args_json);

    LaneQueue& lanes() { return lanes_; }

private:
    Tool* find(const std::string& name) const;

    std::vector<std::unique_ptr<Tool>> tools_;
    LaneQueue lanes_;
};

// Try to repair malformed JSON from LLM output (unbalanced braces, trailing commas)
std::string repair_json(const std::string& json_str);

} // namespace sciclaw
