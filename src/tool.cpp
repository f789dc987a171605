#include "tool.hpp"
#include "errors.hpp"
#include "plugin.hpp"
#include "session.hpp"
#include <iostream>

namespace sciclaw {

nlohmann::json ToolResult::to_json() const {
    nlohmann::json j;
    j["success"] = success;
    j["message"] = message;
    if (!data.is_null()) j["data"] = data;
    if (error) j["error"] = *error;
    j["has_chart"] = has_chart;
    if (has_chart) j["chart_data"] = chart_data;
    j["has_dataframe"] = has_dataframe;
    if (has_dataframe) j["dataframe_preview"] = dataframe_preview;
    if (artifacts.is_array() && !artifacts.empty()) j["artifacts"] = artifacts;
    if (!images.empty()) j["images"] = images;
    if (metadata.is_object() && !metadata.empty()) j["metadata"] = metadata;
    return j;
}

ToolRegistry::ToolRegistry(std::vector<std::unique_ptr<Tool>> tools)
    : tools_(std::move(tools)) {}

std::unique_ptr<ToolRegistry> ToolRegistry::from_config(const Config& config) {
    return std::make_unique<ToolRegistry>(PluginRegistry::instance().create_all_tools(config));
}

void ToolRegistry::add(std::unique_ptr<Tool> tool) {
    tools_.push_back(std::move(tool));
}

Tool* ToolRegistry::find(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool->tool_name() == name) return tool.get();
    }
    return nullptr;
}

bool ToolRegistry::has(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<ToolSpec> ToolRegistry::specs() const {
    std::vector<ToolSpec> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) out.push_back(tool->spec());
    return out;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) out.push_back(tool->tool_name());
    return out;
}

nlohmann::json ToolRegistry::execute(const std::string& name, Session& session,
                                     const std::string& args_json) {
    Tool* tool = find(name);
    if (!tool) {
        return {{"success", false}, {"error", "Unknown tool: " + name}};
    }

    nlohmann::json args = nlohmann::json::object();
    if (!args_json.empty()) {
        try {
            args = nlohmann::json::parse(args_json);
        } catch (const nlohmann::json::parse_error&) {
            std::string repaired = repair_json(args_json);
            try {
                args = nlohmann::json::parse(repaired);
            } catch (const nlohmann::json::parse_error& e) {
                return {{"success", false},
                        {"error", std::string("tool argument parse failed: ") + e.what()}};
            }
        }
    }
    if (!args.is_object()) {
        return {{"success", false},
                {"error", "tool argument parse failed: arguments must be a JSON object"}};
    }

    try {
        ToolResult result = lanes_.execute(session.id, [&]() {
            return tool->execute(session, args);
        });
        return result.to_json();
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[tools] " << name << " failed: " << e.what() << "\n";
        return {{"success", false},
                {"error", "tool " + name + " failed: " + e.what()}};
    }
}

std::string repair_json(const std::string& json_str) {
    std::string s = json_str;

    // Balance braces
    int brace_count = 0;
    int bracket_count = 0;
    for (char c : s) {
        if (c == '{') brace_count++;
        else if (c == '}') brace_count--;
        else if (c == '[') bracket_count++;
        else if (c == ']') bracket_count--;
    }

    // Append missing closing braces/brackets
    while (bracket_count > 0) {
        s += ']';
        bracket_count--;
    }
    while (brace_count > 0) {
        s += '}';
        brace_count--;
    }

    // Remove trailing commas before } or ]
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == ',') {
            size_t j = i + 1;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) {
                j++;
            }
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) {
                continue;
            }
        }
        result += s[i];
    }

    // Keep the original if the repair did not produce valid JSON
    if (!nlohmann::json::accept(result)) return json_str;
    return result;
}

} // namespace sciclaw
