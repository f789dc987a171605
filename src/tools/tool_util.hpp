#pragma once
#include "../tool.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sciclaw {

// Required non-empty string field. Throws ToolExecutionError if missing.
inline std::string require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        throw ToolExecutionError(std::string("Missing required parameter: ") + field);
    }
    std::string value = args[field].get<std::string>();
    if (value.empty()) {
        throw ToolExecutionError(std::string("Parameter must not be empty: ") + field);
    }
    return value;
}

inline std::string optional_string(const nlohmann::json& args, const char* field,
                                   const std::string& fallback = "") {
    if (args.contains(field) && args[field].is_string()) {
        return args[field].get<std::string>();
    }
    return fallback;
}

inline bool optional_bool(const nlohmann::json& args, const char* field, bool fallback) {
    if (args.contains(field) && args[field].is_boolean()) {
        return args[field].get<bool>();
    }
    return fallback;
}

} // namespace sciclaw
