#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sciclaw {

// pending -> in_progress -> completed | error
struct AnalysisStep {
    int id = 0;
    std::string title;
    std::optional<std::string> tool_hint;
    std::string status = "pending";

    nlohmann::json to_json() const;
};

struct AnalysisPlan {
    std::vector<AnalysisStep> steps;
    std::string raw_text;

    nlohmann::json to_json() const;

    // Step to attach the next call of tool_name to: the first pending step
    // hinting that tool, else the first pending step. nullptr when none is left.
    AnalysisStep* claim_step(const std::string& tool_name);
};

// Numbered ("1.", "1)", "1、", "第1步", "Step 1:") or bulleted lines.
// Returns nullopt for fewer than two steps.
std::optional<AnalysisPlan> parse_analysis_plan(const std::string& text);

} // namespace sciclaw
