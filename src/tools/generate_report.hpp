#pragma once
#include "../tool.hpp"

namespace sciclaw {

class Workspace;

// Writes a markdown analysis report as a session artifact. The runner ends
// the turn with the report text verbatim.
class GenerateReportTool : public Tool {
public:
    explicit GenerateReportTool(std::string sessions_dir);

    ToolResult execute(Session& session, const nlohmann::json& args) override;
    std::string tool_name() const override { return "generate_report"; }
    std::string description() const override;
    std::string parameters_json() const override;

    static std::string build_markdown(const Session& session, const Workspace& workspace,
                                      const nlohmann::json& args);

private:
    std::string sessions_dir_;
};

} // namespace sciclaw
