#pragma once
#include "../tool.hpp"
#include "../sandbox/result.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sciclaw {

class Workspace;

// Front end shared by run_code and run_r_code: argument checks, folding
// results back into the session, saving figures as chart artifacts.
class CodeTool : public Tool {
public:
    CodeTool(std::unique_ptr<CodeExecutor> executor, std::string sessions_dir);

    ToolResult execute(Session& session, const nlohmann::json& args) override;
    std::string parameters_json() const override;

    CodeExecutor& executor() { return *executor_; }

    // "code.py" / "code.R" style extension for persisted code
    virtual std::string code_extension() const = 0;

protected:
    // "Python" or "R", used in messages
    virtual std::string language_label() const = 0;

    nlohmann::json save_figures(Workspace& workspace, const std::vector<Figure>& figures,
                                const std::string& label, ToolResult& result) const;

private:
    std::unique_ptr<CodeExecutor> executor_;
    std::string sessions_dir_;
};

} // namespace sciclaw
