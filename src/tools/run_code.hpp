#pragma once
#include "code_tool.hpp"

namespace sciclaw {

class RunCodeTool : public CodeTool {
public:
    using CodeTool::CodeTool;

    std::string tool_name() const override { return "run_code"; }
    std::string description() const override;
    std::string code_extension() const override { return "py"; }

protected:
    std::string language_label() const override { return "Python"; }
};

} // namespace sciclaw
