#pragma once
#include "code_tool.hpp"

namespace sciclaw {

class RunRCodeTool : public CodeTool {
public:
    using CodeTool::CodeTool;

    std::string tool_name() const override { return "run_r_code"; }
    std::string description() const override;
    std::string code_extension() const override { return "R"; }

protected:
    std::string language_label() const override { return "R"; }
};

} // namespace sciclaw
