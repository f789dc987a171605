#include "run_code.hpp"
#include "../plugin.hpp"
#include "../sandbox/python_executor.hpp"

static sciclaw::ToolRegistrar reg_run_code("run_code",
    [](const sciclaw::Config& config) {
        return std::make_unique<sciclaw::RunCodeTool>(
            std::make_unique<sciclaw::PythonExecutor>(config.sandbox, config.sessions_dir()),
            config.sessions_dir());
    });

namespace sciclaw {

std::string RunCodeTool::description() const {
    return "Run Python code in a restricted sandbox. Variables: datasets (all loaded "
           "datasets by name) and df (when dataset_name is given). Return a value by "
           "assigning result, or a table by assigning output_df. matplotlib and plotly "
           "figures are detected and saved as chart artifacts.";
}

} // namespace sciclaw
