#include "run_r_code.hpp"
#include "../plugin.hpp"
#include "../sandbox/r_executor.hpp"

static sciclaw::ToolRegistrar reg_run_r_code("run_r_code",
    [](const sciclaw::Config& config) {
        return std::make_unique<sciclaw::RunRCodeTool>(
            std::make_unique<sciclaw::RExecutor>(config.r_sandbox, config.sessions_dir(),
                                                 config.r_libs_dir()),
            config.sessions_dir());
    });

namespace sciclaw {

std::string RunRCodeTool::description() const {
    return "Run R code through Rscript in a sandbox. Variables: datasets (named list of "
           "data.frames) and df (when dataset_name is given). Assign result for a return "
           "value or output_df for a table. Base graphics and ggplot objects are saved as "
           "chart artifacts. Packages named in library() calls are installed on demand.";
}

} // namespace sciclaw
