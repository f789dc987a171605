#include "r_executor.hpp"
#include "process.hpp"
#include "r_packages.hpp"
#include "r_policy.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include "../workspace.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace sciclaw {

namespace {

constexpr uint64_t kMemoryFloorMb = 256;
constexpr size_t kStderrTail = 4000;

std::string quote_r(const std::string& s) {
    return nlohmann::json(s).dump();
}

std::string random_hex8() {
    std::random_device rd;
    std::ostringstream out;
    out << std::hex;
    for (int i = 0; i < 8; ++i) out << (rd() & 0xF);
    return out.str();
}

std::string dataset_stem(const std::string& name) {
    std::string stem = fs::path(name).stem().string();
    return Workspace::sanitize_filename(stem.empty() ? name : stem, "dataset");
}

std::string tail(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    return text.substr(text.size() - max_bytes);
}

const char* kWrapperTemplate = R"R(options(stringsAsFactors = FALSE, warn = 1)
.sciclaw <- new.env()
local({
  lib <- Sys.getenv("R_LIBS_USER")
  if (nzchar(lib)) {
    dir.create(lib, recursive = TRUE, showWarnings = FALSE)
    .libPaths(c(lib, .libPaths()))
  }
})
suppressPackageStartupMessages(library(jsonlite))

.sciclaw$plots_dir <- file.path(getwd(), "plots")
dir.create(.sciclaw$plots_dir, recursive = TRUE, showWarnings = FALSE)

datasets <- list()
local({
  manifest <- jsonlite::fromJSON(@MANIFEST@, simplifyVector = FALSE)
  for (entry in manifest) {
    datasets[[entry$name]] <<- utils::read.csv(entry$path, check.names = FALSE,
                                               stringsAsFactors = FALSE, na.strings = "NA")
  }
})
.sciclaw$active <- @ACTIVE@
if (nzchar(.sciclaw$active) && .sciclaw$active %in% names(datasets)) {
  df <- datasets[[.sciclaw$active]]
}

.sciclaw$plotted <- FALSE
setHook("plot.new", function() .sciclaw$plotted <- TRUE)
setHook("grid.newpage", function() .sciclaw$plotted <- TRUE)
.sciclaw$base_plot <- file.path(.sciclaw$plots_dir, "base_plots.pdf")
grDevices::pdf(.sciclaw$base_plot)

.sciclaw$error <- NULL
tryCatch({
  .sciclaw$code <- paste(readLines(@USER_CODE@, warn = FALSE, encoding = "UTF-8"), collapse = "\n")
  eval(parse(text = .sciclaw$code), envir = globalenv())
}, error = function(e) {
  .sciclaw$error <- conditionMessage(e)
})

try(grDevices::dev.off(), silent = TRUE)
if (!.sciclaw$plotted) unlink(.sciclaw$base_plot)

if (!is.null(.sciclaw$error)) {
  writeLines(paste0('{"success":false,"error":',
                    jsonlite::toJSON(jsonlite::unbox(.sciclaw$error)), '}'),
             "_result.json", useBytes = TRUE)
  quit(save = "no", status = 1)
}

local({
  i <- 0
  for (nm in ls(globalenv())) {
    obj <- get(nm, envir = globalenv())
    if (inherits(obj, "ggplot")) {
      i <- i + 1
      stem <- file.path(.sciclaw$plots_dir, sprintf("%02d_%s", i, make.names(nm)))
      try(ggplot2::ggsave(paste0(stem, ".png"), obj, width = 7, height = 5, dpi = 150), silent = TRUE)
      try(ggplot2::ggsave(paste0(stem, ".pdf"), obj, width = 7, height = 5), silent = TRUE)
    }
  }
})

if (@PERSIST@) {
  if (exists("df", envir = globalenv(), inherits = FALSE) && is.data.frame(df) &&
      nzchar(.sciclaw$active)) {
    datasets[[.sciclaw$active]] <- df
  }
  local({
    dir.create("dataset_updates", showWarnings = FALSE)
    updates <- list()
    for (nm in names(datasets)) {
      if (!is.data.frame(datasets[[nm]])) next
      path <- file.path(getwd(), "dataset_updates", sprintf("%03d.csv", length(updates) + 1))
      utils::write.csv(datasets[[nm]], path, row.names = FALSE, na = "NA")
      updates[[nm]] <- path
    }
    jsonlite::write_json(updates, "_datasets.json", auto_unbox = TRUE)
  })
}

.sciclaw$envelope <- function(x) {
  if (is.null(x)) return('{"kind":"none"}')
  if (is.data.frame(x)) {
    utils::write.csv(x, "_result_df.csv", row.names = FALSE, na = "NA")
    return('{"kind":"table"}')
  }
  if (!is.object(x) || is.factor(x)) {
    if (is.factor(x)) x <- as.character(x)
    txt <- tryCatch(as.character(jsonlite::toJSON(x, auto_unbox = TRUE, null = "null",
                                                  na = "null", digits = NA)),
                    error = function(e) NULL)
    if (!is.null(txt)) return(paste0('{"kind":"scalar","value":', txt, '}'))
  }
  repr <- paste(utils::capture.output(print(x)), collapse = "\n")
  paste0('{"kind":"opaque","repr":',
         jsonlite::toJSON(jsonlite::unbox(substr(repr, 1, 20000))), '}')
}

if (exists("output_df", envir = globalenv(), inherits = FALSE) && is.data.frame(output_df)) {
  utils::write.csv(output_df, "_output_df.csv", row.names = FALSE, na = "NA")
}
.sciclaw$result <- if (exists("result", envir = globalenv(), inherits = FALSE)) {
  get("result", envir = globalenv())
} else {
  NULL
}
writeLines(paste0('{"success":true,"result":', .sciclaw$envelope(.sciclaw$result), '}'),
           "_result.json", useBytes = TRUE)
)R";

} // namespace

RExecutor::RExecutor(RSandboxConfig config, std::string sessions_dir, std::string r_libs_dir)
    : config_(std::move(config)),
      sessions_dir_(expand_home(sessions_dir)),
      r_libs_dir_(expand_home(r_libs_dir)) {}

std::string RExecutor::last_run_dir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_run_dir_;
}

std::string RExecutor::make_run_dir(const std::string& session_id) const {
    std::string dir = sessions_dir_ + "/" + Workspace::sanitize_filename(session_id, "session") +
                      "/r_sandbox_tmp/run_" + std::to_string(epoch_seconds()) + "_" + random_hex8();
    std::error_code ec;
    fs::create_directories(dir + "/plots", ec);
    if (ec) throw std::runtime_error("Failed to create " + dir + ": " + ec.message());
    return dir;
}

nlohmann::json RExecutor::write_datasets(const std::map<std::string, Dataset>& datasets,
                                         const std::string& run_dir) {
    std::string dir = run_dir + "/datasets";
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw std::runtime_error("Failed to create " + dir + ": " + ec.message());

    nlohmann::json manifest = nlohmann::json::array();
    int index = 0;
    for (const auto& [name, ds] : datasets) {
        char prefix[8];
        std::snprintf(prefix, sizeof(prefix), "%03d", ++index);
        std::string path = dir + "/" + prefix + "_" + dataset_stem(name) + ".csv";
        write_csv(ds, path);
        manifest.push_back({{"name", name}, {"path", path}});
    }
    return manifest;
}

std::string RExecutor::build_wrapper_script(const std::string& manifest_path,
                                            const std::string& user_code_path,
                                            const std::string& active_dataset,
                                            bool persist) {
    std::string script = kWrapperTemplate;
    script = replace_all(script, "@MANIFEST@", quote_r(manifest_path));
    script = replace_all(script, "@USER_CODE@", quote_r(user_code_path));
    script = replace_all(script, "@ACTIVE@", quote_r(active_dataset));
    script = replace_all(script, "@PERSIST@", persist ? "TRUE" : "FALSE");
    return script;
}

SandboxResult RExecutor::execute(const SandboxRequest& request) {
    try {
        validate_r_code(request.code);
    } catch (const SandboxPolicyError& e) {
        return SandboxResult::failure(SandboxErrorKind::Policy, e.what());
    }

    std::string rscript = find_executable(config_.rscript);
    if (rscript.empty()) {
        return SandboxResult::failure(SandboxErrorKind::Configuration,
                                      "Rscript not found: " + config_.rscript +
                                      " (install R or set r_sandbox.rscript)");
    }

    std::string run_dir;
    try {
        run_dir = make_run_dir(request.session_id);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_run_dir_ = run_dir;
        }

        nlohmann::json manifest = write_datasets(request.datasets, run_dir);
        std::string manifest_path = run_dir + "/_datasets_manifest.json";
        atomic_write_file(manifest_path, manifest.dump(2));
        std::string user_code_path = run_dir + "/user_code.R";
        atomic_write_file(user_code_path, request.code);
        atomic_write_file(run_dir + "/_wrapper.R",
                          build_wrapper_script(manifest_path, user_code_path,
                                               request.active_dataset.value_or(""),
                                               request.persist));
    } catch (const std::exception& e) {
        return SandboxResult::failure(SandboxErrorKind::Crash,
                                      std::string("R sandbox setup failed: ") + e.what());
    }

    RPackageManager packages(config_, rscript, r_libs_dir_);
    std::set<std::string> wanted = extract_r_packages(request.code);
    wanted.insert(bootstrap_r_packages().begin(), bootstrap_r_packages().end());
    std::set<std::string> missing = packages.missing(wanted);
    if (!missing.empty()) {
        std::string names;
        for (const auto& m : missing) names += (names.empty() ? "" : ", ") + m;
        if (!config_.auto_install_packages) {
            return SandboxResult::failure(SandboxErrorKind::Dependency,
                                          "missing R packages: " + names);
        }
        auto installed = packages.install(missing);
        if (!installed.ok) {
            std::cerr << "[r_sandbox] Package installation failed: " << names << "\n";
            SandboxResult r = SandboxResult::failure(SandboxErrorKind::Dependency,
                                                     "R package installation failed: " + names);
            r.stderr_text = tail(installed.log, kStderrTail);
            return r;
        }
    }

    ProcessLimits limits;
    limits.memory_bytes = std::max<uint64_t>(config_.max_memory_mb, kMemoryFloorMb) * 1024 * 1024;

    ProcessOutput out;
    try {
        out = run_process({rscript, "--vanilla", "_wrapper.R"}, run_dir,
                          r_environment(r_libs_dir_), config_.timeout, limits);
    } catch (const SandboxCrashError& e) {
        return SandboxResult::failure(SandboxErrorKind::Crash, e.what());
    }

    if (out.timed_out) {
        std::cerr << "[r_sandbox] Rscript killed after " << config_.timeout << "s timeout\n";
        SandboxResult r = SandboxResult::failure(
            SandboxErrorKind::Timeout,
            "R code execution timed out (>" + std::to_string(config_.timeout) + "s)");
        r.stdout_text = out.stdout_text;
        r.stderr_text = tail(out.stderr_text, kStderrTail);
        return r;
    }

    SandboxResult result = collect_outputs(run_dir, request.persist);
    result.stdout_text = out.stdout_text;
    result.stderr_text = out.stderr_text;
    if (!result.success) {
        if (result.error_kind == SandboxErrorKind::None) result.error_kind = SandboxErrorKind::Code;
        if (result.error.empty()) {
            std::string err = trim(tail(out.stderr_text, kStderrTail));
            if (!err.empty()) {
                result.error = err;
            } else if (out.term_signal != 0) {
                result.error = "Rscript terminated by signal " + std::to_string(out.term_signal);
                result.error_kind = SandboxErrorKind::Crash;
            } else {
                result.error = "R code execution failed (exit code " +
                               std::to_string(out.exit_code) + ")";
            }
        }
    } else if (!out.ok()) {
        // Exit status wins over a stale success file
        result.success = false;
        result.error_kind = SandboxErrorKind::Code;
        result.error = trim(tail(out.stderr_text, kStderrTail));
        if (result.error.empty()) result.error = "R code execution failed";
    }
    return result;
}

SandboxResult RExecutor::collect_outputs(const std::string& run_dir, bool persist) {
    SandboxResult result;
    std::string result_path = run_dir + "/_result.json";
    if (!fs::exists(result_path)) {
        result.error_kind = SandboxErrorKind::Crash;
        result.error = "R process finished without writing a result";
        return result;
    }

    nlohmann::json envelope;
    try {
        envelope = nlohmann::json::parse(read_file(result_path));
    } catch (const std::exception& e) {
        result.error_kind = SandboxErrorKind::Crash;
        result.error = std::string("unreadable R result: ") + e.what();
        return result;
    }
    if (!envelope.is_object()) {
        result.error_kind = SandboxErrorKind::Crash;
        result.error = "unreadable R result";
        return result;
    }

    result.success = envelope.value("success", false);
    if (!result.success) {
        result.error_kind = SandboxErrorKind::Code;
        if (envelope.contains("error") && envelope["error"].is_string()) {
            result.error = envelope["error"].get<std::string>();
        }
        return result;
    }

    if (envelope.contains("result") && envelope["result"].is_object()) {
        const auto& r = envelope["result"];
        if (r.value("kind", "") == "table") {
            std::string table_path = run_dir + "/_result_df.csv";
            if (fs::exists(table_path)) result.result = ResultValue::of_table(read_csv(table_path));
        } else {
            result.result = ResultValue::from_envelope(r);
        }
    }
    std::string output_df = run_dir + "/_output_df.csv";
    if (fs::exists(output_df)) result.result = ResultValue::of_table(read_csv(output_df));

    if (persist) {
        std::string updates_path = run_dir + "/_datasets.json";
        if (fs::exists(updates_path)) {
            try {
                auto updates = nlohmann::json::parse(read_file(updates_path));
                if (updates.is_object()) {
                    for (auto& [name, path] : updates.items()) {
                        if (path.is_string()) {
                            result.updated_datasets[name] = read_csv(path.get<std::string>());
                        }
                    }
                }
            } catch (const std::exception& e) {
                std::cerr << "[r_sandbox] Dropping unreadable dataset updates: " << e.what() << "\n";
            }
        }
    }

    std::error_code ec;
    std::vector<fs::path> plots;
    for (const auto& entry : fs::directory_iterator(run_dir + "/plots", ec)) {
        if (entry.is_regular_file()) plots.push_back(entry.path());
    }
    std::sort(plots.begin(), plots.end());
    for (const auto& p : plots) {
        std::string ext = to_lower(p.extension().string());
        if (ext != ".pdf" && ext != ".png" && ext != ".svg" && ext != ".html") continue;
        Figure fig;
        fig.library = "r";
        fig.title = p.stem().string();
        fig.path = p.string();
        fig.format = ext.substr(1);
        result.figures.push_back(std::move(fig));
    }
    return result;
}

} // namespace sciclaw
