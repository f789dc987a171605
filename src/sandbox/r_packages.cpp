#include "r_packages.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace sciclaw {

namespace {

std::string quote_r(const std::string& s) {
    // JSON string escapes are valid R string escapes
    return nlohmann::json(s).dump();
}

std::string libpaths_prelude(const std::string& r_libs_dir) {
    return "lib <- " + quote_r(r_libs_dir) + "; "
           "dir.create(lib, recursive = TRUE, showWarnings = FALSE); "
           ".libPaths(c(lib, .libPaths())); ";
}

std::string join_names(const std::set<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // namespace

const std::set<std::string>& bioconductor_packages() {
    static const std::set<std::string> packages = {
        "Biobase", "BiocGenerics", "S4Vectors", "IRanges", "GenomicRanges",
        "SummarizedExperiment", "DESeq2", "edgeR", "limma", "clusterProfiler",
        "org.Hs.eg.db", "ComplexHeatmap", "GSVA",
    };
    return packages;
}

const std::set<std::string>& bootstrap_r_packages() {
    static const std::set<std::string> packages = {"jsonlite"};
    return packages;
}

EnvOverrides r_environment(const std::string& r_libs_dir) {
    return {
        {"R_PROFILE_USER", ""},
        {"R_ENVIRON_USER", ""},
        {"R_LIBS_USER", r_libs_dir},
        {"OPENBLAS_NUM_THREADS", "1"},
        {"OMP_NUM_THREADS", "1"},
    };
}

RPackageManager::RPackageManager(RSandboxConfig config, std::string rscript, std::string r_libs_dir)
    : config_(std::move(config)), rscript_(std::move(rscript)), r_libs_dir_(std::move(r_libs_dir)) {}

std::string RPackageManager::r_string_vector(const std::set<std::string>& values) {
    std::string out = "c(";
    bool first = true;
    for (const auto& v : values) {
        if (!first) out += ", ";
        out += quote_r(v);
        first = false;
    }
    return out + ")";
}

std::set<std::string> RPackageManager::missing(const std::set<std::string>& packages) const {
    std::set<std::string> result;
    if (packages.empty()) return result;

    // Base packages ship with R and never need installing
    static const std::set<std::string> base = {
        "base", "utils", "stats", "graphics", "grDevices", "methods", "datasets",
        "grid", "splines", "parallel", "stats4", "tcltk",
    };
    std::set<std::string> to_check;
    for (const auto& p : packages) {
        if (base.count(p) == 0) to_check.insert(p);
    }
    if (to_check.empty()) return result;

    std::string expr = libpaths_prelude(r_libs_dir_) +
                       "pkgs <- " + r_string_vector(to_check) + "; "
                       "for (p in pkgs) if (!requireNamespace(p, quietly = TRUE)) cat(p, \"\\n\", sep = \"\")";

    uint32_t timeout = std::max<uint32_t>(10, config_.timeout / 2);
    ProcessOutput out;
    try {
        out = run_process({rscript_, "--vanilla", "-e", expr}, ".", r_environment(r_libs_dir_),
                          timeout);
    } catch (const SandboxCrashError& e) {
        std::cerr << "[r_sandbox] Package check failed to start: " << e.what() << "\n";
        return to_check;
    }
    if (!out.ok()) {
        std::cerr << "[r_sandbox] Package check failed"
                  << (out.timed_out ? " (timed out)" : "") << "\n";
        return to_check;
    }
    for (const auto& line : split(out.stdout_text, '\n')) {
        std::string name = trim(line);
        if (!name.empty() && to_check.count(name) > 0) result.insert(name);
    }
    return result;
}

RPackageManager::InstallResult RPackageManager::install(const std::set<std::string>& packages) const {
    InstallResult result;
    if (packages.empty()) {
        result.ok = true;
        return result;
    }

    std::set<std::string> cran;
    std::set<std::string> bioc;
    for (const auto& p : packages) {
        if (bioconductor_packages().count(p) > 0) {
            bioc.insert(p);
        } else {
            cran.insert(p);
        }
    }
    if (!bioc.empty()) cran.insert("BiocManager");

    std::string expr = libpaths_prelude(r_libs_dir_) +
                       "options(repos = c(CRAN = " + quote_r(config_.cran_mirror) + ")); ";
    if (!cran.empty()) {
        expr += "cran <- " + r_string_vector(cran) + "; "
                "cran <- cran[!vapply(cran, requireNamespace, logical(1), quietly = TRUE)]; "
                "if (length(cran) > 0) install.packages(cran, lib = lib, quiet = TRUE); ";
    }
    if (!bioc.empty()) {
        expr += "BiocManager::install(" + r_string_vector(bioc) +
                ", lib = lib, update = FALSE, ask = FALSE); ";
    }
    expr += "pkgs <- " + r_string_vector(packages) + "; "
            "bad <- pkgs[!vapply(pkgs, requireNamespace, logical(1), quietly = TRUE)]; "
            "if (length(bad) > 0) { cat(\"missing after install:\", bad, \"\\n\"); quit(status = 2) }";

    std::error_code ec;
    std::filesystem::create_directories(r_libs_dir_, ec);

    std::cerr << "[r_sandbox] Installing R packages: " << join_names(packages) << "\n";
    ProcessOutput out;
    try {
        out = run_process({rscript_, "--vanilla", "-e", expr}, ".", r_environment(r_libs_dir_),
                          config_.package_install_timeout);
    } catch (const SandboxCrashError& e) {
        result.log = e.what();
        return result;
    }
    result.log = out.stdout_text + out.stderr_text;
    if (out.timed_out) {
        result.log += "\npackage installation timed out (>" +
                      std::to_string(config_.package_install_timeout) + "s)";
    }
    result.ok = out.ok();
    return result;
}

} // namespace sciclaw
