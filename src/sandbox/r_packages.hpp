#pragma once
#include "process.hpp"
#include "../config.hpp"
#include <set>
#include <string>

namespace sciclaw {

// Installed from Bioconductor through BiocManager rather than CRAN
const std::set<std::string>& bioconductor_packages();

// Packages every R run needs regardless of user code
const std::set<std::string>& bootstrap_r_packages();

// Environment for every Rscript launch: no user profile, private library first.
EnvOverrides r_environment(const std::string& r_libs_dir);

// Checks and installs packages into the private R library.
class RPackageManager {
public:
    RPackageManager(RSandboxConfig config, std::string rscript, std::string r_libs_dir);

    // Subset of packages that cannot be loaded. A failed check reports all of them.
    std::set<std::string> missing(const std::set<std::string>& packages) const;

    struct InstallResult {
        bool ok = false;
        std::string log;
    };
    InstallResult install(const std::set<std::string>& packages) const;

    // R expression for a character vector literal: c("a", "b")
    static std::string r_string_vector(const std::set<std::string>& values);

private:
    RSandboxConfig config_;
    std::string rscript_;
    std::string r_libs_dir_;
};

} // namespace sciclaw
