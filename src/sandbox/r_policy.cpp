#include "r_policy.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <cctype>

namespace sciclaw {

const std::set<std::string>& allowed_r_packages() {
    static const std::set<std::string> packages = {
        // base and recommended
        "base", "utils", "stats", "graphics", "grDevices", "methods", "datasets",
        "grid", "splines", "parallel", "stats4", "tcltk",
        // data handling
        "dplyr", "tidyr", "tibble", "readr", "stringr", "forcats", "purrr",
        "data.table", "janitor", "lubridate", "zoo",
        // plotting
        "ggplot2", "scales", "patchwork", "cowplot", "ggpubr", "viridis", "plotly",
        // modelling
        "broom", "car", "lme4", "nlme", "emmeans", "survival", "forecast", "MASS", "mgcv",
        // bioinformatics
        "BiocManager", "Biobase", "BiocGenerics", "S4Vectors", "IRanges",
        "GenomicRanges", "SummarizedExperiment", "DESeq2", "edgeR", "limma",
        "clusterProfiler", "org.Hs.eg.db", "MetaCycle", "JTK_CYCLE",
        "ComplexHeatmap", "GSVA",
        // serialization
        "jsonlite",
    };
    return packages;
}

const std::set<std::string>& banned_r_calls() {
    static const std::set<std::string> calls = {
        "system", "system2", "shell", "shell.exec", "pipe",
        "file.remove", "file.rename", "file.copy", "unlink", "setwd",
        "download.file", "url", "curl", "browseURL",
        "eval", "parse", "source", "sys.source",
        "Sys.getenv", "Sys.setenv",
        "install.packages", "remove.packages",
        ".Internal", ".Call", ".External",
    };
    return calls;
}

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

// Position just past an identifier starting at pos
size_t read_identifier(const std::string& s, size_t pos) {
    while (pos < s.size() && is_name_char(s[pos])) ++pos;
    return pos;
}

// `name(` with no name character directly before it
bool calls_function(const std::string& line, const std::string& name) {
    size_t pos = 0;
    while ((pos = line.find(name, pos)) != std::string::npos) {
        bool bounded_left = pos == 0 || !is_name_char(line[pos - 1]);
        size_t after = pos + name.size();
        bool bounded_right = after >= line.size() || !is_name_char(line[after]);
        if (bounded_left && bounded_right) {
            while (after < line.size() && std::isspace(static_cast<unsigned char>(line[after]))) {
                ++after;
            }
            if (after < line.size() && line[after] == '(') return true;
        }
        pos += name.size();
    }
    return false;
}

void scan_packages(const std::string& line, std::set<std::string>& out) {
    std::string lower = to_lower(line);
    for (const char* fn : {"requirenamespace", "library", "require"}) {
        std::string name = fn;
        size_t pos = 0;
        while ((pos = lower.find(name, pos)) != std::string::npos) {
            size_t p = pos + name.size();
            bool bounded = (pos == 0 || !is_name_char(lower[pos - 1])) &&
                           (p >= lower.size() || !is_name_char(lower[p]));
            pos = p;
            if (!bounded) continue;
            while (p < line.size() && std::isspace(static_cast<unsigned char>(line[p]))) ++p;
            if (p >= line.size() || line[p] != '(') continue;
            ++p;
            while (p < line.size() && std::isspace(static_cast<unsigned char>(line[p]))) ++p;
            if (p < line.size() && (line[p] == '"' || line[p] == '\'')) ++p;
            if (p >= line.size() || !is_identifier_start(line[p])) continue;
            size_t end = read_identifier(line, p);
            out.insert(line.substr(p, end - p));
        }
    }

    // pkg::fn and pkg:::fn
    size_t pos = 0;
    while ((pos = line.find("::", pos)) != std::string::npos) {
        size_t start = pos;
        while (start > 0 && is_name_char(line[start - 1])) --start;
        if (start < pos && is_identifier_start(line[start])) {
            out.insert(line.substr(start, pos - start));
        }
        pos += 2;
        if (pos < line.size() && line[pos] == ':') ++pos;
    }
}

} // namespace

std::string strip_r_comment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::set<std::string> extract_r_packages(const std::string& code) {
    std::set<std::string> packages;
    for (const auto& raw : split(code, '\n')) {
        scan_packages(strip_r_comment(raw), packages);
    }
    return packages;
}

void validate_r_code(const std::string& code) {
    int lineno = 0;
    for (const auto& raw : split(code, '\n')) {
        ++lineno;
        std::string line = strip_r_comment(raw);
        if (trim(line).empty()) continue;

        for (const auto& name : banned_r_calls()) {
            if (calls_function(line, name)) {
                throw SandboxPolicyError("call to " + name + " is not allowed (line " +
                                         std::to_string(lineno) + ")");
            }
        }

        std::set<std::string> packages;
        scan_packages(line, packages);
        for (const auto& pkg : packages) {
            if (allowed_r_packages().count(pkg) == 0) {
                throw SandboxPolicyError("R package " + pkg + " is not allowed (line " +
                                         std::to_string(lineno) + ")");
            }
        }
    }
}

} // namespace sciclaw
