#pragma once
#include <set>
#include <string>

namespace sciclaw {

const std::set<std::string>& allowed_r_packages();
const std::set<std::string>& banned_r_calls();

// Line with its trailing # comment removed (quotes respected)
std::string strip_r_comment(const std::string& line);

// Packages named in library()/require()/requireNamespace() calls or pkg:: prefixes
std::set<std::string> extract_r_packages(const std::string& code);

// Throws SandboxPolicyError describing the first violation and its line.
void validate_r_code(const std::string& code);

} // namespace sciclaw
