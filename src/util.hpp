#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace sciclaw {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// Filename-safe timestamp: 20250101_120000
std::string compact_timestamp();

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// ASCII lowercase
std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Generate a simple unique ID (16 hex chars)
std::string generate_id();

// Estimate token count from text (~4 chars per token)
uint32_t estimate_tokens(const std::string& text);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Cut to at most max_bytes without splitting a UTF-8 sequence.
std::string utf8_truncate(const std::string& s, size_t max_bytes);

// Write via temp file + rename. Throws std::runtime_error on failure.
void atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file. Throws std::runtime_error if it cannot be opened.
std::string read_file(const std::string& path);

// Standard base64 (RFC 4648); decode skips whitespace and stops at '='.
std::string base64_encode(const std::string& data);
std::string base64_decode(const std::string& data);

} // namespace sciclaw
