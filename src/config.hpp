#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace sciclaw {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
    std::string model;
};

// Override of the default backend for a named sub-task ("chat", "title_generation", ...)
struct PurposeRoute {
    std::string provider_id;
    std::string model;     // empty = provider's configured model
    std::string base_url;  // empty = provider's configured base URL
};

struct LlmConfig {
    double temperature = 0.3;
    uint32_t max_tokens = 4096;
    uint32_t request_timeout = 300;
    std::string preferred_provider;
};

struct AgentConfig {
    uint32_t max_iterations = 20;  // 0 = unbounded
    bool auto_compress_enabled = true;
    uint32_t auto_compress_threshold_tokens = 30000;
    uint32_t compressed_context_max_chars = 6000;
    double compress_ratio = 0.5;
    uint32_t compress_min_messages = 4;
    std::string knowledge_dir;
    uint32_t knowledge_max_entries = 3;
    uint32_t knowledge_max_chars = 3000;
    std::string system_prompt;  // empty = built-in prompt
};

struct SandboxConfig {
    uint32_t timeout = 30;
    uint32_t max_memory_mb = 512;
    std::string python = "python3";
};

struct RSandboxConfig {
    uint32_t timeout = 120;
    uint32_t max_memory_mb = 2048;
    uint32_t package_install_timeout = 600;
    bool auto_install_packages = true;
    std::string rscript = "Rscript";
    std::string cran_mirror = "https://cloud.r-project.org";
};

// Canonical failover order
extern const std::vector<std::string> kDefaultProviderOrder;

struct Config {
    std::string data_dir = "~/.sciclaw/data";
    LlmConfig llm;
    std::vector<std::string> provider_order = kDefaultProviderOrder;
    std::unordered_map<std::string, ProviderEntry> providers;
    std::unordered_map<std::string, PurposeRoute> purposes;
    AgentConfig agent;
    SandboxConfig sandbox;
    RSandboxConfig r_sandbox;

    // Load from ~/.sciclaw/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults if missing) + env vars
    static Config load_from(const std::string& path);

    // Parse an already merged JSON document (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Environment variables always override the file
    void apply_env_overrides();

    std::string api_key_for(const std::string& provider) const;
    std::string base_url_for(const std::string& provider) const;
    ProviderEntry provider_entry(const std::string& provider) const;

    // <data_dir>/sessions, <data_dir>/r_libs (expanded)
    std::string sessions_dir() const;
    std::string r_libs_dir() const;
};

} // namespace sciclaw
