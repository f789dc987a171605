#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace sciclaw {

const std::vector<std::string> kDefaultProviderOrder = {
    "openai", "anthropic", "moonshot", "kimi_coding",
    "zhipu", "deepseek", "dashscope", "ollama"
};

nlohmann::json Config::defaults_json() {
    return {
        {"data_dir", "~/.sciclaw/data"},
        {"llm", {
            {"temperature", 0.3},
            {"max_tokens", 4096},
            {"request_timeout", 300},
            {"preferred_provider", ""}
        }},
        {"provider_order", kDefaultProviderOrder},
        {"providers", {
            {"openai", {{"api_key", ""}, {"base_url", "https://api.openai.com/v1"}, {"model", "gpt-4o"}}},
            {"anthropic", {{"api_key", ""}, {"base_url", "https://api.anthropic.com"}, {"model", "claude-sonnet-4-20250514"}}},
            {"moonshot", {{"api_key", ""}, {"base_url", "https://api.moonshot.cn/v1"}, {"model", "moonshot-v1-8k"}}},
            {"kimi_coding", {{"api_key", ""}, {"base_url", "https://api.kimi.com/coding/v1"}, {"model", "kimi-for-coding"}}},
            {"zhipu", {{"api_key", ""}, {"base_url", "https://open.bigmodel.cn/api/coding/paas/v4"}, {"model", "glm-4"}}},
            {"deepseek", {{"api_key", ""}, {"base_url", "https://api.deepseek.com/v1"}, {"model", "deepseek-chat"}}},
            {"dashscope", {{"api_key", ""}, {"base_url", "https://dashscope.aliyuncs.com/compatible-mode/v1"}, {"model", "qwen-plus"}}},
            {"ollama", {{"base_url", "http://localhost:11434"}, {"model", "qwen2.5:7b"}}}
        }},
        {"purposes", nlohmann::json::object()},
        {"agent", {
            {"max_iterations", 20},
            {"auto_compress_enabled", true},
            {"auto_compress_threshold_tokens", 30000},
            {"compressed_context_max_chars", 6000},
            {"compress_ratio", 0.5},
            {"compress_min_messages", 4},
            {"knowledge_dir", ""},
            {"knowledge_max_entries", 3},
            {"knowledge_max_chars", 3000},
            {"system_prompt", ""}
        }},
        {"sandbox", {
            {"timeout", 30},
            {"max_memory_mb", 512},
            {"python", "python3"}
        }},
        {"r_sandbox", {
            {"timeout", 120},
            {"max_memory_mb", 2048},
            {"package_install_timeout", 600},
            {"auto_install_packages", true},
            {"rscript", "Rscript"},
            {"cran_mirror", "https://cloud.r-project.org"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string())
        out = j[key].get<std::string>();
}

static void read_uint(const nlohmann::json& j, const char* key, uint32_t& out) {
    if (j.contains(key) && j[key].is_number_unsigned())
        out = j[key].get<uint32_t>();
}

static void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (j.contains(key) && j[key].is_boolean())
        out = j[key].get<bool>();
}

static void read_double(const nlohmann::json& j, const char* key, double& out) {
    if (j.contains(key) && j[key].is_number())
        out = j[key].get<double>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    read_string(j, "data_dir", cfg.data_dir);

    if (j.contains("llm") && j["llm"].is_object()) {
        auto& l = j["llm"];
        read_double(l, "temperature", cfg.llm.temperature);
        read_uint(l, "max_tokens", cfg.llm.max_tokens);
        read_uint(l, "request_timeout", cfg.llm.request_timeout);
        read_string(l, "preferred_provider", cfg.llm.preferred_provider);
    }

    if (j.contains("provider_order") && j["provider_order"].is_array()) {
        cfg.provider_order.clear();
        for (const auto& id : j["provider_order"]) {
            if (id.is_string()) cfg.provider_order.push_back(id.get<std::string>());
        }
    }

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            read_string(obj, "api_key", entry.api_key);
            read_string(obj, "base_url", entry.base_url);
            read_string(obj, "model", entry.model);
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("purposes") && j["purposes"].is_object()) {
        for (auto& [purpose, obj] : j["purposes"].items()) {
            if (!obj.is_object()) continue;
            PurposeRoute route;
            read_string(obj, "provider_id", route.provider_id);
            read_string(obj, "model", route.model);
            read_string(obj, "base_url", route.base_url);
            if (!route.provider_id.empty())
                cfg.purposes[purpose] = std::move(route);
        }
    }

    if (j.contains("agent") && j["agent"].is_object()) {
        auto& a = j["agent"];
        read_uint(a, "max_iterations", cfg.agent.max_iterations);
        read_bool(a, "auto_compress_enabled", cfg.agent.auto_compress_enabled);
        read_uint(a, "auto_compress_threshold_tokens", cfg.agent.auto_compress_threshold_tokens);
        read_uint(a, "compressed_context_max_chars", cfg.agent.compressed_context_max_chars);
        read_double(a, "compress_ratio", cfg.agent.compress_ratio);
        read_uint(a, "compress_min_messages", cfg.agent.compress_min_messages);
        read_string(a, "knowledge_dir", cfg.agent.knowledge_dir);
        read_uint(a, "knowledge_max_entries", cfg.agent.knowledge_max_entries);
        read_uint(a, "knowledge_max_chars", cfg.agent.knowledge_max_chars);
        read_string(a, "system_prompt", cfg.agent.system_prompt);
    }

    if (j.contains("sandbox") && j["sandbox"].is_object()) {
        auto& s = j["sandbox"];
        read_uint(s, "timeout", cfg.sandbox.timeout);
        read_uint(s, "max_memory_mb", cfg.sandbox.max_memory_mb);
        read_string(s, "python", cfg.sandbox.python);
    }

    if (j.contains("r_sandbox") && j["r_sandbox"].is_object()) {
        auto& r = j["r_sandbox"];
        read_uint(r, "timeout", cfg.r_sandbox.timeout);
        read_uint(r, "max_memory_mb", cfg.r_sandbox.max_memory_mb);
        read_uint(r, "package_install_timeout", cfg.r_sandbox.package_install_timeout);
        read_bool(r, "auto_install_packages", cfg.r_sandbox.auto_install_packages);
        read_string(r, "rscript", cfg.r_sandbox.rscript);
        read_string(r, "cran_mirror", cfg.r_sandbox.cran_mirror);
    }

    return cfg;
}

void Config::apply_env_overrides() {
    static const std::pair<const char*, const char*> key_vars[] = {
        {"OPENAI_API_KEY", "openai"},
        {"ANTHROPIC_API_KEY", "anthropic"},
        {"MOONSHOT_API_KEY", "moonshot"},
        {"KIMI_CODING_API_KEY", "kimi_coding"},
        {"ZHIPU_API_KEY", "zhipu"},
        {"DEEPSEEK_API_KEY", "deepseek"},
        {"DASHSCOPE_API_KEY", "dashscope"},
    };
    for (const auto& [var, provider] : key_vars) {
        if (const char* v = std::getenv(var))
            providers[provider].api_key = v;
    }
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        providers["ollama"].base_url = v;
    if (const char* v = std::getenv("SCICLAW_PROVIDER"))
        llm.preferred_provider = v;
    if (const char* v = std::getenv("SCICLAW_DATA_DIR"))
        data_dir = v;
}

Config Config::load() {
    return load_from(expand_home("~/.sciclaw/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        } catch (const std::runtime_error& e) {
            std::cerr << "[config] " << e.what() << "\n";
        }
    } else {
        j = defaults_json();
        try {
            atomic_write_file(config_path, j.dump(4) + "\n");
            std::cerr << "[config] Created default config: " << config_path << "\n";
        } catch (const std::runtime_error& e) {
            std::cerr << "[config] " << e.what() << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

ProviderEntry Config::provider_entry(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second;
    return {};
}

std::string Config::sessions_dir() const {
    return expand_home(data_dir) + "/sessions";
}

std::string Config::r_libs_dir() const {
    return expand_home(data_dir) + "/r_libs";
}

} // namespace sciclaw
