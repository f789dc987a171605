#include "ollama.hpp"
#include "../plugin.hpp"

static sciclaw::ProviderRegistrar reg_ollama("ollama",
    [](const sciclaw::ProviderEntry& entry, sciclaw::HttpClient& http) {
        return std::make_unique<sciclaw::OllamaProvider>(entry, http);
    });

namespace sciclaw {

static std::string strip_v1(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (url.size() >= 3 && url.compare(url.size() - 3, 3, "/v1") == 0) {
        url.erase(url.size() - 3);
    }
    return url;
}

static ProviderEntry ollama_entry(const ProviderEntry& entry) {
    ProviderEntry adjusted = entry;
    adjusted.base_url = strip_v1(entry.base_url);
    return adjusted;
}

OllamaProvider::OllamaProvider(const ProviderEntry& entry, HttpClient& http)
    : OpenAIProvider(ollama_entry(entry), http, "http://localhost:11434", "qwen2.5:7b") {}

} // namespace sciclaw
