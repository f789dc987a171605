#include "compatible.hpp"
#include "../plugin.hpp"

static sciclaw::ProviderRegistrar reg_moonshot("moonshot",
    [](const sciclaw::ProviderEntry& entry, sciclaw::HttpClient& http) {
        return std::make_unique<sciclaw::MoonshotProvider>(entry, http);
    });

static sciclaw::ProviderRegistrar reg_kimi_coding("kimi_coding",
    [](const sciclaw::ProviderEntry& entry, sciclaw::HttpClient& http) {
        return std::make_unique<sciclaw::KimiCodingProvider>(entry, http);
    });

static sciclaw::ProviderRegistrar reg_zhipu("zhipu",
    [](const sciclaw::ProviderEntry& entry, sciclaw::HttpClient& http) {
        return std::make_unique<sciclaw::ZhipuProvider>(entry, http);
    });

static sciclaw::ProviderRegistrar reg_deepseek("deepseek",
    [](const sciclaw::ProviderEntry& entry, sciclaw::HttpClient& http) {
        return std::make_unique<sciclaw::DeepSeekProvider>(entry, http);
    });

static sciclaw::ProviderRegistrar reg_dashscope("dashscope",
    [](const sciclaw::ProviderEntry& entry, sciclaw::HttpClient& http) {
        return std::make_unique<sciclaw::DashScopeProvider>(entry, http);
    });

namespace sciclaw {

MoonshotProvider::MoonshotProvider(const ProviderEntry& entry, HttpClient& http)
    : OpenAIProvider(entry, http, "https://api.moonshot.cn/v1", "moonshot-v1-8k") {}

double MoonshotProvider::effective_temperature(double requested) const {
    if (model_.find("k2.5") != std::string::npos) return 1.0;
    return requested;
}

KimiCodingProvider::KimiCodingProvider(const ProviderEntry& entry, HttpClient& http)
    : OpenAIProvider(entry, http, "https://api.kimi.com/coding/v1", "kimi-for-coding") {}

std::vector<Header> KimiCodingProvider::build_headers() const {
    auto headers = OpenAIProvider::build_headers();
    headers.emplace_back("User-Agent", "sciclaw/1.0");
    headers.emplace_back("X-Title", "sciclaw");
    return headers;
}

ZhipuProvider::ZhipuProvider(const ProviderEntry& entry, HttpClient& http)
    : OpenAIProvider(entry, http, "https://open.bigmodel.cn/api/coding/paas/v4", "glm-4") {}

DeepSeekProvider::DeepSeekProvider(const ProviderEntry& entry, HttpClient& http)
    : OpenAIProvider(entry, http, "https://api.deepseek.com/v1", "deepseek-chat") {}

DashScopeProvider::DashScopeProvider(const ProviderEntry& entry, HttpClient& http)
    : OpenAIProvider(entry, http, "https://dashscope.aliyuncs.com/compatible-mode/v1",
                     "qwen-plus") {}

} // namespace sciclaw
