#pragma once
#include "openai.hpp"
#include <string>

namespace sciclaw {

// Vendors speaking the OpenAI chat-completions protocol at their own base URL.

class MoonshotProvider : public OpenAIProvider {
public:
    MoonshotProvider(const ProviderEntry& entry, HttpClient& http);

    std::string provider_id() const override { return "moonshot"; }
    std::string display_name() const override { return "Moonshot AI (Kimi)"; }

protected:
    bool include_stream_usage() const override { return false; }
    // k2.5 models only accept temperature 1
    double effective_temperature(double requested) const override;
};

class KimiCodingProvider : public OpenAIProvider {
public:
    KimiCodingProvider(const ProviderEntry& entry, HttpClient& http);

    std::string provider_id() const override { return "kimi_coding"; }
    std::string display_name() const override { return "Kimi Coding"; }

protected:
    std::vector<Header> build_headers() const override;
    bool include_stream_usage() const override { return false; }
};

class ZhipuProvider : public OpenAIProvider {
public:
    ZhipuProvider(const ProviderEntry& entry, HttpClient& http);

    std::string provider_id() const override { return "zhipu"; }
    std::string display_name() const override { return "Zhipu AI (GLM)"; }

protected:
    bool include_stream_usage() const override { return false; }
};

class DeepSeekProvider : public OpenAIProvider {
public:
    DeepSeekProvider(const ProviderEntry& entry, HttpClient& http);

    std::string provider_id() const override { return "deepseek"; }
    std::string display_name() const override { return "DeepSeek"; }
};

class DashScopeProvider : public OpenAIProvider {
public:
    DashScopeProvider(const ProviderEntry& entry, HttpClient& http);

    std::string provider_id() const override { return "dashscope"; }
    std::string display_name() const override { return "Alibaba DashScope (Qwen)"; }
};

} // namespace sciclaw
