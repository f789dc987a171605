#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include "../config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sciclaw {

class AnthropicProvider : public ProviderClient {
public:
    AnthropicProvider(const ProviderEntry& entry, HttpClient& http);

    void stream_chat(const std::vector<ChatMessage>& messages,
                     const std::vector<ToolSpec>& tools,
                     const ChatOptions& options,
                     const ChunkCallback& on_chunk) override;

    bool is_available() const override { return !api_key_.empty() && !model_.empty(); }
    std::string provider_id() const override { return "anthropic"; }
    std::string display_name() const override { return "Anthropic Claude"; }
    std::string model() const override { return model_; }

    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const std::vector<ToolSpec>& tools,
                                 const ChatOptions& options) const;

private:
    static bool is_retryable(long status_code);
    static void backoff_sleep(uint32_t attempt);

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    std::string model_;
    static constexpr const char* API_VERSION = "2023-06-01";
    static constexpr uint32_t MAX_RETRIES = 2;
    static constexpr double INITIAL_DELAY_S = 0.5;
    static constexpr double MAX_DELAY_S = 8.0;
};

} // namespace sciclaw
