#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include "../config.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sciclaw {

// Streaming client for the OpenAI chat-completions protocol. Vendors that
// speak the same protocol derive from it and adjust the hooks below.
class OpenAIProvider : public ProviderClient {
public:
    OpenAIProvider(const ProviderEntry& entry, HttpClient& http);

    void stream_chat(const std::vector<ChatMessage>& messages,
                     const std::vector<ToolSpec>& tools,
                     const ChatOptions& options,
                     const ChunkCallback& on_chunk) override;

    bool is_available() const override { return !api_key_.empty() && !model_.empty(); }
    std::string provider_id() const override { return "openai"; }
    std::string display_name() const override { return "OpenAI"; }
    std::string model() const override { return model_; }

    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const std::vector<ToolSpec>& tools,
                                 const ChatOptions& options) const;

protected:
    OpenAIProvider(const ProviderEntry& entry, HttpClient& http,
                   const std::string& default_base_url,
                   const std::string& default_model);

    virtual std::vector<Header> build_headers() const;
    // Some vendors reject stream_options.include_usage
    virtual bool include_stream_usage() const { return true; }
    virtual double effective_temperature(double requested) const { return requested; }
    virtual std::string chat_url() const { return base_url_ + "/chat/completions"; }

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    std::string model_;
};

} // namespace sciclaw
