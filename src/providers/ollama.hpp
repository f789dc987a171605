#pragma once
#include "openai.hpp"
#include <string>

namespace sciclaw {

// Local Ollama server through its OpenAI-compatible /v1 endpoint. No key needed.
class OllamaProvider : public OpenAIProvider {
public:
    OllamaProvider(const ProviderEntry& entry, HttpClient& http);

    bool is_available() const override { return !base_url_.empty() && !model_.empty(); }
    std::string provider_id() const override { return "ollama"; }
    std::string display_name() const override { return "Ollama (local)"; }

protected:
    bool include_stream_usage() const override { return false; }
    std::string chat_url() const override { return base_url_ + "/v1/chat/completions"; }
};

} // namespace sciclaw
