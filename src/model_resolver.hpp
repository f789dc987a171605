#pragma once
#include "provider.hpp"
#include "config.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sciclaw {

class HttpClient;

// Per-call options; unset fields fall back to the resolver defaults.
struct ChatRequest {
    std::optional<double> temperature;
    std::optional<uint32_t> max_tokens;
    std::string purpose = "chat";
};

struct ActiveModelInfo {
    std::string provider_id;
    std::string provider_name;
    std::string model;
};

// Ordered failover over vendor clients, with a global preferred provider and
// per-purpose routing overrides.
class ModelResolver {
public:
    using ClientFactory = std::function<std::unique_ptr<ProviderClient>(
        const std::string& provider_id, const ProviderEntry& entry)>;

    explicit ModelResolver(std::vector<std::unique_ptr<ProviderClient>> chain,
                           ClientFactory factory = nullptr,
                           ChatOptions defaults = {});

    // Chain in config.provider_order, built through the plugin registry.
    static std::unique_ptr<ModelResolver> from_config(const Config& config, HttpClient& http);

    // Replace the chain (clients created in the given order) and the purpose overrides.
    void reload(const std::vector<std::pair<std::string, ProviderEntry>>& providers,
                const std::unordered_map<std::string, PurposeRoute>& purpose_routes);

    // Empty purpose sets the global preference; empty provider_id clears it.
    void set_preferred_provider(const std::string& provider_id,
                                const std::string& purpose = "");

    // Streams from the first candidate that succeeds.
    // Throws ConfigurationError if no candidate is available and ProviderError
    // (or ContextOverflowError) once every available candidate has failed.
    void chat(const std::vector<ChatMessage>& messages,
              const std::vector<ToolSpec>& tools,
              const ChunkCallback& on_chunk,
              const ChatRequest& request = {});

    LLMResponse chat_complete(const std::vector<ChatMessage>& messages,
                              const std::vector<ToolSpec>& tools = {},
                              const ChatRequest& request = {});

    // First available candidate that chat() would try for purpose.
    std::optional<ActiveModelInfo> active_model_info(const std::string& purpose = "chat") const;

    std::vector<std::string> chain_ids() const;

private:
    struct Candidate {
        std::shared_ptr<ProviderClient> client;
        bool one_shot = false;
    };
    std::vector<Candidate> candidates_for(const std::string& purpose) const;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ProviderClient>> chain_;
    std::unordered_map<std::string, ProviderEntry> provider_configs_;
    std::unordered_map<std::string, PurposeRoute> purpose_routes_;
    std::string preferred_provider_;
    ClientFactory factory_;
    ChatOptions defaults_;
};

} // namespace sciclaw
