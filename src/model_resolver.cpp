#include "model_resolver.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include <iostream>
#include <stdexcept>

namespace sciclaw {

ModelResolver::ModelResolver(std::vector<std::unique_ptr<ProviderClient>> chain,
                             ClientFactory factory,
                             ChatOptions defaults)
    : factory_(std::move(factory)), defaults_(defaults) {
    for (auto& client : chain) {
        if (client) chain_.push_back(std::shared_ptr<ProviderClient>(std::move(client)));
    }
}

std::unique_ptr<ModelResolver> ModelResolver::from_config(const Config& config,
                                                          HttpClient& http) {
    ClientFactory factory = [&http](const std::string& id, const ProviderEntry& entry) {
        return create_provider(id, entry, http);
    };

    ChatOptions defaults;
    defaults.temperature = config.llm.temperature;
    defaults.max_tokens = config.llm.max_tokens;
    defaults.timeout_seconds = static_cast<long>(config.llm.request_timeout);

    auto resolver = std::make_unique<ModelResolver>(
        std::vector<std::unique_ptr<ProviderClient>>{}, factory, defaults);

    std::vector<std::pair<std::string, ProviderEntry>> providers;
    for (const auto& id : config.provider_order) {
        providers.emplace_back(id, config.provider_entry(id));
    }
    resolver->reload(providers, config.purposes);
    if (!config.llm.preferred_provider.empty()) {
        resolver->set_preferred_provider(config.llm.preferred_provider);
    }
    return resolver;
}

void ModelResolver::reload(const std::vector<std::pair<std::string, ProviderEntry>>& providers,
                           const std::unordered_map<std::string, PurposeRoute>& purpose_routes) {
    if (!factory_) {
        throw std::logic_error("ModelResolver::reload needs a client factory");
    }
    std::vector<std::shared_ptr<ProviderClient>> chain;
    std::unordered_map<std::string, ProviderEntry> configs;
    for (const auto& [id, entry] : providers) {
        configs[id] = entry;
        try {
            auto client = factory_(id, entry);
            if (client) chain.push_back(std::shared_ptr<ProviderClient>(std::move(client)));
        } catch (const std::invalid_argument& e) {
            std::cerr << "[resolver] Skipping provider " << id << ": " << e.what() << "\n";
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // Superseded clients are released once in-flight calls drop their references
    chain_ = std::move(chain);
    provider_configs_ = std::move(configs);
    purpose_routes_ = purpose_routes;
}

void ModelResolver::set_preferred_provider(const std::string& provider_id,
                                           const std::string& purpose) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (purpose.empty()) {
        preferred_provider_ = provider_id;
        return;
    }
    if (provider_id.empty()) {
        purpose_routes_.erase(purpose);
    } else {
        purpose_routes_[purpose] = PurposeRoute{provider_id, "", ""};
    }
}

std::vector<ModelResolver::Candidate>
ModelResolver::candidates_for(const std::string& purpose) const {
    std::vector<Candidate> candidates;
    std::lock_guard<std::mutex> lock(mutex_);

    auto route_it = purpose_routes_.find(purpose);
    if (route_it != purpose_routes_.end() && !route_it->second.provider_id.empty()) {
        const PurposeRoute& route = route_it->second;
        ProviderEntry entry;
        auto cfg_it = provider_configs_.find(route.provider_id);
        if (cfg_it != provider_configs_.end()) entry = cfg_it->second;
        if (!route.model.empty()) entry.model = route.model;
        if (!route.base_url.empty()) entry.base_url = route.base_url;

        if (factory_) {
            try {
                auto client = factory_(route.provider_id, entry);
                if (client) {
                    candidates.push_back({std::shared_ptr<ProviderClient>(std::move(client)), true});
                }
            } catch (const std::invalid_argument& e) {
                std::cerr << "[resolver] Purpose route " << purpose << " -> "
                          << route.provider_id << " unusable: " << e.what() << "\n";
            }
        }
        for (const auto& client : chain_) candidates.push_back({client, false});
        return candidates;
    }

    if (!preferred_provider_.empty()) {
        for (const auto& client : chain_) {
            if (client->provider_id() == preferred_provider_) candidates.push_back({client, false});
        }
        for (const auto& client : chain_) {
            if (client->provider_id() != preferred_provider_) candidates.push_back({client, false});
        }
        return candidates;
    }

    for (const auto& client : chain_) candidates.push_back({client, false});
    return candidates;
}

namespace {

// Closes one-shot clients when the call ends, whatever the outcome.
struct OneShotCloser {
    std::vector<std::shared_ptr<ProviderClient>> clients;
    ~OneShotCloser() {
        for (auto& c : clients) {
            try {
                c->close();
            } catch (const std::exception& e) {
                std::cerr << "[resolver] Failed to close " << c->provider_id() << ": "
                          << e.what() << "\n";
            }
        }
    }
};

} // namespace

void ModelResolver::chat(const std::vector<ChatMessage>& messages,
                         const std::vector<ToolSpec>& tools,
                         const ChunkCallback& on_chunk,
                         const ChatRequest& request) {
    auto candidates = candidates_for(request.purpose);

    OneShotCloser closer;
    for (const auto& c : candidates) {
        if (c.one_shot) closer.clients.push_back(c.client);
    }

    ChatOptions options = defaults_;
    if (request.temperature) options.temperature = *request.temperature;
    if (request.max_tokens) options.max_tokens = *request.max_tokens;

    bool any_available = false;
    bool last_was_overflow = false;
    std::string last_error;

    for (const auto& candidate : candidates) {
        auto& client = candidate.client;
        if (!client->is_available()) continue;
        any_available = true;

        bool produced = false;
        bool consumer_threw = false;
        try {
            client->stream_chat(messages, tools, options,
                [&](const LLMChunk& chunk) -> bool {
                    produced = true;
                    try {
                        return on_chunk(chunk);
                    } catch (...) {
                        consumer_threw = true;
                        throw;
                    }
                });
            return;
        } catch (const std::exception& e) {
            if (consumer_threw) throw;
            if (produced) {
                // Chunks already reached the caller; no failover after that
                std::cerr << "[resolver] Provider " << client->provider_id()
                          << " failed mid-stream: " << e.what() << "\n";
                throw ProviderError(client->display_name() + " failed mid-stream: " + e.what());
            }
            last_error = e.what();
            last_was_overflow = dynamic_cast<const ContextOverflowError*>(&e) != nullptr;
            std::cerr << "[resolver] Provider " << client->provider_id()
                      << " failed: " << last_error << "\n";
        }
    }

    if (!any_available) {
        throw ConfigurationError(
            "No LLM provider is available. Configure an API key in ~/.sciclaw/config.json "
            "or through the environment.");
    }
    std::string message = "All LLM providers failed: " + last_error;
    if (last_was_overflow) throw ContextOverflowError(message);
    throw ProviderError(message);
}

LLMResponse ModelResolver::chat_complete(const std::vector<ChatMessage>& messages,
                                         const std::vector<ToolSpec>& tools,
                                         const ChatRequest& request) {
    LLMResponse response;
    chat(messages, tools, [&response](const LLMChunk& chunk) {
        response.absorb(chunk);
        return true;
    }, request);
    return response;
}

std::optional<ActiveModelInfo> ModelResolver::active_model_info(const std::string& purpose) const {
    auto candidates = candidates_for(purpose);
    OneShotCloser closer;
    std::optional<ActiveModelInfo> info;
    for (const auto& c : candidates) {
        if (c.one_shot) closer.clients.push_back(c.client);
        if (!info && c.client->is_available()) {
            info = ActiveModelInfo{c.client->provider_id(), c.client->display_name(),
                                   c.client->model()};
        }
    }
    return info;
}

std::vector<std::string> ModelResolver::chain_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(chain_.size());
    for (const auto& c : chain_) ids.push_back(c->provider_id());
    return ids;
}

} // namespace sciclaw
