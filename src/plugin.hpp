#pragma once
#include "provider.hpp"
#include "tool.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace sciclaw {

// Factory function types
using ProviderFactory = std::function<std::unique_ptr<ProviderClient>(
    const ProviderEntry& entry, HttpClient& http)>;

using ToolFactory = std::function<std::unique_ptr<Tool>(const Config& config)>;

// Central registry for self-registering providers and tools.
// Only holds factories; instances are owned by whoever creates them.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_provider(const std::string& id, ProviderFactory factory);
    void register_tool(const std::string& name, ToolFactory factory);

    // Creation
    std::unique_ptr<ProviderClient> create_provider(const std::string& id,
                                                    const ProviderEntry& entry,
                                                    HttpClient& http) const;

    std::vector<std::unique_ptr<Tool>> create_all_tools(const Config& config) const;

    // Query
    std::vector<std::string> provider_names() const;
    std::vector<std::string> tool_names() const;
    bool has_provider(const std::string& id) const;

    // Testing support
    void clear();

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
    std::unordered_map<std::string, ToolFactory> tools_;
};

// ── Self-registrar helpers (used at file scope in each plugin .cpp) ──

struct ProviderRegistrar {
    ProviderRegistrar(const std::string& id, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(id, std::move(factory));
    }
};

struct ToolRegistrar {
    ToolRegistrar(const std::string& name, ToolFactory factory) {
        PluginRegistry::instance().register_tool(name, std::move(factory));
    }
};

} // namespace sciclaw
