#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace sciclaw {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& id, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[id] = std::move(factory);
}

void PluginRegistry::register_tool(const std::string& name, ToolFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[name] = std::move(factory);
}

std::unique_ptr<ProviderClient> PluginRegistry::create_provider(const std::string& id,
                                                                const ProviderEntry& entry,
                                                                HttpClient& http) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(id);
    if (it == providers_.end()) {
        throw std::invalid_argument("Unknown provider: " + id);
    }
    return it->second(entry, http);
}

std::vector<std::unique_ptr<Tool>> PluginRegistry::create_all_tools(const Config& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    // Sorted so tool order in prompts is stable
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) names.push_back(name);
    std::sort(names.begin(), names.end());

    std::vector<std::unique_ptr<Tool>> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(tools_.at(name)(config));
    }
    return result;
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& [name, _] : providers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::tool_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_provider(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(id) > 0;
}

void PluginRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_.clear();
    tools_.clear();
}

} // namespace sciclaw
