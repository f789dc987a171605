#include <catch2/catch_test_macros.hpp>
#include "mock_http_client.hpp"
#include "plugin.hpp"
#include "session.hpp"
#include <algorithm>
#include <stdexcept>

using namespace sciclaw;

// Tests use unique prefixed names to avoid colliding with real registrations.
// clear() is never called on the global singleton since it would drop the
// static registrations from the provider and tool .cpp files.

// ── Helpers ─────────────────────────────────────────────────────

namespace {

class PluginTestProvider : public ProviderClient {
public:
    explicit PluginTestProvider(ProviderEntry entry) : entry_(std::move(entry)) {}

    void stream_chat(const std::vector<ChatMessage>&, const std::vector<ToolSpec>&,
                     const ChatOptions&, const ChunkCallback&) override {}
    bool is_available() const override { return !entry_.api_key.empty(); }
    std::string provider_id() const override { return "_test_prov"; }
    std::string display_name() const override { return "Test"; }
    std::string model() const override { return entry_.model; }

private:
    ProviderEntry entry_;
};

class PluginTestTool : public Tool {
public:
    explicit PluginTestTool(std::string name) : name_(std::move(name)) {}
    ToolResult execute(Session&, const nlohmann::json&) override {
        ToolResult r;
        r.message = "ok";
        return r;
    }
    std::string tool_name() const override { return name_; }
    std::string description() const override { return "test"; }
    std::string parameters_json() const override { return R"({"type":"object"})"; }

private:
    std::string name_;
};

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

// ── Built-in static registrations ───────────────────────────────

TEST_CASE("PluginRegistry: built-in providers are registered", "[plugin]") {
    auto names = PluginRegistry::instance().provider_names();
    for (const char* id : {"openai", "anthropic", "moonshot", "kimi_coding", "zhipu",
                           "deepseek", "dashscope", "ollama"}) {
        INFO(id);
        REQUIRE(contains(names, id));
    }
    REQUIRE(std::is_sorted(names.begin(), names.end()));
}

TEST_CASE("PluginRegistry: every default provider id has a factory", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    for (const auto& id : kDefaultProviderOrder) {
        INFO(id);
        REQUIRE(reg.has_provider(id));
    }
}

TEST_CASE("PluginRegistry: built-in tools are registered", "[plugin]") {
    auto names = PluginRegistry::instance().tool_names();
    REQUIRE(contains(names, "run_code"));
    REQUIRE(contains(names, "run_r_code"));
    REQUIRE(contains(names, "generate_report"));
}

// ── Provider registration & creation ────────────────────────────

TEST_CASE("PluginRegistry: register and create custom provider", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    reg.register_provider("_test_prov", [](const ProviderEntry& entry, HttpClient&) {
        return std::make_unique<PluginTestProvider>(entry);
    });

    MockHttpClient http;
    ProviderEntry entry{"sk-test", "", "tiny-model"};
    auto client = reg.create_provider("_test_prov", entry, http);
    REQUIRE(client != nullptr);
    REQUIRE(client->provider_id() == "_test_prov");
    REQUIRE(client->model() == "tiny-model");
    REQUIRE(client->is_available());
}

TEST_CASE("PluginRegistry: unknown provider throws", "[plugin]") {
    MockHttpClient http;
    REQUIRE_THROWS_AS(PluginRegistry::instance().create_provider("_nope", {}, http),
                      std::invalid_argument);
    REQUIRE_FALSE(PluginRegistry::instance().has_provider("_nope"));
}

TEST_CASE("PluginRegistry: built-in provider takes the configured model", "[plugin]") {
    MockHttpClient http;
    ProviderEntry entry{"sk-deep", "", "deepseek-reasoner"};
    auto client = create_provider("deepseek", entry, http);
    REQUIRE(client->provider_id() == "deepseek");
    REQUIRE(client->display_name() == "DeepSeek");
    REQUIRE(client->model() == "deepseek-reasoner");
    REQUIRE(client->is_available());
}

TEST_CASE("PluginRegistry: provider without a key is unavailable", "[plugin]") {
    MockHttpClient http;
    auto client = create_provider("openai", ProviderEntry{"", "", "gpt-4o"}, http);
    REQUIRE_FALSE(client->is_available());
}

// ── Tool registration & creation ────────────────────────────────

TEST_CASE("PluginRegistry: register custom tool", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    reg.register_tool("_test_tool", [](const Config&) {
        return std::make_unique<PluginTestTool>("_test_tool");
    });
    REQUIRE(contains(reg.tool_names(), "_test_tool"));

    Config cfg;
    auto tools = reg.create_all_tools(cfg);
    auto it = std::find_if(tools.begin(), tools.end(), [](const auto& t) {
        return t->tool_name() == "_test_tool";
    });
    REQUIRE(it != tools.end());
}

TEST_CASE("PluginRegistry: create_all_tools is sorted by name", "[plugin]") {
    Config cfg;
    auto tools = PluginRegistry::instance().create_all_tools(cfg);
    std::vector<std::string> names;
    for (const auto& t : tools) names.push_back(t->tool_name());
    REQUIRE(std::is_sorted(names.begin(), names.end()));
}

TEST_CASE("ToolRegistry::from_config: holds every registered tool", "[plugin]") {
    Config cfg;
    auto registry = ToolRegistry::from_config(cfg);
    REQUIRE(registry->has("run_code"));
    REQUIRE(registry->has("run_r_code"));
    REQUIRE(registry->has("generate_report"));
    REQUIRE(registry->names().size() == PluginRegistry::instance().tool_names().size());
}
