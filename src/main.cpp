#include "agent.hpp"
#include "config.hpp"
#include "context.hpp"
#include "dataset.hpp"
#include "http.hpp"
#include "knowledge.hpp"
#include "model_resolver.hpp"
#include "session.hpp"
#include "tool.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

static std::atomic<bool> g_stop{false};

static void signal_handler(int /*sig*/) {
    g_stop.store(true);
}

static void print_usage() {
    std::cout << "Usage: sciclaw [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG       Run a single turn and exit\n"
              << "  --provider ID           Preferred provider (openai, anthropic, deepseek, ollama, ...)\n"
              << "  --model NAME            Model for the preferred provider\n"
              << "  --load NAME=PATH.csv    Load a CSV file as dataset NAME (repeatable)\n"
              << "  --session ID            Session id (workspace directory name)\n"
              << "  -h, --help              Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /status                 Show model, session and history info\n"
              << "  /datasets               List loaded datasets\n"
              << "  /clear                  Clear conversation history\n"
              << "  /quit, /exit            Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY, ANTHROPIC_API_KEY, MOONSHOT_API_KEY, KIMI_CODING_API_KEY,\n"
              << "  ZHIPU_API_KEY, DEEPSEEK_API_KEY, DASHSCOPE_API_KEY\n"
              << "  OLLAMA_BASE_URL       Base URL for Ollama (default: http://localhost:11434)\n"
              << "  SCICLAW_PROVIDER      Preferred provider\n"
              << "  SCICLAW_DATA_DIR      Data directory (default: ~/.sciclaw/data)\n";
}

static std::string first_line(const std::string& text, size_t max_len = 160) {
    std::string line = text.substr(0, text.find('\n'));
    return line.size() > max_len ? sciclaw::utf8_truncate(line, max_len) + "..." : line;
}

// Text goes to stdout as it streams; everything else is one line on stderr.
static void print_event(const sciclaw::AgentEvent& ev) {
    using sciclaw::EventType;
    const auto& d = ev.data;
    switch (ev.type) {
        case EventType::Text:
            if (d.is_string()) std::cout << d.get<std::string>() << std::flush;
            break;
        case EventType::IterationStart:
        case EventType::Reasoning:
            break;
        case EventType::ToolCall:
            std::cerr << "\n[tool_call] " << ev.tool_name.value_or("?");
            if (ev.metadata.contains("intent")) {
                std::cerr << " (" << ev.metadata["intent"].get<std::string>() << ")";
            }
            std::cerr << "\n";
            break;
        case EventType::ToolResult:
            std::cerr << "[tool_result] " << ev.tool_name.value_or("?") << " "
                      << d.value("status", "") << ": "
                      << first_line(d.value("message", "")) << "\n";
            break;
        case EventType::Artifact:
            std::cerr << "[artifact] " << d.value("name", "") << " " << d.value("path", "") << "\n";
            break;
        case EventType::Chart:
            std::cerr << "[chart] " << ev.tool_name.value_or("") << "\n";
            break;
        case EventType::Data:
            std::cerr << "[data] " << d.value("total_rows", 0) << " rows\n";
            break;
        case EventType::Image:
            std::cerr << "[image] " << d.value("urls", nlohmann::json::array()).size() << " image(s)\n";
            break;
        case EventType::Retrieval:
            std::cerr << "[retrieval] " << d.value("results", nlohmann::json::array()).size()
                      << " knowledge hit(s)\n";
            break;
        case EventType::AnalysisPlan:
            std::cerr << "[plan] " << d.value("steps", nlohmann::json::array()).size() << " steps\n";
            break;
        case EventType::PlanStepUpdate:
            std::cerr << "[plan_step] " << d.value("id", 0) << " " << d.value("status", "") << ": "
                      << first_line(d.value("title", "")) << "\n";
            break;
        case EventType::ContextCompressed:
            std::cerr << "[context_compressed] " << d.value("message", "") << "\n";
            break;
        case EventType::Error:
            std::cerr << "\n[error] " << (d.is_string() ? d.get<std::string>() : d.dump()) << "\n";
            break;
        case EventType::Done:
            std::cout << "\n";
            break;
    }
}

static void print_status(const sciclaw::ModelResolver& resolver,
                         const sciclaw::Session& session) {
    auto info = resolver.active_model_info("chat");
    if (info) {
        std::cout << "Provider: " << info->provider_name << " (" << info->provider_id << ")\n"
                  << "Model: " << info->model << "\n";
    } else {
        std::cout << "Provider: none available\n";
    }
    std::cout << "Session: " << session.id << "\n"
              << "History: " << session.messages.size() << " messages\n"
              << "Estimated tokens: " << sciclaw::estimate_messages_tokens(session.messages) << "\n"
              << "Compressed rounds: " << session.compressed_rounds << "\n"
              << "Datasets: " << session.datasets.size() << "\n";
}

static void print_datasets(const sciclaw::Session& session) {
    if (session.datasets.empty()) {
        std::cout << "No datasets loaded.\n";
        return;
    }
    for (const auto& [name, ds] : session.datasets) {
        std::cout << "  " << name << ": " << ds.row_count() << " rows x "
                  << ds.column_count() << " columns\n";
    }
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string provider_name;
    std::string model_name;
    std::string session_id;
    std::vector<std::pair<std::string, std::string>> loads;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--session") == 0 && i + 1 < argc) {
            session_id = argv[++i];
        } else if (std::strcmp(argv[i], "--load") == 0 && i + 1 < argc) {
            std::string spec = argv[++i];
            auto eq = spec.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
                std::cerr << "--load expects NAME=PATH.csv, got: " << spec << "\n";
                return 1;
            }
            loads.emplace_back(spec.substr(0, eq), spec.substr(eq + 1));
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    sciclaw::http_init();
    auto config = sciclaw::Config::load();

    // Override config with CLI args
    if (!provider_name.empty()) {
        config.llm.preferred_provider = provider_name;
    }
    if (!model_name.empty()) {
        std::string target = config.llm.preferred_provider;
        if (target.empty() && !config.provider_order.empty()) target = config.provider_order.front();
        config.providers[target].model = model_name;
    }

    sciclaw::Session session(session_id);
    for (const auto& [name, path] : loads) {
        try {
            session.datasets[name] = sciclaw::read_csv(sciclaw::expand_home(path));
        } catch (const std::exception& e) {
            std::cerr << "Error loading " << path << ": " << e.what() << "\n";
            sciclaw::http_cleanup();
            return 1;
        }
    }

    sciclaw::CurlHttpClient http_client;
    auto resolver = sciclaw::ModelResolver::from_config(config, http_client);
    auto tools = sciclaw::ToolRegistry::from_config(config);
    std::unique_ptr<sciclaw::KnowledgeLoader> knowledge;
    if (!config.agent.knowledge_dir.empty()) {
        knowledge = std::make_unique<sciclaw::KnowledgeLoader>(config.agent.knowledge_dir);
    }
    sciclaw::AgentRunner runner(*resolver, *tools, config, knowledge.get());

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    sciclaw::http_set_abort_flag(&g_stop);

    sciclaw::RunOptions options;
    options.stop_flag = &g_stop;

    // Single message mode
    if (!message.empty()) {
        bool failed = false;
        runner.run(session, message, [&failed](const sciclaw::AgentEvent& ev) {
            if (ev.type == sciclaw::EventType::Error) failed = true;
            print_event(ev);
        }, options);
        sciclaw::http_cleanup();
        return failed ? 1 : 0;
    }

    // Interactive REPL
    std::cout << "sciclaw research analysis agent\n";
    print_status(*resolver, session);
    std::cout << "Type /quit to exit.\n\n";

    std::string line;
    while (true) {
        std::cout << "sciclaw> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        line = sciclaw::trim(line);
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/status") {
                print_status(*resolver, session);
            } else if (line == "/datasets") {
                print_datasets(session);
            } else if (line == "/clear") {
                session.messages.clear();
                session.compressed_context.clear();
                session.compressed_rounds = 0;
                std::cout << "History cleared.\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        g_stop.store(false);
        runner.run(session, line, print_event, options);
        std::cout << "\n";
    }

    sciclaw::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
