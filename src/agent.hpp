#pragma once
#include "config.hpp"
#include "context.hpp"
#include "event.hpp"
#include "provider.hpp"
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sciclaw {

class KnowledgeSource;
class ModelResolver;
class ToolRegistry;
struct Session;

struct RunOptions {
    bool append_user_message = true;
    // Checked at iteration boundaries, while streaming and before each tool call
    const std::atomic<bool>* stop_flag = nullptr;
};

// ReAct loop over one session: prompt, model call, tool dispatch, repeat.
// Every turn ends with exactly one terminal event (done or error).
class AgentRunner {
public:
    AgentRunner(ModelResolver& resolver,
                ToolRegistry& tools,
                const Config& config,
                const KnowledgeSource* knowledge = nullptr);

    // Runs one turn and returns its id. Never throws: fatal failures become
    // an error event. Turns on the same session run one at a time.
    std::string run(Session& session,
                    const std::string& user_message,
                    const EventSink& sink,
                    const RunOptions& options = {});

    void set_context_limit_classifier(ContextLimitClassifier classifier);

    // Prompt that would be sent for the session right now, trimmed to budget
    std::vector<ChatMessage> build_messages(const Session& session) const;

private:
    struct Prompt {
        std::vector<ChatMessage> head;     // system + runtime context + summary
        std::vector<ChatMessage> history;  // filtered and compacted session messages
        nlohmann::json retrieval;          // null when nothing was retrieved

        uint32_t tokens() const;
    };

    class Turn;

    Prompt build_prompt(const Session& session) const;
    std::vector<ChatMessage> finalize(const Prompt& prompt) const;

    // Event data for context_compressed, or nullopt when nothing was compressed
    std::optional<nlohmann::json> compress(Session& session, uint32_t current_tokens,
                                           const std::string& trigger) const;

    // Code of run_code / run_r_code calls becomes a code artifact or an
    // execution record. Returns the artifact record when one was written.
    std::optional<nlohmann::json> persist_code(Session& session,
                                               const std::string& tool_name,
                                               const std::string& arguments) const;

    void save_plan_note(const Session& session, const std::string& text) const;

    void run_turn(Session& session, Turn& turn, const RunOptions& options);

    ModelResolver& resolver_;
    ToolRegistry& tools_;
    Config config_;
    const KnowledgeSource* knowledge_;
    ContextLimitClassifier context_limit_classifier_;
};

} // namespace sciclaw
