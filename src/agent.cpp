#include "agent.hpp"
#include "compression.hpp"
#include "errors.hpp"
#include "knowledge.hpp"
#include "model_resolver.hpp"
#include "plan_parser.hpp"
#include "prompt.hpp"
#include "session.hpp"
#include "tool.hpp"
#include "util.hpp"
#include "workspace.hpp"
#include <cctype>
#include <iostream>
#include <mutex>

namespace sciclaw {

namespace {

ChatMessage make_message(Role role, const std::string& content) {
    return ChatMessage{role, content, std::nullopt, std::nullopt, {}, std::nullopt,
                       nlohmann::json::object()};
}

bool is_code_tool(const std::string& name) {
    return name == "run_code" || name == "run_r_code";
}

bool stop_requested(const RunOptions& options) {
    return options.stop_flag != nullptr && options.stop_flag->load();
}

std::string last_user_message(const Session& session) {
    for (auto it = session.messages.rbegin(); it != session.messages.rend(); ++it) {
        if (it->role == Role::User) return trim(it->content);
    }
    return "";
}

std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "";
}

bool flag_field(const nlohmann::json& j, const char* key) {
    return j.is_object() && j.contains(key) && j[key].is_boolean() && j[key].get<bool>();
}

// A dict with a non-empty "error" or "success": false
bool result_has_error(const nlohmann::json& result) {
    if (!result.is_object()) return false;
    if (result.contains("error")) {
        const auto& e = result["error"];
        if (e.is_string() ? !e.get_ref<const std::string&>().empty()
                          : !(e.is_null() || (e.is_boolean() && !e.get<bool>()))) {
            return true;
        }
    }
    return result.contains("success") && result["success"].is_boolean() &&
           !result["success"].get<bool>();
}

nlohmann::json parse_arguments(const std::string& text) {
    nlohmann::json args = nlohmann::json::parse(text, nullptr, false);
    if (args.is_discarded()) args = nlohmann::json::parse(repair_json(text), nullptr, false);
    return args.is_object() ? args : nlohmann::json::object();
}

std::string code_intent(const nlohmann::json& args) {
    std::string intent = trim(string_field(args, "intent"));
    return intent.empty() ? trim(string_field(args, "label")) : intent;
}

} // namespace

// Per-turn event numbering and delivery
class AgentRunner::Turn {
public:
    Turn(std::string id, const EventSink& sink) : id_(std::move(id)), sink_(sink) {}

    const std::string& id() const { return id_; }
    bool terminated() const { return terminated_; }

    void emit(EventType type, nlohmann::json data = nullptr, const ToolCall* call = nullptr,
              const nlohmann::json& metadata = nlohmann::json::object()) {
        AgentEvent event;
        event.type = type;
        event.turn_id = id_;
        if (call) {
            event.tool_call_id = call->id;
            event.tool_name = call->name;
        }
        event.data = std::move(data);
        if (metadata.is_object()) event.metadata = metadata;
        event.metadata["seq"] = ++seq_;
        if (event.is_terminal()) terminated_ = true;
        if (!sink_) return;
        try {
            sink_(event);
        } catch (const std::exception& e) {
            // History is already written; keep the turn going
            std::cerr << "[agent] Event sink failed on " << event_type_name(type) << ": "
                      << e.what() << "\n";
        }
    }

private:
    std::string id_;
    const EventSink& sink_;
    uint64_t seq_ = 0;
    bool terminated_ = false;
};

AgentRunner::AgentRunner(ModelResolver& resolver,
                         ToolRegistry& tools,
                         const Config& config,
                         const KnowledgeSource* knowledge)
    : resolver_(resolver)
    , tools_(tools)
    , config_(config)
    , knowledge_(knowledge)
    , context_limit_classifier_(default_context_limit_classifier)
{}

void AgentRunner::set_context_limit_classifier(ContextLimitClassifier classifier) {
    context_limit_classifier_ = std::move(classifier);
}

uint32_t AgentRunner::Prompt::tokens() const {
    return estimate_messages_tokens(head) + estimate_messages_tokens(history);
}

AgentRunner::Prompt AgentRunner::build_prompt(const Session& session) const {
    Prompt prompt;
    prompt.head.push_back(make_message(
        Role::System, build_system_prompt(tools_.specs(), config_.agent.system_prompt)));

    std::string knowledge_text;
    std::string query = last_user_message(session);
    if (knowledge_ && !query.empty()) {
        KnowledgeSelection selection = knowledge_->select(
            query, config_.agent.knowledge_max_entries, config_.agent.knowledge_max_chars);
        knowledge_text = selection.text;
        if (!selection.hits.empty()) {
            nlohmann::json results = nlohmann::json::array();
            for (const auto& hit : selection.hits) results.push_back(hit.to_json());
            prompt.retrieval = {{"query", query}, {"results", results}, {"mode", knowledge_->mode()}};
        }
    }

    std::string runtime = build_runtime_context(build_dataset_context(session.datasets),
                                                knowledge_text,
                                                config_.agent.knowledge_max_chars);
    if (!runtime.empty()) prompt.head.push_back(make_message(Role::Assistant, runtime));
    if (!trim(session.compressed_context).empty()) {
        prompt.head.push_back(make_message(
            Role::Assistant, build_compressed_context_message(session.compressed_context)));
    }

    prompt.history = prepare_messages_for_llm(filter_valid_messages(session.messages));
    return prompt;
}

std::vector<ChatMessage> AgentRunner::finalize(const Prompt& prompt) const {
    std::vector<ChatMessage> messages = prompt.head;
    std::vector<ChatMessage> history = prompt.history;
    uint32_t budget = config_.agent.auto_compress_threshold_tokens;
    if (config_.agent.auto_compress_enabled && !history.empty() && prompt.tokens() > budget) {
        history = sliding_window_trim(history, budget, estimate_messages_tokens(prompt.head));
    }
    messages.insert(messages.end(), history.begin(), history.end());
    return messages;
}

std::vector<ChatMessage> AgentRunner::build_messages(const Session& session) const {
    return finalize(build_prompt(session));
}

std::optional<nlohmann::json> AgentRunner::compress(Session& session, uint32_t current_tokens,
                                                    const std::string& trigger) const {
    std::cerr << "[agent] Auto compression (" << trigger << "): " << current_tokens
              << " tokens, threshold " << config_.agent.auto_compress_threshold_tokens << "\n";
    try {
        Workspace workspace(config_.sessions_dir(), session.id);
        CompressionResult r = compress_session_history(session, workspace,
                                                       config_.agent.compress_ratio,
                                                       config_.agent.compress_min_messages,
                                                       config_.agent.compressed_context_max_chars);
        if (!r.success) {
            std::cerr << "[agent] Compression skipped: " << r.message << "\n";
            return std::nullopt;
        }
        std::string count = std::to_string(r.archived_count);
        std::string message = trigger == "context_limit_error"
            ? "context limit exceeded, compressed automatically, archived " + count + " messages"
            : "context compressed automatically, archived " + count + " messages";
        return nlohmann::json{
            {"trigger", trigger},
            {"archived_count", r.archived_count},
            {"remaining_count", r.remaining_count},
            {"archive_path", r.archive_path},
            {"compressed_rounds", session.compressed_rounds},
            {"previous_tokens", current_tokens},
            {"message", message},
        };
    } catch (const std::exception& e) {
        std::cerr << "[agent] Auto compression failed (" << trigger << "): " << e.what() << "\n";
        return std::nullopt;
    }
}

std::optional<nlohmann::json> AgentRunner::persist_code(Session& session,
                                                        const std::string& tool_name,
                                                        const std::string& arguments) const {
    if (!is_code_tool(tool_name)) return std::nullopt;
    nlohmann::json args = parse_arguments(arguments);
    std::string code = string_field(args, "code");
    while (!code.empty() && std::isspace(static_cast<unsigned char>(code.back()))) code.pop_back();
    if (trim(code).empty()) return std::nullopt;

    bool is_r = tool_name == "run_r_code";
    std::string ext = is_r ? "R" : "py";
    std::string format = is_r ? "r" : "py";
    std::string purpose = trim(string_field(args, "purpose"));
    std::string label = trim(string_field(args, "label"));

    try {
        Workspace workspace(config_.sessions_dir(), session.id);
        if (purpose != "visualization" && purpose != "export") {
            workspace.save_code_execution(code, "", "pending", is_r ? "r" : "python",
                                          tool_name, args, code_intent(args));
            return std::nullopt;
        }
        std::string filename = !label.empty()
            ? Workspace::sanitize_filename(label + "." + ext, "code." + ext)
            : Workspace::sanitize_filename(tool_name + "_" + compact_timestamp() + "." + ext,
                                           tool_name + "." + ext);
        nlohmann::json record = workspace.save_artifact(filename, code + "\n", "code", format);
        return nlohmann::json{
            {"name", record.value("name", filename)},
            {"type", "code"},
            {"format", format},
            {"path", record.value("path", "")},
            {"download_url", record.value("download_url", "")},
        };
    } catch (const std::exception& e) {
        std::cerr << "[agent] Failed to persist code of " << tool_name << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

void AgentRunner::save_plan_note(const Session& session, const std::string& text) const {
    try {
        Workspace workspace(config_.sessions_dir(), session.id);
        workspace.save_artifact("analysis_plan_" + compact_timestamp() + ".md",
                                "# Analysis Plan\n\n" + text + "\n", "note", "md", "internal");
    } catch (const std::exception& e) {
        std::cerr << "[agent] Failed to save analysis plan: " << e.what() << "\n";
    }
}

std::string AgentRunner::run(Session& session,
                             const std::string& user_message,
                             const EventSink& sink,
                             const RunOptions& options) {
    std::lock_guard<std::mutex> turn_lock(session.turn_mutex);
    if (options.append_user_message) session.add_message(Role::User, user_message);
    session.last_active = epoch_seconds();

    Turn turn(generate_id().substr(0, 12), sink);
    try {
        run_turn(session, turn, options);
    } catch (const std::exception& e) {
        std::cerr << "[agent] Turn " << turn.id() << " failed: " << e.what() << "\n";
        if (!turn.terminated()) turn.emit(EventType::Error, e.what());
    }
    if (!turn.terminated()) turn.emit(EventType::Done);
    return turn.id();
}

void AgentRunner::run_turn(Session& session, Turn& turn, const RunOptions& options) {
    const uint32_t max_iterations = config_.agent.max_iterations;
    const uint32_t threshold = config_.agent.auto_compress_threshold_tokens;
    std::vector<ToolSpec> specs = tools_.specs();
    std::optional<AnalysisPlan> plan;
    std::string report_markdown;

    for (uint32_t iteration = 0; max_iterations == 0 || iteration < max_iterations; ++iteration) {
        if (stop_requested(options)) {
            turn.emit(EventType::Done);
            return;
        }
        turn.emit(EventType::IterationStart, {{"iteration", iteration}});

        Prompt prompt = build_prompt(session);
        if (iteration == 0 && !prompt.retrieval.is_null()) {
            turn.emit(EventType::Retrieval, prompt.retrieval);
        }
        uint32_t tokens = prompt.tokens();
        if (config_.agent.auto_compress_enabled && tokens > threshold) {
            if (auto data = compress(session, tokens, "auto_threshold")) {
                turn.emit(EventType::ContextCompressed, *data);
                prompt = build_prompt(session);
            }
        }
        std::vector<ChatMessage> messages = finalize(prompt);

        // Model call; one compress-and-retry on a context overflow before any output
        std::string full_text;
        std::vector<ToolCall> tool_calls;
        bool stopped = false;
        bool retried = false;
        for (;;) {
            full_text.clear();
            tool_calls.clear();
            try {
                resolver_.chat(messages, specs, [&](const LLMChunk& chunk) {
                    if (stop_requested(options)) {
                        stopped = true;
                        return false;
                    }
                    if (!chunk.text.empty()) {
                        full_text += chunk.text;
                        turn.emit(EventType::Text, chunk.text);
                    }
                    tool_calls.insert(tool_calls.end(), chunk.tool_calls.begin(),
                                      chunk.tool_calls.end());
                    return true;
                });
            } catch (const std::exception& e) {
                if (stopped || stop_requested(options)) {
                    // Aborted transfer, not a provider failure
                    turn.emit(EventType::Done);
                    return;
                }
                bool overflow = dynamic_cast<const ContextOverflowError*>(&e) != nullptr ||
                                (context_limit_classifier_ && context_limit_classifier_(e.what()));
                if (overflow && !retried && full_text.empty() && tool_calls.empty() &&
                    config_.agent.auto_compress_enabled) {
                    if (auto data = compress(session, estimate_messages_tokens(messages),
                                             "context_limit_error")) {
                        retried = true;
                        turn.emit(EventType::ContextCompressed, *data);
                        messages = build_messages(session);
                        continue;
                    }
                }
                std::cerr << "[agent] Model call failed: " << e.what() << "\n";
                turn.emit(EventType::Error, e.what());
                return;
            }
            break;
        }

        if (stopped || stop_requested(options)) {
            turn.emit(EventType::Done);
            return;
        }

        if (tool_calls.empty()) {
            session.add_message(Role::Assistant, full_text);
            turn.emit(EventType::Done);
            return;
        }

        // Leading text of the first tool-calling reply is the analysis plan
        std::string reasoning = trim(full_text);
        if (iteration == 0 && !reasoning.empty()) {
            plan = parse_analysis_plan(reasoning);
            if (plan) turn.emit(EventType::AnalysisPlan, plan->to_json());
            turn.emit(EventType::Reasoning, {{"content", reasoning}});
            save_plan_note(session, reasoning);
        }

        ChatMessage assistant = make_message(Role::Assistant, full_text);
        assistant.tool_calls = tool_calls;
        session.messages.push_back(std::move(assistant));

        for (const auto& call : tool_calls) {
            if (stop_requested(options)) {
                turn.emit(EventType::Done);
                return;
            }

            nlohmann::json call_meta = nlohmann::json::object();
            std::string intent;
            if (is_code_tool(call.name)) {
                intent = code_intent(parse_arguments(call.arguments));
                if (!intent.empty()) call_meta["intent"] = intent;
            }

            AnalysisStep* step = plan ? plan->claim_step(call.name) : nullptr;
            if (step) {
                step->status = "in_progress";
                turn.emit(EventType::PlanStepUpdate, step->to_json());
            }

            turn.emit(EventType::ToolCall,
                      {{"name", call.name}, {"arguments", call.arguments}}, &call, call_meta);

            if (auto artifact = persist_code(session, call.name, call.arguments)) {
                session.add_assistant_event("artifact", "code saved to workspace",
                                            {{"artifacts", nlohmann::json::array({*artifact})}});
                turn.emit(EventType::Artifact, *artifact, &call, call_meta);
            }

            nlohmann::json result = tools_.execute(call.name, session, call.arguments);
            bool failed = result_has_error(result);
            std::string status = failed ? "error" : "success";

            if (step) {
                step->status = failed ? "error" : "completed";
                turn.emit(EventType::PlanStepUpdate, step->to_json());
            }

            if (call.name == "generate_report" && !failed && result.contains("data")) {
                std::string md = string_field(result["data"], "report_markdown");
                if (!trim(md).empty()) report_markdown = md;
            }

            nlohmann::json result_meta = result.is_object() && result.contains("metadata") &&
                                                 result["metadata"].is_object()
                ? result["metadata"]
                : nlohmann::json::object();
            if (!intent.empty() && !result_meta.contains("intent")) result_meta["intent"] = intent;

            // History first, so a lost event never leaves history out of order
            session.add_tool_result(call.id, serialize_tool_result_for_history(result), call.name,
                                    status, intent, string_field(result_meta, "execution_id"));

            std::string message;
            if (failed) {
                message = string_field(result, "error");
                if (message.empty()) message = string_field(result, "message");
                if (message.empty()) message = "tool execution failed";
            } else {
                message = string_field(result, "message");
                if (message.empty()) message = "tool execution completed";
            }
            turn.emit(EventType::ToolResult,
                      {{"result", result}, {"status", status}, {"message", message}},
                      &call, result_meta);

            if (flag_field(result, "has_chart")) {
                nlohmann::json chart = result.contains("chart_data") ? result["chart_data"]
                                                                     : nlohmann::json();
                session.add_assistant_event("chart", "chart generated", {{"chart_data", chart}});
                turn.emit(EventType::Chart, chart, &call, call_meta);
            }
            if (flag_field(result, "has_dataframe")) {
                nlohmann::json preview = result.contains("dataframe_preview")
                    ? result["dataframe_preview"]
                    : nlohmann::json();
                session.add_assistant_event("data", "data preview", {{"data_preview", preview}});
                turn.emit(EventType::Data, preview, &call, call_meta);
            }
            if (result.contains("artifacts") && result["artifacts"].is_array()) {
                for (const auto& artifact : result["artifacts"]) {
                    session.add_assistant_event("artifact", "artifact generated",
                                                {{"artifacts", nlohmann::json::array({artifact})}});
                    turn.emit(EventType::Artifact, artifact, &call, call_meta);
                }
            }
            if (result.contains("images")) {
                nlohmann::json urls = nlohmann::json::array();
                const auto& images = result["images"];
                if (images.is_string()) {
                    urls.push_back(images);
                } else if (images.is_array()) {
                    for (const auto& url : images) {
                        if (url.is_string()) urls.push_back(url);
                    }
                }
                if (!urls.empty()) {
                    session.add_assistant_event("image", "image generated", {{"images", urls}});
                    turn.emit(EventType::Image, {{"urls", urls}}, &call, call_meta);
                }
            }
        }

        // The persisted report is the reply, byte for byte
        if (!report_markdown.empty()) {
            session.add_message(Role::Assistant, report_markdown);
            turn.emit(EventType::Text, report_markdown);
            turn.emit(EventType::Done);
            return;
        }
    }

    std::string message = "reached the maximum number of iterations (" +
                          std::to_string(max_iterations) + "), stopping";
    std::cerr << "[agent] " << message << "\n";
    turn.emit(EventType::Error, message);
}

} // namespace sciclaw
