#include "generate_report.hpp"
#include "tool_util.hpp"
#include "../plugin.hpp"
#include "../session.hpp"
#include "../util.hpp"
#include "../workspace.hpp"
#include <filesystem>
#include <set>

static sciclaw::ToolRegistrar reg_generate_report("generate_report",
    [](const sciclaw::Config& config) {
        return std::make_unique<sciclaw::GenerateReportTool>(config.sessions_dir());
    });

namespace sciclaw {

namespace {

constexpr size_t kMaxFindings = 12;
constexpr size_t kMaxCharts = 12;
constexpr size_t kFindingChars = 120;

const char* kNoisePatterns[] = {
    "stdout:", "stderr:", "kaleido", "chromium", "chrome", "timed out",
    "traceback", "error installing", "deprecationwarning",
};

bool is_noise(const std::string& text) {
    std::string lower = to_lower(text);
    for (const char* p : kNoisePatterns) {
        if (lower.find(p) != std::string::npos) return true;
    }
    return false;
}

std::string dataset_overview(const Session& session, const std::vector<std::string>& names) {
    std::vector<std::string> targets = names;
    if (targets.empty()) {
        for (const auto& [name, _] : session.datasets) targets.push_back(name);
    }
    if (targets.empty()) return "No datasets loaded in this session.";

    std::string out;
    for (const auto& name : targets) {
        auto it = session.datasets.find(name);
        if (it == session.datasets.end()) continue;
        const Dataset& ds = it->second;
        size_t numeric = 0;
        for (size_t c = 0; c < ds.column_count(); ++c) {
            std::string dtype = ds.column_dtype(c);
            if (dtype == "int64" || dtype == "float64") ++numeric;
        }
        size_t missing = 0;
        for (const auto& row : ds.rows) {
            for (const auto& cell : row) {
                if (cell.is_null()) ++missing;
            }
        }
        if (!out.empty()) out += "\n";
        out += "- **" + name + "**: " + std::to_string(ds.row_count()) + " rows x " +
               std::to_string(ds.column_count()) + " columns, " + std::to_string(numeric) +
               " numeric, " + std::to_string(missing) + " missing values";
    }
    return out.empty() ? "The requested datasets do not exist." : out;
}

std::string recent_findings(const std::vector<ChatMessage>& messages) {
    std::vector<std::string> findings;
    for (auto it = messages.rbegin(); it != messages.rend() && findings.size() < kMaxFindings; ++it) {
        if (it->role != Role::Tool) continue;
        nlohmann::json parsed = nlohmann::json::parse(it->content, nullptr, false);
        if (!parsed.is_object()) continue;
        if (parsed.value("success", true) == false || parsed.contains("error")) continue;
        if (!parsed.contains("message") || !parsed["message"].is_string()) continue;
        std::string message = trim(parsed["message"].get<std::string>());
        if (message.empty() || is_noise(message)) continue;
        findings.push_back("- " + utf8_truncate(message, kFindingChars));
    }
    std::string out;
    for (auto it = findings.rbegin(); it != findings.rend(); ++it) {
        if (!out.empty()) out += "\n";
        out += *it;
    }
    return out;
}

std::string chart_section(const Workspace& workspace) {
    std::set<std::string> seen;
    std::string out;
    size_t count = 0;
    for (const auto& item : workspace.list_artifacts()) {
        if (!item.is_object() || item.value("type", "") != "chart") continue;
        std::string name = item.value("name", "");
        if (name.empty() || !seen.insert(to_lower(name)).second) continue;
        std::string url = item.value("download_url", workspace.download_url(name));
        std::string ext = to_lower(std::filesystem::path(name).extension().string());
        ++count;
        out += "### Figure " + std::to_string(count) + ": " + name + "\n";
        if (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".svg" || ext == ".gif") {
            out += "![" + name + "](" + url + ")\n\n";
        } else if (ext == ".html") {
            out += "[Open interactive chart](" + url + ")\n\n";
        } else {
            out += "[View chart file](" + url + ")\n\n";
        }
        if (count >= kMaxCharts) break;
    }
    return trim(out);
}

std::string output_name(const Workspace& workspace, const std::string& requested) {
    std::string raw = trim(requested);
    if (raw.empty()) raw = "report_" + compact_timestamp() + ".md";
    if (!ends_with(raw, ".md")) raw += ".md";
    std::string safe = Workspace::sanitize_filename(raw, "report.md");
    if (!ends_with(safe, ".md")) safe += ".md";

    std::string stem = safe.substr(0, safe.size() - 3);
    std::string candidate = safe;
    for (int n = 2; std::filesystem::exists(workspace.artifacts_dir() + "/" + candidate); ++n) {
        candidate = stem + "_" + std::to_string(n) + ".md";
    }
    return candidate;
}

} // namespace

GenerateReportTool::GenerateReportTool(std::string sessions_dir)
    : sessions_dir_(std::move(sessions_dir)) {}

std::string GenerateReportTool::description() const {
    return "Generate a structured markdown analysis report and save it as a session "
           "artifact. Pass methods, summary_text and conclusions; key findings are "
           "collected from earlier tool results.";
}

std::string GenerateReportTool::parameters_json() const {
    return R"({"type":"object","properties":{)"
           R"("title":{"type":"string","default":"Data Analysis Report"},)"
           R"("summary_text":{"type":"string","description":"Core results: key statistics, p-values, effect sizes"},)"
           R"("methods":{"type":"string","description":"Methods used and why"},)"
           R"("conclusions":{"type":"string","description":"Interpretation, limitations, next steps"},)"
           R"("dataset_names":{"type":"array","items":{"type":"string"}},)"
           R"("include_recent_messages":{"type":"boolean","default":true},)"
           R"("include_charts":{"type":"boolean","default":true},)"
           R"json("filename":{"type":"string","description":"Artifact file name (.md)"})json"
           R"(},"required":[]})";
}

std::string GenerateReportTool::build_markdown(const Session& session, const Workspace& workspace,
                                               const nlohmann::json& args) {
    std::string title = trim(optional_string(args, "title", "Data Analysis Report"));
    if (title.empty()) title = "Data Analysis Report";
    std::vector<std::string> names;
    if (args.contains("dataset_names") && args["dataset_names"].is_array()) {
        for (const auto& n : args["dataset_names"]) {
            if (n.is_string()) names.push_back(n.get<std::string>());
        }
    }

    std::string md = "# " + title + "\n\n> Session: `" + session.id + "` | Generated: " +
                     timestamp_now() + "\n\n## Datasets\n" + dataset_overview(session, names) + "\n";

    auto section = [&](const char* heading, const std::string& body) {
        std::string text = trim(body);
        if (!text.empty()) md += std::string("\n## ") + heading + "\n" + text + "\n";
    };
    section("Methods", optional_string(args, "methods"));
    section("Summary", optional_string(args, "summary_text"));
    if (optional_bool(args, "include_charts", true)) section("Figures", chart_section(workspace));
    if (optional_bool(args, "include_recent_messages", true)) {
        section("Key Findings", recent_findings(session.messages));
    }
    section("Conclusions", optional_string(args, "conclusions"));
    return md;
}

ToolResult GenerateReportTool::execute(Session& session, const nlohmann::json& args) {
    Workspace workspace(sessions_dir_, session.id);
    std::string markdown = build_markdown(session, workspace, args);
    std::string name = output_name(workspace, optional_string(args, "filename"));
    nlohmann::json record = workspace.save_artifact(name, markdown, "report", "md");

    ToolResult result;
    result.message = "report saved as `" + name + "`";
    result.data = {
        {"title", trim(optional_string(args, "title", "Data Analysis Report"))},
        {"filename", name},
        {"report_markdown", markdown},
    };
    result.artifacts.push_back({
        {"name", name},
        {"type", "report"},
        {"format", "md"},
        {"path", record.value("path", "")},
        {"download_url", record.value("download_url", "")},
    });
    return result;
}

} // namespace sciclaw
