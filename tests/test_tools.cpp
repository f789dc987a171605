#include <catch2/catch_test_macros.hpp>
#include "tool.hpp"
#include "errors.hpp"
#include "session.hpp"
#include "util.hpp"
#include "workspace.hpp"
#include "tools/run_code.hpp"
#include "tools/run_r_code.hpp"
#include "tools/generate_report.hpp"
#include "temp_dir.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace sciclaw;

// ── Helpers ──────────────────────────────────────────────────────

namespace {

class EchoTool : public Tool {
public:
    nlohmann::json last_args;

    ToolResult execute(Session&, const nlohmann::json& args) override {
        last_args = args;
        ToolResult r;
        r.message = "echo";
        r.data = args;
        return r;
    }
    std::string tool_name() const override { return "echo"; }
    std::string description() const override { return "Echo arguments"; }
    std::string parameters_json() const override { return R"({"type":"object"})"; }
};

class ThrowingTool : public Tool {
public:
    bool configuration = false;

    ToolResult execute(Session&, const nlohmann::json&) override {
        if (configuration) throw ConfigurationError("interpreter missing");
        throw ToolExecutionError("disk full");
    }
    std::string tool_name() const override { return "boom"; }
    std::string description() const override { return "Always fails"; }
    std::string parameters_json() const override { return R"({"type":"object"})"; }
};

// Returns a scripted result and records the request it was given
class FakeExecutor : public CodeExecutor {
public:
    SandboxResult next;
    SandboxRequest last_request;
    int calls = 0;

    SandboxResult execute(const SandboxRequest& request) override {
        ++calls;
        last_request = request;
        return next;
    }
    std::string language() const override { return "python"; }
};

struct CodeToolFixture {
    TempDir dir;
    FakeExecutor* executor = nullptr;
    std::unique_ptr<RunCodeTool> tool;
    Session session{"sess-1"};

    CodeToolFixture() {
        auto exec = std::make_unique<FakeExecutor>();
        executor = exec.get();
        tool = std::make_unique<RunCodeTool>(std::move(exec), dir.path);
        session.datasets["trial"] = parse_csv("dose,response\n1,2.5\n2,3.1\n");
    }

    ToolResult run(const nlohmann::json& args) { return tool->execute(session, args); }
};

SandboxResult ok_result() {
    SandboxResult r;
    r.success = true;
    return r;
}

} // namespace

// ── ToolRegistry ─────────────────────────────────────────────────

TEST_CASE("ToolRegistry: unknown tool gives an error result", "[tools]") {
    ToolRegistry registry;
    Session session("s");
    auto result = registry.execute("missing", session, "{}");
    REQUIRE(result["success"] == false);
    REQUIRE(result["error"] == "Unknown tool: missing");
}

TEST_CASE("ToolRegistry: dispatches parsed arguments", "[tools]") {
    ToolRegistry registry;
    auto echo = std::make_unique<EchoTool>();
    EchoTool* raw = echo.get();
    registry.add(std::move(echo));
    Session session("s");

    auto result = registry.execute("echo", session, R"({"x": 1})");
    REQUIRE(result["success"] == true);
    REQUIRE(result["message"] == "echo");
    REQUIRE(raw->last_args["x"] == 1);
}

TEST_CASE("ToolRegistry: empty arguments become an empty object", "[tools]") {
    ToolRegistry registry;
    auto echo = std::make_unique<EchoTool>();
    EchoTool* raw = echo.get();
    registry.add(std::move(echo));
    Session session("s");

    registry.execute("echo", session, "");
    REQUIRE(raw->last_args.is_object());
    REQUIRE(raw->last_args.empty());
}

TEST_CASE("ToolRegistry: repairs truncated arguments", "[tools]") {
    ToolRegistry registry;
    auto echo = std::make_unique<EchoTool>();
    EchoTool* raw = echo.get();
    registry.add(std::move(echo));
    Session session("s");

    auto result = registry.execute("echo", session, R"({"code": "print(1)", "tags": ["a",)");
    REQUIRE(result["success"] == true);
    REQUIRE(raw->last_args["code"] == "print(1)");
    REQUIRE(raw->last_args["tags"] == nlohmann::json::array({"a"}));
}

TEST_CASE("ToolRegistry: unparseable arguments give a parse error", "[tools]") {
    ToolRegistry registry;
    registry.add(std::make_unique<EchoTool>());
    Session session("s");

    auto result = registry.execute("echo", session, "code = print(1)");
    REQUIRE(result["success"] == false);
    REQUIRE(result["error"].get<std::string>().rfind("tool argument parse failed", 0) == 0);
}

TEST_CASE("ToolRegistry: non-object arguments are rejected", "[tools]") {
    ToolRegistry registry;
    registry.add(std::make_unique<EchoTool>());
    Session session("s");

    auto result = registry.execute("echo", session, "[1, 2]");
    REQUIRE(result["success"] == false);
    REQUIRE(result["error"] ==
            "tool argument parse failed: arguments must be a JSON object");
}

TEST_CASE("ToolRegistry: tool exceptions become error results", "[tools]") {
    ToolRegistry registry;
    registry.add(std::make_unique<ThrowingTool>());
    Session session("s");

    auto result = registry.execute("boom", session, "{}");
    REQUIRE(result["success"] == false);
    REQUIRE(result["error"] == "tool boom failed: disk full");
}

TEST_CASE("ToolRegistry: configuration errors propagate", "[tools]") {
    ToolRegistry registry;
    auto tool = std::make_unique<ThrowingTool>();
    tool->configuration = true;
    registry.add(std::move(tool));
    Session session("s");

    REQUIRE_THROWS_AS(registry.execute("boom", session, "{}"), ConfigurationError);
}

TEST_CASE("ToolRegistry: specs and names follow registration order", "[tools]") {
    ToolRegistry registry;
    registry.add(std::make_unique<EchoTool>());
    registry.add(std::make_unique<ThrowingTool>());

    REQUIRE(registry.names() == std::vector<std::string>{"echo", "boom"});
    REQUIRE(registry.has("boom"));
    REQUIRE_FALSE(registry.has("shell"));

    auto specs = registry.specs();
    REQUIRE(specs.size() == 2);
    REQUIRE(specs[0].name == "echo");
    REQUIRE(specs[1].description == "Always fails");
}

TEST_CASE("repair_json: leaves valid and hopeless input alone", "[tools]") {
    REQUIRE(repair_json(R"({"a": 1})") == R"({"a": 1})");
    REQUIRE(repair_json(R"({"a": [1, 2,]})") == R"({"a": [1, 2]})");
    REQUIRE(repair_json("not json at all") == "not json at all");
}

// ── ToolResult ───────────────────────────────────────────────────

TEST_CASE("ToolResult::to_json: minimal success", "[tools]") {
    ToolResult r;
    r.message = "done";
    auto j = r.to_json();
    REQUIRE(j["success"] == true);
    REQUIRE(j["message"] == "done");
    REQUIRE(j["has_chart"] == false);
    REQUIRE(j["has_dataframe"] == false);
    REQUIRE_FALSE(j.contains("data"));
    REQUIRE_FALSE(j.contains("error"));
    REQUIRE_FALSE(j.contains("artifacts"));
    REQUIRE_FALSE(j.contains("metadata"));
}

TEST_CASE("ToolResult::to_json: optional payloads", "[tools]") {
    ToolResult r = ToolResult::failure("bad", {{"stderr", "oops"}});
    r.error = "bad";
    r.has_chart = true;
    r.chart_data = {{"data", nlohmann::json::array()}};
    r.images.push_back("plot.png");
    r.metadata["error_kind"] = "code";

    auto j = r.to_json();
    REQUIRE(j["success"] == false);
    REQUIRE(j["error"] == "bad");
    REQUIRE(j["data"]["stderr"] == "oops");
    REQUIRE(j["chart_data"].contains("data"));
    REQUIRE(j["images"][0] == "plot.png");
    REQUIRE(j["metadata"]["error_kind"] == "code");
}

// ── CodeTool ─────────────────────────────────────────────────────

TEST_CASE("CodeTool: empty code is rejected without running", "[tools][code]") {
    CodeToolFixture f;
    auto r = f.run({{"code", "   "}, {"intent", "check"}});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.message == "code must not be empty");
    REQUIRE(r.metadata["intent"] == "check");
    REQUIRE(f.executor->calls == 0);
}

TEST_CASE("CodeTool: unknown dataset is rejected without running", "[tools][code]") {
    CodeToolFixture f;
    auto r = f.run({{"code", "result = 1"}, {"dataset_name", "nope"}});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.message == "dataset 'nope' does not exist");
    REQUIRE(f.executor->calls == 0);
}

TEST_CASE("CodeTool: request carries code and dataset snapshot", "[tools][code]") {
    CodeToolFixture f;
    f.executor->next = ok_result();
    f.run({{"code", "  df.describe()  "}, {"dataset_name", "trial"}, {"persist_df", true}});

    const auto& req = f.executor->last_request;
    REQUIRE(req.session_id == "sess-1");
    REQUIRE(req.code == "df.describe()");
    REQUIRE(req.active_dataset == std::optional<std::string>("trial"));
    REQUIRE(req.persist);
    REQUIRE(req.datasets.count("trial") == 1);
}

TEST_CASE("CodeTool: policy rejections are reported as blocked", "[tools][code]") {
    CodeToolFixture f;
    f.executor->next = SandboxResult::failure(SandboxErrorKind::Policy, "import of 'os' is not allowed");
    auto r = f.run({{"code", "import os"}});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.message == "sandbox policy blocked: import of 'os' is not allowed");
}

TEST_CASE("CodeTool: missing interpreter throws ConfigurationError", "[tools][code]") {
    CodeToolFixture f;
    f.executor->next = SandboxResult::failure(SandboxErrorKind::Configuration, "python3 not found");
    REQUIRE_THROWS_AS(f.run({{"code", "result = 1"}}), ConfigurationError);
}

TEST_CASE("CodeTool: code failures keep output and error kind", "[tools][code]") {
    CodeToolFixture f;
    SandboxResult out = SandboxResult::failure(SandboxErrorKind::Code, "ZeroDivisionError: division by zero");
    out.stdout_text = "before";
    out.traceback = "Traceback (most recent call last): ...";
    f.executor->next = out;

    auto r = f.run({{"code", "1/0"}, {"label", "ratio"}});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.message == "code execution failed: ZeroDivisionError: division by zero");
    REQUIRE(r.data["stdout"] == "before");
    REQUIRE(r.data["traceback"] == "Traceback (most recent call last): ...");
    REQUIRE(r.metadata["error_kind"] == "code");
    REQUIRE(r.metadata["intent"] == "ratio");
}

TEST_CASE("CodeTool: timeouts report their error kind", "[tools][code]") {
    CodeToolFixture f;
    f.executor->next = SandboxResult::failure(SandboxErrorKind::Timeout, "execution timed out after 30s");
    auto r = f.run({{"code", "while True: pass"}});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.metadata["error_kind"] == "timeout");
}

TEST_CASE("CodeTool: scalar result with output", "[tools][code]") {
    CodeToolFixture f;
    SandboxResult out = ok_result();
    out.result = ResultValue::of_scalar(2.8);
    out.stdout_text = "mean computed\n";
    f.executor->next = out;

    auto r = f.run({{"code", "result = df.response.mean()"}});
    REQUIRE(r.success);
    REQUIRE(r.data["result"] == 2.8);
    REQUIRE(r.data["result_type"] == "scalar");
    REQUIRE(r.message == "code executed\nstdout:\nmean computed");
}

TEST_CASE("CodeTool: no result value", "[tools][code]") {
    CodeToolFixture f;
    f.executor->next = ok_result();
    auto r = f.run({{"code", "x = 1"}});
    REQUIRE(r.success);
    REQUIRE(r.data["result"].is_null());
    REQUIRE(r.data["result_type"] == "none");
    REQUIRE(r.message == "code executed");
}

TEST_CASE("CodeTool: opaque results carry their repr", "[tools][code]") {
    CodeToolFixture f;
    SandboxResult out = ok_result();
    out.result.kind = ResultValue::Kind::Opaque;
    out.result.repr = "<object at 0x1>";
    f.executor->next = out;

    auto r = f.run({{"code", "result = object()"}});
    REQUIRE(r.data["result_type"] == "opaque");
    REQUIRE(r.data["result_repr"] == "<object at 0x1>");
}

TEST_CASE("CodeTool: table result is previewed and saved as a dataset", "[tools][code]") {
    CodeToolFixture f;
    SandboxResult out = ok_result();
    out.result = ResultValue::of_table(parse_csv("group,n\na,3\nb,4\nc,5\n"));
    f.executor->next = out;

    auto r = f.run({{"code", "output_df = summary"}, {"save_as", "counts"}});
    REQUIRE(r.success);
    REQUIRE(r.has_dataframe);
    REQUIRE(r.dataframe_preview["total_rows"] == 3);
    REQUIRE(r.data["result_type"] == "dataframe");
    REQUIRE(r.message == "code executed, returned a table (3 rows x 2 columns), saved as dataset 'counts'");
    REQUIRE(f.session.datasets.count("counts") == 1);
    REQUIRE(f.session.datasets["counts"].row_count() == 3);
}

TEST_CASE("CodeTool: table without save_as leaves datasets alone", "[tools][code]") {
    CodeToolFixture f;
    SandboxResult out = ok_result();
    out.result = ResultValue::of_table(parse_csv("a\n1\n"));
    f.executor->next = out;

    auto r = f.run({{"code", "output_df = df.head(1)"}});
    REQUIRE(r.message == "code executed, returned a table (1 rows x 1 columns)");
    REQUIRE(f.session.datasets.size() == 1);
}

TEST_CASE("CodeTool: persisted datasets are folded into the session", "[tools][code]") {
    CodeToolFixture f;
    SandboxResult out = ok_result();
    out.updated_datasets["trial"] = parse_csv("dose,response,log_dose\n1,2.5,0\n2,3.1,0.69\n");
    f.executor->next = out;

    f.run({{"code", "df['log_dose'] = np.log(df.dose)"}, {"dataset_name", "trial"},
           {"persist_df", true}});
    REQUIRE(f.session.datasets["trial"].column_count() == 3);
}

TEST_CASE("CodeTool: plotly figures become chart artifacts", "[tools][code]") {
    CodeToolFixture f;
    SandboxResult out = ok_result();
    Figure fig;
    fig.library = "plotly";
    fig.title = "Dose response";
    fig.plotly_json = R"({"data": [{"type": "scatter", "x": [1, 2], "y": [2.5, 3.1]}], "layout": {}})";
    out.figures.push_back(fig);
    f.executor->next = out;

    auto r = f.run({{"code", "fig = px.scatter(df)"}, {"label", "dose response"}});
    REQUIRE(r.success);
    REQUIRE(r.has_chart);
    REQUIRE(r.chart_data["data"][0]["type"] == "scatter");
    REQUIRE(r.artifacts.size() == 2);
    REQUIRE(r.artifacts[0]["name"] == "dose_response.plotly.json");
    REQUIRE(r.artifacts[1]["name"] == "dose_response.html");
    REQUIRE(r.artifacts[1]["type"] == "chart");
    REQUIRE(r.message == "code executed\nexported 2 chart artifact(s)");

    std::string html = read_file(r.artifacts[1]["path"].get<std::string>());
    REQUIRE(html.find("Plotly.newPlot") != std::string::npos);
    REQUIRE(html.find("<title>Dose response</title>") != std::string::npos);

    Workspace ws(f.dir.path, "sess-1");
    REQUIRE(ws.list_artifacts().size() == 2);
}

TEST_CASE("CodeTool: plotly JSON cannot close the page script", "[tools][code]") {
    CodeToolFixture f;
    SandboxResult out = ok_result();
    Figure fig;
    fig.library = "plotly";
    fig.plotly_json = R"({"data": [], "layout": {"title": "</script><b>x"}})";
    out.figures.push_back(fig);
    f.executor->next = out;

    auto r = f.run({{"code", "fig = go.Figure()"}, {"label", "t"}});
    std::string html = read_file(r.artifacts[1]["path"].get<std::string>());
    REQUIRE(html.find("<\\/script><b>x") != std::string::npos);
}

TEST_CASE("CodeTool: matplotlib figures are decoded to files", "[tools][code]") {
    CodeToolFixture f;
    SandboxResult out = ok_result();
    Figure fig;
    fig.library = "matplotlib";
    fig.svg_base64 = base64_encode("<svg></svg>");
    fig.png_base64 = base64_encode(std::string("\x89PNG\r\n", 6));
    out.figures.push_back(fig);
    f.executor->next = out;

    auto r = f.run({{"code", "plt.plot([1, 2])"}, {"label", "line"}});
    REQUIRE(r.artifacts.size() == 2);
    REQUIRE(r.artifacts[0]["format"] == "svg");
    REQUIRE(read_file(r.artifacts[0]["path"].get<std::string>()) == "<svg></svg>");
    REQUIRE(r.artifacts[1]["name"] == "line.png");
    REQUIRE_FALSE(r.has_chart);
}

TEST_CASE("CodeTool: several figures get numbered names", "[tools][code]") {
    CodeToolFixture f;
    SandboxResult out = ok_result();
    for (int i = 0; i < 2; ++i) {
        Figure fig;
        fig.library = "matplotlib";
        fig.svg_base64 = base64_encode("<svg/>");
        out.figures.push_back(fig);
    }
    f.executor->next = out;

    auto r = f.run({{"code", "..."}, {"label", "hist"}});
    REQUIRE(r.artifacts.size() == 2);
    REQUIRE(r.artifacts[0]["name"] == "hist_1.svg");
    REQUIRE(r.artifacts[1]["name"] == "hist_2.svg");
}

TEST_CASE("RunRCodeTool: R plot files are copied into artifacts", "[tools][code]") {
    TempDir dir;
    auto exec = std::make_unique<FakeExecutor>();
    FakeExecutor* raw = exec.get();
    RunRCodeTool tool(std::move(exec), dir.path);
    REQUIRE(tool.tool_name() == "run_r_code");
    REQUIRE(tool.code_extension() == "R");

    std::string plot_path = dir.file("plots/plot_1.png");
    std::filesystem::create_directories(std::filesystem::path(plot_path).parent_path());
    {
        std::ofstream out(plot_path, std::ios::binary);
        out << "PNGDATA";
    }

    SandboxResult out = ok_result();
    Figure fig;
    fig.library = "r";
    fig.path = plot_path;
    fig.format = "png";
    out.figures.push_back(fig);
    raw->next = out;

    Session session("r-sess");
    auto r = tool.execute(session, {{"code", "plot(1:10)"}, {"label", "scatter"}});
    REQUIRE(r.success);
    REQUIRE(r.artifacts.size() == 1);
    std::string name = r.artifacts[0]["name"];
    REQUIRE(starts_with(name, "scatter_"));
    REQUIRE(ends_with(name, "_00.png"));
    REQUIRE(read_file(r.artifacts[0]["path"].get<std::string>()) == "PNGDATA");
}

// ── GenerateReportTool ───────────────────────────────────────────

TEST_CASE("GenerateReportTool: markdown sections", "[tools][report]") {
    TempDir dir;
    Session session("rep");
    session.datasets["trial"] = parse_csv("dose,response,site\n1,2.5,A\n2,,B\n");
    session.add_tool_result("c1", R"({"success": true, "message": "t = 4.2, p = 0.003"})",
                            "run_code", "success");
    session.add_tool_result("c2", R"({"success": false, "message": "boom"})",
                            "run_code", "error");
    session.add_tool_result("c3", R"({"success": true, "message": "stderr: warning"})",
                            "run_code", "success");

    Workspace ws(dir.path, session.id);
    ws.save_artifact("dose.png", "png", "chart", "png");

    nlohmann::json args = {
        {"title", "Trial Analysis"},
        {"methods", "Welch t-test"},
        {"summary_text", "Response rises with dose."},
        {"conclusions", "Effect is significant."},
    };
    std::string md = GenerateReportTool::build_markdown(session, ws, args);

    REQUIRE(starts_with(md, "# Trial Analysis\n"));
    REQUIRE(md.find("> Session: `rep`") != std::string::npos);
    REQUIRE(md.find("- **trial**: 2 rows x 3 columns, 2 numeric, 1 missing values") != std::string::npos);
    REQUIRE(md.find("## Methods\nWelch t-test") != std::string::npos);
    REQUIRE(md.find("## Summary\nResponse rises with dose.") != std::string::npos);
    REQUIRE(md.find("### Figure 1: dose.png") != std::string::npos);
    REQUIRE(md.find("![dose.png](") != std::string::npos);
    REQUIRE(md.find("## Key Findings\n- t = 4.2, p = 0.003") != std::string::npos);
    REQUIRE(md.find("boom") == std::string::npos);
    REQUIRE(md.find("stderr: warning") == std::string::npos);
    REQUIRE(md.find("## Conclusions\nEffect is significant.") != std::string::npos);
    REQUIRE(md.find("## Methods") < md.find("## Summary"));
    REQUIRE(md.find("## Key Findings") < md.find("## Conclusions"));
}

TEST_CASE("GenerateReportTool: empty sections are omitted", "[tools][report]") {
    TempDir dir;
    Session session("rep");
    Workspace ws(dir.path, session.id);

    std::string md = GenerateReportTool::build_markdown(
        session, ws, {{"title", "  "}, {"include_charts", false}});
    REQUIRE(starts_with(md, "# Data Analysis Report\n"));
    REQUIRE(md.find("No datasets loaded in this session.") != std::string::npos);
    REQUIRE(md.find("## Methods") == std::string::npos);
    REQUIRE(md.find("## Figures") == std::string::npos);
    REQUIRE(md.find("## Key Findings") == std::string::npos);
}

TEST_CASE("GenerateReportTool: saves the report as an artifact", "[tools][report]") {
    TempDir dir;
    GenerateReportTool tool(dir.path);
    Session session("rep");

    auto first = tool.execute(session, {{"filename", "final report"}, {"summary_text", "x"}});
    REQUIRE(first.success);
    REQUIRE(first.data["filename"] == "final_report.md");
    REQUIRE(first.artifacts[0]["type"] == "report");
    REQUIRE(first.message == "report saved as `final_report.md`");

    std::string path = first.artifacts[0]["path"];
    REQUIRE(read_file(path) == first.data["report_markdown"].get<std::string>());

    auto second = tool.execute(session, {{"filename", "final report.md"}});
    REQUIRE(second.data["filename"] == "final_report_2.md");
}

TEST_CASE("GenerateReportTool: default filename is timestamped", "[tools][report]") {
    TempDir dir;
    GenerateReportTool tool(dir.path);
    Session session("rep");

    auto r = tool.execute(session, nlohmann::json::object());
    std::string name = r.data["filename"];
    REQUIRE(starts_with(name, "report_"));
    REQUIRE(ends_with(name, ".md"));
}
