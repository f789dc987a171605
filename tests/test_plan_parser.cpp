#include <catch2/catch_test_macros.hpp>
#include "plan_parser.hpp"

using namespace sciclaw;

// ── Parsing ──────────────────────────────────────────────────────

TEST_CASE("parse_analysis_plan: dotted numbered list", "[plan]") {
    auto plan = parse_analysis_plan("Plan:\n1. Inspect the data\n2. Run a t-test\n3. Summarize\n");
    REQUIRE(plan);
    REQUIRE(plan->steps.size() == 3);
    REQUIRE(plan->steps[0].id == 1);
    REQUIRE(plan->steps[1].title == "Run a t-test");
    REQUIRE(plan->steps[2].status == "pending");
}

TEST_CASE("parse_analysis_plan: parenthesis, Step N: and CJK markers", "[plan]") {
    auto a = parse_analysis_plan("1) Load\n2) Clean");
    REQUIRE(a);
    REQUIRE(a->steps[1].title == "Clean");

    auto b = parse_analysis_plan("Step 1: Describe\nstep 2. Model");
    REQUIRE(b);
    REQUIRE(b->steps[0].title == "Describe");
    REQUIRE(b->steps[1].title == "Model");

    auto c = parse_analysis_plan("第1步：读取数据\n第2步 绘图");
    REQUIRE(c);
    REQUIRE(c->steps[0].title == "读取数据");
    REQUIRE(c->steps[1].title == "绘图");

    auto d = parse_analysis_plan("1、描述统计\n2、回归分析");
    REQUIRE(d);
    REQUIRE(d->steps[1].title == "回归分析");
}

TEST_CASE("parse_analysis_plan: bullets used when numbering is absent", "[plan]") {
    auto plan = parse_analysis_plan("- check missing values\n* fit the model\n• plot residuals");
    REQUIRE(plan);
    REQUIRE(plan->steps.size() == 3);
    REQUIRE(plan->steps[2].id == 3);
    REQUIRE(plan->steps[2].title == "plot residuals");
}

TEST_CASE("parse_analysis_plan: numbered steps win over bullets", "[plan]") {
    auto plan = parse_analysis_plan("1. Load\n- detail\n2. Fit\n- detail\n- more");
    REQUIRE(plan);
    REQUIRE(plan->steps.size() == 2);
    REQUIRE(plan->steps[1].title == "Fit");
}

TEST_CASE("parse_analysis_plan: tool hints split off the title", "[plan]") {
    auto plan = parse_analysis_plan("1. Describe data - tool: run_code\n"
                                    "2. Mixed model - using tool: run_r_code\n"
                                    "3. Report — 使用工具：generate_report\n"
                                    "4. Note the tool: choice\n");
    REQUIRE(plan);
    REQUIRE(plan->steps[0].title == "Describe data");
    REQUIRE(plan->steps[0].tool_hint == std::optional<std::string>("run_code"));
    REQUIRE(plan->steps[1].title == "Mixed model");
    REQUIRE(plan->steps[1].tool_hint == std::optional<std::string>("run_r_code"));
    REQUIRE(plan->steps[2].title == "Report");
    REQUIRE(plan->steps[2].tool_hint == std::optional<std::string>("generate_report"));
    REQUIRE_FALSE(plan->steps[3].tool_hint);
}

TEST_CASE("parse_analysis_plan: fewer than two steps is no plan", "[plan]") {
    REQUIRE_FALSE(parse_analysis_plan("1. Only one step"));
    REQUIRE_FALSE(parse_analysis_plan("The mean is 4.2 and p < 0.05."));
    REQUIRE_FALSE(parse_analysis_plan(""));
}

TEST_CASE("parse_analysis_plan: decimals and dashes without space are not steps", "[plan]") {
    REQUIRE_FALSE(parse_analysis_plan("1.5 is the effect\n2.7 is the other"));
    REQUIRE_FALSE(parse_analysis_plan("-1 degrees\n-2 degrees"));
}

TEST_CASE("parse_analysis_plan: keeps raw text and CRLF input", "[plan]") {
    std::string text = "1. A\r\n2. B\r\n";
    auto plan = parse_analysis_plan(text);
    REQUIRE(plan);
    REQUIRE(plan->raw_text == text);
    REQUIRE(plan->steps[1].title == "B");
}

// ── Step claiming ────────────────────────────────────────────────

TEST_CASE("AnalysisPlan::claim_step: hinted step preferred, else first pending", "[plan]") {
    auto plan = parse_analysis_plan("1. Describe\n2. Plot - tool: run_r_code\n3. Report");
    REQUIRE(plan);

    AnalysisStep* s = plan->claim_step("run_r_code");
    REQUIRE(s->id == 2);
    s->status = "completed";

    s = plan->claim_step("run_r_code");
    REQUIRE(s->id == 1);
    s->status = "in_progress";

    s = plan->claim_step("run_code");
    REQUIRE(s->id == 3);
    s->status = "error";

    REQUIRE(plan->claim_step("run_code") == nullptr);
}

TEST_CASE("AnalysisPlan::to_json: steps with null hints", "[plan]") {
    auto plan = parse_analysis_plan("1. A - tool: run_code\n2. B");
    auto j = plan->to_json();
    REQUIRE(j["steps"].size() == 2);
    REQUIRE(j["steps"][0]["tool_hint"] == "run_code");
    REQUIRE(j["steps"][1]["tool_hint"].is_null());
    REQUIRE(j["raw_text"] == "1. A - tool: run_code\n2. B");
}
