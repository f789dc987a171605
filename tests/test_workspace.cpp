#include <catch2/catch_test_macros.hpp>
#include "workspace.hpp"
#include "util.hpp"
#include "temp_dir.hpp"
#include <filesystem>

using namespace sciclaw;
using json = nlohmann::json;

// ── Names and URLs ───────────────────────────────────────────────

TEST_CASE("Workspace::sanitize_filename: strips directories and unsafe characters", "[workspace]") {
    REQUIRE(Workspace::sanitize_filename("../../etc/passwd") == "passwd");
    REQUIRE(Workspace::sanitize_filename("my plot (1).png") == "my_plot__1_.png");
    REQUIRE(Workspace::sanitize_filename("..") == "file");
    REQUIRE(Workspace::sanitize_filename("", "session") == "session");
    REQUIRE(Workspace::sanitize_filename("dir\\x.csv") == "x.csv");
}

TEST_CASE("Workspace: session root is sanitized", "[workspace]") {
    Workspace ws("/data/sessions", "../evil");
    REQUIRE(ws.root() == "/data/sessions/evil");
    REQUIRE(ws.artifacts_dir() == "/data/sessions/evil/artifacts");
}

TEST_CASE("Workspace::download_url: percent-encodes the name", "[workspace]") {
    Workspace ws("/tmp", "s1");
    REQUIRE(ws.download_url("a b.png") == "/api/artifacts/s1/a%20b.png");
}

// ── Artifacts ────────────────────────────────────────────────────

TEST_CASE("Workspace::save_artifact: writes file and index record", "[workspace]") {
    TempDir dir;
    Workspace ws(dir.path, "s1");
    auto rec = ws.save_artifact("report.md", "# Title", "report", "md");

    REQUIRE(rec["name"] == "report.md");
    REQUIRE(rec["type"] == "report");
    REQUIRE(rec["visibility"] == "deliverable");
    REQUIRE(read_file(rec["path"].get<std::string>()) == "# Title");

    auto list = ws.list_artifacts();
    REQUIRE(list.size() == 1);
    REQUIRE(list[0]["id"] == rec["id"]);
}

TEST_CASE("Workspace::add_artifact_record: same path upserts and keeps the id", "[workspace]") {
    TempDir dir;
    Workspace ws(dir.path, "s1");
    auto first = ws.save_artifact("plot.png", "v1", "chart", "png");
    auto second = ws.save_artifact("plot.png", "v2", "chart", "png", "internal");

    REQUIRE(first["id"] == second["id"]);
    auto list = ws.list_artifacts();
    REQUIRE(list.size() == 1);
    REQUIRE(list[0]["visibility"] == "internal");

    ws.save_artifact("other.png", "x", "chart", "png");
    REQUIRE(ws.list_artifacts().size() == 2);
}

TEST_CASE("Workspace: malformed index is replaced", "[workspace]") {
    TempDir dir;
    Workspace ws(dir.path, "s1");
    ws.ensure_dirs();
    atomic_write_file(ws.artifacts_dir() + "/artifacts.json", "{broken");
    ws.save_artifact("a.txt", "a", "note", "txt");
    auto index = json::parse(read_file(ws.artifacts_dir() + "/artifacts.json"));
    REQUIRE(index["artifacts"].size() == 1);
    REQUIRE(index["session_id"] == "s1");
}

// ── Executions and archives ──────────────────────────────────────

TEST_CASE("Workspace::save_code_execution: record file with optional fields", "[workspace]") {
    TempDir dir;
    Workspace ws(dir.path, "s1");
    auto rec = ws.save_code_execution("print(1)", "", "pending", "python", "run_code",
                                      {{"code", "print(1)"}}, "check");
    std::string path = ws.executions_dir() + "/" + rec["id"].get<std::string>() + ".json";
    auto stored = json::parse(read_file(path));
    REQUIRE(stored["status"] == "pending");
    REQUIRE(stored["intent"] == "check");
    REQUIRE(stored["tool_args"]["code"] == "print(1)");

    auto bare = ws.save_code_execution("x", "", "success", "r", "", nullptr);
    REQUIRE_FALSE(bare.contains("tool_name"));
    REQUIRE_FALSE(bare.contains("tool_args"));
}

TEST_CASE("Workspace::archive_messages: messages stored as JSON", "[workspace]") {
    TempDir dir;
    Workspace ws(dir.path, "s1");
    std::vector<ChatMessage> msgs = {{Role::User, "a"}, {Role::Assistant, "b"}};
    auto path = ws.archive_messages(msgs);
    REQUIRE(starts_with(path, ws.archive_dir() + "/compressed_"));
    auto stored = json::parse(read_file(path));
    REQUIRE(stored.size() == 2);
    REQUIRE(stored[1]["role"] == "assistant");
}
