#include <catch2/catch_test_macros.hpp>
#include "sandbox/python_executor.hpp"
#include "sandbox/process.hpp"
#include "temp_dir.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>

using namespace sciclaw;

// ── Helpers ──────────────────────────────────────────────────────

namespace {

bool has_python() {
    return !find_executable("python3").empty();
}

struct PythonFixture {
    TempDir dir;
    SandboxConfig cfg;
    std::unique_ptr<PythonExecutor> exec;

    PythonFixture() {
        cfg.timeout = 20;
        exec = std::make_unique<PythonExecutor>(cfg, dir.path);
    }

    void reconfigure() { exec = std::make_unique<PythonExecutor>(cfg, dir.path); }

    SandboxResult run(const std::string& code) {
        SandboxRequest req;
        req.session_id = "py";
        req.code = code;
        return exec->execute(req);
    }
};

} // namespace

// ── Policy lists ─────────────────────────────────────────────────

TEST_CASE("PythonExecutor: policy lists", "[python]") {
    const auto& imports = PythonExecutor::allowed_imports();
    REQUIRE(std::find(imports.begin(), imports.end(), "pandas") != imports.end());
    REQUIRE(std::find(imports.begin(), imports.end(), "os") == imports.end());
    REQUIRE(std::find(imports.begin(), imports.end(), "subprocess") == imports.end());

    const auto& banned = PythonExecutor::banned_calls();
    REQUIRE(std::find(banned.begin(), banned.end(), "open") != banned.end());
    REQUIRE(std::find(banned.begin(), banned.end(), "__import__") != banned.end());
}

TEST_CASE("PythonExecutor: missing interpreter is a configuration error", "[python]") {
    TempDir dir;
    SandboxConfig cfg;
    cfg.python = "/nonexistent/python3";
    PythonExecutor exec(cfg, dir.path);
    SandboxRequest req;
    req.session_id = "s";
    req.code = "result = 1";
    auto r = exec.execute(req);
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error_kind == SandboxErrorKind::Configuration);
    REQUIRE(exec.last_worker_pid() == 0);
}

// ── Execution ────────────────────────────────────────────────────

TEST_CASE("PythonExecutor: scalar result and captured output", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    auto r = f.run("import math\nprint('hello')\nresult = math.sqrt(16) + 1");
    INFO(r.error);
    REQUIRE(r.success);
    REQUIRE(r.stdout_text == "hello\n");
    REQUIRE(r.result.kind == ResultValue::Kind::Scalar);
    REQUIRE(r.result.scalar == 5.0);
    REQUIRE(f.exec->last_worker_pid() > 0);
}

TEST_CASE("PythonExecutor: no result assigned", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    auto r = f.run("x = [1, 2, 3]");
    REQUIRE(r.success);
    REQUIRE(r.result.kind == ResultValue::Kind::None);
}

TEST_CASE("PythonExecutor: unrepresentable result becomes its repr", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    auto r = f.run("class Model:\n    def __repr__(self):\n        return 'Model()'\nresult = Model()");
    INFO(r.error);
    REQUIRE(r.success);
    REQUIRE(r.result.kind == ResultValue::Kind::Opaque);
    REQUIRE(r.result.repr == "Model()");
}

TEST_CASE("PythonExecutor: datasets are bound and copied", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    SandboxRequest req;
    req.session_id = "py";
    req.code = "result = [len(datasets['trial']), len(df)]";
    req.datasets["trial"] = parse_csv("dose,response\n1,2.5\n2,3.1\n3,4.0\n");
    req.active_dataset = "trial";

    auto r = f.exec->execute(req);
    INFO(r.error);
    REQUIRE(r.success);
    REQUIRE(r.result.scalar == nlohmann::json::array({3, 3}));
    REQUIRE(r.updated_datasets.empty());
}

TEST_CASE("PythonExecutor: mutations without persist leave the caller's datasets alone", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    SandboxRequest req;
    req.session_id = "py";
    req.code =
        "if isinstance(df, list):\n"
        "    df.append({'dose': 9, 'response': 9.9})\n"
        "    datasets['trial'].clear()\n"
        "else:\n"
        "    df['response'] = 0\n"
        "    df.drop(index=0, inplace=True)\n"
        "datasets['extra'] = df\n"
        "datasets.pop('trial')\n"
        "result = 42\n";
    req.datasets["trial"] = parse_csv("dose,response\n1,2.5\n2,3.1\n3,4.0\n");
    req.active_dataset = "trial";
    const auto before = req.datasets;

    auto r = f.exec->execute(req);
    INFO(r.error);
    REQUIRE(r.success);
    REQUIRE(r.result.scalar == 42);
    REQUIRE(r.updated_datasets.empty());
    REQUIRE(req.datasets == before);

    // the next call starts from the caller's copy, not the mutated one
    req.code = "result = [len(df), len(datasets)]";
    auto again = f.exec->execute(req);
    INFO(again.error);
    REQUIRE(again.success);
    REQUIRE(again.result.scalar == nlohmann::json::array({3, 1}));
}

TEST_CASE("PythonExecutor: records become a table result", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    auto r = f.run("result = 1\noutput_df = [{'g': 'a', 'n': 1}, {'g': 'b', 'n': 2}]");
    INFO(r.error);
    REQUIRE(r.success);
    REQUIRE(r.result.kind == ResultValue::Kind::Table);
    REQUIRE(r.result.table.columns == std::vector<std::string>{"g", "n"});
    REQUIRE(r.result.table.row_count() == 2);
}

TEST_CASE("PythonExecutor: persist returns every dataset", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    SandboxRequest req;
    req.session_id = "py";
    req.code = "result = len(df)";
    req.datasets["a"] = parse_csv("x\n1\n");
    req.datasets["b"] = parse_csv("y\n2\n");
    req.active_dataset = "a";
    req.persist = true;

    auto r = f.exec->execute(req);
    INFO(r.error);
    REQUIRE(r.success);
    REQUIRE(r.updated_datasets.size() == 2);
    REQUIRE(r.updated_datasets.at("a").columns == std::vector<std::string>{"x"});
}

TEST_CASE("PythonExecutor: unknown active dataset is an error", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    SandboxRequest req;
    req.session_id = "py";
    req.code = "result = 1";
    req.active_dataset = "missing";
    auto r = f.exec->execute(req);
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error == "dataset 'missing' does not exist");
}

TEST_CASE("PythonExecutor: exceptions carry a traceback", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    auto r = f.run("print('before')\n1 / 0");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error_kind == SandboxErrorKind::Code);
    REQUIRE(r.error == "ZeroDivisionError: division by zero");
    REQUIRE(r.traceback.find("ZeroDivisionError") != std::string::npos);
    REQUIRE(r.stdout_text == "before\n");
}

TEST_CASE("PythonExecutor: policy violations", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;

    auto imp = f.run("import os\nresult = os.getcwd()");
    REQUIRE(imp.error_kind == SandboxErrorKind::Policy);
    REQUIRE(imp.error == "import of module os is not allowed (line 1)");

    auto from = f.run("from subprocess import run");
    REQUIRE(from.error_kind == SandboxErrorKind::Policy);

    auto call = f.run("x = 1\nopen('/etc/passwd')");
    REQUIRE(call.error_kind == SandboxErrorKind::Policy);
    REQUIRE(call.error == "call to open is not allowed (line 2)");

    auto dunder = f.run("result = ().__class__.__bases__");
    REQUIRE(dunder.error_kind == SandboxErrorKind::Policy);

    auto syntax = f.run("def broken(:");
    REQUIRE(syntax.error_kind == SandboxErrorKind::Policy);
    REQUIRE(syntax.error.rfind("syntax error", 0) == 0);
}

TEST_CASE("PythonExecutor: timeout kills the worker", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    f.cfg.timeout = 2;
    f.reconfigure();

    auto start = std::chrono::steady_clock::now();
    auto r = f.run("while True:\n    pass");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(r.success);
    REQUIRE(r.error_kind == SandboxErrorKind::Timeout);
    REQUIRE(elapsed < std::chrono::seconds(10));

    pid_t pid = f.exec->last_worker_pid();
    REQUIRE(pid > 0);
    int rc = kill(pid, 0);
    int err = errno;
    REQUIRE(rc == -1);
    REQUIRE(err == ESRCH);
}

TEST_CASE("PythonExecutor: memory ceiling stops large allocations", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    f.cfg.max_memory_mb = 512;
    f.reconfigure();

    auto r = f.run("block = bytearray(8 * 1024 * 1024 * 1024)\nresult = len(block)");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error.find("MemoryError") != std::string::npos);
}

TEST_CASE("PythonExecutor: large results do not deadlock the pipe", "[python][worker]") {
    if (!has_python()) SKIP("python3 not installed");
    PythonFixture f;
    auto r = f.run("result = 'x' * (4 * 1024 * 1024)");
    INFO(r.error);
    REQUIRE(r.success);
    REQUIRE(r.result.scalar.get<std::string>().size() == 4u * 1024 * 1024);
}
