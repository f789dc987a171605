#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include "temp_dir.hpp"
#include <filesystem>
#include <cstdlib>
#include <stdexcept>

using namespace sciclaw;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
    REQUIRE(trim("").empty());
}

// ── split ────────────────────────────────────────────────────────

TEST_CASE("split: empty parts preserved", "[util]") {
    REQUIRE(split("a,,b", ',') == std::vector<std::string>{"a", "", "b"});
}

TEST_CASE("split: empty string gives no parts", "[util]") {
    REQUIRE(split("", ',').empty());
}

// ── replace_all / to_lower / affixes ─────────────────────────────

TEST_CASE("replace_all: replacement containing the pattern terminates", "[util]") {
    REQUIRE(replace_all("aaa", "a", "aa") == "aaaaaa");
    REQUIRE(replace_all("hello", "", "x") == "hello");
}

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("ReadCSV") == "readcsv");
}

TEST_CASE("starts_with / ends_with", "[util]") {
    REQUIRE(starts_with("library(dplyr)", "library"));
    REQUIRE_FALSE(starts_with("lib", "library"));
    REQUIRE(ends_with("plot.png", ".png"));
    REQUIRE_FALSE(ends_with("png", ".png"));
}

// ── generate_id / timestamps ─────────────────────────────────────

TEST_CASE("generate_id: 16 hex chars, distinct", "[util]") {
    auto a = generate_id();
    auto b = generate_id();
    REQUIRE(a.size() == 16);
    REQUIRE(a.find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(a != b);
}

TEST_CASE("compact_timestamp: filename safe", "[util]") {
    auto ts = compact_timestamp();
    REQUIRE(ts.size() == 15);
    REQUIRE(ts[8] == '_');
}

TEST_CASE("timestamp_now: ISO 8601 UTC", "[util]") {
    auto ts = timestamp_now();
    REQUIRE(ts.size() == 20);
    REQUIRE(ts.back() == 'Z');
    REQUIRE(ts[10] == 'T');
}

// ── estimate_tokens ──────────────────────────────────────────────

TEST_CASE("estimate_tokens: four chars per token", "[util]") {
    REQUIRE(estimate_tokens("") == 0);
    REQUIRE(estimate_tokens("abcdefgh") == 2);
    REQUIRE(estimate_tokens("ab") == 0);
}

// ── utf8_truncate ────────────────────────────────────────────────

TEST_CASE("utf8_truncate: short string unchanged", "[util]") {
    REQUIRE(utf8_truncate("abc", 10) == "abc");
}

TEST_CASE("utf8_truncate: never splits a multi-byte sequence", "[util]") {
    std::string s = "a\xe4\xb8\x96";  // a + 3-byte char
    REQUIRE(utf8_truncate(s, 2) == "a");
    REQUIRE(utf8_truncate(s, 3) == "a");
    REQUIRE(utf8_truncate(s, 4) == s);
}

// ── files ────────────────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parents and leaves no temp file", "[util]") {
    TempDir dir;
    std::string path = dir.file("nested/out.txt");
    atomic_write_file(path, "first");
    atomic_write_file(path, "second");
    REQUIRE(read_file(path) == "second");

    size_t count = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir.file("nested"))) {
        (void)e;
        count++;
    }
    REQUIRE(count == 1);
}

TEST_CASE("read_file: missing file throws", "[util]") {
    TempDir dir;
    REQUIRE_THROWS_AS(read_file(dir.file("nope.txt")), std::runtime_error);
}

TEST_CASE("expand_home: tilde replaced by HOME", "[util]") {
    const char* home = std::getenv("HOME");
    if (!home) return;
    REQUIRE(expand_home("~/x") == std::string(home) + "/x");
    REQUIRE(expand_home("/abs/x") == "/abs/x");
}

// ── base64 ───────────────────────────────────────────────────────

TEST_CASE("base64_encode: RFC 4648 vectors", "[util]") {
    REQUIRE(base64_encode("") == "");
    REQUIRE(base64_encode("f") == "Zg==");
    REQUIRE(base64_encode("fo") == "Zm8=");
    REQUIRE(base64_encode("foo") == "Zm9v");
    REQUIRE(base64_encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64_decode: skips whitespace and stops at padding", "[util]") {
    REQUIRE(base64_decode("Zm9v\nYmFy") == "foobar");
    REQUIRE(base64_decode("Zg==") == "f");
}

TEST_CASE("base64: binary bytes survive", "[util]") {
    std::string bin("\x89PNG\r\n\x1a\n\0\xff", 10);
    REQUIRE(base64_decode(base64_encode(bin)) == bin);
}
