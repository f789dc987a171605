#include <catch2/catch_test_macros.hpp>
#include "knowledge.hpp"
#include "temp_dir.hpp"
#include <filesystem>
#include <fstream>

using namespace sciclaw;

static void write_entry(const TempDir& dir, const std::string& name, const std::string& body) {
    std::filesystem::create_directories(std::filesystem::path(dir.file(name)).parent_path());
    std::ofstream(dir.file(name)) << body;
}

// ── parse_entry ──────────────────────────────────────────────────

TEST_CASE("KnowledgeLoader::parse_entry: header comments", "[knowledge]") {
    auto e = KnowledgeLoader::parse_entry("anova.md",
        "<!-- keywords: ANOVA, Variance , f-test -->\n<!-- priority: HIGH -->\n# ANOVA\nCheck homogeneity.");
    REQUIRE(e.keywords == std::set<std::string>{"anova", "variance", "f-test"});
    REQUIRE(e.priority == "high");
    REQUIRE(e.priority_weight() == 2);
    REQUIRE(e.content == "# ANOVA\nCheck homogeneity.");
}

TEST_CASE("KnowledgeLoader::parse_entry: unknown priority stays normal", "[knowledge]") {
    auto e = KnowledgeLoader::parse_entry("x.md", "<!-- priority: urgent -->\ntext");
    REQUIRE(e.priority == "normal");
    REQUIRE(e.keywords.empty());
    REQUIRE(e.content == "text");
}

// ── Directory loading and selection ──────────────────────────────

TEST_CASE("KnowledgeLoader: loads markdown recursively, skips README", "[knowledge]") {
    TempDir dir;
    write_entry(dir, "a.md", "<!-- keywords: regression -->\nA");
    write_entry(dir, "sub/b.md", "<!-- keywords: survival -->\nB");
    write_entry(dir, "README.md", "<!-- keywords: regression -->\nreadme");
    write_entry(dir, "notes.txt", "<!-- keywords: regression -->\ntxt");

    KnowledgeLoader loader(dir.path);
    REQUIRE(loader.size() == 2);
}

TEST_CASE("KnowledgeLoader: missing directory gives no entries", "[knowledge]") {
    KnowledgeLoader loader("/nonexistent/sciclaw/knowledge");
    REQUIRE(loader.size() == 0);
    REQUIRE(loader.select("anything", 3, 1000).hits.empty());
}

TEST_CASE("KnowledgeLoader::select: keyword hits weighted by priority", "[knowledge]") {
    TempDir dir;
    write_entry(dir, "low.md", "<!-- keywords: t-test, normality -->\n<!-- priority: low -->\nLOW");
    write_entry(dir, "high.md", "<!-- keywords: t-test -->\n<!-- priority: high -->\nHIGH");
    write_entry(dir, "none.md", "<!-- keywords: survival -->\nNONE");
    KnowledgeLoader loader(dir.path);

    auto sel = loader.select("Run a T-test and check normality", 3, 1000);
    REQUIRE(sel.hits.size() == 2);
    REQUIRE(sel.hits[0].source == "high.md");
    REQUIRE(sel.hits[0].score == 2.0);
    REQUIRE(sel.hits[1].hits == 2);
    REQUIRE(sel.text == "HIGH\n\nLOW");
    REQUIRE(sel.hits[0].to_json()["method"] == "keyword");
}

TEST_CASE("KnowledgeLoader::select: max_entries and empty query", "[knowledge]") {
    TempDir dir;
    write_entry(dir, "a.md", "<!-- keywords: model -->\nA");
    write_entry(dir, "b.md", "<!-- keywords: model -->\nB");
    KnowledgeLoader loader(dir.path);
    REQUIRE(loader.select("model", 1, 1000).hits.size() == 1);
    REQUIRE(loader.select("", 3, 1000).hits.empty());
}

TEST_CASE("KnowledgeLoader::select: char budget truncates the last entry", "[knowledge]") {
    TempDir dir;
    write_entry(dir, "a.md", "<!-- keywords: pca -->\n" + std::string(600, 'a'));
    write_entry(dir, "b.md", "<!-- keywords: pca -->\n" + std::string(600, 'b'));
    KnowledgeLoader loader(dir.path);

    auto sel = loader.select("pca", 5, 900);
    REQUIRE(sel.hits.size() == 2);
    REQUIRE(sel.text.find(std::string(300, 'b')) != std::string::npos);
    REQUIRE(sel.text.find(std::string(301, 'b')) == std::string::npos);
    REQUIRE(sel.text.size() < 1000);

    auto tight = loader.select("pca", 5, 700);
    REQUIRE(tight.hits.size() == 1);
}

TEST_CASE("KnowledgeLoader::reload: picks up new files", "[knowledge]") {
    TempDir dir;
    KnowledgeLoader loader(dir.path);
    REQUIRE(loader.size() == 0);
    write_entry(dir, "new.md", "<!-- keywords: anova -->\nnew");
    loader.reload();
    REQUIRE(loader.size() == 1);
}
