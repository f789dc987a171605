#pragma once
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sciclaw {

struct KnowledgeHit {
    std::string source;
    double score = 0.0;
    int hits = 0;
    std::string snippet;
    std::string method = "keyword";

    nlohmann::json to_json() const;
};

struct KnowledgeSelection {
    std::string text;  // joined entry bodies
    std::vector<KnowledgeHit> hits;
};

// Reference material retrieved for the latest user message.
class KnowledgeSource {
public:
    virtual ~KnowledgeSource() = default;
    virtual KnowledgeSelection select(const std::string& query,
                                      size_t max_entries,
                                      size_t max_chars) const = 0;
    virtual std::string mode() const { return "keyword"; }
};

struct KnowledgeEntry {
    std::string source;  // file name
    std::set<std::string> keywords;  // lowercase
    std::string priority = "normal";
    std::string content;  // comments removed

    int priority_weight() const;
};

// Markdown files under a directory, headed by optional
//   <!-- keywords: a, b -->
//   <!-- priority: high|normal|low -->
class KnowledgeLoader : public KnowledgeSource {
public:
    explicit KnowledgeLoader(std::string dir);

    // Rescan the directory. Unreadable files are skipped.
    void reload();
    size_t size() const;

    KnowledgeSelection select(const std::string& query,
                              size_t max_entries,
                              size_t max_chars) const override;

    static KnowledgeEntry parse_entry(const std::string& source, const std::string& raw);

private:
    std::string dir_;
    mutable std::mutex mutex_;
    std::vector<KnowledgeEntry> entries_;
};

} // namespace sciclaw
