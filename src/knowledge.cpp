#include "knowledge.hpp"
#include "util.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace sciclaw {

nlohmann::json KnowledgeHit::to_json() const {
    return {{"source", source}, {"score", score}, {"hits", hits},
            {"snippet", snippet}, {"method", method}};
}

int KnowledgeEntry::priority_weight() const {
    if (priority == "high") return 2;
    if (priority == "low") return 0;
    return 1;
}

KnowledgeLoader::KnowledgeLoader(std::string dir) : dir_(expand_home(dir)) {
    reload();
}

// Value of "<!-- name: value -->", empty if absent
static std::string comment_field(const std::string& raw, const std::string& name) {
    std::string lower = to_lower(raw);
    size_t pos = 0;
    while ((pos = lower.find("<!--", pos)) != std::string::npos) {
        size_t end = lower.find("-->", pos + 4);
        if (end == std::string::npos) break;
        std::string body = trim(raw.substr(pos + 4, end - pos - 4));
        if (starts_with(to_lower(body), name + ":")) {
            return trim(body.substr(name.size() + 1));
        }
        pos = end + 3;
    }
    return "";
}

KnowledgeEntry KnowledgeLoader::parse_entry(const std::string& source, const std::string& raw) {
    KnowledgeEntry entry;
    entry.source = source;

    for (const auto& kw : split(comment_field(raw, "keywords"), ',')) {
        std::string k = to_lower(trim(kw));
        if (!k.empty()) entry.keywords.insert(k);
    }
    std::string priority = to_lower(comment_field(raw, "priority"));
    if (priority == "high" || priority == "normal" || priority == "low") {
        entry.priority = priority;
    }

    std::string content;
    size_t pos = 0;
    for (;;) {
        size_t open = raw.find("<!--", pos);
        if (open == std::string::npos) {
            content += raw.substr(pos);
            break;
        }
        content += raw.substr(pos, open - pos);
        size_t close = raw.find("-->", open + 4);
        if (close == std::string::npos) break;
        pos = close + 3;
    }
    entry.content = trim(content);
    return entry;
}

void KnowledgeLoader::reload() {
    std::vector<KnowledgeEntry> fresh;
    std::error_code ec;
    if (!dir_.empty() && fs::is_directory(dir_, ec)) {
        std::vector<fs::path> files;
        for (auto it = fs::recursive_directory_iterator(dir_, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;
            const fs::path& p = it->path();
            if (p.extension() != ".md") continue;
            if (to_lower(p.filename().string()) == "readme.md") continue;
            files.push_back(p);
        }
        std::sort(files.begin(), files.end());
        for (const auto& p : files) {
            try {
                fresh.push_back(parse_entry(p.filename().string(), read_file(p.string())));
            } catch (const std::exception& e) {
                std::cerr << "[knowledge] Skipping " << p.string() << ": " << e.what() << "\n";
            }
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = std::move(fresh);
}

size_t KnowledgeLoader::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

KnowledgeSelection KnowledgeLoader::select(const std::string& query,
                                           size_t max_entries,
                                           size_t max_chars) const {
    KnowledgeSelection out;
    if (query.empty()) return out;
    std::string q = to_lower(query);

    struct Scored {
        double score;
        int hits;
        const KnowledgeEntry* entry;
    };

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Scored> scored;
    for (const auto& entry : entries_) {
        int hits = 0;
        for (const auto& kw : entry.keywords) {
            if (q.find(kw) != std::string::npos) ++hits;
        }
        if (hits == 0) continue;
        scored.push_back({static_cast<double>(hits * entry.priority_weight()), hits, &entry});
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const Scored& a, const Scored& b) { return a.score > b.score; });

    size_t total = 0;
    std::vector<std::string> parts;
    for (size_t i = 0; i < scored.size() && i < max_entries; ++i) {
        std::string chunk = scored[i].entry->content;
        bool last = false;
        if (total + chunk.size() > max_chars) {
            size_t remaining = max_chars - total;
            if (remaining <= 200) break;
            chunk = utf8_truncate(chunk, remaining) + "\n...";
            last = true;
        }
        parts.push_back(chunk);
        total += chunk.size();

        KnowledgeHit hit;
        hit.source = scored[i].entry->source;
        hit.score = scored[i].score;
        hit.hits = scored[i].hits;
        hit.snippet = utf8_truncate(chunk, 300);
        out.hits.push_back(std::move(hit));
        if (last) break;
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out.text += "\n\n";
        out.text += parts[i];
    }
    return out;
}

} // namespace sciclaw
