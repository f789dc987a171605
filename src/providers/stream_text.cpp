#include "stream_text.hpp"
#include <algorithm>

namespace sciclaw {

static const std::string kOpenTag = "<think>";
static const std::string kCloseTag = "</think>";
static constexpr size_t kMinCumulativePrefix = 4;

// Length of the longest suffix of s that is a proper prefix of tag.
static size_t partial_tag_suffix(const std::string& s, const std::string& tag) {
    size_t max_len = std::min(s.size(), tag.size() - 1);
    for (size_t len = max_len; len > 0; --len) {
        if (s.compare(s.size() - len, len, tag, 0, len) == 0) return len;
    }
    return 0;
}

ThinkTagParser::Output ThinkTagParser::feed(const std::string& text) {
    Output out;
    std::string buf = pending_ + text;
    pending_.clear();

    while (!buf.empty()) {
        const std::string& tag = inside_ ? kCloseTag : kOpenTag;
        std::string& sink = inside_ ? out.reasoning : out.visible;

        size_t pos = buf.find(tag);
        if (pos != std::string::npos) {
            sink.append(buf, 0, pos);
            buf.erase(0, pos + tag.size());
            inside_ = !inside_;
            continue;
        }

        size_t hold = partial_tag_suffix(buf, tag);
        sink.append(buf, 0, buf.size() - hold);
        pending_ = buf.substr(buf.size() - hold);
        break;
    }
    return out;
}

ThinkTagParser::Output ThinkTagParser::flush() {
    Output out;
    if (inside_) out.reasoning = pending_;
    else out.visible = pending_;
    pending_.clear();
    return out;
}

std::string DeltaReconciler::next(const std::string& piece) {
    if (piece.empty()) return {};

    bool extends = !accumulated_.empty() &&
                   piece.size() > accumulated_.size() &&
                   piece.compare(0, accumulated_.size(), accumulated_) == 0;

    // Short prefixes are too ambiguous to switch modes on
    if (cumulative_ || (extends && accumulated_.size() >= kMinCumulativePrefix)) {
        if (extends) {
            cumulative_ = true;
            std::string delta = piece.substr(accumulated_.size());
            accumulated_ = piece;
            return delta;
        }
        // Cumulative stream repeating or rewinding: nothing new unless it diverged
        if (accumulated_.compare(0, piece.size(), piece) == 0) return {};
        cumulative_ = false;
    }

    accumulated_ += piece;
    return piece;
}

} // namespace sciclaw
