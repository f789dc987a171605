#pragma once
#include <string>

namespace sciclaw {

// Splits a text stream into visible text and <think>...</think> reasoning.
// Two states (outside / inside a tag pair); a tag split across feeds is held
// back in a lookback buffer until it is confirmed or ruled out.
class ThinkTagParser {
public:
    struct Output {
        std::string visible;
        std::string reasoning;
        bool empty() const { return visible.empty() && reasoning.empty(); }
    };

    Output feed(const std::string& text);

    // Release anything still held back (end of stream).
    Output flush();

    bool inside() const { return inside_; }

private:
    bool inside_ = false;
    std::string pending_;
};

// Turns cumulative text snapshots into deltas. Some vendors resend the whole
// text so far on every chunk; once a chunk is seen that strictly extends the
// accumulated text, the stream is treated as cumulative from then on.
class DeltaReconciler {
public:
    std::string next(const std::string& piece);
    const std::string& accumulated() const { return accumulated_; }
    bool cumulative() const { return cumulative_; }

private:
    std::string accumulated_;
    bool cumulative_ = false;
};

} // namespace sciclaw
