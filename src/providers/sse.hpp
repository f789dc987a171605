#pragma once
#include <string>
#include <functional>

namespace sciclaw {

struct SSEEvent {
    std::string event; // event type (e.g., "message_start", "content_block_delta")
    std::string data;  // raw JSON data
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental SSE parser. Lines and events may straddle feed() calls.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback asked to stop.
    bool feed(const std::string& chunk, const SSECallback& callback);

    // Dispatch a trailing event that was not followed by a blank line.
    bool finish(const SSECallback& callback);

    // Reset parser state
    void reset();

private:
    bool dispatch(const SSECallback& callback);

    std::string buffer_;
    std::string current_event_;
    std::string current_data_;
};

} // namespace sciclaw
