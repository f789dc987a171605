#include "sse.hpp"

namespace sciclaw {

bool SSEParser::dispatch(const SSECallback& callback) {
    bool keep_going = true;
    if (!current_data_.empty()) {
        SSEEvent event{current_event_, current_data_};
        keep_going = callback(event);
    }
    current_event_.clear();
    current_data_.clear();
    return keep_going;
}

bool SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;  // incomplete line stays buffered

        std::string line = buffer_.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (line.empty()) {
            // Empty line = dispatch event
            if (!dispatch(callback)) {
                buffer_.erase(0, pos);
                return false;
            }
        } else if (line.rfind("event:", 0) == 0) {
            current_event_ = line.substr(line.size() > 6 && line[6] == ' ' ? 7 : 6);
        } else if (line.rfind("data:", 0) == 0) {
            if (!current_data_.empty()) {
                current_data_ += '\n';
            }
            // Handle both "data: payload" (with space) and "data:payload" (without)
            current_data_ += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
        }
        // Ignore other lines (comments starting with :, id:, retry:)
    }

    buffer_.erase(0, pos);
    return true;
}

bool SSEParser::finish(const SSECallback& callback) {
    if (!buffer_.empty()) {
        // Terminate the dangling line so it is parsed
        std::string rest;
        rest.swap(buffer_);
        if (!feed(rest + "\n", callback)) return false;
    }
    return dispatch(callback);
}

void SSEParser::reset() {
    buffer_.clear();
    current_event_.clear();
    current_data_.clear();
}

} // namespace sciclaw
