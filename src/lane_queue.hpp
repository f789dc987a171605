#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sciclaw {

// Per-key serialization: work for the same key runs one at a time,
// different keys run concurrently. Not reentrant for the same key.
class LaneQueue {
public:
    template <typename Fn>
    auto execute(const std::string& key, Fn&& fn) -> decltype(fn()) {
        std::shared_ptr<std::mutex> lane = lane_for(key);
        std::lock_guard<std::mutex> hold(*lane);
        return fn();
    }

    // Drop the lane for a key; running work keeps its lane alive until done.
    void remove(const std::string& key);

    std::vector<std::string> keys() const;

private:
    std::shared_ptr<std::mutex> lane_for(const std::string& key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> lanes_;
};

} // namespace sciclaw
