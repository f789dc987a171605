#include "lane_queue.hpp"
#include <algorithm>

namespace sciclaw {

std::shared_ptr<std::mutex> LaneQueue::lane_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& lane = lanes_[key];
    if (!lane) lane = std::make_shared<std::mutex>();
    return lane;
}

void LaneQueue::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    lanes_.erase(key);
}

std::vector<std::string> LaneQueue::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(lanes_.size());
    for (const auto& [key, _] : lanes_) out.push_back(key);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace sciclaw
