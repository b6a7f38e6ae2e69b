#include <flowcore/core/events/chain_tracker.hpp>

#include <algorithm>

namespace FlowCore {

EventChainTracker::EventChainTracker(size_t capacity)
    : slots_(std::max<size_t>(1, capacity)) {}

void EventChainTracker::push(const std::string& event_type) {
    if (count_ < slots_.size()) {
        slots_[(head_ + count_) % slots_.size()] = event_type;
        ++count_;
    } else {
        slots_[head_] = event_type;
        head_ = (head_ + 1) % slots_.size();
    }
}

void EventChainTracker::pop() {
    if (count_ == 0) return;
    slots_[(head_ + count_ - 1) % slots_.size()].clear();
    --count_;
}

bool EventChainTracker::contains(const std::string& event_type) const {
    for (size_t i = 0; i < count_; ++i) {
        if (slots_[(head_ + i) % slots_.size()] == event_type) return true;
    }
    return false;
}

std::vector<std::string> EventChainTracker::entries() const {
    std::vector<std::string> out;
    out.reserve(count_);
    for (size_t i = 0; i < count_; ++i) {
        out.push_back(slots_[(head_ + i) % slots_.size()]);
    }
    return out;
}

void EventChainTracker::clear() {
    for (auto& s : slots_) s.clear();
    head_ = 0;
    count_ = 0;
}

} // namespace FlowCore
