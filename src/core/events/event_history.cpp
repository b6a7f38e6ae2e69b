#include <flowcore/core/events/event_history.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace FlowCore {

EventHistory::EventHistory(size_t capacity)
    : slots_(std::max<size_t>(1, capacity)) {
    spdlog::debug("[EventHistory] initialized with capacity {}", slots_.size());
}

void EventHistory::push(const Event& e) {
    HistoryRecord record{e.id, e.type, e.timestamp, e.correlationId()};

    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ < slots_.size()) {
        slots_[(head_ + count_) % slots_.size()] = std::move(record);
        ++count_;
    } else {
        slots_[head_] = std::move(record);
        head_ = (head_ + 1) % slots_.size();
    }
    total_recorded_.fetch_add(1, std::memory_order_relaxed);
}

std::vector<HistoryRecord> EventHistory::getRecentEvents(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = std::min(max_count, count_);

    std::vector<HistoryRecord> result;
    result.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        size_t idx = (head_ + count_ - 1 - i) % slots_.size();
        result.push_back(slots_[idx]);
    }
    return result;
}

void EventHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
        slot = HistoryRecord{};
    }
    head_ = 0;
    count_ = 0;
}

} // namespace FlowCore
