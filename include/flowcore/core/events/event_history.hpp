#pragma once

#include <flowcore/core/events/event.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace FlowCore {

struct HistoryRecord {
    std::string id;
    std::string type;
    uint64_t timestamp = 0;
    std::optional<std::string> correlationId;
};

/**
 * @class EventHistory
 * @brief Fixed-capacity ring of the most recently processed events.
 *
 * When full, the oldest record is overwritten. Thread-safe.
 */
class EventHistory {
public:
    static constexpr size_t DEFAULT_CAPACITY = 10000;

    explicit EventHistory(size_t capacity = DEFAULT_CAPACITY);

    void push(const Event& e);

    /**
     * @brief Get recent events for debugging
     * @param max_count Maximum records to retrieve
     * @return Records newest first
     */
    std::vector<HistoryRecord> getRecentEvents(size_t max_count = 50) const;

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    size_t capacity() const { return slots_.size(); }

    /// Cumulative number of recorded events, including overwritten ones
    uint64_t totalRecorded() const {
        return total_recorded_.load(std::memory_order_relaxed);
    }

    void clear();

private:
    std::atomic<uint64_t> total_recorded_{0};
    mutable std::mutex mutex_;
    std::vector<HistoryRecord> slots_;
    size_t head_ = 0;   // index of the oldest record
    size_t count_ = 0;
};

} // namespace FlowCore
