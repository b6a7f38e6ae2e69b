#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace FlowCore {

/**
 * @class EventChainTracker
 * @brief Bounded stack of the event types on the current dispatch path.
 *
 * Backed by a ring of fixed capacity; once full, pushing overwrites the
 * oldest entry. Not thread-safe: each dispatch path owns its own tracker.
 */
class EventChainTracker {
public:
    explicit EventChainTracker(size_t capacity);

    void push(const std::string& event_type);

    /// Remove the most recent entry (no-op when empty)
    void pop();

    bool contains(const std::string& event_type) const;

    size_t size() const { return count_; }
    size_t capacity() const { return slots_.size(); }
    bool empty() const { return count_ == 0; }

    /// Entries from oldest to newest
    std::vector<std::string> entries() const;

    void clear();

private:
    std::vector<std::string> slots_;
    size_t head_ = 0;
    size_t count_ = 0;
};

} // namespace FlowCore
