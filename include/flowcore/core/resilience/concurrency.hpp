#pragma once

#include <flowcore/core/processor/middleware.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace FlowCore {

struct ConcurrencyStats {
    size_t activeKeys = 0;
    size_t inFlight = 0;
    size_t waiting = 0;
    uint64_t totalAcquired = 0;
    uint64_t totalDropped = 0;
    uint64_t totalTimedOut = 0;
};

/**
 * @class ConcurrencyLimiter
 * @brief Per-key cap on in-flight work with a FIFO wait queue.
 *
 * Share one limiter between every middleware that must count against the
 * same keys.
 */
class ConcurrencyLimiter {
public:
    /// RAII slot; releases on destruction
    class Permit {
    public:
        Permit() = default;
        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        ~Permit();

        void release();

    private:
        friend class ConcurrencyLimiter;
        Permit(ConcurrencyLimiter* owner, std::string key) : owner_(owner), key_(std::move(key)) {}

        ConcurrencyLimiter* owner_ = nullptr;
        std::string key_;
    };

    /**
     * @brief Take a slot for @p key, waiting up to @p queue_timeout for one.
     * @throws ConcurrencyLimitError CONCURRENCY_DROP when full and no wait is allowed,
     *         CONCURRENCY_TIMEOUT when the wait expires
     * @throws AbortedError when @p signal fires while waiting
     */
    Permit acquire(const std::string& key, size_t max_concurrent,
                   std::chrono::milliseconds queue_timeout, const AbortSignal& signal = nullptr);

    size_t inFlight(const std::string& key) const;
    ConcurrencyStats getStats() const;

private:
    struct KeyState {
        size_t in_flight = 0;
        std::deque<uint64_t> waiters;   // tickets, oldest first
    };

    void release(const std::string& key);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, KeyState> keys_;
    uint64_t next_ticket_ = 0;
    uint64_t total_acquired_ = 0;
    uint64_t total_dropped_ = 0;
    uint64_t total_timed_out_ = 0;
};

using ConcurrencyLimiterPtr = std::shared_ptr<ConcurrencyLimiter>;

struct ConcurrencyOptions {
    size_t maxConcurrent = 5;
    std::chrono::milliseconds queueTimeoutMs{0};   // 0 = drop immediately when full
    std::function<std::string(const Event&)> getKey;   // default: event type
};

/// Pipeline middleware bounding concurrent handler calls per key
Middleware withConcurrency(ConcurrencyLimiterPtr limiter, ConcurrencyOptions options = {});

} // namespace FlowCore
