#include <flowcore/core/resilience/concurrency.hpp>
#include <flowcore/core/errors.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace FlowCore {

namespace {
constexpr std::chrono::milliseconds ABORT_POLL_INTERVAL{10};
}

// ============================================================================
// Permit
// ============================================================================

ConcurrencyLimiter::Permit::Permit(Permit&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)) {
    other.owner_ = nullptr;
}

ConcurrencyLimiter::Permit& ConcurrencyLimiter::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        key_ = std::move(other.key_);
        other.owner_ = nullptr;
    }
    return *this;
}

ConcurrencyLimiter::Permit::~Permit() {
    release();
}

void ConcurrencyLimiter::Permit::release() {
    if (owner_) {
        owner_->release(key_);
        owner_ = nullptr;
    }
}

// ============================================================================
// ConcurrencyLimiter
// ============================================================================

ConcurrencyLimiter::Permit ConcurrencyLimiter::acquire(const std::string& key, size_t max_concurrent,
                                                       std::chrono::milliseconds queue_timeout,
                                                       const AbortSignal& signal) {
    max_concurrent = std::max<size_t>(1, max_concurrent);

    std::unique_lock<std::mutex> lock(mutex_);
    auto& state = keys_[key];

    if (state.in_flight < max_concurrent && state.waiters.empty()) {
        ++state.in_flight;
        ++total_acquired_;
        return Permit(this, key);
    }

    if (queue_timeout.count() <= 0) {
        ++total_dropped_;
        if (state.in_flight == 0 && state.waiters.empty()) keys_.erase(key);
        throw ConcurrencyLimitError("CONCURRENCY_DROP",
                                    "Concurrency limit " + std::to_string(max_concurrent) +
                                        " reached for " + key);
    }

    const uint64_t ticket = next_ticket_++;
    state.waiters.push_back(ticket);
    const auto deadline = std::chrono::steady_clock::now() + queue_timeout;

    auto leave_queue = [&]() {
        auto& s = keys_[key];
        s.waiters.erase(std::remove(s.waiters.begin(), s.waiters.end(), ticket), s.waiters.end());
        if (s.in_flight == 0 && s.waiters.empty()) keys_.erase(key);
        cv_.notify_all();
    };

    while (true) {
        auto& s = keys_[key];
        if (s.in_flight < max_concurrent && !s.waiters.empty() && s.waiters.front() == ticket) {
            s.waiters.pop_front();
            ++s.in_flight;
            ++total_acquired_;
            cv_.notify_all();
            return Permit(this, key);
        }
        if (isAborted(signal)) {
            leave_queue();
            throw AbortedError("Concurrency wait aborted for " + key);
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            ++total_timed_out_;
            leave_queue();
            throw ConcurrencyLimitError("CONCURRENCY_TIMEOUT",
                                        "Timed out after " + std::to_string(queue_timeout.count()) +
                                            "ms waiting for a slot on " + key);
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, ABORT_POLL_INTERVAL);
        cv_.wait_for(lock, slice);
    }
}

void ConcurrencyLimiter::release(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = keys_.find(key);
        if (it == keys_.end()) return;
        if (it->second.in_flight > 0) --it->second.in_flight;
        if (it->second.in_flight == 0 && it->second.waiters.empty()) {
            keys_.erase(it);
        }
    }
    cv_.notify_all();
}

size_t ConcurrencyLimiter::inFlight(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(key);
    return it == keys_.end() ? 0 : it->second.in_flight;
}

ConcurrencyStats ConcurrencyLimiter::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ConcurrencyStats stats;
    stats.activeKeys = keys_.size();
    for (const auto& [key, state] : keys_) {
        stats.inFlight += state.in_flight;
        stats.waiting += state.waiters.size();
    }
    stats.totalAcquired = total_acquired_;
    stats.totalDropped = total_dropped_;
    stats.totalTimedOut = total_timed_out_;
    return stats;
}

// ============================================================================
// Middleware
// ============================================================================

Middleware withConcurrency(ConcurrencyLimiterPtr limiter, ConcurrencyOptions options) {
    if (!limiter) {
        limiter = std::make_shared<ConcurrencyLimiter>();
    }

    Middleware mw;
    mw.name = "concurrency";
    mw.kind = MiddlewareKind::PIPELINE;
    mw.wrap = [limiter, options](PipelineHandler next) -> PipelineHandler {
        return [limiter, options, next = std::move(next)](const Event& event,
                                                          const AbortSignal& signal) {
            const std::string key = options.getKey ? options.getKey(event) : event.type;
            ConcurrencyLimiter::Permit permit;
            try {
                permit = limiter->acquire(key, options.maxConcurrent, options.queueTimeoutMs, signal);
            } catch (const ConcurrencyLimitError& e) {
                if (event.cost) {
                    event.cost->concurrencyDrops.fetch_add(1, std::memory_order_relaxed);
                }
                spdlog::warn("[Concurrency] {} ({})", e.what(), e.code());
                throw;
            }
            return next(event, signal);
        };
    };
    return mw;
}

} // namespace FlowCore
