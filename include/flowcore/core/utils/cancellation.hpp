#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace FlowCore {

/**
 * @class CancellationToken
 * @brief Cooperative cancellation flag shared between a caller and the work it started.
 *
 * Once cancelled it stays cancelled. Waiters blocked in waitFor() are woken
 * immediately, which lets backoff sleeps and queue waits end early.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /**
     * @brief Sleep for up to @p duration.
     * @return true if the token was cancelled before or during the wait
     */
    bool waitFor(std::chrono::milliseconds duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

/// Optional abort signal threaded through handler calls; nullptr means "never aborted"
using AbortSignal = std::shared_ptr<CancellationToken>;

inline AbortSignal makeAbortSignal() {
    return std::make_shared<CancellationToken>();
}

inline bool isAborted(const AbortSignal& signal) {
    return signal && signal->isCancelled();
}

} // namespace FlowCore
