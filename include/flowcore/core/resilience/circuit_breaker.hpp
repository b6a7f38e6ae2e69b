#pragma once

#include <flowcore/core/config/app_config.hpp>
#include <flowcore/core/errors.hpp>
#include <flowcore/core/metrics/metrics.hpp>
#include <flowcore/core/utils/cancellation.hpp>
#include <flowcore/core/utils/parallel.hpp>
#include <flowcore/core/utils/worker_group.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace FlowCore {

// ============================================================================
// State
// ============================================================================
//
//   CLOSED --(failureThreshold consecutive failures)--> OPEN
//   OPEN --(first call after recoveryTimeout)--> HALF_OPEN
//   HALF_OPEN --(successThreshold successes)--> CLOSED
//   HALF_OPEN --(any failure)--> OPEN
//

enum class CircuitState {
    CLOSED = 0,
    OPEN = 1,
    HALF_OPEN = 2
};

const char* toString(CircuitState state);

struct CircuitBreakerConfig {
    std::string name = "default";
    uint32_t failureThreshold = 3;
    std::chrono::milliseconds recoveryTimeout{180000};
    uint32_t successThreshold = 2;
    std::chrono::milliseconds operationTimeout{180000};   // 0 = no race

    std::function<void(CircuitState current, CircuitState previous)> onStateChange;
    std::function<void()> onSuccess;
    std::function<void(const std::string& error)> onFailure;

    static CircuitBreakerConfig fromApp(const AppConfig::CircuitBreakerConfig& app,
                                        const std::string& name);
};

struct CircuitFailure {
    uint64_t timestampMs = 0;   // epoch
    std::string error;
};

struct CircuitMetrics {
    std::string name;
    CircuitState state = CircuitState::CLOSED;
    uint64_t totalCalls = 0;
    uint64_t successfulCalls = 0;
    uint64_t failedCalls = 0;
    uint64_t rejectedCalls = 0;
    double successRate = 0.0;   // percent of executed calls
    double failureRate = 0.0;
    uint32_t consecutiveFailures = 0;
    std::optional<CircuitFailure> lastFailure;
    std::optional<uint64_t> lastSuccessMs;
    std::chrono::milliseconds timeInCurrentState{0};
    std::optional<uint64_t> nextAttemptMs;   // epoch, only while OPEN
};

template <typename T>
struct CircuitResult {
    bool executed = false;
    bool rejected = false;
    std::optional<T> result;
    std::exception_ptr error;
    std::string errorMessage;
    CircuitState state = CircuitState::CLOSED;
    std::chrono::milliseconds duration{0};

    bool ok() const { return executed && !error; }
};

/**
 * @class CircuitBreaker
 * @brief Failure-counting gate in front of an unreliable operation.
 *
 * execute() never throws: rejections, failures, timeouts and aborts all come
 * back in the CircuitResult. An operation that lost its timeout race keeps
 * running on a breaker-owned thread; destroying the breaker waits for it. Callbacks run outside the internal lock; an
 * exception escaping a callback is logged and ignored.
 */
class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitBreakerConfig config = {}, Metrics* metrics = nullptr);
    ~CircuitBreaker() = default;

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    template <typename T>
    CircuitResult<T> execute(std::function<T()> operation, const AbortSignal& signal = nullptr);

    CircuitState getState() const;
    bool isOpen() const { return getState() == CircuitState::OPEN; }
    bool isClosed() const { return getState() == CircuitState::CLOSED; }
    bool isHalfOpen() const { return getState() == CircuitState::HALF_OPEN; }

    CircuitMetrics getMetrics() const;

    void forceOpen();
    void forceClose();

    /// Back to CLOSED with every counter cleared
    void reset();

    const std::string& name() const { return config_.name; }
    const CircuitBreakerConfig& config() const { return config_; }

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct Transition {
        CircuitState from;
        CircuitState to;
    };

    /// Counts the call; moves OPEN to HALF_OPEN once the recovery timeout passed
    bool admitCall(std::optional<Transition>& transition);
    void recordSuccess();
    void recordFailure(const std::string& error, bool timed_out = false);
    void recordAbort();

    // caller holds mutex_
    Transition transitionTo(CircuitState next);

    void notifyStateChange(const std::optional<Transition>& transition);
    void notifySuccess();
    void notifyFailure(const std::string& error);

    CircuitBreakerConfig config_;
    Metrics* metrics_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint32_t consecutive_failures_ = 0;
    uint32_t half_open_successes_ = 0;
    TimePoint state_since_;
    TimePoint next_attempt_;
    uint64_t next_attempt_epoch_ms_ = 0;
    std::optional<CircuitFailure> last_failure_;
    std::optional<uint64_t> last_success_ms_;
    uint64_t total_calls_ = 0;
    uint64_t successful_calls_ = 0;
    uint64_t failed_calls_ = 0;
    uint64_t rejected_calls_ = 0;

    // Timed-out operations finish here; declared last so it is joined first
    WorkerGroup workers_;
};

// ============================================================================
// Template implementation
// ============================================================================

template <typename T>
CircuitResult<T> CircuitBreaker::execute(std::function<T()> operation, const AbortSignal& signal) {
    const auto started = std::chrono::steady_clock::now();
    auto elapsed = [&started]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    };

    CircuitResult<T> out;
    std::optional<Transition> transition;
    const bool admitted = admitCall(transition);
    notifyStateChange(transition);

    if (!admitted) {
        out.rejected = true;
        out.error = std::make_exception_ptr(CircuitOpenError(config_.name));
        out.errorMessage = "Circuit breaker is OPEN for " + config_.name;
        out.state = getState();
        out.duration = elapsed();
        return out;
    }

    out.executed = true;
    auto slot = std::make_shared<std::optional<T>>();
    try {
        runWithDeadline([slot, operation]() { slot->emplace(operation()); },
                        config_.operationTimeout, signal, workers_,
                        "Circuit " + config_.name + " operation");
        out.result = std::move(*slot);
        recordSuccess();
    } catch (const AbortedError& e) {
        out.error = std::current_exception();
        out.errorMessage = e.what();
        recordAbort();
    } catch (const TimeoutError& e) {
        out.error = std::current_exception();
        out.errorMessage = e.what();
        recordFailure(e.what(), true);
    } catch (const std::exception& e) {
        out.error = std::current_exception();
        out.errorMessage = e.what();
        recordFailure(e.what());
    } catch (...) {
        out.error = std::current_exception();
        out.errorMessage = "unknown error";
        recordFailure(out.errorMessage);
    }

    out.state = getState();
    out.duration = elapsed();
    return out;
}

} // namespace FlowCore
