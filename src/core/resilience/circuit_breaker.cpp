#include <flowcore/core/resilience/circuit_breaker.hpp>
#include <flowcore/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

namespace FlowCore {

const char* toString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "CLOSED";
        case CircuitState::OPEN:      return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default:                      return "UNKNOWN";
    }
}

CircuitBreakerConfig CircuitBreakerConfig::fromApp(const AppConfig::CircuitBreakerConfig& app,
                                                   const std::string& name) {
    CircuitBreakerConfig cfg;
    cfg.name = name;
    cfg.failureThreshold = app.failureThreshold;
    cfg.recoveryTimeout = std::chrono::milliseconds(app.recoveryTimeoutMs);
    cfg.successThreshold = app.successThreshold;
    cfg.operationTimeout = std::chrono::milliseconds(app.operationTimeoutMs);
    return cfg;
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, Metrics* metrics)
    : config_(std::move(config)),
      metrics_(metrics),
      state_since_(std::chrono::steady_clock::now()),
      workers_("circuit-" + config_.name) {
    if (config_.failureThreshold == 0) config_.failureThreshold = 1;
    if (config_.successThreshold == 0) config_.successThreshold = 1;
    spdlog::debug("[CircuitBreaker:{}] created (failureThreshold={}, recoveryTimeout={}ms, "
                  "successThreshold={}, operationTimeout={}ms)",
                  config_.name, config_.failureThreshold, config_.recoveryTimeout.count(),
                  config_.successThreshold, config_.operationTimeout.count());
}

// ============================================================================
// State machine (mutex_ held unless noted)
// ============================================================================

CircuitBreaker::Transition CircuitBreaker::transitionTo(CircuitState next) {
    Transition t{state_, next};
    state_ = next;
    state_since_ = std::chrono::steady_clock::now();

    switch (next) {
        case CircuitState::OPEN:
            next_attempt_ = state_since_ + config_.recoveryTimeout;
            next_attempt_epoch_ms_ = Clock::epoch_ms() + config_.recoveryTimeout.count();
            half_open_successes_ = 0;
            break;
        case CircuitState::HALF_OPEN:
            half_open_successes_ = 0;
            break;
        case CircuitState::CLOSED:
            consecutive_failures_ = 0;
            half_open_successes_ = 0;
            break;
    }

    spdlog::info("[CircuitBreaker:{}] State transition: {} → {}",
                 config_.name, toString(t.from), toString(t.to));
    return t;
}

bool CircuitBreaker::admitCall(std::optional<Transition>& transition) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_calls_;

    if (state_ == CircuitState::OPEN) {
        if (std::chrono::steady_clock::now() >= next_attempt_) {
            transition = transitionTo(CircuitState::HALF_OPEN);
            return true;
        }
        ++rejected_calls_;
        if (metrics_) metrics_->total_rejections.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

void CircuitBreaker::recordSuccess() {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++successful_calls_;
        last_success_ms_ = Clock::epoch_ms();

        if (state_ == CircuitState::HALF_OPEN) {
            if (++half_open_successes_ >= config_.successThreshold) {
                transition = transitionTo(CircuitState::CLOSED);
            }
        } else if (state_ == CircuitState::CLOSED) {
            consecutive_failures_ = 0;
        }
    }
    notifyStateChange(transition);
    notifySuccess();
}

void CircuitBreaker::recordFailure(const std::string& error, bool timed_out) {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++failed_calls_;
        ++consecutive_failures_;
        last_failure_ = CircuitFailure{Clock::epoch_ms(), error};

        if (timed_out && metrics_) {
            metrics_->total_timeouts.fetch_add(1, std::memory_order_relaxed);
        }

        if (state_ == CircuitState::HALF_OPEN) {
            transition = transitionTo(CircuitState::OPEN);
        } else if (state_ == CircuitState::CLOSED &&
                   consecutive_failures_ >= config_.failureThreshold) {
            transition = transitionTo(CircuitState::OPEN);
        }
    }
    spdlog::debug("[CircuitBreaker:{}] operation failed: {}", config_.name, error);
    notifyStateChange(transition);
    notifyFailure(error);
}

void CircuitBreaker::recordAbort() {
    spdlog::debug("[CircuitBreaker:{}] operation aborted by caller", config_.name);
}

// ============================================================================
// Callbacks (never called with mutex_ held)
// ============================================================================

void CircuitBreaker::notifyStateChange(const std::optional<Transition>& transition) {
    if (!transition || !config_.onStateChange) return;
    try {
        config_.onStateChange(transition->to, transition->from);
    } catch (const std::exception& e) {
        spdlog::error("[CircuitBreaker:{}] onStateChange callback threw: {}", config_.name, e.what());
    }
}

void CircuitBreaker::notifySuccess() {
    if (!config_.onSuccess) return;
    try {
        config_.onSuccess();
    } catch (const std::exception& e) {
        spdlog::error("[CircuitBreaker:{}] onSuccess callback threw: {}", config_.name, e.what());
    }
}

void CircuitBreaker::notifyFailure(const std::string& error) {
    if (!config_.onFailure) return;
    try {
        config_.onFailure(error);
    } catch (const std::exception& e) {
        spdlog::error("[CircuitBreaker:{}] onFailure callback threw: {}", config_.name, e.what());
    }
}

// ============================================================================
// Queries & manual control
// ============================================================================

CircuitState CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitMetrics CircuitBreaker::getMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitMetrics m;
    m.name = config_.name;
    m.state = state_;
    m.totalCalls = total_calls_;
    m.successfulCalls = successful_calls_;
    m.failedCalls = failed_calls_;
    m.rejectedCalls = rejected_calls_;
    const uint64_t executed = successful_calls_ + failed_calls_;
    if (executed > 0) {
        m.successRate = 100.0 * static_cast<double>(successful_calls_) / static_cast<double>(executed);
        m.failureRate = 100.0 * static_cast<double>(failed_calls_) / static_cast<double>(executed);
    }
    m.consecutiveFailures = consecutive_failures_;
    m.lastFailure = last_failure_;
    m.lastSuccessMs = last_success_ms_;
    m.timeInCurrentState = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - state_since_);
    if (state_ == CircuitState::OPEN) {
        m.nextAttemptMs = next_attempt_epoch_ms_;
    }
    return m;
}

void CircuitBreaker::forceOpen() {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::OPEN) {
            transition = transitionTo(CircuitState::OPEN);
        }
    }
    spdlog::warn("[CircuitBreaker:{}] forced OPEN", config_.name);
    notifyStateChange(transition);
}

void CircuitBreaker::forceClose() {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::CLOSED) {
            transition = transitionTo(CircuitState::CLOSED);
        }
        consecutive_failures_ = 0;
    }
    spdlog::warn("[CircuitBreaker:{}] forced CLOSED", config_.name);
    notifyStateChange(transition);
}

void CircuitBreaker::reset() {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::CLOSED) {
            transition = transitionTo(CircuitState::CLOSED);
        }
        consecutive_failures_ = 0;
        half_open_successes_ = 0;
        last_failure_.reset();
        last_success_ms_.reset();
        total_calls_ = 0;
        successful_calls_ = 0;
        failed_calls_ = 0;
        rejected_calls_ = 0;
        state_since_ = std::chrono::steady_clock::now();
    }
    spdlog::info("[CircuitBreaker:{}] reset", config_.name);
    notifyStateChange(transition);
}

} // namespace FlowCore
