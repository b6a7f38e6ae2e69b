#pragma once

#include <flowcore/core/processor/middleware.hpp>
#include <flowcore/core/resilience/circuit_breaker_manager.hpp>
#include <flowcore/core/resilience/concurrency.hpp>
#include <flowcore/core/resilience/retry.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>

namespace FlowCore {

struct StandardMiddlewareOptions {
    size_t maxConcurrent = 0;                      // 0 = no limit
    ConcurrencyLimiterPtr limiter;                 // shared limiter, created when empty
    std::chrono::milliseconds timeout{0};          // 0 = no timeout
    std::optional<RetryOptions> retry = RetryOptions{};   // nullopt disables retry

    /// Circuit breaker runs innermost, only when a manager is given
    std::shared_ptr<CircuitBreakerManager> circuitManager;
    CircuitBreakerMiddlewareConfig circuit;
};

/**
 * @brief The usual resilience stack as one pipeline middleware.
 *
 * From inside out: circuit breaker, concurrency, timeout, retry. Retry is
 * outermost so a retried attempt passes through the whole stack again.
 */
Middleware createStandardMiddleware(StandardMiddlewareOptions options = {});

struct ResilientHandlerOptions {
    uint32_t maxRetries = 3;
    std::chrono::milliseconds timeout{5000};
    /// Called with the final error instead of throwing it
    std::function<HandlerResult(const Event&, const std::exception&)> fallback;
};

/// Timeout and retry around a single handler, with an optional fallback
PipelineHandler createResilientHandler(EventHandler handler, ResilientHandlerOptions options = {});

} // namespace FlowCore
