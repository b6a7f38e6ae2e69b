#pragma once

#include <flowcore/core/observability/observability.hpp>
#include <flowcore/core/processor/middleware.hpp>
#include <flowcore/core/resilience/concurrency.hpp>
#include <flowcore/core/resilience/retry.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace FlowCore {

/// Decides per event whether a middleware takes part in the call
using MiddlewareCondition = std::function<bool(const Event&)>;

// ============================================================================
// Conditions
// ============================================================================
//
// Priority, origin and tenant are read from event metadata ("priority",
// "origin", "tenantId"). A missing or non-numeric priority counts as 0.
//

namespace Conditions {

MiddlewareCondition forEventTypes(std::vector<std::string> types);
MiddlewareCondition forPriority(int min_priority, std::optional<int> max_priority = std::nullopt);
MiddlewareCondition forMetadata(std::string key, std::string value);
MiddlewareCondition forOrigin(std::vector<std::string> origins);
MiddlewareCondition forTenant(std::vector<std::string> tenants);

/// Payload size in bytes within [min_size, max_size]
MiddlewareCondition forEventSize(size_t min_size, std::optional<size_t> max_size = std::nullopt);

/// Local hour of day within [start_hour, end_hour]
MiddlewareCondition forTimeWindow(int start_hour, int end_hour);

/// priority >= 8 or metadata critical=true
MiddlewareCondition forCriticalEvents();
/// type contains "debug" or metadata debug=true
MiddlewareCondition forDebugEvents();
/// metadata environment=production
MiddlewareCondition forProductionEvents();

MiddlewareCondition withProbability(double probability);

MiddlewareCondition allOf(std::vector<MiddlewareCondition> conditions);
MiddlewareCondition anyOf(std::vector<MiddlewareCondition> conditions);
MiddlewareCondition negate(MiddlewareCondition condition);

} // namespace Conditions

/**
 * @brief Apply @p middleware only to events matching @p condition.
 *
 * Other events go straight to the next handler. The result keeps the kind of
 * @p middleware.
 */
Middleware when(MiddlewareCondition condition, Middleware middleware);

// ============================================================================
// Conditional pipelines
// ============================================================================

struct ConditionalMiddleware {
    Middleware middleware;
    MiddlewareCondition condition;   // empty = always
    int priority = 5;                // lower runs first (outermost)
};

struct ConditionalMiddlewareStats {
    uint64_t applied = 0;
    uint64_t skipped = 0;
    uint64_t errors = 0;
};

/**
 * @class ConditionalMiddlewareExecutor
 * @brief Runs a handler through a priority-ordered list of conditional middlewares.
 *
 * Each middleware is checked against the event when the call reaches it and
 * either wraps the rest of the chain or is skipped. Per-name counters record
 * applied, skipped and failed passes; a failure is counted at every layer it
 * crosses. The executor may be dropped while calls it started are still
 * running.
 */
class ConditionalMiddlewareExecutor {
public:
    explicit ConditionalMiddlewareExecutor(ObservabilitySinkPtr sink = nullptr);

    HandlerResult execute(const std::vector<ConditionalMiddleware>& middlewares,
                          const PipelineHandler& handler, const Event& event,
                          const AbortSignal& signal = nullptr);

    /// The whole conditional list as one pipeline middleware
    Middleware asMiddleware(std::vector<ConditionalMiddleware> middlewares, std::string name = "conditional");

    std::map<std::string, ConditionalMiddlewareStats> getStats() const;
    void clearStats();

private:
    struct Shared;
    using List = std::shared_ptr<const std::vector<ConditionalMiddleware>>;

    static List sortByPriority(std::vector<ConditionalMiddleware> middlewares);
    static HandlerResult runFrom(const std::shared_ptr<Shared>& shared, const List& list, size_t index,
                                 const PipelineHandler& handler, const Event& event,
                                 const AbortSignal& signal);

    std::shared_ptr<Shared> shared_;
};

/**
 * @class ConditionalMiddlewareFactory
 * @brief Ready-made conditional entries around the resilience middlewares.
 *
 *   retry        critical events                  priority 1
 *   timeout      "api" and "external" events      priority 2
 *   concurrency  "database" and "external" events priority 3
 *   custom       every event                      priority 5
 *   observability 10% of events                   priority 10
 */
class ConditionalMiddlewareFactory {
public:
    explicit ConditionalMiddlewareFactory(ObservabilitySinkPtr sink = nullptr);

    ConditionalMiddleware createRetryMiddleware(RetryOptions options = {}) const;
    ConditionalMiddleware createTimeoutMiddleware(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000)) const;
    ConditionalMiddleware createConcurrencyMiddleware(size_t max_concurrent = 10,
                                                      ConcurrencyLimiterPtr limiter = nullptr) const;
    ConditionalMiddleware createObservabilityMiddleware(LogLevel level = LogLevel::INFO) const;
    ConditionalMiddleware createCustomMiddleware(Middleware middleware) const;

private:
    ObservabilitySinkPtr sink_;
};

} // namespace FlowCore
