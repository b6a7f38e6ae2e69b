#include <flowcore/core/resilience/conditional.hpp>
#include <flowcore/core/resilience/timeout.hpp>
#include <flowcore/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <random>
#include <stdexcept>

namespace FlowCore {

namespace {

int priorityOf(const Event& event) {
    auto value = event.metadataValue("priority");
    if (!value) return 0;
    try {
        return std::stoi(*value);
    } catch (const std::logic_error&) {
        return 0;
    }
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

void logTo(const ObservabilitySinkPtr& sink, LogLevel level, const std::string& message,
           const LogContext& context) {
    try {
        sink->log(level, message, context);
    } catch (const std::exception& e) {
        spdlog::warn("[Conditional] Observability sink failed on '{}': {}", message, e.what());
    }
}

ObservabilitySinkPtr orDefault(ObservabilitySinkPtr sink) {
    return sink ? std::move(sink) : std::make_shared<SpdlogObservability>();
}

} // namespace

// ============================================================================
// Conditions
// ============================================================================

namespace Conditions {

MiddlewareCondition forEventTypes(std::vector<std::string> types) {
    return [types = std::move(types)](const Event& event) { return contains(types, event.type); };
}

MiddlewareCondition forPriority(int min_priority, std::optional<int> max_priority) {
    return [min_priority, max_priority](const Event& event) {
        const int priority = priorityOf(event);
        if (max_priority) {
            return priority >= min_priority && priority <= *max_priority;
        }
        return priority >= min_priority;
    };
}

MiddlewareCondition forMetadata(std::string key, std::string value) {
    return [key = std::move(key), value = std::move(value)](const Event& event) {
        auto found = event.metadataValue(key);
        return found && *found == value;
    };
}

MiddlewareCondition forOrigin(std::vector<std::string> origins) {
    return [origins = std::move(origins)](const Event& event) {
        auto origin = event.metadataValue("origin");
        return origin && !origin->empty() && contains(origins, *origin);
    };
}

MiddlewareCondition forTenant(std::vector<std::string> tenants) {
    return [tenants = std::move(tenants)](const Event& event) {
        auto tenant = event.metadataValue("tenantId");
        return tenant && !tenant->empty() && contains(tenants, *tenant);
    };
}

MiddlewareCondition forEventSize(size_t min_size, std::optional<size_t> max_size) {
    return [min_size, max_size](const Event& event) {
        const size_t size = event.data.size();
        if (max_size) {
            return size >= min_size && size <= *max_size;
        }
        return size >= min_size;
    };
}

MiddlewareCondition forTimeWindow(int start_hour, int end_hour) {
    return [start_hour, end_hour](const Event&) {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        return local.tm_hour >= start_hour && local.tm_hour <= end_hour;
    };
}

MiddlewareCondition forCriticalEvents() {
    return [](const Event& event) {
        return priorityOf(event) >= 8 || event.metadataOr("critical", "") == "true";
    };
}

MiddlewareCondition forDebugEvents() {
    return [](const Event& event) {
        return event.type.find("debug") != std::string::npos ||
               event.metadataOr("debug", "") == "true";
    };
}

MiddlewareCondition forProductionEvents() {
    return [](const Event& event) {
        return event.metadataOr("environment", "development") == "production";
    };
}

MiddlewareCondition withProbability(double probability) {
    return [probability](const Event&) {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(rng) < probability;
    };
}

MiddlewareCondition allOf(std::vector<MiddlewareCondition> conditions) {
    return [conditions = std::move(conditions)](const Event& event) {
        for (const auto& condition : conditions) {
            if (!condition(event)) return false;
        }
        return true;
    };
}

MiddlewareCondition anyOf(std::vector<MiddlewareCondition> conditions) {
    return [conditions = std::move(conditions)](const Event& event) {
        for (const auto& condition : conditions) {
            if (condition(event)) return true;
        }
        return false;
    };
}

MiddlewareCondition negate(MiddlewareCondition condition) {
    return [condition = std::move(condition)](const Event& event) { return !condition(event); };
}

} // namespace Conditions

Middleware when(MiddlewareCondition condition, Middleware middleware) {
    Middleware mw;
    mw.name = "conditional-" + middleware.name;
    mw.kind = middleware.kind;
    mw.wrap = [condition = std::move(condition), inner = middleware.wrap](PipelineHandler next) -> PipelineHandler {
        PipelineHandler wrapped = inner ? inner(next) : next;
        return [condition, wrapped = std::move(wrapped), next = std::move(next)](
                   const Event& event, const AbortSignal& signal) {
            if (!condition || condition(event)) {
                return wrapped(event, signal);
            }
            return next(event, signal);
        };
    };
    return mw;
}

// ============================================================================
// ConditionalMiddlewareExecutor
// ============================================================================

struct ConditionalMiddlewareExecutor::Shared {
    ObservabilitySinkPtr sink;
    mutable std::mutex mutex;
    std::map<std::string, ConditionalMiddlewareStats> stats;

    template <typename Fn>
    void update(const std::string& name, Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex);
        fn(stats[name]);
    }
};

ConditionalMiddlewareExecutor::ConditionalMiddlewareExecutor(ObservabilitySinkPtr sink)
    : shared_(std::make_shared<Shared>()) {
    shared_->sink = orDefault(std::move(sink));
}

ConditionalMiddlewareExecutor::List ConditionalMiddlewareExecutor::sortByPriority(
    std::vector<ConditionalMiddleware> middlewares) {
    std::stable_sort(middlewares.begin(), middlewares.end(),
                     [](const ConditionalMiddleware& a, const ConditionalMiddleware& b) {
                         return a.priority < b.priority;
                     });
    return std::make_shared<const std::vector<ConditionalMiddleware>>(std::move(middlewares));
}

HandlerResult ConditionalMiddlewareExecutor::execute(const std::vector<ConditionalMiddleware>& middlewares,
                                                     const PipelineHandler& handler, const Event& event,
                                                     const AbortSignal& signal) {
    return runFrom(shared_, sortByPriority(middlewares), 0, handler, event, signal);
}

Middleware ConditionalMiddlewareExecutor::asMiddleware(std::vector<ConditionalMiddleware> middlewares,
                                                       std::string name) {
    Middleware mw;
    mw.name = std::move(name);
    mw.kind = MiddlewareKind::PIPELINE;
    mw.wrap = [shared = shared_, list = sortByPriority(std::move(middlewares))](PipelineHandler next) -> PipelineHandler {
        return [shared, list, next = std::move(next)](const Event& event, const AbortSignal& signal) {
            return runFrom(shared, list, 0, next, event, signal);
        };
    };
    return mw;
}

HandlerResult ConditionalMiddlewareExecutor::runFrom(const std::shared_ptr<Shared>& shared, const List& list,
                                                     size_t index, const PipelineHandler& handler,
                                                     const Event& event, const AbortSignal& signal) {
    if (index >= list->size()) {
        return handler(event, signal);
    }

    const ConditionalMiddleware& entry = (*list)[index];
    const std::string name = entry.middleware.name.empty() ? "anonymous" : entry.middleware.name;

    // Captures by value: a middleware may hand the rest of the chain to another thread
    PipelineHandler rest = [shared, list, index, handler](const Event& e, const AbortSignal& s) {
        return runFrom(shared, list, index + 1, handler, e, s);
    };

    try {
        const bool apply = entry.middleware.wrap && (!entry.condition || entry.condition(event));
        if (apply) {
            shared->update(name, [](ConditionalMiddlewareStats& s) { ++s.applied; });
            logTo(shared->sink, LogLevel::DEBUG, "Applying conditional middleware",
                  {{"middleware", name},
                   {"eventType", event.type},
                   {"priority", std::to_string(entry.priority)}});
            return entry.middleware.wrap(std::move(rest))(event, signal);
        }

        shared->update(name, [](ConditionalMiddlewareStats& s) { ++s.skipped; });
        logTo(shared->sink, LogLevel::DEBUG, "Skipping conditional middleware",
              {{"middleware", name}, {"eventType", event.type}, {"reason", "condition_not_met"}});
        return rest(event, signal);
    } catch (const std::exception& e) {
        shared->update(name, [](ConditionalMiddlewareStats& s) { ++s.errors; });
        logTo(shared->sink, LogLevel::ERROR, "Conditional middleware error",
              {{"error", e.what()}, {"middleware", name}, {"eventType", event.type}});
        throw;
    }
}

std::map<std::string, ConditionalMiddlewareStats> ConditionalMiddlewareExecutor::getStats() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->stats;
}

void ConditionalMiddlewareExecutor::clearStats() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->stats.clear();
}

// ============================================================================
// ConditionalMiddlewareFactory
// ============================================================================

ConditionalMiddlewareFactory::ConditionalMiddlewareFactory(ObservabilitySinkPtr sink)
    : sink_(orDefault(std::move(sink))) {}

ConditionalMiddleware ConditionalMiddlewareFactory::createRetryMiddleware(RetryOptions options) const {
    Middleware mw = withRetry(std::move(options));
    mw.name = "conditional-retry";
    return ConditionalMiddleware{std::move(mw), Conditions::forCriticalEvents(), 1};
}

ConditionalMiddleware ConditionalMiddlewareFactory::createTimeoutMiddleware(
    std::chrono::milliseconds timeout) const {
    Middleware inner = withTimeout(timeout);

    Middleware mw;
    mw.name = "conditional-timeout";
    mw.kind = MiddlewareKind::PIPELINE;
    mw.wrap = [inner, sink = sink_, timeout](PipelineHandler next) -> PipelineHandler {
        return [timed = inner.wrap(std::move(next)), sink, timeout](const Event& event,
                                                                     const AbortSignal& signal) {
            try {
                return timed(event, signal);
            } catch (const std::exception& e) {
                logTo(sink, LogLevel::ERROR, "Timeout error",
                      {{"error", e.what()},
                       {"eventType", event.type},
                       {"timeoutMs", std::to_string(timeout.count())}});
                throw;
            }
        };
    };
    return ConditionalMiddleware{std::move(mw), Conditions::forEventTypes({"api", "external"}), 2};
}

ConditionalMiddleware ConditionalMiddlewareFactory::createConcurrencyMiddleware(
    size_t max_concurrent, ConcurrencyLimiterPtr limiter) const {
    ConcurrencyOptions options;
    options.maxConcurrent = max_concurrent;
    options.queueTimeoutMs = std::chrono::milliseconds(0);
    options.getKey = [](const Event&) { return std::string("default"); };

    Middleware mw = withConcurrency(std::move(limiter), std::move(options));
    mw.name = "conditional-concurrency";
    return ConditionalMiddleware{std::move(mw), Conditions::forEventTypes({"database", "external"}), 3};
}

ConditionalMiddleware ConditionalMiddlewareFactory::createObservabilityMiddleware(LogLevel level) const {
    Middleware mw;
    mw.name = "conditional-observability";
    mw.kind = MiddlewareKind::PIPELINE;
    mw.wrap = [sink = sink_, level](PipelineHandler next) -> PipelineHandler {
        return [sink, level, next = std::move(next)](const Event& event, const AbortSignal& signal) {
            const uint64_t started = Clock::now_ms();
            logTo(sink, level, "Middleware execution started", {{"eventType", event.type}});
            try {
                auto result = next(event, signal);
                logTo(sink, level, "Middleware execution completed", {{"eventType", event.type}});
                return result;
            } catch (const std::exception& e) {
                logTo(sink, LogLevel::ERROR, "Middleware execution failed",
                      {{"error", e.what()},
                       {"middleware", "observability"},
                       {"eventType", event.type},
                       {"executionTime", std::to_string(Clock::now_ms() - started)}});
                throw;
            }
        };
    };
    return ConditionalMiddleware{std::move(mw), Conditions::withProbability(0.1), 10};
}

ConditionalMiddleware ConditionalMiddlewareFactory::createCustomMiddleware(Middleware middleware) const {
    if (middleware.name.empty()) {
        middleware.name = "custom-conditional";
    }
    return ConditionalMiddleware{std::move(middleware), nullptr, 5};
}

} // namespace FlowCore
