#include <flowcore/core/resilience/composites.hpp>
#include <flowcore/core/resilience/timeout.hpp>

#include <utility>
#include <vector>

namespace FlowCore {

Middleware createStandardMiddleware(StandardMiddlewareOptions options) {
    std::vector<Middleware> stack;
    if (options.circuitManager) {
        stack.push_back(withCircuitBreaker(options.circuitManager, options.circuit));
    }
    if (options.maxConcurrent > 0) {
        ConcurrencyOptions concurrency;
        concurrency.maxConcurrent = options.maxConcurrent;
        stack.push_back(withConcurrency(options.limiter, std::move(concurrency)));
    }
    if (options.timeout.count() > 0) {
        stack.push_back(withTimeout(options.timeout));
    }
    if (options.retry) {
        stack.push_back(withRetry(*options.retry));
    }

    Middleware mw;
    mw.name = "standard";
    mw.kind = MiddlewareKind::PIPELINE;
    mw.wrap = [stack = std::move(stack)](PipelineHandler next) -> PipelineHandler {
        return compose(std::move(next), stack);
    };
    return mw;
}

PipelineHandler createResilientHandler(EventHandler handler, ResilientHandlerOptions options) {
    RetryOptions retry;
    retry.maxRetries = options.maxRetries;

    PipelineHandler wrapped = compose(adaptHandler(std::move(handler)),
                                      {withTimeout(options.timeout), withRetry(std::move(retry))});
    if (!options.fallback) {
        return wrapped;
    }

    return [wrapped = std::move(wrapped), fallback = std::move(options.fallback)](
               const Event& event, const AbortSignal& signal) -> HandlerResult {
        try {
            return wrapped(event, signal);
        } catch (const std::exception& e) {
            return fallback(event, e);
        }
    };
}

} // namespace FlowCore
