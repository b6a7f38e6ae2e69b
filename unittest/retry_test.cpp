// ============================================================================
// RESILIENCE MIDDLEWARE UNIT TESTS
// ============================================================================
// Tests for retry classification and backoff, the timeout middleware, the
// per-key concurrency limiter, conditional and composite stacks and validation
// ============================================================================

#include <gtest/gtest.h>
#include <flowcore/core/errors.hpp>
#include <flowcore/core/events/event_factory.hpp>
#include <flowcore/core/metrics/registry.hpp>
#include <flowcore/core/observability/observability.hpp>
#include <flowcore/core/resilience/composites.hpp>
#include <flowcore/core/resilience/concurrency.hpp>
#include <flowcore/core/resilience/conditional.hpp>
#include <flowcore/core/resilience/retry.hpp>
#include <flowcore/core/resilience/timeout.hpp>
#include <flowcore/core/resilience/validate.hpp>

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace FlowCore;
using namespace std::chrono_literals;

namespace {

RetryOptions quickRetry() {
    RetryOptions options;
    options.maxRetries = 3;
    options.initialDelayMs = 1ms;
    options.maxDelayMs = 5ms;
    options.jitter = false;
    return options;
}

/// Middleware appending its name to @p trace on the way in
Middleware recording(const std::string& name, std::vector<std::string>& trace) {
    Middleware mw;
    mw.name = name;
    mw.kind = MiddlewareKind::PIPELINE;
    mw.wrap = [name, &trace](PipelineHandler next) -> PipelineHandler {
        return [name, &trace, next = std::move(next)](const Event& e, const AbortSignal& s) {
            trace.push_back(name);
            return next(e, s);
        };
    };
    return mw;
}

Event withMeta(std::string type, std::unordered_map<std::string, std::string> metadata) {
    return EventFactory::createEvent(std::move(type), {}, std::move(metadata));
}

} // namespace

// ============================================================================
// BACKOFF & CLASSIFICATION TESTS
// ============================================================================

TEST(Retry, BackoffGrowsExponentiallyUpToMaxDelay) {
    RetryOptions options;
    options.initialDelayMs = 100ms;
    options.backoffFactor = 2.0;
    options.maxDelayMs = 10000ms;
    options.jitter = false;

    EXPECT_EQ(computeBackoff(0, options), 100ms);
    EXPECT_EQ(computeBackoff(1, options), 200ms);
    EXPECT_EQ(computeBackoff(3, options), 800ms);
    EXPECT_EQ(computeBackoff(10, options), 10000ms);
}

TEST(Retry, JitterScalesTheCappedDelay) {
    RetryOptions options;
    options.initialDelayMs = 100ms;
    options.backoffFactor = 2.0;
    options.jitter = true;

    EXPECT_EQ(computeBackoff(1, options, 0.5), 100ms);
    EXPECT_EQ(computeBackoff(1, options, 0.0), 0ms);
    EXPECT_EQ(computeBackoff(1, options, 1.5), 200ms);

    for (int i = 0; i < 20; ++i) {
        auto delay = computeBackoff(2, options);
        EXPECT_GE(delay, 0ms);
        EXPECT_LE(delay, 400ms);
    }
}

TEST(Retry, ClassifiesByCodeThenStatus) {
    RetryOptions options;

    EXPECT_TRUE(isRetryable(FlowError("ECONNRESET", "reset"), options));
    EXPECT_TRUE(isRetryable(TimeoutError("slow"), options));
    EXPECT_TRUE(isRetryable(FlowError("HTTP_ERROR", "bad gateway", 502), options));
    EXPECT_FALSE(isRetryable(FlowError("HTTP_ERROR", "bad request", 400), options));
    EXPECT_FALSE(isRetryable(FlowError("VALIDATION", "nope"), options));
    EXPECT_FALSE(isRetryable(std::runtime_error("plain"), options));
}

TEST(Retry, PredicateDecidesAlone) {
    RetryOptions options;
    options.retryPredicate = [](const std::exception& e) {
        return std::string(e.what()) == "flaky";
    };

    EXPECT_TRUE(isRetryable(std::runtime_error("flaky"), options));
    EXPECT_FALSE(isRetryable(FlowError("ECONNRESET", "reset"), options));
}

// ============================================================================
// RETRY MIDDLEWARE TESTS
// ============================================================================

TEST(RetryMiddleware, RecoversFromTransientFailures) {
    std::atomic<int> calls{0};
    PipelineHandler flaky = [&calls](const Event& e, const AbortSignal&) -> HandlerResult {
        if (calls.fetch_add(1) < 2) throw FlowError("ETIMEDOUT", "timed out");
        return reEmit(EventFactory::createFollowUp(e, "ok"));
    };
    MetricRegistry registry;
    auto options = quickRetry();
    options.metrics = &registry.getMetrics(MetricNames::RETRY);
    auto wrapped = compose(flaky, {withRetry(options)});

    Event event = EventFactory::createEvent("job");
    EventFactory::withCostTracking(event);
    auto result = wrapped(event, nullptr);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, "ok");
    EXPECT_EQ(calls.load(), 3);
    EXPECT_EQ(event.cost->retries.load(), 2u);

    auto snapshot = registry.getSnapshot("Retry");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->total_retries, 2u);
    EXPECT_FALSE(registry.getSnapshot("Unknown").has_value());
}

TEST(RetryMiddleware, ThrowsRetryExceededAfterMaxRetries) {
    std::atomic<int> calls{0};
    PipelineHandler failing = [&calls](const Event&, const AbortSignal&) -> HandlerResult {
        calls.fetch_add(1);
        throw FlowError("ECONNREFUSED", "refused");
    };
    auto wrapped = compose(failing, {withRetry(quickRetry())});

    try {
        wrapped(EventFactory::createEvent("job"), nullptr);
        FAIL() << "expected RetryExceededError";
    } catch (const RetryExceededError& e) {
        EXPECT_EQ(e.attempts(), 4u);
        EXPECT_EQ(e.eventType(), "job");
        EXPECT_EQ(e.causeMessage(), "refused");
        EXPECT_THROW(std::rethrow_exception(e.cause()), FlowError);
    }
    EXPECT_EQ(calls.load(), 4);
}

TEST(RetryMiddleware, NonRetryableErrorPassesThrough) {
    std::atomic<int> calls{0};
    PipelineHandler failing = [&calls](const Event&, const AbortSignal&) -> HandlerResult {
        calls.fetch_add(1);
        throw std::logic_error("bug");
    };
    auto wrapped = compose(failing, {withRetry(quickRetry())});

    EXPECT_THROW(wrapped(EventFactory::createEvent("job"), nullptr), std::logic_error);
    EXPECT_EQ(calls.load(), 1);
}

TEST(RetryMiddleware, TotalBudgetEndsRetriesEarly) {
    auto options = quickRetry();
    options.maxRetries = 100;
    options.initialDelayMs = 40ms;
    options.maxDelayMs = 40ms;
    options.maxTotalMs = 100ms;

    std::atomic<int> calls{0};
    PipelineHandler failing = [&calls](const Event&, const AbortSignal&) -> HandlerResult {
        calls.fetch_add(1);
        throw FlowError("NETWORK_ERROR", "down");
    };
    auto wrapped = compose(failing, {withRetry(options)});

    EXPECT_THROW(wrapped(EventFactory::createEvent("job"), nullptr), RetryExceededError);
    EXPECT_LE(calls.load(), 4);
}

TEST(RetryMiddleware, BudgetCountsOnlyTimeAlreadySpent) {
    auto options = quickRetry();
    options.initialDelayMs = 30ms;
    options.maxDelayMs = 30ms;
    options.maxTotalMs = 10ms;

    std::atomic<int> calls{0};
    PipelineHandler failing = [&calls](const Event&, const AbortSignal&) -> HandlerResult {
        calls.fetch_add(1);
        throw FlowError("NETWORK_ERROR", "down");
    };
    auto wrapped = compose(failing, {withRetry(options)});

    // First failure is inside the budget even though its backoff overruns it
    EXPECT_THROW(wrapped(EventFactory::createEvent("job"), nullptr), RetryExceededError);
    EXPECT_EQ(calls.load(), 2);
}

TEST(RetryMiddleware, AbortDuringBackoffStopsRetrying) {
    auto options = quickRetry();
    options.initialDelayMs = 5000ms;
    options.maxDelayMs = 5000ms;

    PipelineHandler failing = [](const Event&, const AbortSignal&) -> HandlerResult {
        throw FlowError("ECONNRESET", "reset");
    };
    auto wrapped = compose(failing, {withRetry(options)});

    auto signal = makeAbortSignal();
    std::thread canceller([signal] {
        std::this_thread::sleep_for(30ms);
        signal->cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(wrapped(EventFactory::createEvent("job"), signal), AbortedError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();
}

// ============================================================================
// TIMEOUT MIDDLEWARE TESTS
// ============================================================================

TEST(TimeoutMiddleware, PassesResultThrough) {
    PipelineHandler quick = [](const Event& e, const AbortSignal&) -> HandlerResult {
        return reEmit(EventFactory::createFollowUp(e, "quick.done"));
    };
    auto wrapped = compose(quick, {withTimeout(1s)});

    auto result = wrapped(EventFactory::createEvent("quick"), nullptr);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, "quick.done");
}

TEST(TimeoutMiddleware, SlowHandlerTimesOut) {
    PipelineHandler slow = [](const Event&, const AbortSignal&) -> HandlerResult {
        std::this_thread::sleep_for(300ms);
        return HandlerResult{};
    };
    auto wrapped = compose(slow, {withTimeout(20ms)});

    try {
        wrapped(EventFactory::createEvent("slow"), nullptr);
        FAIL() << "expected TimeoutError";
    } catch (const TimeoutError& e) {
        EXPECT_EQ(e.code(), "TIMEOUT_EXCEEDED");
    }
}

TEST(TimeoutMiddleware, TimeoutIsRetryableUnderRetry) {
    std::atomic<int> calls{0};
    PipelineHandler slow_then_fast = [&calls](const Event&, const AbortSignal&) -> HandlerResult {
        if (calls.fetch_add(1) == 0) std::this_thread::sleep_for(200ms);
        return HandlerResult{};
    };
    // retry outermost, timeout around each attempt
    auto wrapped = compose(slow_then_fast, {withTimeout(20ms), withRetry(quickRetry())});

    EXPECT_NO_THROW(wrapped(EventFactory::createEvent("job"), nullptr));
    EXPECT_EQ(calls.load(), 2);
}

// ============================================================================
// CONCURRENCY LIMITER TESTS
// ============================================================================

TEST(ConcurrencyLimiter, DropsWhenFullWithoutQueue) {
    ConcurrencyLimiter limiter;
    auto first = limiter.acquire("k", 1, 0ms);
    EXPECT_EQ(limiter.inFlight("k"), 1u);

    try {
        limiter.acquire("k", 1, 0ms);
        FAIL() << "expected ConcurrencyLimitError";
    } catch (const ConcurrencyLimitError& e) {
        EXPECT_EQ(e.code(), "CONCURRENCY_DROP");
    }

    first.release();
    EXPECT_EQ(limiter.inFlight("k"), 0u);
    EXPECT_EQ(limiter.getStats().activeKeys, 0u);
    EXPECT_EQ(limiter.getStats().totalDropped, 1u);
}

TEST(ConcurrencyLimiter, KeysAreIndependent) {
    ConcurrencyLimiter limiter;
    auto a = limiter.acquire("a", 1, 0ms);
    auto b = limiter.acquire("b", 1, 0ms);

    auto stats = limiter.getStats();
    EXPECT_EQ(stats.activeKeys, 2u);
    EXPECT_EQ(stats.inFlight, 2u);
}

TEST(ConcurrencyLimiter, QueuedWaiterGetsReleasedSlot) {
    ConcurrencyLimiter limiter;
    auto held = limiter.acquire("k", 1, 0ms);

    auto waiter = std::async(std::launch::async, [&limiter] {
        auto permit = limiter.acquire("k", 1, 2s);
        return limiter.inFlight("k");
    });

    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(limiter.getStats().waiting, 1u);
    held.release();

    EXPECT_EQ(waiter.get(), 1u);
    EXPECT_EQ(limiter.getStats().totalAcquired, 2u);
}

TEST(ConcurrencyLimiter, QueueTimeoutExpires) {
    ConcurrencyLimiter limiter;
    auto held = limiter.acquire("k", 1, 0ms);

    try {
        limiter.acquire("k", 1, 30ms);
        FAIL() << "expected ConcurrencyLimitError";
    } catch (const ConcurrencyLimitError& e) {
        EXPECT_EQ(e.code(), "CONCURRENCY_TIMEOUT");
    }
    EXPECT_EQ(limiter.getStats().totalTimedOut, 1u);
    EXPECT_EQ(limiter.getStats().waiting, 0u);
}

TEST(ConcurrencyMiddleware, CountsDropsOnTheEventCost) {
    auto limiter = std::make_shared<ConcurrencyLimiter>();
    ConcurrencyOptions options;
    options.maxConcurrent = 1;
    options.getKey = [](const Event&) { return std::string("shared"); };

    auto held = limiter->acquire("shared", 1, 0ms);

    PipelineHandler handler = [](const Event&, const AbortSignal&) { return HandlerResult{}; };
    auto wrapped = compose(handler, {withConcurrency(limiter, options)});

    Event event = EventFactory::createEvent("job");
    EventFactory::withCostTracking(event);
    EXPECT_THROW(wrapped(event, nullptr), ConcurrencyLimitError);
    EXPECT_EQ(event.cost->concurrencyDrops.load(), 1u);

    held.release();
    EXPECT_NO_THROW(wrapped(event, nullptr));
    EXPECT_EQ(limiter->inFlight("shared"), 0u);
}

// ============================================================================
// CONDITIONAL MIDDLEWARE TESTS
// ============================================================================

TEST(Conditions, ReadPriorityAndFlagsFromMetadata) {
    auto critical = Conditions::forCriticalEvents();
    EXPECT_TRUE(critical(withMeta("job", {{"priority", "9"}})));
    EXPECT_TRUE(critical(withMeta("job", {{"critical", "true"}})));
    EXPECT_FALSE(critical(withMeta("job", {{"priority", "high"}})));
    EXPECT_FALSE(critical(EventFactory::createEvent("job")));

    auto mid = Conditions::forPriority(3, 5);
    EXPECT_TRUE(mid(withMeta("job", {{"priority", "4"}})));
    EXPECT_FALSE(mid(withMeta("job", {{"priority", "6"}})));

    EXPECT_TRUE(Conditions::forDebugEvents()(EventFactory::createEvent("debug.dump")));
    EXPECT_FALSE(Conditions::forProductionEvents()(EventFactory::createEvent("job")));
    EXPECT_TRUE(Conditions::forTenant({"acme"})(withMeta("job", {{"tenantId", "acme"}})));
    EXPECT_FALSE(Conditions::withProbability(0.0)(EventFactory::createEvent("job")));
}

TEST(Conditions, Combinators) {
    auto api = Conditions::forEventTypes({"api"});
    auto prod = Conditions::forMetadata("environment", "production");

    Event prod_api = withMeta("api", {{"environment", "production"}});
    Event dev_api = withMeta("api", {{"environment", "dev"}});

    EXPECT_TRUE(Conditions::allOf({api, prod})(prod_api));
    EXPECT_FALSE(Conditions::allOf({api, prod})(dev_api));
    EXPECT_TRUE(Conditions::anyOf({prod, api})(dev_api));
    EXPECT_TRUE(Conditions::negate(prod)(dev_api));

    auto small = Conditions::forEventSize(1, 4);
    EXPECT_TRUE(small(EventFactory::createEvent("job", EventFactory::bytes("abc"))));
    EXPECT_FALSE(small(EventFactory::createEvent("job", EventFactory::bytes("abcdef"))));
    EXPECT_FALSE(small(EventFactory::createEvent("job")));
}

TEST(ConditionalMiddleware, WhenSkipsNonMatchingEvents) {
    std::vector<std::string> trace;
    PipelineHandler handler = [](const Event&, const AbortSignal&) { return HandlerResult{}; };
    auto wrapped = compose(handler, {when(Conditions::forEventTypes({"api"}), recording("tag", trace))});

    wrapped(EventFactory::createEvent("api"), nullptr);
    wrapped(EventFactory::createEvent("db"), nullptr);

    EXPECT_EQ(trace, std::vector<std::string>{"tag"});
}

TEST(ConditionalExecutor, AppliesInPriorityOrderAndCountsPasses) {
    std::vector<std::string> trace;
    std::vector<ConditionalMiddleware> list{
        {recording("b", trace), Conditions::forEventTypes({"x"}), 2},
        {recording("a", trace), nullptr, 1},
    };
    PipelineHandler handler = [&trace](const Event&, const AbortSignal&) {
        trace.push_back("handler");
        return HandlerResult{};
    };

    ConditionalMiddlewareExecutor executor(std::make_shared<NullObservability>());
    executor.execute(list, handler, EventFactory::createEvent("x"));
    EXPECT_EQ(trace, (std::vector<std::string>{"a", "b", "handler"}));

    trace.clear();
    executor.execute(list, handler, EventFactory::createEvent("y"));
    EXPECT_EQ(trace, (std::vector<std::string>{"a", "handler"}));

    auto stats = executor.getStats();
    EXPECT_EQ(stats["a"].applied, 2u);
    EXPECT_EQ(stats["b"].applied, 1u);
    EXPECT_EQ(stats["b"].skipped, 1u);

    executor.clearStats();
    EXPECT_TRUE(executor.getStats().empty());
}

TEST(ConditionalExecutor, CountsErrorsAndRethrows) {
    std::vector<std::string> trace;
    std::vector<std::string> messages;
    std::mutex mutex;
    auto sink = std::make_shared<CallbackObservability>(
        [&](LogLevel level, const std::string& message, const LogContext&) {
            std::lock_guard<std::mutex> lock(mutex);
            if (level == LogLevel::ERROR) messages.push_back(message);
        });

    ConditionalMiddlewareExecutor executor(sink);
    auto wrapped = compose(
        [](const Event&, const AbortSignal&) -> HandlerResult { throw FlowError("BROKEN", "no"); },
        {executor.asMiddleware(std::vector<ConditionalMiddleware>{
            ConditionalMiddleware{recording("guard", trace), nullptr, 1}})});

    EXPECT_THROW(wrapped(EventFactory::createEvent("job"), nullptr), FlowError);
    EXPECT_EQ(executor.getStats()["guard"].errors, 1u);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "Conditional middleware error");
}

TEST(ConditionalFactory, RetriesOnlyCriticalEvents) {
    ConditionalMiddlewareFactory factory(std::make_shared<NullObservability>());
    auto entry = factory.createRetryMiddleware(quickRetry());
    EXPECT_EQ(entry.priority, 1);
    EXPECT_EQ(entry.middleware.name, "conditional-retry");

    std::atomic<int> calls{0};
    PipelineHandler flaky = [&calls](const Event&, const AbortSignal&) -> HandlerResult {
        if (calls.fetch_add(1) % 2 == 0) throw FlowError("ETIMEDOUT", "timed out");
        return HandlerResult{};
    };
    ConditionalMiddlewareExecutor executor(std::make_shared<NullObservability>());

    EXPECT_NO_THROW(executor.execute({entry}, flaky, withMeta("job", {{"critical", "true"}})));
    EXPECT_EQ(calls.load(), 2);

    calls = 0;
    EXPECT_THROW(executor.execute({entry}, flaky, EventFactory::createEvent("job")), FlowError);
    EXPECT_EQ(calls.load(), 1);
}

TEST(ConditionalFactory, TimeoutAppliesToExternalCalls) {
    ConditionalMiddlewareFactory factory(std::make_shared<NullObservability>());
    auto entry = factory.createTimeoutMiddleware(20ms);
    EXPECT_EQ(entry.priority, 2);
    EXPECT_TRUE(entry.condition(EventFactory::createEvent("external")));
    EXPECT_FALSE(entry.condition(EventFactory::createEvent("internal")));

    PipelineHandler slow = [](const Event&, const AbortSignal&) -> HandlerResult {
        std::this_thread::sleep_for(100ms);
        return HandlerResult{};
    };
    ConditionalMiddlewareExecutor executor(std::make_shared<NullObservability>());
    EXPECT_THROW(executor.execute({entry}, slow, EventFactory::createEvent("api")), TimeoutError);
    EXPECT_NO_THROW(executor.execute({entry}, slow, EventFactory::createEvent("internal")));
}

// ============================================================================
// COMPOSITE STACK TESTS
// ============================================================================

TEST(StandardMiddleware, RetryWrapsTheTimeout) {
    std::atomic<int> calls{0};
    PipelineHandler slow_then_fast = [&calls](const Event&, const AbortSignal&) -> HandlerResult {
        if (calls.fetch_add(1) == 0) std::this_thread::sleep_for(200ms);
        return HandlerResult{};
    };
    StandardMiddlewareOptions options;
    options.timeout = 20ms;
    options.retry = quickRetry();
    auto wrapped = compose(slow_then_fast, {createStandardMiddleware(options)});

    EXPECT_NO_THROW(wrapped(EventFactory::createEvent("job"), nullptr));
    EXPECT_EQ(calls.load(), 2);
}

TEST(StandardMiddleware, RetryCanBeTurnedOff) {
    std::atomic<int> calls{0};
    PipelineHandler failing = [&calls](const Event&, const AbortSignal&) -> HandlerResult {
        calls.fetch_add(1);
        throw FlowError("ETIMEDOUT", "timed out");
    };
    StandardMiddlewareOptions options;
    options.retry = std::nullopt;
    auto wrapped = compose(failing, {createStandardMiddleware(options)});

    EXPECT_THROW(wrapped(EventFactory::createEvent("job"), nullptr), FlowError);
    EXPECT_EQ(calls.load(), 1);
}

TEST(StandardMiddleware, ConcurrencyLimitsByEventType) {
    auto limiter = std::make_shared<ConcurrencyLimiter>();
    auto held = limiter->acquire("job", 1, 0ms);

    StandardMiddlewareOptions options;
    options.maxConcurrent = 1;
    options.limiter = limiter;
    options.retry = std::nullopt;
    PipelineHandler handler = [](const Event&, const AbortSignal&) { return HandlerResult{}; };
    auto wrapped = compose(handler, {createStandardMiddleware(options)});

    EXPECT_THROW(wrapped(EventFactory::createEvent("job"), nullptr), ConcurrencyLimitError);
    EXPECT_NO_THROW(wrapped(EventFactory::createEvent("other"), nullptr));
    held.release();
    EXPECT_NO_THROW(wrapped(EventFactory::createEvent("job"), nullptr));
}

TEST(ResilientHandler, FallbackReceivesTheFinalError) {
    std::atomic<int> calls{0};
    EventHandler failing = [&calls](const Event&) -> HandlerResult {
        calls.fetch_add(1);
        throw FlowError("NETWORK_ERROR", "down");
    };
    ResilientHandlerOptions options;
    options.maxRetries = 1;
    options.timeout = 1s;
    std::string seen_code;
    options.fallback = [&seen_code](const Event& e, const std::exception& error) -> HandlerResult {
        if (auto flow = dynamic_cast<const FlowError*>(&error)) seen_code = flow->code();
        return reEmit(EventFactory::createFollowUp(e, "fallback"));
    };

    auto handler = createResilientHandler(failing, options);
    auto result = handler(EventFactory::createEvent("job"), nullptr);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, "fallback");
    EXPECT_EQ(seen_code, "RETRY_EXCEEDED");
    EXPECT_EQ(calls.load(), 2);
}

TEST(ResilientHandler, ThrowsWithoutFallback) {
    EventHandler buggy = [](const Event&) -> HandlerResult { throw std::logic_error("bug"); };
    auto handler = createResilientHandler(buggy);

    EXPECT_THROW(handler(EventFactory::createEvent("job"), nullptr), std::logic_error);
}

// ============================================================================
// VALIDATION MIDDLEWARE TESTS
// ============================================================================

TEST(ValidateMiddleware, RejectsInvalidEvents) {
    std::atomic<int> calls{0};
    PipelineHandler handler = [&calls](const Event&, const AbortSignal&) {
        calls.fetch_add(1);
        return HandlerResult{};
    };
    ValidateOptions options;
    options.errorCode = "BAD_ORDER";
    auto mw = withValidate(Validators::requireMetadata({"orderId"}), options);
    EXPECT_EQ(mw.kind, MiddlewareKind::HANDLER);
    auto wrapped = compose(handler, {mw});

    try {
        wrapped(EventFactory::createEvent("order"), nullptr);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), "BAD_ORDER");
        EXPECT_EQ(std::string(e.what()), "Validation failed for event order: missing metadata 'orderId'");
    }
    EXPECT_EQ(calls.load(), 0);

    EXPECT_NO_THROW(wrapped(withMeta("order", {{"orderId", "7"}}), nullptr));
    EXPECT_EQ(calls.load(), 1);
}

TEST(ValidateMiddleware, DropsInvalidEventsWhenNotThrowing) {
    std::atomic<int> calls{0};
    PipelineHandler handler = [&calls](const Event& e, const AbortSignal&) {
        calls.fetch_add(1);
        return reEmit(EventFactory::createFollowUp(e, "done"));
    };
    ValidateOptions options;
    options.throwOnError = false;
    auto wrapped = compose(handler, {withValidate(
        Validators::all({Validators::requireData(), Validators::maxDataSize(4)}), options)});

    EXPECT_FALSE(wrapped(EventFactory::createEvent("job"), nullptr).has_value());
    EXPECT_FALSE(wrapped(EventFactory::createEvent("job", EventFactory::bytes("too long")), nullptr).has_value());
    EXPECT_EQ(calls.load(), 0);

    auto result = wrapped(EventFactory::createEvent("job", EventFactory::bytes("ok")), nullptr);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, "done");
}

TEST(ValidateMiddleware, ValidatorExceptionsBecomeValidationErrors) {
    PipelineHandler handler = [](const Event&, const AbortSignal&) { return HandlerResult{}; };

    auto throwing = compose(handler, {withValidate([](const Event&) -> std::optional<std::string> {
        throw std::runtime_error("parser crashed");
    })});
    try {
        throwing(EventFactory::createEvent("job"), nullptr);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), "VALIDATION_ERROR");
        EXPECT_EQ(std::string(e.what()), "Validation error: parser crashed");
    }

    auto flow = compose(handler, {withValidate([](const Event&) -> std::optional<std::string> {
        throw FlowError("SCHEMA_MISSING", "no schema");
    })});
    try {
        flow(EventFactory::createEvent("job"), nullptr);
        FAIL() << "expected FlowError";
    } catch (const FlowError& e) {
        EXPECT_EQ(e.code(), "SCHEMA_MISSING");
    }
}

TEST(ValidateMiddleware, HandlerErrorsPassThroughUnchanged) {
    PipelineHandler handler = [](const Event&, const AbortSignal&) -> HandlerResult {
        throw std::logic_error("bug");
    };
    auto wrapped = compose(handler, {withValidate(Validators::requireData())});

    EXPECT_THROW(wrapped(EventFactory::createEvent("job", EventFactory::bytes("x")), nullptr),
                 std::logic_error);
}
