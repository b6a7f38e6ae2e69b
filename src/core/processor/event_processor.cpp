#include <flowcore/core/processor/event_processor.hpp>
#include <flowcore/core/errors.hpp>
#include <flowcore/core/metrics/registry.hpp>
#include <flowcore/core/resilience/timeout.hpp>
#include <flowcore/core/utils/clock.hpp>
#include <flowcore/core/utils/parallel.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace FlowCore {

// ============================================================================
// DispatchFrame - depth/chain bookkeeping released on every exit path
// ============================================================================

class EventProcessor::DispatchFrame {
public:
    DispatchFrame(ProcessingContext& ctx, std::atomic<size_t>& active_depth, const std::string& type)
        : ctx_(ctx), active_depth_(active_depth) {
        ++ctx_.depth;
        ctx_.chain.push(type);
        active_depth_.fetch_add(1, std::memory_order_relaxed);
    }

    ~DispatchFrame() {
        active_depth_.fetch_sub(1, std::memory_order_relaxed);
        ctx_.chain.pop();
        --ctx_.depth;
    }

    DispatchFrame(const DispatchFrame&) = delete;
    DispatchFrame& operator=(const DispatchFrame&) = delete;

private:
    ProcessingContext& ctx_;
    std::atomic<size_t>& active_depth_;
};

// ============================================================================
// Construction
// ============================================================================

EventProcessorConfig EventProcessorConfig::fromApp(const AppConfig::ProcessorConfig& app) {
    EventProcessorConfig cfg;
    cfg.maxEventDepth = app.maxEventDepth;
    cfg.maxEventChainLength = app.maxEventChainLength;
    cfg.enableObservability = app.enableObservability;
    cfg.batchSize = app.batchSize;
    cfg.maxBatchWorkers = app.maxBatchWorkers;
    cfg.cleanupInterval = std::chrono::milliseconds(app.cleanupIntervalMs);
    cfg.staleThreshold = std::chrono::milliseconds(app.staleThresholdMs);
    cfg.operationTimeout = std::chrono::milliseconds(app.operationTimeoutMs);
    cfg.historyCapacity = app.historyCapacity;
    return cfg;
}

EventProcessor::EventProcessor(Runtime& runtime, EventProcessorConfig config)
    : runtime_(runtime),
      config_(std::move(config)),
      history_(config_.historyCapacity),
      workers_(std::make_shared<WorkerGroup>("processor")) {
    for (const auto& mw : config_.middleware) {
        if (mw.kind == MiddlewareKind::PIPELINE) {
            pipeline_middlewares_.push_back(mw);
        } else {
            handler_middlewares_.push_back(mw);
        }
    }
    if (config_.operationTimeout.count() > 0) {
        pipeline_middlewares_.push_back(withTimeout(config_.operationTimeout, workers_));
    }

    if (config_.cleanupInterval.count() > 0) {
        cleanup_task_ = runtime_.timers().scheduleEvery(config_.cleanupInterval, [this] {
            size_t removed = cleanupStaleHandlers();
            if (removed > 0) {
                spdlog::info("[EventProcessor] Periodic sweep removed {} stale handlers", removed);
            }
        });
    }

    spdlog::info("[EventProcessor] initialized (maxDepth={}, maxChain={}, batchSize={}, "
                 "pipelineMiddlewares={}, handlerMiddlewares={})",
                 config_.maxEventDepth, config_.maxEventChainLength, config_.batchSize,
                 pipeline_middlewares_.size(), handler_middlewares_.size());
}

EventProcessor::~EventProcessor() noexcept {
    spdlog::info("[DESTRUCTOR] EventProcessor being destroyed...");
    cleanup_task_.cancelAndWait();
    // Handler calls that lost their timeout race may still be running
    workers_->waitIdle();
}

// ============================================================================
// Registration
// ============================================================================

PipelineHandler EventProcessor::wrapHandler(EventHandler handler) const {
    return compose(adaptHandler(std::move(handler)), handler_middlewares_);
}

HandlerId EventProcessor::registerHandler(const std::string& event_type, EventHandler handler) {
    auto id = registry_.addExact(event_type, wrapHandler(std::move(handler)));
    spdlog::debug("[EventProcessor] Registered handler {} for {}", id, event_type);
    return id;
}

HandlerId EventProcessor::registerWildcardHandler(EventHandler handler) {
    auto id = registry_.addWildcard(wrapHandler(std::move(handler)));
    spdlog::debug("[EventProcessor] Registered wildcard handler {}", id);
    return id;
}

HandlerId EventProcessor::registerPatternHandler(const std::string& pattern, EventHandler handler) {
    auto id = registry_.addPattern(pattern, wrapHandler(std::move(handler)));
    spdlog::debug("[EventProcessor] Registered pattern handler {} for /{}/", id, pattern);
    return id;
}

bool EventProcessor::deactivateHandler(const HandlerId& id) {
    bool found = registry_.deactivate(id);
    if (!found) {
        spdlog::warn("[EventProcessor] deactivateHandler: unknown handler {}", id);
    }
    return found;
}

// ============================================================================
// Dispatch
// ============================================================================

void EventProcessor::processEvent(const Event& event, const AbortSignal& signal) {
    auto& m = runtime_.metrics().getMetrics(MetricNames::EVENT_PROCESSOR);

    ProcessingContext ctx(config_.maxEventChainLength);
    ctx.startTimeMs = Clock::now_ms();
    ctx.correlationId = event.correlationId();
    ctx.signal = signal;

    try {
        dispatch(event, ctx);
    } catch (...) {
        m.total_events_errors.fetch_add(1, std::memory_order_relaxed);
        throw;
    }

    const uint64_t elapsed = Clock::now_ms() - ctx.startTimeMs;
    m.total_events_processed.fetch_add(1, std::memory_order_relaxed);
    m.total_processing_time_ms.fetch_add(elapsed, std::memory_order_relaxed);
    updateMax(m.max_processing_time_ms, elapsed);
    m.last_event_timestamp_ms.store(Clock::epoch_ms(), std::memory_order_relaxed);
}

void EventProcessor::dispatch(const Event& event, ProcessingContext& ctx) {
    auto& m = runtime_.metrics().getMetrics(MetricNames::EVENT_PROCESSOR);

    if (ctx.depth >= config_.maxEventDepth) {
        m.total_depth_violations.fetch_add(1, std::memory_order_relaxed);
        throw EventDepthExceededError(ctx.depth, config_.maxEventDepth);
    }
    if (ctx.chain.size() >= config_.maxEventChainLength) {
        m.total_depth_violations.fetch_add(1, std::memory_order_relaxed);
        throw EventChainLengthError(ctx.chain.size(), config_.maxEventChainLength);
    }

    const bool seen = ctx.chain.contains(event.type);
    DispatchFrame frame(ctx, active_depth_, event.type);

    if (seen && ctx.chain.size() > 1) {
        m.total_loops_detected.fetch_add(1, std::memory_order_relaxed);
        auto chain = ctx.chain.entries();
        logToSink(LogLevel::ERROR, "Event loop detected",
                  {{"eventType", event.type}, {"chainLength", std::to_string(chain.size())}});
        ctx.failureLogged = true;
        throw EventLoopDetectedError(event.type, std::move(chain));
    }

    history_.push(event);

    // Only the handler outcome decides how dispatch ends; sink errors are logged
    std::exception_ptr failure;
    bool entered = false;
    auto body = [&] {
        entered = true;
        try {
            runHandlers(event, ctx);
        } catch (...) {
            failure = std::current_exception();
            throw;
        }
    };

    if (config_.enableObservability) {
        TraceOptions opts;
        opts.correlationId = ctx.correlationId.value_or(event.id);
        opts.tenantId = event.metadataOr("tenantId", runtime_.tenantId());
        opts.attributes = {
            {"workflow.name", "event-processing"},
            {"workflow.step", event.type},
            {"executionId", runtime_.executionId()},
            {"eventType", event.type},
            {"eventSize", std::to_string(event.data.size())},
            {"depth", std::to_string(ctx.depth)},
        };
        try {
            runtime_.observability().trace("workflow.step", body, opts);
        } catch (const std::exception& e) {
            if (!failure) {
                spdlog::warn("[EventProcessor] Observability trace failed for {}: {}",
                             event.type, e.what());
            }
        } catch (...) {
            // handler error that is not a std::exception; rethrown below
            if (!failure) throw;
        }
    }

    if (!entered) {
        try {
            runHandlers(event, ctx);
        } catch (...) {
            failure = std::current_exception();
        }
    }

    if (failure) {
        if (!ctx.failureLogged) {
            ctx.failureLogged = true;
            logToSink(LogLevel::ERROR, "Event processing failed",
                      {{"eventType", event.type},
                       {"eventId", event.id},
                       {"depth", std::to_string(ctx.depth)},
                       {"chainLength", std::to_string(ctx.chain.size())},
                       {"error", describeException(failure)}});
        }
        std::rethrow_exception(failure);
    }
}

void EventProcessor::logToSink(LogLevel level, const std::string& message, const LogContext& context) {
    try {
        runtime_.observability().log(level, message, context);
    } catch (const std::exception& e) {
        spdlog::warn("[EventProcessor] Observability sink failed on '{}': {}", message, e.what());
    }
}

void EventProcessor::runHandlers(const Event& event, ProcessingContext& ctx) {
    auto handlers = registry_.resolve(event.type, Clock::epoch_ms());
    if (handlers.empty()) {
        logToSink(LogLevel::DEBUG, "No handlers registered for event", {{"eventType", event.type}});
        return;
    }

    if (config_.batchSize > 0 && handlers.size() > config_.batchSize) {
        processHandlersBatch(handlers, event, ctx);
    } else {
        processHandlersSequential(handlers, event, ctx);
    }
}

void EventProcessor::processHandlersSequential(const std::vector<TrackedHandlerPtr>& handlers,
                                               const Event& event, ProcessingContext& ctx) {
    for (const auto& handler : handlers) {
        if (isAborted(ctx.signal)) {
            throw AbortedError("Event processing aborted for " + event.type);
        }
        invokeHandler(handler, event, ctx);
    }
}

void EventProcessor::processHandlersBatch(const std::vector<TrackedHandlerPtr>& handlers,
                                          const Event& event, const ProcessingContext& ctx) {
    auto& m = runtime_.metrics().getMetrics(MetricNames::EVENT_PROCESSOR);
    const size_t total = handlers.size();
    size_t failed = 0;

    for (size_t offset = 0; offset < total; offset += config_.batchSize) {
        const size_t end = std::min(total, offset + config_.batchSize);

        std::vector<std::function<void()>> tasks;
        tasks.reserve(end - offset);
        for (size_t i = offset; i < end; ++i) {
            tasks.push_back([this, handler = handlers[i], &event, branch = ctx]() mutable {
                invokeHandler(handler, event, branch);
            });
        }

        m.total_batches.fetch_add(1, std::memory_order_relaxed);
        auto errors = runConcurrently(tasks, config_.maxBatchWorkers);
        for (size_t i = 0; i < errors.size(); ++i) {
            if (errors[i]) {
                ++failed;
                spdlog::debug("[EventProcessor] Batch handler {} failed: {}",
                              handlers[offset + i]->id, describeException(errors[i]));
            }
        }
    }

    if (failed > 0) {
        logToSink(LogLevel::WARN, "Batch processing completed with failures",
                  {{"eventType", event.type},
                   {"failed", std::to_string(failed)},
                   {"total", std::to_string(total)}});
    }
}

void EventProcessor::invokeHandler(const TrackedHandlerPtr& handler, const Event& event,
                                   ProcessingContext& ctx) {
    auto& m = runtime_.metrics().getMetrics(MetricNames::EVENT_PROCESSOR);
    PipelineHandler call = compose(handler->handler, pipeline_middlewares_);

    m.total_handler_invocations.fetch_add(1, std::memory_order_relaxed);
    HandlerResult result;
    try {
        result = call(event, ctx.signal);
    } catch (...) {
        m.total_handler_failures.fetch_add(1, std::memory_order_relaxed);
        throw;
    }

    if (result) {
        dispatch(*result, ctx);
    }
}

// ============================================================================
// Maintenance & introspection
// ============================================================================

size_t EventProcessor::cleanupStaleHandlers() {
    size_t removed = registry_.sweep(Clock::epoch_ms(), config_.staleThreshold);
    if (removed > 0) {
        spdlog::debug("[EventProcessor] Removed {} stale handlers", removed);
    }
    return removed;
}

void EventProcessor::clearHandlers() {
    registry_.clear();
    spdlog::info("[EventProcessor] All handlers cleared");
}

void EventProcessor::cleanup() {
    registry_.clear();
    history_.clear();
    spdlog::info("[EventProcessor] Handlers and history cleared");
}

EventProcessorStats EventProcessor::getStats() const {
    EventProcessorStats stats;
    stats.exactEventTypes = registry_.exactTypeCount();
    stats.wildcardHandlers = registry_.wildcardCount();
    stats.patternHandlers = registry_.patternCount();
    stats.totalHandlers = registry_.totalHandlers();
    stats.currentDepth = active_depth_.load(std::memory_order_relaxed);
    stats.historySize = history_.size();
    stats.historyCapacity = history_.capacity();
    stats.totalRecorded = history_.totalRecorded();
    stats.operationTimeout = config_.operationTimeout;
    return stats;
}

std::vector<HistoryRecord> EventProcessor::getRecentEvents(size_t limit) const {
    return history_.getRecentEvents(limit);
}

} // namespace FlowCore
