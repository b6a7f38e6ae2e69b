#pragma once
#include <flowcore/core/config/app_config.hpp>
#include <flowcore/core/events/event.hpp>
#include <flowcore/core/events/event_history.hpp>
#include <flowcore/core/processor/handler_registry.hpp>
#include <flowcore/core/processor/middleware.hpp>
#include <flowcore/core/processor/processing_context.hpp>
#include <flowcore/core/runtime/runtime.hpp>
#include <flowcore/core/runtime/timer_service.hpp>
#include <flowcore/core/utils/worker_group.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace FlowCore {

struct EventProcessorConfig {
    size_t maxEventDepth = 100;
    size_t maxEventChainLength = 1000;
    bool enableObservability = true;
    std::vector<Middleware> middleware;
    size_t batchSize = 100;                              // 0 = always sequential
    size_t maxBatchWorkers = 0;                          // 0 = hardware concurrency
    std::chrono::milliseconds cleanupInterval{120000};   // 0 = no periodic sweep
    std::chrono::milliseconds staleThreshold{600000};
    std::chrono::milliseconds operationTimeout{0};       // per handler call, 0 = unbounded
    size_t historyCapacity = EventHistory::DEFAULT_CAPACITY;

    static EventProcessorConfig fromApp(const AppConfig::ProcessorConfig& app);
};

struct EventProcessorStats {
    size_t exactEventTypes = 0;
    size_t wildcardHandlers = 0;
    size_t patternHandlers = 0;
    size_t totalHandlers = 0;
    size_t currentDepth = 0;
    size_t historySize = 0;
    size_t historyCapacity = 0;
    uint64_t totalRecorded = 0;
    std::chrono::milliseconds operationTimeout{0};
};

/**
 * @class EventProcessor
 * @brief Synchronous event dispatcher with recursion and loop protection.
 *
 * processEvent() resolves every handler registered for the event (exact,
 * wildcard, then pattern), runs them through the middleware chain and
 * recursively dispatches any follow-up event they return, all before it
 * returns to the caller.
 *
 * Handlers run sequentially in registration order and the first failure
 * propagates. When more than batchSize handlers match, they run in chunks of
 * batchSize, each chunk concurrently; failures there are isolated and logged.
 *
 * The observability sink only observes: an exception it throws is logged and
 * never replaces or masks the handler outcome. The destructor waits for
 * handler calls that outlived their operation timeout.
 */
class EventProcessor {
public:
    EventProcessor(Runtime& runtime, EventProcessorConfig config = {});
    ~EventProcessor() noexcept;

    EventProcessor(const EventProcessor&) = delete;
    EventProcessor& operator=(const EventProcessor&) = delete;

    HandlerId registerHandler(const std::string& event_type, EventHandler handler);
    HandlerId registerWildcardHandler(EventHandler handler);

    /// @throws ConfigError on an invalid regex
    HandlerId registerPatternHandler(const std::string& pattern, EventHandler handler);

    /// @return false when no handler has this id
    bool deactivateHandler(const HandlerId& id);

    /**
     * @brief Dispatch @p event and everything it re-emits.
     * @throws EventDepthExceededError, EventChainLengthError, EventLoopDetectedError
     *         or the first handler failure (sequential mode)
     */
    void processEvent(const Event& event, const AbortSignal& signal = nullptr);

    /// @return number of handlers removed
    size_t cleanupStaleHandlers();

    void clearHandlers();

    /// Clear handlers and history
    void cleanup();

    EventProcessorStats getStats() const;

    /// Newest first
    std::vector<HistoryRecord> getRecentEvents(size_t limit = 50) const;

    const char* name() const { return "EventProcessor"; }

private:
    class DispatchFrame;

    void dispatch(const Event& event, ProcessingContext& ctx);
    void runHandlers(const Event& event, ProcessingContext& ctx);
    void processHandlersSequential(const std::vector<TrackedHandlerPtr>& handlers,
                                   const Event& event, ProcessingContext& ctx);
    void processHandlersBatch(const std::vector<TrackedHandlerPtr>& handlers,
                              const Event& event, const ProcessingContext& ctx);
    void invokeHandler(const TrackedHandlerPtr& handler, const Event& event, ProcessingContext& ctx);
    PipelineHandler wrapHandler(EventHandler handler) const;

    /// Sink failures are logged and never change the dispatch outcome
    void logToSink(LogLevel level, const std::string& message, const LogContext& context);

    Runtime& runtime_;
    EventProcessorConfig config_;
    std::vector<Middleware> pipeline_middlewares_;
    std::vector<Middleware> handler_middlewares_;
    HandlerRegistry registry_;
    EventHistory history_;
    std::atomic<size_t> active_depth_{0};
    std::shared_ptr<WorkerGroup> workers_;   // owns handler calls past their operation timeout
    TaskHandle cleanup_task_;
};

} // namespace FlowCore
