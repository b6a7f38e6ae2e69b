#include <flowcore/core/resilience/timeout.hpp>
#include <flowcore/core/utils/parallel.hpp>

#include <memory>
#include <optional>

namespace FlowCore {

Middleware withTimeout(std::chrono::milliseconds timeout, std::shared_ptr<WorkerGroup> workers) {
    if (!workers) {
        workers = std::make_shared<WorkerGroup>("timeout");
    }

    Middleware mw;
    mw.name = "timeout";
    mw.kind = MiddlewareKind::PIPELINE;
    mw.wrap = [timeout, workers](PipelineHandler next) -> PipelineHandler {
        return [timeout, workers, next = std::move(next)](const Event& event, const AbortSignal& signal) {
            auto slot = std::make_shared<HandlerResult>();
            // The worker must not hold the group itself
            runWithDeadline(
                [slot, next, event, signal]() { *slot = next(event, signal); },
                timeout, signal, *workers, "Handler for " + event.type);
            return *slot;
        };
    };
    return mw;
}

} // namespace FlowCore
