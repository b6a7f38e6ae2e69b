#pragma once

#include <flowcore/core/events/event.hpp>
#include <flowcore/core/utils/cancellation.hpp>

#include <functional>
#include <string>
#include <vector>

namespace FlowCore {

/// User handler: reacts to one event, optionally returning a follow-up to re-dispatch
using EventHandler = std::function<HandlerResult(const Event&)>;

/// Handler as seen by middlewares: also receives the abort signal of the current call
using PipelineHandler = std::function<HandlerResult(const Event&, const AbortSignal&)>;

/**
 * @enum MiddlewareKind
 * HANDLER middlewares are composed once around each handler at registration.
 * PIPELINE middlewares are composed around every handler invocation.
 */
enum class MiddlewareKind {
    PIPELINE,
    HANDLER
};

struct Middleware {
    std::string name;
    MiddlewareKind kind = MiddlewareKind::HANDLER;
    std::function<PipelineHandler(PipelineHandler)> wrap;
};

/// Lift a plain handler into a pipeline handler that ignores the signal
PipelineHandler adaptHandler(EventHandler handler);

/// Apply @p middlewares in order; the last one ends up outermost
PipelineHandler compose(PipelineHandler inner, const std::vector<Middleware>& middlewares);

} // namespace FlowCore
