#include <flowcore/core/processor/middleware.hpp>

namespace FlowCore {

PipelineHandler adaptHandler(EventHandler handler) {
    return [handler = std::move(handler)](const Event& event, const AbortSignal&) {
        return handler(event);
    };
}

PipelineHandler compose(PipelineHandler inner, const std::vector<Middleware>& middlewares) {
    PipelineHandler current = std::move(inner);
    for (const auto& mw : middlewares) {
        if (mw.wrap) {
            current = mw.wrap(std::move(current));
        }
    }
    return current;
}

} // namespace FlowCore
