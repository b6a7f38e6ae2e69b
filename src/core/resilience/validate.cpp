#include <flowcore/core/resilience/validate.hpp>
#include <flowcore/core/errors.hpp>

#include <utility>

namespace FlowCore {

Middleware withValidate(EventValidator validator, ValidateOptions options) {
    Middleware mw;
    mw.name = "validate";
    mw.kind = MiddlewareKind::HANDLER;
    mw.wrap = [validator = std::move(validator), options = std::move(options)](PipelineHandler next) -> PipelineHandler {
        return [validator, options, next = std::move(next)](const Event& event,
                                                             const AbortSignal& signal) -> HandlerResult {
            std::optional<std::string> problem;
            try {
                problem = validator ? validator(event) : std::nullopt;
            } catch (const FlowError&) {
                throw;
            } catch (const std::exception& e) {
                throw ValidationError(std::string("Validation error: ") + e.what());
            }

            if (problem) {
                if (!options.throwOnError) {
                    return std::nullopt;
                }
                throw ValidationError("Validation failed for event " + event.type + ": " + *problem,
                                      options.errorCode);
            }
            return next(event, signal);
        };
    };
    return mw;
}

namespace Validators {

EventValidator requireMetadata(std::vector<std::string> keys) {
    return [keys = std::move(keys)](const Event& event) -> std::optional<std::string> {
        for (const auto& key : keys) {
            if (!event.metadataValue(key)) {
                return "missing metadata '" + key + "'";
            }
        }
        return std::nullopt;
    };
}

EventValidator requireData() {
    return [](const Event& event) -> std::optional<std::string> {
        if (event.data.empty()) return std::string("empty payload");
        return std::nullopt;
    };
}

EventValidator maxDataSize(size_t max_bytes) {
    return [max_bytes](const Event& event) -> std::optional<std::string> {
        if (event.data.size() > max_bytes) {
            return "payload of " + std::to_string(event.data.size()) + " bytes exceeds " +
                   std::to_string(max_bytes);
        }
        return std::nullopt;
    };
}

EventValidator all(std::vector<EventValidator> validators) {
    return [validators = std::move(validators)](const Event& event) -> std::optional<std::string> {
        for (const auto& validator : validators) {
            if (auto problem = validator(event)) return problem;
        }
        return std::nullopt;
    };
}

} // namespace Validators

} // namespace FlowCore
