#pragma once

#include <flowcore/core/processor/middleware.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace FlowCore {

/// Returns a description of what is wrong with the event, or nullopt when it is valid
using EventValidator = std::function<std::optional<std::string>(const Event&)>;

struct ValidateOptions {
    bool throwOnError = true;                  // false: drop the event silently
    std::string errorCode = "VALIDATION_ERROR";
};

/**
 * @brief Handler middleware that runs @p validator before the handler.
 *
 * An invalid event raises ValidationError ("Validation failed for event
 * <type>: <reason>") with options.errorCode, or, when throwOnError is false,
 * returns no result without calling the handler. A FlowError thrown by the
 * validator passes through; any other exception becomes a VALIDATION_ERROR.
 * Handler errors are not touched.
 */
Middleware withValidate(EventValidator validator, ValidateOptions options = {});

namespace Validators {

EventValidator requireMetadata(std::vector<std::string> keys);
EventValidator requireData();
EventValidator maxDataSize(size_t max_bytes);
/// First failing validator wins
EventValidator all(std::vector<EventValidator> validators);

} // namespace Validators

} // namespace FlowCore
