#include <flowcore/core/errors.hpp>

#include <sstream>
#include <utility>

namespace FlowCore {

FlowError::FlowError(std::string code, const std::string& message, std::optional<int> status)
    : std::runtime_error(message), code_(std::move(code)), status_(status) {}

ConfigError::ConfigError(const std::string& message)
    : FlowError("CONFIG_ERROR", message) {}

EventDepthExceededError::EventDepthExceededError(size_t depth, size_t limit)
    : FlowError("MAX_DEPTH_EXCEEDED",
                "Maximum event processing depth exceeded: " + std::to_string(depth) +
                    " >= " + std::to_string(limit)),
      depth_(depth) {}

EventChainLengthError::EventChainLengthError(size_t length, size_t limit)
    : FlowError("MAX_CHAIN_EXCEEDED",
                "Event chain too long: " + std::to_string(length) +
                    " >= " + std::to_string(limit)) {}

static std::string joinChain(const std::vector<std::string>& chain) {
    std::ostringstream out;
    for (size_t i = 0; i < chain.size(); ++i) {
        if (i > 0) out << " -> ";
        out << chain[i];
    }
    return out.str();
}

EventLoopDetectedError::EventLoopDetectedError(const std::string& event_type,
                                               std::vector<std::string> chain)
    : FlowError("EVENT_LOOP_DETECTED",
                "Event loop detected for " + event_type + ": " + joinChain(chain)),
      event_type_(event_type),
      chain_(std::move(chain)) {}

RetryExceededError::RetryExceededError(const std::string& event_type, uint32_t attempts,
                                       std::exception_ptr cause,
                                       const std::string& cause_message)
    : FlowError("RETRY_EXCEEDED",
                "Retry limit exceeded for " + event_type + " after " +
                    std::to_string(attempts) + " attempts: " + cause_message),
      event_type_(event_type),
      attempts_(attempts),
      cause_(std::move(cause)),
      cause_message_(cause_message) {}

AbortedError::AbortedError(const std::string& message)
    : FlowError("ABORTED", message) {}

TimeoutError::TimeoutError(const std::string& message)
    : FlowError("TIMEOUT_EXCEEDED", message) {}

CircuitOpenError::CircuitOpenError(const std::string& circuit_name)
    : FlowError("CIRCUIT_OPEN", "Circuit breaker is OPEN for " + circuit_name),
      circuit_name_(circuit_name) {}

ConcurrencyLimitError::ConcurrencyLimitError(std::string code, const std::string& message)
    : FlowError(std::move(code), message) {}

ValidationError::ValidationError(const std::string& message, std::string code)
    : FlowError(std::move(code), message) {}

StateCapacityError::StateCapacityError(const std::string& message)
    : FlowError("STATE_CAPACITY_EXCEEDED", message) {}

LifecycleError::LifecycleError(const std::string& message)
    : FlowError("AGENT_ERROR", message) {}

LifecycleError::LifecycleError(std::string code, const std::string& message)
    : FlowError(std::move(code), message) {}

LifecycleConflictError::LifecycleConflictError(const std::string& message)
    : LifecycleError("AGENT_CONFLICT", message) {}

InvalidTransitionError::InvalidTransitionError(const std::string& from, const std::string& to)
    : LifecycleError("INVALID_TRANSITION",
                     "Invalid status transition from " + from + " to " + to),
      from_(from),
      to_(to) {}

AgentNotFoundError::AgentNotFoundError(const std::string& tenant_id,
                                       const std::string& agent_name)
    : LifecycleError("AGENT_NOT_FOUND",
                     "Agent " + agent_name + " not found for tenant " + tenant_id) {}

std::string describeException(const std::exception_ptr& error) {
    if (!error) return "no error";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace FlowCore
