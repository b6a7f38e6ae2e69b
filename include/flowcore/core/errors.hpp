#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace FlowCore {

/**
 * @brief Base class for every error raised by FlowCore components.
 *
 * Carries a stable machine-readable code (e.g. "RETRY_EXCEEDED") and an
 * optional transport-style status, which the retry classifier inspects.
 */
class FlowError : public std::runtime_error {
public:
    FlowError(std::string code, const std::string& message,
              std::optional<int> status = std::nullopt);

    const std::string& code() const noexcept { return code_; }
    std::optional<int> status() const noexcept { return status_; }

private:
    std::string code_;
    std::optional<int> status_;
};

class ConfigError : public FlowError {
public:
    explicit ConfigError(const std::string& message);
};

// ============================================================================
// Event processing
// ============================================================================

class EventDepthExceededError : public FlowError {
public:
    EventDepthExceededError(size_t depth, size_t limit);
    size_t depth() const noexcept { return depth_; }

private:
    size_t depth_;
};

class EventChainLengthError : public FlowError {
public:
    EventChainLengthError(size_t length, size_t limit);
};

class EventLoopDetectedError : public FlowError {
public:
    EventLoopDetectedError(const std::string& event_type, std::vector<std::string> chain);

    const std::string& eventType() const noexcept { return event_type_; }
    const std::vector<std::string>& chain() const noexcept { return chain_; }

private:
    std::string event_type_;
    std::vector<std::string> chain_;
};

// ============================================================================
// Resilience
// ============================================================================

class RetryExceededError : public FlowError {
public:
    RetryExceededError(const std::string& event_type, uint32_t attempts,
                       std::exception_ptr cause, const std::string& cause_message);

    uint32_t attempts() const noexcept { return attempts_; }
    const std::string& eventType() const noexcept { return event_type_; }
    std::exception_ptr cause() const noexcept { return cause_; }
    const std::string& causeMessage() const noexcept { return cause_message_; }

private:
    std::string event_type_;
    uint32_t attempts_;
    std::exception_ptr cause_;
    std::string cause_message_;
};

class AbortedError : public FlowError {
public:
    explicit AbortedError(const std::string& message = "Operation aborted");
};

class TimeoutError : public FlowError {
public:
    explicit TimeoutError(const std::string& message);
};

class CircuitOpenError : public FlowError {
public:
    explicit CircuitOpenError(const std::string& circuit_name);
    const std::string& circuitName() const noexcept { return circuit_name_; }

private:
    std::string circuit_name_;
};

class ConcurrencyLimitError : public FlowError {
public:
    ConcurrencyLimitError(std::string code, const std::string& message);
};

class ValidationError : public FlowError {
public:
    explicit ValidationError(const std::string& message, std::string code = "VALIDATION_ERROR");
};

// ============================================================================
// State and lifecycle
// ============================================================================

class StateCapacityError : public FlowError {
public:
    explicit StateCapacityError(const std::string& message);
};

class LifecycleError : public FlowError {
public:
    explicit LifecycleError(const std::string& message);

protected:
    LifecycleError(std::string code, const std::string& message);
};

class LifecycleConflictError : public LifecycleError {
public:
    explicit LifecycleConflictError(const std::string& message);
};

class InvalidTransitionError : public LifecycleError {
public:
    InvalidTransitionError(const std::string& from, const std::string& to);

    const std::string& from() const noexcept { return from_; }
    const std::string& to() const noexcept { return to_; }

private:
    std::string from_;
    std::string to_;
};

class AgentNotFoundError : public LifecycleError {
public:
    AgentNotFoundError(const std::string& tenant_id, const std::string& agent_name);
};

/// Message of a captured exception, "unknown error" when it is not a std::exception
std::string describeException(const std::exception_ptr& error);

} // namespace FlowCore
