#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace FlowCore {

/**
 * @enum LogLevel
 * @brief Severity of a message sent to an ObservabilitySink
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* toString(LogLevel level);

/// Structured key/value context attached to a log line or span
using LogContext = std::vector<std::pair<std::string, std::string>>;

struct TraceOptions {
    std::string correlationId;
    std::string tenantId;
    LogContext attributes;
};

/**
 * @class ObservabilitySink
 * @brief Output interface for component logs and trace spans.
 *
 * Implementations must be thread-safe. trace() runs @p fn exactly once on
 * the calling thread and lets its exceptions propagate.
 */
class ObservabilitySink {
public:
    virtual ~ObservabilitySink() = default;

    virtual void log(LogLevel level, const std::string& message, const LogContext& context = {}) = 0;

    virtual void trace(const std::string& span_name, const std::function<void()>& fn,
                       const TraceOptions& options = {}) = 0;

    virtual const char* name() const = 0;
};

using ObservabilitySinkPtr = std::shared_ptr<ObservabilitySink>;

/**
 * @class SpdlogObservability
 * @brief Logs through spdlog; spans are logged at debug level with their duration
 */
class SpdlogObservability : public ObservabilitySink {
public:
    void log(LogLevel level, const std::string& message, const LogContext& context = {}) override;
    void trace(const std::string& span_name, const std::function<void()>& fn,
               const TraceOptions& options = {}) override;
    const char* name() const override { return "SpdlogObservability"; }
};

/**
 * @class CallbackObservability
 * @brief Forwards logs and finished spans to user callbacks (handy in tests)
 */
class CallbackObservability : public ObservabilitySink {
public:
    struct SpanRecord {
        std::string name;
        TraceOptions options;
        uint64_t durationMs = 0;
        bool failed = false;
    };

    using LogCallback = std::function<void(LogLevel, const std::string&, const LogContext&)>;
    using SpanCallback = std::function<void(const SpanRecord&)>;

    explicit CallbackObservability(LogCallback on_log, SpanCallback on_span = nullptr)
        : on_log_(std::move(on_log)), on_span_(std::move(on_span)) {}

    void log(LogLevel level, const std::string& message, const LogContext& context = {}) override;
    void trace(const std::string& span_name, const std::function<void()>& fn,
               const TraceOptions& options = {}) override;
    const char* name() const override { return "CallbackObservability"; }

private:
    LogCallback on_log_;
    SpanCallback on_span_;
};

/**
 * @class NullObservability
 * @brief Discards logs; spans just run their function
 */
class NullObservability : public ObservabilitySink {
public:
    void log(LogLevel, const std::string&, const LogContext&) override {}
    void trace(const std::string&, const std::function<void()>& fn, const TraceOptions&) override {
        fn();
    }
    const char* name() const override { return "NullObservability"; }
};

} // namespace FlowCore
