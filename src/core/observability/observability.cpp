#include <flowcore/core/observability/observability.hpp>
#include <flowcore/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

namespace FlowCore {

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        default:              return "unknown";
    }
}

static std::string formatContext(const LogContext& context) {
    std::string out;
    for (const auto& [key, value] : context) {
        out += out.empty() ? " {" : ", ";
        out += key;
        out += "=";
        out += value;
    }
    if (!out.empty()) out += "}";
    return out;
}

void SpdlogObservability::log(LogLevel level, const std::string& message, const LogContext& context) {
    const std::string ctx = formatContext(context);
    switch (level) {
        case LogLevel::DEBUG:
            spdlog::debug("{}{}", message, ctx);
            break;
        case LogLevel::INFO:
            spdlog::info("{}{}", message, ctx);
            break;
        case LogLevel::WARN:
            spdlog::warn("{}{}", message, ctx);
            break;
        case LogLevel::ERROR:
            spdlog::error("{}{}", message, ctx);
            break;
    }
}

void SpdlogObservability::trace(const std::string& span_name, const std::function<void()>& fn,
                                const TraceOptions& options) {
    const uint64_t start = Clock::now_ms();
    try {
        fn();
    } catch (const std::exception& e) {
        spdlog::debug("[TRACE] {} failed after {}ms (correlationId={}): {}",
                      span_name, Clock::now_ms() - start, options.correlationId, e.what());
        throw;
    }
    spdlog::debug("[TRACE] {} finished in {}ms (correlationId={}){}",
                  span_name, Clock::now_ms() - start, options.correlationId,
                  formatContext(options.attributes));
}

void CallbackObservability::log(LogLevel level, const std::string& message, const LogContext& context) {
    if (on_log_) {
        on_log_(level, message, context);
    }
}

void CallbackObservability::trace(const std::string& span_name, const std::function<void()>& fn,
                                  const TraceOptions& options) {
    SpanRecord record{span_name, options, 0, false};
    const uint64_t start = Clock::now_ms();
    try {
        fn();
    } catch (...) {
        record.failed = true;
        record.durationMs = Clock::now_ms() - start;
        if (on_span_) on_span_(record);
        throw;
    }
    record.durationMs = Clock::now_ms() - start;
    if (on_span_) on_span_(record);
}

} // namespace FlowCore
