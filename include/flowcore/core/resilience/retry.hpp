#pragma once

#include <flowcore/core/config/app_config.hpp>
#include <flowcore/core/metrics/metrics.hpp>
#include <flowcore/core/processor/middleware.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace FlowCore {

struct RetryOptions {
    uint32_t maxRetries = 3;
    std::chrono::milliseconds maxTotalMs{60000};
    std::chrono::milliseconds initialDelayMs{100};
    double backoffFactor = 2.0;
    std::chrono::milliseconds maxDelayMs{10000};
    bool jitter = true;
    std::vector<std::string> retryableErrorCodes{
        "ECONNRESET", "ETIMEDOUT", "ECONNREFUSED", "EAI_AGAIN", "NETWORK_ERROR", "TIMEOUT_EXCEEDED"};
    std::vector<int> retryableStatusCodes{408, 429, 500, 502, 503, 504};

    /// When set, decides alone whether an error is retryable
    std::function<bool(const std::exception&)> retryPredicate;
    Metrics* metrics = nullptr;   // optional, counts total_retries

    static RetryOptions fromApp(const AppConfig::RetryConfig& app);
};

/**
 * @brief Delay before retry number @p attempt.
 *
 * min(initialDelay * backoffFactor^attempt, maxDelay), multiplied by
 * @p unit_sample (expected in [0,1]) when jitter is enabled.
 */
std::chrono::milliseconds computeBackoff(uint32_t attempt, const RetryOptions& options,
                                         double unit_sample);

/// Same, drawing the jitter sample from a thread-local generator
std::chrono::milliseconds computeBackoff(uint32_t attempt, const RetryOptions& options);

/**
 * @brief Classify an error: predicate first, then FlowError code, then FlowError status.
 *
 * Errors that are not FlowError only retry through the predicate.
 */
bool isRetryable(const std::exception& error, const RetryOptions& options);

/**
 * @brief Pipeline middleware retrying retryable handler failures with backoff.
 *
 * Non-retryable errors and AbortedError pass through untouched. Once retries
 * would exceed maxRetries, or a failure arrives after maxTotalMs has elapsed,
 * RetryExceededError is thrown carrying the last error. The budget is checked
 * at each failure, so the final backoff wait may end past it. Backoff waits
 * end early on abort.
 */
Middleware withRetry(RetryOptions options = {});

} // namespace FlowCore
