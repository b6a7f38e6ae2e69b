#include <flowcore/core/resilience/retry.hpp>
#include <flowcore/core/errors.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace FlowCore {

RetryOptions RetryOptions::fromApp(const AppConfig::RetryConfig& app) {
    RetryOptions opts;
    opts.maxRetries = app.maxRetries;
    opts.maxTotalMs = std::chrono::milliseconds(app.maxTotalMs);
    opts.initialDelayMs = std::chrono::milliseconds(app.initialDelayMs);
    opts.backoffFactor = app.backoffFactor;
    opts.maxDelayMs = std::chrono::milliseconds(app.maxDelayMs);
    opts.jitter = app.jitter;
    if (!app.retryableErrorCodes.empty()) opts.retryableErrorCodes = app.retryableErrorCodes;
    if (!app.retryableStatusCodes.empty()) opts.retryableStatusCodes = app.retryableStatusCodes;
    return opts;
}

std::chrono::milliseconds computeBackoff(uint32_t attempt, const RetryOptions& options,
                                         double unit_sample) {
    const double base = static_cast<double>(options.initialDelayMs.count()) *
                        std::pow(options.backoffFactor, static_cast<double>(attempt));
    double delay = std::min(base, static_cast<double>(options.maxDelayMs.count()));
    if (options.jitter) {
        delay *= std::clamp(unit_sample, 0.0, 1.0);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::floor(delay)));
}

std::chrono::milliseconds computeBackoff(uint32_t attempt, const RetryOptions& options) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    return computeBackoff(attempt, options, options.jitter ? unit(rng) : 1.0);
}

bool isRetryable(const std::exception& error, const RetryOptions& options) {
    if (options.retryPredicate) {
        return options.retryPredicate(error);
    }

    const auto* flow = dynamic_cast<const FlowError*>(&error);
    if (!flow) return false;

    const auto& codes = options.retryableErrorCodes;
    if (std::find(codes.begin(), codes.end(), flow->code()) != codes.end()) {
        return true;
    }
    if (flow->status()) {
        const auto& statuses = options.retryableStatusCodes;
        return std::find(statuses.begin(), statuses.end(), *flow->status()) != statuses.end();
    }
    return false;
}

Middleware withRetry(RetryOptions options) {
    Middleware mw;
    mw.name = "retry";
    mw.kind = MiddlewareKind::PIPELINE;
    mw.wrap = [options](PipelineHandler next) -> PipelineHandler {
        return [options, next = std::move(next)](const Event& event,
                                                 const AbortSignal& signal) -> HandlerResult {
            const auto started = std::chrono::steady_clock::now();
            uint32_t attempt = 0;

            while (true) {
                try {
                    return next(event, signal);
                } catch (const AbortedError&) {
                    throw;
                } catch (const std::exception& err) {
                    if (!isRetryable(err, options)) {
                        throw;
                    }

                    ++attempt;
                    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - started);

                    // The budget covers time already spent; the next delay may overrun it
                    if (attempt > options.maxRetries || elapsed > options.maxTotalMs) {
                        spdlog::warn("[Retry] Giving up on {} after {} attempts: {}",
                                     event.type, attempt, err.what());
                        throw RetryExceededError(event.type, attempt, std::current_exception(),
                                                 err.what());
                    }

                    const auto delay = computeBackoff(attempt, options);
                    if (event.cost) {
                        event.cost->retries.fetch_add(1, std::memory_order_relaxed);
                    }
                    if (options.metrics) {
                        options.metrics->total_retries.fetch_add(1, std::memory_order_relaxed);
                    }
                    spdlog::debug("[Retry] {} attempt {} failed ({}), retrying in {}ms",
                                  event.type, attempt, err.what(), delay.count());

                    if (signal) {
                        if (signal->waitFor(delay)) {
                            throw AbortedError("Retry aborted for " + event.type);
                        }
                    } else {
                        std::this_thread::sleep_for(delay);
                    }
                }
            }
        };
    };
    return mw;
}

} // namespace FlowCore
