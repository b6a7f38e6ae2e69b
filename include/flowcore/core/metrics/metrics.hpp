#pragma once
#include <atomic>
#include <cstdint>

namespace FlowCore {

/**
 * @brief Counters kept per component name in the MetricRegistry.
 *
 * All counters are lock-free atomics updated with relaxed ordering.
 * A component only touches the counters that make sense for it.
 */
struct Metrics {
    // Dispatch
    std::atomic<uint64_t> total_events_processed{0};     // processEvent calls that returned normally
    std::atomic<uint64_t> total_events_errors{0};        // processEvent calls that threw
    std::atomic<uint64_t> total_handler_invocations{0};
    std::atomic<uint64_t> total_handler_failures{0};
    std::atomic<uint64_t> total_loops_detected{0};
    std::atomic<uint64_t> total_depth_violations{0};
    std::atomic<uint64_t> total_batches{0};

    // Resilience
    std::atomic<uint64_t> total_retries{0};
    std::atomic<uint64_t> total_rejections{0};           // calls refused by an open circuit
    std::atomic<uint64_t> total_timeouts{0};

    // State
    std::atomic<uint64_t> total_capacity_rejections{0};
    std::atomic<uint64_t> total_gc_runs{0};

    // Lifecycle
    std::atomic<uint64_t> total_transitions{0};

    // Latency (ms)
    std::atomic<uint64_t> total_processing_time_ms{0};
    std::atomic<uint64_t> max_processing_time_ms{0};

    std::atomic<uint64_t> last_event_timestamp_ms{0};
};

/**
 * Non-atomic snapshot for consistent metric reads.
 */
struct MetricSnapshot {
    uint64_t total_events_processed = 0;
    uint64_t total_events_errors = 0;
    uint64_t total_handler_invocations = 0;
    uint64_t total_handler_failures = 0;
    uint64_t total_loops_detected = 0;
    uint64_t total_depth_violations = 0;
    uint64_t total_batches = 0;
    uint64_t total_retries = 0;
    uint64_t total_rejections = 0;
    uint64_t total_timeouts = 0;
    uint64_t total_capacity_rejections = 0;
    uint64_t total_gc_runs = 0;
    uint64_t total_transitions = 0;
    uint64_t total_processing_time_ms = 0;
    uint64_t max_processing_time_ms = 0;
    uint64_t last_event_timestamp_ms = 0;

    uint64_t get_avg_latency_ms() const {
        return total_events_processed > 0 ? total_processing_time_ms / total_events_processed : 0;
    }

    uint64_t get_error_rate_percent() const {
        uint64_t total = total_events_processed + total_events_errors;
        return total > 0 ? (total_events_errors * 100) / total : 0;
    }
};

/// Raise @p target to @p value if it is larger
inline void updateMax(std::atomic<uint64_t>& target, uint64_t value) {
    uint64_t current = target.load(std::memory_order_relaxed);
    while (value > current &&
           !target.compare_exchange_weak(current, value, std::memory_order_relaxed)) {
    }
}

} // namespace FlowCore
