#include <flowcore/core/metrics/registry.hpp>

namespace FlowCore {

Metrics& MetricRegistry::getMetrics(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    // try_emplace: Metrics holds atomics and cannot be copied
    auto [it, inserted] = metrics_map_.try_emplace(name);
    return it->second;
}

Metrics& MetricRegistry::getMetrics(std::string_view name) {
    return getMetrics(std::string(name));
}

Metrics& MetricRegistry::getMetrics(const char* name) {
    return getMetrics(std::string(name ? name : ""));
}

std::unordered_map<std::string, MetricSnapshot> MetricRegistry::getSnapshots() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::unordered_map<std::string, MetricSnapshot> snaps;
    snaps.reserve(metrics_map_.size());
    for (auto& [name, m] : metrics_map_) {
        snaps[name] = buildSnapshot(m);
    }
    return snaps;
}

std::optional<MetricSnapshot> MetricRegistry::getSnapshot(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = metrics_map_.find(name);
    if (it == metrics_map_.end()) return std::nullopt;
    return buildSnapshot(it->second);
}

MetricSnapshot MetricRegistry::buildSnapshot(const Metrics& m) {
    MetricSnapshot snap{};
    snap.total_events_processed = m.total_events_processed.load(std::memory_order_relaxed);
    snap.total_events_errors = m.total_events_errors.load(std::memory_order_relaxed);
    snap.total_handler_invocations = m.total_handler_invocations.load(std::memory_order_relaxed);
    snap.total_handler_failures = m.total_handler_failures.load(std::memory_order_relaxed);
    snap.total_loops_detected = m.total_loops_detected.load(std::memory_order_relaxed);
    snap.total_depth_violations = m.total_depth_violations.load(std::memory_order_relaxed);
    snap.total_batches = m.total_batches.load(std::memory_order_relaxed);
    snap.total_retries = m.total_retries.load(std::memory_order_relaxed);
    snap.total_rejections = m.total_rejections.load(std::memory_order_relaxed);
    snap.total_timeouts = m.total_timeouts.load(std::memory_order_relaxed);
    snap.total_capacity_rejections = m.total_capacity_rejections.load(std::memory_order_relaxed);
    snap.total_gc_runs = m.total_gc_runs.load(std::memory_order_relaxed);
    snap.total_transitions = m.total_transitions.load(std::memory_order_relaxed);
    snap.total_processing_time_ms = m.total_processing_time_ms.load(std::memory_order_relaxed);
    snap.max_processing_time_ms = m.max_processing_time_ms.load(std::memory_order_relaxed);
    snap.last_event_timestamp_ms = m.last_event_timestamp_ms.load(std::memory_order_relaxed);
    return snap;
}

} // namespace FlowCore
