#pragma once
#include <flowcore/core/metrics/metrics.hpp>
#include <unordered_map>
#include <string>
#include <string_view>
#include <mutex>
#include <optional>

namespace FlowCore {

// Component names used as registry keys
namespace MetricNames {
    constexpr std::string_view EVENT_PROCESSOR = "EventProcessor";
    constexpr std::string_view CIRCUIT_BREAKER = "CircuitBreaker";
    constexpr std::string_view RETRY = "Retry";
    constexpr std::string_view STATE_STORE = "StateStore";
    constexpr std::string_view AGENT_LIFECYCLE = "AgentLifecycle";
}

/**
 * @class MetricRegistry
 * @brief Named Metrics blocks, one per component. Owned by the Runtime.
 *
 * References returned by getMetrics() stay valid for the registry's lifetime.
 */
class MetricRegistry {
public:
    MetricRegistry() = default;
    ~MetricRegistry() = default;
    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;

    Metrics& getMetrics(const std::string& name);
    Metrics& getMetrics(std::string_view name);
    Metrics& getMetrics(const char* name);
    std::unordered_map<std::string, MetricSnapshot> getSnapshots();
    std::optional<MetricSnapshot> getSnapshot(const std::string& name);

private:
    std::unordered_map<std::string, Metrics> metrics_map_;
    mutable std::mutex mtx_;

    static MetricSnapshot buildSnapshot(const Metrics& m);
};

} // namespace FlowCore
