#pragma once

#include <flowcore/core/config/app_config.hpp>
#include <flowcore/core/metrics/registry.hpp>
#include <flowcore/core/observability/observability.hpp>
#include <flowcore/core/runtime/timer_service.hpp>

#include <memory>
#include <string>

namespace FlowCore {

/**
 * @class Runtime
 * @brief Explicit context shared by every component of one FlowCore instance.
 *
 * Owns the metric registry, the timer thread and the observability sink, and
 * carries the tenant and execution ids. Components hold a reference to it and
 * must be destroyed before it.
 */
class Runtime {
public:
    explicit Runtime(AppConfig::AppConfiguration config = {},
                     ObservabilitySinkPtr sink = nullptr);
    ~Runtime() noexcept;

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    const AppConfig::AppConfiguration& config() const { return config_; }
    ObservabilitySink& observability() { return *sink_; }
    MetricRegistry& metrics() { return metrics_; }
    TimerService& timers() { return timers_; }

    const std::string& tenantId() const { return config_.tenant_id; }
    const std::string& executionId() const { return execution_id_; }

private:
    AppConfig::AppConfiguration config_;
    ObservabilitySinkPtr sink_;
    MetricRegistry metrics_;
    std::string execution_id_;
    TimerService timers_;   // last: its thread stops first
};

} // namespace FlowCore
