#pragma once

#include <flowcore/core/processor/middleware.hpp>
#include <flowcore/core/resilience/circuit_breaker.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace FlowCore {

class MetricRegistry;

/**
 * @class CircuitBreakerManager
 * @brief One CircuitBreaker per name, created on first use.
 */
class CircuitBreakerManager {
public:
    /// @param metrics optional; breakers then report under "CircuitBreaker"
    explicit CircuitBreakerManager(MetricRegistry* metrics = nullptr);

    /**
     * @brief Get the breaker called @p name, creating it from @p config if missing.
     *
     * The config of an existing breaker is left unchanged.
     */
    std::shared_ptr<CircuitBreaker> getCircuit(const std::string& name,
                                               const CircuitBreakerConfig& config = {});

    std::shared_ptr<CircuitBreaker> findCircuit(const std::string& name) const;

    void resetAll();

    std::map<std::string, CircuitMetrics> getAllMetrics() const;

    size_t size() const;

private:
    MetricRegistry* metrics_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> circuits_;
};

struct CircuitBreakerMiddlewareConfig {
    CircuitBreakerConfig breaker;

    /// Fixed circuit name for every event; wins over keyGenerator
    std::optional<std::string> circuitKey;
    /// Circuit name per event; default is the event type
    std::function<std::string(const Event&)> keyGenerator;
    /// Only protect events for which this returns true (default: all)
    std::function<bool(const Event&)> shouldProtect;
    /// Called when a call is rejected, before CircuitOpenError is thrown
    std::function<void(const Event&, const std::string& circuit)> onRejected;
};

/**
 * @brief Pipeline middleware routing each handler call through a managed breaker.
 *
 * A rejected call throws CircuitOpenError; a failed call rethrows the
 * handler's own error.
 */
Middleware withCircuitBreaker(std::shared_ptr<CircuitBreakerManager> manager,
                              CircuitBreakerMiddlewareConfig config = {});

} // namespace FlowCore
