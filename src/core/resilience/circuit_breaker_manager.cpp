#include <flowcore/core/resilience/circuit_breaker_manager.hpp>
#include <flowcore/core/metrics/registry.hpp>
#include <spdlog/spdlog.h>

namespace FlowCore {

CircuitBreakerManager::CircuitBreakerManager(MetricRegistry* metrics) : metrics_(metrics) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::getCircuit(const std::string& name,
                                                                  const CircuitBreakerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = circuits_.find(name);
    if (it != circuits_.end()) {
        return it->second;
    }

    CircuitBreakerConfig cfg = config;
    cfg.name = name;
    Metrics* m = metrics_ ? &metrics_->getMetrics(MetricNames::CIRCUIT_BREAKER) : nullptr;
    auto breaker = std::make_shared<CircuitBreaker>(std::move(cfg), m);
    circuits_.emplace(name, breaker);
    spdlog::info("[CircuitBreakerManager] Created circuit {}", name);
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::findCircuit(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = circuits_.find(name);
    return it == circuits_.end() ? nullptr : it->second;
}

void CircuitBreakerManager::resetAll() {
    std::map<std::string, std::shared_ptr<CircuitBreaker>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = circuits_;
    }
    for (auto& [name, breaker] : snapshot) {
        breaker->reset();
    }
}

std::map<std::string, CircuitMetrics> CircuitBreakerManager::getAllMetrics() const {
    std::map<std::string, std::shared_ptr<CircuitBreaker>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = circuits_;
    }
    std::map<std::string, CircuitMetrics> out;
    for (const auto& [name, breaker] : snapshot) {
        out.emplace(name, breaker->getMetrics());
    }
    return out;
}

size_t CircuitBreakerManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return circuits_.size();
}

// ============================================================================
// Middleware
// ============================================================================

Middleware withCircuitBreaker(std::shared_ptr<CircuitBreakerManager> manager,
                              CircuitBreakerMiddlewareConfig config) {
    if (!manager) {
        manager = std::make_shared<CircuitBreakerManager>();
    }

    Middleware mw;
    mw.name = "circuit-breaker";
    mw.kind = MiddlewareKind::PIPELINE;
    mw.wrap = [manager, config](PipelineHandler next) -> PipelineHandler {
        return [manager, config, next = std::move(next)](const Event& event,
                                                         const AbortSignal& signal) -> HandlerResult {
            if (config.shouldProtect && !config.shouldProtect(event)) {
                return next(event, signal);
            }

            const std::string key = config.circuitKey
                ? *config.circuitKey
                : (config.keyGenerator ? config.keyGenerator(event) : event.type);
            auto breaker = manager->getCircuit(key, config.breaker);

            auto outcome = breaker->execute<HandlerResult>(
                [next, event, signal]() { return next(event, signal); }, signal);

            if (outcome.rejected) {
                spdlog::warn("[CircuitBreaker:{}] rejected {} (circuit OPEN)", key, event.type);
                if (config.onRejected) {
                    try {
                        config.onRejected(event, key);
                    } catch (const std::exception& e) {
                        spdlog::error("[CircuitBreaker:{}] onRejected callback threw: {}", key, e.what());
                    }
                }
                throw CircuitOpenError(key);
            }
            if (outcome.error) {
                std::rethrow_exception(outcome.error);
            }
            return outcome.result ? std::move(*outcome.result) : HandlerResult{};
        };
    };
    return mw;
}

} // namespace FlowCore
