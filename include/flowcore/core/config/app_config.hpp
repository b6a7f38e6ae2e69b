#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace AppConfig {

    struct LoggingConfig {
        std::string level = "info";
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    };

    struct ProcessorConfig {
        uint32_t maxEventDepth = 100;
        uint32_t maxEventChainLength = 1000;
        bool enableObservability = true;
        uint32_t batchSize = 100;            // 0 = sequential dispatch
        uint32_t maxBatchWorkers = 0;        // 0 = hardware concurrency
        uint64_t cleanupIntervalMs = 120000;
        uint64_t staleThresholdMs = 600000;
        uint64_t operationTimeoutMs = 0;     // 0 = handler calls are not raced
        uint32_t historyCapacity = 10000;
    };

    struct StateStoreConfig {
        uint32_t maxNamespaces = 1000;
        uint32_t maxKeysPerNamespace = 10000;
        uint64_t gcIntervalMs = 300000;
    };

    struct CircuitBreakerConfig {
        uint32_t failureThreshold = 3;
        uint64_t recoveryTimeoutMs = 180000;
        uint32_t successThreshold = 2;
        uint64_t operationTimeoutMs = 180000;
    };

    struct RetryConfig {
        uint32_t maxRetries = 3;
        uint64_t maxTotalMs = 60000;
        uint64_t initialDelayMs = 100;
        double backoffFactor = 2.0;
        uint64_t maxDelayMs = 10000;
        bool jitter = true;
        std::vector<std::string> retryableErrorCodes;   // empty = built-in list
        std::vector<int> retryableStatusCodes;          // empty = built-in list
    };

    struct LifecycleConfig {
        uint64_t cronFallbackDelayMs = 60000;
    };

    struct AppConfiguration {
        std::string app_name;
        std::string version;
        std::string tenant_id = "default";
        LoggingConfig logging;
        ProcessorConfig processor;
        StateStoreConfig stateStore;
        CircuitBreakerConfig circuitBreaker;
        RetryConfig retry;
        LifecycleConfig lifecycle;
    };

} // namespace AppConfig
