#include <flowcore/core/config/loader.hpp>
#include <flowcore/core/errors.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>

using FlowCore::ConfigError;

namespace {

template <typename T>
void readField(const YAML::Node& parent, const char* key, T& out, const std::string& section) {
    const YAML::Node node = parent[key];
    if (!node) return;
    try {
        out = node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError("Invalid type for config field '" + section + key + "'");
    }
}

template <typename T>
void readRequired(const YAML::Node& parent, const char* key, T& out) {
    if (!parent[key]) {
        throw ConfigError(std::string("Missing required config field '") + key + "'");
    }
    readField(parent, key, out, "");
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError("Invalid config value: " + message);
    }
}

void parseLogging(const YAML::Node& node, AppConfig::LoggingConfig& cfg) {
    if (!node) return;
    readField(node, "level", cfg.level, "logging.");
    readField(node, "pattern", cfg.pattern, "logging.");

    static const std::array<const char*, 7> LEVELS = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    require(std::find(LEVELS.begin(), LEVELS.end(), cfg.level) != LEVELS.end(),
            "logging.level '" + cfg.level + "' is not a known level");
}

void parseProcessor(const YAML::Node& node, AppConfig::ProcessorConfig& cfg) {
    if (!node) return;
    readField(node, "max_event_depth", cfg.maxEventDepth, "processor.");
    readField(node, "max_event_chain_length", cfg.maxEventChainLength, "processor.");
    readField(node, "enable_observability", cfg.enableObservability, "processor.");
    readField(node, "batch_size", cfg.batchSize, "processor.");
    readField(node, "max_batch_workers", cfg.maxBatchWorkers, "processor.");
    readField(node, "cleanup_interval_ms", cfg.cleanupIntervalMs, "processor.");
    readField(node, "stale_threshold_ms", cfg.staleThresholdMs, "processor.");
    readField(node, "operation_timeout_ms", cfg.operationTimeoutMs, "processor.");
    readField(node, "history_capacity", cfg.historyCapacity, "processor.");

    require(cfg.maxEventDepth > 0, "processor.max_event_depth must be positive");
    require(cfg.maxEventChainLength > 0, "processor.max_event_chain_length must be positive");
    require(cfg.cleanupIntervalMs > 0, "processor.cleanup_interval_ms must be positive");
    require(cfg.staleThresholdMs > 0, "processor.stale_threshold_ms must be positive");
    require(cfg.historyCapacity > 0, "processor.history_capacity must be positive");
}

void parseStateStore(const YAML::Node& node, AppConfig::StateStoreConfig& cfg) {
    if (!node) return;
    readField(node, "max_namespaces", cfg.maxNamespaces, "state_store.");
    readField(node, "max_keys_per_namespace", cfg.maxKeysPerNamespace, "state_store.");
    readField(node, "gc_interval_ms", cfg.gcIntervalMs, "state_store.");

    require(cfg.maxNamespaces > 0, "state_store.max_namespaces must be positive");
    require(cfg.maxKeysPerNamespace > 0, "state_store.max_keys_per_namespace must be positive");
    require(cfg.gcIntervalMs > 0, "state_store.gc_interval_ms must be positive");
}

void parseCircuitBreaker(const YAML::Node& node, AppConfig::CircuitBreakerConfig& cfg) {
    if (!node) return;
    readField(node, "failure_threshold", cfg.failureThreshold, "circuit_breaker.");
    readField(node, "recovery_timeout_ms", cfg.recoveryTimeoutMs, "circuit_breaker.");
    readField(node, "success_threshold", cfg.successThreshold, "circuit_breaker.");
    readField(node, "operation_timeout_ms", cfg.operationTimeoutMs, "circuit_breaker.");

    require(cfg.failureThreshold > 0, "circuit_breaker.failure_threshold must be positive");
    require(cfg.successThreshold > 0, "circuit_breaker.success_threshold must be positive");
}

void parseRetry(const YAML::Node& node, AppConfig::RetryConfig& cfg) {
    if (!node) return;
    readField(node, "max_retries", cfg.maxRetries, "retry.");
    readField(node, "max_total_ms", cfg.maxTotalMs, "retry.");
    readField(node, "initial_delay_ms", cfg.initialDelayMs, "retry.");
    readField(node, "backoff_factor", cfg.backoffFactor, "retry.");
    readField(node, "max_delay_ms", cfg.maxDelayMs, "retry.");
    readField(node, "jitter", cfg.jitter, "retry.");
    readField(node, "retryable_error_codes", cfg.retryableErrorCodes, "retry.");
    readField(node, "retryable_status_codes", cfg.retryableStatusCodes, "retry.");

    require(cfg.backoffFactor >= 1.0, "retry.backoff_factor must be at least 1");
    require(cfg.initialDelayMs <= cfg.maxDelayMs, "retry.initial_delay_ms exceeds retry.max_delay_ms");
}

void parseLifecycle(const YAML::Node& node, AppConfig::LifecycleConfig& cfg) {
    if (!node) return;
    readField(node, "cron_fallback_delay_ms", cfg.cronFallbackDelayMs, "lifecycle.");
    require(cfg.cronFallbackDelayMs > 0, "lifecycle.cron_fallback_delay_ms must be positive");
}

AppConfig::AppConfiguration parseRoot(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    AppConfig::AppConfiguration config;
    readRequired(root, "app_name", config.app_name);
    readRequired(root, "version", config.version);
    readField(root, "tenant_id", config.tenant_id, "");
    require(!config.app_name.empty(), "app_name must not be empty");
    require(!config.tenant_id.empty(), "tenant_id must not be empty");

    parseLogging(root["logging"], config.logging);
    parseProcessor(root["processor"], config.processor);
    parseStateStore(root["state_store"], config.stateStore);
    parseCircuitBreaker(root["circuit_breaker"], config.circuitBreaker);
    parseRetry(root["retry"], config.retry);
    parseLifecycle(root["lifecycle"], config.lifecycle);
    return config;
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Config file not found: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw ConfigError("Malformed config file " + filepath + ": " + e.what());
    }

    auto config = parseRoot(root);
    spdlog::info("[ConfigLoader] Loaded {} v{} (tenant={}) from {}",
                 config.app_name, config.version, config.tenant_id, filepath);
    return config;
}

AppConfig::AppConfiguration ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::ParserException& e) {
        throw ConfigError(std::string("Malformed config document: ") + e.what());
    }
    return parseRoot(root);
}
