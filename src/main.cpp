#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <flowcore/core/config/loader.hpp>
#include <flowcore/core/events/event_factory.hpp>
#include <flowcore/core/lifecycle/agent_lifecycle.hpp>
#include <flowcore/core/processor/event_processor.hpp>
#include <flowcore/core/resilience/circuit_breaker_manager.hpp>
#include <flowcore/core/resilience/retry.hpp>
#include <flowcore/core/runtime/runtime.hpp>
#include <flowcore/core/state/state_store_registry.hpp>

using namespace FlowCore;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    spdlog::info("Signal {} received, initiating shutdown...", signum);
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging(const AppConfig::LoggingConfig& logging) {
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Declared in construction order; destroyed in reverse
    std::unique_ptr<Runtime> runtime;
    std::unique_ptr<StateStoreRegistry> stores;
    std::shared_ptr<CircuitBreakerManager> circuits;
    std::unique_ptr<EventProcessor> processor;
    std::unique_ptr<AgentLifecycle> lifecycle;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    c.runtime = std::make_unique<Runtime>(config);
    c.stores = std::make_unique<StateStoreRegistry>(*c.runtime);
    c.circuits = std::make_shared<CircuitBreakerManager>(&c.runtime->metrics());

    // Retry is outermost: an open circuit is not a retryable error
    auto processorConfig = EventProcessorConfig::fromApp(config.processor);
    CircuitBreakerMiddlewareConfig breakerConfig;
    breakerConfig.breaker = CircuitBreakerConfig::fromApp(config.circuitBreaker, "handlers");
    processorConfig.middleware.push_back(withCircuitBreaker(c.circuits, breakerConfig));
    auto retryOptions = RetryOptions::fromApp(config.retry);
    retryOptions.metrics = &c.runtime->metrics().getMetrics(MetricNames::RETRY);
    processorConfig.middleware.push_back(withRetry(retryOptions));
    c.processor = std::make_unique<EventProcessor>(*c.runtime, processorConfig);

    auto lifecycleOptions = LifecycleOptions::fromApp(config.lifecycle);
    lifecycleOptions.persistor = std::make_shared<InMemorySnapshotPersistor>();
    c.lifecycle = std::make_unique<AgentLifecycle>(*c.runtime, lifecycleOptions);
    c.lifecycle->attachTo(*c.processor);

    return c;
}

static void registerHandlers(Components& c) {
    auto store = c.stores->getOrCreate("agents", StateStoreKind::CONCURRENT,
                                       StateStoreOptions::fromApp(c.runtime->config().stateStore));

    c.lifecycle->setStatusListener([store](const StatusChange& change) {
        store->set(change.tenantId + "/" + change.agentName, "status",
                   StateValue{std::string(toString(change.to))});
    });

    c.processor->registerPatternHandler("^agent\\.lifecycle\\.[a-z]+ed$", [](const Event& event) {
        spdlog::info("[Demo] {} -> {} ({})", event.metadataOr("agentName", "?"),
                     event.metadataOr("status", "?"), event.type);
        return HandlerResult{};
    });
}

static void runDemo(Components& c) {
    const std::string tenant = c.runtime->tenantId();

    auto command = [&](const char* type, std::unordered_map<std::string, std::string> meta) {
        meta.emplace("agentName", "demo-agent");
        meta.emplace("tenantId", tenant);
        meta.emplace("correlationId", c.runtime->executionId());
        c.processor->processEvent(EventFactory::createEvent(type, {}, std::move(meta)));
    };

    command(LifecycleEvents::START, {{"context.goal", "warmup"}});
    command(LifecycleEvents::PAUSE, {{"reason", "demo"}});
    command(LifecycleEvents::RESUME, {});

    auto stats = c.lifecycle->getStats();
    spdlog::info("[Demo] agents={} transitions={} errors={}",
                 stats.totalAgents, stats.totalTransitions, stats.totalErrors);
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    // Stop in reverse order of start
    if (c.lifecycle) c.lifecycle->dispose();
    if (c.processor) c.processor->cleanup();
    if (c.stores) c.stores->cleanup();

    for (const auto& [name, snapshot] : c.runtime->metrics().getSnapshots()) {
        spdlog::info("[Metrics] {}: processed={} errors={} retries={} rejections={} transitions={}",
                     name, snapshot.total_events_processed, snapshot.total_events_errors,
                     snapshot.total_retries, snapshot.total_rejections, snapshot.total_transitions);
    }

    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupSignalHandlers();

    try {
        // Load configuration
        auto config = loadConfiguration(argc, argv);
        setupLogging(config.logging);
        spdlog::info("{} v{} starting...", config.app_name, config.version);
        spdlog::info("Build: {} {}", __DATE__, __TIME__);

        // Initialize all components
        auto components = initializeComponents(config);
        registerHandlers(components);
        runDemo(components);

        spdlog::info("{} running. Press Ctrl+C to shutdown.", config.app_name);

        // Main loop
        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        // Graceful shutdown
        stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("FlowCore terminated gracefully");
    return EXIT_SUCCESS;
}
