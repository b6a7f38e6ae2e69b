// ============================================================================
// AGENT LIFECYCLE UNIT TESTS
// ============================================================================
// Tests for the agent status graph, start/stop/pause/resume/schedule,
// snapshots, status notifications and the lifecycle event adapter
// ============================================================================

#include <gtest/gtest.h>
#include <flowcore/core/errors.hpp>
#include <flowcore/core/events/event_factory.hpp>
#include <flowcore/core/lifecycle/agent_lifecycle.hpp>
#include <flowcore/core/lifecycle/agent_status.hpp>
#include <flowcore/core/lifecycle/snapshot_persistor.hpp>
#include <flowcore/core/metrics/registry.hpp>
#include <flowcore/core/processor/event_processor.hpp>
#include <flowcore/core/utils/clock.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

using namespace FlowCore;
using namespace std::chrono_literals;

namespace {

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 2s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

class AgentLifecycleTest : public ::testing::Test {
protected:
    AgentLifecycleTest()
        : runtime_(AppConfig::AppConfiguration{}, std::make_shared<NullObservability>()),
          persistor_(std::make_shared<InMemorySnapshotPersistor>()) {}

    void SetUp() override {
        LifecycleOptions options;
        options.persistor = persistor_;
        options.cronFallbackDelay = 40ms;
        lifecycle_ = std::make_unique<AgentLifecycle>(runtime_, options);
        lifecycle_->setStatusListener([this](const StatusChange& change) {
            std::lock_guard<std::mutex> lock(changes_mutex_);
            changes_.push_back(change);
        });
    }

    void TearDown() override {
        lifecycle_.reset();
    }

    std::optional<AgentStatus> statusOf(const std::string& agent, const std::string& tenant = "acme") {
        auto record = lifecycle_->getAgentStatus(tenant, agent);
        if (!record) return std::nullopt;
        return record->status;
    }

    std::vector<std::pair<AgentStatus, AgentStatus>> transitions() {
        std::lock_guard<std::mutex> lock(changes_mutex_);
        std::vector<std::pair<AgentStatus, AgentStatus>> out;
        for (const auto& change : changes_) out.emplace_back(change.from, change.to);
        return out;
    }

    Runtime runtime_;
    std::shared_ptr<InMemorySnapshotPersistor> persistor_;
    std::unique_ptr<AgentLifecycle> lifecycle_;

    std::mutex changes_mutex_;
    std::vector<StatusChange> changes_;
};

} // namespace

// ============================================================================
// STATUS GRAPH TESTS
// ============================================================================

TEST(AgentStatus, TransitionGraph) {
    EXPECT_TRUE(isValidTransition(AgentStatus::STOPPED, AgentStatus::STARTING));
    EXPECT_TRUE(isValidTransition(AgentStatus::STARTING, AgentStatus::RUNNING));
    EXPECT_TRUE(isValidTransition(AgentStatus::RUNNING, AgentStatus::PAUSING));
    EXPECT_TRUE(isValidTransition(AgentStatus::PAUSED, AgentStatus::RESUMING));
    EXPECT_TRUE(isValidTransition(AgentStatus::SCHEDULED, AgentStatus::STARTING));
    EXPECT_TRUE(isValidTransition(AgentStatus::STOPPING, AgentStatus::ERROR));
    EXPECT_TRUE(isValidTransition(AgentStatus::ERROR, AgentStatus::STOPPED));

    EXPECT_FALSE(isValidTransition(AgentStatus::STOPPED, AgentStatus::RUNNING));
    EXPECT_FALSE(isValidTransition(AgentStatus::RUNNING, AgentStatus::ERROR));
    EXPECT_FALSE(isValidTransition(AgentStatus::PAUSED, AgentStatus::RUNNING));
    EXPECT_FALSE(isValidTransition(AgentStatus::RUNNING, AgentStatus::SCHEDULED));
}

TEST(AgentStatus, NamesRoundTrip) {
    EXPECT_STREQ(toString(AgentStatus::SCHEDULED), "scheduled");
    EXPECT_EQ(parseAgentStatus("paused"), AgentStatus::PAUSED);
    EXPECT_FALSE(parseAgentStatus("sleeping").has_value());
    EXPECT_TRUE(isTransitional(AgentStatus::RESUMING));
    EXPECT_FALSE(isTransitional(AgentStatus::PAUSED));
    EXPECT_TRUE(isBusy(AgentStatus::RUNNING));
    EXPECT_FALSE(isBusy(AgentStatus::PAUSED));
}

// ============================================================================
// START / STOP TESTS
// ============================================================================

TEST_F(AgentLifecycleTest, StartMovesAgentToRunning) {
    auto result = lifecycle_->start({"crawler", "acme", {{"model", "small"}}, {}});

    EXPECT_EQ(result.status, AgentStatus::RUNNING);
    EXPECT_EQ(result.executionId.rfind("lifecycle-crawler-", 0), 0u);

    auto record = lifecycle_->getAgentStatus("acme", "crawler");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->config.at("model"), "small");
    EXPECT_TRUE(record->startedAt.has_value());

    EXPECT_EQ(transitions(), (std::vector<std::pair<AgentStatus, AgentStatus>>{
        {AgentStatus::STOPPED, AgentStatus::STARTING},
        {AgentStatus::STARTING, AgentStatus::RUNNING}}));
}

TEST_F(AgentLifecycleTest, DoubleStartConflicts) {
    lifecycle_->start({"crawler", "acme", {}, {}});

    try {
        lifecycle_->start({"crawler", "acme", {}, {}});
        FAIL() << "expected LifecycleConflictError";
    } catch (const LifecycleConflictError& e) {
        EXPECT_EQ(e.code(), "AGENT_CONFLICT");
    }
    EXPECT_EQ(statusOf("crawler"), AgentStatus::RUNNING);
}

TEST_F(AgentLifecycleTest, SameNameInOtherTenantIsIndependent) {
    lifecycle_->start({"crawler", "acme", {}, {}});
    EXPECT_NO_THROW(lifecycle_->start({"crawler", "globex", {}, {}}));

    EXPECT_EQ(lifecycle_->listAgentsByTenant("acme").size(), 1u);
    EXPECT_EQ(lifecycle_->listAgentsByTenant("globex").size(), 1u);
    EXPECT_TRUE(lifecycle_->listAgentsByTenant("initech").empty());
}

TEST_F(AgentLifecycleTest, StopRemovesAgent) {
    lifecycle_->start({"crawler", "acme", {}, {}});
    auto result = lifecycle_->stop({"crawler", "acme", "maintenance", false});

    EXPECT_EQ(result.status, AgentStatus::STOPPED);
    EXPECT_EQ(result.reason, "maintenance");
    EXPECT_FALSE(statusOf("crawler").has_value());

    auto seen = transitions();
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[2], std::make_pair(AgentStatus::RUNNING, AgentStatus::STOPPING));
    EXPECT_EQ(seen[3], std::make_pair(AgentStatus::STOPPING, AgentStatus::STOPPED));
}

TEST_F(AgentLifecycleTest, StopUnknownAgentIsIdempotent) {
    auto first = lifecycle_->stop({"ghost", "acme", "", false});
    auto second = lifecycle_->stop({"ghost", "acme", "", false});

    EXPECT_EQ(first.status, AgentStatus::STOPPED);
    EXPECT_EQ(first.reason, "already stopped");
    EXPECT_EQ(second.reason, "already stopped");
    EXPECT_TRUE(transitions().empty());
}

// ============================================================================
// PAUSE / RESUME TESTS
// ============================================================================

TEST_F(AgentLifecycleTest, PauseSavesSnapshotAndResumeRestoresIt) {
    lifecycle_->start({"writer", "acme", {{"model", "large"}}, {{"topic", "news"}}});

    auto paused = lifecycle_->pause({"writer", "acme", "budget", true});
    EXPECT_EQ(paused.status, AgentStatus::PAUSED);
    ASSERT_TRUE(paused.snapshotId.has_value());
    EXPECT_EQ(paused.snapshotId->rfind("snapshot-lifecycle-writer-", 0), 0u);
    EXPECT_EQ(persistor_->size(), 1u);

    auto resumed = lifecycle_->resume({"writer", "acme", std::nullopt, {{"priority", "high"}}});
    EXPECT_EQ(resumed.status, AgentStatus::RUNNING);
    EXPECT_EQ(resumed.snapshotId, paused.snapshotId);

    auto record = lifecycle_->getAgentStatus("acme", "writer");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->config.at("model"), "large");
    EXPECT_EQ(record->context.at("topic"), "news");
    EXPECT_EQ(record->context.at("priority"), "high");
    EXPECT_FALSE(record->pausedAt.has_value());
}

TEST_F(AgentLifecycleTest, PauseWithoutSnapshot) {
    lifecycle_->start({"writer", "acme", {}, {}});
    auto paused = lifecycle_->pause({"writer", "acme", "", false});

    EXPECT_FALSE(paused.snapshotId.has_value());
    EXPECT_EQ(persistor_->size(), 0u);
    EXPECT_EQ(lifecycle_->resume({"writer", "acme", std::nullopt, {}}).status, AgentStatus::RUNNING);
}

TEST_F(AgentLifecycleTest, MissingSnapshotMovesAgentToError) {
    lifecycle_->start({"writer", "acme", {}, {}});
    lifecycle_->pause({"writer", "acme", "", true});

    EXPECT_THROW(lifecycle_->resume({"writer", "acme", std::string("snapshot-unknown"), {}}),
                 LifecycleError);

    auto record = lifecycle_->getAgentStatus("acme", "writer");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, AgentStatus::ERROR);
    EXPECT_NE(record->lastError.find("snapshot-unknown"), std::string::npos);

    // An errored agent can be started again
    EXPECT_EQ(lifecycle_->start({"writer", "acme", {}, {}}).status, AgentStatus::RUNNING);
}

TEST_F(AgentLifecycleTest, StartingAPausedAgentRestartsIt) {
    lifecycle_->start({"writer", "acme", {}, {}});
    lifecycle_->pause({"writer", "acme", "", false});
    {
        std::lock_guard<std::mutex> lock(changes_mutex_);
        changes_.clear();
    }

    EXPECT_EQ(lifecycle_->start({"writer", "acme", {}, {}}).status, AgentStatus::RUNNING);

    EXPECT_EQ(transitions(), (std::vector<std::pair<AgentStatus, AgentStatus>>{
        {AgentStatus::PAUSED, AgentStatus::STOPPING},
        {AgentStatus::STOPPING, AgentStatus::STOPPED},
        {AgentStatus::STOPPED, AgentStatus::STARTING},
        {AgentStatus::STARTING, AgentStatus::RUNNING}}));
}

TEST_F(AgentLifecycleTest, InvalidTransitionsLeaveAgentUntouched) {
    EXPECT_THROW(lifecycle_->pause({"nobody", "acme", "", true}), AgentNotFoundError);
    EXPECT_THROW(lifecycle_->resume({"nobody", "acme", std::nullopt, {}}), AgentNotFoundError);

    lifecycle_->start({"crawler", "acme", {}, {}});
    try {
        lifecycle_->resume({"crawler", "acme", std::nullopt, {}});
        FAIL() << "expected InvalidTransitionError";
    } catch (const InvalidTransitionError& e) {
        EXPECT_EQ(e.code(), "INVALID_TRANSITION");
        EXPECT_STREQ(e.what(), "Invalid status transition from running to resuming");
    }
    EXPECT_EQ(statusOf("crawler"), AgentStatus::RUNNING);

    lifecycle_->pause({"crawler", "acme", "", false});
    EXPECT_THROW(lifecycle_->pause({"crawler", "acme", "", false}), InvalidTransitionError);
    EXPECT_EQ(statusOf("crawler"), AgentStatus::PAUSED);
}

// ============================================================================
// SCHEDULE TESTS
// ============================================================================

TEST_F(AgentLifecycleTest, ScheduledAgentStartsAfterInterval) {
    ScheduleRequest request;
    request.agentName = "nightly";
    request.tenantId = "acme";
    request.schedule.interval = 30ms;
    request.config = {{"mode", "batch"}};

    auto result = lifecycle_->schedule(request);
    EXPECT_EQ(result.status, AgentStatus::SCHEDULED);
    ASSERT_TRUE(result.scheduledFor.has_value());
    EXPECT_GE(*result.scheduledFor, result.timestamp + 30);

    ASSERT_TRUE(waitUntil([&] { return statusOf("nightly") == AgentStatus::RUNNING; }));

    auto record = lifecycle_->getAgentStatus("acme", "nightly");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->config.at("mode"), "batch");
    // One-shot schedules are consumed by the run
    EXPECT_FALSE(record->schedule.has_value());
    EXPECT_FALSE(record->scheduledFor.has_value());
}

TEST_F(AgentLifecycleTest, ScheduledAgentStartsAtAbsoluteTime) {
    ScheduleRequest request;
    request.agentName = "report";
    request.tenantId = "acme";
    request.schedule.atEpochMs = Clock::epoch_ms() + 30;

    auto result = lifecycle_->schedule(request);
    EXPECT_EQ(result.scheduledFor, request.schedule.atEpochMs);
    ASSERT_TRUE(waitUntil([&] { return statusOf("report") == AgentStatus::RUNNING; }));
}

TEST_F(AgentLifecycleTest, CronOnlyScheduleUsesFallbackDelay) {
    ScheduleRequest request;
    request.agentName = "cron";
    request.tenantId = "acme";
    request.schedule.cron = "0 * * * *";

    auto result = lifecycle_->schedule(request);
    ASSERT_TRUE(result.scheduledFor.has_value());
    EXPECT_GE(*result.scheduledFor, result.timestamp + 40);
    ASSERT_TRUE(waitUntil([&] { return statusOf("cron") == AgentStatus::RUNNING; }));
}

TEST_F(AgentLifecycleTest, RepeatingScheduleKeepsRunningAgent) {
    ScheduleRequest request;
    request.agentName = "poller";
    request.tenantId = "acme";
    request.schedule.interval = 20ms;
    request.schedule.repeat = true;

    lifecycle_->schedule(request);
    ASSERT_TRUE(waitUntil([&] { return statusOf("poller") == AgentStatus::RUNNING; }));

    // Later runs find the agent busy and re-arm
    std::this_thread::sleep_for(100ms);
    auto record = lifecycle_->getAgentStatus("acme", "poller");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, AgentStatus::RUNNING);
    EXPECT_TRUE(record->schedule.has_value());
    EXPECT_TRUE(record->scheduledFor.has_value());
    EXPECT_EQ(lifecycle_->getStats().totalErrors, 0u);

    lifecycle_->stop({"poller", "acme", "", false});
    EXPECT_FALSE(statusOf("poller").has_value());
}

TEST_F(AgentLifecycleTest, StopCancelsPendingSchedule) {
    ScheduleRequest request;
    request.agentName = "later";
    request.tenantId = "acme";
    request.schedule.interval = 50ms;
    lifecycle_->schedule(request);

    lifecycle_->stop({"later", "acme", "cancelled", false});
    std::this_thread::sleep_for(120ms);

    EXPECT_FALSE(statusOf("later").has_value());
}

TEST_F(AgentLifecycleTest, RejectsInvalidSchedules) {
    ScheduleRequest empty;
    empty.agentName = "x";
    empty.tenantId = "acme";
    EXPECT_THROW(lifecycle_->schedule(empty), LifecycleError);

    ScheduleRequest negative = empty;
    negative.schedule.interval = std::chrono::milliseconds(-5);
    EXPECT_THROW(lifecycle_->schedule(negative), LifecycleError);

    lifecycle_->start({"busy", "acme", {}, {}});
    ScheduleRequest running = empty;
    running.agentName = "busy";
    running.schedule.interval = 1000ms;
    EXPECT_THROW(lifecycle_->schedule(running), InvalidTransitionError);
    EXPECT_EQ(statusOf("busy"), AgentStatus::RUNNING);
}

// ============================================================================
// NOTIFICATION & STATS TESTS
// ============================================================================

TEST_F(AgentLifecycleTest, ListenerFailureDoesNotBreakCommands) {
    int calls = 0;
    lifecycle_->setStatusListener([&calls](const StatusChange&) {
        ++calls;
        throw std::runtime_error("listener broke");
    });

    EXPECT_NO_THROW(lifecycle_->start({"crawler", "acme", {}, {}}));
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(statusOf("crawler"), AgentStatus::RUNNING);
}

TEST_F(AgentLifecycleTest, StatsCountAgentsAndTransitions) {
    lifecycle_->start({"a", "acme", {}, {}});
    lifecycle_->start({"b", "acme", {}, {}});
    lifecycle_->pause({"b", "acme", "", false});
    lifecycle_->start({"c", "globex", {}, {}});

    auto stats = lifecycle_->getStats();
    EXPECT_EQ(stats.totalAgents, 3u);
    EXPECT_EQ(stats.agentsByStatus.size(), 9u);
    EXPECT_EQ(stats.agentsByStatus.at("running"), 2u);
    EXPECT_EQ(stats.agentsByStatus.at("paused"), 1u);
    EXPECT_EQ(stats.agentsByStatus.at("error"), 0u);
    EXPECT_EQ(stats.agentsByTenant.at("acme"), 2u);
    EXPECT_EQ(stats.totalTransitions, 8u);
    EXPECT_EQ(runtime_.metrics().getMetrics(MetricNames::AGENT_LIFECYCLE).total_transitions.load(), 8u);
}

TEST_F(AgentLifecycleTest, DisposeStopsEveryActiveAgent) {
    lifecycle_->start({"a", "acme", {}, {}});
    lifecycle_->start({"b", "acme", {}, {}});
    lifecycle_->pause({"b", "acme", "", false});

    ScheduleRequest request;
    request.agentName = "c";
    request.tenantId = "acme";
    request.schedule.interval = 10000ms;
    lifecycle_->schedule(request);

    lifecycle_->dispose();

    EXPECT_EQ(lifecycle_->getStats().totalAgents, 0u);
    std::lock_guard<std::mutex> lock(changes_mutex_);
    int disposals = 0;
    for (const auto& change : changes_) {
        if (change.to == AgentStatus::STOPPED && change.reason == "Handler disposal") ++disposals;
    }
    EXPECT_EQ(disposals, 3);
}

// ============================================================================
// EVENT ADAPTER TESTS
// ============================================================================

TEST_F(AgentLifecycleTest, HandleStartEventReturnsStartedEvent) {
    Event command = EventFactory::createEvent(LifecycleEvents::START, {},
        {{"agentName", "crawler"}, {"tenantId", "acme"}, {"correlationId", "c-1"},
         {"config.model", "small"}, {"context.user", "u-7"}});

    Event started = lifecycle_->handleLifecycleEvent(command);

    EXPECT_EQ(started.type, LifecycleEvents::STARTED);
    EXPECT_EQ(started.metadataOr("status", ""), "running");
    EXPECT_EQ(started.metadataOr("agentName", ""), "crawler");
    EXPECT_EQ(started.metadataOr("correlationId", ""), "c-1");
    EXPECT_FALSE(started.metadataOr("executionId", "").empty());

    auto record = lifecycle_->getAgentStatus("acme", "crawler");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->config.at("model"), "small");
    EXPECT_EQ(record->context.at("user"), "u-7");
}

TEST_F(AgentLifecycleTest, HandleEventDefaultsToRuntimeTenant) {
    lifecycle_->handleLifecycleEvent(
        EventFactory::createEvent(LifecycleEvents::START, {}, {{"agentName", "solo"}}));
    EXPECT_EQ(statusOf("solo", runtime_.tenantId()), AgentStatus::RUNNING);

    Event paused = lifecycle_->handleLifecycleEvent(EventFactory::createEvent(
        LifecycleEvents::PAUSE, {}, {{"agentName", "solo"}, {"saveSnapshot", "false"}}));
    EXPECT_EQ(paused.type, LifecycleEvents::PAUSED);
    EXPECT_EQ(paused.metadataOr("snapshotId", "none"), "none");
}

TEST_F(AgentLifecycleTest, HandleScheduleEventParsesTiming) {
    Event scheduled = lifecycle_->handleLifecycleEvent(EventFactory::createEvent(
        LifecycleEvents::SCHEDULE, {},
        {{"agentName", "nightly"}, {"tenantId", "acme"}, {"interval_ms", "5000"}, {"repeat", "1"}}));

    EXPECT_EQ(scheduled.type, LifecycleEvents::SCHEDULED);
    EXPECT_EQ(scheduled.metadataOr("status", ""), "scheduled");
    EXPECT_FALSE(scheduled.metadataOr("scheduledFor", "").empty());

    auto record = lifecycle_->getAgentStatus("acme", "nightly");
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->schedule.has_value());
    EXPECT_TRUE(record->schedule->repeat);
    EXPECT_EQ(record->schedule->interval, 5000ms);
}

TEST_F(AgentLifecycleTest, HandleEventRejectsBadInput) {
    EXPECT_THROW(lifecycle_->handleLifecycleEvent(
                     EventFactory::createEvent(LifecycleEvents::START, {}, {})),
                 LifecycleError);
    EXPECT_THROW(lifecycle_->handleLifecycleEvent(
                     EventFactory::createEvent("agent.lifecycle.explode", {}, {{"agentName", "x"}})),
                 LifecycleError);
    EXPECT_THROW(lifecycle_->handleLifecycleEvent(EventFactory::createEvent(
                     LifecycleEvents::STOP, {}, {{"agentName", "x"}, {"force", "maybe"}})),
                 LifecycleError);
    EXPECT_THROW(lifecycle_->handleLifecycleEvent(EventFactory::createEvent(
                     LifecycleEvents::SCHEDULE, {}, {{"agentName", "x"}, {"interval_ms", "-3"}})),
                 LifecycleError);

    auto& metrics = runtime_.metrics().getMetrics(MetricNames::AGENT_LIFECYCLE);
    EXPECT_EQ(metrics.total_events_processed.load(), 4u);
    EXPECT_EQ(metrics.total_events_errors.load(), 4u);
    EXPECT_EQ(lifecycle_->getStats().totalErrors, 4u);
}

TEST_F(AgentLifecycleTest, AttachedProcessorReEmitsResultEvents) {
    EventProcessorConfig config;
    config.cleanupInterval = 0ms;
    EventProcessor processor(runtime_, config);
    lifecycle_->attachTo(processor);

    std::vector<std::string> results;
    processor.registerPatternHandler("^agent\\.lifecycle\\.[a-z]+ed$", [&results](const Event& e) {
        results.push_back(e.type + ":" + e.metadataOr("status", ""));
        return HandlerResult{};
    });

    processor.processEvent(EventFactory::createEvent(LifecycleEvents::START, {},
        {{"agentName", "crawler"}, {"tenantId", "acme"}}));
    processor.processEvent(EventFactory::createEvent(LifecycleEvents::STOP, {},
        {{"agentName", "crawler"}, {"tenantId", "acme"}}));

    EXPECT_EQ(results, (std::vector<std::string>{
        "agent.lifecycle.started:running", "agent.lifecycle.stopped:stopped"}));

    // A failing command surfaces through processEvent
    EXPECT_THROW(processor.processEvent(EventFactory::createEvent(LifecycleEvents::PAUSE, {},
                     {{"agentName", "crawler"}, {"tenantId", "acme"}})),
                 AgentNotFoundError);
}

// ============================================================================
// SHUTDOWN WITH COMMANDS IN FLIGHT
// ============================================================================

namespace {

struct SlowPauseSetup {
    std::unique_ptr<Runtime> runtime;
    std::unique_ptr<AgentLifecycle> lifecycle;
    std::unique_ptr<EventProcessor> processor;
};

/// The status listener stalls on "pausing" well past the processor's operation timeout
SlowPauseSetup makeSlowPauseSetup(std::atomic<bool>& listener_done) {
    SlowPauseSetup setup;
    setup.runtime = std::make_unique<Runtime>(AppConfig::AppConfiguration{},
                                              std::make_shared<NullObservability>());
    setup.lifecycle = std::make_unique<AgentLifecycle>(*setup.runtime);
    setup.lifecycle->setStatusListener([&listener_done](const StatusChange& change) {
        if (change.to == AgentStatus::PAUSING) {
            std::this_thread::sleep_for(100ms);
            listener_done.store(true);
        }
    });

    EventProcessorConfig config;
    config.cleanupInterval = 0ms;
    config.operationTimeout = 20ms;
    setup.processor = std::make_unique<EventProcessor>(*setup.runtime, config);
    setup.lifecycle->attachTo(*setup.processor);
    setup.lifecycle->start({"crawler", "acme", {}, {}});
    return setup;
}

Event pauseCommand() {
    return EventFactory::createEvent(LifecycleEvents::PAUSE, {},
                                     {{"agentName", "crawler"}, {"tenantId", "acme"}});
}

} // namespace

TEST(AgentLifecycleShutdown, ProcessorTeardownWaitsForTimedOutCommand) {
    std::atomic<bool> listener_done{false};
    auto setup = makeSlowPauseSetup(listener_done);

    EXPECT_THROW(setup.processor->processEvent(pauseCommand()), TimeoutError);
    EXPECT_FALSE(listener_done.load());

    setup.processor.reset();
    EXPECT_TRUE(listener_done.load());
    EXPECT_EQ(setup.lifecycle->getAgentStatus("acme", "crawler")->status, AgentStatus::PAUSED);

    setup.lifecycle.reset();
    setup.runtime.reset();
}

TEST(AgentLifecycleShutdown, LifecycleTeardownWaitsAndRefusesLaterCommands) {
    std::atomic<bool> listener_done{false};
    auto setup = makeSlowPauseSetup(listener_done);

    EXPECT_THROW(setup.processor->processEvent(pauseCommand()), TimeoutError);

    // The command is still running inside the lifecycle
    setup.lifecycle.reset();
    EXPECT_TRUE(listener_done.load());

    EXPECT_THROW(setup.processor->processEvent(EventFactory::createEvent(
                     LifecycleEvents::START, {}, {{"agentName", "crawler"}, {"tenantId", "acme"}})),
                 LifecycleError);

    setup.processor.reset();
    setup.runtime.reset();
}
