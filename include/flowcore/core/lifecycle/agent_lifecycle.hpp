#pragma once

#include <flowcore/core/config/app_config.hpp>
#include <flowcore/core/events/event.hpp>
#include <flowcore/core/lifecycle/agent_status.hpp>
#include <flowcore/core/lifecycle/snapshot_persistor.hpp>
#include <flowcore/core/runtime/runtime.hpp>
#include <flowcore/core/runtime/timer_service.hpp>
#include <flowcore/core/utils/worker_group.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace FlowCore {

class EventProcessor;

using LifecycleParams = std::map<std::string, std::string>;

// ============================================================================
// Lifecycle event types
// ============================================================================
namespace LifecycleEvents {
    constexpr const char* START = "agent.lifecycle.start";
    constexpr const char* STOP = "agent.lifecycle.stop";
    constexpr const char* PAUSE = "agent.lifecycle.pause";
    constexpr const char* RESUME = "agent.lifecycle.resume";
    constexpr const char* SCHEDULE = "agent.lifecycle.schedule";

    constexpr const char* STARTED = "agent.lifecycle.started";
    constexpr const char* STOPPED = "agent.lifecycle.stopped";
    constexpr const char* PAUSED = "agent.lifecycle.paused";
    constexpr const char* RESUMED = "agent.lifecycle.resumed";
    constexpr const char* SCHEDULED = "agent.lifecycle.scheduled";

    /// Matches the five command types and nothing else
    constexpr const char* COMMAND_PATTERN = "^agent\\.lifecycle\\.(start|stop|pause|resume|schedule)$";
}

/**
 * @brief When a scheduled agent should start.
 *
 * The first run happens at atEpochMs when set. Later runs (repeat) and runs
 * without an absolute time happen after interval, or after the configured
 * cron fallback delay when only a cron expression is given.
 */
struct ScheduleConfig {
    std::optional<uint64_t> atEpochMs;
    std::string cron;
    bool repeat = false;
    std::chrono::milliseconds interval{0};
};

struct StartRequest {
    std::string agentName;
    std::string tenantId;
    LifecycleParams config;
    LifecycleParams context;
};

struct StopRequest {
    std::string agentName;
    std::string tenantId;
    std::string reason;
    bool force = false;   // also stop agents caught in a transitional status
};

struct PauseRequest {
    std::string agentName;
    std::string tenantId;
    std::string reason;
    bool saveSnapshot = true;
};

struct ResumeRequest {
    std::string agentName;
    std::string tenantId;
    std::optional<std::string> snapshotId;
    LifecycleParams context;
};

struct ScheduleRequest {
    std::string agentName;
    std::string tenantId;
    ScheduleConfig schedule;
    LifecycleParams config;
};

struct LifecycleResult {
    std::string agentName;
    std::string tenantId;
    AgentStatus status = AgentStatus::STOPPED;
    uint64_t timestamp = 0;
    std::string executionId;
    std::optional<std::string> snapshotId;
    std::string reason;
    std::optional<uint64_t> scheduledFor;

    /// Flat key/value form used as event metadata
    std::unordered_map<std::string, std::string> toMetadata() const;
};

/// Copy of one registry entry
struct AgentRecord {
    std::string agentName;
    std::string tenantId;
    AgentStatus status = AgentStatus::STOPPED;
    std::string executionId;
    std::optional<std::string> snapshotId;
    LifecycleParams config;
    LifecycleParams context;
    std::optional<uint64_t> startedAt;
    std::optional<uint64_t> pausedAt;
    std::optional<uint64_t> stoppedAt;
    std::optional<ScheduleConfig> schedule;
    std::optional<uint64_t> scheduledFor;
    std::string lastError;
};

struct StatusChange {
    std::string agentName;
    std::string tenantId;
    AgentStatus from = AgentStatus::STOPPED;
    AgentStatus to = AgentStatus::STOPPED;
    std::string reason;
    uint64_t timestamp = 0;
};

using StatusListener = std::function<void(const StatusChange&)>;

struct LifecycleStats {
    size_t totalAgents = 0;
    std::map<std::string, size_t> agentsByStatus;
    std::map<std::string, size_t> agentsByTenant;
    uint64_t totalTransitions = 0;
    uint64_t totalErrors = 0;
    uint64_t uptimeMs = 0;
};

struct LifecycleOptions {
    std::chrono::milliseconds cronFallbackDelay{60000};
    SnapshotPersistorPtr persistor;   // optional

    static LifecycleOptions fromApp(const AppConfig::LifecycleConfig& app);
};

/**
 * @class AgentLifecycle
 * @brief Per (tenant, agent) state machine driven by start/stop/pause/resume/schedule.
 *
 * Every command validates its transitions against the lifecycle graph under
 * one registry mutex. An invalid transition throws and leaves the entry as it
 * was. A failure after a transitional status has been entered moves the
 * entry to error and rethrows.
 *
 * Status changes are delivered to the status listener after the registry
 * mutex is released, in the order they happened. Scheduled starts run on the
 * runtime timer thread.
 */
class AgentLifecycle {
public:
    explicit AgentLifecycle(Runtime& runtime, LifecycleOptions options = {});
    ~AgentLifecycle() noexcept;

    AgentLifecycle(const AgentLifecycle&) = delete;
    AgentLifecycle& operator=(const AgentLifecycle&) = delete;

    /// @throws LifecycleConflictError if the agent is running, starting, pausing or resuming
    LifecycleResult start(const StartRequest& request);

    /// Missing or stopped agents yield reason "already stopped"
    LifecycleResult stop(const StopRequest& request);

    /// @throws AgentNotFoundError, InvalidTransitionError unless running
    LifecycleResult pause(const PauseRequest& request);

    /// @throws AgentNotFoundError, InvalidTransitionError unless paused
    LifecycleResult resume(const ResumeRequest& request);

    /// @throws LifecycleError on an empty schedule, InvalidTransitionError unless stopped or scheduled
    LifecycleResult schedule(const ScheduleRequest& request);

    /**
     * @brief Run the command carried by a lifecycle event.
     *
     * Parameters come from the event metadata: agentName (required),
     * tenantId, reason, force, saveSnapshot, snapshotId, at, cron, repeat,
     * interval_ms, and config.* / context.* entries.
     *
     * @return the matching agent.lifecycle.{started,stopped,paused,resumed,scheduled} event
     * @throws LifecycleError (or a subclass) for unknown types and failed commands
     */
    Event handleLifecycleEvent(const Event& event);

    /**
     * @brief Register handleLifecycleEvent on @p processor; the result event is re-emitted.
     *
     * The handler may outlive this object inside the processor. Once
     * destruction starts it throws LifecycleError, and the destructor waits
     * for calls already inside.
     */
    std::string attachTo(EventProcessor& processor);

    void setStatusListener(StatusListener listener);

    std::optional<AgentRecord> getAgentStatus(const std::string& tenant_id,
                                              const std::string& agent_name) const;
    std::vector<AgentRecord> listAgentsByTenant(const std::string& tenant_id) const;

    LifecycleStats getStats() const;

    /// Stop running, paused and scheduled agents, then clear the registry
    void dispose();

private:
    struct Entry {
        AgentRecord record;
        TaskHandle timer;
        uint64_t timerGeneration = 0;
    };

    using Changes = std::vector<StatusChange>;

    template <typename Fn>
    LifecycleResult runCommand(Fn&& command);

    LifecycleResult startLocked(const StartRequest& request, Changes& changes);
    LifecycleResult stopLocked(const StopRequest& request, Changes& changes);
    LifecycleResult pauseLocked(const PauseRequest& request, Changes& changes);
    LifecycleResult resumeLocked(const ResumeRequest& request, Changes& changes);
    LifecycleResult scheduleLocked(const ScheduleRequest& request, Changes& changes);

    /// @throws InvalidTransitionError without touching @p entry
    void transitionLocked(Entry& entry, AgentStatus to, const std::string& reason, Changes& changes);

    /// Move @p entry to error after a failure inside a transitional status
    void failLocked(Entry& entry, const std::string& reason, Changes& changes);

    Entry& requireEntryLocked(const std::string& tenant_id, const std::string& agent_name);

    uint64_t nextRunTime(const ScheduleConfig& schedule, bool initial, uint64_t now) const;
    void armTimerLocked(const std::string& key, Entry& entry, uint64_t run_at);
    void fireScheduled(const std::string& key, uint64_t generation);

    StateBlob encodeSnapshot(const Entry& entry) const;
    void restoreSnapshot(Entry& entry, const StateBlob& blob) const;

    void publish(const Changes& changes);

    static std::string registryKey(const std::string& tenant_id, const std::string& agent_name);
    static LifecycleResult resultFor(const Entry& entry, uint64_t timestamp);

    Runtime& runtime_;
    LifecycleOptions options_;
    const uint64_t start_time_ms_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> agents_;
    std::vector<TaskHandle> timers_;   // every armed task, for teardown
    uint64_t next_generation_ = 0;

    std::mutex listener_mutex_;
    StatusListener listener_;

    std::atomic<uint64_t> total_transitions_{0};
    std::atomic<uint64_t> total_errors_{0};

    std::shared_ptr<CallGate> gate_;   // processor handler calls in flight
};

} // namespace FlowCore
