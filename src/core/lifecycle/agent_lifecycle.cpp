#include <flowcore/core/lifecycle/agent_lifecycle.hpp>
#include <flowcore/core/errors.hpp>
#include <flowcore/core/events/event_factory.hpp>
#include <flowcore/core/metrics/registry.hpp>
#include <flowcore/core/processor/event_processor.hpp>
#include <flowcore/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace FlowCore {

namespace {

std::string requireAgentName(const Event& event) {
    auto name = event.metadataValue("agentName");
    if (!name || name->empty()) {
        throw LifecycleError("Lifecycle event " + event.type + " is missing agentName");
    }
    return *name;
}

bool parseFlag(const Event& event, const std::string& key, bool fallback) {
    auto value = event.metadataValue(key);
    if (!value) return fallback;
    if (*value == "true" || *value == "1") return true;
    if (*value == "false" || *value == "0") return false;
    throw LifecycleError("Invalid boolean '" + *value + "' for " + key);
}

std::optional<uint64_t> parseMillis(const Event& event, const std::string& key) {
    auto value = event.metadataValue(key);
    if (!value) return std::nullopt;
    size_t consumed = 0;
    uint64_t parsed = 0;
    try {
        parsed = std::stoull(*value, &consumed);
    } catch (const std::logic_error&) {
        throw LifecycleError("Invalid number '" + *value + "' for " + key);
    }
    if (consumed != value->size() || value->front() == '-') {
        throw LifecycleError("Invalid number '" + *value + "' for " + key);
    }
    return parsed;
}

LifecycleParams collectPrefixed(const Event& event, const std::string& prefix) {
    LifecycleParams out;
    for (const auto& [key, value] : event.metadata) {
        if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0) {
            out.emplace(key.substr(prefix.size()), value);
        }
    }
    return out;
}

Event resultEvent(const Event& command, const char* type, const LifecycleResult& result) {
    return EventFactory::createFollowUp(command, std::string(type), {}, result.toMetadata());
}

} // namespace

// ============================================================================
// Value types
// ============================================================================

std::unordered_map<std::string, std::string> LifecycleResult::toMetadata() const {
    std::unordered_map<std::string, std::string> meta{
        {"agentName", agentName},
        {"tenantId", tenantId},
        {"status", toString(status)},
        {"timestamp", std::to_string(timestamp)},
    };
    if (!executionId.empty()) meta.emplace("executionId", executionId);
    if (snapshotId) meta.emplace("snapshotId", *snapshotId);
    if (!reason.empty()) meta.emplace("reason", reason);
    if (scheduledFor) meta.emplace("scheduledFor", std::to_string(*scheduledFor));
    return meta;
}

LifecycleOptions LifecycleOptions::fromApp(const AppConfig::LifecycleConfig& app) {
    LifecycleOptions opts;
    opts.cronFallbackDelay = std::chrono::milliseconds(app.cronFallbackDelayMs);
    return opts;
}

// ============================================================================
// AgentLifecycle
// ============================================================================

AgentLifecycle::AgentLifecycle(Runtime& runtime, LifecycleOptions options)
    : runtime_(runtime),
      options_(std::move(options)),
      start_time_ms_(Clock::epoch_ms()),
      gate_(std::make_shared<CallGate>()) {
    spdlog::info("[AgentLifecycle] initialized (cronFallbackDelay={}ms, persistor={})",
                 options_.cronFallbackDelay.count(), options_.persistor ? "attached" : "none");
}

AgentLifecycle::~AgentLifecycle() noexcept {
    spdlog::info("[DESTRUCTOR] AgentLifecycle being destroyed...");
    // Processor calls may still be inside, e.g. on a thread that lost a timeout race
    gate_->closeAndWait();
    dispose();
}

template <typename Fn>
LifecycleResult AgentLifecycle::runCommand(Fn&& command) {
    Changes changes;
    std::optional<LifecycleResult> result;
    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            result = command(changes);
        } catch (...) {
            failure = std::current_exception();
        }
    }
    // Transitions that happened before a failure are still reported
    publish(changes);
    if (failure) {
        std::rethrow_exception(failure);
    }
    return std::move(*result);
}

LifecycleResult AgentLifecycle::start(const StartRequest& request) {
    return runCommand([&](Changes& changes) { return startLocked(request, changes); });
}

LifecycleResult AgentLifecycle::stop(const StopRequest& request) {
    return runCommand([&](Changes& changes) { return stopLocked(request, changes); });
}

LifecycleResult AgentLifecycle::pause(const PauseRequest& request) {
    return runCommand([&](Changes& changes) { return pauseLocked(request, changes); });
}

LifecycleResult AgentLifecycle::resume(const ResumeRequest& request) {
    return runCommand([&](Changes& changes) { return resumeLocked(request, changes); });
}

LifecycleResult AgentLifecycle::schedule(const ScheduleRequest& request) {
    return runCommand([&](Changes& changes) { return scheduleLocked(request, changes); });
}

// ============================================================================
// Commands (registry mutex held)
// ============================================================================

LifecycleResult AgentLifecycle::startLocked(const StartRequest& request, Changes& changes) {
    const std::string key = registryKey(request.tenantId, request.agentName);
    auto it = agents_.find(key);
    if (it != agents_.end() && isBusy(it->second.record.status)) {
        throw LifecycleConflictError("Agent " + request.agentName + " is already " +
                                     toString(it->second.record.status));
    }

    spdlog::info("[AgentLifecycle] Starting agent {} (tenant={})", request.agentName, request.tenantId);

    if (it == agents_.end()) {
        Entry fresh;
        fresh.record.agentName = request.agentName;
        fresh.record.tenantId = request.tenantId;
        it = agents_.emplace(key, std::move(fresh)).first;
    }
    Entry& entry = it->second;

    if (entry.record.status == AgentStatus::PAUSED) {
        transitionLocked(entry, AgentStatus::STOPPING, "restart", changes);
        transitionLocked(entry, AgentStatus::STOPPED, "restart", changes);
    }
    transitionLocked(entry, AgentStatus::STARTING, "", changes);

    try {
        AgentRecord& record = entry.record;
        const uint64_t now = Clock::epoch_ms();
        record.config = request.config;
        record.context = request.context;
        record.executionId = "lifecycle-" + request.agentName + "-" + std::to_string(now);
        record.startedAt = now;
        record.pausedAt.reset();
        record.stoppedAt.reset();
        record.snapshotId.reset();
        record.lastError.clear();

        // A pending one-shot schedule is consumed by this start
        if (!(record.schedule && record.schedule->repeat)) {
            entry.timer.cancel();
            entry.timer = TaskHandle();
            record.schedule.reset();
            record.scheduledFor.reset();
        }

        transitionLocked(entry, AgentStatus::RUNNING, "", changes);
        spdlog::info("[AgentLifecycle] Agent {} started (tenant={}, executionId={})",
                     request.agentName, request.tenantId, record.executionId);
        return resultFor(entry, now);
    } catch (const std::exception& e) {
        failLocked(entry, e.what(), changes);
        throw;
    }
}

LifecycleResult AgentLifecycle::stopLocked(const StopRequest& request, Changes& changes) {
    const std::string key = registryKey(request.tenantId, request.agentName);
    const uint64_t now = Clock::epoch_ms();
    spdlog::info("[AgentLifecycle] Stopping agent {} (tenant={}, reason={}, force={})",
                 request.agentName, request.tenantId, request.reason, request.force);

    auto it = agents_.find(key);
    if (it == agents_.end() || it->second.record.status == AgentStatus::STOPPED) {
        spdlog::warn("[AgentLifecycle] Agent {} already stopped (tenant={})",
                     request.agentName, request.tenantId);
        LifecycleResult result;
        result.agentName = request.agentName;
        result.tenantId = request.tenantId;
        result.status = AgentStatus::STOPPED;
        result.timestamp = now;
        if (it != agents_.end() && it->second.record.stoppedAt) {
            result.timestamp = *it->second.record.stoppedAt;
        }
        result.reason = "already stopped";
        return result;
    }

    Entry& entry = it->second;
    if (request.force && isTransitional(entry.record.status)) {
        transitionLocked(entry, AgentStatus::ERROR, "forced stop", changes);
    }
    if (entry.record.status != AgentStatus::ERROR) {
        transitionLocked(entry, AgentStatus::STOPPING, request.reason, changes);
    }

    entry.timer.cancel();
    entry.timer = TaskHandle();
    entry.record.executionId.clear();
    entry.record.scheduledFor.reset();
    entry.record.stoppedAt = now;
    transitionLocked(entry, AgentStatus::STOPPED, request.reason, changes);

    LifecycleResult result = resultFor(entry, now);
    result.reason = request.reason;
    agents_.erase(it);

    spdlog::info("[AgentLifecycle] Agent {} stopped (tenant={})", request.agentName, request.tenantId);
    return result;
}

LifecycleResult AgentLifecycle::pauseLocked(const PauseRequest& request, Changes& changes) {
    Entry& entry = requireEntryLocked(request.tenantId, request.agentName);
    spdlog::info("[AgentLifecycle] Pausing agent {} (tenant={}, saveSnapshot={})",
                 request.agentName, request.tenantId, request.saveSnapshot);

    transitionLocked(entry, AgentStatus::PAUSING, request.reason, changes);
    try {
        const uint64_t now = Clock::epoch_ms();
        entry.record.pausedAt = now;

        std::optional<std::string> snapshot_id;
        if (request.saveSnapshot) {
            const std::string& base = entry.record.executionId.empty()
                                          ? entry.record.agentName
                                          : entry.record.executionId;
            snapshot_id = "snapshot-" + base + "-" + std::to_string(now);
            if (options_.persistor) {
                options_.persistor->save(*snapshot_id, encodeSnapshot(entry));
            }
            entry.record.snapshotId = snapshot_id;
        }

        transitionLocked(entry, AgentStatus::PAUSED, request.reason, changes);
        spdlog::info("[AgentLifecycle] Agent {} paused (snapshot={})",
                     request.agentName, snapshot_id.value_or("none"));

        LifecycleResult result = resultFor(entry, now);
        result.snapshotId = snapshot_id;
        result.reason = request.reason;
        return result;
    } catch (const std::exception& e) {
        failLocked(entry, e.what(), changes);
        throw;
    }
}

LifecycleResult AgentLifecycle::resumeLocked(const ResumeRequest& request, Changes& changes) {
    Entry& entry = requireEntryLocked(request.tenantId, request.agentName);
    spdlog::info("[AgentLifecycle] Resuming agent {} (tenant={})", request.agentName, request.tenantId);

    transitionLocked(entry, AgentStatus::RESUMING, "", changes);
    try {
        const std::optional<std::string> resume_id =
            request.snapshotId ? request.snapshotId : entry.record.snapshotId;

        if (resume_id && options_.persistor) {
            auto blob = options_.persistor->load(*resume_id);
            if (!blob) {
                throw LifecycleError("Snapshot " + *resume_id + " not found");
            }
            restoreSnapshot(entry, *blob);
            spdlog::info("[AgentLifecycle] Agent {} restored from snapshot {}",
                         request.agentName, *resume_id);
        }

        for (const auto& [key, value] : request.context) {
            entry.record.context[key] = value;
        }
        entry.record.pausedAt.reset();
        entry.record.snapshotId = resume_id;

        transitionLocked(entry, AgentStatus::RUNNING, "", changes);
        LifecycleResult result = resultFor(entry, Clock::epoch_ms());
        result.snapshotId = resume_id;
        return result;
    } catch (const std::exception& e) {
        failLocked(entry, e.what(), changes);
        throw;
    }
}

LifecycleResult AgentLifecycle::scheduleLocked(const ScheduleRequest& request, Changes& changes) {
    const ScheduleConfig& schedule = request.schedule;
    if (schedule.interval.count() < 0) {
        throw LifecycleError("Schedule interval for agent " + request.agentName + " is negative");
    }
    if (!schedule.atEpochMs && schedule.cron.empty() && schedule.interval.count() == 0) {
        throw LifecycleError("Schedule for agent " + request.agentName +
                             " needs an absolute time, a cron expression or an interval");
    }

    const std::string key = registryKey(request.tenantId, request.agentName);
    auto it = agents_.find(key);
    if (it != agents_.end()) {
        AgentStatus status = it->second.record.status;
        if (status != AgentStatus::SCHEDULED && !isValidTransition(status, AgentStatus::SCHEDULED)) {
            throw InvalidTransitionError(toString(status), toString(AgentStatus::SCHEDULED));
        }
    } else {
        Entry fresh;
        fresh.record.agentName = request.agentName;
        fresh.record.tenantId = request.tenantId;
        it = agents_.emplace(key, std::move(fresh)).first;
    }
    Entry& entry = it->second;

    const uint64_t now = Clock::epoch_ms();
    const uint64_t run_at = nextRunTime(schedule, true, now);

    for (const auto& [name, value] : request.config) {
        entry.record.config[name] = value;
    }
    entry.record.schedule = schedule;
    if (entry.record.status != AgentStatus::SCHEDULED) {
        transitionLocked(entry, AgentStatus::SCHEDULED, "", changes);
    }
    armTimerLocked(key, entry, run_at);

    spdlog::info("[AgentLifecycle] Agent {} scheduled (tenant={}, runAt={}, repeat={})",
                 request.agentName, request.tenantId, run_at, schedule.repeat);
    return resultFor(entry, now);
}

// ============================================================================
// Transitions
// ============================================================================

void AgentLifecycle::transitionLocked(Entry& entry, AgentStatus to, const std::string& reason,
                                      Changes& changes) {
    const AgentStatus from = entry.record.status;
    if (!isValidTransition(from, to)) {
        throw InvalidTransitionError(toString(from), toString(to));
    }

    entry.record.status = to;
    if (to == AgentStatus::ERROR) {
        entry.record.lastError = reason;
    }

    total_transitions_.fetch_add(1, std::memory_order_relaxed);
    runtime_.metrics().getMetrics(MetricNames::AGENT_LIFECYCLE)
        .total_transitions.fetch_add(1, std::memory_order_relaxed);

    changes.push_back(StatusChange{entry.record.agentName, entry.record.tenantId,
                                   from, to, reason, Clock::epoch_ms()});
    spdlog::debug("[AgentLifecycle] {}:{} {} -> {}", entry.record.tenantId,
                  entry.record.agentName, toString(from), toString(to));
}

void AgentLifecycle::failLocked(Entry& entry, const std::string& reason, Changes& changes) {
    if (!isTransitional(entry.record.status)) return;
    transitionLocked(entry, AgentStatus::ERROR, reason, changes);
    spdlog::error("[AgentLifecycle] Agent {} failed: {}", entry.record.agentName, reason);
}

AgentLifecycle::Entry& AgentLifecycle::requireEntryLocked(const std::string& tenant_id,
                                                          const std::string& agent_name) {
    auto it = agents_.find(registryKey(tenant_id, agent_name));
    if (it == agents_.end()) {
        throw AgentNotFoundError(tenant_id, agent_name);
    }
    return it->second;
}

void AgentLifecycle::publish(const Changes& changes) {
    if (changes.empty()) return;

    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }

    for (const auto& change : changes) {
        try {
            runtime_.observability().log(LogLevel::DEBUG, "Agent status changed",
                                         {{"agentName", change.agentName},
                                          {"tenantId", change.tenantId},
                                          {"from", toString(change.from)},
                                          {"to", toString(change.to)},
                                          {"reason", change.reason}});
        } catch (const std::exception& e) {
            spdlog::warn("[AgentLifecycle] observability sink failed: {}", e.what());
        }

        if (!listener) continue;
        try {
            listener(change);
        } catch (const std::exception& e) {
            spdlog::warn("[AgentLifecycle] status listener failed for {} ({} -> {}): {}",
                         change.agentName, toString(change.from), toString(change.to), e.what());
        }
    }
}

void AgentLifecycle::setStatusListener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

// ============================================================================
// Scheduling
// ============================================================================

uint64_t AgentLifecycle::nextRunTime(const ScheduleConfig& schedule, bool initial, uint64_t now) const {
    if (initial && schedule.atEpochMs) {
        return *schedule.atEpochMs;
    }
    if (schedule.interval.count() > 0) {
        return now + static_cast<uint64_t>(schedule.interval.count());
    }
    if (!schedule.cron.empty()) {
        // TODO: evaluate cron expressions instead of the fixed fallback delay
        spdlog::warn("[AgentLifecycle] Cron expression '{}' not evaluated, running in {}ms",
                     schedule.cron, options_.cronFallbackDelay.count());
    }
    return now + static_cast<uint64_t>(options_.cronFallbackDelay.count());
}

void AgentLifecycle::armTimerLocked(const std::string& key, Entry& entry, uint64_t run_at) {
    entry.timer.cancel();

    const uint64_t now = Clock::epoch_ms();
    const auto delay = std::chrono::milliseconds(run_at > now ? run_at - now : 0);
    const uint64_t generation = ++next_generation_;

    entry.timerGeneration = generation;
    entry.record.scheduledFor = run_at;
    entry.timer = runtime_.timers().schedule(delay, [this, key, generation] {
        fireScheduled(key, generation);
    });

    timers_.erase(std::remove_if(timers_.begin(), timers_.end(),
                                 [](const TaskHandle& handle) { return handle.isFinished(); }),
                  timers_.end());
    timers_.push_back(entry.timer);
}

void AgentLifecycle::fireScheduled(const std::string& key, uint64_t generation) {
    Changes changes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(key);
        if (it == agents_.end() || it->second.timerGeneration != generation) {
            return;
        }
        Entry& entry = it->second;
        StartRequest request{entry.record.agentName, entry.record.tenantId,
                             entry.record.config, entry.record.context};

        spdlog::info("[AgentLifecycle] Executing scheduled agent {} (tenant={})",
                     request.agentName, request.tenantId);
        try {
            startLocked(request, changes);
        } catch (const LifecycleConflictError& e) {
            spdlog::warn("[AgentLifecycle] Scheduled start skipped: {}", e.what());
        } catch (const std::exception& e) {
            total_errors_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("[AgentLifecycle] Scheduled agent execution failed for {}: {}",
                          request.agentName, e.what());
        }

        // startLocked never removes the entry
        if (entry.record.schedule && entry.record.schedule->repeat) {
            armTimerLocked(key, entry, nextRunTime(*entry.record.schedule, false, Clock::epoch_ms()));
        } else {
            entry.timer = TaskHandle();
            entry.record.scheduledFor.reset();
        }
    }
    publish(changes);
}

// ============================================================================
// Snapshots
// ============================================================================

StateBlob AgentLifecycle::encodeSnapshot(const Entry& entry) const {
    const AgentRecord& record = entry.record;
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "agentName" << YAML::Value << record.agentName;
    out << YAML::Key << "tenantId" << YAML::Value << record.tenantId;
    out << YAML::Key << "executionId" << YAML::Value << record.executionId;
    if (record.pausedAt) {
        out << YAML::Key << "pausedAt" << YAML::Value << *record.pausedAt;
    }
    out << YAML::Key << "config" << YAML::Value << record.config;
    out << YAML::Key << "context" << YAML::Value << record.context;
    out << YAML::EndMap;

    if (!out.good()) {
        throw LifecycleError("Failed to encode snapshot for " + record.agentName + ": " +
                             out.GetLastError());
    }
    const std::string text = out.c_str();
    return StateBlob(text.begin(), text.end());
}

void AgentLifecycle::restoreSnapshot(Entry& entry, const StateBlob& blob) const {
    try {
        const YAML::Node root = YAML::Load(std::string(blob.begin(), blob.end()));
        if (!root.IsMap()) {
            throw LifecycleError("Snapshot for " + entry.record.agentName + " is not a map");
        }
        if (root["config"]) {
            entry.record.config = root["config"].as<LifecycleParams>();
        }
        if (root["context"]) {
            entry.record.context = root["context"].as<LifecycleParams>();
        }
    } catch (const YAML::Exception& e) {
        throw LifecycleError("Corrupt snapshot for " + entry.record.agentName + ": " + e.what());
    }
}

// ============================================================================
// Event adapter
// ============================================================================

Event AgentLifecycle::handleLifecycleEvent(const Event& event) {
    auto& metrics = runtime_.metrics().getMetrics(MetricNames::AGENT_LIFECYCLE);
    metrics.total_events_processed.fetch_add(1, std::memory_order_relaxed);

    try {
        const std::string tenant = event.metadataOr("tenantId", runtime_.tenantId());

        if (event.type == LifecycleEvents::START) {
            StartRequest request{requireAgentName(event), tenant,
                                 collectPrefixed(event, "config."), collectPrefixed(event, "context.")};
            return resultEvent(event, LifecycleEvents::STARTED, start(request));
        }
        if (event.type == LifecycleEvents::STOP) {
            StopRequest request{requireAgentName(event), tenant, event.metadataOr("reason", ""),
                                parseFlag(event, "force", false)};
            return resultEvent(event, LifecycleEvents::STOPPED, stop(request));
        }
        if (event.type == LifecycleEvents::PAUSE) {
            PauseRequest request{requireAgentName(event), tenant, event.metadataOr("reason", ""),
                                 parseFlag(event, "saveSnapshot", true)};
            return resultEvent(event, LifecycleEvents::PAUSED, pause(request));
        }
        if (event.type == LifecycleEvents::RESUME) {
            ResumeRequest request{requireAgentName(event), tenant, event.metadataValue("snapshotId"),
                                  collectPrefixed(event, "context.")};
            return resultEvent(event, LifecycleEvents::RESUMED, resume(request));
        }
        if (event.type == LifecycleEvents::SCHEDULE) {
            ScheduleRequest request;
            request.agentName = requireAgentName(event);
            request.tenantId = tenant;
            request.schedule.atEpochMs = parseMillis(event, "at");
            request.schedule.cron = event.metadataOr("cron", "");
            request.schedule.repeat = parseFlag(event, "repeat", false);
            request.schedule.interval =
                std::chrono::milliseconds(parseMillis(event, "interval_ms").value_or(0));
            request.config = collectPrefixed(event, "config.");
            return resultEvent(event, LifecycleEvents::SCHEDULED, schedule(request));
        }
        throw LifecycleError("Unknown lifecycle operation: " + event.type);
    } catch (const LifecycleError& e) {
        total_errors_.fetch_add(1, std::memory_order_relaxed);
        metrics.total_events_errors.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[AgentLifecycle] Lifecycle operation {} failed: {}", event.type, e.what());
        throw;
    } catch (const std::exception& e) {
        total_errors_.fetch_add(1, std::memory_order_relaxed);
        metrics.total_events_errors.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[AgentLifecycle] Lifecycle operation {} failed: {}", event.type, e.what());
        throw LifecycleError(std::string("Lifecycle operation failed: ") + e.what());
    }
}

std::string AgentLifecycle::attachTo(EventProcessor& processor) {
    auto handler = [this, gate = gate_](const Event& event) {
        CallGate::Pass pass(*gate);
        if (!pass) {
            throw LifecycleError("Lifecycle handler is disposed, dropping " + event.type);
        }
        return reEmit(handleLifecycleEvent(event));
    };
    auto id = processor.registerPatternHandler(LifecycleEvents::COMMAND_PATTERN, std::move(handler));
    spdlog::info("[AgentLifecycle] attached to {} as {}", processor.name(), id);
    return id;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<AgentRecord> AgentLifecycle::getAgentStatus(const std::string& tenant_id,
                                                          const std::string& agent_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(registryKey(tenant_id, agent_name));
    if (it == agents_.end()) return std::nullopt;
    return it->second.record;
}

std::vector<AgentRecord> AgentLifecycle::listAgentsByTenant(const std::string& tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentRecord> out;
    for (const auto& [key, entry] : agents_) {
        if (entry.record.tenantId == tenant_id) {
            out.push_back(entry.record);
        }
    }
    return out;
}

LifecycleStats AgentLifecycle::getStats() const {
    static const AgentStatus all[] = {
        AgentStatus::STOPPED, AgentStatus::STARTING, AgentStatus::RUNNING,
        AgentStatus::PAUSING, AgentStatus::PAUSED, AgentStatus::RESUMING,
        AgentStatus::STOPPING, AgentStatus::SCHEDULED, AgentStatus::ERROR};

    LifecycleStats stats;
    for (AgentStatus status : all) {
        stats.agentsByStatus[toString(status)] = 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats.totalAgents = agents_.size();
    for (const auto& [key, entry] : agents_) {
        stats.agentsByStatus[toString(entry.record.status)] += 1;
        stats.agentsByTenant[entry.record.tenantId] += 1;
    }
    stats.totalTransitions = total_transitions_.load(std::memory_order_relaxed);
    stats.totalErrors = total_errors_.load(std::memory_order_relaxed);
    stats.uptimeMs = Clock::epoch_ms() - start_time_ms_;
    return stats;
}

// ============================================================================
// Teardown
// ============================================================================

void AgentLifecycle::dispose() {
    spdlog::info("[AgentLifecycle] Disposing...");

    std::vector<StopRequest> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, entry] : agents_) {
            AgentStatus status = entry.record.status;
            if (status == AgentStatus::RUNNING || status == AgentStatus::PAUSED ||
                status == AgentStatus::SCHEDULED) {
                pending.push_back(StopRequest{entry.record.agentName, entry.record.tenantId,
                                              "Handler disposal", true});
            }
        }
    }

    for (const auto& request : pending) {
        try {
            stop(request);
        } catch (const std::exception& e) {
            spdlog::error("[AgentLifecycle] Error stopping agent {}:{} during disposal: {}",
                          request.tenantId, request.agentName, e.what());
        }
    }

    std::vector<TaskHandle> timers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, entry] : agents_) {
            entry.timer.cancel();
        }
        agents_.clear();
        timers.swap(timers_);
    }
    // Outside the registry mutex: a firing task may be waiting for it
    for (auto& timer : timers) {
        timer.cancelAndWait();
    }

    spdlog::info("[AgentLifecycle] Disposed ({} stopped)", pending.size());
}

// ============================================================================
// Helpers
// ============================================================================

std::string AgentLifecycle::registryKey(const std::string& tenant_id, const std::string& agent_name) {
    return tenant_id + ":" + agent_name;
}

LifecycleResult AgentLifecycle::resultFor(const Entry& entry, uint64_t timestamp) {
    LifecycleResult result;
    result.agentName = entry.record.agentName;
    result.tenantId = entry.record.tenantId;
    result.status = entry.record.status;
    result.timestamp = timestamp;
    result.executionId = entry.record.executionId;
    result.snapshotId = entry.record.snapshotId;
    result.scheduledFor = entry.record.scheduledFor;
    return result;
}

} // namespace FlowCore
