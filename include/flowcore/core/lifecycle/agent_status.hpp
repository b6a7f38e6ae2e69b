#pragma once

#include <optional>
#include <string>

namespace FlowCore {

enum class AgentStatus {
    STOPPED,
    STARTING,
    RUNNING,
    PAUSING,
    PAUSED,
    RESUMING,
    STOPPING,
    SCHEDULED,
    ERROR
};

const char* toString(AgentStatus status);

std::optional<AgentStatus> parseAgentStatus(const std::string& text);

/**
 * @brief Edge check against the lifecycle graph.
 *
 * stopped->starting->running, running->pausing->paused,
 * paused->resuming->running, running|paused|scheduled->stopping->stopped,
 * stopped->scheduled, scheduled->starting, any transitional state->error,
 * error->starting and error->stopped.
 */
bool isValidTransition(AgentStatus from, AgentStatus to);

/// starting, pausing, resuming, stopping
bool isTransitional(AgentStatus status);

/// Statuses that block a new start
bool isBusy(AgentStatus status);

} // namespace FlowCore
