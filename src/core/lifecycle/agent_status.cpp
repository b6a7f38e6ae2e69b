#include <flowcore/core/lifecycle/agent_status.hpp>

namespace FlowCore {

const char* toString(AgentStatus status) {
    switch (status) {
        case AgentStatus::STOPPED: return "stopped";
        case AgentStatus::STARTING: return "starting";
        case AgentStatus::RUNNING: return "running";
        case AgentStatus::PAUSING: return "pausing";
        case AgentStatus::PAUSED: return "paused";
        case AgentStatus::RESUMING: return "resuming";
        case AgentStatus::STOPPING: return "stopping";
        case AgentStatus::SCHEDULED: return "scheduled";
        case AgentStatus::ERROR: return "error";
        default: return "unknown";
    }
}

std::optional<AgentStatus> parseAgentStatus(const std::string& text) {
    static const AgentStatus all[] = {
        AgentStatus::STOPPED, AgentStatus::STARTING, AgentStatus::RUNNING,
        AgentStatus::PAUSING, AgentStatus::PAUSED, AgentStatus::RESUMING,
        AgentStatus::STOPPING, AgentStatus::SCHEDULED, AgentStatus::ERROR};
    for (AgentStatus status : all) {
        if (text == toString(status)) return status;
    }
    return std::nullopt;
}

bool isTransitional(AgentStatus status) {
    return status == AgentStatus::STARTING || status == AgentStatus::PAUSING ||
           status == AgentStatus::RESUMING || status == AgentStatus::STOPPING;
}

bool isBusy(AgentStatus status) {
    return status == AgentStatus::RUNNING || status == AgentStatus::STARTING ||
           status == AgentStatus::PAUSING || status == AgentStatus::RESUMING;
}

bool isValidTransition(AgentStatus from, AgentStatus to) {
    if (to == AgentStatus::ERROR) {
        return isTransitional(from);
    }
    switch (from) {
        case AgentStatus::STOPPED:
            return to == AgentStatus::STARTING || to == AgentStatus::SCHEDULED;
        case AgentStatus::STARTING:
            return to == AgentStatus::RUNNING;
        case AgentStatus::RUNNING:
            return to == AgentStatus::PAUSING || to == AgentStatus::STOPPING;
        case AgentStatus::PAUSING:
            return to == AgentStatus::PAUSED;
        case AgentStatus::PAUSED:
            return to == AgentStatus::RESUMING || to == AgentStatus::STOPPING;
        case AgentStatus::RESUMING:
            return to == AgentStatus::RUNNING;
        case AgentStatus::STOPPING:
            return to == AgentStatus::STOPPED;
        case AgentStatus::SCHEDULED:
            return to == AgentStatus::STARTING || to == AgentStatus::STOPPING;
        case AgentStatus::ERROR:
            return to == AgentStatus::STARTING || to == AgentStatus::STOPPED;
        default:
            return false;
    }
}

} // namespace FlowCore
