#pragma once

#include <flowcore/core/events/event.hpp>

#include <atomic>
#include <string>
#include <unordered_map>
#include <vector>

namespace FlowCore {

class EventFactory {
public:
    static Event createEvent(std::string&& type,
                             std::vector<uint8_t>&& data = {},
                             std::unordered_map<std::string, std::string>&& metadata = {});

    /**
     * @brief Create an event that continues the flow of @p parent.
     *
     * The correlation id, tenant id and cost context of the parent carry over.
     */
    static Event createFollowUp(const Event& parent,
                                std::string&& type,
                                std::vector<uint8_t>&& data = {},
                                std::unordered_map<std::string, std::string>&& metadata = {});

    /// Attach a fresh CostContext if the event has none
    static Event& withCostTracking(Event& event);

    static std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

private:
    static std::atomic<uint64_t> global_event_id;
};

} // namespace FlowCore
