#include <flowcore/core/events/event_factory.hpp>
#include <flowcore/core/utils/clock.hpp>

namespace FlowCore {

    std::atomic<uint64_t> EventFactory::global_event_id{0};

    Event EventFactory::createEvent(std::string&& type,
                                    std::vector<uint8_t>&& data,
                                    std::unordered_map<std::string, std::string>&& metadata) {
        const uint64_t ts = Clock::epoch_ms();
        const uint64_t seq = global_event_id.fetch_add(1, std::memory_order_relaxed);
        std::string id = "evt-" + std::to_string(ts) + "-" + std::to_string(seq);
        return Event(std::move(id), std::move(type), std::move(data), ts, std::move(metadata));
    }

    Event EventFactory::createFollowUp(const Event& parent,
                                       std::string&& type,
                                       std::vector<uint8_t>&& data,
                                       std::unordered_map<std::string, std::string>&& metadata) {
        for (const char* key : {"correlationId", "tenantId"}) {
            auto it = parent.metadata.find(key);
            if (it != parent.metadata.end()) {
                metadata.try_emplace(key, it->second);
            }
        }
        Event e = createEvent(std::move(type), std::move(data), std::move(metadata));
        e.cost = parent.cost;
        return e;
    }

    Event& EventFactory::withCostTracking(Event& event) {
        if (!event.cost) {
            event.cost = std::make_shared<CostContext>();
        }
        return event;
    }

} // namespace FlowCore
