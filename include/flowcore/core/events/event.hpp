#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace FlowCore {

/**
 * @brief Per-event-flow cost counters shared by every copy of an event.
 *
 * Middlewares bump these so the caller can see how much a delivery cost.
 */
struct CostContext {
    std::atomic<uint32_t> retries{0};
    std::atomic<uint32_t> concurrencyDrops{0};
};

using CostContextPtr = std::shared_ptr<CostContext>;

struct Event {
    std::string id;
    std::string type;
    std::vector<uint8_t> data;
    uint64_t timestamp = 0;   // epoch ms
    std::unordered_map<std::string, std::string> metadata;
    CostContextPtr cost;      // optional

    Event() = default;
    Event(std::string id, std::string type, std::vector<uint8_t> data, uint64_t timestamp,
          std::unordered_map<std::string, std::string> metadata = {})
        : id(std::move(id)),
          type(std::move(type)),
          data(std::move(data)),
          timestamp(timestamp),
          metadata(std::move(metadata)) {}

    std::optional<std::string> metadataValue(const std::string& key) const {
        auto it = metadata.find(key);
        if (it == metadata.end()) return std::nullopt;
        return it->second;
    }

    std::string metadataOr(const std::string& key, const std::string& fallback) const {
        auto it = metadata.find(key);
        return it == metadata.end() ? fallback : it->second;
    }

    std::optional<std::string> correlationId() const { return metadataValue("correlationId"); }
};

/// A handler either finishes the flow (nullopt) or asks the processor to re-dispatch a follow-up event
using HandlerResult = std::optional<Event>;

inline HandlerResult reEmit(Event follow_up) {
    return HandlerResult(std::move(follow_up));
}

} // namespace FlowCore
