#pragma once

#include <flowcore/core/events/chain_tracker.hpp>
#include <flowcore/core/utils/cancellation.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace FlowCore {

/**
 * @brief Dispatch state of one top-level processEvent() call.
 *
 * Copied for every concurrent batch branch so sibling branches never see
 * each other's depth or chain.
 */
struct ProcessingContext {
    size_t depth = 0;
    EventChainTracker chain;
    uint64_t startTimeMs = 0;
    std::optional<std::string> correlationId;
    AbortSignal signal;
    bool failureLogged = false;

    explicit ProcessingContext(size_t chain_capacity) : chain(chain_capacity) {}
};

} // namespace FlowCore
