// ============================================================================
// CLOCK HELPERS

#pragma once

#include <chrono>
#include <cstdint>

namespace FlowCore {

class Clock {
public:
    // Monotonic milliseconds, for durations and deadlines
    static inline uint64_t now_ms() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Wall-clock milliseconds since epoch, for timestamps and ids
    static inline uint64_t epoch_ms() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }
};

} // namespace FlowCore
