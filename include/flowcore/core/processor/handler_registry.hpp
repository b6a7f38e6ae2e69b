#pragma once

#include <flowcore/core/processor/middleware.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <regex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace FlowCore {

using HandlerId = std::string;

struct TrackedHandler {
    HandlerId id;
    std::string key;              // event type, "*" or the pattern source
    PipelineHandler handler;      // already wrapped by handler middlewares
    std::atomic<bool> active{true};
    std::atomic<uint64_t> last_used_ms{0};   // 0 = never resolved
};

using TrackedHandlerPtr = std::shared_ptr<TrackedHandler>;

/**
 * @class HandlerRegistry
 * @brief Exact, wildcard and pattern handler indices behind one shared_mutex.
 *
 * resolve() returns a copy of the matching handlers, so registrations and
 * sweeps running meanwhile never invalidate a dispatch in progress.
 */
class HandlerRegistry {
public:
    HandlerId addExact(const std::string& event_type, PipelineHandler handler);
    HandlerId addWildcard(PipelineHandler handler);

    /// @throws ConfigError when @p pattern is not a valid ECMAScript regex
    HandlerId addPattern(const std::string& pattern, PipelineHandler handler);

    /// Exact handlers, then wildcard handlers, then matching pattern handlers
    std::vector<TrackedHandlerPtr> resolve(const std::string& event_type, uint64_t now_ms) const;

    bool deactivate(const HandlerId& id);

    /**
     * @brief Drop inactive handlers and handlers unused for longer than @p stale_threshold.
     * @return number of handlers removed
     */
    size_t sweep(uint64_t now_ms, std::chrono::milliseconds stale_threshold);

    void clear();

    size_t exactTypeCount() const;
    size_t wildcardCount() const;
    size_t patternCount() const;
    size_t totalHandlers() const;

private:
    struct PatternBucket {
        std::regex regex;
        std::vector<TrackedHandlerPtr> handlers;
    };

    TrackedHandlerPtr track(const std::string& key, PipelineHandler handler);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::vector<TrackedHandlerPtr>> exact_;
    std::vector<TrackedHandlerPtr> wildcard_;
    std::vector<std::pair<std::string, PatternBucket>> patterns_;   // registration order
    std::atomic<uint64_t> next_id_{1};
};

} // namespace FlowCore
