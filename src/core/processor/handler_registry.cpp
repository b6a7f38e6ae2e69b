#include <flowcore/core/processor/handler_registry.hpp>
#include <flowcore/core/errors.hpp>

#include <algorithm>
#include <iterator>
#include <mutex>

namespace FlowCore {

TrackedHandlerPtr HandlerRegistry::track(const std::string& key, PipelineHandler handler) {
    auto tracked = std::make_shared<TrackedHandler>();
    tracked->id = "handler-" + std::to_string(next_id_.fetch_add(1, std::memory_order_relaxed));
    tracked->key = key;
    tracked->handler = std::move(handler);
    return tracked;
}

HandlerId HandlerRegistry::addExact(const std::string& event_type, PipelineHandler handler) {
    auto tracked = track(event_type, std::move(handler));
    std::unique_lock<std::shared_mutex> lock(mutex_);
    exact_[event_type].push_back(tracked);
    return tracked->id;
}

HandlerId HandlerRegistry::addWildcard(PipelineHandler handler) {
    auto tracked = track("*", std::move(handler));
    std::unique_lock<std::shared_mutex> lock(mutex_);
    wildcard_.push_back(tracked);
    return tracked->id;
}

HandlerId HandlerRegistry::addPattern(const std::string& pattern, PipelineHandler handler) {
    std::regex compiled;
    try {
        compiled = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw ConfigError("Invalid handler pattern '" + pattern + "': " + e.what());
    }

    auto tracked = track(pattern, std::move(handler));
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(patterns_.begin(), patterns_.end(),
                           [&](const auto& entry) { return entry.first == pattern; });
    if (it == patterns_.end()) {
        patterns_.push_back({pattern, PatternBucket{std::move(compiled), {}}});
        it = std::prev(patterns_.end());
    }
    it->second.handlers.push_back(tracked);
    return tracked->id;
}

std::vector<TrackedHandlerPtr> HandlerRegistry::resolve(const std::string& event_type,
                                                        uint64_t now_ms) const {
    std::vector<TrackedHandlerPtr> resolved;
    auto take = [&](const TrackedHandlerPtr& h) {
        if (!h->active.load(std::memory_order_acquire)) return;
        h->last_used_ms.store(now_ms, std::memory_order_relaxed);
        resolved.push_back(h);
    };

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = exact_.find(event_type);
    if (it != exact_.end()) {
        for (const auto& h : it->second) take(h);
    }
    for (const auto& h : wildcard_) take(h);
    for (const auto& [source, bucket] : patterns_) {
        if (std::regex_search(event_type, bucket.regex)) {
            for (const auto& h : bucket.handlers) take(h);
        }
    }
    return resolved;
}

bool HandlerRegistry::deactivate(const HandlerId& id) {
    auto match = [&](const TrackedHandlerPtr& h) {
        if (h->id != id) return false;
        h->active.store(false, std::memory_order_release);
        return true;
    };

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [type, handlers] : exact_) {
        for (const auto& h : handlers) {
            if (match(h)) return true;
        }
    }
    for (const auto& h : wildcard_) {
        if (match(h)) return true;
    }
    for (const auto& [source, bucket] : patterns_) {
        for (const auto& h : bucket.handlers) {
            if (match(h)) return true;
        }
    }
    return false;
}

size_t HandlerRegistry::sweep(uint64_t now_ms, std::chrono::milliseconds stale_threshold) {
    const auto threshold = static_cast<uint64_t>(stale_threshold.count());
    auto is_stale = [&](const TrackedHandlerPtr& h) {
        if (!h->active.load(std::memory_order_acquire)) return true;
        const uint64_t last = h->last_used_ms.load(std::memory_order_relaxed);
        return last != 0 && now_ms > last && now_ms - last > threshold;
    };

    size_t removed = 0;
    auto prune = [&](std::vector<TrackedHandlerPtr>& handlers) {
        auto first = std::remove_if(handlers.begin(), handlers.end(), is_stale);
        removed += static_cast<size_t>(std::distance(first, handlers.end()));
        handlers.erase(first, handlers.end());
    };

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = exact_.begin(); it != exact_.end();) {
        prune(it->second);
        it = it->second.empty() ? exact_.erase(it) : std::next(it);
    }
    prune(wildcard_);
    for (auto it = patterns_.begin(); it != patterns_.end();) {
        prune(it->second.handlers);
        it = it->second.handlers.empty() ? patterns_.erase(it) : std::next(it);
    }
    return removed;
}

void HandlerRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    exact_.clear();
    wildcard_.clear();
    patterns_.clear();
}

size_t HandlerRegistry::exactTypeCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return exact_.size();
}

size_t HandlerRegistry::wildcardCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return wildcard_.size();
}

size_t HandlerRegistry::patternCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return patterns_.size();
}

size_t HandlerRegistry::totalHandlers() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t total = wildcard_.size();
    for (const auto& [type, handlers] : exact_) total += handlers.size();
    for (const auto& [source, bucket] : patterns_) total += bucket.handlers.size();
    return total;
}

} // namespace FlowCore
