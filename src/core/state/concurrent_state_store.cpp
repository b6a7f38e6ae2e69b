#include <flowcore/core/state/concurrent_state_store.hpp>
#include <flowcore/core/errors.hpp>
#include <flowcore/core/metrics/registry.hpp>
#include <spdlog/spdlog.h>

#include <iterator>
#include <vector>

namespace FlowCore {

StateStoreOptions StateStoreOptions::fromApp(const AppConfig::StateStoreConfig& app) {
    StateStoreOptions opts;
    opts.maxNamespaces = app.maxNamespaces;
    opts.maxKeysPerNamespace = app.maxKeysPerNamespace;
    opts.gcInterval = std::chrono::milliseconds(app.gcIntervalMs);
    return opts;
}

ConcurrentStateStore::ConcurrentStateStore(Runtime& runtime, StateStoreOptions options)
    : runtime_(runtime), options_(options) {
    if (options_.gcInterval.count() > 0) {
        gc_task_ = runtime_.timers().scheduleEvery(options_.gcInterval, [this] {
            size_t removed = collectGarbage();
            if (removed > 0) {
                spdlog::debug("[ConcurrentStateStore] GC removed {} lock entries", removed);
            }
        });
    }
    spdlog::info("[ConcurrentStateStore] initialized (maxNamespaces={}, maxKeysPerNamespace={}, gc={}ms)",
                 options_.maxNamespaces, options_.maxKeysPerNamespace, options_.gcInterval.count());
}

ConcurrentStateStore::~ConcurrentStateStore() noexcept {
    spdlog::info("[DESTRUCTOR] ConcurrentStateStore being destroyed...");
    gc_task_.cancelAndWait();
}

// ============================================================================
// Lock table
// ============================================================================

ConcurrentStateStore::SlotPtr ConcurrentStateStore::findSlot(const std::string& ns) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = slots_.find(ns);
    return it == slots_.end() ? nullptr : it->second;
}

ConcurrentStateStore::SlotPtr ConcurrentStateStore::acquireSlot(const std::string& ns) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& slot = slots_[ns];
    if (!slot) {
        slot = std::make_shared<NamespaceSlot>();
    }
    return slot;
}

void ConcurrentStateStore::releaseIfEmpty(const std::string& ns, SlotPtr slot) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = slots_.find(ns);
    // Two owners: the table and our local copy
    if (it == slots_.end() || it->second != slot || slot.use_count() != 2) return;
    std::lock_guard<std::mutex> slot_lock(slot->mutex);
    if (slot->entries.empty()) {
        slots_.erase(it);
    }
}

void ConcurrentStateStore::reserveNamespace(const std::string& ns) {
    size_t current = live_namespaces_.load(std::memory_order_relaxed);
    do {
        if (current >= options_.maxNamespaces) {
            throw StateCapacityError("Maximum number of namespaces (" +
                                     std::to_string(options_.maxNamespaces) +
                                     ") reached, cannot create " + ns);
        }
    } while (!live_namespaces_.compare_exchange_weak(current, current + 1,
                                                     std::memory_order_acq_rel));
}

size_t ConcurrentStateStore::collectGarbage() {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        for (auto it = slots_.begin(); it != slots_.end();) {
            // use_count 1: only the table holds it, so nobody can be inside its lock
            if (it->second.use_count() == 1 && it->second->entries.empty()) {
                it = slots_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    runtime_.metrics().getMetrics(MetricNames::STATE_STORE)
        .total_gc_runs.fetch_add(1, std::memory_order_relaxed);
    return removed;
}

size_t ConcurrentStateStore::lockTableSize() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return slots_.size();
}

// ============================================================================
// Single-namespace operations
// ============================================================================

std::optional<StateValue> ConcurrentStateStore::get(const std::string& ns, const std::string& key) {
    auto slot = findSlot(ns);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mutex);
    auto it = slot->entries.find(key);
    if (it == slot->entries.end()) return std::nullopt;
    return it->second;
}

void ConcurrentStateStore::set(const std::string& ns, const std::string& key, StateValue value) {
    auto slot = acquireSlot(ns);
    try {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto it = slot->entries.find(key);
        if (it != slot->entries.end()) {
            it->second = std::move(value);
            return;
        }
        if (slot->entries.size() >= options_.maxKeysPerNamespace) {
            throw StateCapacityError("Maximum keys per namespace (" +
                                     std::to_string(options_.maxKeysPerNamespace) +
                                     ") reached in " + ns);
        }
        if (slot->entries.empty()) {
            reserveNamespace(ns);
        }
        slot->entries.emplace(key, std::move(value));
    } catch (const StateCapacityError& e) {
        runtime_.metrics().getMetrics(MetricNames::STATE_STORE)
            .total_capacity_rejections.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[ConcurrentStateStore] {}", e.what());
        releaseIfEmpty(ns, std::move(slot));
        throw;
    }
}

bool ConcurrentStateStore::erase(const std::string& ns, const std::string& key) {
    auto slot = findSlot(ns);
    if (!slot) return false;
    bool emptied = false;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->entries.erase(key) == 0) return false;
        if (slot->entries.empty()) {
            live_namespaces_.fetch_sub(1, std::memory_order_acq_rel);
            emptied = true;
        }
    }
    if (emptied) {
        releaseIfEmpty(ns, std::move(slot));
    }
    return true;
}

bool ConcurrentStateStore::has(const std::string& ns, const std::string& key) {
    auto slot = findSlot(ns);
    if (!slot) return false;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->entries.count(key) > 0;
}

std::vector<std::string> ConcurrentStateStore::keys(const std::string& ns) {
    std::vector<std::string> out;
    auto slot = findSlot(ns);
    if (!slot) return out;
    std::lock_guard<std::mutex> lock(slot->mutex);
    out.reserve(slot->entries.size());
    for (const auto& [key, value] : slot->entries) {
        out.push_back(key);
    }
    return out;
}

size_t ConcurrentStateStore::size(const std::string& ns) {
    auto slot = findSlot(ns);
    if (!slot) return 0;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->entries.size();
}

void ConcurrentStateStore::clear(const std::string& ns) {
    auto slot = findSlot(ns);
    if (!slot) return;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->entries.empty()) return;
        slot->entries.clear();
        live_namespaces_.fetch_sub(1, std::memory_order_acq_rel);
    }
    releaseIfEmpty(ns, std::move(slot));
}

// ============================================================================
// Whole-store operations: map_mutex_, then every namespace in name order
// ============================================================================

size_t ConcurrentStateStore::size() {
    std::lock_guard<std::mutex> lock(map_mutex_);
    std::vector<std::unique_lock<std::mutex>> held;
    held.reserve(slots_.size());
    size_t total = 0;
    for (auto& [ns, slot] : slots_) {
        held.emplace_back(slot->mutex);
        total += slot->entries.size();
    }
    return total;
}

void ConcurrentStateStore::clear() {
    std::lock_guard<std::mutex> lock(map_mutex_);
    {
        std::vector<std::unique_lock<std::mutex>> held;
        held.reserve(slots_.size());
        for (auto& [ns, slot] : slots_) {
            held.emplace_back(slot->mutex);
            slot->entries.clear();
        }
        live_namespaces_.store(0, std::memory_order_release);
    }
    for (auto it = slots_.begin(); it != slots_.end();) {
        it = it->second.use_count() == 1 ? slots_.erase(it) : std::next(it);
    }
    spdlog::info("[ConcurrentStateStore] cleared");
}

StateStoreStats ConcurrentStateStore::getStats() {
    std::lock_guard<std::mutex> lock(map_mutex_);
    std::vector<std::unique_lock<std::mutex>> held;
    held.reserve(slots_.size());

    StateStoreStats stats;
    stats.lockTableSize = slots_.size();
    for (auto& [ns, slot] : slots_) {
        held.emplace_back(slot->mutex);
        if (slot->entries.empty()) continue;
        NamespaceStats ns_stats;
        ns_stats.keyCount = slot->entries.size();
        ns_stats.estimatedSize = estimateNamespaceSize(ns, slot->entries);
        stats.namespaceCount += 1;
        stats.totalKeys += ns_stats.keyCount;
        stats.memoryUsage += ns_stats.estimatedSize;
        stats.namespaces.emplace(ns, ns_stats);
    }
    return stats;
}

} // namespace FlowCore
