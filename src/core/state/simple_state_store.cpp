#include <flowcore/core/state/simple_state_store.hpp>
#include <flowcore/core/errors.hpp>
#include <spdlog/spdlog.h>

namespace FlowCore {

SimpleStateStore::SimpleStateStore(StateStoreOptions options) : options_(options) {
    spdlog::debug("[SimpleStateStore] initialized (maxNamespaces={}, maxKeysPerNamespace={})",
                  options_.maxNamespaces, options_.maxKeysPerNamespace);
}

std::optional<StateValue> SimpleStateStore::get(const std::string& ns, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ns_it = data_.find(ns);
    if (ns_it == data_.end()) return std::nullopt;
    auto it = ns_it->second.find(key);
    if (it == ns_it->second.end()) return std::nullopt;
    return it->second;
}

void SimpleStateStore::set(const std::string& ns, const std::string& key, StateValue value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ns_it = data_.find(ns);
    if (ns_it == data_.end()) {
        if (data_.size() >= options_.maxNamespaces) {
            spdlog::warn("[SimpleStateStore] namespace ceiling reached, rejecting {}", ns);
            throw StateCapacityError("Maximum number of namespaces (" +
                                     std::to_string(options_.maxNamespaces) +
                                     ") reached, cannot create " + ns);
        }
        data_[ns].emplace(key, std::move(value));
        return;
    }

    auto& entries = ns_it->second;
    auto it = entries.find(key);
    if (it != entries.end()) {
        it->second = std::move(value);
        return;
    }
    if (entries.size() >= options_.maxKeysPerNamespace) {
        spdlog::warn("[SimpleStateStore] key ceiling reached in {}", ns);
        throw StateCapacityError("Maximum keys per namespace (" +
                                 std::to_string(options_.maxKeysPerNamespace) +
                                 ") reached in " + ns);
    }
    entries.emplace(key, std::move(value));
}

bool SimpleStateStore::erase(const std::string& ns, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ns_it = data_.find(ns);
    if (ns_it == data_.end()) return false;
    if (ns_it->second.erase(key) == 0) return false;
    if (ns_it->second.empty()) {
        data_.erase(ns_it);
    }
    return true;
}

bool SimpleStateStore::has(const std::string& ns, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ns_it = data_.find(ns);
    return ns_it != data_.end() && ns_it->second.count(key) > 0;
}

std::vector<std::string> SimpleStateStore::keys(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    auto ns_it = data_.find(ns);
    if (ns_it == data_.end()) return out;
    for (const auto& [key, value] : ns_it->second) {
        out.push_back(key);
    }
    return out;
}

size_t SimpleStateStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [ns, entries] : data_) total += entries.size();
    return total;
}

size_t SimpleStateStore::size(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ns_it = data_.find(ns);
    return ns_it == data_.end() ? 0 : ns_it->second.size();
}

void SimpleStateStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

void SimpleStateStore::clear(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(ns);
}

StateStoreStats SimpleStateStore::getStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    StateStoreStats stats;
    for (const auto& [ns, entries] : data_) {
        NamespaceStats ns_stats;
        ns_stats.keyCount = entries.size();
        ns_stats.estimatedSize = estimateNamespaceSize(ns, entries);
        stats.namespaceCount += 1;
        stats.totalKeys += ns_stats.keyCount;
        stats.memoryUsage += ns_stats.estimatedSize;
        stats.namespaces.emplace(ns, ns_stats);
    }
    return stats;
}

} // namespace FlowCore
