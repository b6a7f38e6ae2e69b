#include <flowcore/core/lifecycle/snapshot_persistor.hpp>

namespace FlowCore {

void InMemorySnapshotPersistor::save(const std::string& key, const StateBlob& blob) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_[key] = blob;
}

std::optional<StateBlob> InMemorySnapshotPersistor::load(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(key);
    if (it == snapshots_.end()) return std::nullopt;
    return it->second;
}

size_t InMemorySnapshotPersistor::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.size();
}

} // namespace FlowCore
