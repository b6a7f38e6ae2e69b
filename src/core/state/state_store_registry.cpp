#include <flowcore/core/state/state_store_registry.hpp>
#include <flowcore/core/state/concurrent_state_store.hpp>
#include <flowcore/core/state/simple_state_store.hpp>
#include <spdlog/spdlog.h>

namespace FlowCore {

const char* toString(StateStoreKind kind) {
    switch (kind) {
        case StateStoreKind::CONCURRENT: return "concurrent";
        case StateStoreKind::SIMPLE: return "simple";
        default: return "unknown";
    }
}

StateStoreRegistry::StateStoreRegistry(Runtime& runtime) : runtime_(runtime) {}

StateStoreRegistry::~StateStoreRegistry() noexcept {
    spdlog::info("[DESTRUCTOR] StateStoreRegistry being destroyed...");
    std::lock_guard<std::mutex> lock(mutex_);
    stores_.clear();
}

std::shared_ptr<StateStore> StateStoreRegistry::getOrCreate(const std::string& name,
                                                           StateStoreKind kind,
                                                           const StateStoreOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stores_.find(name);
    if (it != stores_.end()) {
        return it->second;
    }

    std::shared_ptr<StateStore> store;
    if (kind == StateStoreKind::SIMPLE) {
        store = std::make_shared<SimpleStateStore>(options);
    } else {
        store = std::make_shared<ConcurrentStateStore>(runtime_, options);
    }
    stores_.emplace(name, store);
    spdlog::info("[StateStoreRegistry] created {} store '{}'", toString(kind), name);
    return store;
}

bool StateStoreRegistry::remove(const std::string& name) {
    std::shared_ptr<StateStore> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stores_.find(name);
        if (it == stores_.end()) return false;
        removed = std::move(it->second);
        stores_.erase(it);
    }
    spdlog::info("[StateStoreRegistry] removed store '{}'", name);
    return true;
}

void StateStoreRegistry::cleanup() {
    std::map<std::string, std::shared_ptr<StateStore>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(stores_);
    }
    for (auto& [name, store] : drained) {
        store->clear();
    }
    spdlog::info("[StateStoreRegistry] cleaned up {} stores", drained.size());
}

std::vector<std::string> StateStoreRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(stores_.size());
    for (const auto& [name, store] : stores_) {
        out.push_back(name);
    }
    return out;
}

} // namespace FlowCore
