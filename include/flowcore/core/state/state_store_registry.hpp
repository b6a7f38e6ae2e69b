#pragma once

#include <flowcore/core/runtime/runtime.hpp>
#include <flowcore/core/state/state_store.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace FlowCore {

enum class StateStoreKind {
    CONCURRENT,
    SIMPLE
};

const char* toString(StateStoreKind kind);

/**
 * @class StateStoreRegistry
 * @brief Named state stores shared by the components of one Runtime.
 *
 * getOrCreate() returns the existing store for a name regardless of the
 * requested kind; the kind and options only apply on first creation.
 */
class StateStoreRegistry {
public:
    explicit StateStoreRegistry(Runtime& runtime);
    ~StateStoreRegistry() noexcept;

    StateStoreRegistry(const StateStoreRegistry&) = delete;
    StateStoreRegistry& operator=(const StateStoreRegistry&) = delete;

    std::shared_ptr<StateStore> getOrCreate(const std::string& name,
                                            StateStoreKind kind = StateStoreKind::CONCURRENT,
                                            const StateStoreOptions& options = {});

    /// @return true if a store was registered under @p name
    bool remove(const std::string& name);

    /// Clear and drop every registered store
    void cleanup();

    std::vector<std::string> names() const;

private:
    Runtime& runtime_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<StateStore>> stores_;
};

} // namespace FlowCore
