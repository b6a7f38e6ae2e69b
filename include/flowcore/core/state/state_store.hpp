#pragma once

#include <flowcore/core/config/app_config.hpp>
#include <flowcore/core/state/state_value.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace FlowCore {

struct StateStoreOptions {
    size_t maxNamespaces = 1000;
    size_t maxKeysPerNamespace = 10000;
    std::chrono::milliseconds gcInterval{300000};   // 0 = no periodic collection

    static StateStoreOptions fromApp(const AppConfig::StateStoreConfig& app);
};

struct NamespaceStats {
    size_t keyCount = 0;
    size_t estimatedSize = 0;
};

struct StateStoreStats {
    size_t namespaceCount = 0;
    size_t totalKeys = 0;
    size_t memoryUsage = 0;    // estimated bytes
    std::map<std::string, NamespaceStats> namespaces;
    size_t lockTableSize = 0;  // 0 for stores without per-namespace locks
};

/**
 * @class StateStore
 * @brief Namespaced key/value store with hard capacity ceilings.
 *
 * Creating a namespace beyond maxNamespaces, or a key beyond
 * maxKeysPerNamespace, throws StateCapacityError and writes nothing.
 * Overwriting an existing key is always allowed. Erasing the last key of a
 * namespace removes the namespace.
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual std::optional<StateValue> get(const std::string& ns, const std::string& key) = 0;
    virtual void set(const std::string& ns, const std::string& key, StateValue value) = 0;
    virtual bool erase(const std::string& ns, const std::string& key) = 0;
    virtual bool has(const std::string& ns, const std::string& key) = 0;

    /// Keys of @p ns in sorted order; empty for an unknown namespace
    virtual std::vector<std::string> keys(const std::string& ns) = 0;

    /// Total key count across all namespaces
    virtual size_t size() = 0;
    virtual size_t size(const std::string& ns) = 0;

    virtual void clear() = 0;
    virtual void clear(const std::string& ns) = 0;

    virtual StateStoreStats getStats() = 0;

    virtual const char* name() const = 0;
};

} // namespace FlowCore
