#pragma once

#include <flowcore/core/state/state_store.hpp>

#include <map>
#include <mutex>
#include <string>

namespace FlowCore {

/**
 * @class SimpleStateStore
 * @brief StateStore behind a single mutex. Same ceilings, no lock table, no GC task.
 */
class SimpleStateStore : public StateStore {
public:
    explicit SimpleStateStore(StateStoreOptions options = {});

    std::optional<StateValue> get(const std::string& ns, const std::string& key) override;
    void set(const std::string& ns, const std::string& key, StateValue value) override;
    bool erase(const std::string& ns, const std::string& key) override;
    bool has(const std::string& ns, const std::string& key) override;
    std::vector<std::string> keys(const std::string& ns) override;
    size_t size() override;
    size_t size(const std::string& ns) override;
    void clear() override;
    void clear(const std::string& ns) override;
    StateStoreStats getStats() override;

    const char* name() const override { return "SimpleStateStore"; }

private:
    StateStoreOptions options_;
    std::mutex mutex_;
    std::map<std::string, std::map<std::string, StateValue>> data_;
};

} // namespace FlowCore
