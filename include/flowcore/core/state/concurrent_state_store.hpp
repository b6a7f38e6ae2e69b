#pragma once

#include <flowcore/core/runtime/runtime.hpp>
#include <flowcore/core/runtime/timer_service.hpp>
#include <flowcore/core/state/state_store.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace FlowCore {

/**
 * @class ConcurrentStateStore
 * @brief StateStore with one mutex per namespace.
 *
 * Operations on different namespaces run in parallel. The namespace table
 * itself is guarded by a short structural lock, always taken before any
 * namespace lock. Whole-store operations lock every namespace in name order.
 *
 * Empty namespace slots left behind by concurrent callers are reclaimed by
 * collectGarbage(), which also runs every gcInterval on the runtime timer.
 */
class ConcurrentStateStore : public StateStore {
public:
    explicit ConcurrentStateStore(Runtime& runtime, StateStoreOptions options = {});
    ~ConcurrentStateStore() noexcept override;

    ConcurrentStateStore(const ConcurrentStateStore&) = delete;
    ConcurrentStateStore& operator=(const ConcurrentStateStore&) = delete;

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

    /// @return number of unused lock-table entries removed
    size_t collectGarbage();

    size_t lockTableSize() const;

    const char* name() const override { return "ConcurrentStateStore"; }

private:
    struct NamespaceSlot {
        std::mutex mutex;
        std::map<std::string, StateValue> entries;
    };
    using SlotPtr = std::shared_ptr<NamespaceSlot>;

    SlotPtr findSlot(const std::string& ns) const;
    SlotPtr acquireSlot(const std::string& ns);

    /// Drop @p slot from the table if it is empty and nobody else holds it
    void releaseIfEmpty(const std::string& ns, SlotPtr slot);

    void reserveNamespace(const std::string& ns);

    Runtime& runtime_;
    StateStoreOptions options_;
    mutable std::mutex map_mutex_;
    std::map<std::string, SlotPtr> slots_;
    std::atomic<size_t> live_namespaces_{0};
    TaskHandle gc_task_;
};

} // namespace FlowCore
