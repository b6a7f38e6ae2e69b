#pragma once

#include <flowcore/core/state/state_value.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace FlowCore {

/**
 * @class SnapshotPersistor
 * @brief Opaque key/blob store used by pause and resume.
 */
class SnapshotPersistor {
public:
    virtual ~SnapshotPersistor() = default;

    virtual void save(const std::string& key, const StateBlob& blob) = 0;
    virtual std::optional<StateBlob> load(const std::string& key) = 0;
};

using SnapshotPersistorPtr = std::shared_ptr<SnapshotPersistor>;

class InMemorySnapshotPersistor : public SnapshotPersistor {
public:
    void save(const std::string& key, const StateBlob& blob) override;
    std::optional<StateBlob> load(const std::string& key) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, StateBlob> snapshots_;
};

} // namespace FlowCore
