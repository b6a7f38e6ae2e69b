#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace FlowCore {

/**
 * @class WorkerGroup
 * @brief Owner of the background threads a component starts.
 *
 * Every thread started through spawn() is joined by waitIdle() or by the
 * destructor, so no thread outlives the component that holds the group.
 * Finished threads are reaped on the next spawn().
 */
class WorkerGroup {
public:
    explicit WorkerGroup(std::string name = "workers");
    ~WorkerGroup() noexcept;

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    /// An exception escaping @p task is logged
    void spawn(std::function<void()> task);

    /// Block until every spawned thread has returned
    void waitIdle();

    /// Threads started and not yet joined (finished ones included until reaped)
    size_t size() const;

    const std::string& name() const { return name_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    static void join(Worker& worker);

    std::string name_;
    mutable std::mutex mutex_;
    std::vector<Worker> workers_;
};

/**
 * @class CallGate
 * @brief Counts calls in flight into a component and lets its owner drain them.
 *
 * Closures that may run on another thread hold the gate by shared_ptr and
 * enter() it before touching the component. Once closeAndWait() has
 * returned, no call is inside and none will be admitted.
 */
class CallGate {
public:
    CallGate() = default;
    CallGate(const CallGate&) = delete;
    CallGate& operator=(const CallGate&) = delete;

    /// @return false once the gate is closed
    bool enter();
    void leave();

    /// Refuse new calls, then wait for the ones inside. Must not be called from inside a call.
    void closeAndWait();

    bool isClosed() const;
    size_t inFlight() const;

    /// RAII enter/leave
    class Pass {
    public:
        explicit Pass(CallGate& gate) : gate_(gate), admitted_(gate.enter()) {}
        ~Pass() {
            if (admitted_) gate_.leave();
        }
        Pass(const Pass&) = delete;
        Pass& operator=(const Pass&) = delete;

        explicit operator bool() const { return admitted_; }

    private:
        CallGate& gate_;
        bool admitted_;
    };

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
    size_t in_flight_ = 0;
};

} // namespace FlowCore
