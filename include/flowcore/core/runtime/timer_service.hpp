#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace FlowCore {

class TimerService;

/**
 * @class TaskHandle
 * @brief Cancellable reference to a task armed on a TimerService.
 *
 * Copies share the same task. A default-constructed handle refers to nothing.
 */
class TaskHandle {
public:
    TaskHandle() = default;

    /// Prevent future runs. Does not wait for a run already in progress.
    void cancel();

    /// Cancel, then block until any in-progress run has returned.
    /// Called from the timer thread itself it behaves like cancel().
    void cancelAndWait();

    /// Armed, not cancelled, and (for one-shot tasks) not yet fired
    bool isActive() const;

    /// Removed from the timer queue and not running; the callback will not be entered again
    bool isFinished() const;

    explicit operator bool() const { return static_cast<bool>(state_); }

private:
    friend class TimerService;

    struct State {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> finished{false};
        std::mutex run_mutex;
        std::thread::id timer_thread;
    };

    explicit TaskHandle(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

/**
 * @class TimerService
 * @brief Single background thread running delayed and periodic tasks.
 *
 * Owned by the Runtime. Components keep the TaskHandle of every task they
 * arm and cancel it on teardown. Tasks run one at a time in due order; an
 * exception escaping a task is logged and does not stop the service.
 */
class TimerService {
public:
    explicit TimerService(std::string name = "timers");
    ~TimerService() noexcept;

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    TaskHandle schedule(std::chrono::milliseconds delay, std::function<void()> task);
    TaskHandle scheduleEvery(std::chrono::milliseconds interval, std::function<void()> task);

    /// Stop the thread; pending tasks are discarded
    void shutdown();

    size_t pendingTasks() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct Entry {
        TimePoint due;
        uint64_t seq = 0;
        std::chrono::milliseconds interval{0};
        bool periodic = false;
        std::function<void()> task;
        std::shared_ptr<TaskHandle::State> state;
    };

    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.due != b.due) return a.due > b.due;
            return a.seq > b.seq;
        }
    };

    TaskHandle arm(std::chrono::milliseconds delay, std::chrono::milliseconds interval,
                   bool periodic, std::function<void()> task);
    void loop();
    void runEntry(Entry& entry);

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
    uint64_t next_seq_ = 0;
    bool running_ = true;
    std::thread worker_;
};

} // namespace FlowCore
