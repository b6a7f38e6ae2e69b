#include <flowcore/core/runtime/timer_service.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace FlowCore {

// ============================================================================
// TaskHandle
// ============================================================================

void TaskHandle::cancel() {
    if (state_) {
        state_->cancelled.store(true, std::memory_order_release);
    }
}

void TaskHandle::cancelAndWait() {
    if (!state_) return;
    cancel();
    if (std::this_thread::get_id() == state_->timer_thread) {
        return;
    }
    // The timer thread holds run_mutex for the whole run
    std::lock_guard<std::mutex> wait(state_->run_mutex);
}

bool TaskHandle::isActive() const {
    return state_ &&
           !state_->cancelled.load(std::memory_order_acquire) &&
           !state_->finished.load(std::memory_order_acquire);
}

bool TaskHandle::isFinished() const {
    return !state_ || state_->finished.load(std::memory_order_acquire);
}

// ============================================================================
// TimerService
// ============================================================================

TimerService::TimerService(std::string name) : name_(std::move(name)) {
    worker_ = std::thread([this] { loop(); });
    spdlog::debug("[TimerService:{}] started", name_);
}

TimerService::~TimerService() noexcept {
    spdlog::info("[DESTRUCTOR] TimerService {} being destroyed...", name_);
    shutdown();
}

void TimerService::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        while (!queue_.empty()) {
            queue_.top().state->finished.store(true, std::memory_order_release);
            queue_.pop();
        }
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
    spdlog::debug("[TimerService:{}] stopped", name_);
}

TaskHandle TimerService::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    return arm(delay, std::chrono::milliseconds(0), false, std::move(task));
}

TaskHandle TimerService::scheduleEvery(std::chrono::milliseconds interval,
                                       std::function<void()> task) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("TimerService: periodic interval must be positive");
    }
    return arm(interval, interval, true, std::move(task));
}

TaskHandle TimerService::arm(std::chrono::milliseconds delay, std::chrono::milliseconds interval,
                             bool periodic, std::function<void()> task) {
    auto state = std::make_shared<TaskHandle::State>();
    state->timer_thread = worker_.get_id();

    Entry entry;
    entry.due = std::chrono::steady_clock::now() + std::max(delay, std::chrono::milliseconds(0));
    entry.interval = interval;
    entry.periodic = periodic;
    entry.task = std::move(task);
    entry.state = state;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            state->finished.store(true, std::memory_order_release);
            spdlog::warn("[TimerService:{}] schedule after shutdown ignored", name_);
            return TaskHandle(state);
        }
        entry.seq = next_seq_++;
        queue_.push(std::move(entry));
    }
    cv_.notify_all();
    return TaskHandle(state);
}

size_t TimerService::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TimerService::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (queue_.empty()) {
            cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            continue;
        }

        auto due = queue_.top().due;
        if (std::chrono::steady_clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        Entry entry = queue_.top();
        queue_.pop();
        if (entry.state->cancelled.load(std::memory_order_acquire)) {
            entry.state->finished.store(true, std::memory_order_release);
            continue;
        }

        lock.unlock();
        runEntry(entry);
        lock.lock();

        if (entry.periodic && running_ &&
            !entry.state->cancelled.load(std::memory_order_acquire)) {
            entry.due = std::chrono::steady_clock::now() + entry.interval;
            entry.seq = next_seq_++;
            queue_.push(std::move(entry));
        } else {
            entry.state->finished.store(true, std::memory_order_release);
        }
    }
}

void TimerService::runEntry(Entry& entry) {
    std::lock_guard<std::mutex> run(entry.state->run_mutex);
    if (entry.state->cancelled.load(std::memory_order_acquire)) {
        return;
    }
    try {
        entry.task();
    } catch (const std::exception& e) {
        spdlog::error("[TimerService:{}] task threw: {}", name_, e.what());
    }
}

} // namespace FlowCore
