#include <flowcore/core/utils/worker_group.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iterator>

namespace FlowCore {

// ============================================================================
// WorkerGroup
// ============================================================================

WorkerGroup::WorkerGroup(std::string name) : name_(std::move(name)) {}

WorkerGroup::~WorkerGroup() noexcept {
    waitIdle();
}

void WorkerGroup::join(Worker& worker) {
    if (!worker.thread.joinable()) return;
    if (worker.thread.get_id() == std::this_thread::get_id()) {
        // Last owner released from inside one of its own threads
        spdlog::warn("[WorkerGroup] worker released its own group; detaching it");
        worker.thread.detach();
        return;
    }
    worker.thread.join();
}

void WorkerGroup::spawn(std::function<void()> task) {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto done = std::partition(workers_.begin(), workers_.end(),
                                   [](const Worker& w) { return !w.finished->load(); });
        std::move(done, workers_.end(), std::back_inserter(finished));
        workers_.erase(done, workers_.end());

        auto flag = std::make_shared<std::atomic<bool>>(false);
        std::thread thread([task = std::move(task), flag, group = name_]() {
            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("[WorkerGroup] {} worker failed: {}", group, e.what());
            } catch (...) {
                spdlog::error("[WorkerGroup] {} worker failed: unknown exception", group);
            }
            flag->store(true);
        });
        workers_.push_back(Worker{std::move(thread), std::move(flag)});
    }
    for (auto& worker : finished) {
        join(worker);
    }
}

void WorkerGroup::waitIdle() {
    // New workers may be spawned while we join; loop until none are left
    for (;;) {
        std::vector<Worker> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending.swap(workers_);
        }
        if (pending.empty()) return;
        for (auto& worker : pending) {
            join(worker);
        }
    }
}

size_t WorkerGroup::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

// ============================================================================
// CallGate
// ============================================================================

bool CallGate::enter() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    ++in_flight_;
    return true;
}

void CallGate::leave() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ > 0 && --in_flight_ == 0) {
        cv_.notify_all();
    }
}

void CallGate::closeAndWait() {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.wait(lock, [this] { return in_flight_ == 0; });
}

bool CallGate::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t CallGate::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

} // namespace FlowCore
