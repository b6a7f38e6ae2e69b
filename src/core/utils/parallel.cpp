#include <flowcore/core/utils/parallel.hpp>
#include <flowcore/core/errors.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace FlowCore {

std::vector<std::exception_ptr> runConcurrently(const std::vector<std::function<void()>>& tasks,
                                                size_t max_workers) {
    std::vector<std::exception_ptr> errors(tasks.size());
    if (tasks.empty()) return errors;

    if (max_workers == 0) {
        max_workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    const size_t worker_count = std::min(max_workers, tasks.size());

    std::atomic<size_t> next{0};
    auto work = [&]() {
        for (size_t i = next.fetch_add(1); i < tasks.size(); i = next.fetch_add(1)) {
            try {
                tasks[i]();
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }
    };

    std::vector<std::thread> helpers;
    helpers.reserve(worker_count - 1);
    for (size_t i = 1; i < worker_count; ++i) {
        helpers.emplace_back(work);
    }
    work();
    for (auto& t : helpers) {
        t.join();
    }
    return errors;
}

namespace {

struct DeadlineState {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::exception_ptr error;
};

constexpr std::chrono::milliseconds ABORT_POLL_INTERVAL{10};

} // namespace

void runWithDeadline(std::function<void()> operation, std::chrono::milliseconds timeout,
                     const AbortSignal& signal, WorkerGroup& workers, const std::string& what) {
    if (isAborted(signal)) {
        throw AbortedError(what + " aborted before start");
    }
    if (timeout.count() <= 0) {
        operation();
        return;
    }

    auto state = std::make_shared<DeadlineState>();
    workers.spawn([state, op = std::move(operation)]() {
        std::exception_ptr error;
        try {
            op();
        } catch (...) {
            error = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->error = error;
            state->done = true;
        }
        state->cv.notify_all();
    });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(state->mutex);
    while (!state->done) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw TimeoutError(what + " timed out after " + std::to_string(timeout.count()) + "ms");
        }
        if (isAborted(signal)) {
            throw AbortedError(what + " aborted");
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, ABORT_POLL_INTERVAL);
        state->cv.wait_for(lock, slice, [&state] { return state->done; });
    }

    if (state->error) {
        std::rethrow_exception(state->error);
    }
}

} // namespace FlowCore
