#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <vector>

#include <flowcore/core/utils/cancellation.hpp>
#include <flowcore/core/utils/worker_group.hpp>

namespace FlowCore {

/**
 * @brief Run every task concurrently and wait for all of them.
 *
 * Tasks are pulled from a shared index by at most @p max_workers short-lived
 * threads (0 means hardware concurrency). The calling thread is one of the
 * workers. Nothing is rethrown: the result has one slot per task, holding
 * the exception it raised or nullptr.
 */
std::vector<std::exception_ptr> runConcurrently(const std::vector<std::function<void()>>& tasks,
                                                size_t max_workers = 0);

/**
 * @brief Race @p operation against a timeout on a thread owned by @p workers.
 *
 * Returns once the operation completes, rethrowing what it threw. Throws
 * TimeoutError when @p timeout elapses first and AbortedError when @p signal
 * fires first; in both cases the operation keeps running and its outcome is
 * discarded. The thread is joined by @p workers, so whatever owns the group
 * outlives the operation. A non-positive timeout runs the operation inline
 * with no race.
 */
void runWithDeadline(std::function<void()> operation, std::chrono::milliseconds timeout,
                     const AbortSignal& signal, WorkerGroup& workers,
                     const std::string& what = "Operation");

} // namespace FlowCore
