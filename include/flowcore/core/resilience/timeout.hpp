#pragma once

#include <flowcore/core/processor/middleware.hpp>
#include <flowcore/core/utils/worker_group.hpp>

#include <chrono>
#include <memory>

namespace FlowCore {

/**
 * @brief Pipeline middleware bounding each handler call to @p timeout.
 *
 * A call that does not finish in time raises TimeoutError (TIMEOUT_EXCEEDED);
 * it keeps running on a thread of @p workers and its result is discarded.
 * Without @p workers the middleware owns a group, joined when the last copy
 * of the middleware is destroyed.
 */
Middleware withTimeout(std::chrono::milliseconds timeout,
                       std::shared_ptr<WorkerGroup> workers = nullptr);

} // namespace FlowCore
