/**
 * @file dispatcher.hpp
 * @brief ComputeDispatcher: asynchronous front-end over IWorkerClient.
 *
 * Every call runs on the shared I/O pool and resolves to a Result; worker
 * exceptions are converted into DispatchFailure errors so one misbehaving
 * worker never escapes into the orchestrator's control flow.
 */

#pragma once

#include "core/result.hpp"
#include "dispatch/worker_client.hpp"
#include "executor/thread_pool.hpp"

#include <chrono>
#include <future>

namespace verified_compute {

/**
 * @brief A queued submit() call.
 *
 * `started` becomes ready when a pool thread picks the call up, so a
 * caller can time the RPC itself rather than its wait in the queue.
 */
struct SubmitCall {
    std::future<Result<JobHandle>> handle;
    std::future<std::chrono::steady_clock::time_point> started;
};

class ComputeDispatcher {
public:
    ComputeDispatcher(IWorkerClient& client, ThreadPool& pool);

    /// Fire one submit() call; `handle` resolves to the worker's job handle.
    SubmitCall submit(DispatchRequest request);

    /// Fire one status() call.
    std::future<Result<WorkerStatusReport>> query_status(JobHandle handle);

    /// Blocking result download.
    Result<Bytes> fetch_result(const ResultHandle& handle);

private:
    IWorkerClient& client_;
    ThreadPool& pool_;
};

}  // namespace verified_compute
