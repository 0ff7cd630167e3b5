/**
 * @file dispatcher.cpp
 * @brief ComputeDispatcher implementation.
 */

#include "dispatch/dispatcher.hpp"

#include <exception>
#include <memory>
#include <string>

namespace verified_compute {

namespace {

Error rpc_error(const char* call, const std::exception& ex) {
    return Error{ErrorCode::DispatchFailure,
                 std::string{"Worker "} + call + " threw: " + ex.what()};
}

}  // anonymous namespace

ComputeDispatcher::ComputeDispatcher(IWorkerClient& client, ThreadPool& pool)
    : client_(client), pool_(pool) {}

SubmitCall ComputeDispatcher::submit(DispatchRequest request) {
    auto started = std::make_shared<std::promise<std::chrono::steady_clock::time_point>>();
    SubmitCall call;
    call.started = started->get_future();
    call.handle = pool_.submit([this, started, req = std::move(request)]() -> Result<JobHandle> {
        started->set_value(std::chrono::steady_clock::now());
        try {
            auto handle = client_.submit(req);
            if (!handle) {
                return Error{ErrorCode::DispatchFailure, handle.error().message};
            }
            return handle;
        } catch (const std::exception& ex) {
            return rpc_error("submit", ex);
        }
    });
    return call;
}

std::future<Result<WorkerStatusReport>> ComputeDispatcher::query_status(JobHandle handle) {
    return pool_.submit([this, h = std::move(handle)]() -> Result<WorkerStatusReport> {
        try {
            return client_.status(h);
        } catch (const std::exception& ex) {
            return rpc_error("status", ex);
        }
    });
}

Result<Bytes> ComputeDispatcher::fetch_result(const ResultHandle& handle) {
    try {
        return client_.fetch_result(handle);
    } catch (const std::exception& ex) {
        return rpc_error("fetch_result", ex);
    }
}

}  // namespace verified_compute
