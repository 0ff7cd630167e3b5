/**
 * @file worker_client.hpp
 * @brief Worker RPC interface consumed by the ComputeDispatcher.
 *
 * A worker runs one partition inside a TEE and reports its progress.
 * Implementations may block and may throw; the dispatcher isolates both.
 */

#pragma once

#include "attestation/attestation.hpp"
#include "core/digest.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "environment/environment_catalog.hpp"
#include "partition/partitioner.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace verified_compute {

/**
 * @brief Everything a worker needs to run one partition.
 */
struct DispatchRequest {
    JobId job_id;
    Partition partition;
    EnvironmentSpec environment;
    std::string algorithm_reference;
    ComputeConfig compute_config;
};

enum class WorkerState : uint8_t {
    Queued,
    Running,
    Succeeded,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Queued:    return "queued";
        case WorkerState::Running:   return "running";
        case WorkerState::Succeeded: return "succeeded";
        case WorkerState::Failed:    return "failed";
    }
    return "unknown";
}

struct WorkerStatusReport {
    WorkerState state = WorkerState::Queued;
    std::optional<Attestation> attestation;
    std::optional<ResultHandle> result_handle;
    std::map<std::string, double> metrics;
    Duration compute_time{0};
    std::string message;
};

class IWorkerClient {
public:
    virtual ~IWorkerClient() = default;

    virtual Result<JobHandle> submit(const DispatchRequest& request) = 0;
    virtual Result<WorkerStatusReport> status(const JobHandle& handle) = 0;
    virtual Result<Bytes> fetch_result(const ResultHandle& handle) = 0;
};

}  // namespace verified_compute
