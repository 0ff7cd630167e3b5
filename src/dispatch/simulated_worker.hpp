/**
 * @file simulated_worker.hpp
 * @brief In-process TEE worker used by the CLI and the test suites.
 *
 * Each submitted partition is "executed" on synthetic data generated from
 * a seeded mt19937, the requested metrics are computed through the metric
 * registry and the result is attested with a real Ed25519 signature.
 * Individual partitions can be scripted to misbehave.
 */

#pragma once

#include "attestation/signature.hpp"
#include "dispatch/worker_client.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace verified_compute {

enum class SimulatedFault : uint8_t {
    None,
    RejectSubmit,          ///< submit() returns an error
    ThrowOnSubmit,         ///< submit() throws
    ReportFailure,         ///< execution ends in WorkerState::Failed
    NeverFinish,           ///< stays Running forever
    TamperedMeasurement,   ///< attests an unapproved measurement
    BadSignature,          ///< signature bytes corrupted
    MissingAttestation,    ///< success without an attestation
    StaleAttestation,      ///< issued_at far in the past
    TamperedOutput,        ///< fetched bytes differ from the attested digest
    MissingResult          ///< success without a result handle
};

[[nodiscard]] constexpr std::string_view to_string(SimulatedFault fault) noexcept {
    switch (fault) {
        case SimulatedFault::None:                return "none";
        case SimulatedFault::RejectSubmit:        return "reject_submit";
        case SimulatedFault::ThrowOnSubmit:       return "throw_on_submit";
        case SimulatedFault::ReportFailure:       return "report_failure";
        case SimulatedFault::NeverFinish:         return "never_finish";
        case SimulatedFault::TamperedMeasurement: return "tampered_measurement";
        case SimulatedFault::BadSignature:        return "bad_signature";
        case SimulatedFault::MissingAttestation:  return "missing_attestation";
        case SimulatedFault::StaleAttestation:    return "stale_attestation";
        case SimulatedFault::TamperedOutput:      return "tampered_output";
        case SimulatedFault::MissingResult:       return "missing_result";
    }
    return "unknown";
}

Result<SimulatedFault> parse_simulated_fault(std::string_view name);

/**
 * @brief Scripted behaviour of one partition.
 */
struct PartitionScript {
    SimulatedFault fault = SimulatedFault::None;
    std::map<std::string, double> metric_overrides;
    std::chrono::milliseconds status_delay{0};   ///< Sleep inside every status() call
};

struct SimulatedWorkerConfig {
    std::string measurement;                     ///< Hex measurement of the worker image
    std::string signer_identity = "sim-tee-signer";
    uint32_t steps_to_finish = 2;                ///< status() calls until the final report
    uint64_t seed = 42;
    double label_noise = 0.1;                    ///< Probability a synthetic label is wrong
    uint64_t max_samples = 10'000;
};

class SimulatedWorkerClient : public IWorkerClient {
public:
    SimulatedWorkerClient(Ed25519Signer signer, SimulatedWorkerConfig config);

    /// Script the behaviour of a partition. Applies to later submissions.
    void script(PartitionId partition, PartitionScript script);

    [[nodiscard]] Bytes public_key() const { return signer_.public_key(); }
    [[nodiscard]] const SimulatedWorkerConfig& config() const noexcept { return config_; }

    Result<JobHandle> submit(const DispatchRequest& request) override;
    Result<WorkerStatusReport> status(const JobHandle& handle) override;
    Result<Bytes> fetch_result(const ResultHandle& handle) override;

    [[nodiscard]] size_t submit_count() const noexcept { return submits_.load(); }
    [[nodiscard]] size_t status_count() const noexcept { return status_calls_.load(); }

private:
    struct SimJob {
        DispatchRequest request;
        PartitionScript script;
        uint32_t status_calls = 0;
        std::optional<WorkerStatusReport> final_report;
    };

    /// Run the partition and build its final report. Called once per job.
    WorkerStatusReport execute(const SimJob& job);

    Ed25519Signer signer_;
    SimulatedWorkerConfig config_;

    std::atomic<size_t> submits_{0};
    std::atomic<size_t> status_calls_{0};

    mutable std::mutex mutex_;
    std::map<PartitionId, PartitionScript> scripts_;
    std::map<JobHandle, SimJob> jobs_;
    std::map<ResultHandle, Bytes> results_;
    uint64_t next_handle_ = 1;
};

}  // namespace verified_compute
