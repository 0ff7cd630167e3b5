/**
 * @file types.hpp
 * @brief Fundamental types used throughout VerifiedCompute.
 *
 * Defines job and group identifiers, the job state machine, failure
 * reasons and the clock aliases shared by every module.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace verified_compute {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = std::string;
using GroupId = std::string;
using JobHandle = std::string;        ///< Worker-issued job handle
using ResultHandle = std::string;     ///< Worker-issued result handle
using PartitionId = uint32_t;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Job State
// ─────────────────────────────────────────────

/**
 * @brief Lifecycle of a single partition job.
 *
 * Pending → Dispatched → Running → {Completed | Failed}.
 * Completed and Failed are terminal.
 */
enum class JobStatus : uint8_t {
    Pending,       ///< Partition created, not yet dispatched
    Dispatched,    ///< Worker returned a handle, no acknowledgment yet
    Running,       ///< Worker reports active execution
    Completed,     ///< Worker succeeded and the attestation verified
    Failed         ///< Any failure, see FailureReason
};

[[nodiscard]] constexpr std::string_view to_string(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending:    return "pending";
        case JobStatus::Dispatched: return "dispatched";
        case JobStatus::Running:    return "running";
        case JobStatus::Completed:  return "completed";
        case JobStatus::Failed:     return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

/**
 * @brief Position of a status in the forward-only state machine.
 */
[[nodiscard]] constexpr int status_rank(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending:    return 0;
        case JobStatus::Dispatched: return 1;
        case JobStatus::Running:    return 2;
        case JobStatus::Completed:  return 3;
        case JobStatus::Failed:     return 3;
    }
    return 0;
}

// ─────────────────────────────────────────────
// Failure Reasons
// ─────────────────────────────────────────────

enum class FailureReason : uint8_t {
    DispatchFailure,      ///< submit() failed or timed out
    WorkerReported,       ///< Worker reported a failed execution
    Timeout,              ///< Poll deadline exceeded
    Cancelled,            ///< Caller cancelled the group
    VerificationFailed,   ///< Attestation missing or rejected
    ResultUnavailable     ///< Result could not be fetched or did not match
};

[[nodiscard]] constexpr std::string_view to_string(FailureReason reason) noexcept {
    switch (reason) {
        case FailureReason::DispatchFailure:    return "dispatch_failure";
        case FailureReason::WorkerReported:     return "worker_reported";
        case FailureReason::Timeout:            return "timeout";
        case FailureReason::Cancelled:          return "cancelled";
        case FailureReason::VerificationFailed: return "verification_failed";
        case FailureReason::ResultUnavailable:  return "result_unavailable";
    }
    return "unknown";
}

/// Milliseconds since the Unix epoch, used by wire encodings and logs.
[[nodiscard]] inline int64_t to_unix_millis(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_unix_millis(int64_t millis) noexcept {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds{millis})};
}

}  // namespace verified_compute
