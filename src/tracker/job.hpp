/**
 * @file job.hpp
 * @brief Job and JobGroup records held by the JobTracker.
 */

#pragma once

#include "attestation/attestation.hpp"
#include "core/digest.hpp"
#include "core/types.hpp"
#include "partition/partitioner.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace verified_compute {

struct Job {
    JobId job_id;
    GroupId group_id;
    Partition partition;
    std::string environment_name;

    JobStatus status = JobStatus::Pending;
    std::optional<FailureReason> failure_reason;
    std::string detail;                          ///< Audit trail for failures

    std::optional<JobHandle> handle;
    std::optional<Timestamp> start_time;         ///< Set when dispatched
    std::optional<Timestamp> end_time;           ///< Set on reaching a terminal state

    std::optional<Attestation> attestation;
    std::optional<VerificationVerdict> verdict;
    std::optional<Timestamp> verified_at;

    std::optional<ResultHandle> result_handle;
    Bytes output;
    std::map<std::string, double> metrics;
    Duration compute_time{0};
};

/**
 * @brief One logical distributed computation. Membership is fixed at creation.
 */
struct JobGroup {
    GroupId group_id;
    std::vector<JobId> job_ids;                  ///< Ordered by partition_id
    Timestamp creation_time;
    std::string environment_name;
    std::string dataset_reference;
};

/**
 * @brief Everything a verified success contributes to the job record.
 */
struct CompletionRecord {
    Attestation attestation;
    VerificationVerdict verdict;
    Timestamp verified_at;
    ResultHandle result_handle;
    Bytes output;
    std::map<std::string, double> metrics;
    Duration compute_time{0};
};

}  // namespace verified_compute
