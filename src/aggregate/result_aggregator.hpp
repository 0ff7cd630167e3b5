/**
 * @file result_aggregator.hpp
 * @brief Merges verified partition results into one group answer.
 */

#pragma once

#include "attestation/attestation.hpp"
#include "attestation/verifier.hpp"
#include "core/digest.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "tracker/job_tracker.hpp"

#include <map>
#include <string>
#include <vector>

namespace verified_compute {

struct PartitionOutput {
    PartitionId partition_id{0};
    JobId job_id;
    Bytes bytes;

    bool operator==(const PartitionOutput&) const = default;
};

/**
 * @brief Result of one aggregation pass. Recomputed on every call.
 */
struct AggregateResult {
    GroupId group_id;
    size_t group_size{0};
    size_t success_count{0};
    size_t failed_count{0};
    Duration total_compute_time{0};
    std::vector<PartitionOutput> merged_results;   ///< Ordered by partition_id
    std::map<std::string, double> metrics;         ///< Mean over reporting successes
    double confidence_score{0.0};

    bool operator==(const AggregateResult&) const = default;
};

/**
 * @brief Folds the Completed jobs of a terminal group.
 *
 * Each Completed job is re-verified at the time it was first verified.
 * A job that no longer passes is demoted to Failed/VerificationFailed in
 * the tracker and counted as a failure.
 */
class ResultAggregator {
public:
    ResultAggregator(JobTracker& tracker, const AttestationVerifier& verifier,
                     const TrustPolicy& policy);

    /**
     * @brief Aggregate a group.
     *
     * Fails with ConfigurationError for an unknown group and with
     * GroupNotTerminal while any job is still in flight.
     */
    Result<AggregateResult> aggregate(const GroupId& group_id);

private:
    JobTracker& tracker_;
    const AttestationVerifier& verifier_;
    const TrustPolicy& policy_;
};

/**
 * @brief Hex SHA-256 over a canonical encoding of the aggregate.
 *
 * Metric values and the confidence score enter the encoding as their
 * IEEE-754 bit patterns, so equal aggregates always hash equally.
 */
std::string aggregate_digest(const AggregateResult& result);

}  // namespace verified_compute
