/**
 * @file result_aggregator.cpp
 * @brief ResultAggregator implementation and the aggregate digest.
 */

#include "aggregate/result_aggregator.hpp"

#include <algorithm>
#include <bit>
#include <chrono>

namespace verified_compute {

ResultAggregator::ResultAggregator(JobTracker& tracker, const AttestationVerifier& verifier,
                                   const TrustPolicy& policy)
    : tracker_(tracker), verifier_(verifier), policy_(policy) {}

Result<AggregateResult> ResultAggregator::aggregate(const GroupId& group_id) {
    auto group = tracker_.group(group_id);
    if (!group) {
        return make_error<AggregateResult>(ErrorCode::ConfigurationError,
                                           "Unknown job group: " + group_id);
    }

    auto pending = tracker_.non_terminal_jobs(group_id);
    if (!pending.empty()) {
        return make_error<AggregateResult>(
            ErrorCode::GroupNotTerminal,
            "Group " + group_id + " has " + std::to_string(pending.size()) +
                " job(s) in flight");
    }

    AggregateResult result;
    result.group_id = group_id;
    result.group_size = group->job_ids.size();

    std::map<std::string, std::pair<double, size_t>> metric_sums;
    double confidence_sum = 0.0;

    for (const auto& job : tracker_.jobs_in_group(group_id)) {
        if (job.status != JobStatus::Completed) {
            ++result.failed_count;
            continue;
        }

        VerificationVerdict verdict{};
        if (job.attestation) {
            auto at = job.verified_at.value_or(
                job.end_time.value_or(std::chrono::system_clock::now()));
            verdict = verifier_.verify_for_job(*job.attestation, job.job_id, policy_, at);
        }

        if (!verdict.valid) {
            tracker_.demote_completed(
                job.job_id, verdict,
                "Re-verification rejected attestation: " + std::string(to_string(verdict.reason)));
            ++result.failed_count;
            continue;
        }

        ++result.success_count;
        confidence_sum += verdict.confidence;
        result.total_compute_time += job.compute_time;
        result.merged_results.push_back(PartitionOutput{
            .partition_id = job.partition.partition_id,
            .job_id = job.job_id,
            .bytes = job.output
        });
        for (const auto& [name, value] : job.metrics) {
            auto& [sum, count] = metric_sums[name];
            sum += value;
            ++count;
        }
    }

    std::sort(result.merged_results.begin(), result.merged_results.end(),
              [](const PartitionOutput& a, const PartitionOutput& b) {
                  return a.partition_id < b.partition_id;
              });

    for (const auto& [name, acc] : metric_sums) {
        result.metrics[name] = acc.first / static_cast<double>(acc.second);
    }

    if (result.success_count > 0 && result.group_size > 0) {
        double success_ratio = static_cast<double>(result.success_count) /
                               static_cast<double>(result.group_size);
        double mean_confidence = confidence_sum / static_cast<double>(result.success_count);
        result.confidence_score = std::clamp((success_ratio + mean_confidence) / 2.0, 0.0, 1.0);
    }

    return result;
}

std::string aggregate_digest(const AggregateResult& result) {
    Bytes buf;
    AttestationCodec::put_string(buf, result.group_id);
    AttestationCodec::put_u64(buf, result.group_size);
    AttestationCodec::put_u64(buf, result.success_count);
    AttestationCodec::put_u64(buf, result.failed_count);
    AttestationCodec::put_u64(buf, static_cast<uint64_t>(result.total_compute_time.count()));

    AttestationCodec::put_u32(buf, static_cast<uint32_t>(result.merged_results.size()));
    for (const auto& out : result.merged_results) {
        AttestationCodec::put_u32(buf, out.partition_id);
        AttestationCodec::put_string(buf, out.job_id);
        AttestationCodec::put_u32(buf, static_cast<uint32_t>(out.bytes.size()));
        buf.insert(buf.end(), out.bytes.begin(), out.bytes.end());
    }

    AttestationCodec::put_u32(buf, static_cast<uint32_t>(result.metrics.size()));
    for (const auto& [name, value] : result.metrics) {
        AttestationCodec::put_string(buf, name);
        AttestationCodec::put_u64(buf, std::bit_cast<uint64_t>(value));
    }
    AttestationCodec::put_u64(buf, std::bit_cast<uint64_t>(result.confidence_score));

    return sha256_hex(buf);
}

}  // namespace verified_compute
