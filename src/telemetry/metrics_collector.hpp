/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "aggregate/result_aggregator.hpp"
#include "attestation/attestation.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "tracker/job.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace verified_compute {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_job_transition(const Job& job);
    void record_dispatch(const JobId& id, bool accepted, std::string_view detail,
                         Duration latency);
    void record_verification(const JobId& id, const VerificationVerdict& verdict);
    void record_aggregate(const AggregateResult& result);
    void record_ledger_commit(const GroupId& group, std::string_view digest,
                              double amount, size_t record_count);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace verified_compute
