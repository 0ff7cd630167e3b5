/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace verified_compute {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_job_transition(const Job& job) {
    std::ostringstream oss;
    oss << R"({"event":"job_transition")"
        << R"(,"job":")" << json_escape(job.job_id) << "\""
        << R"(,"group":")" << json_escape(job.group_id) << "\""
        << R"(,"partition":)" << job.partition.partition_id
        << R"(,"status":")" << to_string(job.status) << "\"";
    if (job.failure_reason) {
        oss << R"(,"reason":")" << to_string(*job.failure_reason) << "\""
            << R"(,"detail":")" << json_escape(job.detail) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_dispatch(const JobId& id, bool accepted, std::string_view detail,
                                       Duration latency) {
    std::ostringstream oss;
    oss << R"({"event":"dispatch")"
        << R"(,"job":")" << json_escape(id) << "\""
        << R"(,"accepted":)" << (accepted ? "true" : "false")
        << R"(,"detail":")" << json_escape(detail) << "\""
        << R"(,"latency_us":)" << latency.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_verification(const JobId& id, const VerificationVerdict& verdict) {
    std::ostringstream oss;
    oss << R"({"event":"verification")"
        << R"(,"job":")" << json_escape(id) << "\""
        << R"(,"valid":)" << (verdict.valid ? "true" : "false")
        << R"(,"reason":")" << to_string(verdict.reason) << "\""
        << R"(,"confidence":)" << verdict.confidence
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_aggregate(const AggregateResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"aggregate")"
        << R"(,"group":")" << json_escape(result.group_id) << "\""
        << R"(,"size":)" << result.group_size
        << R"(,"succeeded":)" << result.success_count
        << R"(,"failed":)" << result.failed_count
        << R"(,"compute_us":)" << result.total_compute_time.count()
        << R"(,"confidence":)" << result.confidence_score
        << R"(,"metrics":{)";
    bool first = true;
    for (const auto& [name, value] : result.metrics) {
        if (!first) oss << ",";
        oss << "\"" << json_escape(name) << "\":" << value;
        first = false;
    }
    oss << "}}";
    emit(oss.str());
}

void MetricsCollector::record_ledger_commit(const GroupId& group, std::string_view digest,
                                            double amount, size_t record_count) {
    std::ostringstream oss;
    oss << R"({"event":"ledger_commit")"
        << R"(,"group":")" << json_escape(group) << "\""
        << R"(,"digest":")" << digest << "\""
        << R"(,"amount":)" << amount
        << R"(,"records":)" << record_count
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace verified_compute
