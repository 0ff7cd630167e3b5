/**
 * @file simulated_worker.cpp
 * @brief SimulatedWorkerClient implementation.
 */

#include "dispatch/simulated_worker.hpp"

#include "aggregate/metric_registry.hpp"
#include "attestation/attestation.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <variant>

namespace verified_compute {

namespace {

constexpr std::array ALL_FAULTS{
    SimulatedFault::None,
    SimulatedFault::RejectSubmit,
    SimulatedFault::ThrowOnSubmit,
    SimulatedFault::ReportFailure,
    SimulatedFault::NeverFinish,
    SimulatedFault::TamperedMeasurement,
    SimulatedFault::BadSignature,
    SimulatedFault::MissingAttestation,
    SimulatedFault::StaleAttestation,
    SimulatedFault::TamperedOutput,
    SimulatedFault::MissingResult,
};

constexpr uint64_t SAMPLES_PER_KEY = 25;

uint64_t sample_count(const Partition& part, uint64_t cap) {
    uint64_t n = std::visit([](const auto& scope) -> uint64_t {
        using S = std::decay_t<decltype(scope)>;
        if constexpr (std::is_same_v<S, RecordRange>) {
            return scope.size();
        } else {
            return scope.values.size() * SAMPLES_PER_KEY;
        }
    }, part.scope);
    return std::clamp<uint64_t>(n, 1, cap);
}

std::string format_value(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6f", v);
    return buf;
}

}  // anonymous namespace

Result<SimulatedFault> parse_simulated_fault(std::string_view name) {
    for (auto fault : ALL_FAULTS) {
        if (to_string(fault) == name) return fault;
    }
    return make_error<SimulatedFault>(ErrorCode::ConfigurationError,
                                      "Unknown simulated fault: " + std::string(name));
}

SimulatedWorkerClient::SimulatedWorkerClient(Ed25519Signer signer, SimulatedWorkerConfig config)
    : signer_(std::move(signer)), config_(std::move(config)) {}

void SimulatedWorkerClient::script(PartitionId partition, PartitionScript script) {
    std::lock_guard lock(mutex_);
    scripts_[partition] = std::move(script);
}

Result<JobHandle> SimulatedWorkerClient::submit(const DispatchRequest& request) {
    ++submits_;

    std::lock_guard lock(mutex_);
    PartitionScript script;
    if (auto it = scripts_.find(request.partition.partition_id); it != scripts_.end()) {
        script = it->second;
    }

    if (script.fault == SimulatedFault::RejectSubmit) {
        return make_error<JobHandle>(ErrorCode::DispatchFailure,
                                     "Worker rejected " + request.job_id + ": no capacity");
    }
    if (script.fault == SimulatedFault::ThrowOnSubmit) {
        throw std::runtime_error("worker connection reset");
    }

    JobHandle handle = "sim-" + std::to_string(next_handle_++);
    jobs_.emplace(handle, SimJob{.request = request, .script = std::move(script)});
    return handle;
}

Result<WorkerStatusReport> SimulatedWorkerClient::status(const JobHandle& handle) {
    ++status_calls_;

    SimJob snapshot;
    uint32_t calls = 0;
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(handle);
        if (it == jobs_.end()) {
            return make_error<WorkerStatusReport>(ErrorCode::DispatchFailure,
                                                  "Unknown job handle: " + handle);
        }
        calls = ++it->second.status_calls;
        if (it->second.final_report) return *it->second.final_report;
        snapshot = it->second;
    }

    if (snapshot.script.status_delay.count() > 0) {
        std::this_thread::sleep_for(snapshot.script.status_delay);
    }

    if (snapshot.script.fault == SimulatedFault::NeverFinish || calls < config_.steps_to_finish) {
        WorkerStatusReport report;
        report.state = (calls == 1 && config_.steps_to_finish > 2) ? WorkerState::Queued
                                                                   : WorkerState::Running;
        return report;
    }

    auto report = execute(snapshot);

    std::lock_guard lock(mutex_);
    auto& job = jobs_.at(handle);
    if (!job.final_report) job.final_report = std::move(report);
    return *job.final_report;
}

Result<Bytes> SimulatedWorkerClient::fetch_result(const ResultHandle& handle) {
    std::lock_guard lock(mutex_);
    auto it = results_.find(handle);
    if (it == results_.end()) {
        return make_error<Bytes>(ErrorCode::DispatchFailure, "Unknown result handle: " + handle);
    }
    return it->second;
}

WorkerStatusReport SimulatedWorkerClient::execute(const SimJob& job) {
    const auto& req = job.request;
    const auto fault = job.script.fault;

    WorkerStatusReport report;
    if (fault == SimulatedFault::ReportFailure) {
        report.state = WorkerState::Failed;
        report.message = "Simulated execution failure in " + req.environment.name;
        return report;
    }

    // ── Synthetic evaluation ─────────────────
    uint64_t n = sample_count(req.partition, config_.max_samples);
    std::mt19937 rng(static_cast<uint32_t>(config_.seed + req.partition.partition_id * 7919ULL));
    std::bernoulli_distribution label(0.5);
    std::bernoulli_distribution flip(config_.label_noise);
    std::uniform_real_distribution<double> target(1.0, 10.0);
    std::normal_distribution<double> noise(0.0, 2.0 * config_.label_noise);

    std::vector<double> cls_actual(n), cls_pred(n), reg_actual(n), reg_pred(n);
    for (uint64_t i = 0; i < n; ++i) {
        cls_actual[i] = label(rng) ? 1.0 : 0.0;
        cls_pred[i] = flip(rng) ? 1.0 - cls_actual[i] : cls_actual[i];
        reg_actual[i] = target(rng);
        reg_pred[i] = reg_actual[i] + noise(rng);
    }

    for (const auto& name : req.compute_config.metrics) {
        auto metric = find_metric(name);
        if (!metric) continue;
        bool cls = metric->family == MetricFamily::Classification;
        report.metrics[name] = metric->fn(cls ? cls_pred : reg_pred, cls ? cls_actual : reg_actual);
    }
    for (const auto& [name, value] : job.script.metric_overrides) {
        report.metrics[name] = value;
    }
    report.compute_time = Duration{static_cast<int64_t>(n) * 100};

    std::string text = "job=" + req.job_id +
                       ";partition=" + std::to_string(req.partition.partition_id) +
                       ";scope=" + describe(req.partition.scope) +
                       ";samples=" + std::to_string(n);
    for (const auto& [name, value] : report.metrics) {
        text += ";" + name + "=" + format_value(value);
    }
    Bytes output(text.begin(), text.end());

    // ── Attestation ──────────────────────────
    ResultHandle result_handle;
    {
        std::lock_guard lock(mutex_);
        result_handle = "res-" + std::to_string(next_handle_++);
        Bytes stored = output;
        if (fault == SimulatedFault::TamperedOutput) stored.push_back('!');
        results_[result_handle] = std::move(stored);
    }

    report.state = WorkerState::Succeeded;
    report.message = "ok";
    if (fault != SimulatedFault::MissingResult) report.result_handle = result_handle;
    if (fault == SimulatedFault::MissingAttestation) return report;

    Attestation att{
        .subject_job_id = req.job_id,
        .measurement = config_.measurement,
        .signer_identity = config_.signer_identity,
        .issued_at = std::chrono::system_clock::now(),
        .result_digest = sha256_hex(output),
        .signature = {}
    };
    if (fault == SimulatedFault::TamperedMeasurement) {
        std::string_view bogus = "tampered-runtime-image";
        att.measurement = sha256_hex(Bytes(bogus.begin(), bogus.end()));
    }
    if (fault == SimulatedFault::StaleAttestation) {
        att.issued_at -= std::chrono::hours(24);
    }

    auto sig = signer_.sign(AttestationCodec::payload(att));
    if (sig) {
        att.signature = std::move(*sig);
        if (fault == SimulatedFault::BadSignature && !att.signature.empty()) {
            att.signature[0] ^= 0xFF;
        }
    } else {
        report.message = "Signing failed: " + sig.error().message;
    }
    report.attestation = std::move(att);
    return report;
}

}  // namespace verified_compute
