/**
 * @file orchestrator.cpp
 * @brief Orchestrator implementation: dispatch fan-out, poll loop,
 *        verification gating, aggregation and ledger commit.
 */

#include "orchestrator/orchestrator.hpp"

#include "aggregate/metric_registry.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <future>
#include <system_error>
#include <utility>

namespace verified_compute {

namespace {

using SteadyClock = std::chrono::steady_clock;

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

std::unique_ptr<ISignatureVerifier> or_ed25519(std::unique_ptr<ISignatureVerifier> verifier) {
    if (verifier) return verifier;
    return std::make_unique<Ed25519Verifier>();
}

}  // anonymous namespace

// ═══════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════

Orchestrator::Orchestrator(Options opts, IWorkerClient& worker, IDataAssetService& assets,
                           ILedgerService* ledger)
    : config_(std::move(opts.config))
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level)
    , metrics_(or_null_sink(std::move(opts.metrics_sink)))
    , catalog_(config_.environments)
    , trust_policy_(make_trust_policy(config_.trust))
    , signatures_(or_ed25519(std::move(opts.signature_verifier)))
    , verifier_(*signatures_)
    , aggregator_(tracker_, verifier_, trust_policy_)
    , worker_(worker)
    , assets_(assets)
    , ledger_(ledger)
    , dispatcher_(worker_, io_pool_)
    , io_pool_(std::max<uint32_t>(config_.orchestrator.io_threads, 1)) {
    tracker_.set_observer([this](const Job& job) {
        metrics_.record_job_transition(job);
        if (job.status == JobStatus::Failed) {
            logger_.warn("Job " + job.job_id + " failed (" +
                         std::string(to_string(*job.failure_reason)) + "): " + job.detail);
        } else {
            logger_.debug("Job " + job.job_id + " -> " + std::string(to_string(job.status)));
        }
    });

    logger_.info("Orchestrator ready: environments=" + std::to_string(catalog_.size()) +
                 " io_threads=" + std::to_string(io_pool_.thread_count()) +
                 " signature_scheme=" + std::string(signatures_->scheme()));
}

Orchestrator::~Orchestrator() {
    {
        std::lock_guard lock(controls_mutex_);
        for (auto& [id, control] : controls_) {
            std::lock_guard cl(control->mutex);
            control->cancelled = true;
            control->cv.notify_all();
        }
    }
    io_pool_.shutdown();
    logger_.flush();
    metrics_.flush();
}

PollParams Orchestrator::default_poll_params() const {
    const auto& o = config_.orchestrator;
    return PollParams{
        .interval = std::chrono::milliseconds{o.poll_interval_ms},
        .timeout = std::chrono::milliseconds{o.poll_timeout_ms},
        .status_timeout = std::chrono::milliseconds{o.status_timeout_ms}
    };
}

size_t Orchestrator::active_group_count() const {
    std::lock_guard lock(controls_mutex_);
    return controls_.size();
}

std::shared_ptr<Orchestrator::GroupControl> Orchestrator::control_for(const GroupId& group_id) const {
    std::lock_guard lock(controls_mutex_);
    auto it = controls_.find(group_id);
    return it == controls_.end() ? nullptr : it->second;
}

bool Orchestrator::is_cancelled(GroupControl& control) const {
    std::lock_guard lock(control.mutex);
    return control.cancelled;
}

void Orchestrator::drop_control(const GroupId& group_id) {
    std::lock_guard lock(controls_mutex_);
    controls_.erase(group_id);
}

// ═══════════════════════════════════════════════
// start_group
// ═══════════════════════════════════════════════

Result<GroupId> Orchestrator::start_group(const GroupRequest& request) {
    // ── Validation (nothing dispatched on failure) ──
    auto environment = catalog_.validate(request.environment_name, request.compute_config);
    if (!environment) {
        logger_.error("Rejected group: " + environment.error().message);
        return environment.error();
    }

    if (auto metrics_ok = validate_metric_names(request.compute_config.metrics); !metrics_ok) {
        logger_.error("Rejected group: " + metrics_ok.error().message);
        return metrics_ok.error();
    }

    const PartitionConfig& part_config =
        request.partition_config ? *request.partition_config : config_.partitioning;
    if (auto strategy = validate_partition_config(part_config); !strategy) {
        logger_.error("Rejected group: " + strategy.error().message);
        return strategy.error();
    }

    // ── Asset resolution ─────────────────────
    DatasetDescriptor dataset;
    try {
        auto meta = assets_.resolve(request.dataset_reference);
        if (!meta) {
            logger_.error("Dataset unavailable: " + meta.error().message);
            return Error{ErrorCode::AssetUnavailable, meta.error().message};
        }
        dataset = meta->dataset;
        dataset.reference = request.dataset_reference;

        if (!request.algorithm_reference.empty()) {
            auto algo = assets_.resolve(request.algorithm_reference);
            if (!algo) {
                logger_.error("Algorithm unavailable: " + algo.error().message);
                return Error{ErrorCode::AssetUnavailable, algo.error().message};
            }
        }
    } catch (const std::exception& ex) {
        return Error{ErrorCode::AssetUnavailable,
                     std::string{"Asset service threw: "} + ex.what()};
    }

    auto partitions = partition(dataset, part_config);
    if (!partitions) {
        logger_.error("Partitioning failed: " + partitions.error().message);
        return partitions.error();
    }

    // ── Record and dispatch ──────────────────
    auto group_id = tracker_.create_group(*partitions, environment->name);
    {
        std::lock_guard lock(controls_mutex_);
        controls_.emplace(group_id, std::make_shared<GroupControl>());
    }

    logger_.info("Group " + group_id + " created: dataset=" + dataset.reference +
                 " partitions=" + std::to_string(partitions->size()) +
                 " strategy=" + part_config.strategy +
                 " environment=" + environment->name);

    dispatch_all(group_id, *environment, request);
    return group_id;
}

void Orchestrator::dispatch_all(const GroupId& group_id, const EnvironmentSpec& environment,
                                const GroupRequest& request) {
    struct InFlight {
        JobId job_id;
        SubmitCall call;
    };

    const std::chrono::milliseconds timeout{config_.orchestrator.dispatch_timeout_ms};
    auto started = SteadyClock::now();

    std::vector<InFlight> inflight;
    for (const auto& job : tracker_.jobs_in_group(group_id)) {
        DispatchRequest req{
            .job_id = job.job_id,
            .partition = job.partition,
            .environment = environment,
            .algorithm_reference = request.algorithm_reference,
            .compute_config = request.compute_config
        };
        try {
            inflight.push_back({job.job_id, dispatcher_.submit(std::move(req))});
        } catch (const std::exception& ex) {
            tracker_.mark_failed(job.job_id, FailureReason::DispatchFailure,
                                 std::string{"Could not queue dispatch: "} + ex.what());
        }
    }

    // Each submit is timed from the moment a pool thread picks it up. A call
    // still queued after every wave of the pool had its full timeout means
    // the threads are held by unresponsive workers.
    auto threads = std::max<size_t>(io_pool_.thread_count(), 1);
    auto waves = std::max<size_t>((inflight.size() + threads - 1) / threads, 1);
    auto start_bound = started + timeout * static_cast<int64_t>(waves);

    for (auto& f : inflight) {
        auto latency = [&] {
            return std::chrono::duration_cast<Duration>(SteadyClock::now() - started);
        };

        if (f.call.started.wait_until(start_bound) != std::future_status::ready) {
            tracker_.mark_failed(f.job_id, FailureReason::DispatchFailure,
                                 "Dispatch never started: io pool saturated for " +
                                     std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                                         start_bound - started).count()) + "ms");
            metrics_.record_dispatch(f.job_id, false, "queued", latency());
            continue;
        }

        SteadyClock::time_point call_started;
        try {
            call_started = f.call.started.get();
        } catch (const std::future_error& ex) {
            tracker_.mark_failed(f.job_id, FailureReason::DispatchFailure,
                                 std::string{"Dispatch abandoned: "} + ex.what());
            continue;
        }

        if (f.call.handle.wait_until(call_started + timeout) != std::future_status::ready) {
            // The RPC keeps running on the pool; its late handle is ignored.
            tracker_.mark_failed(f.job_id, FailureReason::DispatchFailure,
                                 "Dispatch timed out after " +
                                     std::to_string(timeout.count()) + "ms");
            metrics_.record_dispatch(f.job_id, false, "timeout", latency());
            continue;
        }

        auto handle = f.call.handle.get();
        if (!handle) {
            tracker_.mark_failed(f.job_id, FailureReason::DispatchFailure,
                                 handle.error().message);
            metrics_.record_dispatch(f.job_id, false, handle.error().message, latency());
            continue;
        }

        tracker_.mark_dispatched(f.job_id, *handle);
        metrics_.record_dispatch(f.job_id, true, *handle, latency());
    }
}

// ═══════════════════════════════════════════════
// poll_group
// ═══════════════════════════════════════════════

Result<TerminalOutcome> Orchestrator::poll_group(const GroupId& group_id) {
    return poll_group(group_id, default_poll_params());
}

Result<TerminalOutcome> Orchestrator::poll_group(const GroupId& group_id,
                                                 const PollParams& params) {
    if (!tracker_.group(group_id)) {
        return make_error<TerminalOutcome>(ErrorCode::ConfigurationError,
                                           "Unknown job group: " + group_id);
    }

    auto started = SteadyClock::now();
    auto deadline = started + params.timeout;

    // No control means the group already went terminal and was dropped.
    auto control = control_for(group_id);
    while (control && !is_cancelled(*control)) {
        auto pending = tracker_.non_terminal_jobs(group_id);
        if (pending.empty()) break;

        auto now = SteadyClock::now();
        if (now >= deadline) break;

        poll_round(pending, *control, std::min(now + params.status_timeout, deadline));

        if (tracker_.is_group_terminal(group_id)) break;

        std::unique_lock lock(control->mutex);
        control->cv.wait_until(lock, std::min(SteadyClock::now() + params.interval, deadline),
                               [&] { return control->cancelled; });
    }

    // Anything still in flight has run out of time (or was cancelled mid-round).
    bool cancelled = control && is_cancelled(*control);
    for (const auto& id : tracker_.non_terminal_jobs(group_id)) {
        if (cancelled) {
            tracker_.mark_failed(id, FailureReason::Cancelled, "Group cancelled");
        } else {
            tracker_.mark_failed(id, FailureReason::Timeout,
                                 "No terminal status within " +
                                     std::to_string(params.timeout.count()) + "ms");
        }
    }

    TerminalOutcome outcome;
    outcome.group_id = group_id;
    outcome.jobs = tracker_.jobs_in_group(group_id);
    outcome.all_terminal = true;
    for (const auto& job : outcome.jobs) {
        if (job.status == JobStatus::Completed) {
            ++outcome.completed;
        } else if (job.status == JobStatus::Failed) {
            ++outcome.failed;
            if (job.failure_reason == FailureReason::Timeout) ++outcome.timed_out;
            if (job.failure_reason == FailureReason::Cancelled) ++outcome.cancelled;
        } else {
            outcome.all_terminal = false;
        }
    }
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now() - started);
    if (outcome.all_terminal) drop_control(group_id);

    logger_.info("Group " + group_id + " polled: completed=" + std::to_string(outcome.completed) +
                 " failed=" + std::to_string(outcome.failed) +
                 " timed_out=" + std::to_string(outcome.timed_out) +
                 " elapsed_ms=" + std::to_string(outcome.elapsed.count()));
    return outcome;
}

void Orchestrator::poll_round(const std::vector<JobId>& pending, GroupControl& control,
                              SteadyClock::time_point round_deadline) {
    struct InFlight {
        JobId job_id;
        StatusFuture future;
    };

    // A job whose previous query has not answered yet keeps that query;
    // only jobs without one get a new status() call.
    std::vector<InFlight> inflight;
    {
        std::lock_guard lock(control.status_mutex);
        for (const auto& id : pending) {
            if (auto it = control.status_in_flight.find(id); it != control.status_in_flight.end()) {
                inflight.push_back({id, std::move(it->second)});
                control.status_in_flight.erase(it);
                continue;
            }
            auto job = tracker_.job(id);
            if (!job || !job->handle) continue;
            try {
                inflight.push_back({id, dispatcher_.query_status(*job->handle)});
            } catch (const std::exception& ex) {
                logger_.warn("Could not queue status query for " + id + ": " + ex.what());
            }
        }
    }

    for (auto& call : inflight) {
        if (is_cancelled(control)) return;

        if (call.future.wait_until(round_deadline) != std::future_status::ready) {
            logger_.debug("No status response from " + call.job_id + " this round");
            std::lock_guard lock(control.status_mutex);
            control.status_in_flight.insert_or_assign(call.job_id, std::move(call.future));
            continue;
        }

        auto report = call.future.get();
        if (!report) {
            logger_.warn("Status query for " + call.job_id + " failed: " +
                         report.error().message);
            continue;
        }
        apply_report(call.job_id, *report);
    }
}

void Orchestrator::apply_report(const JobId& id, const WorkerStatusReport& report) {
    switch (report.state) {
        case WorkerState::Queued:
            break;
        case WorkerState::Running:
            tracker_.mark_running(id);
            break;
        case WorkerState::Failed:
            tracker_.mark_failed(id, FailureReason::WorkerReported,
                                 report.message.empty() ? "Worker reported failure"
                                                        : report.message);
            break;
        case WorkerState::Succeeded:
            complete_job(id, report);
            break;
    }
}

void Orchestrator::complete_job(const JobId& id, const WorkerStatusReport& report) {
    auto now = std::chrono::system_clock::now();

    if (!report.attestation) {
        tracker_.mark_failed(id, FailureReason::VerificationFailed,
                             "Worker reported success without an attestation");
        return;
    }
    const auto& att = *report.attestation;

    auto verdict = verifier_.verify_for_job(att, id, trust_policy_, now);
    metrics_.record_verification(id, verdict);
    if (!verdict.valid) {
        tracker_.mark_verification_failed(
            id, att, verdict, now,
            "Attestation rejected: " + std::string(to_string(verdict.reason)));
        return;
    }

    if (!report.result_handle) {
        tracker_.mark_failed(id, FailureReason::ResultUnavailable,
                             "Worker reported success without a result handle");
        return;
    }

    auto output = dispatcher_.fetch_result(*report.result_handle);
    if (!output) {
        tracker_.mark_failed(id, FailureReason::ResultUnavailable,
                             "Result fetch failed: " + output.error().message);
        return;
    }

    if (!att.result_digest.empty()) {
        auto digest = sha256_hex(*output);
        if (digest != att.result_digest) {
            tracker_.mark_failed(id, FailureReason::ResultUnavailable,
                                 "Result digest " + digest + " does not match attested " +
                                     att.result_digest);
            return;
        }
    }

    tracker_.mark_completed(id, CompletionRecord{
        .attestation = att,
        .verdict = verdict,
        .verified_at = now,
        .result_handle = *report.result_handle,
        .output = std::move(*output),
        .metrics = report.metrics,
        .compute_time = report.compute_time
    });
}

// ═══════════════════════════════════════════════
// cancel_group
// ═══════════════════════════════════════════════

Result<size_t> Orchestrator::cancel_group(const GroupId& group_id) {
    if (!tracker_.group(group_id)) {
        return make_error<size_t>(ErrorCode::ConfigurationError,
                                  "Unknown job group: " + group_id);
    }

    size_t cancelled = 0;
    for (const auto& id : tracker_.non_terminal_jobs(group_id)) {
        if (tracker_.mark_failed(id, FailureReason::Cancelled, "Group cancelled")) {
            ++cancelled;
        }
    }

    if (auto control = control_for(group_id)) {
        {
            std::lock_guard lock(control->mutex);
            control->cancelled = true;
        }
        control->cv.notify_all();
    }
    if (tracker_.is_group_terminal(group_id)) drop_control(group_id);

    logger_.info("Group " + group_id + " cancelled: " + std::to_string(cancelled) + " job(s)");
    return cancelled;
}

Result<void> Orchestrator::release_group(const GroupId& group_id) {
    if (!tracker_.group(group_id)) {
        return make_error<void>(ErrorCode::ConfigurationError, "Unknown job group: " + group_id);
    }
    if (!tracker_.is_group_terminal(group_id)) {
        return make_error<void>(ErrorCode::GroupNotTerminal,
                                "Group " + group_id + " still has jobs in flight");
    }

    drop_control(group_id);
    tracker_.remove_group(group_id);
    logger_.debug("Group " + group_id + " released");
    return {};
}

// ═══════════════════════════════════════════════
// Aggregation, ledger and publishing
// ═══════════════════════════════════════════════

Result<AggregateResult> Orchestrator::aggregate(const GroupId& group_id) {
    auto result = aggregator_.aggregate(group_id);
    if (!result) {
        logger_.warn("Aggregation of " + group_id + " failed: " + result.error().message);
        return result;
    }

    metrics_.record_aggregate(*result);
    logger_.info("Group " + group_id + " aggregated: succeeded=" +
                 std::to_string(result->success_count) + "/" +
                 std::to_string(result->group_size) +
                 " confidence=" + std::to_string(result->confidence_score));
    return result;
}

Result<LedgerCommit> Orchestrator::commit_result(const AggregateResult& result) {
    if (!ledger_) {
        return make_error<LedgerCommit>(ErrorCode::LedgerSubmissionFailed,
                                        "No ledger service configured");
    }
    if (result.success_count == 0) {
        return make_error<LedgerCommit>(ErrorCode::LedgerSubmissionFailed,
                                        "Group " + result.group_id + " has no verified results");
    }

    LedgerCommit commit;
    commit.digest = aggregate_digest(result);

    const auto& lc = config_.ledger;
    double amount = static_cast<double>(result.group_size) * lc.fee_per_partition *
                    (1.0 + lc.distributed_premium);

    try {
        auto receipt = ledger_->pay(amount, lc.recipient);
        if (!receipt) {
            logger_.error("Ledger payment failed: " + receipt.error().message);
            return Error{ErrorCode::LedgerSubmissionFailed, receipt.error().message};
        }
        commit.payment = *receipt;

        for (const auto& out : result.merged_results) {
            auto tx = ledger_->record(commit.digest, out.job_id);
            if (!tx) {
                logger_.error("Ledger record for " + out.job_id + " failed: " +
                              tx.error().message);
                return Error{ErrorCode::LedgerSubmissionFailed, tx.error().message};
            }
            commit.records.push_back(*tx);
        }
    } catch (const std::exception& ex) {
        return Error{ErrorCode::LedgerSubmissionFailed,
                     std::string{"Ledger service threw: "} + ex.what()};
    }

    metrics_.record_ledger_commit(result.group_id, commit.digest, amount, commit.records.size());
    logger_.info("Group " + result.group_id + " committed: digest=" + commit.digest);
    return commit;
}

Result<std::string> Orchestrator::publish_result(const AggregateResult& result,
                                                 const std::string& name) {
    const auto& staging = config_.orchestrator.staging_dir;

    std::error_code ec;
    std::filesystem::create_directories(staging, ec);
    if (ec) {
        return make_error<std::string>(ErrorCode::AssetUnavailable,
                                       "Cannot create staging dir " + staging.string() + ": " +
                                           ec.message());
    }

    auto path = staging / (result.group_id + "-results.txt");
    Bytes contents;
    for (const auto& out : result.merged_results) {
        contents.insert(contents.end(), out.bytes.begin(), out.bytes.end());
        contents.push_back('\n');
    }
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(contents.data()),
                   static_cast<std::streamsize>(contents.size()));
        if (!file) {
            return make_error<std::string>(ErrorCode::AssetUnavailable,
                                           "Cannot write " + path.string());
        }
    }

    AssetMetadata meta{
        .dataset = DatasetDescriptor{.reference = {}, .record_count = result.merged_results.size()},
        .name = name,
        .checksum = sha256_hex(contents),
        .owner = "verified_compute"
    };

    try {
        auto reference = assets_.upload(path, meta);
        if (!reference) {
            return Error{ErrorCode::AssetUnavailable, reference.error().message};
        }
        logger_.info("Published " + result.group_id + " as " + *reference);
        return reference;
    } catch (const std::exception& ex) {
        return Error{ErrorCode::AssetUnavailable,
                     std::string{"Asset service threw: "} + ex.what()};
    }
}

Result<AggregateResult> Orchestrator::run_to_completion(const GroupRequest& request) {
    auto group_id = start_group(request);
    if (!group_id) return group_id.error();

    auto outcome = poll_group(*group_id);
    if (!outcome) return outcome.error();

    return aggregate(*group_id);
}

}  // namespace verified_compute
