/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade tying all modules together.
 *
 * Provides a single entry point for:
 *   1. Starting a job group: validate, partition, fan out dispatches
 *   2. Polling a group until every job is terminal or the deadline passes
 *   3. Cancelling a group
 *   4. Aggregating verified results and committing them to the ledger
 *
 * Worker, asset and ledger services are injected as interfaces so tests
 * and the CLI can run against in-process implementations.
 */

#pragma once

#include "aggregate/result_aggregator.hpp"
#include "attestation/signature.hpp"
#include "attestation/verifier.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "dispatch/dispatcher.hpp"
#include "dispatch/worker_client.hpp"
#include "environment/environment_catalog.hpp"
#include "executor/thread_pool.hpp"
#include "services/data_asset_service.hpp"
#include "services/ledger_service.hpp"
#include "telemetry/metrics_collector.hpp"
#include "tracker/job_tracker.hpp"

#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace verified_compute {

/**
 * @brief Everything needed to start one distributed computation.
 */
struct GroupRequest {
    std::string dataset_reference;
    std::string algorithm_reference;                 ///< Empty = none
    ComputeConfig compute_config;
    std::string environment_name;
    std::optional<PartitionConfig> partition_config; ///< nullopt = [partitioning] defaults
};

struct PollParams {
    std::chrono::milliseconds interval{1000};
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds status_timeout{2000};  ///< Per status() call
};

/**
 * @brief What poll_group observed when it returned.
 */
struct TerminalOutcome {
    GroupId group_id;
    size_t completed = 0;
    size_t failed = 0;                  ///< All failures, timed_out and cancelled included
    size_t timed_out = 0;
    size_t cancelled = 0;
    bool all_terminal = false;
    std::chrono::milliseconds elapsed{0};
    std::vector<Job> jobs;              ///< Snapshot in partition order

    /// At least one job completed with a verified result.
    [[nodiscard]] bool succeeded() const noexcept { return completed > 0; }
};

struct LedgerCommit {
    std::string digest;
    PaymentReceipt payment;
    std::vector<TransactionReference> records;   ///< One per successful job
};

class Orchestrator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;                 ///< nullptr = discard
        std::unique_ptr<ISignatureVerifier> signature_verifier; ///< nullptr = Ed25519
    };

    /**
     * @param worker  Must outlive the orchestrator.
     * @param assets  Must outlive the orchestrator.
     * @param ledger  Optional; commit_result() fails without one.
     */
    Orchestrator(Options opts, IWorkerClient& worker, IDataAssetService& assets,
                 ILedgerService* ledger = nullptr);
    ~Orchestrator();

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Group lifecycle ──────────────────────

    /**
     * @brief Validate, partition and dispatch one job per partition.
     *
     * EnvironmentUnsupported, ConfigurationError and AssetUnavailable are
     * returned before anything is dispatched. Individual dispatch failures
     * only fail their own job.
     */
    Result<GroupId> start_group(const GroupRequest& request);

    /// Poll until all jobs are terminal, the group is cancelled or the timeout passes.
    Result<TerminalOutcome> poll_group(const GroupId& group_id, const PollParams& params);

    /// poll_group() with the [orchestrator] defaults.
    Result<TerminalOutcome> poll_group(const GroupId& group_id);

    /// Fail every non-terminal job with Cancelled. Returns how many were cancelled.
    Result<size_t> cancel_group(const GroupId& group_id);

    /**
     * @brief Forget a terminal group and all of its jobs.
     *
     * Fails with GroupNotTerminal while any job is still in flight. Call it
     * once the group has been aggregated and committed.
     */
    Result<void> release_group(const GroupId& group_id);

    // ── Results ──────────────────────────────

    Result<AggregateResult> aggregate(const GroupId& group_id);

    /// Pay for the group and record the aggregate digest once per successful job.
    Result<LedgerCommit> commit_result(const AggregateResult& result);

    /// Write merged outputs to the staging dir and upload them. Returns the asset reference.
    Result<std::string> publish_result(const AggregateResult& result, const std::string& name);

    /// start_group + poll_group (defaults) + aggregate.
    Result<AggregateResult> run_to_completion(const GroupRequest& request);

    // ── Accessors (for testing) ─────────────
    JobTracker& tracker() { return tracker_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }
    const EnvironmentCatalog& catalog() const { return catalog_; }
    const TrustPolicy& trust_policy() const { return trust_policy_; }
    [[nodiscard]] PollParams default_poll_params() const;
    /// Groups that still hold live poll state.
    [[nodiscard]] size_t active_group_count() const;

private:
    using StatusFuture = std::future<Result<WorkerStatusReport>>;

    /**
     * Live state of a group that still has jobs in flight. Dropped once the
     * group is terminal.
     */
    struct GroupControl {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;

        /// At most one outstanding status() call per job, carried across rounds.
        std::mutex status_mutex;
        std::map<JobId, StatusFuture> status_in_flight;
    };

    std::shared_ptr<GroupControl> control_for(const GroupId& group_id) const;
    bool is_cancelled(GroupControl& control) const;
    void drop_control(const GroupId& group_id);

    void dispatch_all(const GroupId& group_id, const EnvironmentSpec& environment,
                      const GroupRequest& request);
    void poll_round(const std::vector<JobId>& pending, GroupControl& control,
                    std::chrono::steady_clock::time_point round_deadline);
    void apply_report(const JobId& id, const WorkerStatusReport& report);
    void complete_job(const JobId& id, const WorkerStatusReport& report);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    EnvironmentCatalog catalog_;
    TrustPolicy trust_policy_;
    std::unique_ptr<ISignatureVerifier> signatures_;
    AttestationVerifier verifier_;
    JobTracker tracker_;
    ResultAggregator aggregator_;

    IWorkerClient& worker_;
    IDataAssetService& assets_;
    ILedgerService* ledger_;

    mutable std::mutex controls_mutex_;
    std::map<GroupId, std::shared_ptr<GroupControl>> controls_;

    ComputeDispatcher dispatcher_;
    ThreadPool io_pool_;                // Last: joined before anything it may touch
};

}  // namespace verified_compute
