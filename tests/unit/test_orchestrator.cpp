/**
 * @file test_orchestrator.cpp
 * @brief Tests for the Orchestrator facade against the in-process worker.
 */

#include "orchestrator/orchestrator.hpp"
#include "dispatch/simulated_worker.hpp"
#include "services/in_memory_services.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace verified_compute;
using namespace verified_compute::test_support;
using namespace std::chrono_literals;

namespace {

constexpr const char* DATASET = "dataset://orchestrator-test";

/**
 * @brief Delays every submit() before forwarding it.
 */
class SlowSubmitWorker : public IWorkerClient {
public:
    SlowSubmitWorker(IWorkerClient& inner, std::chrono::milliseconds delay)
        : inner_(inner), delay_(delay) {}

    Result<JobHandle> submit(const DispatchRequest& request) override {
        std::this_thread::sleep_for(delay_);
        return inner_.submit(request);
    }
    Result<WorkerStatusReport> status(const JobHandle& handle) override {
        return inner_.status(handle);
    }
    Result<Bytes> fetch_result(const ResultHandle& handle) override {
        return inner_.fetch_result(handle);
    }

private:
    IWorkerClient& inner_;
    std::chrono::milliseconds delay_;
};

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    std::filesystem::path staging_ =
        std::filesystem::temp_directory_path() / "vc_test_orchestrator";
    SimulatedWorkerClient worker_{make_signer(), SimulatedWorkerConfig{
        .measurement = approved_measurement(),
        .signer_identity = std::string{SIGNER_ID}
    }};
    InMemoryAssetService assets_{staging_ / "assets"};
    InMemoryLedger ledger_;
    std::shared_ptr<CapturingSink::Lines> log_lines_ = std::make_shared<CapturingSink::Lines>();

    void SetUp() override {
        std::filesystem::remove_all(staging_);
        assets_.register_dataset(DATASET, 100, {{"region", {"eu", "us", "apac", "latam"}}});
    }

    void TearDown() override {
        std::filesystem::remove_all(staging_);
    }

    Config test_config() {
        auto config = fast_config(worker_.public_key(), approved_measurement());
        config.orchestrator.staging_dir = staging_;
        return config;
    }

    std::unique_ptr<Orchestrator> make_orchestrator(IWorkerClient& worker,
                                                    ILedgerService* ledger, Config config) {
        Orchestrator::Options opts{
            .config = std::move(config),
            .log_sink = std::make_unique<CapturingSink>(log_lines_),
            .log_level = LogLevel::Debug,
            .metrics_sink = nullptr,
            .signature_verifier = nullptr
        };
        return std::make_unique<Orchestrator>(std::move(opts), worker, assets_, ledger);
    }

    std::unique_ptr<Orchestrator> make_orchestrator() {
        return make_orchestrator(worker_, &ledger_, test_config());
    }

    static GroupRequest request(uint32_t partitions,
                                std::vector<std::string> metrics = {"accuracy"}) {
        PartitionConfig pc;
        pc.strategy = "equal_size";
        pc.num_partitions = partitions;
        return GroupRequest{
            .dataset_reference = DATASET,
            .algorithm_reference = {},
            .compute_config = ComputeConfig{.metrics = std::move(metrics)},
            .environment_name = "sklearn-cpu",
            .partition_config = pc
        };
    }

    static PollParams fast_poll(std::chrono::milliseconds timeout = 5000ms) {
        return PollParams{.interval = 5ms, .timeout = timeout, .status_timeout = 500ms};
    }

    static const Job& job_at(const TerminalOutcome& outcome, PartitionId pid) {
        return outcome.jobs.at(pid);
    }
};

// ═══════════════════════════════════════════════
// start_group validation
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, UnknownEnvironmentRejectedBeforeDispatch) {
    auto orch = make_orchestrator();
    auto req = request(2);
    req.environment_name = "quantum-annealer";

    auto group = orch->start_group(req);
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error().code, ErrorCode::EnvironmentUnsupported);
    EXPECT_EQ(worker_.submit_count(), 0u);
    EXPECT_EQ(orch->tracker().group_count(), 0u);
}

TEST_F(OrchestratorTest, OversizedResourceRequestRejected) {
    auto orch = make_orchestrator();
    auto req = request(2);
    req.compute_config.resources.memory_gb = 512;

    auto group = orch->start_group(req);
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error().code, ErrorCode::EnvironmentUnsupported);
}

TEST_F(OrchestratorTest, UnknownMetricRejected) {
    auto orch = make_orchestrator();
    auto group = orch->start_group(request(2, {"accuracy", "vibes"}));
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(worker_.submit_count(), 0u);
}

TEST_F(OrchestratorTest, MissingDatasetRejected) {
    auto orch = make_orchestrator();
    auto req = request(2);
    req.dataset_reference = "dataset://nowhere";

    auto group = orch->start_group(req);
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error().code, ErrorCode::AssetUnavailable);
}

TEST_F(OrchestratorTest, MissingAlgorithmRejected) {
    auto orch = make_orchestrator();
    auto req = request(2);
    req.algorithm_reference = "algorithm://unknown";

    auto group = orch->start_group(req);
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error().code, ErrorCode::AssetUnavailable);
}

TEST_F(OrchestratorTest, AssetOutageRejected) {
    auto orch = make_orchestrator();
    assets_.set_available(false);
    auto group = orch->start_group(request(2));
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error().code, ErrorCode::AssetUnavailable);
}

TEST_F(OrchestratorTest, TooManyPartitionsRejected) {
    auto orch = make_orchestrator();
    auto group = orch->start_group(request(101));
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(worker_.submit_count(), 0u);
}

TEST_F(OrchestratorTest, ConfiguredPartitioningIsDefault) {
    auto config = test_config();
    config.partitioning.strategy = "by_key";
    config.partitioning.num_partitions = 2;
    config.partitioning.key_field = "region";
    auto orch = make_orchestrator(worker_, &ledger_, std::move(config));

    auto req = request(1);
    req.partition_config.reset();
    auto group = orch->start_group(req);
    ASSERT_TRUE(group.has_value()) << group.error().message;

    auto jobs = orch->tracker().jobs_in_group(*group);
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<KeyFilter>(jobs[0].partition.scope));
}

// ═══════════════════════════════════════════════
// Dispatch and polling
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, HappyPath) {
    auto orch = make_orchestrator();
    auto group = orch->start_group(request(4));
    ASSERT_TRUE(group.has_value());
    EXPECT_EQ(worker_.submit_count(), 4u);

    for (const auto& job : orch->tracker().jobs_in_group(*group)) {
        EXPECT_EQ(job.status, JobStatus::Dispatched);
        EXPECT_TRUE(job.handle.has_value());
    }

    auto outcome = orch->poll_group(*group, fast_poll());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->all_terminal);
    EXPECT_TRUE(outcome->succeeded());
    EXPECT_EQ(outcome->completed, 4u);
    EXPECT_EQ(outcome->failed, 0u);

    for (const auto& job : outcome->jobs) {
        EXPECT_EQ(job.status, JobStatus::Completed);
        ASSERT_TRUE(job.verdict.has_value());
        EXPECT_TRUE(job.verdict->valid);
        EXPECT_FALSE(job.output.empty());
        EXPECT_TRUE(job.metrics.contains("accuracy"));
    }
}

TEST_F(OrchestratorTest, DispatchRejectionFailsOnlyThatJob) {
    worker_.script(1, PartitionScript{.fault = SimulatedFault::RejectSubmit});
    worker_.script(2, PartitionScript{.fault = SimulatedFault::ThrowOnSubmit});
    auto orch = make_orchestrator();

    auto group = orch->start_group(request(4));
    ASSERT_TRUE(group.has_value());

    auto outcome = orch->poll_group(*group, fast_poll());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->completed, 2u);
    EXPECT_EQ(job_at(*outcome, 1).failure_reason, FailureReason::DispatchFailure);
    EXPECT_EQ(job_at(*outcome, 2).failure_reason, FailureReason::DispatchFailure);
    EXPECT_NE(job_at(*outcome, 2).detail.find("connection reset"), std::string::npos);
    EXPECT_EQ(job_at(*outcome, 0).status, JobStatus::Completed);
    EXPECT_EQ(job_at(*outcome, 3).status, JobStatus::Completed);
}

TEST_F(OrchestratorTest, DispatchTimeout) {
    SlowSubmitWorker slow(worker_, 400ms);
    auto config = test_config();
    config.orchestrator.dispatch_timeout_ms = 50;
    auto orch = make_orchestrator(slow, &ledger_, std::move(config));

    auto group = orch->start_group(request(2));
    ASSERT_TRUE(group.has_value());

    for (const auto& job : orch->tracker().jobs_in_group(*group)) {
        EXPECT_EQ(job.status, JobStatus::Failed);
        EXPECT_EQ(job.failure_reason, FailureReason::DispatchFailure);
        EXPECT_NE(job.detail.find("timed out"), std::string::npos);
    }
}

TEST_F(OrchestratorTest, WorkerReportedFailure) {
    worker_.script(0, PartitionScript{.fault = SimulatedFault::ReportFailure});
    auto orch = make_orchestrator();

    auto group = orch->start_group(request(2));
    auto outcome = orch->poll_group(*group, fast_poll());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(job_at(*outcome, 0).failure_reason, FailureReason::WorkerReported);
    EXPECT_EQ(job_at(*outcome, 1).status, JobStatus::Completed);
}

TEST_F(OrchestratorTest, PollTimeout) {
    worker_.script(1, PartitionScript{.fault = SimulatedFault::NeverFinish});
    auto orch = make_orchestrator();

    auto group = orch->start_group(request(2));
    auto start = std::chrono::steady_clock::now();
    auto outcome = orch->poll_group(*group, fast_poll(300ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->all_terminal);
    EXPECT_EQ(outcome->completed, 1u);
    EXPECT_EQ(outcome->timed_out, 1u);
    EXPECT_EQ(job_at(*outcome, 1).failure_reason, FailureReason::Timeout);
    EXPECT_GE(elapsed, 300ms);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(OrchestratorTest, SlowStatusDoesNotBlockRound) {
    worker_.script(0, PartitionScript{.fault = SimulatedFault::NeverFinish,
                                           .status_delay = 500ms});
    auto orch = make_orchestrator();

    auto group = orch->start_group(request(2));
    auto outcome = orch->poll_group(*group, PollParams{
        .interval = 5ms, .timeout = 400ms, .status_timeout = 50ms});
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(job_at(*outcome, 1).status, JobStatus::Completed);
    EXPECT_EQ(job_at(*outcome, 0).failure_reason, FailureReason::Timeout);
}

TEST_F(OrchestratorTest, HungWorkerDoesNotStarveSiblings) {
    worker_.script(0, PartitionScript{.fault = SimulatedFault::NeverFinish,
                                           .status_delay = 1000ms});
    auto config = test_config();
    config.orchestrator.io_threads = 2;
    auto orch = make_orchestrator(worker_, &ledger_, std::move(config));

    auto group = orch->start_group(request(6));
    ASSERT_TRUE(group.has_value());
    auto outcome = orch->poll_group(*group, PollParams{
        .interval = 5ms, .timeout = 1500ms, .status_timeout = 50ms});

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->completed, 5u);
    EXPECT_EQ(outcome->timed_out, 1u);
    EXPECT_EQ(job_at(*outcome, 0).failure_reason, FailureReason::Timeout);
    for (PartitionId p = 1; p < 6; ++p) {
        EXPECT_EQ(job_at(*outcome, p).status, JobStatus::Completed) << "partition " << p;
    }
}

TEST_F(OrchestratorTest, QueuedDispatchIsTimedFromItsOwnStart) {
    SlowSubmitWorker slow(worker_, 200ms);
    auto config = test_config();
    config.orchestrator.io_threads = 2;
    config.orchestrator.dispatch_timeout_ms = 300;
    auto orch = make_orchestrator(slow, &ledger_, std::move(config));

    auto group = orch->start_group(request(4));
    ASSERT_TRUE(group.has_value());
    for (const auto& job : orch->tracker().jobs_in_group(*group)) {
        EXPECT_EQ(job.status, JobStatus::Dispatched) << job.job_id << ": " << job.detail;
    }
}

TEST_F(OrchestratorTest, SaturatedPoolFailsQueuedDispatch) {
    SlowSubmitWorker slow(worker_, 400ms);
    auto config = test_config();
    config.orchestrator.io_threads = 1;
    config.orchestrator.dispatch_timeout_ms = 50;
    auto orch = make_orchestrator(slow, &ledger_, std::move(config));

    auto group = orch->start_group(request(2));
    ASSERT_TRUE(group.has_value());

    auto first = orch->tracker().job(*group + "-p0");
    auto second = orch->tracker().job(*group + "-p1");
    EXPECT_EQ(first->failure_reason, FailureReason::DispatchFailure);
    EXPECT_NE(first->detail.find("timed out"), std::string::npos);
    EXPECT_EQ(second->failure_reason, FailureReason::DispatchFailure);
    EXPECT_NE(second->detail.find("never started"), std::string::npos);
}

TEST_F(OrchestratorTest, UnknownGroup) {
    auto orch = make_orchestrator();
    EXPECT_FALSE(orch->poll_group("grp-404", fast_poll()).has_value());
    EXPECT_FALSE(orch->cancel_group("grp-404").has_value());
    auto agg = orch->aggregate("grp-404");
    ASSERT_FALSE(agg.has_value());
    EXPECT_EQ(agg.error().code, ErrorCode::ConfigurationError);
}

// ═══════════════════════════════════════════════
// Verification gating
// ═══════════════════════════════════════════════

struct GatingCase {
    SimulatedFault fault;
    FailureReason expected;
};

class OrchestratorGatingTest : public OrchestratorTest,
                               public ::testing::WithParamInterface<GatingCase> {};

TEST_P(OrchestratorGatingTest, FaultyPartitionNeverCompletes) {
    const auto& param = GetParam();
    worker_.script(0, PartitionScript{.fault = param.fault});
    auto orch = make_orchestrator();

    auto group = orch->start_group(request(2));
    ASSERT_TRUE(group.has_value());
    auto outcome = orch->poll_group(*group, fast_poll());
    ASSERT_TRUE(outcome.has_value());

    const auto& bad = job_at(*outcome, 0);
    EXPECT_EQ(bad.status, JobStatus::Failed);
    EXPECT_EQ(bad.failure_reason, param.expected) << to_string(param.fault);
    EXPECT_EQ(job_at(*outcome, 1).status, JobStatus::Completed);

    auto result = orch->aggregate(*group);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->success_count, 1u);
    ASSERT_EQ(result->merged_results.size(), 1u);
    EXPECT_EQ(result->merged_results[0].partition_id, 1u);
}

INSTANTIATE_TEST_SUITE_P(
    Faults, OrchestratorGatingTest,
    ::testing::Values(
        GatingCase{SimulatedFault::TamperedMeasurement, FailureReason::VerificationFailed},
        GatingCase{SimulatedFault::BadSignature, FailureReason::VerificationFailed},
        GatingCase{SimulatedFault::StaleAttestation, FailureReason::VerificationFailed},
        GatingCase{SimulatedFault::MissingAttestation, FailureReason::VerificationFailed},
        GatingCase{SimulatedFault::TamperedOutput, FailureReason::ResultUnavailable},
        GatingCase{SimulatedFault::MissingResult, FailureReason::ResultUnavailable}),
    [](const ::testing::TestParamInfo<GatingCase>& info) {
        return std::string(to_string(info.param.fault));
    });

TEST_F(OrchestratorTest, RejectedAttestationIsKept) {
    worker_.script(0, PartitionScript{.fault = SimulatedFault::TamperedMeasurement});
    auto orch = make_orchestrator();

    auto group = orch->start_group(request(1));
    auto outcome = orch->poll_group(*group, fast_poll());
    ASSERT_TRUE(outcome.has_value());

    const auto& job = job_at(*outcome, 0);
    ASSERT_TRUE(job.attestation.has_value());
    ASSERT_TRUE(job.verdict.has_value());
    EXPECT_EQ(job.verdict->reason, VerificationReason::MeasurementMismatch);
    EXPECT_TRUE(job.verified_at.has_value());
}

// ═══════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, CancelInterruptsPolling) {
    for (PartitionId p = 0; p < 3; ++p) {
        worker_.script(p, PartitionScript{.fault = SimulatedFault::NeverFinish});
    }
    auto orch = make_orchestrator();
    auto group = orch->start_group(request(3));
    ASSERT_TRUE(group.has_value());

    std::thread canceller([&] {
        std::this_thread::sleep_for(100ms);
        auto cancelled = orch->cancel_group(*group);
        EXPECT_TRUE(cancelled.has_value());
        EXPECT_EQ(*cancelled, 3u);
    });

    auto start = std::chrono::steady_clock::now();
    auto outcome = orch->poll_group(*group, fast_poll(10s));
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_LT(elapsed, 3s);
    EXPECT_EQ(outcome->cancelled, 3u);
    EXPECT_EQ(outcome->timed_out, 0u);
    for (const auto& job : outcome->jobs) {
        EXPECT_EQ(job.failure_reason, FailureReason::Cancelled);
    }
}

TEST_F(OrchestratorTest, CancelLeavesTerminalJobsAlone) {
    worker_.script(1, PartitionScript{.fault = SimulatedFault::NeverFinish});
    auto orch = make_orchestrator();
    auto group = orch->start_group(request(2));
    auto outcome = orch->poll_group(*group, fast_poll(200ms));
    ASSERT_TRUE(outcome.has_value());

    auto cancelled = orch->cancel_group(*group);
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(*cancelled, 0u);
    EXPECT_EQ(orch->tracker().job(*group + "-p0")->status, JobStatus::Completed);
    EXPECT_EQ(orch->tracker().job(*group + "-p1")->failure_reason, FailureReason::Timeout);
}

TEST_F(OrchestratorTest, TerminalGroupsDropPollState) {
    auto orch = make_orchestrator();
    auto polled = orch->start_group(request(2));
    auto cancelled = orch->start_group(request(2));
    ASSERT_TRUE(polled.has_value());
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(orch->active_group_count(), 2u);

    ASSERT_TRUE(orch->poll_group(*polled, fast_poll()).has_value());
    EXPECT_EQ(orch->active_group_count(), 1u);
    ASSERT_TRUE(orch->cancel_group(*cancelled).has_value());
    EXPECT_EQ(orch->active_group_count(), 0u);

    // Still answerable after the poll state is gone.
    auto again = orch->poll_group(*polled, fast_poll());
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->completed, 2u);
    EXPECT_EQ(*orch->cancel_group(*polled), 0u);
}

TEST_F(OrchestratorTest, ReleaseGroup) {
    worker_.script(0, PartitionScript{.fault = SimulatedFault::NeverFinish});
    auto orch = make_orchestrator();
    auto group = orch->start_group(request(2));
    ASSERT_TRUE(group.has_value());

    auto early = orch->release_group(*group);
    ASSERT_FALSE(early.has_value());
    EXPECT_EQ(early.error().code, ErrorCode::GroupNotTerminal);

    ASSERT_TRUE(orch->poll_group(*group, fast_poll(200ms)).has_value());
    ASSERT_TRUE(orch->aggregate(*group).has_value());
    EXPECT_TRUE(orch->release_group(*group).has_value());
    EXPECT_EQ(orch->tracker().group_count(), 0u);
    EXPECT_EQ(orch->tracker().job_count(), 0u);
    EXPECT_EQ(orch->active_group_count(), 0u);

    auto again = orch->release_group(*group);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::ConfigurationError);
}

// ═══════════════════════════════════════════════
// Aggregation, ledger and publishing
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, AggregateBeforeTerminalRejected) {
    worker_.script(0, PartitionScript{.fault = SimulatedFault::NeverFinish});
    auto orch = make_orchestrator();
    auto group = orch->start_group(request(2));

    auto result = orch->aggregate(*group);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::GroupNotTerminal);
}

TEST_F(OrchestratorTest, CommitResult) {
    worker_.script(3, PartitionScript{.fault = SimulatedFault::ReportFailure});
    auto orch = make_orchestrator();

    auto group = orch->start_group(request(4));
    ASSERT_TRUE(orch->poll_group(*group, fast_poll()).has_value());
    auto result = orch->aggregate(*group);
    ASSERT_TRUE(result.has_value());

    auto commit = orch->commit_result(*result);
    ASSERT_TRUE(commit.has_value()) << commit.error().message;
    EXPECT_EQ(commit->digest, aggregate_digest(*result));
    // 4 partitions * 10.0 * 1.2
    EXPECT_DOUBLE_EQ(commit->payment.amount, 48.0);
    EXPECT_EQ(commit->payment.recipient, "compute-provider");
    EXPECT_EQ(commit->records.size(), 3u);

    auto records = ledger_.records();
    ASSERT_EQ(records.size(), 3u);
    for (const auto& rec : records) {
        EXPECT_EQ(rec.result_hash, commit->digest);
    }
    EXPECT_EQ(records[0].job_id, *group + "-p0");
    EXPECT_EQ(ledger_.payments().size(), 1u);
}

TEST_F(OrchestratorTest, CommitWithoutLedgerFails) {
    auto orch = make_orchestrator(worker_, nullptr, test_config());
    auto result = orch->run_to_completion(request(1));
    ASSERT_TRUE(result.has_value());

    auto commit = orch->commit_result(*result);
    ASSERT_FALSE(commit.has_value());
    EXPECT_EQ(commit.error().code, ErrorCode::LedgerSubmissionFailed);
}

TEST_F(OrchestratorTest, CommitWithoutSuccessesFails) {
    worker_.script(0, PartitionScript{.fault = SimulatedFault::ReportFailure});
    auto orch = make_orchestrator();
    auto result = orch->run_to_completion(request(1));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->success_count, 0u);

    EXPECT_FALSE(orch->commit_result(*result).has_value());
    EXPECT_TRUE(ledger_.payments().empty());
}

TEST_F(OrchestratorTest, LedgerFailureReported) {
    auto orch = make_orchestrator();
    auto result = orch->run_to_completion(request(2));
    ASSERT_TRUE(result.has_value());

    ledger_.set_fail_records(true);
    auto commit = orch->commit_result(*result);
    ASSERT_FALSE(commit.has_value());
    EXPECT_EQ(commit.error().code, ErrorCode::LedgerSubmissionFailed);
}

TEST_F(OrchestratorTest, PublishResult) {
    auto orch = make_orchestrator();
    auto result = orch->run_to_completion(request(2));
    ASSERT_TRUE(result.has_value());

    size_t before = assets_.asset_count();
    auto reference = orch->publish_result(*result, "evaluation-report");
    ASSERT_TRUE(reference.has_value()) << reference.error().message;
    EXPECT_EQ(assets_.asset_count(), before + 1);

    auto meta = assets_.resolve(*reference);
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->name, "evaluation-report");

    auto local = assets_.download(*reference);
    ASSERT_TRUE(local.has_value());
    EXPECT_TRUE(std::filesystem::exists(*local));
    EXPECT_GT(std::filesystem::file_size(*local), 0u);
}

TEST_F(OrchestratorTest, PublishFailsWhenServiceDown) {
    auto orch = make_orchestrator();
    auto result = orch->run_to_completion(request(1));
    ASSERT_TRUE(result.has_value());

    assets_.set_available(false);
    auto reference = orch->publish_result(*result, "report");
    ASSERT_FALSE(reference.has_value());
    EXPECT_EQ(reference.error().code, ErrorCode::AssetUnavailable);
}

TEST_F(OrchestratorTest, LogsLifecycle) {
    auto orch = make_orchestrator();
    auto group = orch->run_to_completion(request(2));
    ASSERT_TRUE(group.has_value());
    orch->logger().flush();

    bool created = false, polled = false, aggregated = false;
    for (const auto& line : log_lines_->snapshot()) {
        if (line.find("created: dataset=") != std::string::npos) created = true;
        if (line.find("polled: completed=2") != std::string::npos) polled = true;
        if (line.find("aggregated: succeeded=2/2") != std::string::npos) aggregated = true;
    }
    EXPECT_TRUE(created);
    EXPECT_TRUE(polled);
    EXPECT_TRUE(aggregated);
}
