/**
 * @file test_job_tracker.cpp
 * @brief Unit tests for job state tracking and the lifecycle state machine.
 */

#include "tracker/job_tracker.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace verified_compute;

namespace {

std::vector<Partition> make_partitions(uint32_t count) {
    DatasetDescriptor ds{.reference = "dataset://jobs", .record_count = count * 10ULL, .key_domains = {}};
    PartitionConfig config;
    config.num_partitions = count;
    return *partition(ds, config);
}

CompletionRecord completion(const JobId& id) {
    return CompletionRecord{
        .attestation = Attestation{.subject_job_id = id},
        .verdict = VerificationVerdict{.valid = true, .reason = VerificationReason::Verified,
                                       .confidence = 1.0},
        .verified_at = std::chrono::system_clock::now(),
        .result_handle = "res-1",
        .output = Bytes{1, 2, 3},
        .metrics = {{"accuracy", 0.9}},
        .compute_time = Duration{1500}
    };
}

}  // namespace

class JobTrackerTest : public ::testing::Test {
protected:
    JobTracker tracker_;
    GroupId group_ = tracker_.create_group(make_partitions(3), "sklearn-cpu");

    JobId job_id(uint32_t partition) const {
        return group_ + "-p" + std::to_string(partition);
    }
};

TEST_F(JobTrackerTest, CreateGroup) {
    EXPECT_EQ(tracker_.group_count(), 1u);
    EXPECT_EQ(tracker_.job_count(), 3u);

    auto grp = tracker_.group(group_);
    ASSERT_TRUE(grp.has_value());
    EXPECT_EQ(grp->job_ids.size(), 3u);
    EXPECT_EQ(grp->environment_name, "sklearn-cpu");
    EXPECT_EQ(grp->dataset_reference, "dataset://jobs");

    auto jobs = tracker_.jobs_in_group(group_);
    ASSERT_EQ(jobs.size(), 3u);
    for (uint32_t i = 0; i < 3; ++i) {
        EXPECT_EQ(jobs[i].job_id, job_id(i));
        EXPECT_EQ(jobs[i].partition.partition_id, i);
        EXPECT_EQ(jobs[i].status, JobStatus::Pending);
        EXPECT_FALSE(jobs[i].handle.has_value());
    }
}

TEST_F(JobTrackerTest, GroupIdsAreUnique) {
    auto second = tracker_.create_group(make_partitions(1), "sklearn-cpu");
    EXPECT_NE(second, group_);
    EXPECT_EQ(tracker_.group_count(), 2u);
    EXPECT_EQ(tracker_.job_count(), 4u);
}

TEST_F(JobTrackerTest, HappyPathLifecycle) {
    auto id = job_id(0);
    EXPECT_TRUE(tracker_.mark_dispatched(id, "sim-1"));
    auto j = tracker_.job(id);
    EXPECT_EQ(j->status, JobStatus::Dispatched);
    EXPECT_EQ(j->handle, std::optional<JobHandle>("sim-1"));
    EXPECT_TRUE(j->start_time.has_value());
    EXPECT_FALSE(j->end_time.has_value());

    EXPECT_TRUE(tracker_.mark_running(id));
    EXPECT_TRUE(tracker_.mark_completed(id, completion(id)));

    j = tracker_.job(id);
    EXPECT_EQ(j->status, JobStatus::Completed);
    EXPECT_TRUE(j->end_time.has_value());
    EXPECT_GE(*j->end_time, *j->start_time);
    EXPECT_EQ(j->result_handle, std::optional<ResultHandle>("res-1"));
    EXPECT_DOUBLE_EQ(j->metrics.at("accuracy"), 0.9);
    EXPECT_EQ(j->compute_time, Duration{1500});
    EXPECT_TRUE(j->verdict->valid);
}

TEST_F(JobTrackerTest, TerminalStatesAreFinal) {
    auto id = job_id(1);
    ASSERT_TRUE(tracker_.mark_dispatched(id, "sim-2"));
    ASSERT_TRUE(tracker_.mark_failed(id, FailureReason::Timeout, "deadline"));

    // Late updates are ignored
    EXPECT_FALSE(tracker_.mark_running(id));
    EXPECT_FALSE(tracker_.mark_completed(id, completion(id)));
    EXPECT_FALSE(tracker_.mark_failed(id, FailureReason::Cancelled, "late"));

    auto j = tracker_.job(id);
    EXPECT_EQ(j->status, JobStatus::Failed);
    EXPECT_EQ(j->failure_reason, FailureReason::Timeout);
    EXPECT_EQ(j->detail, "deadline");
}

TEST_F(JobTrackerTest, NoBackwardTransitions) {
    auto id = job_id(0);
    ASSERT_TRUE(tracker_.mark_dispatched(id, "sim-1"));
    ASSERT_TRUE(tracker_.mark_running(id));
    EXPECT_FALSE(tracker_.mark_dispatched(id, "sim-9"));
    EXPECT_FALSE(tracker_.mark_running(id));
    EXPECT_EQ(tracker_.job(id)->handle, std::optional<JobHandle>("sim-1"));
}

TEST_F(JobTrackerTest, PendingMayFailDirectly) {
    EXPECT_TRUE(tracker_.mark_failed(job_id(2), FailureReason::DispatchFailure, "rejected"));
    EXPECT_EQ(tracker_.job(job_id(2))->status, JobStatus::Failed);
}

TEST_F(JobTrackerTest, VerificationFailureKeepsEvidence) {
    auto id = job_id(0);
    ASSERT_TRUE(tracker_.mark_dispatched(id, "sim-1"));

    Attestation att{.subject_job_id = id, .measurement = "bad"};
    VerificationVerdict verdict{.valid = false, .reason = VerificationReason::MeasurementMismatch,
                                .confidence = 0.0};
    auto now = std::chrono::system_clock::now();
    EXPECT_TRUE(tracker_.mark_verification_failed(id, att, verdict, now, "measurement_mismatch"));

    auto j = tracker_.job(id);
    EXPECT_EQ(j->status, JobStatus::Failed);
    EXPECT_EQ(j->failure_reason, FailureReason::VerificationFailed);
    EXPECT_EQ(j->attestation->measurement, "bad");
    EXPECT_EQ(j->verdict->reason, VerificationReason::MeasurementMismatch);
    EXPECT_EQ(j->verified_at, std::optional<Timestamp>(now));
}

TEST_F(JobTrackerTest, DemoteOnlyFromCompleted) {
    auto id = job_id(0);
    VerificationVerdict rejected{.valid = false, .reason = VerificationReason::StaleAttestation,
                                 .confidence = 0.0};
    EXPECT_FALSE(tracker_.demote_completed(id, rejected, "stale"));

    ASSERT_TRUE(tracker_.mark_dispatched(id, "sim-1"));
    ASSERT_TRUE(tracker_.mark_completed(id, completion(id)));
    EXPECT_TRUE(tracker_.demote_completed(id, rejected, "stale"));

    auto j = tracker_.job(id);
    EXPECT_EQ(j->status, JobStatus::Failed);
    EXPECT_EQ(j->failure_reason, FailureReason::VerificationFailed);
    EXPECT_EQ(j->verdict->reason, VerificationReason::StaleAttestation);

    // Already failed: nothing more to demote
    EXPECT_FALSE(tracker_.demote_completed(id, rejected, "stale"));
}

TEST_F(JobTrackerTest, GroupTermination) {
    EXPECT_FALSE(tracker_.is_group_terminal(group_));
    EXPECT_EQ(tracker_.non_terminal_jobs(group_).size(), 3u);

    tracker_.mark_failed(job_id(0), FailureReason::Cancelled, "");
    tracker_.mark_failed(job_id(1), FailureReason::Cancelled, "");
    EXPECT_EQ(tracker_.non_terminal_jobs(group_), std::vector<JobId>{job_id(2)});
    EXPECT_FALSE(tracker_.is_group_terminal(group_));

    tracker_.mark_completed(job_id(2), completion(job_id(2)));
    EXPECT_TRUE(tracker_.is_group_terminal(group_));

    auto counts = tracker_.status_counts(group_);
    EXPECT_EQ(counts[JobStatus::Failed], 2u);
    EXPECT_EQ(counts[JobStatus::Completed], 1u);
}

TEST_F(JobTrackerTest, RemoveOnlyTerminalGroups) {
    auto other = tracker_.create_group(make_partitions(2), "sklearn-cpu");
    EXPECT_FALSE(tracker_.remove_group(group_));

    for (uint32_t p = 0; p < 3; ++p) {
        tracker_.mark_failed(job_id(p), FailureReason::Cancelled, "");
    }
    EXPECT_TRUE(tracker_.remove_group(group_));
    EXPECT_FALSE(tracker_.group(group_).has_value());
    EXPECT_FALSE(tracker_.job(job_id(0)).has_value());
    EXPECT_EQ(tracker_.group_count(), 1u);
    EXPECT_EQ(tracker_.job_count(), 2u);
    EXPECT_TRUE(tracker_.group(other).has_value());

    EXPECT_FALSE(tracker_.remove_group(group_));
}

TEST_F(JobTrackerTest, UnknownIds) {
    EXPECT_FALSE(tracker_.job("missing").has_value());
    EXPECT_FALSE(tracker_.group("missing").has_value());
    EXPECT_TRUE(tracker_.jobs_in_group("missing").empty());
    EXPECT_FALSE(tracker_.is_group_terminal("missing"));
    EXPECT_FALSE(tracker_.mark_running("missing"));
}

TEST_F(JobTrackerTest, ObserverSeesEveryTransition) {
    std::vector<std::pair<JobId, JobStatus>> seen;
    tracker_.set_observer([&](const Job& j) { seen.emplace_back(j.job_id, j.status); });

    tracker_.mark_dispatched(job_id(0), "sim-1");
    tracker_.mark_running(job_id(0));
    tracker_.mark_running(job_id(0));    // rejected, not observed
    tracker_.mark_failed(job_id(0), FailureReason::WorkerReported, "oom");

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].second, JobStatus::Dispatched);
    EXPECT_EQ(seen[1].second, JobStatus::Running);
    EXPECT_EQ(seen[2].second, JobStatus::Failed);
}

TEST_F(JobTrackerTest, ConcurrentTerminalRaceHasOneWinner) {
    auto id = job_id(0);
    ASSERT_TRUE(tracker_.mark_dispatched(id, "sim-1"));

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            bool won = (i % 2 == 0)
                ? tracker_.mark_completed(id, completion(id))
                : tracker_.mark_failed(id, FailureReason::Timeout, "race");
            if (won) winners.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_TRUE(is_terminal(tracker_.job(id)->status));
}

TEST_F(JobTrackerTest, ConcurrentUpdatesAcrossJobs) {
    auto big = tracker_.create_group(make_partitions(64), "sklearn-cpu");
    auto ids = tracker_.group(big)->job_ids;

    std::vector<std::thread> threads;
    for (size_t t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (size_t i = t; i < ids.size(); i += 4) {
                tracker_.mark_dispatched(ids[i], "h" + std::to_string(i));
                tracker_.mark_running(ids[i]);
                tracker_.mark_completed(ids[i], completion(ids[i]));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_TRUE(tracker_.is_group_terminal(big));
    EXPECT_EQ(tracker_.status_counts(big)[JobStatus::Completed], 64u);
}
