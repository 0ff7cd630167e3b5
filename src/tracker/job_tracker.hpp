/**
 * @file job_tracker.hpp
 * @brief Single source of truth for job and job-group state.
 *
 * Jobs and groups live in arena-style maps indexed by id. Each job has its
 * own mutex, so updates to one job are serialized while updates to
 * different jobs proceed in parallel. The index maps change under a
 * shared_mutex, growing when a group is created and shrinking when a
 * terminal group is removed.
 *
 * Every mutator enforces the forward-only state machine and returns false
 * when the requested transition is not allowed from the job's current
 * state (for example a late dispatch acknowledgment for a job that has
 * already timed out).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "tracker/job.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace verified_compute {

/**
 * @brief Notified after every successful status change.
 */
using TransitionObserver = std::function<void(const Job&)>;

class JobTracker {
public:
    JobTracker() = default;

    // Non-copyable
    JobTracker(const JobTracker&) = delete;
    JobTracker& operator=(const JobTracker&) = delete;

    // ── Construction ──────────────────────────

    /// Register a group with one Pending job per partition.
    GroupId create_group(const std::vector<Partition>& partitions,
                         const std::string& environment_name);

    void set_observer(TransitionObserver observer);

    /**
     * @brief Drop a group and its jobs. Only terminal groups are removed.
     *
     * The caller must ensure nothing else is still operating on the group.
     */
    bool remove_group(const GroupId& id);

    // ── Transitions ───────────────────────────

    bool mark_dispatched(const JobId& id, const JobHandle& handle);
    bool mark_running(const JobId& id);
    bool mark_completed(const JobId& id, CompletionRecord record);
    bool mark_failed(const JobId& id, FailureReason reason, std::string detail);

    /// Record a rejected attestation and fail the job.
    bool mark_verification_failed(const JobId& id, const Attestation& attestation,
                                  const VerificationVerdict& verdict, Timestamp verified_at,
                                  std::string detail);

    /**
     * @brief The one permitted terminal change: Completed → Failed when a
     *        re-verification rejects the attestation.
     */
    bool demote_completed(const JobId& id, const VerificationVerdict& verdict,
                          std::string detail);

    // ── Queries ───────────────────────────────

    [[nodiscard]] std::optional<Job> job(const JobId& id) const;
    [[nodiscard]] std::optional<JobGroup> group(const GroupId& id) const;
    [[nodiscard]] std::vector<Job> jobs_in_group(const GroupId& id) const;
    [[nodiscard]] std::vector<JobId> non_terminal_jobs(const GroupId& id) const;
    [[nodiscard]] bool is_group_terminal(const GroupId& id) const;
    [[nodiscard]] std::map<JobStatus, size_t> status_counts(const GroupId& id) const;
    [[nodiscard]] size_t group_count() const;
    [[nodiscard]] size_t job_count() const;

private:
    struct JobEntry {
        mutable std::mutex mutex;
        Job job;
    };

    using Mutator = std::function<void(Job&)>;

    /// Apply a transition to `to` under the job's lock if the state machine allows it.
    bool transition(const JobId& id, JobStatus to, const Mutator& mutate);

    JobEntry* find_entry(const JobId& id) const;

    mutable std::shared_mutex index_mutex_;
    std::unordered_map<JobId, std::unique_ptr<JobEntry>> jobs_;
    std::unordered_map<GroupId, JobGroup> groups_;
    std::atomic<uint64_t> next_group_{1};

    std::mutex observer_mutex_;
    TransitionObserver observer_;
};

/**
 * @brief Whether the forward-only state machine allows from → to.
 */
[[nodiscard]] constexpr bool is_allowed_transition(JobStatus from, JobStatus to) noexcept {
    if (is_terminal(from)) return false;
    if (to == JobStatus::Failed) return true;
    return status_rank(to) > status_rank(from);
}

}  // namespace verified_compute
