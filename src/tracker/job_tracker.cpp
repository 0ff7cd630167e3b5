/**
 * @file job_tracker.cpp
 * @brief JobTracker implementation.
 */

#include "tracker/job_tracker.hpp"

#include <chrono>

namespace verified_compute {

GroupId JobTracker::create_group(const std::vector<Partition>& partitions,
                                 const std::string& environment_name) {
    GroupId group_id = "grp-" + std::to_string(next_group_.fetch_add(1));

    JobGroup group{
        .group_id = group_id,
        .job_ids = {},
        .creation_time = std::chrono::system_clock::now(),
        .environment_name = environment_name,
        .dataset_reference = partitions.empty() ? std::string{}
                                                : partitions.front().dataset_reference
    };
    group.job_ids.reserve(partitions.size());

    std::unique_lock lock(index_mutex_);
    for (const auto& part : partitions) {
        auto entry = std::make_unique<JobEntry>();
        entry->job.job_id = group_id + "-p" + std::to_string(part.partition_id);
        entry->job.group_id = group_id;
        entry->job.partition = part;
        entry->job.environment_name = environment_name;

        group.job_ids.push_back(entry->job.job_id);
        jobs_.emplace(entry->job.job_id, std::move(entry));
    }
    groups_.emplace(group_id, std::move(group));
    return group_id;
}

void JobTracker::set_observer(TransitionObserver observer) {
    std::lock_guard lock(observer_mutex_);
    observer_ = std::move(observer);
}

bool JobTracker::remove_group(const GroupId& id) {
    if (!is_group_terminal(id)) return false;

    std::unique_lock lock(index_mutex_);
    auto it = groups_.find(id);
    if (it == groups_.end()) return false;
    for (const auto& job_id : it->second.job_ids) {
        jobs_.erase(job_id);
    }
    groups_.erase(it);
    return true;
}

JobTracker::JobEntry* JobTracker::find_entry(const JobId& id) const {
    std::shared_lock lock(index_mutex_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second.get();
}

bool JobTracker::transition(const JobId& id, JobStatus to, const Mutator& mutate) {
    auto* entry = find_entry(id);
    if (!entry) return false;

    Job snapshot;
    {
        std::lock_guard lock(entry->mutex);
        if (!is_allowed_transition(entry->job.status, to)) return false;

        mutate(entry->job);
        entry->job.status = to;
        if (is_terminal(to)) {
            entry->job.end_time = std::chrono::system_clock::now();
        }
        snapshot = entry->job;
    }

    TransitionObserver observer;
    {
        std::lock_guard lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) observer(snapshot);
    return true;
}

bool JobTracker::mark_dispatched(const JobId& id, const JobHandle& handle) {
    return transition(id, JobStatus::Dispatched, [&](Job& job) {
        job.handle = handle;
        job.start_time = std::chrono::system_clock::now();
    });
}

bool JobTracker::mark_running(const JobId& id) {
    return transition(id, JobStatus::Running, [](Job&) {});
}

bool JobTracker::mark_completed(const JobId& id, CompletionRecord record) {
    return transition(id, JobStatus::Completed, [&](Job& job) {
        job.attestation = std::move(record.attestation);
        job.verdict = record.verdict;
        job.verified_at = record.verified_at;
        job.result_handle = std::move(record.result_handle);
        job.output = std::move(record.output);
        job.metrics = std::move(record.metrics);
        job.compute_time = record.compute_time;
    });
}

bool JobTracker::mark_failed(const JobId& id, FailureReason reason, std::string detail) {
    return transition(id, JobStatus::Failed, [&](Job& job) {
        job.failure_reason = reason;
        job.detail = std::move(detail);
    });
}

bool JobTracker::mark_verification_failed(const JobId& id, const Attestation& attestation,
                                          const VerificationVerdict& verdict,
                                          Timestamp verified_at, std::string detail) {
    return transition(id, JobStatus::Failed, [&](Job& job) {
        job.failure_reason = FailureReason::VerificationFailed;
        job.detail = std::move(detail);
        job.attestation = attestation;
        job.verdict = verdict;
        job.verified_at = verified_at;
    });
}

bool JobTracker::demote_completed(const JobId& id, const VerificationVerdict& verdict,
                                  std::string detail) {
    auto* entry = find_entry(id);
    if (!entry) return false;

    Job snapshot;
    {
        std::lock_guard lock(entry->mutex);
        if (entry->job.status != JobStatus::Completed) return false;

        entry->job.status = JobStatus::Failed;
        entry->job.failure_reason = FailureReason::VerificationFailed;
        entry->job.verdict = verdict;
        entry->job.detail = std::move(detail);
        snapshot = entry->job;
    }

    TransitionObserver observer;
    {
        std::lock_guard lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) observer(snapshot);
    return true;
}

std::optional<Job> JobTracker::job(const JobId& id) const {
    auto* entry = find_entry(id);
    if (!entry) return std::nullopt;
    std::lock_guard lock(entry->mutex);
    return entry->job;
}

std::optional<JobGroup> JobTracker::group(const GroupId& id) const {
    std::shared_lock lock(index_mutex_);
    auto it = groups_.find(id);
    if (it == groups_.end()) return std::nullopt;
    return it->second;
}

std::vector<Job> JobTracker::jobs_in_group(const GroupId& id) const {
    std::vector<Job> out;
    auto grp = group(id);
    if (!grp) return out;

    out.reserve(grp->job_ids.size());
    for (const auto& job_id : grp->job_ids) {
        if (auto j = job(job_id)) out.push_back(std::move(*j));
    }
    return out;
}

std::vector<JobId> JobTracker::non_terminal_jobs(const GroupId& id) const {
    std::vector<JobId> out;
    for (const auto& j : jobs_in_group(id)) {
        if (!is_terminal(j.status)) out.push_back(j.job_id);
    }
    return out;
}

bool JobTracker::is_group_terminal(const GroupId& id) const {
    auto grp = group(id);
    if (!grp) return false;
    return non_terminal_jobs(id).empty();
}

std::map<JobStatus, size_t> JobTracker::status_counts(const GroupId& id) const {
    std::map<JobStatus, size_t> counts;
    for (const auto& j : jobs_in_group(id)) {
        ++counts[j.status];
    }
    return counts;
}

size_t JobTracker::group_count() const {
    std::shared_lock lock(index_mutex_);
    return groups_.size();
}

size_t JobTracker::job_count() const {
    std::shared_lock lock(index_mutex_);
    return jobs_.size();
}

}  // namespace verified_compute
