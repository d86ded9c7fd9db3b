#pragma once
#include "event_sink.hpp"
#include "job_store.hpp"
#include "progress.hpp"
#include "retry_policy.hpp"
#include "state_machine.hpp"
#include "util.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Applies state machine events to stored jobs: plan and write under the
// store's per-job compare-and-set, then emit the state event and carry out
// the effects that live outside the record.
class Lifecycle {
public:
    Lifecycle(JobStore& store, EventSink& sink, ActiveJobs& active, RetryPolicy policy, Clock clock);

    // Throws InvalidTransition, NotFound, or InvariantViolation; nothing is
    // written in that case.
    JobRecord apply(const std::string& id, JobEvent ev);

    // Called after any transition that leaves a job claimable.
    std::size_t add_waker(std::function<void()> fn);
    void remove_waker(std::size_t handle);

    void emit(const std::string& job_id, const std::string& kind, nlohmann::json payload);

    // Deletes the fetched copy of `job` from local disk, if any.
    void discard_local(const JobRecord& job);

    JobStore& store() { return store_; }
    ActiveJobs& active() { return active_; }
    const RetryPolicy& policy() const { return policy_; }
    std::int64_t now() const { return clock_(); }
    const Clock& clock() const { return clock_; }

private:
    void wake_all();

    JobStore& store_;
    EventSink& sink_;
    ActiveJobs& active_;
    RetryPolicy policy_;
    Clock clock_;
    std::mutex wakers_mtx_;
    std::size_t next_waker_{0};
    std::map<std::size_t, std::function<void()>> wakers_;
};
