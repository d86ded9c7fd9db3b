#include "../include/lifecycle.hpp"
#include <filesystem>

Lifecycle::Lifecycle(JobStore& store, EventSink& sink, ActiveJobs& active, RetryPolicy policy, Clock clock)
    : store_(store), sink_(sink), active_(active), policy_(policy), clock_(std::move(clock)) {}

JobRecord Lifecycle::apply(const std::string& id, JobEvent ev) {
    if (ev.now == 0) ev.now = clock_();
    Transition t;
    JobRecord job = store_.mutate(id, [&](JobRecord& r) {
        t = plan_transition(r, ev, policy_);
        apply_transition(r, ev, t);
    });

    if (t.from != t.to) {
        nlohmann::json payload{{"from", to_string(t.from)},
                               {"to", to_string(t.to)},
                               {"event", to_string(ev.kind)},
                               {"attempt_count", job.attempt_count},
                               {"max_attempts", job.max_attempts},
                               {"progress_percent", job.progress_percent}};
        if (t.to == JobState::Failed || t.has(kEffectBackoff)) {
            payload["last_error"] = job.last_error;
            payload["eligible_at"] = job.eligible_at;
        }
        emit(id, "state", std::move(payload));
        log_info("job", id + " " + to_string(t.from) + " -> " + to_string(t.to) +
                            (job.last_error.empty() || t.to == JobState::Completed ? "" : " (" + job.last_error + ")"));
    }

    if (t.has(kEffectAbortWorker)) active_.signal_abort(id, to_string(ev.kind));
    if (t.has(kEffectDiscardLocal)) discard_local(job);
    if (job.claimed_by.empty() &&
        (job.state == JobState::Pending || job.state == JobState::Fetched || is_active(job.state))) {
        wake_all();
    }
    return job;
}

std::size_t Lifecycle::add_waker(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(wakers_mtx_);
    wakers_[++next_waker_] = std::move(fn);
    return next_waker_;
}

void Lifecycle::remove_waker(std::size_t handle) {
    std::lock_guard<std::mutex> lock(wakers_mtx_);
    wakers_.erase(handle);
}

void Lifecycle::wake_all() {
    std::lock_guard<std::mutex> lock(wakers_mtx_);
    for (auto& kv : wakers_) kv.second();
}

void Lifecycle::emit(const std::string& job_id, const std::string& kind, nlohmann::json payload) {
    PipelineEvent ev;
    ev.job_id = job_id;
    ev.kind = kind;
    ev.payload = std::move(payload);
    ev.at = clock_();
    sink_.emit(std::move(ev));
}

void Lifecycle::discard_local(const JobRecord& job) {
    if (job.local_path.empty()) return;
    std::error_code ec;
    if (std::filesystem::remove(job.local_path, ec)) {
        log_info("job", job.id + " removed local copy " + job.local_path);
    } else if (ec) {
        log_warn("job", job.id + " could not remove " + job.local_path + ": " + ec.message());
    }
}
