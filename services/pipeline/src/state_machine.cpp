#include "../include/state_machine.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

[[noreturn]] void reject(const JobRecord& job, const JobEvent& ev) {
    throw InvalidTransition(std::string("cannot ") + to_string(ev.kind) + " job " + job.id +
                            " in state " + to_string(job.state));
}

void require_holder(const JobRecord& job, const JobEvent& ev, JobState expected) {
    if (job.state != expected) reject(job, ev);
    if (job.claimed_by.empty()) reject(job, ev);
    if (job.claimed_by != ev.claim) {
        throw InvariantViolation("claim exclusivity violated on job " + job.id + ": held by " +
                               job.claimed_by + ", reported by " + ev.claim);
    }
}

Transition claim(const JobRecord& job, const JobEvent& ev, JobState queued, JobState running) {
    if (!job.claimed_by.empty()) {
        throw ClaimConflict("job " + job.id + " is already claimed by " + job.claimed_by);
    }
    if (ev.claim.empty()) throw InvariantViolation("claim event without claim token");
    Transition t;
    t.from = job.state;
    t.to = running;
    if (job.state == queued) {
        if (job.eligible_at > ev.now) {
            throw InvalidTransition("job " + job.id + " is backing off until " + std::to_string(job.eligible_at));
        }
        t.effects = kEffectNewAttempt;
    } else if (job.state != running) {
        reject(job, ev);
    }
    return t;
}

std::string failure_detail(const JobRecord& job, const JobEvent& ev) {
    json detail = json::object();
    if (!ev.error_detail.empty()) {
        auto parsed = json::parse(ev.error_detail, nullptr, false);
        if (parsed.is_object()) detail = parsed;
        else detail["raw"] = ev.error_detail;
    }
    detail["kind"] = to_string(ev.failure);
    detail["stage"] = job.state == JobState::Fetching ? "fetch" : "transfer";
    detail["attempt"] = job.attempt_count;
    detail["max_attempts"] = job.max_attempts;
    return detail.dump();
}

}

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::ClaimFetch: return "claim-fetch";
        case EventKind::FetchSucceeded: return "complete-fetch";
        case EventKind::ClaimTransfer: return "claim-transfer";
        case EventKind::TransferVerified: return "complete-transfer";
        case EventKind::StageFailed: return "fail";
        case EventKind::Pause: return "pause";
        case EventKind::Resume: return "resume";
        case EventKind::Cancel: return "cancel";
        case EventKind::Retry: return "retry";
    }
    return "unknown";
}

bool fetch_finished(const JobRecord& job) {
    return !job.checksum.empty() && !job.local_path.empty();
}

bool is_final(const JobRecord& job) {
    if (job.state == JobState::Completed || job.state == JobState::Cancelled) return true;
    return job.state == JobState::Failed && job.attempt_count >= job.max_attempts;
}

Transition plan_transition(const JobRecord& job, const JobEvent& ev, const RetryPolicy& policy) {
    Transition t;
    t.from = job.state;
    switch (ev.kind) {
        case EventKind::ClaimFetch:
            return claim(job, ev, JobState::Pending, JobState::Fetching);
        case EventKind::ClaimTransfer:
            return claim(job, ev, JobState::Fetched, JobState::Transferring);
        case EventKind::FetchSucceeded:
            require_holder(job, ev, JobState::Fetching);
            if (!job.checksum.empty() && job.checksum != ev.checksum) {
                throw InvariantViolation("checksum of job " + job.id + " would change after fetch");
            }
            t.to = JobState::Fetched;
            t.effects = kEffectReleaseClaim | kEffectHandToTransfer;
            return t;
        case EventKind::TransferVerified:
            require_holder(job, ev, JobState::Transferring);
            t.to = JobState::Completed;
            t.effects = kEffectReleaseClaim;
            return t;
        case EventKind::StageFailed: {
            if (!is_active(job.state)) reject(job, ev);
            require_holder(job, ev, job.state);
            Stage stage = job.state == JobState::Fetching ? Stage::Fetch : Stage::Transfer;
            auto d = policy.decide(job, stage, ev.failure, ev.now);
            t.effects = kEffectReleaseClaim;
            if (d.retry) {
                t.to = d.next_state;
                t.eligible_at = d.eligible_at;
                t.effects |= kEffectIncrementAttempt | kEffectBackoff;
            } else {
                t.to = JobState::Failed;
            }
            return t;
        }
        case EventKind::Pause:
            if (!is_active(job.state)) reject(job, ev);
            t.to = JobState::Paused;
            if (!job.claimed_by.empty()) t.effects = kEffectAbortWorker;
            return t;
        case EventKind::Resume:
            if (job.state != JobState::Paused) reject(job, ev);
            t.to = fetch_finished(job) ? JobState::Transferring : JobState::Fetching;
            return t;
        case EventKind::Cancel:
            if (is_final(job)) reject(job, ev);
            t.to = JobState::Cancelled;
            if (!job.claimed_by.empty()) t.effects = kEffectAbortWorker;
            else if (!job.local_path.empty()) t.effects = kEffectDiscardLocal;
            return t;
        case EventKind::Retry:
            if (job.state != JobState::Failed || is_final(job)) reject(job, ev);
            t.to = (!job.checksum.empty() && !job.local_path.empty()) ? JobState::Fetched : JobState::Pending;
            t.effects = kEffectIncrementAttempt;
            t.eligible_at = ev.now;
            return t;
    }
    reject(job, ev);
}

void apply_transition(JobRecord& job, const JobEvent& ev, const Transition& t) {
    switch (ev.kind) {
        case EventKind::ClaimFetch:
            job.claimed_by = ev.claim;
            if (t.has(kEffectNewAttempt)) {
                job.progress_percent = 0.0;
                job.fetched_size = 0;
                job.transfer_rate = 0.0;
                job.fetch_started_at = ev.now;
            }
            break;
        case EventKind::ClaimTransfer:
            job.claimed_by = ev.claim;
            if (t.has(kEffectNewAttempt)) {
                job.progress_percent = 0.0;
                job.transferred_size = 0;
                job.transfer_rate = 0.0;
                job.transfer_started_at = ev.now;
            }
            break;
        case EventKind::FetchSucceeded:
            job.local_path = ev.local_path;
            job.local_size = ev.local_size;
            job.fetched_size = ev.local_size;
            if (job.checksum.empty()) job.checksum = ev.checksum;
            job.fetch_completed_at = ev.now;
            job.progress_percent = 100.0;
            break;
        case EventKind::TransferVerified:
            job.transferred_size = job.local_size;
            job.progress_percent = 100.0;
            job.completed_at = ev.now;
            break;
        case EventKind::StageFailed:
            job.last_error = ev.error.empty() ? std::string("unknown ") + to_string(ev.failure) + " failure" : ev.error;
            job.last_error_detail = failure_detail(job, ev);
            job.transfer_rate = 0.0;
            if (t.to == JobState::Failed) job.completed_at = ev.now;
            break;
        case EventKind::Pause:
            job.resume_progress =
                fetch_finished(job) ? 100.0 : std::min(job.progress_percent, kFetchProgressCeiling);
            job.transfer_rate = 0.0;
            break;
        case EventKind::Resume:
            break;
        case EventKind::Cancel:
            job.completed_at = ev.now;
            job.transfer_rate = 0.0;
            break;
        case EventKind::Retry:
            job.last_error.clear();
            job.last_error_detail.clear();
            job.completed_at.reset();
            break;
    }
    if (t.has(kEffectIncrementAttempt)) ++job.attempt_count;
    if (t.has(kEffectBackoff) || ev.kind == EventKind::Retry) job.eligible_at = t.eligible_at;
    if (t.has(kEffectReleaseClaim)) job.claimed_by.clear();
    job.state = t.to;
    job.updated_at = ev.now;
}
