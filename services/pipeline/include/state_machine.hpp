#pragma once
#include "errors.hpp"
#include "job.hpp"
#include "retry_policy.hpp"
#include <cstdint>
#include <string>

enum class EventKind {
    ClaimFetch,
    FetchSucceeded,
    ClaimTransfer,
    TransferVerified,
    StageFailed,
    Pause,
    Resume,
    Cancel,
    Retry
};

const char* to_string(EventKind kind);

struct JobEvent {
    EventKind kind;
    std::int64_t now{0};
    std::string claim;  // claim token of the worker sending the event
    FailureKind failure{FailureKind::Transient};
    std::string error;
    std::string error_detail;
    std::string local_path;
    std::int64_t local_size{0};
    std::string checksum;
};

enum Effect : unsigned {
    kEffectNone = 0,
    kEffectNewAttempt = 1u << 0,        // stage progress restarts from zero
    kEffectAbortWorker = 1u << 1,       // the holding worker must stop
    kEffectReleaseClaim = 1u << 2,
    kEffectHandToTransfer = 1u << 3,
    kEffectBackoff = 1u << 4,
    kEffectDiscardLocal = 1u << 5,      // fetched copy is no longer needed
    kEffectIncrementAttempt = 1u << 6,
};

struct Transition {
    JobState from{JobState::Pending};
    JobState to{JobState::Pending};
    unsigned effects{kEffectNone};
    std::int64_t eligible_at{0};

    bool has(Effect e) const { return (effects & e) != 0; }
};

// Fetch progress stays below this until the fetched copy is hashed and
// recorded; only FetchSucceeded reports 100.
constexpr double kFetchProgressCeiling = 99.0;

// True once the fetched copy has been hashed and recorded on the job. Resume
// goes back to TRANSFERRING only then.
bool fetch_finished(const JobRecord& job);

// COMPLETED, CANCELLED, and FAILED with attempts exhausted. Nothing moves a
// final job any more.
bool is_final(const JobRecord& job);

// Decides the outcome of `ev` on `job` without touching it. Throws
// InvalidTransition (ClaimConflict for lost claims) when the event is illegal
// in the current state, and InvariantViolation when the record shows a claim
// held by a different worker than the one reporting a stage result.
Transition plan_transition(const JobRecord& job, const JobEvent& ev, const RetryPolicy& policy);

// Writes the outcome of a planned transition into the record.
void apply_transition(JobRecord& job, const JobEvent& ev, const Transition& t);
