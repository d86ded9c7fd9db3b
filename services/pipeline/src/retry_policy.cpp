#include "../include/retry_policy.hpp"
#include <algorithm>

const char* to_string(Stage stage) {
    return stage == Stage::Fetch ? "fetch" : "transfer";
}

std::int64_t RetryPolicy::backoff_for(int attempt) const {
    std::int64_t delay = std::max<std::int64_t>(0, base_backoff_ms);
    for (int i = 1; i < attempt && delay < max_backoff_ms; ++i) delay *= 2;
    return std::min(delay, max_backoff_ms);
}

RetryDecision RetryPolicy::decide(const JobRecord& job, Stage stage, FailureKind kind, std::int64_t now) const {
    RetryDecision d;
    if (kind == FailureKind::Fatal) return d;
    // Integrity mismatches are retried like any transient failure.
    if (job.attempt_count >= job.max_attempts) return d;
    d.retry = true;
    d.next_state = stage == Stage::Fetch ? JobState::Pending : JobState::Fetched;
    d.eligible_at = now + backoff_for(job.attempt_count);
    return d;
}
