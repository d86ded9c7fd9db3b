#pragma once
#include "errors.hpp"
#include "job.hpp"
#include <cstdint>

enum class Stage { Fetch, Transfer };

const char* to_string(Stage stage);

struct RetryDecision {
    bool retry{false};
    JobState next_state{JobState::Failed};
    std::int64_t eligible_at{0};
};

// Exponential backoff: base * 2^(attempt-1), capped at max_backoff_ms.
struct RetryPolicy {
    std::int64_t base_backoff_ms{30000};
    std::int64_t max_backoff_ms{600000};

    std::int64_t backoff_for(int attempt) const;
    RetryDecision decide(const JobRecord& job, Stage stage, FailureKind kind, std::int64_t now) const;
};
