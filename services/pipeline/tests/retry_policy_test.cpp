#include "../include/retry_policy.hpp"
#include <gtest/gtest.h>

namespace {

JobRecord job_with_attempts(int attempt, int max) {
    JobRecord j;
    j.id = "j";
    j.attempt_count = attempt;
    j.max_attempts = max;
    return j;
}

}

TEST(RetryPolicy, BackoffDoublesUpToCap) {
    RetryPolicy p{30000, 600000};
    EXPECT_EQ(p.backoff_for(1), 30000);
    EXPECT_EQ(p.backoff_for(2), 60000);
    EXPECT_EQ(p.backoff_for(3), 120000);
    EXPECT_EQ(p.backoff_for(6), 600000);
    EXPECT_EQ(p.backoff_for(40), 600000);
}

TEST(RetryPolicy, FatalNeverRetries) {
    RetryPolicy p;
    auto d = p.decide(job_with_attempts(1, 3), Stage::Fetch, FailureKind::Fatal, 100);
    EXPECT_FALSE(d.retry);
    EXPECT_EQ(d.next_state, JobState::Failed);
}

TEST(RetryPolicy, TransientRequeuesPerStage) {
    RetryPolicy p{1000, 10000};
    auto fetch = p.decide(job_with_attempts(1, 3), Stage::Fetch, FailureKind::Transient, 100);
    EXPECT_TRUE(fetch.retry);
    EXPECT_EQ(fetch.next_state, JobState::Pending);
    EXPECT_EQ(fetch.eligible_at, 1100);

    auto transfer = p.decide(job_with_attempts(2, 3), Stage::Transfer, FailureKind::Transient, 100);
    EXPECT_TRUE(transfer.retry);
    EXPECT_EQ(transfer.next_state, JobState::Fetched);
    EXPECT_EQ(transfer.eligible_at, 2100);
}

TEST(RetryPolicy, IntegrityMismatchRetriesLikeTransient) {
    RetryPolicy p;
    auto d = p.decide(job_with_attempts(1, 3), Stage::Transfer, FailureKind::Integrity, 0);
    EXPECT_TRUE(d.retry);
    EXPECT_EQ(d.next_state, JobState::Fetched);
}

TEST(RetryPolicy, ExhaustedAttemptsFail) {
    RetryPolicy p;
    auto d = p.decide(job_with_attempts(3, 3), Stage::Fetch, FailureKind::Transient, 0);
    EXPECT_FALSE(d.retry);
    EXPECT_EQ(d.next_state, JobState::Failed);

    auto single = p.decide(job_with_attempts(1, 1), Stage::Transfer, FailureKind::Integrity, 0);
    EXPECT_FALSE(single.retry);
}
