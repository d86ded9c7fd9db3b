#include "../include/errors.hpp"
#include "../include/progress.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

TEST(ProgressThrottle, EmitsFirstDecilesAndCompletion) {
    ProgressThrottle t(5000);
    EXPECT_TRUE(t.should_emit(0.0, 0));
    EXPECT_FALSE(t.should_emit(3.0, 100));
    EXPECT_FALSE(t.should_emit(9.9, 200));
    EXPECT_TRUE(t.should_emit(10.0, 300));
    EXPECT_FALSE(t.should_emit(15.0, 400));
    EXPECT_TRUE(t.should_emit(35.0, 500));  // skipped deciles emit once
    EXPECT_FALSE(t.should_emit(39.0, 600));
    EXPECT_TRUE(t.should_emit(100.0, 700));
    EXPECT_FALSE(t.should_emit(100.0, 800));
}

TEST(ProgressThrottle, EmitsAfterIntervalWithoutStep) {
    ProgressThrottle t(5000);
    EXPECT_TRUE(t.should_emit(1.0, 0));
    EXPECT_FALSE(t.should_emit(2.0, 4999));
    EXPECT_TRUE(t.should_emit(3.0, 5000));
    EXPECT_FALSE(t.should_emit(4.0, 9000));
    EXPECT_TRUE(t.should_emit(4.5, 10000));
}

TEST(ProgressThrottle, BoundedEmissionsForManySamples) {
    ProgressThrottle t(5000);
    int emitted = 0;
    for (int i = 0; i <= 10000; ++i) {
        if (t.should_emit(i / 100.0, i)) ++emitted;
    }
    // first + nine decile crossings + completion, and at most two interval ticks
    EXPECT_LE(emitted, 13);
    EXPECT_GE(emitted, 11);
}

TEST(ClampProgress, NeverGoesBackwardsOrOutOfRange) {
    EXPECT_DOUBLE_EQ(clamp_progress(40.0, 10.0), 40.0);
    EXPECT_DOUBLE_EQ(clamp_progress(40.0, 55.0), 55.0);
    EXPECT_DOUBLE_EQ(clamp_progress(0.0, 150.0), 100.0);
    EXPECT_DOUBLE_EQ(clamp_progress(0.0, -3.0), 0.0);
}

TEST(StageContext, AbortAndTimeout) {
    FakeClock clock;
    StageContext ctx("j1", clock.now + 1000, clock.fn());
    EXPECT_NO_THROW(ctx.check());
    clock.advance(1001);
    EXPECT_THROW(ctx.check(), TransientFailure);

    StageContext no_deadline("j2", 0, clock.fn());
    clock.advance(1000000);
    EXPECT_NO_THROW(no_deadline.check());
    no_deadline.request_abort("pause");
    EXPECT_TRUE(no_deadline.abort_requested());
    try {
        no_deadline.check();
        FAIL() << "expected JobAborted";
    } catch (const JobAborted& e) {
        EXPECT_NE(std::string(e.what()).find("pause"), std::string::npos);
    }
}

TEST(ActiveJobs, SignalsOnlyRegisteredJobs) {
    FakeClock clock;
    ActiveJobs active;
    auto ctx = std::make_shared<StageContext>("j1", 0, clock.fn());
    active.add(ctx);
    EXPECT_EQ(active.size(), 1u);
    EXPECT_FALSE(active.signal_abort("other", "cancel"));
    EXPECT_TRUE(active.signal_abort("j1", "cancel"));
    EXPECT_TRUE(ctx->abort_requested());
    active.remove(ctx);
    EXPECT_EQ(active.size(), 0u);
}

TEST(ActiveJobs, StaleRemovalKeepsNewerClaim) {
    FakeClock clock;
    ActiveJobs active;
    auto old_ctx = std::make_shared<StageContext>("j1", 0, clock.fn());
    auto new_ctx = std::make_shared<StageContext>("j1", 0, clock.fn());
    active.add(old_ctx);
    active.add(new_ctx);
    active.remove(old_ctx);
    EXPECT_EQ(active.size(), 1u);
    EXPECT_TRUE(active.signal_abort("j1", "pause"));
    EXPECT_TRUE(new_ctx->abort_requested());
    EXPECT_FALSE(old_ctx->abort_requested());
}
