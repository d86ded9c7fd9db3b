#include "../include/errors.hpp"
#include "../include/job_store.hpp"
#include "../include/state_machine.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace testing_support;

namespace {

JobRecord record(const std::string& id, std::int64_t now = 1000) {
    JobDescriptor d;
    d.title = "The Wire";
    d.content_type = "series";
    d.quality = "720p";
    d.source_url = "https://cdn.example.net/wire-s01e01.mkv";
    d.season = 1;
    d.episode = 1;
    d.backend_id = "nas";
    d.destination_path = "tv/The Wire/";
    d.priority = Priority::High;
    return make_record(id, d, now);
}

}

TEST(JobStore, InsertAndReadBack) {
    JobStore store(":memory:");
    store.insert(record("a"));
    auto job = store.get("a");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->title, "The Wire");
    EXPECT_EQ(job->state, JobState::Pending);
    EXPECT_EQ(job->priority, Priority::High);
    EXPECT_EQ(job->season, 1);
    EXPECT_FALSE(job->year.has_value());
    EXPECT_EQ(job->attempt_count, 1);
    EXPECT_TRUE(job->claimed_by.empty());
    EXPECT_FALSE(store.get("missing").has_value());
}

TEST(JobStore, DuplicateIdRejected) {
    JobStore store(":memory:");
    store.insert(record("a"));
    EXPECT_THROW(store.insert(record("a")), ValidationError);
}

TEST(JobStore, PersistsAcrossReopen) {
    TempDir dir;
    auto db = (dir.path / "jobs.db").string();
    {
        JobStore store(db);
        store.insert(record("a"));
        store.mutate("a", [](JobRecord& j) {
            j.state = JobState::Fetched;
            j.checksum = "deadbeef";
            j.local_path = "/tmp/a.mkv";
        });
    }
    JobStore reopened(db);
    auto job = reopened.get("a");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::Fetched);
    EXPECT_EQ(job->checksum, "deadbeef");
    EXPECT_EQ(job->local_path, "/tmp/a.mkv");
}

TEST(JobStore, MutateBumpsVersionAndKeepsId) {
    JobStore store(":memory:");
    store.insert(record("a"));
    auto v0 = store.get("a")->version;
    auto updated = store.mutate("a", [](JobRecord& j) {
        j.id = "other";
        j.progress_percent = 42.0;
    });
    EXPECT_EQ(updated.id, "a");
    EXPECT_EQ(updated.version, v0 + 1);
    EXPECT_DOUBLE_EQ(store.get("a")->progress_percent, 42.0);
    EXPECT_FALSE(store.get("other").has_value());
}

TEST(JobStore, MutateThatThrowsWritesNothing) {
    JobStore store(":memory:");
    store.insert(record("a"));
    EXPECT_THROW(store.mutate("a",
                              [](JobRecord& j) {
                                  j.progress_percent = 99.0;
                                  throw InvalidTransition("no");
                              }),
                 InvalidTransition);
    EXPECT_DOUBLE_EQ(store.get("a")->progress_percent, 0.0);
    EXPECT_THROW(store.mutate("missing", [](JobRecord&) {}), NotFound);
}

TEST(JobStore, ClaimableFiltersStateClaimAndBackoff) {
    JobStore store(":memory:");
    store.insert(record("ready", 1000));
    store.insert(record("claimed", 1001));
    store.insert(record("backoff", 1002));
    store.insert(record("fetched", 1003));
    store.mutate("claimed", [](JobRecord& j) { j.claimed_by = "w#1"; });
    store.mutate("backoff", [](JobRecord& j) { j.eligible_at = 50000; });
    store.mutate("fetched", [](JobRecord& j) { j.state = JobState::Fetched; });

    auto ids = [](const std::vector<JobRecord>& jobs) {
        std::vector<std::string> out;
        for (const auto& j : jobs) out.push_back(j.id);
        return out;
    };
    EXPECT_EQ(ids(store.list_claimable({JobState::Pending, JobState::Fetching}, 2000)),
              (std::vector<std::string>{"ready"}));
    EXPECT_EQ(ids(store.list_claimable({JobState::Pending, JobState::Fetching}, 50000)),
              (std::vector<std::string>{"ready", "backoff"}));
    EXPECT_EQ(ids(store.list_claimable({JobState::Fetched, JobState::Transferring}, 2000)),
              (std::vector<std::string>{"fetched"}));
}

TEST(JobStore, CountsAndListByState) {
    JobStore store(":memory:");
    store.insert(record("a"));
    store.insert(record("b"));
    store.insert(record("c"));
    store.mutate("c", [](JobRecord& j) { j.state = JobState::Completed; });
    auto counts = store.count_by_state();
    EXPECT_EQ(counts[JobState::Pending], 2u);
    EXPECT_EQ(counts[JobState::Completed], 1u);
    EXPECT_EQ(counts.count(JobState::Failed), 0u);
    EXPECT_EQ(store.list(JobState::Pending).size(), 2u);
    EXPECT_EQ(store.list().size(), 3u);
}

TEST(JobStore, ReleaseOnlyByHolder) {
    JobStore store(":memory:");
    store.insert(record("a"));
    store.mutate("a", [](JobRecord& j) { j.claimed_by = "fetch-1#1"; });
    EXPECT_FALSE(store.release_claim("a", "fetch-1#2", 2000));
    EXPECT_EQ(store.get("a")->claimed_by, "fetch-1#1");
    EXPECT_TRUE(store.release_claim("a", "fetch-1#1", 2000));
    EXPECT_TRUE(store.get("a")->claimed_by.empty());
    EXPECT_FALSE(store.release_claim("a", "", 2000));
}

TEST(JobStore, ResetClaimsFreesEverything) {
    JobStore store(":memory:");
    store.insert(record("a"));
    store.insert(record("b"));
    store.insert(record("c"));
    store.mutate("a", [](JobRecord& j) {
        j.state = JobState::Fetching;
        j.claimed_by = "old#1";
    });
    store.mutate("b", [](JobRecord& j) {
        j.state = JobState::Transferring;
        j.claimed_by = "old#2";
    });
    EXPECT_EQ(store.reset_claims(5000), 2u);
    auto adoptable = store.list_claimable({JobState::Pending, JobState::Fetching}, 5000);
    EXPECT_EQ(adoptable.size(), 2u);
    EXPECT_EQ(store.get("b")->state, JobState::Transferring);
    EXPECT_TRUE(store.get("b")->claimed_by.empty());
}

TEST(JobStore, ConcurrentClaimsHaveOneWinner) {
    JobStore store(":memory:");
    store.insert(record("a"));
    RetryPolicy policy;
    std::atomic<int> winners{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            JobEvent ev{};
            ev.kind = EventKind::ClaimFetch;
            ev.now = 2000;
            ev.claim = "worker-" + std::to_string(i) + "#1";
            try {
                store.mutate("a", [&](JobRecord& j) { apply_transition(j, ev, plan_transition(j, ev, policy)); });
                ++winners;
            } catch (const ClaimConflict&) {
                ++conflicts;
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(conflicts.load(), 7);
    auto job = store.get("a");
    EXPECT_EQ(job->state, JobState::Fetching);
    EXPECT_FALSE(job->claimed_by.empty());
}
