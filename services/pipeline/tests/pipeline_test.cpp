#include "../include/pipeline.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace testing_support;
using json = nlohmann::json;

namespace {

JobDescriptor valid_descriptor() {
    JobDescriptor d;
    d.title = "Severance";
    d.content_type = "series";
    d.season = 1;
    d.episode = 3;
    d.quality = "720p";
    d.source_url = "https://cdn.example.net/sev-s01e03.mkv";
    d.backend_id = "nas";
    d.destination_path = "tv/Severance/";
    return d;
}

}

TEST(CreateJob, StoresPendingRecordAndEmitsEvent) {
    Harness h;
    std::string id = h.pipeline->create_job(valid_descriptor());
    JobRecord job = h.job(id);
    EXPECT_EQ(job.state, JobState::Pending);
    EXPECT_EQ(job.attempt_count, 1);
    EXPECT_EQ(job.max_attempts, 3);
    EXPECT_EQ(job.created_at, h.clock.now.load());
    EXPECT_EQ(formatted_title(job), "Severance S01E03");
    EXPECT_EQ(h.sink.states(id), std::vector<std::string>{"pending"});
}

TEST(CreateJob, RejectsInvalidDescriptors) {
    Harness h;
    auto expect_invalid = [&](const std::function<void(JobDescriptor&)>& breaker) {
        JobDescriptor d = valid_descriptor();
        breaker(d);
        EXPECT_THROW(h.pipeline->create_job(d), ValidationError);
    };
    expect_invalid([](JobDescriptor& d) { d.title.clear(); });
    expect_invalid([](JobDescriptor& d) { d.quality.clear(); });
    expect_invalid([](JobDescriptor& d) { d.source_url.clear(); });
    expect_invalid([](JobDescriptor& d) { d.destination_path.clear(); });
    expect_invalid([](JobDescriptor& d) { d.max_attempts = 0; });
    expect_invalid([](JobDescriptor& d) { d.backend_id = "does-not-exist"; });
    expect_invalid([](JobDescriptor& d) { d.destination_path = "../../../outside/"; });
    expect_invalid([](JobDescriptor& d) { d.destination_path = "tv/../../etc/"; });
    EXPECT_TRUE(h.store.list().empty());
    EXPECT_TRUE(h.sink.events().empty());
}

TEST(ControlJob, RejectsIllegalActions) {
    Harness h;
    std::string id = h.create("Dune");
    EXPECT_THROW(h.pipeline->control_job(id, ControlAction::Resume), InvalidTransition);
    EXPECT_THROW(h.pipeline->control_job(id, ControlAction::Pause), InvalidTransition);
    EXPECT_THROW(h.pipeline->control_job(id, ControlAction::Retry), InvalidTransition);
    EXPECT_THROW(h.pipeline->control_job("nope", ControlAction::Cancel), NotFound);
    EXPECT_EQ(h.job(id).state, JobState::Pending);
}

TEST(ControlJob, CancelPendingAndFinalIsFinal) {
    Harness h;
    std::string id = h.create("Dune");
    EXPECT_EQ(h.pipeline->control_job(id, ControlAction::Cancel), JobState::Cancelled);
    EXPECT_THROW(h.pipeline->control_job(id, ControlAction::Cancel), InvalidTransition);
    EXPECT_THROW(h.pipeline->control_job(id, ControlAction::Resume), InvalidTransition);
    EXPECT_FALSE(h.fetch());
}

TEST(ControlJob, CancelFetchedDropsLocalCopy) {
    Harness h;
    std::string id = h.create("Dune");
    ASSERT_TRUE(h.fetch());
    std::string local = h.job(id).local_path;
    ASSERT_TRUE(std::filesystem::exists(local));
    EXPECT_EQ(h.pipeline->control_job(id, ControlAction::Cancel), JobState::Cancelled);
    EXPECT_FALSE(std::filesystem::exists(local));
    EXPECT_FALSE(h.transfer());
}

TEST(JobStatusQuery, ReportsEtaWhileTransferring) {
    Harness h;
    std::string id = h.create("Dune");
    h.store.mutate(id, [](JobRecord& j) {
        j.state = JobState::Transferring;
        j.local_size = 1000;
        j.transferred_size = 400;
        j.progress_percent = 40.0;
        j.transfer_rate = 100.0;
    });
    JobStatus s = h.pipeline->get_job_status(id);
    EXPECT_EQ(s.state, JobState::Transferring);
    EXPECT_DOUBLE_EQ(s.progress_percent, 40.0);
    ASSERT_TRUE(s.eta.has_value());
    EXPECT_DOUBLE_EQ(*s.eta, 6.0);

    h.store.mutate(id, [](JobRecord& j) {
        j.state = JobState::Fetching;
        j.fetched_size = 250;
        j.progress_percent = 25.0;
        j.transfer_rate = 50.0;
    });
    s = h.pipeline->get_job_status(id);
    ASSERT_TRUE(s.eta.has_value());
    EXPECT_DOUBLE_EQ(*s.eta, 15.0);

    json j = to_json(s);
    EXPECT_EQ(j["state"], "fetching");
    EXPECT_TRUE(j["error"].is_null());
}

TEST(JobStatusQuery, NoEtaWhenIdleAndErrorsSurface) {
    Harness h;
    h.fetcher.script({Step::Fatal});
    std::string id = h.create("Dune");
    EXPECT_FALSE(h.pipeline->get_job_status(id).eta.has_value());
    ASSERT_TRUE(h.fetch());
    JobStatus s = h.pipeline->get_job_status(id);
    EXPECT_EQ(s.state, JobState::Failed);
    EXPECT_EQ(s.error, "unsupported protocol");
    json j = to_json(s);
    EXPECT_EQ(j["error_detail"]["kind"], "fatal");
    EXPECT_THROW(h.pipeline->get_job_status("missing"), NotFound);
}

TEST(EligibleCountsQuery, CountsQueuedAndRunning) {
    Harness h;
    std::string a = h.create("A");
    h.create("B");
    h.create("C");
    ASSERT_TRUE(h.fetch());
    h.store.mutate(h.create("D"), [](JobRecord& j) { j.state = JobState::Transferring; });
    h.pipeline->control_job(a, ControlAction::Cancel);
    EligibleCounts c = h.pipeline->list_eligible_counts();
    EXPECT_EQ(c.pending, 2u);
    EXPECT_EQ(c.fetching, 0u);
    EXPECT_EQ(c.fetched, 0u);
    EXPECT_EQ(c.transferring, 1u);
    EXPECT_EQ(to_json(c)["pending"], 2);
}

TEST(Recovery, ReleasesStaleClaims) {
    Harness h;
    std::string id = h.create("Dune");
    h.store.mutate(id, [](JobRecord& j) {
        j.state = JobState::Fetching;
        j.claimed_by = "fetch-deadbeef#7";
        j.progress_percent = 30.0;
    });
    EXPECT_FALSE(h.fetch());
    EXPECT_EQ(h.pipeline->recover(), 1u);
    ASSERT_TRUE(h.fetch());
    JobRecord job = h.job(id);
    EXPECT_EQ(job.state, JobState::Fetched);
    EXPECT_EQ(job.attempt_count, 1);
}

TEST(DescriptorJson, ParsesAndValidates) {
    json body = {{"title", "Arrival"},     {"content_type", "movie"},     {"quality", "1080p"},
                 {"source_url", "https://x/a.mkv"}, {"year", 2016}, {"backend_id", 7},
                 {"destination_path", "movies/"}, {"priority", "high"}, {"max_attempts", 5}};
    JobDescriptor d = job_descriptor_from_json(body);
    EXPECT_EQ(d.backend_id, "7");
    EXPECT_EQ(d.priority, Priority::High);
    EXPECT_EQ(d.year, 2016);
    EXPECT_FALSE(d.season.has_value());
    EXPECT_EQ(d.max_attempts, 5);

    json no_backend = {{"title", "x"}};
    EXPECT_EQ(job_descriptor_from_json(no_backend, "nas").backend_id, "nas");
    EXPECT_THROW(job_descriptor_from_json({{"priority", "urgent"}}), ValidationError);
    EXPECT_THROW(job_descriptor_from_json({{"year", "twenty"}}), ValidationError);
    EXPECT_THROW(job_descriptor_from_json(json::array()), ValidationError);
}

TEST(ControlActionNames, RoundTrip) {
    EXPECT_EQ(control_action_from_string("pause"), ControlAction::Pause);
    EXPECT_EQ(control_action_from_string("retry"), ControlAction::Retry);
    EXPECT_FALSE(control_action_from_string("delete").has_value());
    EXPECT_STREQ(to_string(ControlAction::Cancel), "cancel");
}
