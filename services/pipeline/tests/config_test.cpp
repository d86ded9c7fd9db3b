#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <gtest/gtest.h>

using namespace testing_support;

TEST(Config, DefaultsAreValid) {
    PipelineConfig cfg;
    EXPECT_NO_THROW(validate(cfg));
    EXPECT_EQ(cfg.max_concurrent_downloads, 2u);
    EXPECT_TRUE(cfg.verify_checksums);
    EXPECT_EQ(cfg.accepted_qualities, (std::vector<std::string>{"480p", "720p", "1080p"}));
}

TEST(Config, AppliesJsonByKeyName) {
    PipelineConfig cfg;
    apply_json(cfg, {{"db_path", "/var/lib/mediadown/jobs.db"},
                     {"max_concurrent_transfers", 4},
                     {"verify_checksums", false},
                     {"accepted_qualities", {"720p", "2160p"}},
                     {"log_level", "debug"}});
    EXPECT_EQ(cfg.db_path, "/var/lib/mediadown/jobs.db");
    EXPECT_EQ(cfg.max_concurrent_transfers, 4u);
    EXPECT_FALSE(cfg.verify_checksums);
    EXPECT_EQ(cfg.accepted_qualities, (std::vector<std::string>{"720p", "2160p"}));
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_THROW(apply_json(cfg, {{"no_such_setting", 1}}), ValidationError);
    EXPECT_THROW(apply_json(cfg, {{"poll_interval_ms", "soon"}}), ValidationError);
}

TEST(Config, LayersFileEnvAndFlags) {
    TempDir dir;
    auto file = dir.path / "pipeline.json";
    write_file(file, R"({"max_concurrent_downloads": 3, "control_port": 7200, "retry_base_backoff_ms": 500})");
    ::setenv("CONTROL_PORT", "7300", 1);
    std::string file_arg = file.string();
    const char* args[] = {"pipelined", "--config", file_arg.c_str(), "--max-downloads", "5", "--no-verify"};
    PipelineConfig cfg = load_config(6, const_cast<char**>(args));
    ::unsetenv("CONTROL_PORT");
    EXPECT_EQ(cfg.max_concurrent_downloads, 5u);
    EXPECT_EQ(cfg.control_port, 7300);
    EXPECT_EQ(cfg.retry_base_backoff_ms, 500);
    EXPECT_FALSE(cfg.verify_checksums);
}

TEST(Config, RejectsBadValues) {
    PipelineConfig cfg;
    cfg.max_concurrent_transfers = 0;
    EXPECT_THROW(validate(cfg), ValidationError);
    cfg = PipelineConfig{};
    cfg.retry_max_backoff_ms = 10;
    EXPECT_THROW(validate(cfg), ValidationError);
    const char* args[] = {"pipelined", "--bogus"};
    EXPECT_THROW(load_config(2, const_cast<char**>(args)), ValidationError);
}

TEST(Config, CountsMustBePositive) {
    PipelineConfig cfg;
    EXPECT_THROW(apply_json(cfg, {{"max_concurrent_downloads", -1}}), ValidationError);
    EXPECT_THROW(apply_json(cfg, {{"max_concurrent_transfers", 0}}), ValidationError);
    EXPECT_THROW(apply_json(cfg, {{"event_queue_capacity", -8}}), ValidationError);
    EXPECT_EQ(cfg.max_concurrent_downloads, PipelineConfig{}.max_concurrent_downloads);

    ::setenv("MAX_CONCURRENT_TRANSFERS", "-4", 1);
    const char* args[] = {"pipelined"};
    EXPECT_THROW(load_config(1, const_cast<char**>(args)), ValidationError);
    ::unsetenv("MAX_CONCURRENT_TRANSFERS");
}
