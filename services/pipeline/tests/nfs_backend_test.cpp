#include "../include/checksum.hpp"
#include "../include/errors.hpp"
#include "../include/nfs_backend.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

namespace {

struct NfsFixture : ::testing::Test {
    TempDir dir;
    BackendDescriptor desc;
    StageContext ctx{"n1", 0, system_now_ms};

    void SetUp() override {
        desc = make_descriptor("nfs1", Protocol::Nfs);
        desc.name = "archive";
        desc.mount_root = (dir.path / "mnt").string();
        std::filesystem::create_directories(dir.path / "mnt" / "archive");
    }
};

}

TEST_F(NfsFixture, MountedPathUnderMountPoint) {
    NfsBackend backend(desc);
    EXPECT_EQ(backend.mount_point(), dir.path / "mnt" / "archive");
    EXPECT_EQ(backend.mounted_path("/media/movies/a.mkv"), dir.path / "mnt" / "archive" / "media/movies/a.mkv");
    EXPECT_EQ(backend.descriptor().port, 2049);
}

TEST_F(NfsFixture, PathsOutsideMountAreRejected) {
    auto local = dir.path / "local" / "job_1.mkv";
    write_file(local, "payload");
    NfsBackend backend(desc);
    try {
        backend.put(local, "/media/../../../outside/Dune.mp4", ctx, nullptr);
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_FALSE(e.retryable());
    }
    EXPECT_FALSE(std::filesystem::exists(dir.path / "outside"));
    EXPECT_FALSE(std::filesystem::exists(dir.path / "mnt" / "outside"));
    EXPECT_THROW(backend.mounted_path("../x.mkv"), TransferError);
    EXPECT_NO_THROW(backend.remove("/../../x.mkv"));
    EXPECT_EQ(backend.mounted_path("/media/./movies/a.mkv"), dir.path / "mnt" / "archive" / "media/movies/a.mkv");
}

TEST_F(NfsFixture, PutCopiesAndChecksumMatches) {
    std::string content(3 * 1024 * 1024 + 17, 'n');
    auto local = dir.path / "local" / "job_1.mkv";
    write_file(local, content);
    NfsBackend backend(desc);
    ASSERT_TRUE(backend.test_connection());

    std::vector<std::int64_t> seen;
    PutResult r = backend.put(local, "/media/movies/Arrival (2016).mkv", ctx,
                              [&](std::int64_t done, std::int64_t total, double) {
                                  EXPECT_EQ(total, (std::int64_t)content.size());
                                  seen.push_back(done);
                              });
    EXPECT_TRUE(r.success);
    ASSERT_GE(seen.size(), 2u);
    EXPECT_EQ(seen.front(), 0);
    EXPECT_EQ(seen.back(), (std::int64_t)content.size());

    auto target = backend.mounted_path("/media/movies/Arrival (2016).mkv");
    EXPECT_EQ(read_file(target), content);
    EXPECT_EQ(backend.remote_checksum("/media/movies/Arrival (2016).mkv", ctx), sha256_file(local));

    backend.remove("/media/movies/Arrival (2016).mkv");
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_NO_THROW(backend.remove("/media/movies/Arrival (2016).mkv"));
}

TEST_F(NfsFixture, MissingMountIsRetryable) {
    desc.name = "not-mounted";
    NfsBackend backend(desc);
    EXPECT_FALSE(backend.test_connection());
    auto local = dir.path / "job_2.mkv";
    write_file(local, "data");
    try {
        backend.put(local, "/x.mkv", ctx, nullptr);
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_TRUE(e.retryable());
    }
}

TEST_F(NfsFixture, MissingDestinationCopyIsRetryable) {
    NfsBackend backend(desc);
    try {
        backend.remote_checksum("/nothing-here.mkv", ctx);
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_TRUE(e.retryable());
    }
}

TEST_F(NfsFixture, AbortStopsCopy) {
    auto local = dir.path / "job_3.mkv";
    write_file(local, std::string(4 * 1024 * 1024, 'a'));
    NfsBackend backend(desc);
    ctx.request_abort("cancel");
    EXPECT_THROW(backend.put(local, "/media/a.mkv", ctx, nullptr), JobAborted);
}

TEST_F(NfsFixture, ReportsDiskUsage) {
    NfsBackend backend(desc);
    auto u = backend.probe_disk_usage();
    ASSERT_TRUE(u.has_value());
    EXPECT_GT(u->total, 0u);
    EXPECT_GE(u->percent, 0.0);
    EXPECT_LE(u->percent, 100.0);
}
