#include "../include/backend_registry.hpp"
#include "../include/errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;
using json = nlohmann::json;

TEST(BackendJson, ParsesDescriptor) {
    json j = {{"id", 3},
              {"name", "nas-main"},
              {"protocol", "sftp"},
              {"host", "10.0.0.5"},
              {"username", "media"},
              {"password", "hunter2"},
              {"base_path", "/volume1/media"},
              {"bandwidth_limit", "50MB/s"},
              {"max_concurrent_transfers", 2},
              {"status", "maintenance"}};
    BackendDescriptor d = backend_from_json(j);
    EXPECT_EQ(d.id, "3");
    EXPECT_EQ(d.protocol, Protocol::Sftp);
    EXPECT_EQ(d.port, 22);
    EXPECT_EQ(d.bandwidth_limit_bps, 50LL * 1024 * 1024);
    EXPECT_EQ(d.max_concurrent_transfers, 2);
    EXPECT_FALSE(d.online);
    EXPECT_TRUE(d.cleanup_after_transfer);

    json out = to_json(d);
    EXPECT_FALSE(out.contains("password"));
    EXPECT_EQ(out["status"], "offline");
}

TEST(BackendJson, RejectsBadEntries) {
    EXPECT_THROW(backend_from_json({{"id", "x"}, {"protocol", "ftp"}, {"host", "h"}}), ValidationError);
    EXPECT_THROW(backend_from_json({{"id", "x"}, {"protocol", "smb"}}), ValidationError);
    EXPECT_THROW(backend_from_json({{"protocol", "sftp"}, {"host", "h"}}), ValidationError);
    EXPECT_THROW(backend_from_json({{"id", "x"}, {"protocol", "sftp"}, {"host", "h"}, {"max_concurrent_transfers", 0}}),
                 ValidationError);
    EXPECT_NO_THROW(backend_from_json({{"id", "n"}, {"protocol", "nfs"}}));
}

TEST(Registry, LoadsFileAndResolves) {
    TempDir dir;
    auto path = dir.path / "backends.json";
    write_file(path, R"([
        {"id": "a", "protocol": "rsync", "host": "box", "ssh_key_path": "/k"},
        {"id": "b", "protocol": "nfs", "name": "archive", "mount_root": "/srv/mnt"}
    ])");
    BackendRegistry registry;
    registry.load_file(path.string());
    EXPECT_EQ(registry.ids(), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(registry.contains("a"));
    EXPECT_EQ(registry.resolve("b").mount_root, "/srv/mnt");
    EXPECT_THROW(registry.resolve("c"), NotFound);
    EXPECT_EQ(registry.backend("a").descriptor().protocol, Protocol::Rsync);
    EXPECT_THROW(registry.load_file((dir.path / "missing.json").string()), ValidationError);
}

TEST(Registry, HealthUpdatesOnlineStatus) {
    std::vector<ScriptedBackend*> made;
    BackendRegistry registry([&](const BackendDescriptor& d) {
        auto b = std::make_unique<ScriptedBackend>(d);
        made.push_back(b.get());
        return std::unique_ptr<TransferBackend>(std::move(b));
    });
    registry.add(make_descriptor("nas"));
    BackendHealth h = registry.check_health("nas");
    ASSERT_EQ(made.size(), 1u);
    EXPECT_TRUE(h.online);
    ASSERT_TRUE(h.disk_usage.has_value());
    EXPECT_DOUBLE_EQ(h.disk_usage->percent, 25.0);
    EXPECT_GT(h.checked_at, 0);

    made[0]->online = false;
    h = registry.check_health("nas");
    EXPECT_FALSE(h.online);
    EXPECT_FALSE(h.disk_usage.has_value());
    EXPECT_FALSE(registry.resolve("nas").online);
    EXPECT_TRUE(to_json(h)["disk_usage"].is_null());
    EXPECT_EQ(made.size(), 1u);
    EXPECT_THROW(registry.check_health("other"), NotFound);
}
