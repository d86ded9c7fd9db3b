#pragma once
#include "transfer_backend.hpp"

// An NFS export mounted at <mount_root>/<name>. Files are copied through the
// mount; mounting itself is left to the host.
class NfsBackend : public TransferBackend {
public:
    explicit NfsBackend(BackendDescriptor desc);

    bool test_connection() override;
    PutResult put(const std::filesystem::path& local, const std::string& dest, StageContext& ctx,
                  const TransferProgressFn& on_progress) override;
    std::optional<DiskUsage> probe_disk_usage() override;
    std::string remote_checksum(const std::string& dest, StageContext& ctx) override;
    void remove(const std::string& dest) override;

    std::filesystem::path mount_point() const;
    // Throws a non-retryable TransferError when dest climbs out of the mount.
    std::filesystem::path mounted_path(const std::string& dest) const;
};
