#pragma once
#include "transfer_backend.hpp"
#include <curl/curl.h>

// SFTP through libcurl's sftp:// support (libssh2 underneath).
class SftpBackend : public TransferBackend {
public:
    explicit SftpBackend(BackendDescriptor desc);

    bool test_connection() override;
    PutResult put(const std::filesystem::path& local, const std::string& dest, StageContext& ctx,
                  const TransferProgressFn& on_progress) override;
    std::optional<DiskUsage> probe_disk_usage() override;
    std::string remote_checksum(const std::string& dest, StageContext& ctx) override;
    void remove(const std::string& dest) override;

    std::string url_for(CURL* h, const std::string& path) const;

private:
    void apply_common(CURL* h) const;
};
