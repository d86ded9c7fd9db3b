#pragma once
#include "transfer_backend.hpp"
#include <optional>
#include <string>
#include <vector>

// rsync over ssh. Key or agent authentication only.
class RsyncBackend : public TransferBackend {
public:
    explicit RsyncBackend(BackendDescriptor desc);

    bool test_connection() override;
    PutResult put(const std::filesystem::path& local, const std::string& dest, StageContext& ctx,
                  const TransferProgressFn& on_progress) override;
    std::optional<DiskUsage> probe_disk_usage() override;
    std::string remote_checksum(const std::string& dest, StageContext& ctx) override;
    void remove(const std::string& dest) override;

    std::vector<std::string> rsync_argv(const std::filesystem::path& local, const std::string& dest) const;
};

struct RsyncProgress {
    std::int64_t bytes{0};
    int percent{0};
    double rate{0.0};  // bytes/s
};

// Parses one `--progress` line, e.g. "  1,048,576  42%   10.50MB/s    0:00:03".
std::optional<RsyncProgress> parse_rsync_progress(const std::string& line);

// Exit statuses documented as transient; 255 (ssh) is transient unless the
// failure was an authentication error.
bool rsync_exit_retryable(int code, const std::string& stderr_text);
