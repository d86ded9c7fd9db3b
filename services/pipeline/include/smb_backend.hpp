#pragma once
#include "transfer_backend.hpp"
#include "process.hpp"

// SMB/CIFS through the smbclient tool. The share comes from `share`, or from
// a host written as "server/share".
class SmbBackend : public TransferBackend {
public:
    explicit SmbBackend(BackendDescriptor desc);

    bool test_connection() override;
    PutResult put(const std::filesystem::path& local, const std::string& dest, StageContext& ctx,
                  const TransferProgressFn& on_progress) override;
    // smbclient has no portable usage query.
    std::optional<DiskUsage> probe_disk_usage() override { return std::nullopt; }
    std::string remote_checksum(const std::string& dest, StageContext& ctx) override;
    void remove(const std::string& dest) override;

    std::string service() const;
    ProcessSpec command(const std::string& smb_commands) const;

private:
    std::string host_;
    std::string share_;
};

// Extracts the first NT_STATUS_* token from smbclient output.
std::string smb_status(const std::string& output);
// Logon, access and bad share errors cannot be fixed by retrying.
bool smb_status_retryable(const std::string& status);
