#pragma once
#include "job.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class StageContext;

enum class Protocol { Sftp, Nfs, Smb, Rsync };

const char* to_string(Protocol p);
std::optional<Protocol> protocol_from_string(const std::string& s);
int default_port(Protocol p);

// A configured destination server. Read-only for the pipeline.
struct BackendDescriptor {
    std::string id;
    std::string name;
    Protocol protocol{Protocol::Sftp};
    std::string host;
    int port{0};
    std::string username;
    std::string password;
    std::string ssh_key_path;
    std::string base_path;
    std::string share;                 // SMB share name
    std::string mount_root{"/mnt"};    // NFS: the export is mounted at <mount_root>/<name>
    bool cleanup_after_transfer{true};
    int max_concurrent_transfers{3};
    std::int64_t bandwidth_limit_bps{0};  // 0: unlimited
    long connect_timeout_ms{10000};
    bool online{true};
};

// "100MB/s", "512KB/s", "1GB/s" or a plain byte count. Empty means 0.
std::int64_t parse_bandwidth(const std::string& text);

// Throws ValidationError when `path` has a ".." component.
void check_destination_path(const std::string& path);

// Absolute, lexically normalized destination path of a job's file on the
// backend: base_path joined with destination_path (unless absolute), plus the
// derived file name when destination_path names a directory. Throws
// ValidationError for paths that would climb out of their root.
std::string resolve_destination(const BackendDescriptor& desc, const JobRecord& job);

struct DiskUsage {
    std::uint64_t total{0};
    std::uint64_t used{0};
    std::uint64_t available{0};
    double percent{0.0};
};

struct PutResult {
    bool success{false};
    std::optional<double> observed_rate;  // bytes/s
};

using TransferProgressFn = std::function<void(std::int64_t transferred, std::int64_t total, double rate)>;

class TransferBackend {
public:
    explicit TransferBackend(BackendDescriptor desc) : desc_(std::move(desc)) {}
    virtual ~TransferBackend() = default;
    TransferBackend(const TransferBackend&) = delete;
    TransferBackend& operator=(const TransferBackend&) = delete;

    const BackendDescriptor& descriptor() const { return desc_; }

    // Non-mutating reachability probe, bounded by connect_timeout_ms.
    virtual bool test_connection() = 0;

    // Copies `local` to `dest`, creating missing directories. Reports progress
    // at least at start and end. Failures throw TransferError.
    virtual PutResult put(const std::filesystem::path& local, const std::string& dest, StageContext& ctx,
                          const TransferProgressFn& on_progress) = 0;

    // Best effort; std::nullopt where the protocol offers no usage query.
    virtual std::optional<DiskUsage> probe_disk_usage() = 0;

    // SHA-256 of the destination copy, read back through the protocol or
    // computed on the remote side.
    virtual std::string remote_checksum(const std::string& dest, StageContext& ctx) = 0;

    // Removes a (possibly partial) destination file. Never throws.
    virtual void remove(const std::string& dest) = 0;

protected:
    BackendDescriptor desc_;
};

std::unique_ptr<TransferBackend> make_transfer_backend(const BackendDescriptor& desc);

// ssh invocation for `remote_command` on the backend host (key auth only).
std::vector<std::string> ssh_argv(const BackendDescriptor& desc, const std::string& remote_command);

// Parses POSIX `df -Pk` output (second line).
std::optional<DiskUsage> parse_df_output(const std::string& out);

// Runs `df -Pk <base_path>` over ssh; nullopt without key auth or on error.
std::optional<DiskUsage> probe_disk_usage_over_ssh(const BackendDescriptor& desc);

// Runs `sha256sum <path>` over ssh and returns the digest.
std::string remote_sha256_over_ssh(const BackendDescriptor& desc, const std::string& path, StageContext& ctx);
