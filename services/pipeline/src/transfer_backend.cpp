#include "../include/transfer_backend.hpp"
#include "../include/errors.hpp"
#include "../include/nfs_backend.hpp"
#include "../include/process.hpp"
#include "../include/progress.hpp"
#include "../include/rsync_backend.hpp"
#include "../include/sftp_backend.hpp"
#include "../include/smb_backend.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

const char* to_string(Protocol p) {
    switch (p) {
        case Protocol::Sftp: return "sftp";
        case Protocol::Nfs: return "nfs";
        case Protocol::Smb: return "smb";
        case Protocol::Rsync: return "rsync";
    }
    return "sftp";
}

std::optional<Protocol> protocol_from_string(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (v == "sftp") return Protocol::Sftp;
    if (v == "nfs") return Protocol::Nfs;
    if (v == "smb" || v == "cifs") return Protocol::Smb;
    if (v == "rsync") return Protocol::Rsync;
    return std::nullopt;
}

int default_port(Protocol p) {
    switch (p) {
        case Protocol::Sftp: return 22;
        case Protocol::Nfs: return 2049;
        case Protocol::Smb: return 445;
        case Protocol::Rsync: return 22;
    }
    return 22;
}

std::int64_t parse_bandwidth(const std::string& text) {
    std::string s;
    for (char c : text)
        if (!std::isspace((unsigned char)c)) s.push_back((char)std::toupper((unsigned char)c));
    if (s.empty()) return 0;
    if (s.size() > 2 && s.compare(s.size() - 2, 2, "/S") == 0) s.resize(s.size() - 2);

    std::size_t pos = 0;
    while (pos < s.size() && (std::isdigit((unsigned char)s[pos]) || s[pos] == '.')) ++pos;
    if (pos == 0) throw ValidationError("bad bandwidth limit: " + text);
    double value = 0.0;
    try {
        value = std::stod(s.substr(0, pos));
    } catch (const std::exception&) {
        throw ValidationError("bad bandwidth limit: " + text);
    }
    std::string unit = s.substr(pos);
    double mult = 1.0;
    if (unit.empty() || unit == "B") mult = 1.0;
    else if (unit == "K" || unit == "KB") mult = 1024.0;
    else if (unit == "M" || unit == "MB") mult = 1024.0 * 1024.0;
    else if (unit == "G" || unit == "GB") mult = 1024.0 * 1024.0 * 1024.0;
    else throw ValidationError("bad bandwidth unit: " + text);
    return (std::int64_t)(value * mult);
}

namespace {

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    bool sa = a.back() == '/';
    bool sb = b.front() == '/';
    if (sa && sb) return a + b.substr(1);
    if (sa || sb) return a + b;
    return a + "/" + b;
}

}

void check_destination_path(const std::string& path) {
    for (const auto& part : std::filesystem::path(path)) {
        if (part == "..") throw ValidationError("destination path must not contain '..': " + path);
    }
}

std::string resolve_destination(const BackendDescriptor& desc, const JobRecord& job) {
    const std::string& dp = job.destination_path;
    check_destination_path(dp);
    std::string path = (!dp.empty() && dp.front() == '/') ? dp : join_path(desc.base_path, dp);
    if (dp.empty() || path.empty() || path.back() == '/') path = join_path(path, destination_filename(job));
    if (path.front() != '/') path = "/" + path;
    check_destination_path(path);
    return std::filesystem::path(path).lexically_normal().generic_string();
}

std::unique_ptr<TransferBackend> make_transfer_backend(const BackendDescriptor& desc) {
    switch (desc.protocol) {
        case Protocol::Sftp: return std::make_unique<SftpBackend>(desc);
        case Protocol::Nfs: return std::make_unique<NfsBackend>(desc);
        case Protocol::Smb: return std::make_unique<SmbBackend>(desc);
        case Protocol::Rsync: return std::make_unique<RsyncBackend>(desc);
    }
    throw ValidationError("unsupported protocol for backend " + desc.id);
}

std::vector<std::string> ssh_argv(const BackendDescriptor& desc, const std::string& remote_command) {
    long timeout_s = std::max(1L, desc.connect_timeout_ms / 1000);
    std::vector<std::string> argv{"ssh", "-p", std::to_string(desc.port ? desc.port : 22)};
    if (!desc.ssh_key_path.empty()) {
        argv.push_back("-i");
        argv.push_back(desc.ssh_key_path);
    }
    argv.insert(argv.end(), {"-o", "BatchMode=yes", "-o", "StrictHostKeyChecking=accept-new",
                             "-o", "ConnectTimeout=" + std::to_string(timeout_s)});
    argv.push_back(desc.username.empty() ? desc.host : desc.username + "@" + desc.host);
    argv.push_back(remote_command);
    return argv;
}

std::optional<DiskUsage> parse_df_output(const std::string& out) {
    std::istringstream in(out);
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;  // header
    if (!std::getline(in, line)) return std::nullopt;
    std::istringstream fields(line);
    std::string fs;
    std::uint64_t blocks = 0, used = 0, avail = 0;
    if (!(fields >> fs >> blocks >> used >> avail)) return std::nullopt;
    DiskUsage u;
    u.total = blocks * 1024;
    u.used = used * 1024;
    u.available = avail * 1024;
    u.percent = u.total ? (double)u.used * 100.0 / (double)u.total : 0.0;
    return u;
}

std::optional<DiskUsage> probe_disk_usage_over_ssh(const BackendDescriptor& desc) {
    if (desc.ssh_key_path.empty()) {
        log_debug("backend", desc.id + ": disk usage needs key auth, skipped");
        return std::nullopt;
    }
    ProcessSpec spec;
    spec.argv = ssh_argv(desc, "df -Pk " + shell_quote(desc.base_path.empty() ? "/" : desc.base_path));
    spec.timeout_ms = desc.connect_timeout_ms + 5000;
    std::string out;
    try {
        ProcessResult r = run_process(spec, nullptr, [&](const char* d, std::size_t n) { out.append(d, n); });
        if (r.exit_code != 0 || r.timed_out) {
            log_warn("backend", desc.id + ": df failed: " + r.stderr_text);
            return std::nullopt;
        }
    } catch (const std::exception& e) {
        log_warn("backend", desc.id + ": df failed: " + e.what());
        return std::nullopt;
    }
    return parse_df_output(out);
}

std::string remote_sha256_over_ssh(const BackendDescriptor& desc, const std::string& path, StageContext& ctx) {
    ProcessSpec spec;
    spec.argv = ssh_argv(desc, "sha256sum " + shell_quote(path));
    std::string out;
    ProcessResult r = run_process(spec, &ctx, [&](const char* d, std::size_t n) { out.append(d, n); });
    if (r.exit_code != 0) {
        bool retryable = r.exit_code == 255 && r.stderr_text.find("Permission denied") == std::string::npos;
        throw TransferError("remote sha256sum failed (exit " + std::to_string(r.exit_code) + ")", retryable,
                            r.stderr_text);
    }
    std::istringstream in(out);
    std::string digest;
    in >> digest;
    if (digest.size() != 64) throw TransferError("unexpected sha256sum output: " + out, true);
    return digest;
}
