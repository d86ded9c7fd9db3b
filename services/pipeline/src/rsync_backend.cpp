#include "../include/rsync_backend.hpp"
#include "../include/errors.hpp"
#include "../include/process.hpp"
#include "../include/progress.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace {

double parse_rate(const std::string& token) {
    std::size_t pos = 0;
    while (pos < token.size() && (std::isdigit((unsigned char)token[pos]) || token[pos] == '.' || token[pos] == ','))
        ++pos;
    if (pos == 0) return 0.0;
    std::string num;
    for (std::size_t i = 0; i < pos; ++i)
        if (token[i] != ',') num.push_back(token[i]);
    double v = std::stod(num);
    std::string unit = token.substr(pos);
    if (unit.rfind("kB", 0) == 0 || unit.rfind("KB", 0) == 0) return v * 1024.0;
    if (unit.rfind("MB", 0) == 0) return v * 1024.0 * 1024.0;
    if (unit.rfind("GB", 0) == 0) return v * 1024.0 * 1024.0 * 1024.0;
    return v;
}

std::string remote_target(const BackendDescriptor& d, const std::string& path) {
    return (d.username.empty() ? d.host : d.username + "@" + d.host) + ":" + path;
}

std::string parent_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return "/";
    return path.substr(0, slash);
}

}

std::optional<RsyncProgress> parse_rsync_progress(const std::string& line) {
    std::istringstream in(line);
    std::string bytes_tok, pct_tok, rate_tok;
    if (!(in >> bytes_tok >> pct_tok)) return std::nullopt;
    if (pct_tok.size() < 2 || pct_tok.back() != '%') return std::nullopt;

    std::string digits;
    for (char c : bytes_tok) {
        if (c == ',') continue;
        if (!std::isdigit((unsigned char)c)) return std::nullopt;
        digits.push_back(c);
    }
    if (digits.empty()) return std::nullopt;
    std::string pct = pct_tok.substr(0, pct_tok.size() - 1);
    for (char c : pct)
        if (!std::isdigit((unsigned char)c)) return std::nullopt;

    RsyncProgress p;
    p.bytes = std::stoll(digits);
    p.percent = std::stoi(pct);
    if (in >> rate_tok) p.rate = parse_rate(rate_tok);
    return p;
}

bool rsync_exit_retryable(int code, const std::string& stderr_text) {
    switch (code) {
        case 5:   // error starting client-server protocol
        case 10:  // socket I/O
        case 11:  // file I/O
        case 12:  // protocol data stream
        case 23:  // partial transfer
        case 24:  // vanished source files
        case 30:  // timeout in data send/receive
        case 35:  // timeout waiting for daemon connection
            return true;
        case 255:
            return stderr_text.find("Permission denied") == std::string::npos &&
                   stderr_text.find("Host key verification failed") == std::string::npos;
        default:
            return false;
    }
}

RsyncBackend::RsyncBackend(BackendDescriptor desc) : TransferBackend(std::move(desc)) {
    if (desc_.port == 0) desc_.port = default_port(Protocol::Rsync);
}

std::vector<std::string> RsyncBackend::rsync_argv(const std::filesystem::path& local, const std::string& dest) const {
    long timeout_s = std::max(1L, desc_.connect_timeout_ms / 1000);
    std::string ssh = "ssh -p " + std::to_string(desc_.port);
    if (!desc_.ssh_key_path.empty()) ssh += " -i " + shell_quote(desc_.ssh_key_path);
    ssh += " -o BatchMode=yes -o StrictHostKeyChecking=accept-new -o ConnectTimeout=" + std::to_string(timeout_s);

    std::vector<std::string> argv{"rsync", "-a", "--progress", "--partial"};
    if (desc_.bandwidth_limit_bps > 0)
        argv.push_back("--bwlimit=" + std::to_string(std::max<std::int64_t>(1, desc_.bandwidth_limit_bps / 1024)));
    argv.push_back("--rsync-path=mkdir -p " + shell_quote(parent_dir(dest)) + " && rsync");
    argv.push_back("-e");
    argv.push_back(ssh);
    argv.push_back(local.string());
    argv.push_back(remote_target(desc_, dest));
    return argv;
}

bool RsyncBackend::test_connection() {
    ProcessSpec spec;
    spec.argv = ssh_argv(desc_, "echo test");
    spec.timeout_ms = desc_.connect_timeout_ms + 2000;
    std::string out;
    try {
        ProcessResult r = run_process(spec, nullptr, [&](const char* d, std::size_t n) { out.append(d, n); });
        if (r.timed_out || r.exit_code != 0 || out.find("test") == std::string::npos) {
            log_warn("rsync", desc_.id + ": connection test failed: " + r.stderr_text);
            return false;
        }
    } catch (const std::exception& e) {
        log_warn("rsync", desc_.id + ": connection test failed: " + e.what());
        return false;
    }
    return true;
}

PutResult RsyncBackend::put(const std::filesystem::path& local, const std::string& dest, StageContext& ctx,
                            const TransferProgressFn& on_progress) {
    std::error_code ec;
    auto total = (std::int64_t)std::filesystem::file_size(local, ec);
    if (ec) throw TransferError("local copy unreadable: " + local.string(), false);

    ProcessSpec spec;
    spec.argv = rsync_argv(local, dest);
    std::int64_t started = ctx.now();
    double last_rate = 0.0;
    if (on_progress) on_progress(0, total, 0.0);

    LineSplitter lines([&](const std::string& line) {
        auto p = parse_rsync_progress(line);
        if (!p) return;
        last_rate = p->rate;
        if (on_progress) on_progress(p->bytes, total, p->rate);
    });
    ProcessResult r = run_process(spec, &ctx, [&](const char* d, std::size_t n) { lines.feed(d, n); });
    lines.finish();

    if (r.exit_code != 0) {
        json detail;
        detail["exit_code"] = r.exit_code;
        detail["stderr"] = r.stderr_text;
        if (r.exit_code == kExecFailedExit) throw TransferError("rsync not available", false, detail.dump());
        throw TransferError("rsync failed with exit code " + std::to_string(r.exit_code),
                            rsync_exit_retryable(r.exit_code, r.stderr_text), detail.dump());
    }

    double secs = (double)(ctx.now() - started) / 1000.0;
    double rate = secs > 0 ? (double)total / secs : last_rate;
    if (on_progress) on_progress(total, total, rate);
    PutResult res;
    res.success = true;
    if (rate > 0) res.observed_rate = rate;
    return res;
}

std::optional<DiskUsage> RsyncBackend::probe_disk_usage() {
    return probe_disk_usage_over_ssh(desc_);
}

std::string RsyncBackend::remote_checksum(const std::string& dest, StageContext& ctx) {
    return remote_sha256_over_ssh(desc_, dest, ctx);
}

void RsyncBackend::remove(const std::string& dest) {
    ProcessSpec spec;
    spec.argv = ssh_argv(desc_, "rm -f " + shell_quote(dest));
    spec.timeout_ms = desc_.connect_timeout_ms * 3;
    try {
        ProcessResult r = run_process(spec, nullptr, nullptr);
        if (r.exit_code != 0) log_warn("rsync", desc_.id + ": cleanup of " + dest + " failed: " + r.stderr_text);
    } catch (const std::exception& e) {
        log_warn("rsync", desc_.id + ": cleanup of " + dest + " failed: " + e.what());
    }
}
