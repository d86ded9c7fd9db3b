#include "../include/smb_backend.hpp"
#include "../include/checksum.hpp"
#include "../include/errors.hpp"
#include "../include/progress.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string smb_quote(const std::string& path) {
    std::string out = "\"";
    for (char c : path) {
        if (c == '"') continue;
        out.push_back(c == '/' ? '\\' : c);
    }
    out += "\"";
    return out;
}

std::string local_quote(const std::string& path) {
    return "\"" + path + "\"";
}

std::string strip_leading_slash(const std::string& p) {
    std::size_t start = p.find_first_not_of('/');
    return start == std::string::npos ? std::string() : p.substr(start);
}

std::string smb_detail(const ProcessResult& r, const std::string& output) {
    json d;
    d["exit_code"] = r.exit_code;
    d["nt_status"] = smb_status(output);
    d["stderr"] = r.stderr_text;
    return d.dump();
}

}

std::string smb_status(const std::string& output) {
    auto pos = output.find("NT_STATUS_");
    if (pos == std::string::npos) return {};
    auto end = output.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_", pos);
    return output.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

bool smb_status_retryable(const std::string& status) {
    return !(status == "NT_STATUS_LOGON_FAILURE" || status == "NT_STATUS_ACCESS_DENIED" ||
             status == "NT_STATUS_BAD_NETWORK_NAME" || status == "NT_STATUS_DISK_FULL" ||
             status == "NT_STATUS_ACCOUNT_DISABLED" || status == "NT_STATUS_WRONG_PASSWORD");
}

SmbBackend::SmbBackend(BackendDescriptor desc) : TransferBackend(std::move(desc)) {
    if (desc_.port == 0) desc_.port = default_port(Protocol::Smb);
    host_ = desc_.host;
    share_ = desc_.share;
    auto slash = host_.find('/');
    if (slash != std::string::npos) {
        if (share_.empty()) share_ = host_.substr(slash + 1);
        host_ = host_.substr(0, slash);
    }
}

std::string SmbBackend::service() const {
    return "//" + host_ + "/" + share_;
}

ProcessSpec SmbBackend::command(const std::string& smb_commands) const {
    ProcessSpec spec;
    spec.argv = {"smbclient", service(), "-p", std::to_string(desc_.port), "-c", smb_commands};
    if (desc_.username.empty()) {
        spec.argv.push_back("-N");
    } else {
        // Credentials go through the environment so they stay off the process list.
        spec.env.emplace_back("USER", desc_.username);
        spec.env.emplace_back("PASSWD", desc_.password);
    }
    return spec;
}

bool SmbBackend::test_connection() {
    ProcessSpec spec = command("ls");
    spec.timeout_ms = desc_.connect_timeout_ms;
    std::string out;
    try {
        ProcessResult r = run_process(spec, nullptr, [&](const char* d, std::size_t n) { out.append(d, n); });
        if (r.timed_out || r.exit_code != 0) {
            log_warn("smb", desc_.id + ": connection test failed: " + smb_status(out + r.stderr_text));
            return false;
        }
    } catch (const std::exception& e) {
        log_warn("smb", desc_.id + ": connection test failed: " + e.what());
        return false;
    }
    return true;
}

PutResult SmbBackend::put(const std::filesystem::path& local, const std::string& dest, StageContext& ctx,
                          const TransferProgressFn& on_progress) {
    std::error_code ec;
    auto total = (std::int64_t)std::filesystem::file_size(local, ec);
    if (ec) throw TransferError("local copy unreadable: " + local.string(), false);
    if (desc_.bandwidth_limit_bps > 0) log_debug("smb", desc_.id + ": bandwidth limit not supported, ignored");

    std::int64_t started = ctx.now();
    if (on_progress) on_progress(0, total, 0.0);

    std::string rel = strip_leading_slash(dest);
    auto parts = split_list(rel, '/');
    std::string dir;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        dir = dir.empty() ? parts[i] : dir + "/" + parts[i];
        std::string out;
        ProcessResult r = run_process(command("mkdir " + smb_quote(dir)), &ctx,
                                      [&](const char* d, std::size_t n) { out.append(d, n); });
        std::string status = smb_status(out + r.stderr_text);
        if (status.empty() || status == "NT_STATUS_OBJECT_NAME_COLLISION") continue;
        throw TransferError("smb mkdir " + dir + " failed: " + status, smb_status_retryable(status),
                            smb_detail(r, out));
    }

    std::string out;
    ProcessResult r = run_process(command("put " + local_quote(local.string()) + " " + smb_quote(rel)), &ctx,
                                  [&](const char* d, std::size_t n) { out.append(d, n); });
    std::string status = smb_status(out + r.stderr_text);
    if (r.exit_code != 0 || !status.empty()) {
        if (r.exit_code == kExecFailedExit) throw TransferError("smbclient not available", false);
        throw TransferError("smb put failed: " + (status.empty() ? "exit " + std::to_string(r.exit_code) : status),
                            status.empty() || smb_status_retryable(status), smb_detail(r, out));
    }

    double secs = (double)(ctx.now() - started) / 1000.0;
    double rate = secs > 0 ? (double)total / secs : 0.0;
    if (on_progress) on_progress(total, total, rate);
    PutResult res;
    res.success = true;
    if (rate > 0) res.observed_rate = rate;
    return res;
}

std::string SmbBackend::remote_checksum(const std::string& dest, StageContext& ctx) {
    // "get <file> -" writes the file to stdout.
    Sha256 sha;
    ProcessResult r = run_process(command("get " + smb_quote(strip_leading_slash(dest)) + " -"), &ctx,
                                  [&](const char* d, std::size_t n) { sha.update(d, n); });
    std::string status = smb_status(r.stderr_text);
    if (r.exit_code != 0 || !status.empty()) {
        throw TransferError("smb read-back failed: " + (status.empty() ? "exit " + std::to_string(r.exit_code) : status),
                            status.empty() || smb_status_retryable(status), smb_detail(r, {}));
    }
    return sha.hex();
}

void SmbBackend::remove(const std::string& dest) {
    try {
        ProcessSpec spec = command("del " + smb_quote(strip_leading_slash(dest)));
        spec.timeout_ms = desc_.connect_timeout_ms * 3;
        std::string out;
        ProcessResult r = run_process(spec, nullptr, [&](const char* d, std::size_t n) { out.append(d, n); });
        std::string status = smb_status(out + r.stderr_text);
        if (!status.empty() && status != "NT_STATUS_OBJECT_NAME_NOT_FOUND")
            log_warn("smb", desc_.id + ": cleanup of " + dest + " failed: " + status);
    } catch (const std::exception& e) {
        log_warn("smb", desc_.id + ": cleanup of " + dest + " failed: " + e.what());
    }
}
