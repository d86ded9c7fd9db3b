#include "../include/nfs_backend.hpp"
#include "../include/checksum.hpp"
#include "../include/errors.hpp"
#include "../include/progress.hpp"
#include "../include/util.hpp"
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kChunk = 1 << 20;

bool errno_retryable(int err) {
    return !(err == ENOSPC || err == EACCES || err == EPERM || err == EROFS || err == EDQUOT);
}

}

NfsBackend::NfsBackend(BackendDescriptor desc) : TransferBackend(std::move(desc)) {
    if (desc_.port == 0) desc_.port = default_port(Protocol::Nfs);
}

fs::path NfsBackend::mount_point() const {
    return fs::path(desc_.mount_root) / desc_.name;
}

fs::path NfsBackend::mounted_path(const std::string& dest) const {
    std::size_t start = dest.find_first_not_of('/');
    fs::path rel = fs::path(start == std::string::npos ? std::string() : dest.substr(start)).lexically_normal();
    if (!rel.empty() && (rel.is_absolute() || *rel.begin() == "..")) {
        throw TransferError("destination " + dest + " escapes mount " + mount_point().string(), false);
    }
    return mount_point() / rel;
}

bool NfsBackend::test_connection() {
    std::error_code ec;
    fs::path mp = mount_point();
    if (!fs::is_directory(mp, ec)) {
        log_warn("nfs", desc_.id + ": mount point " + mp.string() + " not available");
        return false;
    }
    if (::access(mp.c_str(), W_OK) != 0) {
        log_warn("nfs", desc_.id + ": mount point " + mp.string() + " not writable: " + std::strerror(errno));
        return false;
    }
    return true;
}

PutResult NfsBackend::put(const fs::path& local, const std::string& dest, StageContext& ctx,
                          const TransferProgressFn& on_progress) {
    std::error_code ec;
    if (!fs::is_directory(mount_point(), ec))
        throw TransferError("mount point " + mount_point().string() + " not available", true);

    std::ifstream in(local, std::ios::binary);
    if (!in) throw TransferError("cannot open " + local.string(), false);
    auto total = (std::int64_t)fs::file_size(local, ec);
    if (ec) throw TransferError("local copy unreadable: " + local.string(), false);

    fs::path target = mounted_path(dest);
    fs::create_directories(target.parent_path(), ec);
    if (ec) throw TransferError("cannot create " + target.parent_path().string() + ": " + ec.message(),
                                errno_retryable(ec.value()));
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) throw TransferError("cannot open " + target.string() + ": " + std::strerror(errno), errno_retryable(errno));

    std::int64_t started = ctx.now();
    std::int64_t done = 0;
    double rate = 0.0;
    if (on_progress) on_progress(0, total, 0.0);
    std::vector<char> buf(kChunk);
    while (in) {
        ctx.check();
        in.read(buf.data(), (std::streamsize)buf.size());
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        out.write(buf.data(), got);
        if (!out) throw TransferError("write to " + target.string() + " failed: " + std::strerror(errno),
                                      errno_retryable(errno));
        done += got;

        // Hold the copy to the configured rate.
        if (desc_.bandwidth_limit_bps > 0) {
            std::int64_t due_ms = done * 1000 / desc_.bandwidth_limit_bps;
            while (ctx.now() - started < due_ms) {
                ctx.check();
                std::int64_t wait = std::min<std::int64_t>(due_ms - (ctx.now() - started), 100);
                std::this_thread::sleep_for(std::chrono::milliseconds(std::max<std::int64_t>(wait, 1)));
            }
        }
        double secs = (double)(ctx.now() - started) / 1000.0;
        if (secs > 0) rate = (double)done / secs;
        if (on_progress) on_progress(done, total, rate);
    }
    if (in.bad()) throw TransferError("read of " + local.string() + " failed", false);
    out.flush();
    out.close();
    if (!out) throw TransferError("flush of " + target.string() + " failed: " + std::strerror(errno),
                                  errno_retryable(errno));

    if (done == 0 && on_progress) on_progress(0, total, 0.0);
    PutResult res;
    res.success = true;
    if (rate > 0) res.observed_rate = rate;
    return res;
}

std::optional<DiskUsage> NfsBackend::probe_disk_usage() {
    std::error_code ec;
    fs::space_info si = fs::space(mount_point(), ec);
    if (ec) {
        log_warn("nfs", desc_.id + ": disk usage unavailable: " + ec.message());
        return std::nullopt;
    }
    DiskUsage u;
    u.total = si.capacity;
    u.available = si.available;
    u.used = si.capacity - si.free;
    u.percent = u.total ? (double)u.used * 100.0 / (double)u.total : 0.0;
    return u;
}

std::string NfsBackend::remote_checksum(const std::string& dest, StageContext& ctx) {
    fs::path target = mounted_path(dest);
    std::error_code ec;
    if (!fs::exists(target, ec)) throw TransferError("destination copy missing: " + target.string(), true);
    try {
        return sha256_file(target, &ctx);
    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        throw TransferError(std::string("read-back failed: ") + e.what(), true);
    }
}

void NfsBackend::remove(const std::string& dest) {
    try {
        std::error_code ec;
        fs::remove(mounted_path(dest), ec);
        if (ec) log_warn("nfs", desc_.id + ": cleanup of " + dest + " failed: " + ec.message());
    } catch (const std::exception& e) {
        log_warn("nfs", desc_.id + ": cleanup of " + dest + " failed: " + e.what());
    }
}
