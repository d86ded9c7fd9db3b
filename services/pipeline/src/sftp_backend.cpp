#include "../include/sftp_backend.hpp"
#include "../include/checksum.hpp"
#include "../include/curl_util.hpp"
#include "../include/errors.hpp"
#include "../include/progress.hpp"
#include "../include/util.hpp"
#include <cstdio>
#include <memory>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

size_t read_cb(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* f = static_cast<std::FILE*>(userp);
    size_t got = std::fread(buffer, 1, size * nitems, f);
    if (got == 0 && std::ferror(f)) return CURL_READFUNC_ABORT;
    return got;
}

size_t discard_cb(void*, size_t size, size_t nmemb, void*) { return size * nmemb; }

size_t hash_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<Sha256*>(userp)->update(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string curl_detail(CURLcode rc, const char* errbuf) {
    json d;
    d["curl_code"] = (int)rc;
    d["curl_error"] = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
    return d.dump();
}

std::string sftp_quote(const std::string& path) {
    std::string out = "\"";
    for (char c : path) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out += "\"";
    return out;
}

}

SftpBackend::SftpBackend(BackendDescriptor desc) : TransferBackend(std::move(desc)) {
    if (desc_.port == 0) desc_.port = default_port(Protocol::Sftp);
}

std::string SftpBackend::url_for(CURL* h, const std::string& path) const {
    std::string p = path.empty() || path.front() != '/' ? "/" + path : path;
    return "sftp://" + desc_.host + ":" + std::to_string(desc_.port) + url_escape_path(h, p);
}

void SftpBackend::apply_common(CURL* h) const {
    if (!desc_.username.empty()) curl_easy_setopt(h, CURLOPT_USERNAME, desc_.username.c_str());
    if (!desc_.password.empty()) curl_easy_setopt(h, CURLOPT_PASSWORD, desc_.password.c_str());
    if (!desc_.ssh_key_path.empty()) {
        curl_easy_setopt(h, CURLOPT_SSH_PRIVATE_KEYFILE, desc_.ssh_key_path.c_str());
        curl_easy_setopt(h, CURLOPT_SSH_AUTH_TYPES, (long)(CURLSSH_AUTH_PUBLICKEY | CURLSSH_AUTH_PASSWORD));
    } else {
        curl_easy_setopt(h, CURLOPT_SSH_AUTH_TYPES, (long)(CURLSSH_AUTH_PASSWORD | CURLSSH_AUTH_KEYBOARD));
    }
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, desc_.connect_timeout_ms);
}

bool SftpBackend::test_connection() {
    CurlHandle ch;
    CURL* h = ch.h;
    std::string dir = desc_.base_path.empty() ? "/" : desc_.base_path;
    if (dir.back() != '/') dir.push_back('/');
    std::string url = url_for(h, dir);
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    apply_common(h);
    curl_easy_setopt(h, CURLOPT_DIRLISTONLY, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, discard_cb);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, desc_.connect_timeout_ms);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        log_warn("sftp", desc_.id + ": connection test failed: " + (errbuf[0] ? std::string(errbuf) : curl_easy_strerror(rc)));
        return false;
    }
    return true;
}

PutResult SftpBackend::put(const std::filesystem::path& local, const std::string& dest, StageContext& ctx,
                           const TransferProgressFn& on_progress) {
    std::error_code ec;
    auto total = (std::int64_t)std::filesystem::file_size(local, ec);
    if (ec) throw TransferError("local copy unreadable: " + local.string(), false);
    std::unique_ptr<std::FILE, decltype(&std::fclose)> f(std::fopen(local.c_str(), "rb"), &std::fclose);
    if (!f) throw TransferError("cannot open " + local.string(), false);

    CurlHandle ch;
    CURL* h = ch.h;
    std::string url = url_for(h, dest);
    char errbuf[CURL_ERROR_SIZE] = {0};
    std::int64_t started = ctx.now();
    double rate = 0.0;

    CurlProgress prog;
    prog.ctx = &ctx;
    prog.upload = true;
    prog.on_progress = [&](std::int64_t now, std::int64_t) {
        double secs = (double)(ctx.now() - started) / 1000.0;
        if (secs > 0) rate = (double)now / secs;
        if (on_progress) on_progress(now, total, rate);
    };

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    apply_common(h);
    curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h, CURLOPT_READFUNCTION, read_cb);
    curl_easy_setopt(h, CURLOPT_READDATA, f.get());
    curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, (curl_off_t)total);
    curl_easy_setopt(h, CURLOPT_FTP_CREATE_MISSING_DIRS, (long)CURLFTP_CREATE_DIR);
    curl_easy_setopt(h, CURLOPT_NEW_DIRECTORY_PERMS, 0755L);
    curl_easy_setopt(h, CURLOPT_NEW_FILE_PERMS, 0644L);
    if (desc_.bandwidth_limit_bps > 0)
        curl_easy_setopt(h, CURLOPT_MAX_SEND_SPEED_LARGE, (curl_off_t)desc_.bandwidth_limit_bps);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    install_progress(h, prog);

    if (on_progress) on_progress(0, total, 0.0);
    CURLcode rc = curl_easy_perform(h);
    f.reset();
    rethrow_parked(prog);
    if (rc != CURLE_OK) {
        std::string msg = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
        throw TransferError("sftp upload failed: " + msg, curl_code_retryable(rc), curl_detail(rc, errbuf));
    }

    double secs = (double)(ctx.now() - started) / 1000.0;
    if (secs > 0) rate = (double)total / secs;
    if (on_progress) on_progress(total, total, rate);
    PutResult res;
    res.success = true;
    if (rate > 0) res.observed_rate = rate;
    return res;
}

std::optional<DiskUsage> SftpBackend::probe_disk_usage() {
    return probe_disk_usage_over_ssh(desc_);
}

std::string SftpBackend::remote_checksum(const std::string& dest, StageContext& ctx) {
    CurlHandle ch;
    CURL* h = ch.h;
    std::string url = url_for(h, dest);
    char errbuf[CURL_ERROR_SIZE] = {0};
    Sha256 sha;
    CurlProgress prog;
    prog.ctx = &ctx;

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    apply_common(h);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, hash_cb);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &sha);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    install_progress(h, prog);

    CURLcode rc = curl_easy_perform(h);
    rethrow_parked(prog);
    if (rc != CURLE_OK) {
        std::string msg = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
        throw TransferError("sftp read-back failed: " + msg, curl_code_retryable(rc), curl_detail(rc, errbuf));
    }
    return sha.hex();
}

void SftpBackend::remove(const std::string& dest) {
    try {
        CurlHandle ch;
        CURL* h = ch.h;
        std::string url = url_for(h, "/");
        CurlSlist quote;
        quote.append("rm " + sftp_quote(dest));
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        apply_common(h);
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_QUOTE, quote.list);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, desc_.connect_timeout_ms * 3);
        CURLcode rc = curl_easy_perform(h);
        if (rc != CURLE_OK) log_warn("sftp", desc_.id + ": cleanup of " + dest + " failed: " + curl_easy_strerror(rc));
    } catch (const std::exception& e) {
        log_warn("sftp", desc_.id + ": cleanup of " + dest + " failed: " + e.what());
    }
}
