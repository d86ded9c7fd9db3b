#include "../include/fetcher.hpp"
#include "../include/curl_util.hpp"
#include "../include/errors.hpp"
#include "../include/progress.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

struct SinkFile {
    std::FILE* f{nullptr};
    bool failed{false};
    int err{0};
};

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<SinkFile*>(userp);
    size_t total = size * nmemb;
    if (std::fwrite(contents, 1, total, sink->f) != total) {
        sink->failed = true;
        sink->err = errno;
        return 0;
    }
    return total;
}

std::string url_extension(const std::string& url) {
    auto end = url.find_first_of("?#");
    std::string path = url.substr(0, end);
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return ".mp4";
    std::string ext = name.substr(dot);
    if (ext.size() > 6 || ext.find_first_of(":%") != std::string::npos) return ".mp4";
    return ext;
}

bool http_status_retryable(long status) {
    return status >= 500 || status == 408 || status == 429;
}

}

bool quality_accepted(const std::vector<std::string>& accepted, const std::string& quality) {
    if (accepted.empty()) return true;
    return std::find(accepted.begin(), accepted.end(), quality) != accepted.end();
}

CurlFetcher::CurlFetcher(FetcherConfig cfg) : cfg_(std::move(cfg)) {}

std::filesystem::path CurlFetcher::local_path_for(const FetchRequest& req) const {
    return cfg_.download_dir / ("job_" + req.job_id + "_" + sanitize_filename(req.title) + url_extension(req.url));
}

FetchResult CurlFetcher::fetch(const FetchRequest& req, StageContext& ctx, const FetchProgressFn& on_progress) {
    if (!quality_accepted(cfg_.accepted_qualities, req.quality)) {
        throw FatalFailure("requested quality " + req.quality + " not available",
                           json({{"quality", req.quality}, {"accepted", cfg_.accepted_qualities}}).dump());
    }
    std::error_code ec;
    std::filesystem::create_directories(cfg_.download_dir, ec);
    if (ec) {
        throw FatalFailure("cannot create download dir " + cfg_.download_dir.string() + ": " + ec.message());
    }

    auto final_path = local_path_for(req);
    auto part_path = final_path;
    part_path += ".part";

    SinkFile sink;
    sink.f = std::fopen(part_path.c_str(), "wb");
    if (!sink.f) {
        throw FatalFailure("cannot open " + part_path.string() + ": " + std::strerror(errno));
    }
    auto discard = [&] {
        if (sink.f) {
            std::fclose(sink.f);
            sink.f = nullptr;
        }
        std::filesystem::remove(part_path, ec);
    };

    log_info("fetch", "job " + req.job_id + " fetching " + req.url);
    CurlProgress progress;
    progress.ctx = &ctx;
    progress.on_progress = on_progress;

    CURLcode code;
    long status = 0;
    try {
        CurlHandle c;
        curl_easy_setopt(c.h, CURLOPT_URL, req.url.c_str());
        curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(c.h, CURLOPT_USERAGENT, cfg_.user_agent.c_str());
        curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &sink);
        curl_easy_setopt(c.h, CURLOPT_CONNECTTIMEOUT_MS, cfg_.connect_timeout_ms);
        curl_easy_setopt(c.h, CURLOPT_LOW_SPEED_LIMIT, cfg_.low_speed_bytes);
        curl_easy_setopt(c.h, CURLOPT_LOW_SPEED_TIME, cfg_.low_speed_time_s);
        if (ctx.remaining_ms() > 0) curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, static_cast<long>(ctx.remaining_ms()));
        install_progress(c.h, progress);
        code = curl_easy_perform(c.h);
        curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    } catch (...) {
        discard();
        throw;
    }

    if (code == CURLE_ABORTED_BY_CALLBACK && progress.error) {
        discard();
        rethrow_parked(progress);
    }
    if (sink.failed) {
        std::string why = std::strerror(sink.err);
        discard();
        throw FatalFailure("local write failed for job " + req.job_id + ": " + why,
                           json({{"path", part_path.string()}, {"errno", sink.err}}).dump());
    }
    if (code != CURLE_OK) {
        discard();
        std::string msg = std::string("fetch failed: ") + curl_easy_strerror(code);
        std::string detail = json({{"url", req.url}, {"curl_code", static_cast<int>(code)}}).dump();
        if (code == CURLE_OPERATION_TIMEDOUT) ctx.check();
        if (curl_code_retryable(code)) throw TransientFailure(msg, detail);
        throw FatalFailure(msg, detail);
    }
    // file:// and ftp:// report 0 here.
    if (status >= 400) {
        discard();
        std::string msg = "fetch failed: HTTP " + std::to_string(status);
        std::string detail = json({{"url", req.url}, {"http_status", status}}).dump();
        if (http_status_retryable(status)) throw TransientFailure(msg, detail);
        throw FatalFailure(msg, detail);
    }
    if (std::fclose(sink.f) != 0) {
        sink.f = nullptr;
        discard();
        throw TransientFailure("closing " + part_path.string() + " failed");
    }
    sink.f = nullptr;

    std::filesystem::rename(part_path, final_path, ec);
    if (ec) {
        discard();
        throw FatalFailure("cannot move fetched file into place: " + ec.message());
    }
    FetchResult res;
    res.local_path = final_path;
    res.size = static_cast<std::int64_t>(std::filesystem::file_size(final_path));
    if (on_progress) {
        try {
            on_progress(res.size, res.size);
        } catch (...) {
            std::filesystem::remove(final_path, ec);
            throw;
        }
    }
    log_info("fetch", "job " + req.job_id + " fetched " + std::to_string(res.size) + " bytes to " + final_path.string());
    return res;
}
