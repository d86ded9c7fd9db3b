#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

class StageContext;

struct FetchRequest {
    std::string job_id;
    std::string url;
    std::string quality;
    std::string title;
};

struct FetchResult {
    std::filesystem::path local_path;
    std::int64_t size{0};
};

// done/total bytes; total is 0 while unknown.
using FetchProgressFn = std::function<void(std::int64_t done, std::int64_t total)>;

class Fetcher {
public:
    virtual ~Fetcher() = default;
    // Throws TransientFailure / FatalFailure on failure and JobAborted when
    // the context is aborted. Leaves no partial file behind on failure.
    virtual FetchResult fetch(const FetchRequest& req, StageContext& ctx, const FetchProgressFn& on_progress) = 0;
};

struct FetcherConfig {
    std::filesystem::path download_dir{"/tmp/mediadown"};
    std::vector<std::string> accepted_qualities{"480p", "720p", "1080p"};
    long connect_timeout_ms{30000};
    std::string user_agent{"Mozilla/5.0 (X11; Linux x86_64) mediadown/1.0"};
    // Abort when slower than low_speed_bytes for low_speed_time_s seconds.
    long low_speed_bytes{1024};
    long low_speed_time_s{60};
};

// Fetches anything libcurl can read (http, https, ftp, file).
class CurlFetcher : public Fetcher {
public:
    explicit CurlFetcher(FetcherConfig cfg);

    FetchResult fetch(const FetchRequest& req, StageContext& ctx, const FetchProgressFn& on_progress) override;

    // job_<id>_<title><ext>, ext from the URL path or ".mp4".
    std::filesystem::path local_path_for(const FetchRequest& req) const;

private:
    FetcherConfig cfg_;
};

bool quality_accepted(const std::vector<std::string>& accepted, const std::string& quality);
