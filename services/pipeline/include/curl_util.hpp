#pragma once
#include <curl/curl.h>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>

class StageContext;

// Calls curl_global_init once per process.
void ensure_curl_global();

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle();
    ~CurlHandle();
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlSlist {
    curl_slist* list{nullptr};
    ~CurlSlist() { if (list) curl_slist_free_all(list); }
    void append(const std::string& s) { list = curl_slist_append(list, s.c_str()); }
};

// State shared with the progress trampoline. Anything thrown by `ctx` or the
// progress function is parked here and rethrown after curl_easy_perform.
struct CurlProgress {
    StageContext* ctx{nullptr};
    std::function<void(std::int64_t now, std::int64_t total)> on_progress;
    bool upload{false};  // feed upload counters instead of download counters
    std::exception_ptr error;
};

void install_progress(CURL* h, CurlProgress& progress);

// Rethrows a parked exception, if any.
void rethrow_parked(const CurlProgress& progress);

// Connection, timeout and mid-stream errors are worth retrying; auth,
// malformed URLs, unsupported schemes and missing remote paths are not.
bool curl_code_retryable(CURLcode code);

std::string url_escape_path(CURL* h, const std::string& path);
