#include "../include/curl_util.hpp"
#include "../include/progress.hpp"
#include <mutex>
#include <stdexcept>

namespace {

int xferinfo_cb(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow) {
    auto* p = static_cast<CurlProgress*>(clientp);
    try {
        if (p->ctx) p->ctx->check();
        if (p->on_progress) {
            if (p->upload) p->on_progress(static_cast<std::int64_t>(ulnow), static_cast<std::int64_t>(ultotal));
            else p->on_progress(static_cast<std::int64_t>(dlnow), static_cast<std::int64_t>(dltotal));
        }
    } catch (...) {
        p->error = std::current_exception();
        return 1;  // curl aborts with CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

}

void ensure_curl_global() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) throw std::runtime_error("curl_global_init failed");
    });
}

CurlHandle::CurlHandle() {
    ensure_curl_global();
    h = curl_easy_init();
    if (!h) throw std::runtime_error("curl_easy_init failed");
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
}

CurlHandle::~CurlHandle() {
    if (h) curl_easy_cleanup(h);
}

void install_progress(CURL* h, CurlProgress& progress) {
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &progress);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
}

void rethrow_parked(const CurlProgress& progress) {
    if (progress.error) std::rethrow_exception(progress.error);
}

bool curl_code_retryable(CURLcode code) {
    switch (code) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
        case CURLE_LOGIN_DENIED:
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_REMOTE_FILE_NOT_FOUND:
        case CURLE_REMOTE_DISK_FULL:
        case CURLE_FILE_COULDNT_READ_FILE:
        case CURLE_WRITE_ERROR:
        case CURLE_READ_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_QUOTE_ERROR:
            return false;
        default:
            return true;
    }
}

std::string url_escape_path(CURL* h, const std::string& path) {
    std::string out;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        std::size_t next = path.find('/', pos);
        std::string seg = path.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        if (!seg.empty()) {
            char* esc = curl_easy_escape(h, seg.c_str(), static_cast<int>(seg.size()));
            if (!esc) throw std::runtime_error("curl_easy_escape failed");
            out += esc;
            curl_free(esc);
        }
        if (next == std::string::npos) break;
        out += '/';
        pos = next + 1;
    }
    return out;
}
