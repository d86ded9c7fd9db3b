#include "../include/pipeline_client.hpp"
#include <curl/curl.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

std::string escape_segment(CURL* h, const std::string& s) {
    char* esc = curl_easy_escape(h, s.c_str(), (int)s.size());
    if (!esc) throw std::runtime_error("curl_easy_escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}
}

std::string error_message(const json& body, long status) {
    if (body.is_object() && body.contains("error")) {
        const json& e = body["error"];
        if (e.is_string()) return e.get<std::string>();
        if (!e.is_null()) return e.dump();
    }
    return "HTTP " + std::to_string(status);
}

PipelineClient::PipelineClient(std::string base_url, long timeout_ms) : base_(std::move(base_url)), timeout_ms_(timeout_ms) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

ClientResult PipelineClient::request(const std::string& method, const std::string& path, const std::string& body) {
    CurlHandle c;
    std::string url = base_ + path;
    std::string buf;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    if (method == "POST") {
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body.size());
    }
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    CURLcode code = curl_easy_perform(c.h);
    curl_slist_free_all(headers);

    ClientResult r;
    if (code != CURLE_OK) {
        r.error = curl_easy_strerror(code);
        return r;
    }
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &r.status);
    r.body = json::parse(buf, nullptr, false);
    if (r.body.is_discarded()) r.body = nullptr;
    r.ok = r.status >= 200 && r.status < 300;
    if (!r.ok) {
        r.error = error_message(r.body, r.status);
    }
    return r;
}

ClientResult PipelineClient::create_job(const json& descriptor) {
    return request("POST", "/jobs", descriptor.dump());
}

ClientResult PipelineClient::job_status(const std::string& id) {
    CurlHandle c;
    return request("GET", "/jobs/" + escape_segment(c.h, id), {});
}

ClientResult PipelineClient::control(const std::string& id, const std::string& action) {
    CurlHandle c;
    return request("POST", "/jobs/" + escape_segment(c.h, id) + "/" + escape_segment(c.h, action), "{}");
}

ClientResult PipelineClient::stats() {
    return request("GET", "/stats", {});
}

ClientResult PipelineClient::backend_health(const std::string& backend_id) {
    CurlHandle c;
    return request("GET", "/backends/" + escape_segment(c.h, backend_id) + "/health", {});
}
