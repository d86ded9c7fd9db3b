#pragma once
#include <nlohmann/json.hpp>
#include <string>

struct ClientResult {
    bool ok{false};
    long status{0};        // HTTP status, 0 when the request never completed
    nlohmann::json body;   // parsed response, null when not JSON
    std::string error;
};

// The server's "error" field of a failed response, or "HTTP <status>".
std::string error_message(const nlohmann::json& body, long status);

// Thin client for the pipelined control API.
class PipelineClient {
public:
    explicit PipelineClient(std::string base_url, long timeout_ms = 30000);

    ClientResult create_job(const nlohmann::json& descriptor);
    ClientResult job_status(const std::string& id);
    ClientResult control(const std::string& id, const std::string& action);  // pause|resume|cancel|retry
    ClientResult stats();
    ClientResult backend_health(const std::string& backend_id);

private:
    ClientResult request(const std::string& method, const std::string& path, const std::string& body);

    std::string base_;
    long timeout_ms_;
};
