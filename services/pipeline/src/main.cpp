#include <iostream>
#include <string>
#include <map>
#include <memory>
#include <cstring>
#include <csignal>
#include <filesystem>
#include <unistd.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include "../include/backend_registry.hpp"
#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/event_sink.hpp"
#include "../include/fetcher.hpp"
#include "../include/job_store.hpp"
#include "../include/pipeline.hpp"
#include "../include/util.hpp"

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

struct Daemon {
    Pipeline* pipeline;
    BackendRegistry* registry;
};

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, unsigned int status, const std::string& body,
                               const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MhdResult send_error(struct MHD_Connection* conn, unsigned int status, const std::string& msg) {
    return send_response(conn, status, json({{"error", msg}}).dump());
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

// "/jobs/<id>" -> {id, ""}, "/jobs/<id>/pause" -> {id, "pause"}
static bool split_job_path(const std::string& path, std::string& id, std::string& action) {
    const std::string prefix = "/jobs/";
    if (path.rfind(prefix, 0) != 0) return false;
    std::string rest = path.substr(prefix.size());
    auto slash = rest.find('/');
    id = rest.substr(0, slash);
    action = slash == std::string::npos ? std::string() : rest.substr(slash + 1);
    return !id.empty();
}

static MhdResult handle(Daemon& d, struct MHD_Connection* connection, const ConnInfo& ci) {
    const std::string& path = ci.url;
    if (ci.method == "POST" && path == "/jobs") {
        json body = json::parse(ci.body, nullptr, false);
        if (body.is_discarded()) return send_error(connection, MHD_HTTP_BAD_REQUEST, "body is not valid JSON");
        std::string id = d.pipeline->create_job(job_descriptor_from_json(body));
        return send_response(connection, MHD_HTTP_CREATED, json({{"id", id}, {"state", "pending"}}).dump());
    }
    if (ci.method == "GET" && path == "/stats") {
        json out = {{"eligible", to_json(d.pipeline->list_eligible_counts())},
                    {"in_flight", {{"fetch", d.pipeline->fetch_scheduler().in_flight()},
                                   {"transfer", d.pipeline->transfer_scheduler().in_flight()}}}};
        return send_response(connection, MHD_HTTP_OK, out.dump());
    }
    if (ci.method == "GET" && path.rfind("/backends/", 0) == 0) {
        std::string rest = path.substr(std::string("/backends/").size());
        auto slash = rest.find('/');
        if (slash == std::string::npos || rest.substr(slash + 1) != "health") {
            return send_error(connection, MHD_HTTP_NOT_FOUND, "not found");
        }
        std::string id = rest.substr(0, slash);
        BackendHealth h = d.registry->check_health(id);
        json out = to_json(h);
        out["backend"] = to_json(d.registry->resolve(id));
        return send_response(connection, MHD_HTTP_OK, out.dump());
    }
    std::string id, action;
    if (split_job_path(path, id, action)) {
        if (ci.method == "GET" && action.empty()) {
            auto job = d.pipeline->get_job(id);
            if (!job) return send_error(connection, MHD_HTTP_NOT_FOUND, "job " + id + " not found");
            json out = to_json(d.pipeline->get_job_status(id));
            out["job"] = to_json(*job);
            return send_response(connection, MHD_HTTP_OK, out.dump());
        }
        if (ci.method == "POST") {
            auto act = control_action_from_string(action);
            if (!act) return send_error(connection, MHD_HTTP_NOT_FOUND, "unknown action " + action);
            JobState s = d.pipeline->control_job(id, *act);
            return send_response(connection, MHD_HTTP_OK, json({{"id", id}, {"state", to_string(s)}}).dump());
        }
    }
    return send_error(connection, MHD_HTTP_NOT_FOUND, "not found");
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    auto* d = static_cast<Daemon*>(cls);
    try {
        return handle(*d, connection, *ci);
    } catch (const ValidationError& e) {
        return send_error(connection, MHD_HTTP_BAD_REQUEST, e.what());
    } catch (const NotFound& e) {
        return send_error(connection, MHD_HTTP_NOT_FOUND, e.what());
    } catch (const InvalidTransition& e) {
        return send_error(connection, MHD_HTTP_CONFLICT, e.what());
    } catch (const std::exception& e) {
        log_error("http", std::string(method) + " " + url + ": " + e.what());
        return send_error(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, e.what());
    }
}

static volatile std::sig_atomic_t g_stop = 0;

int main(int argc, char** argv) {
    PipelineConfig cfg;
    try {
        cfg = load_config(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[pipelined] " << e.what() << std::endl;
        return 2;
    }
    set_log_level(parse_log_level(cfg.log_level));

    try {
        std::filesystem::path db_dir = std::filesystem::path(cfg.db_path).parent_path();
        if (!db_dir.empty()) std::filesystem::create_directories(db_dir);
        JobStore store(cfg.db_path);
        BackendRegistry registry;
        if (!cfg.backends_file.empty()) registry.load_file(cfg.backends_file);
        else log_warn("pipelined", "no BACKENDS_FILE configured; every job will be rejected");

        FetcherConfig fc;
        fc.download_dir = cfg.download_dir;
        fc.accepted_qualities = cfg.accepted_qualities;
        CurlFetcher fetcher(fc);

        auto event_log = std::make_shared<JsonLinesEventLog>(cfg.events_log_path);
        AsyncEventSink sink([event_log](const PipelineEvent& ev) { (*event_log)(ev); }, cfg.event_queue_capacity);

        Pipeline pipeline(cfg, store, registry, fetcher, sink);
        pipeline.recover();
        pipeline.start();

        Daemon daemon{&pipeline, &registry};
        log_info("pipelined", "Starting HTTP server on port " + std::to_string(cfg.control_port) + "...");
        struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD,
                                                (uint16_t)cfg.control_port, nullptr, nullptr, &handler, &daemon,
                                                MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                                MHD_OPTION_END);
        if (!d) {
            log_error("pipelined", "Failed to start HTTP server");
            pipeline.stop();
            return 1;
        }

        std::signal(SIGTERM, [](int) { g_stop = 1; });
        std::signal(SIGINT, [](int) { g_stop = 1; });
        while (!g_stop) pause();

        log_info("pipelined", "shutting down");
        MHD_stop_daemon(d);
        pipeline.stop();
        sink.stop();
        if (sink.dropped()) log_warn("pipelined", std::to_string(sink.dropped()) + " events were dropped");
    } catch (const std::exception& e) {
        log_error("pipelined", e.what());
        return 1;
    }
    return 0;
}
