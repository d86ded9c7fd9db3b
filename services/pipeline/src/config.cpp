#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

std::int64_t to_int(const std::string& key, const std::string& v) {
    try {
        std::size_t pos = 0;
        long long n = std::stoll(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return n;
    } catch (const std::exception&) {
        throw ValidationError(key + ": expected an integer, got '" + v + "'");
    }
}

std::size_t to_count(const std::string& key, const std::string& v) {
    std::int64_t n = to_int(key, v);
    if (n < 1) throw ValidationError(key + " must be at least 1, got " + v);
    return static_cast<std::size_t>(n);
}

bool to_bool(const std::string& key, const std::string& v) {
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ValidationError(key + ": expected a boolean, got '" + v + "'");
}

// One setting by its environment name; shared by the env and flag layers.
void set_value(PipelineConfig& c, const std::string& key, const std::string& v) {
    if (key == "PIPELINE_DB_PATH") c.db_path = v;
    else if (key == "TEMP_DOWNLOAD_DIR") c.download_dir = v;
    else if (key == "MAX_CONCURRENT_DOWNLOADS") c.max_concurrent_downloads = to_count(key, v);
    else if (key == "MAX_CONCURRENT_TRANSFERS") c.max_concurrent_transfers = to_count(key, v);
    else if (key == "POLL_INTERVAL_MS") c.poll_interval_ms = to_int(key, v);
    else if (key == "FETCH_TIMEOUT_MS") c.fetch_timeout_ms = to_int(key, v);
    else if (key == "TRANSFER_TIMEOUT_MS") c.transfer_timeout_ms = to_int(key, v);
    else if (key == "AGING_THRESHOLD_MS") c.aging_threshold_ms = to_int(key, v);
    else if (key == "RETRY_BASE_BACKOFF_MS") c.retry_base_backoff_ms = to_int(key, v);
    else if (key == "RETRY_MAX_BACKOFF_MS") c.retry_max_backoff_ms = to_int(key, v);
    else if (key == "PROGRESS_INTERVAL_MS") c.progress_interval_ms = to_int(key, v);
    else if (key == "VERIFY_CHECKSUMS") c.verify_checksums = to_bool(key, v);
    else if (key == "ACCEPTED_QUALITIES") c.accepted_qualities = split_list(v, ',');
    else if (key == "BACKENDS_FILE") c.backends_file = v;
    else if (key == "CONTROL_PORT") c.control_port = (int)to_int(key, v);
    else if (key == "EVENT_QUEUE_CAPACITY") c.event_queue_capacity = to_count(key, v);
    else if (key == "EVENTS_LOG_PATH") c.events_log_path = v;
    else if (key == "LOG_LEVEL") c.log_level = v;
    else throw ValidationError("unknown setting " + key);
}

const char* kKeys[] = {"PIPELINE_DB_PATH",      "TEMP_DOWNLOAD_DIR",     "MAX_CONCURRENT_DOWNLOADS",
                       "MAX_CONCURRENT_TRANSFERS", "POLL_INTERVAL_MS",   "FETCH_TIMEOUT_MS",
                       "TRANSFER_TIMEOUT_MS",   "AGING_THRESHOLD_MS",    "RETRY_BASE_BACKOFF_MS",
                       "RETRY_MAX_BACKOFF_MS",  "PROGRESS_INTERVAL_MS",  "VERIFY_CHECKSUMS",
                       "ACCEPTED_QUALITIES",    "BACKENDS_FILE",         "CONTROL_PORT",
                       "EVENT_QUEUE_CAPACITY",  "EVENTS_LOG_PATH",       "LOG_LEVEL"};

std::string upper(std::string s) {
    for (auto& ch : s) ch = (char)std::toupper((unsigned char)ch);
    return s;
}

void usage() {
    std::cerr << "pipelined usage:\n"
              << "  pipelined [--config <file>] [--db <dbfile>] [--download-dir <dir>] [--backends <file>]\n"
              << "            [--port N] [--max-downloads N] [--max-transfers N] [--log-level <level>]\n"
              << "            [--no-verify]\n";
}

}

void apply_json(PipelineConfig& cfg, const json& j) {
    if (!j.is_object()) throw ValidationError("config must be a JSON object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        std::string key = upper(it.key());
        if (key == "DB_PATH") key = "PIPELINE_DB_PATH";
        if (key == "ACCEPTED_QUALITIES" && it.value().is_array()) {
            cfg.accepted_qualities = it.value().get<std::vector<std::string>>();
            continue;
        }
        const json& v = it.value();
        set_value(cfg, key, v.is_string() ? v.get<std::string>() : v.dump());
    }
}

void apply_env(PipelineConfig& cfg) {
    for (const char* key : kKeys) {
        if (const char* v = std::getenv(key)) set_value(cfg, key, v);
    }
}

void validate(const PipelineConfig& cfg) {
    if (cfg.max_concurrent_downloads < 1) throw ValidationError("MAX_CONCURRENT_DOWNLOADS must be at least 1");
    if (cfg.max_concurrent_transfers < 1) throw ValidationError("MAX_CONCURRENT_TRANSFERS must be at least 1");
    if (cfg.poll_interval_ms < 1) throw ValidationError("POLL_INTERVAL_MS must be positive");
    if (cfg.retry_base_backoff_ms < 0 || cfg.retry_max_backoff_ms < cfg.retry_base_backoff_ms)
        throw ValidationError("retry backoff must satisfy 0 <= base <= max");
    if (cfg.control_port < 0 || cfg.control_port > 65535) throw ValidationError("CONTROL_PORT out of range");
    if (cfg.event_queue_capacity < 1) throw ValidationError("EVENT_QUEUE_CAPACITY must be at least 1");
}

PipelineConfig load_config(int argc, char** argv) {
    PipelineConfig cfg;

    std::string file = getenv_or("PIPELINE_CONFIG", "");
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) file = argv[i + 1];
    }
    if (!file.empty()) {
        std::ifstream in(file);
        if (!in) throw ValidationError("cannot open config file " + file);
        json j = json::parse(in, nullptr, false);
        if (j.is_discarded()) throw ValidationError("config file " + file + " is not valid JSON");
        apply_json(cfg, j);
    }

    apply_env(cfg);

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        bool has_value = i + 1 < argc;
        if (a == "--config" && has_value) ++i;
        else if (a == "--db" && has_value) cfg.db_path = argv[++i];
        else if (a == "--download-dir" && has_value) cfg.download_dir = argv[++i];
        else if (a == "--backends" && has_value) cfg.backends_file = argv[++i];
        else if (a == "--port" && has_value) set_value(cfg, "CONTROL_PORT", argv[++i]);
        else if (a == "--max-downloads" && has_value) set_value(cfg, "MAX_CONCURRENT_DOWNLOADS", argv[++i]);
        else if (a == "--max-transfers" && has_value) set_value(cfg, "MAX_CONCURRENT_TRANSFERS", argv[++i]);
        else if (a == "--log-level" && has_value) cfg.log_level = argv[++i];
        else if (a == "--no-verify") cfg.verify_checksums = false;
        else {
            usage();
            throw ValidationError("unknown argument " + a);
        }
    }
    validate(cfg);
    return cfg;
}
