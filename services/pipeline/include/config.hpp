#pragma once
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct PipelineConfig {
    std::string db_path{"./data/pipeline.db"};
    std::string download_dir{"/tmp/mediadown"};
    std::size_t max_concurrent_downloads{2};
    std::size_t max_concurrent_transfers{2};
    std::int64_t poll_interval_ms{1000};
    std::int64_t fetch_timeout_ms{6 * 3600 * 1000};
    std::int64_t transfer_timeout_ms{6 * 3600 * 1000};
    std::int64_t aging_threshold_ms{0};
    std::int64_t retry_base_backoff_ms{30000};
    std::int64_t retry_max_backoff_ms{600000};
    std::int64_t progress_interval_ms{5000};
    bool verify_checksums{true};
    std::vector<std::string> accepted_qualities{"480p", "720p", "1080p"};
    std::string backends_file;
    int control_port{7100};
    std::size_t event_queue_capacity{1024};
    std::string events_log_path;
    std::string log_level{"info"};
};

// Keys as in the environment, lower-cased: {"db_path": ..., "max_concurrent_downloads": 4, ...}.
void apply_json(PipelineConfig& cfg, const nlohmann::json& j);
void apply_env(PipelineConfig& cfg);

// Defaults, then the JSON file from --config or PIPELINE_CONFIG, then the
// environment, then command-line flags. Throws ValidationError.
PipelineConfig load_config(int argc, char** argv);

void validate(const PipelineConfig& cfg);
