#pragma once
#include "backend_registry.hpp"
#include "config.hpp"
#include "event_sink.hpp"
#include "fetcher.hpp"
#include "job_store.hpp"
#include "lifecycle.hpp"
#include "scheduler.hpp"
#include <cstdint>
#include <optional>
#include <string>

enum class ControlAction { Pause, Resume, Cancel, Retry };

const char* to_string(ControlAction action);
std::optional<ControlAction> control_action_from_string(const std::string& s);

struct JobStatus {
    JobState state{JobState::Pending};
    double progress_percent{0.0};
    double rate{0.0};                // bytes/s of the running stage
    std::optional<double> eta;       // seconds
    std::string error;
    std::string error_detail;
};

struct EligibleCounts {
    std::size_t pending{0};
    std::size_t fetching{0};
    std::size_t fetched{0};
    std::size_t transferring{0};
};

nlohmann::json to_json(const JobStatus& s);
nlohmann::json to_json(const EligibleCounts& c);
nlohmann::json to_json(const JobRecord& job);

// Parses a job descriptor from the control API body. Throws ValidationError.
JobDescriptor job_descriptor_from_json(const nlohmann::json& j, const std::string& default_backend = {});

// The orchestrator: owns the lifecycle and both schedulers, built once at
// startup over explicitly passed collaborators.
class Pipeline {
public:
    Pipeline(const PipelineConfig& cfg, JobStore& store, BackendRegistry& registry, Fetcher& fetcher,
             EventSink& sink, Clock clock = system_now_ms);
    ~Pipeline();
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    void start();
    void stop();

    // Releases claims left behind by a previous process.
    std::size_t recover();

    // Throws ValidationError; no record is created in that case.
    std::string create_job(const JobDescriptor& desc);

    // Returns the new state. Throws NotFound or InvalidTransition.
    JobState control_job(const std::string& id, ControlAction action);

    JobStatus get_job_status(const std::string& id);
    std::optional<JobRecord> get_job(const std::string& id);
    EligibleCounts list_eligible_counts();

    FetchScheduler& fetch_scheduler() { return fetch_; }
    TransferScheduler& transfer_scheduler() { return transfer_; }
    Lifecycle& lifecycle() { return lifecycle_; }

private:
    PipelineConfig cfg_;
    JobStore& store_;
    BackendRegistry& registry_;
    Clock clock_;
    ActiveJobs active_;
    Lifecycle lifecycle_;
    FetchScheduler fetch_;
    TransferScheduler transfer_;
};
