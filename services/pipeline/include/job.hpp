#pragma once
#include <cstdint>
#include <optional>
#include <string>

enum class JobState { Pending, Fetching, Fetched, Transferring, Completed, Failed, Paused, Cancelled };

enum class Priority { Low = 1, Medium = 2, High = 3 };

const char* to_string(JobState state);
const char* to_string(Priority priority);
std::optional<JobState> job_state_from_string(const std::string& s);
std::optional<Priority> priority_from_string(const std::string& s);

// COMPLETED, CANCELLED and FAILED. A FAILED job with attempts left can still
// be retried by an operator.
bool is_terminal(JobState state);
bool is_active(JobState state); // FETCHING or TRANSFERRING

// What the ingestion side hands over. Everything but the destination is
// carried through untouched.
struct JobDescriptor {
    std::string title;
    std::string content_type;   // movie, series, novela, ...
    std::string quality;        // e.g. "1080p"
    std::string source_url;
    std::optional<int> season;
    std::optional<int> episode;
    std::optional<int> year;
    std::string backend_id;
    std::string destination_path;
    Priority priority{Priority::Medium};
    int max_attempts{3};
};

struct JobRecord {
    std::string id;

    std::string title;
    std::string content_type;
    std::string quality;
    std::string source_url;
    std::optional<int> season;
    std::optional<int> episode;
    std::optional<int> year;

    std::string backend_id;
    std::string destination_path;

    JobState state{JobState::Pending};
    Priority priority{Priority::Medium};
    int attempt_count{1};  // number of the attempt in progress
    int max_attempts{3};

    std::string local_path;
    std::int64_t local_size{0};
    std::int64_t fetched_size{0};
    std::int64_t transferred_size{0};
    double progress_percent{0.0};
    double transfer_rate{0.0};  // bytes/s of the running stage
    std::string checksum;       // sha256 hex of the fetched copy

    std::int64_t created_at{0};
    std::optional<std::int64_t> fetch_started_at;
    std::optional<std::int64_t> fetch_completed_at;
    std::optional<std::int64_t> transfer_started_at;
    std::optional<std::int64_t> completed_at;
    std::int64_t updated_at{0};

    std::string last_error;
    std::string last_error_detail;  // JSON object

    std::string claimed_by;       // claim token, empty when no worker holds the job
    std::int64_t eligible_at{0};  // backoff gate
    double resume_progress{0.0};
    std::int64_t version{0};
};

JobRecord make_record(const std::string& id, const JobDescriptor& d, std::int64_t now);

// "Title (2020)", "Title S01E02", "Title - 1x02" or the bare title.
std::string formatted_title(const JobRecord& job);

// File name on the destination, extension taken from the fetched copy.
// Path separators in the title become "-".
std::string destination_filename(const JobRecord& job);
