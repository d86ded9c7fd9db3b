#include "../include/job.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>

const char* to_string(JobState state) {
    switch (state) {
        case JobState::Pending: return "pending";
        case JobState::Fetching: return "fetching";
        case JobState::Fetched: return "fetched";
        case JobState::Transferring: return "transferring";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::Paused: return "paused";
        case JobState::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(Priority priority) {
    switch (priority) {
        case Priority::Low: return "low";
        case Priority::Medium: return "medium";
        case Priority::High: return "high";
    }
    return "medium";
}

std::optional<JobState> job_state_from_string(const std::string& s) {
    if (s == "pending") return JobState::Pending;
    if (s == "fetching") return JobState::Fetching;
    if (s == "fetched") return JobState::Fetched;
    if (s == "transferring") return JobState::Transferring;
    if (s == "completed") return JobState::Completed;
    if (s == "failed") return JobState::Failed;
    if (s == "paused") return JobState::Paused;
    if (s == "cancelled") return JobState::Cancelled;
    return std::nullopt;
}

std::optional<Priority> priority_from_string(const std::string& s) {
    if (s == "low") return Priority::Low;
    if (s == "medium") return Priority::Medium;
    if (s == "high") return Priority::High;
    return std::nullopt;
}

bool is_terminal(JobState state) {
    return state == JobState::Completed || state == JobState::Failed || state == JobState::Cancelled;
}

bool is_active(JobState state) {
    return state == JobState::Fetching || state == JobState::Transferring;
}

JobRecord make_record(const std::string& id, const JobDescriptor& d, std::int64_t now) {
    JobRecord r;
    r.id = id;
    r.title = d.title;
    r.content_type = d.content_type;
    r.quality = d.quality;
    r.source_url = d.source_url;
    r.season = d.season;
    r.episode = d.episode;
    r.year = d.year;
    r.backend_id = d.backend_id;
    r.destination_path = d.destination_path;
    r.priority = d.priority;
    r.max_attempts = d.max_attempts;
    r.created_at = now;
    r.updated_at = now;
    r.eligible_at = now;
    return r;
}

std::string formatted_title(const JobRecord& job) {
    char buf[64];
    if (job.content_type == "movie") {
        if (!job.year) return job.title;
        snprintf(buf, sizeof(buf), " (%d)", *job.year);
        return job.title + buf;
    }
    if (job.content_type == "series" && job.season && job.episode) {
        snprintf(buf, sizeof(buf), " S%02dE%02d", *job.season, *job.episode);
        return job.title + buf;
    }
    if (job.content_type == "novela" && job.season && job.episode) {
        snprintf(buf, sizeof(buf), " - %dx%02d", *job.season, *job.episode);
        return job.title + buf;
    }
    return job.title;
}

std::string destination_filename(const JobRecord& job) {
    std::string ext = ".mp4";
    if (!job.local_path.empty()) {
        auto e = std::filesystem::path(job.local_path).extension().string();
        if (!e.empty()) ext = e;
    }
    std::string name = formatted_title(job) + ext;
    std::replace(name.begin(), name.end(), '/', '-');
    std::replace(name.begin(), name.end(), '\\', '-');
    return name;
}
