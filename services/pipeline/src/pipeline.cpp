#include "../include/pipeline.hpp"
#include "../include/errors.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace {

SchedulerOptions fetch_options(const PipelineConfig& cfg) {
    SchedulerOptions o;
    o.max_concurrent = cfg.max_concurrent_downloads;
    o.poll_interval_ms = cfg.poll_interval_ms;
    o.stage_timeout_ms = cfg.fetch_timeout_ms;
    o.aging_threshold_ms = cfg.aging_threshold_ms;
    o.progress_interval_ms = cfg.progress_interval_ms;
    return o;
}

SchedulerOptions transfer_options(const PipelineConfig& cfg) {
    SchedulerOptions o = fetch_options(cfg);
    o.max_concurrent = cfg.max_concurrent_transfers;
    o.stage_timeout_ms = cfg.transfer_timeout_ms;
    return o;
}

std::optional<int> optional_int(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<int>();
}

}

const char* to_string(ControlAction action) {
    switch (action) {
        case ControlAction::Pause: return "pause";
        case ControlAction::Resume: return "resume";
        case ControlAction::Cancel: return "cancel";
        case ControlAction::Retry: return "retry";
    }
    return "unknown";
}

std::optional<ControlAction> control_action_from_string(const std::string& s) {
    if (s == "pause") return ControlAction::Pause;
    if (s == "resume") return ControlAction::Resume;
    if (s == "cancel") return ControlAction::Cancel;
    if (s == "retry") return ControlAction::Retry;
    return std::nullopt;
}

json to_json(const JobStatus& s) {
    json j{{"state", to_string(s.state)}, {"progress_percent", s.progress_percent}, {"rate", s.rate}};
    j["eta"] = s.eta ? json(*s.eta) : json(nullptr);
    j["error"] = s.error.empty() ? json(nullptr) : json(s.error);
    if (!s.error_detail.empty()) {
        auto d = json::parse(s.error_detail, nullptr, false);
        j["error_detail"] = d.is_discarded() ? json(s.error_detail) : d;
    }
    return j;
}

json to_json(const EligibleCounts& c) {
    return json{{"pending", c.pending}, {"fetching", c.fetching}, {"fetched", c.fetched}, {"transferring", c.transferring}};
}

json to_json(const JobRecord& r) {
    auto opt = [](const auto& v) { return v ? json(*v) : json(nullptr); };
    return json{{"id", r.id},
                {"title", r.title},
                {"content_type", r.content_type},
                {"quality", r.quality},
                {"source_url", r.source_url},
                {"season", opt(r.season)},
                {"episode", opt(r.episode)},
                {"year", opt(r.year)},
                {"backend_id", r.backend_id},
                {"destination_path", r.destination_path},
                {"state", to_string(r.state)},
                {"priority", to_string(r.priority)},
                {"attempt_count", r.attempt_count},
                {"max_attempts", r.max_attempts},
                {"local_size", r.local_size},
                {"transferred_size", r.transferred_size},
                {"progress_percent", r.progress_percent},
                {"transfer_rate", r.transfer_rate},
                {"checksum", r.checksum},
                {"created_at", r.created_at},
                {"fetch_started_at", opt(r.fetch_started_at)},
                {"fetch_completed_at", opt(r.fetch_completed_at)},
                {"transfer_started_at", opt(r.transfer_started_at)},
                {"completed_at", opt(r.completed_at)},
                {"last_error", r.last_error}};
}

JobDescriptor job_descriptor_from_json(const json& j, const std::string& default_backend) {
    if (!j.is_object()) throw ValidationError("job descriptor must be a JSON object");
    JobDescriptor d;
    try {
        d.title = j.value("title", std::string());
        d.content_type = j.value("content_type", std::string("movie"));
        d.quality = j.value("quality", std::string());
        d.source_url = j.value("source_url", std::string());
        d.season = optional_int(j, "season");
        d.episode = optional_int(j, "episode");
        d.year = optional_int(j, "year");
        d.backend_id = j.contains("backend_id") && j["backend_id"].is_number()
                           ? std::to_string(j["backend_id"].get<long long>())
                           : j.value("backend_id", default_backend);
        d.destination_path = j.value("destination_path", std::string());
        std::string prio = j.value("priority", std::string("medium"));
        auto p = priority_from_string(prio);
        if (!p) throw ValidationError("unknown priority '" + prio + "'");
        d.priority = *p;
        d.max_attempts = j.value("max_attempts", 3);
    } catch (const json::exception& e) {
        throw ValidationError(std::string("bad job descriptor: ") + e.what());
    }
    return d;
}

Pipeline::Pipeline(const PipelineConfig& cfg, JobStore& store, BackendRegistry& registry, Fetcher& fetcher,
                   EventSink& sink, Clock clock)
    : cfg_(cfg),
      store_(store),
      registry_(registry),
      clock_(std::move(clock)),
      lifecycle_(store, sink, active_, RetryPolicy{cfg.retry_base_backoff_ms, cfg.retry_max_backoff_ms}, clock_),
      fetch_(lifecycle_, fetcher, fetch_options(cfg)),
      transfer_(lifecycle_, registry, transfer_options(cfg), cfg.verify_checksums) {}

Pipeline::~Pipeline() {
    stop();
}

void Pipeline::start() {
    fetch_.start();
    transfer_.start();
}

void Pipeline::stop() {
    fetch_.stop();
    transfer_.stop();
}

std::size_t Pipeline::recover() {
    std::size_t n = store_.reset_claims(clock_());
    if (n) log_warn("pipeline", "released " + std::to_string(n) + " stale claims");
    return n;
}

std::string Pipeline::create_job(const JobDescriptor& d) {
    auto require = [](const std::string& v, const char* what) {
        if (v.empty()) throw ValidationError(std::string(what) + " is required");
    };
    require(d.title, "title");
    require(d.content_type, "content_type");
    require(d.quality, "quality");
    require(d.source_url, "source_url");
    require(d.backend_id, "backend_id");
    require(d.destination_path, "destination_path");
    check_destination_path(d.destination_path);
    if (d.max_attempts < 1) throw ValidationError("max_attempts must be at least 1");
    if (!registry_.contains(d.backend_id)) throw ValidationError("unknown backend " + d.backend_id);

    JobRecord rec = make_record(gen_id(), d, clock_());
    store_.insert(rec);
    lifecycle_.emit(rec.id, "state", json{{"from", nullptr}, {"to", to_string(rec.state)}, {"event", "create"}});
    log_info("pipeline", "job " + rec.id + " created: " + formatted_title(rec) + " -> " + d.backend_id);
    fetch_.wake();
    return rec.id;
}

JobState Pipeline::control_job(const std::string& id, ControlAction action) {
    JobEvent ev{};
    switch (action) {
        case ControlAction::Pause: ev.kind = EventKind::Pause; break;
        case ControlAction::Resume: ev.kind = EventKind::Resume; break;
        case ControlAction::Cancel: ev.kind = EventKind::Cancel; break;
        case ControlAction::Retry: ev.kind = EventKind::Retry; break;
    }
    return lifecycle_.apply(id, ev).state;
}

std::optional<JobRecord> Pipeline::get_job(const std::string& id) {
    return store_.get(id);
}

JobStatus Pipeline::get_job_status(const std::string& id) {
    auto job = store_.get(id);
    if (!job) throw NotFound("job " + id + " not found");
    JobStatus s;
    s.state = job->state;
    s.progress_percent = job->progress_percent;
    s.rate = job->transfer_rate;
    s.error = job->last_error;
    s.error_detail = job->last_error_detail;
    if (is_active(job->state) && job->transfer_rate > 0) {
        double done = 0.0, total = 0.0;
        if (job->state == JobState::Fetching) {
            // The size is known only once fetched; extrapolate from progress.
            done = (double)job->fetched_size;
            if (job->progress_percent > 0) total = done * 100.0 / job->progress_percent;
        } else {
            done = (double)job->transferred_size;
            total = (double)job->local_size;
        }
        if (total > 0) s.eta = std::max(0.0, total - done) / job->transfer_rate;
    }
    return s;
}

EligibleCounts Pipeline::list_eligible_counts() {
    auto counts = store_.count_by_state();
    auto get = [&](JobState s) {
        auto it = counts.find(s);
        return it == counts.end() ? std::size_t{0} : it->second;
    };
    EligibleCounts c;
    c.pending = get(JobState::Pending);
    c.fetching = get(JobState::Fetching);
    c.fetched = get(JobState::Fetched);
    c.transferring = get(JobState::Transferring);
    return c;
}
