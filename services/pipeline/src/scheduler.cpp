#include "../include/scheduler.hpp"
#include "../include/checksum.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>

using json = nlohmann::json;

namespace {

json progress_payload(double percent, std::int64_t done, std::int64_t total, double rate) {
    json p{{"progress_percent", percent}, {"bytes", done}, {"total", total}, {"rate", rate}};
    if (rate > 0 && total > done) p["eta"] = (double)(total - done) / rate;
    return p;
}

}

int effective_priority(const JobRecord& job, std::int64_t now, std::int64_t aging_threshold_ms) {
    int p = static_cast<int>(job.priority);
    if (aging_threshold_ms > 0 && now - job.created_at > aging_threshold_ms) {
        p = std::min(p + 1, static_cast<int>(Priority::High));
    }
    return p;
}

std::vector<JobRecord> order_for_dispatch(std::vector<JobRecord> jobs, std::int64_t now,
                                          std::int64_t aging_threshold_ms) {
    std::stable_sort(jobs.begin(), jobs.end(), [&](const JobRecord& a, const JobRecord& b) {
        int pa = effective_priority(a, now, aging_threshold_ms);
        int pb = effective_priority(b, now, aging_threshold_ms);
        if (pa != pb) return pa > pb;
        return a.created_at < b.created_at;
    });
    return jobs;
}

StageScheduler::StageScheduler(std::string name, Lifecycle& lifecycle, SchedulerOptions opts)
    : lifecycle_(lifecycle), opts_(opts), name_(std::move(name)), instance_(gen_id().substr(0, 8)) {
    if (opts_.max_concurrent == 0) opts_.max_concurrent = 1;
    waker_ = lifecycle_.add_waker([this] { wake(); });
}

StageScheduler::~StageScheduler() {
    stop();
    lifecycle_.remove_waker(waker_);
}

void StageScheduler::start() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (started_) return;
    started_ = true;
    stop_ = false;
    for (std::size_t i = 0; i < opts_.max_concurrent; ++i) workers_.emplace_back([this] { worker_loop(); });
    dispatcher_ = std::thread([this] { dispatch_loop(); });
    log_info(name_, "started with " + std::to_string(opts_.max_concurrent) + " workers");
}

void StageScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!started_) return;
        stop_ = true;
        for (auto& kv : running_) kv.second->request_abort("shutdown");
    }
    dispatch_cv_.notify_all();
    work_cv_.notify_all();
    if (dispatcher_.joinable()) dispatcher_.join();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    // Claimed but never started.
    std::deque<Claimed> leftover;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        leftover.swap(ready_);
        in_flight_ -= std::min(in_flight_, leftover.size());
        started_ = false;
    }
    for (const auto& c : leftover) {
        try {
            lifecycle_.store().release_claim(c.job.id, c.claim, lifecycle_.now());
        } catch (const std::exception& e) {
            log_error(name_, "releasing " + c.job.id + " failed: " + e.what());
        }
        release_reservation(c.job);
    }
    log_info(name_, "stopped");
}

void StageScheduler::wake() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        woken_ = true;
    }
    dispatch_cv_.notify_one();
}

std::size_t StageScheduler::in_flight() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return in_flight_;
}

bool StageScheduler::run_next() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (in_flight_ >= opts_.max_concurrent) return false;
    }
    auto c = claim_next();
    if (!c) return false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ++in_flight_;
    }
    run_claimed(*c);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        --in_flight_;
    }
    return true;
}

std::string StageScheduler::next_claim_token() {
    return name_ + "-" + instance_ + "#" + std::to_string(++seq_);
}

std::optional<StageScheduler::Claimed> StageScheduler::claim_next() {
    std::int64_t now = lifecycle_.now();
    auto candidates = order_for_dispatch(lifecycle_.store().list_claimable(claim_states(), now), now,
                                         opts_.aging_threshold_ms);
    for (const auto& job : candidates) {
        if (!try_reserve(job)) continue;
        JobEvent ev{};
        ev.kind = claim_event();
        ev.now = now;
        ev.claim = next_claim_token();
        try {
            JobRecord claimed = lifecycle_.apply(job.id, ev);
            log_debug(name_, "claimed " + job.id + " as " + ev.claim);
            return Claimed{claimed, ev.claim};
        } catch (const InvalidTransition& e) {
            release_reservation(job);
            log_debug(name_, "skip " + job.id + ": " + e.what());
        } catch (const NotFound&) {
            release_reservation(job);
        } catch (const std::exception& e) {
            release_reservation(job);
            log_error(name_, "claiming " + job.id + " failed: " + e.what());
            throw;
        }
    }
    return std::nullopt;
}

void StageScheduler::dispatch_loop() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stop_) {
        if (in_flight_ >= opts_.max_concurrent) {
            dispatch_cv_.wait(lock, [&] { return stop_ || in_flight_ < opts_.max_concurrent; });
            continue;
        }
        lock.unlock();
        std::optional<Claimed> c;
        try {
            c = claim_next();
        } catch (const InvariantViolation& e) {
            log_error(name_, e.what());
            std::abort();
        } catch (const std::exception& e) {
            log_error(name_, std::string("dispatch failed: ") + e.what());
        }
        lock.lock();
        if (c) {
            ++in_flight_;
            ready_.push_back(std::move(*c));
            work_cv_.notify_one();
            continue;
        }
        dispatch_cv_.wait_for(lock, std::chrono::milliseconds(opts_.poll_interval_ms),
                              [&] { return stop_ || woken_; });
        woken_ = false;
    }
}

void StageScheduler::worker_loop() {
    while (true) {
        Claimed c;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            work_cv_.wait(lock, [&] { return stop_ || !ready_.empty(); });
            if (stop_) return;
            c = std::move(ready_.front());
            ready_.pop_front();
        }
        run_claimed(c);
        {
            std::lock_guard<std::mutex> lock(mtx_);
            --in_flight_;
        }
        dispatch_cv_.notify_one();
    }
}

void StageScheduler::run_claimed(const Claimed& c) {
    std::int64_t now = lifecycle_.now();
    auto ctx = std::make_shared<StageContext>(c.job.id, opts_.stage_timeout_ms > 0 ? now + opts_.stage_timeout_ms : 0,
                                              lifecycle_.clock());
    lifecycle_.active().add(ctx);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        running_[c.claim] = ctx;
        if (stop_) ctx->request_abort("shutdown");
    }
    try {
        run_stage(c, *ctx);
    } catch (const InvariantViolation& e) {
        log_error(name_, e.what());
        std::abort();
    }
    lifecycle_.active().remove(ctx);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        running_.erase(c.claim);
    }
    release_reservation(c.job);
}

void StageScheduler::run_stage(const Claimed& c, StageContext& ctx) {
    try {
        // A pause or cancel may have landed between the claim and the
        // registration of the context.
        auto current = lifecycle_.store().get(c.job.id);
        if (!current || current->claimed_by != c.claim || !is_active(current->state)) {
            throw JobAborted("job " + c.job.id + " left " + to_string(c.job.state) + " before start");
        }
        execute(*current, c.claim, ctx);
    } catch (const JobAborted& e) {
        abandon(c, e.what());
    } catch (const InvalidTransition& e) {
        // The controller moved the job while the stage ran.
        abandon(c, e.what());
    } catch (const StageFailure& e) {
        fail(c, e.kind(), e.what(), e.detail());
    } catch (const InvariantViolation&) {
        throw;
    } catch (const std::exception& e) {
        fail(c, FailureKind::Transient, e.what(), {});
    }
}

void StageScheduler::fail(const Claimed& c, FailureKind kind, const std::string& error, const std::string& detail) {
    JobEvent ev{};
    ev.kind = EventKind::StageFailed;
    ev.claim = c.claim;
    ev.failure = kind;
    ev.error = error;
    ev.error_detail = detail;
    try {
        JobRecord job = lifecycle_.apply(c.job.id, ev);
        log_warn(name_, "job " + job.id + " attempt " + std::to_string(job.attempt_count) + "/" +
                            std::to_string(job.max_attempts) + " " + to_string(kind) + " failure: " + error);
        if (is_final(job)) lifecycle_.discard_local(job);
    } catch (const InvalidTransition& e) {
        abandon(c, e.what());
    } catch (const NotFound& e) {
        log_warn(name_, e.what());
    } catch (const InvariantViolation&) {
        throw;
    } catch (const std::exception& e) {
        log_error(name_, "recording failure of " + c.job.id + " failed: " + e.what());
    }
}

void StageScheduler::abandon(const Claimed& c, const std::string& reason) {
    try {
        lifecycle_.store().release_claim(c.job.id, c.claim, lifecycle_.now());
        auto current = lifecycle_.store().get(c.job.id);
        log_info(name_, "released " + c.job.id + ": " + reason);
        if (!current) return;
        if (current->state == JobState::Cancelled) lifecycle_.discard_local(*current);
        if (current->claimed_by.empty() && is_active(current->state)) wake();
    } catch (const std::exception& e) {
        log_error(name_, "releasing " + c.job.id + " failed: " + e.what());
    }
}

void StageScheduler::report_progress(const JobRecord& job, const std::string& claim, const std::string& kind,
                                     double percent, std::int64_t done, std::int64_t total, double rate) {
    bool fetch = kind == "fetch_progress";
    std::int64_t now = lifecycle_.now();
    try {
        lifecycle_.store().mutate(job.id, [&](JobRecord& r) {
            if (r.claimed_by != claim) return;
            r.progress_percent = clamp_progress(r.progress_percent, percent);
            if (fetch) r.fetched_size = done;
            else r.transferred_size = done;
            r.transfer_rate = rate;
            r.updated_at = now;
        });
    } catch (const NotFound&) {
        return;
    }
    lifecycle_.emit(job.id, kind, progress_payload(percent, done, total, rate));
}

FetchScheduler::FetchScheduler(Lifecycle& lifecycle, Fetcher& fetcher, SchedulerOptions opts)
    : StageScheduler("fetch", lifecycle, opts), fetcher_(fetcher) {}

FetchScheduler::~FetchScheduler() {
    stop();
}

void FetchScheduler::execute(const JobRecord& job, const std::string& claim, StageContext& ctx) {
    FetchRequest req{job.id, job.source_url, job.quality, formatted_title(job)};
    ProgressThrottle throttle(opts_.progress_interval_ms);
    double progress = job.progress_percent;
    std::int64_t started = ctx.now();

    log_info("fetch", "job " + job.id + " attempt " + std::to_string(job.attempt_count) + " from " + job.source_url);
    FetchResult res = fetcher_.fetch(req, ctx, [&](std::int64_t done, std::int64_t total) {
        ctx.check();
        double pct = total > 0 ? (double)done * 100.0 / (double)total : 0.0;
        progress = clamp_progress(progress, std::min(pct, kFetchProgressCeiling));
        std::int64_t now = ctx.now();
        if (!throttle.should_emit(progress, now)) return;
        double secs = (double)(now - started) / 1000.0;
        report_progress(job, claim, "fetch_progress", progress, done, total, secs > 0 ? (double)done / secs : 0.0);
    });

    try {
        std::string checksum = sha256_file(res.local_path, &ctx);
        JobEvent ev{};
        ev.kind = EventKind::FetchSucceeded;
        ev.claim = claim;
        ev.local_path = res.local_path.string();
        ev.local_size = res.size;
        ev.checksum = checksum;
        lifecycle_.apply(job.id, ev);
        log_debug("fetch", "job " + job.id + " sha256 " + checksum);
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(res.local_path, ec);
        throw;
    }
}

bool BackendSlots::try_acquire(const std::string& backend_id, int cap) {
    std::atomic<int>& c = counter(backend_id);
    int cur = c.load();
    while (cur < cap) {
        if (c.compare_exchange_weak(cur, cur + 1)) return true;
    }
    return false;
}

void BackendSlots::release(const std::string& backend_id) {
    std::atomic<int>& c = counter(backend_id);
    int cur = c.load();
    while (cur > 0 && !c.compare_exchange_weak(cur, cur - 1)) {
    }
}

int BackendSlots::in_use(const std::string& backend_id) const {
    return counter(backend_id).load();
}

std::atomic<int>& BackendSlots::counter(const std::string& backend_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& slot = counters_[backend_id];
    if (!slot) slot = std::make_unique<std::atomic<int>>(0);
    return *slot;
}

TransferScheduler::TransferScheduler(Lifecycle& lifecycle, BackendRegistry& registry, SchedulerOptions opts,
                                     bool verify_checksums)
    : StageScheduler("transfer", lifecycle, opts), registry_(registry), verify_checksums_(verify_checksums) {}

TransferScheduler::~TransferScheduler() {
    stop();
}

bool TransferScheduler::try_reserve(const JobRecord& job) {
    BackendDescriptor desc;
    try {
        desc = registry_.resolve(job.backend_id);
    } catch (const NotFound&) {
        return true;  // execute() fails the job
    }
    if (!desc.online) return false;
    int cap = std::min<int>(static_cast<int>(opts_.max_concurrent), desc.max_concurrent_transfers);
    if (!slots_.try_acquire(desc.id, cap)) return false;
    std::lock_guard<std::mutex> lock(held_mtx_);
    held_[job.id] = desc.id;
    return true;
}

void TransferScheduler::release_reservation(const JobRecord& job) {
    std::string backend_id;
    {
        std::lock_guard<std::mutex> lock(held_mtx_);
        auto it = held_.find(job.id);
        if (it == held_.end()) return;
        backend_id = it->second;
        held_.erase(it);
    }
    slots_.release(backend_id);
}

void TransferScheduler::execute(const JobRecord& job, const std::string& claim, StageContext& ctx) {
    BackendDescriptor desc;
    try {
        desc = registry_.resolve(job.backend_id);
    } catch (const NotFound& e) {
        throw FatalFailure(e.what(), json{{"backend_id", job.backend_id}}.dump());
    }
    TransferBackend& backend = registry_.backend(desc.id);

    std::error_code ec;
    std::filesystem::path local = job.local_path;
    if (local.empty() || !std::filesystem::exists(local, ec)) {
        throw FatalFailure("local copy missing: " + job.local_path);
    }
    std::string dest;
    try {
        dest = resolve_destination(desc, job);
    } catch (const ValidationError& e) {
        throw FatalFailure("destination path rejected: " + std::string(e.what()),
                           json{{"destination_path", job.destination_path}}.dump());
    }
    log_info("transfer", "job " + job.id + " attempt " + std::to_string(job.attempt_count) + " to " + desc.name +
                             " (" + to_string(desc.protocol) + ") " + dest);

    ProgressThrottle throttle(opts_.progress_interval_ms);
    double progress = job.progress_percent;
    try {
        PutResult res = backend.put(local, dest, ctx, [&](std::int64_t done, std::int64_t total, double rate) {
            ctx.check();
            progress = clamp_progress(progress, total > 0 ? (double)done * 100.0 / (double)total : 0.0);
            if (!throttle.should_emit(progress, ctx.now())) return;
            report_progress(job, claim, "transfer_progress", progress, done, total, rate);
        });
        if (!res.success) throw TransferError("backend reported an unsuccessful transfer", true);
        if (res.observed_rate) log_debug("transfer", "job " + job.id + " at " + format_rate(*res.observed_rate));

        if (verify_checksums_) {
            std::string remote = backend.remote_checksum(dest, ctx);
            verify_digest(job.checksum, remote);
        }
    } catch (...) {
        backend.remove(dest);
        throw;
    }

    JobEvent ev{};
    ev.kind = EventKind::TransferVerified;
    ev.claim = claim;
    JobRecord done;
    try {
        done = lifecycle_.apply(job.id, ev);
    } catch (const InvalidTransition&) {
        // Paused or cancelled after verification.
        backend.remove(dest);
        throw;
    }
    log_info("transfer", "job " + job.id + " completed" + (verify_checksums_ ? ", checksum verified" : ""));
    if (desc.cleanup_after_transfer) lifecycle_.discard_local(done);
}
