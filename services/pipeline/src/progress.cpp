#include "../include/progress.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <cmath>

StageContext::StageContext(std::string job_id, std::int64_t deadline_ms, Clock clock)
    : job_id_(std::move(job_id)), deadline_ms_(deadline_ms), clock_(std::move(clock)) {}

void StageContext::request_abort(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (reason_.empty()) reason_ = reason;
    }
    abort_.store(true);
}

void StageContext::check() const {
    if (abort_.load()) {
        std::lock_guard<std::mutex> lock(mtx_);
        throw JobAborted("job " + job_id_ + " aborted: " + reason_);
    }
    if (deadline_ms_ > 0 && clock_() > deadline_ms_) {
        throw TransientFailure("stage timed out for job " + job_id_, R"({"reason":"stage_timeout"})");
    }
}

std::int64_t StageContext::remaining_ms() const {
    if (deadline_ms_ <= 0) return 0;
    return std::max<std::int64_t>(1, deadline_ms_ - clock_());
}

bool ProgressThrottle::should_emit(double percent, std::int64_t now_ms) {
    int decile = static_cast<int>(std::floor(percent / 10.0));
    bool emit = false;
    if (!started_) {
        emit = true;
    } else if (percent >= 100.0 && !emitted_complete_) {
        emit = true;
    } else if (decile > last_decile_) {
        emit = true;
    } else if (now_ms - last_emit_ms_ >= interval_ms_) {
        emit = true;
    }
    if (emit) {
        started_ = true;
        last_emit_ms_ = now_ms;
        last_decile_ = std::max(last_decile_, decile);
        if (percent >= 100.0) emitted_complete_ = true;
    }
    return emit;
}

double clamp_progress(double previous, double reported) {
    if (std::isnan(reported)) reported = 0.0;
    double p = std::min(100.0, std::max(0.0, reported));
    return std::max(previous, p);
}

void ActiveJobs::add(const std::shared_ptr<StageContext>& ctx) {
    std::lock_guard<std::mutex> lock(mtx_);
    contexts_[ctx->job_id()] = ctx;
}

void ActiveJobs::remove(const std::shared_ptr<StageContext>& ctx) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = contexts_.find(ctx->job_id());
    if (it != contexts_.end() && it->second == ctx) contexts_.erase(it);
}

bool ActiveJobs::signal_abort(const std::string& job_id, const std::string& reason) {
    std::shared_ptr<StageContext> ctx;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = contexts_.find(job_id);
        if (it == contexts_.end()) return false;
        ctx = it->second;
    }
    ctx->request_abort(reason);
    return true;
}

std::size_t ActiveJobs::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return contexts_.size();
}
