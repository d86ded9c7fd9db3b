#pragma once
#include "util.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// Per-claim control block shared between a worker and the controller. The
// worker calls check() at every progress callback and I/O boundary.
class StageContext {
public:
    StageContext(std::string job_id, std::int64_t deadline_ms, Clock clock);

    const std::string& job_id() const { return job_id_; }

    void request_abort(const std::string& reason);
    bool abort_requested() const { return abort_.load(); }

    // Throws JobAborted after request_abort(), TransientFailure once the stage
    // deadline has passed.
    void check() const;

    std::int64_t now() const { return clock_(); }
    std::int64_t remaining_ms() const;

private:
    std::string job_id_;
    std::int64_t deadline_ms_;
    Clock clock_;
    std::atomic<bool> abort_{false};
    mutable std::mutex mtx_;
    std::string reason_;
};

// Decides when a progress sample is worth an event and a store write: the
// first sample, every crossing of a 10 % step, completion, and otherwise at
// most once per interval.
class ProgressThrottle {
public:
    explicit ProgressThrottle(std::int64_t interval_ms = 5000) : interval_ms_(interval_ms) {}

    bool should_emit(double percent, std::int64_t now_ms);

private:
    std::int64_t interval_ms_;
    bool started_{false};
    std::int64_t last_emit_ms_{0};
    int last_decile_{0};
    bool emitted_complete_{false};
};

// Keeps progress inside [0,100] and never below what was already reported
// in the current attempt.
double clamp_progress(double previous, double reported);

// Contexts of the jobs currently held by a worker, by job id.
class ActiveJobs {
public:
    void add(const std::shared_ptr<StageContext>& ctx);
    // Drops `ctx` unless a newer claim on the same job has replaced it.
    void remove(const std::shared_ptr<StageContext>& ctx);
    bool signal_abort(const std::string& job_id, const std::string& reason);
    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<StageContext>> contexts_;
};
