#pragma once
#include "backend_registry.hpp"
#include "fetcher.hpp"
#include "lifecycle.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct SchedulerOptions {
    std::size_t max_concurrent{2};
    std::int64_t poll_interval_ms{1000};
    std::int64_t stage_timeout_ms{0};      // 0: no wall-clock ceiling
    std::int64_t aging_threshold_ms{0};    // 0: strict priority
    std::int64_t progress_interval_ms{5000};
};

// Priority used for dispatch: one tier up (capped at high) once the job has
// waited longer than the aging threshold.
int effective_priority(const JobRecord& job, std::int64_t now, std::int64_t aging_threshold_ms);

// Sorts by (effective priority desc, created_at asc).
std::vector<JobRecord> order_for_dispatch(std::vector<JobRecord> jobs, std::int64_t now,
                                          std::int64_t aging_threshold_ms);

// Dispatch loop plus a fixed pool of workers. The loop claims eligible jobs
// while fewer than max_concurrent are in flight and queues them for the
// workers; each worker runs one claimed job to its outcome.
class StageScheduler {
public:
    StageScheduler(std::string name, Lifecycle& lifecycle, SchedulerOptions opts);
    virtual ~StageScheduler();
    StageScheduler(const StageScheduler&) = delete;
    StageScheduler& operator=(const StageScheduler&) = delete;

    void start();
    // Aborts running stages (their jobs stay claimable) and joins all threads.
    void stop();
    void wake();

    // Claims one job and runs it on the calling thread. For tests and
    // single-threaded drivers; do not mix with start().
    bool run_next();

    std::size_t in_flight() const;
    const std::string& name() const { return name_; }

protected:
    struct Claimed {
        JobRecord job;
        std::string claim;
    };

    virtual std::vector<JobState> claim_states() const = 0;
    virtual EventKind claim_event() const = 0;
    virtual void execute(const JobRecord& job, const std::string& claim, StageContext& ctx) = 0;
    // Admission beyond the global cap. A reservation taken here is returned
    // through release_reservation once the job is done or was not claimed.
    virtual bool try_reserve(const JobRecord&) { return true; }
    virtual void release_reservation(const JobRecord&) {}

    // Writes throttled progress onto the record (if `claim` still holds it)
    // and emits the matching progress event.
    void report_progress(const JobRecord& job, const std::string& claim, const std::string& kind, double percent,
                         std::int64_t done, std::int64_t total, double rate);

    Lifecycle& lifecycle_;
    SchedulerOptions opts_;

private:
    std::optional<Claimed> claim_next();
    void run_claimed(const Claimed& c);
    void run_stage(const Claimed& c, StageContext& ctx);
    void fail(const Claimed& c, FailureKind kind, const std::string& error, const std::string& detail);
    void abandon(const Claimed& c, const std::string& reason);
    void dispatch_loop();
    void worker_loop();
    std::string next_claim_token();

    std::string name_;
    std::string instance_;
    std::size_t waker_{0};
    std::atomic<std::uint64_t> seq_{0};

    mutable std::mutex mtx_;
    std::condition_variable dispatch_cv_;
    std::condition_variable work_cv_;
    std::deque<Claimed> ready_;
    std::unordered_map<std::string, std::shared_ptr<StageContext>> running_;
    std::size_t in_flight_{0};
    bool started_{false};
    bool stop_{false};
    bool woken_{false};
    std::thread dispatcher_;
    std::vector<std::thread> workers_;
};

class FetchScheduler : public StageScheduler {
public:
    FetchScheduler(Lifecycle& lifecycle, Fetcher& fetcher, SchedulerOptions opts);
    ~FetchScheduler() override;

protected:
    std::vector<JobState> claim_states() const override { return {JobState::Pending, JobState::Fetching}; }
    EventKind claim_event() const override { return EventKind::ClaimFetch; }
    void execute(const JobRecord& job, const std::string& claim, StageContext& ctx) override;

private:
    Fetcher& fetcher_;
};

// Per-backend in-flight counters, changed only by atomic compare-and-swap.
class BackendSlots {
public:
    bool try_acquire(const std::string& backend_id, int cap);
    void release(const std::string& backend_id);
    int in_use(const std::string& backend_id) const;

private:
    std::atomic<int>& counter(const std::string& backend_id) const;

    mutable std::mutex mtx_;
    mutable std::map<std::string, std::unique_ptr<std::atomic<int>>> counters_;
};

class TransferScheduler : public StageScheduler {
public:
    TransferScheduler(Lifecycle& lifecycle, BackendRegistry& registry, SchedulerOptions opts,
                      bool verify_checksums = true);
    ~TransferScheduler() override;

    const BackendSlots& slots() const { return slots_; }

protected:
    std::vector<JobState> claim_states() const override { return {JobState::Fetched, JobState::Transferring}; }
    EventKind claim_event() const override { return EventKind::ClaimTransfer; }
    void execute(const JobRecord& job, const std::string& claim, StageContext& ctx) override;
    bool try_reserve(const JobRecord& job) override;
    void release_reservation(const JobRecord& job) override;

private:
    BackendRegistry& registry_;
    bool verify_checksums_;
    BackendSlots slots_;
    std::mutex held_mtx_;
    std::unordered_map<std::string, std::string> held_;  // job id -> backend id
};
