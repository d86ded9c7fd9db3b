#pragma once
#include "job.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// SQLite-backed Job Record store, the single source of truth. All writes go
// through one connection under one mutex and are compare-and-set on the row
// version, so a mutation sees a consistent record and no two writers can
// interleave on the same job.
class JobStore {
public:
    explicit JobStore(const std::string& db_path);
    ~JobStore();
    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    void insert(const JobRecord& job);
    std::optional<JobRecord> get(const std::string& id);

    // Loads the record, lets `fn` change it and writes it back atomically.
    // Whatever `fn` throws propagates and nothing is written.
    JobRecord mutate(const std::string& id, const std::function<void(JobRecord&)>& fn);

    // Unclaimed jobs in any of `states` whose backoff has elapsed, in
    // insertion order. Ordering for dispatch is done by the caller.
    std::vector<JobRecord> list_claimable(const std::vector<JobState>& states, std::int64_t now);

    std::vector<JobRecord> list(std::optional<JobState> state = std::nullopt);
    std::map<JobState, std::size_t> count_by_state();

    // Drops the claim if `claim` still holds it. Returns whether it did.
    bool release_claim(const std::string& id, const std::string& claim, std::int64_t now);

    // Frees every claim; used at startup after an unclean shutdown.
    std::size_t reset_claims(std::int64_t now);

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    std::optional<JobRecord> get_locked(const std::string& id);
    void write_locked(const JobRecord& job, std::int64_t expected_version);

    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* update_stmt_ {nullptr};
    struct sqlite3_stmt* by_id_stmt_ {nullptr};
    struct sqlite3_stmt* claimable_stmt_ {nullptr};
    struct sqlite3_stmt* all_stmt_ {nullptr};
    struct sqlite3_stmt* by_state_stmt_ {nullptr};
    struct sqlite3_stmt* counts_stmt_ {nullptr};
    struct sqlite3_stmt* release_stmt_ {nullptr};
    struct sqlite3_stmt* reset_stmt_ {nullptr};
};
