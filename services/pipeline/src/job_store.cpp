#include "../include/job_store.hpp"
#include "../include/errors.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace {

const char* const kColumns[] = {
    "id", "title", "content_type", "quality", "source_url", "season", "episode", "year",
    "backend_id", "destination_path", "state", "priority", "attempt_count", "max_attempts",
    "local_path", "local_size", "fetched_size", "transferred_size", "progress_percent",
    "transfer_rate", "checksum", "created_at", "fetch_started_at", "fetch_completed_at",
    "transfer_started_at", "completed_at", "updated_at", "last_error", "last_error_detail",
    "claimed_by", "eligible_at", "resume_progress", "version"};
constexpr int kColumnCount = sizeof(kColumns) / sizeof(kColumns[0]);

std::string column_list() {
    std::string out;
    for (int i = 0; i < kColumnCount; ++i) {
        if (i) out += ", ";
        out += kColumns[i];
    }
    return out;
}

void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

void bind_opt_int(sqlite3_stmt* st, int idx, const std::optional<int>& v) {
    if (v) sqlite3_bind_int(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

void bind_opt_int64(sqlite3_stmt* st, int idx, const std::optional<std::int64_t>& v) {
    if (v) sqlite3_bind_int64(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* p = sqlite3_column_text(st, col);
    return p ? reinterpret_cast<const char*>(p) : std::string();
}

std::optional<int> column_opt_int(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int(st, col);
}

std::optional<std::int64_t> column_opt_int64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(st, col);
}

// Binds the record to parameters 1..kColumnCount in column order.
void bind_record(sqlite3_stmt* st, const JobRecord& j) {
    int i = 1;
    bind_text(st, i++, j.id);
    bind_text(st, i++, j.title);
    bind_text(st, i++, j.content_type);
    bind_text(st, i++, j.quality);
    bind_text(st, i++, j.source_url);
    bind_opt_int(st, i++, j.season);
    bind_opt_int(st, i++, j.episode);
    bind_opt_int(st, i++, j.year);
    bind_text(st, i++, j.backend_id);
    bind_text(st, i++, j.destination_path);
    bind_text(st, i++, to_string(j.state));
    sqlite3_bind_int(st, i++, static_cast<int>(j.priority));
    sqlite3_bind_int(st, i++, j.attempt_count);
    sqlite3_bind_int(st, i++, j.max_attempts);
    bind_text(st, i++, j.local_path);
    sqlite3_bind_int64(st, i++, j.local_size);
    sqlite3_bind_int64(st, i++, j.fetched_size);
    sqlite3_bind_int64(st, i++, j.transferred_size);
    sqlite3_bind_double(st, i++, j.progress_percent);
    sqlite3_bind_double(st, i++, j.transfer_rate);
    bind_text(st, i++, j.checksum);
    sqlite3_bind_int64(st, i++, j.created_at);
    bind_opt_int64(st, i++, j.fetch_started_at);
    bind_opt_int64(st, i++, j.fetch_completed_at);
    bind_opt_int64(st, i++, j.transfer_started_at);
    bind_opt_int64(st, i++, j.completed_at);
    sqlite3_bind_int64(st, i++, j.updated_at);
    bind_text(st, i++, j.last_error);
    bind_text(st, i++, j.last_error_detail);
    bind_text(st, i++, j.claimed_by);
    sqlite3_bind_int64(st, i++, j.eligible_at);
    sqlite3_bind_double(st, i++, j.resume_progress);
    sqlite3_bind_int64(st, i++, j.version);
}

JobRecord read_record(sqlite3_stmt* st) {
    JobRecord j;
    int c = 0;
    j.id = column_text(st, c++);
    j.title = column_text(st, c++);
    j.content_type = column_text(st, c++);
    j.quality = column_text(st, c++);
    j.source_url = column_text(st, c++);
    j.season = column_opt_int(st, c++);
    j.episode = column_opt_int(st, c++);
    j.year = column_opt_int(st, c++);
    j.backend_id = column_text(st, c++);
    j.destination_path = column_text(st, c++);
    std::string state = column_text(st, c++);
    auto parsed = job_state_from_string(state);
    if (!parsed) throw std::runtime_error("job " + j.id + " has unknown state '" + state + "'");
    j.state = *parsed;
    int prio = sqlite3_column_int(st, c++);
    j.priority = prio >= 3 ? Priority::High : prio <= 1 ? Priority::Low : Priority::Medium;
    j.attempt_count = sqlite3_column_int(st, c++);
    j.max_attempts = sqlite3_column_int(st, c++);
    j.local_path = column_text(st, c++);
    j.local_size = sqlite3_column_int64(st, c++);
    j.fetched_size = sqlite3_column_int64(st, c++);
    j.transferred_size = sqlite3_column_int64(st, c++);
    j.progress_percent = sqlite3_column_double(st, c++);
    j.transfer_rate = sqlite3_column_double(st, c++);
    j.checksum = column_text(st, c++);
    j.created_at = sqlite3_column_int64(st, c++);
    j.fetch_started_at = column_opt_int64(st, c++);
    j.fetch_completed_at = column_opt_int64(st, c++);
    j.transfer_started_at = column_opt_int64(st, c++);
    j.completed_at = column_opt_int64(st, c++);
    j.updated_at = sqlite3_column_int64(st, c++);
    j.last_error = column_text(st, c++);
    j.last_error_detail = column_text(st, c++);
    j.claimed_by = column_text(st, c++);
    j.eligible_at = sqlite3_column_int64(st, c++);
    j.resume_progress = sqlite3_column_double(st, c++);
    j.version = sqlite3_column_int64(st, c++);
    return j;
}

// Resets the statement when leaving scope, whatever happened while stepping.
struct StmtReset {
    sqlite3_stmt* st;
    ~StmtReset() {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }
};

}

JobStore::JobStore(const std::string& db_path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB " + db_path + ": " + msg);
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

JobStore::~JobStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void JobStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA busy_timeout=5000;");
    exec("CREATE TABLE IF NOT EXISTS jobs (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  title TEXT NOT NULL,\n"
         "  content_type TEXT NOT NULL,\n"
         "  quality TEXT NOT NULL,\n"
         "  source_url TEXT NOT NULL,\n"
         "  season INTEGER,\n"
         "  episode INTEGER,\n"
         "  year INTEGER,\n"
         "  backend_id TEXT NOT NULL,\n"
         "  destination_path TEXT NOT NULL,\n"
         "  state TEXT NOT NULL,\n"
         "  priority INTEGER NOT NULL,\n"
         "  attempt_count INTEGER NOT NULL,\n"
         "  max_attempts INTEGER NOT NULL,\n"
         "  local_path TEXT,\n"
         "  local_size INTEGER,\n"
         "  fetched_size INTEGER,\n"
         "  transferred_size INTEGER,\n"
         "  progress_percent REAL,\n"
         "  transfer_rate REAL,\n"
         "  checksum TEXT,\n"
         "  created_at INTEGER NOT NULL,\n"
         "  fetch_started_at INTEGER,\n"
         "  fetch_completed_at INTEGER,\n"
         "  transfer_started_at INTEGER,\n"
         "  completed_at INTEGER,\n"
         "  updated_at INTEGER,\n"
         "  last_error TEXT,\n"
         "  last_error_detail TEXT,\n"
         "  claimed_by TEXT NOT NULL DEFAULT '',\n"
         "  eligible_at INTEGER NOT NULL DEFAULT 0,\n"
         "  resume_progress REAL,\n"
         "  version INTEGER NOT NULL DEFAULT 0\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_jobs_state ON jobs(state, claimed_by, eligible_at);");
}

void JobStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void JobStore::prepare_statements() {
    auto prepare = [&](const std::string& sql, sqlite3_stmt** out) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, out, nullptr) != SQLITE_OK) {
            throw std::runtime_error("prepare failed: " + std::string(sqlite3_errmsg(db_)) + " in " + sql);
        }
    };
    std::string cols = column_list();
    std::string placeholders;
    std::string assignments;
    for (int i = 0; i < kColumnCount; ++i) {
        placeholders += (i ? ", ?" : "?") + std::to_string(i + 1);
        if (i > 0) {
            if (i > 1) assignments += ", ";
            assignments += std::string(kColumns[i]) + " = ?" + std::to_string(i + 1);
        }
    }
    prepare("INSERT INTO jobs (" + cols + ") VALUES (" + placeholders + ");", &insert_stmt_);
    prepare("UPDATE jobs SET " + assignments + " WHERE id = ?1 AND version = ?" +
                std::to_string(kColumnCount + 1) + ";",
            &update_stmt_);
    prepare("SELECT " + cols + " FROM jobs WHERE id = ?1;", &by_id_stmt_);
    prepare("SELECT " + cols + " FROM jobs WHERE state IN (?1, ?2) AND claimed_by = '' AND eligible_at <= ?3"
            " ORDER BY rowid;", &claimable_stmt_);
    prepare("SELECT " + cols + " FROM jobs ORDER BY created_at, rowid;", &all_stmt_);
    prepare("SELECT " + cols + " FROM jobs WHERE state = ?1 ORDER BY created_at, rowid;", &by_state_stmt_);
    prepare("SELECT state, COUNT(*) FROM jobs GROUP BY state;", &counts_stmt_);
    prepare("UPDATE jobs SET claimed_by = '', updated_at = ?3, version = version + 1"
            " WHERE id = ?1 AND claimed_by = ?2;", &release_stmt_);
    prepare("UPDATE jobs SET claimed_by = '', updated_at = ?1, version = version + 1"
            " WHERE claimed_by <> '';", &reset_stmt_);
}

void JobStore::close_statements() {
    for (sqlite3_stmt** st : {&insert_stmt_, &update_stmt_, &by_id_stmt_, &claimable_stmt_, &all_stmt_,
                              &by_state_stmt_, &counts_stmt_, &release_stmt_, &reset_stmt_}) {
        if (*st) {
            sqlite3_finalize(*st);
            *st = nullptr;
        }
    }
}

void JobStore::insert(const JobRecord& job) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{insert_stmt_};
    bind_record(insert_stmt_, job);
    int rc = sqlite3_step(insert_stmt_);
    if (rc == SQLITE_CONSTRAINT) throw ValidationError("job " + job.id + " already exists");
    if (rc != SQLITE_DONE) throw std::runtime_error("insert job failed: " + std::string(sqlite3_errmsg(db_)));
}

std::optional<JobRecord> JobStore::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    return get_locked(id);
}

std::optional<JobRecord> JobStore::get_locked(const std::string& id) {
    StmtReset guard{by_id_stmt_};
    bind_text(by_id_stmt_, 1, id);
    int rc = sqlite3_step(by_id_stmt_);
    if (rc == SQLITE_ROW) return read_record(by_id_stmt_);
    if (rc != SQLITE_DONE) throw std::runtime_error("select job failed: " + std::string(sqlite3_errmsg(db_)));
    return std::nullopt;
}

void JobStore::write_locked(const JobRecord& job, std::int64_t expected_version) {
    StmtReset guard{update_stmt_};
    bind_record(update_stmt_, job);
    sqlite3_bind_int64(update_stmt_, kColumnCount + 1, expected_version);
    if (sqlite3_step(update_stmt_) != SQLITE_DONE) {
        throw std::runtime_error("update job failed: " + std::string(sqlite3_errmsg(db_)));
    }
    if (sqlite3_changes(db_) != 1) {
        throw InvalidTransition("job " + job.id + " was modified concurrently");
    }
}

JobRecord JobStore::mutate(const std::string& id, const std::function<void(JobRecord&)>& fn) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto current = get_locked(id);
    if (!current) throw NotFound("job " + id + " not found");
    JobRecord next = *current;
    fn(next);
    next.id = current->id;
    next.version = current->version + 1;
    write_locked(next, current->version);
    return next;
}

std::vector<JobRecord> JobStore::list_claimable(const std::vector<JobState>& states, std::int64_t now) {
    if (states.empty()) return {};
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{claimable_stmt_};
    bind_text(claimable_stmt_, 1, to_string(states[0]));
    bind_text(claimable_stmt_, 2, to_string(states.size() > 1 ? states[1] : states[0]));
    sqlite3_bind_int64(claimable_stmt_, 3, now);
    std::vector<JobRecord> out;
    int rc;
    while ((rc = sqlite3_step(claimable_stmt_)) == SQLITE_ROW) out.push_back(read_record(claimable_stmt_));
    if (rc != SQLITE_DONE) throw std::runtime_error("select claimable failed: " + std::string(sqlite3_errmsg(db_)));
    return out;
}

std::vector<JobRecord> JobStore::list(std::optional<JobState> state) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_stmt* st = state ? by_state_stmt_ : all_stmt_;
    StmtReset guard{st};
    if (state) bind_text(st, 1, to_string(*state));
    std::vector<JobRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) out.push_back(read_record(st));
    if (rc != SQLITE_DONE) throw std::runtime_error("select jobs failed: " + std::string(sqlite3_errmsg(db_)));
    return out;
}

std::map<JobState, std::size_t> JobStore::count_by_state() {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{counts_stmt_};
    std::map<JobState, std::size_t> out;
    int rc;
    while ((rc = sqlite3_step(counts_stmt_)) == SQLITE_ROW) {
        auto state = job_state_from_string(column_text(counts_stmt_, 0));
        if (state) out[*state] = static_cast<std::size_t>(sqlite3_column_int64(counts_stmt_, 1));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error("count jobs failed: " + std::string(sqlite3_errmsg(db_)));
    return out;
}

bool JobStore::release_claim(const std::string& id, const std::string& claim, std::int64_t now) {
    if (claim.empty()) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{release_stmt_};
    bind_text(release_stmt_, 1, id);
    bind_text(release_stmt_, 2, claim);
    sqlite3_bind_int64(release_stmt_, 3, now);
    if (sqlite3_step(release_stmt_) != SQLITE_DONE) {
        throw std::runtime_error("release claim failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return sqlite3_changes(db_) == 1;
}

std::size_t JobStore::reset_claims(std::int64_t now) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{reset_stmt_};
    sqlite3_bind_int64(reset_stmt_, 1, now);
    if (sqlite3_step(reset_stmt_) != SQLITE_DONE) {
        throw std::runtime_error("reset claims failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return static_cast<std::size_t>(sqlite3_changes(db_));
}
