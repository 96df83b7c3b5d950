#include "seedkeeper/storage/state_store.hpp"
#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/utils.hpp"
#include <sqlite3.h>
#include <utility>

namespace seedkeeper::storage {

using core::utils::TimeUtils;

namespace {

struct Migration {
    int version;
    const char* sql;
};

// Applied in order; each one runs inside its own transaction together with
// the user_version bump.
const Migration MIGRATIONS[] = {
    {1, R"(
        CREATE TABLE IF NOT EXISTS controller_state (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            schema_version INTEGER NOT NULL,
            limit_bytes_per_sec INTEGER NOT NULL,
            integral_term REAL NOT NULL,
            previous_error REAL NOT NULL,
            kalman_estimate REAL NOT NULL,
            kalman_covariance REAL NOT NULL,
            last_tick_at INTEGER,
            updated_at INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS protected_transfers (
            hash TEXT PRIMARY KEY,
            protected_at INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS rule_config_snapshot (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            applied_at INTEGER NOT NULL,
            rules TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS action_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            at INTEGER NOT NULL,
            action TEXT NOT NULL,
            hash TEXT NOT NULL,
            name TEXT,
            tier INTEGER NOT NULL DEFAULT 0,
            reason TEXT,
            delete_files INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_action_log_at ON action_log(at);
        CREATE TABLE IF NOT EXISTS feed_cursor (
            item_id TEXT PRIMARY KEY,
            seen_at INTEGER NOT NULL
        );
    )"},
};

// Finalizes the statement when it goes out of scope.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : stmt_(nullptr) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    
    bool ok() const { return rc_ == SQLITE_OK; }
    sqlite3_stmt* get() const { return stmt_; }
    
private:
    sqlite3_stmt* stmt_;
    int rc_;
};

std::string column_text(sqlite3_stmt* stmt, int column) {
    auto text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

StateStore::StateStore(const std::filesystem::path& database_path,
                       std::chrono::milliseconds busy_timeout)
    : db_path_(database_path), db_(nullptr), busy_timeout_(busy_timeout) {
}

StateStore::~StateStore() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

StoreResult StateStore::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    
    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    
    int result = sqlite3_open_v2(db_path_.string().c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
    if (result != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        degraded_ = true;
        LOG_ERROR("Failed to open state database {}: {}", db_path_.string(), message);
        return StoreResult(StoreError::OPEN_FAILED, message);
    }
    
    sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_.count()));
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=FULL;");
    
    auto migrated = run_migrations();
    if (!migrated) {
        return migrated;
    }
    
    load_protected_set();
    LOG_INFO("State database ready at {} (schema v{})", db_path_.string(), SCHEMA_VERSION);
    return StoreResult();
}

bool StateStore::is_open() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return db_ != nullptr;
}

int StateStore::schema_version() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return 0;
    }
    Statement stmt(db_, "PRAGMA user_version;");
    if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

StoreResult StateStore::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        std::string message = error_msg ? error_msg : sqlite3_errstr(result);
        sqlite3_free(error_msg);
        return StoreResult(StoreError::WRITE_FAILED, message);
    }
    return StoreResult();
}

StoreResult StateStore::fail(StoreError error, const std::string& message) {
    if (!degraded_.exchange(true)) {
        LOG_ERROR("State store degraded, continuing in memory: {}", message);
    } else {
        LOG_WARN("State store write failed: {}", message);
    }
    return StoreResult(error, message);
}

// Called with db_mutex_ held after a write went through. A degraded store
// writes its in-memory mirror back before it reports itself healthy again.
StoreResult StateStore::succeed() {
    if (!degraded_.load()) {
        return StoreResult();
    }
    
    auto resynced = write_back_mirror();
    if (!resynced) {
        LOG_WARN("State store still degraded, write-back failed: {}", resynced.message);
        return StoreResult();
    }
    
    degraded_ = false;
    LOG_INFO("State store recovered, in-memory state written back");
    return StoreResult();
}

StoreResult StateStore::write_back_mirror() {
    std::unordered_set<std::string> mirror;
    std::optional<ControllerState> controller;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        mirror = protected_;
        controller = controller_;
    }
    
    auto begun = exec("BEGIN IMMEDIATE;");
    if (!begun) {
        return begun;
    }
    
    auto result = [&]() -> StoreResult {
        std::vector<std::string> stale;
        {
            Statement select(db_, "SELECT hash FROM protected_transfers;");
            if (!select.ok()) {
                return StoreResult(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
            }
            while (sqlite3_step(select.get()) == SQLITE_ROW) {
                auto hash = column_text(select.get(), 0);
                if (mirror.count(hash) == 0) {
                    stale.push_back(std::move(hash));
                }
            }
        }
        
        for (const auto& hash : stale) {
            Statement remove(db_, "DELETE FROM protected_transfers WHERE hash = ?;");
            if (!remove.ok()) {
                return StoreResult(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
            }
            sqlite3_bind_text(remove.get(), 1, hash.c_str(), -1, SQLITE_STATIC);
            if (sqlite3_step(remove.get()) != SQLITE_DONE) {
                return StoreResult(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
            }
        }
        
        for (const auto& hash : mirror) {
            Statement insert(db_, "INSERT OR IGNORE INTO protected_transfers (hash, protected_at) VALUES (?, ?);");
            if (!insert.ok()) {
                return StoreResult(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
            }
            sqlite3_bind_text(insert.get(), 1, hash.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_int64(insert.get(), 2, TimeUtils::to_unix_millis(TimeUtils::now()));
            if (sqlite3_step(insert.get()) != SQLITE_DONE) {
                return StoreResult(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
            }
        }
        
        if (controller) {
            return write_controller_state(*controller);
        }
        return StoreResult();
    }();
    
    if (!result) {
        exec("ROLLBACK;");
        return result;
    }
    
    auto committed = exec("COMMIT;");
    if (!committed) {
        exec("ROLLBACK;");
    }
    return committed;
}

StoreResult StateStore::run_migrations() {
    int current = 0;
    {
        Statement stmt(db_, "PRAGMA user_version;");
        if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
            current = sqlite3_column_int(stmt.get(), 0);
        }
    }
    
    for (const auto& migration : MIGRATIONS) {
        if (migration.version <= current) {
            continue;
        }
        
        auto begun = exec("BEGIN IMMEDIATE;");
        if (!begun) {
            return fail(StoreError::MIGRATION_FAILED, begun.message);
        }
        
        auto applied = exec(migration.sql);
        if (applied) {
            std::string bump = "PRAGMA user_version = " + std::to_string(migration.version) + ";";
            applied = exec(bump.c_str());
        }
        if (!applied) {
            exec("ROLLBACK;");
            return fail(StoreError::MIGRATION_FAILED,
                        "migration " + std::to_string(migration.version) + ": " + applied.message);
        }
        
        auto committed = exec("COMMIT;");
        if (!committed) {
            exec("ROLLBACK;");
            return fail(StoreError::MIGRATION_FAILED, committed.message);
        }
        LOG_INFO("Applied state schema migration v{}", migration.version);
    }
    return StoreResult();
}

void StateStore::load_protected_set() {
    Statement stmt(db_, "SELECT hash FROM protected_transfers;");
    if (!stmt.ok()) {
        return;
    }
    
    std::unordered_set<std::string> hashes;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        hashes.insert(column_text(stmt.get(), 0));
    }
    
    std::lock_guard<std::mutex> lock(cache_mutex_);
    protected_ = std::move(hashes);
}

StoreResult StateStore::save_controller_state(const ControllerState& state) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        controller_ = state;
    }
    
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return fail(StoreError::NOT_OPEN, "database not open");
    }
    
    auto written = write_controller_state(state);
    if (!written) {
        return fail(written.error, written.message);
    }
    return succeed();
}

StoreResult StateStore::write_controller_state(const ControllerState& state) {
    // Single-row upsert; one statement is one atomic transaction.
    const char* sql = R"(
        INSERT OR REPLACE INTO controller_state
        (id, schema_version, limit_bytes_per_sec, integral_term, previous_error,
         kalman_estimate, kalman_covariance, last_tick_at, updated_at)
        VALUES (1, ?, ?, ?, ?, ?, ?, ?, ?);
    )";
    
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        return StoreResult(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    
    sqlite3_bind_int(stmt.get(), 1, ControllerState::CURRENT_VERSION);
    sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(state.limit_bytes_per_sec));
    sqlite3_bind_double(stmt.get(), 3, state.integral_term);
    sqlite3_bind_double(stmt.get(), 4, state.previous_error);
    sqlite3_bind_double(stmt.get(), 5, state.kalman_estimate);
    sqlite3_bind_double(stmt.get(), 6, state.kalman_covariance);
    if (state.last_tick_at) {
        sqlite3_bind_int64(stmt.get(), 7, TimeUtils::to_unix_millis(*state.last_tick_at));
    } else {
        sqlite3_bind_null(stmt.get(), 7);
    }
    sqlite3_bind_int64(stmt.get(), 8, TimeUtils::to_unix_millis(TimeUtils::now()));
    
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return StoreResult(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    return StoreResult();
}

std::optional<ControllerState> StateStore::load_controller_state() {
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_) {
            Statement stmt(db_, R"(
                SELECT schema_version, limit_bytes_per_sec, integral_term, previous_error,
                       kalman_estimate, kalman_covariance, last_tick_at
                FROM controller_state WHERE id = 1;
            )");
            if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
                ControllerState state;
                state.schema_version = sqlite3_column_int(stmt.get(), 0);
                state.limit_bytes_per_sec = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1));
                state.integral_term = sqlite3_column_double(stmt.get(), 2);
                state.previous_error = sqlite3_column_double(stmt.get(), 3);
                state.kalman_estimate = sqlite3_column_double(stmt.get(), 4);
                state.kalman_covariance = sqlite3_column_double(stmt.get(), 5);
                if (sqlite3_column_type(stmt.get(), 6) != SQLITE_NULL) {
                    state.last_tick_at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt.get(), 6));
                }
                
                if (state.schema_version > ControllerState::CURRENT_VERSION) {
                    LOG_WARN("Controller state written by newer schema v{}, ignoring",
                             state.schema_version);
                    return std::nullopt;
                }
                // Version 1 is the only layout so far; older rows upgrade in place.
                state.schema_version = ControllerState::CURRENT_VERSION;
                
                std::lock_guard<std::mutex> cache_lock(cache_mutex_);
                controller_ = state;
                return state;
            }
        }
    }
    
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return controller_;
}

StoreResult StateStore::protect(const std::string& hash) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        protected_.insert(hash);
    }
    
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return fail(StoreError::NOT_OPEN, "database not open");
    }
    
    Statement stmt(db_, "INSERT OR REPLACE INTO protected_transfers (hash, protected_at) VALUES (?, ?);");
    if (!stmt.ok()) {
        return fail(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt.get(), 1, hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt.get(), 2, TimeUtils::to_unix_millis(TimeUtils::now()));
    
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return fail(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    return succeed();
}

StoreResult StateStore::unprotect(const std::string& hash) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        protected_.erase(hash);
    }
    
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return fail(StoreError::NOT_OPEN, "database not open");
    }
    
    Statement stmt(db_, "DELETE FROM protected_transfers WHERE hash = ?;");
    if (!stmt.ok()) {
        return fail(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt.get(), 1, hash.c_str(), -1, SQLITE_STATIC);
    
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return fail(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    return succeed();
}

bool StateStore::is_protected(const std::string& hash) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return protected_.count(hash) > 0;
}

std::unordered_set<std::string> StateStore::protected_hashes() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return protected_;
}

size_t StateStore::protected_count() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return protected_.size();
}

StoreResult StateStore::save_rule_snapshot(const std::string& serialized_rules) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return fail(StoreError::NOT_OPEN, "database not open");
    }
    
    Statement stmt(db_, "INSERT INTO rule_config_snapshot (applied_at, rules) VALUES (?, ?);");
    if (!stmt.ok()) {
        return fail(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(stmt.get(), 1, TimeUtils::to_unix_millis(TimeUtils::now()));
    sqlite3_bind_text(stmt.get(), 2, serialized_rules.c_str(), -1, SQLITE_STATIC);
    
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return fail(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    return succeed();
}

std::optional<std::string> StateStore::latest_rule_snapshot() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return std::nullopt;
    }
    
    Statement stmt(db_, "SELECT rules FROM rule_config_snapshot ORDER BY id DESC LIMIT 1;");
    if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return column_text(stmt.get(), 0);
}

StoreResult StateStore::append_action(const ActionLogEntry& entry) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return fail(StoreError::NOT_OPEN, "database not open");
    }
    
    const char* sql = R"(
        INSERT INTO action_log (at, action, hash, name, tier, reason, delete_files)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )";
    
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        return fail(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(stmt.get(), 1, TimeUtils::to_unix_millis(entry.at));
    sqlite3_bind_text(stmt.get(), 2, entry.action.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 3, entry.hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 4, entry.name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt.get(), 5, entry.tier);
    sqlite3_bind_text(stmt.get(), 6, entry.reason.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt.get(), 7, entry.delete_files ? 1 : 0);
    
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return fail(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    return succeed();
}

std::vector<ActionLogEntry> StateStore::recent_actions(size_t limit) {
    std::vector<ActionLogEntry> entries;
    
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return entries;
    }
    
    Statement stmt(db_, R"(
        SELECT id, at, action, hash, name, tier, reason, delete_files
        FROM action_log ORDER BY id DESC LIMIT ?;
    )");
    if (!stmt.ok()) {
        return entries;
    }
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));
    
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        ActionLogEntry entry;
        entry.id = sqlite3_column_int64(stmt.get(), 0);
        entry.at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt.get(), 1));
        entry.action = column_text(stmt.get(), 2);
        entry.hash = column_text(stmt.get(), 3);
        entry.name = column_text(stmt.get(), 4);
        entry.tier = sqlite3_column_int(stmt.get(), 5);
        entry.reason = column_text(stmt.get(), 6);
        entry.delete_files = sqlite3_column_int(stmt.get(), 7) != 0;
        entries.push_back(std::move(entry));
    }
    return entries;
}

StoreResult StateStore::mark_feed_item_seen(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return fail(StoreError::NOT_OPEN, "database not open");
    }
    
    Statement stmt(db_, "INSERT OR IGNORE INTO feed_cursor (item_id, seen_at) VALUES (?, ?);");
    if (!stmt.ok()) {
        return fail(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt.get(), 1, item_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt.get(), 2, TimeUtils::to_unix_millis(TimeUtils::now()));
    
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return fail(StoreError::WRITE_FAILED, sqlite3_errmsg(db_));
    }
    return succeed();
}

bool StateStore::feed_item_seen(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return false;
    }
    
    Statement stmt(db_, "SELECT 1 FROM feed_cursor WHERE item_id = ?;");
    if (!stmt.ok()) {
        return false;
    }
    sqlite3_bind_text(stmt.get(), 1, item_id.c_str(), -1, SQLITE_STATIC);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

} // namespace seedkeeper::storage
