#pragma once

#include "controller_state.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

struct sqlite3;

namespace seedkeeper::storage {

enum class StoreError {
    SUCCESS = 0,
    NOT_OPEN,
    OPEN_FAILED,
    MIGRATION_FAILED,
    WRITE_FAILED
};

struct StoreResult {
    StoreError error;
    std::string message;
    
    StoreResult(StoreError err = StoreError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == StoreError::SUCCESS; }
    operator bool() const { return success(); }
};

struct ActionLogEntry {
    int64_t id = 0;
    std::chrono::system_clock::time_point at;
    std::string action;
    std::string hash;
    std::string name;
    int tier = 0;
    std::string reason;
    bool delete_files = false;
};

// SQLite-backed store for controller state, the protected set, the rule
// snapshot audit trail, the action log and the feed cursor. Every write is
// one committed transaction. If the database cannot be written the store
// keeps serving its in-memory mirror and reports itself degraded.
class StateStore {
public:
    static constexpr int SCHEMA_VERSION = 1;
    
    explicit StateStore(const std::filesystem::path& database_path,
                        std::chrono::milliseconds busy_timeout = std::chrono::seconds(5));
    ~StateStore();
    
    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;
    
    StoreResult initialize();
    bool is_open() const;
    bool degraded() const { return degraded_.load(); }
    int schema_version() const;
    
    // Controller state
    StoreResult save_controller_state(const ControllerState& state);
    std::optional<ControllerState> load_controller_state();
    
    // Protected set
    StoreResult protect(const std::string& hash);
    StoreResult unprotect(const std::string& hash);
    bool is_protected(const std::string& hash) const;
    std::unordered_set<std::string> protected_hashes() const;
    size_t protected_count() const;
    
    // Audit trail
    StoreResult save_rule_snapshot(const std::string& serialized_rules);
    std::optional<std::string> latest_rule_snapshot();
    StoreResult append_action(const ActionLogEntry& entry);
    std::vector<ActionLogEntry> recent_actions(size_t limit);
    
    // Feed cursor
    StoreResult mark_feed_item_seen(const std::string& item_id);
    bool feed_item_seen(const std::string& item_id);

private:
    StoreResult run_migrations();
    StoreResult exec(const char* sql);
    StoreResult fail(StoreError error, const std::string& message);
    StoreResult succeed();
    StoreResult write_back_mirror();
    StoreResult write_controller_state(const ControllerState& state);
    void load_protected_set();
    
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::chrono::milliseconds busy_timeout_;
    mutable std::mutex db_mutex_;
    
    mutable std::mutex cache_mutex_;
    std::unordered_set<std::string> protected_;
    std::optional<ControllerState> controller_;
    
    std::atomic<bool> degraded_{false};
};

} // namespace seedkeeper::storage
