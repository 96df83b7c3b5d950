#pragma once

#include "cleanup_engine.hpp"
#include "directive_file.hpp"
#include "free_space_probe.hpp"
#include "seedkeeper/client/client_session.hpp"
#include "seedkeeper/core/settings.hpp"
#include "seedkeeper/scheduler/event_channel.hpp"
#include "seedkeeper/storage/state_store.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace seedkeeper::cleanup {

struct CleanupStatus {
    bool enabled = false;
    bool in_progress = false;
    std::optional<PendingDeletion> pending;
    std::string last_action;
    uint64_t deleted = 0;
    uint64_t abandoned = 0;
    size_t manual_queued = 0;
};

// Executes deletions one at a time on its own strand:
// select -> reannounce -> wait -> re-verify -> delete -> log -> cool down,
// then evaluates again against a fresh snapshot until nothing matches.
// Manual requests go through the same executor ahead of rule candidates.
class CleanupService : public std::enable_shared_from_this<CleanupService> {
public:
    CleanupService(boost::asio::io_context& io_context,
                   std::shared_ptr<client::ClientSession> session,
                   std::shared_ptr<storage::StateStore> store,
                   std::shared_ptr<scheduler::EventChannel> events,
                   std::shared_ptr<core::SettingsProvider> settings);
    
    void set_enabled(bool enabled);
    bool enabled() const;
    
    // Starts a cycle unless one is already running.
    void trigger();
    
    // Applies protect/unprotect directives and queues deletions.
    size_t process_directives();
    
    // Refused when the hash is protected.
    bool request_delete(const std::string& hash, std::optional<bool> delete_files,
                        std::string reason, std::string& error);
    void request_delete_by_name(const std::string& pattern, std::optional<bool> delete_files,
                                std::string reason);
    
    storage::StoreResult protect(const std::string& hash);
    storage::StoreResult unprotect(const std::string& hash);
    
    // Stops new steps from starting and cuts a cool-down short; the current
    // step, including its reannounce wait, runs to completion.
    void shutdown();
    bool wait_idle(std::chrono::milliseconds timeout);
    
    CleanupStatus status() const;

private:
    struct ManualRequest {
        std::string hash;
        std::string name_pattern;
        std::optional<bool> delete_files;
        std::string reason;
    };
    
    void next_step();
    std::optional<PendingDeletion> next_manual(const std::vector<client::TransferSnapshot>& transfers,
                                               const std::unordered_set<std::string>& protected_hashes);
    void begin(PendingDeletion candidate);
    void on_wait_complete(const boost::system::error_code& ec);
    void conclude(DeletionPhase phase, const std::string& note);
    void schedule_cooldown();
    void finish_cycle();
    void refresh_settings();
    void record_action(const std::string& action, const std::string& hash,
                       const std::string& name, int tier, const std::string& reason,
                       bool delete_files);
    
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    
    std::shared_ptr<client::ClientSession> session_;
    std::shared_ptr<storage::StateStore> store_;
    std::shared_ptr<scheduler::EventChannel> events_;
    std::shared_ptr<core::SettingsProvider> settings_;
    
    // Strand-confined, refreshed at the start of every step
    std::shared_ptr<const core::Settings> active_settings_;
    uint64_t settings_generation_ = 0;
    std::unique_ptr<CleanupEngine> engine_;
    std::unique_ptr<FreeSpaceProbe> probe_;
    bool cooling_down_ = false;
    
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    bool enabled_ = false;
    bool busy_ = false;
    bool shutting_down_ = false;
    std::deque<ManualRequest> manual_;
    std::optional<PendingDeletion> pending_;
    std::string last_action_;
    uint64_t deleted_ = 0;
    uint64_t abandoned_ = 0;
};

} // namespace seedkeeper::cleanup
