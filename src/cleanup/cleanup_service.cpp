#include "seedkeeper/cleanup/cleanup_service.hpp"
#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/utils.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace seedkeeper::cleanup {

using core::utils::StringUtils;
using scheduler::EventSeverity;

CleanupService::CleanupService(boost::asio::io_context& io_context,
                               std::shared_ptr<client::ClientSession> session,
                               std::shared_ptr<storage::StateStore> store,
                               std::shared_ptr<scheduler::EventChannel> events,
                               std::shared_ptr<core::SettingsProvider> settings)
    : strand_(boost::asio::make_strand(io_context))
    , timer_(io_context)
    , session_(std::move(session))
    , store_(std::move(store))
    , events_(std::move(events))
    , settings_(std::move(settings))
    , enabled_(settings_->current()->cleanup_enabled) {
}

void CleanupService::set_enabled(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (enabled_ == enabled) {
            return;
        }
        enabled_ = enabled;
    }
    LOG_INFO("Cleanup {}", enabled ? "enabled" : "disabled");
    if (enabled) {
        trigger();
    }
}

bool CleanupService::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

void CleanupService::trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return;
        }
        if (busy_) {
            LOG_DEBUG("Cleanup cycle already running, trigger skipped");
            return;
        }
        if (!enabled_ && manual_.empty()) {
            return;
        }
        busy_ = true;
    }
    
    boost::asio::post(strand_, [self = shared_from_this()] {
        self->next_step();
    });
}

size_t CleanupService::process_directives() {
    DirectiveFile file(settings_->current()->cleanup_directive_file);
    auto batch = file.consume();
    
    for (const auto& error : batch.errors) {
        events_->publish(EventSeverity::WARNING, "cleanup", "Rejected directive: " + error);
    }
    
    for (const auto& directive : batch.directives) {
        switch (directive.action) {
            case DirectiveAction::PROTECT: {
                auto result = protect(directive.hash);
                if (!result) {
                    LOG_WARN("Protect {} kept in memory only: {}", directive.hash, result.message);
                }
                break;
            }
            case DirectiveAction::UNPROTECT: {
                auto result = unprotect(directive.hash);
                if (!result) {
                    LOG_WARN("Unprotect {} kept in memory only: {}", directive.hash, result.message);
                }
                break;
            }
            case DirectiveAction::DELETE:
                if (!directive.hash.empty()) {
                    std::string error;
                    if (!request_delete(directive.hash, directive.delete_files, directive.reason, error)) {
                        events_->publish(EventSeverity::WARNING, "cleanup", error);
                    }
                } else {
                    request_delete_by_name(directive.name_pattern, directive.delete_files, directive.reason);
                }
                break;
        }
    }
    return batch.directives.size();
}

bool CleanupService::request_delete(const std::string& hash, std::optional<bool> delete_files,
                                    std::string reason, std::string& error) {
    if (store_->is_protected(hash)) {
        error = "Refusing manual delete of protected transfer " + StringUtils::short_hash(hash);
        LOG_WARN("{}", error);
        return false;
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manual_.push_back(ManualRequest{hash, "", delete_files, std::move(reason)});
    }
    LOG_INFO("Queued manual delete of {}", StringUtils::short_hash(hash));
    trigger();
    return true;
}

void CleanupService::request_delete_by_name(const std::string& pattern, std::optional<bool> delete_files,
                                            std::string reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manual_.push_back(ManualRequest{"", pattern, delete_files, std::move(reason)});
    }
    LOG_INFO("Queued manual delete of transfers matching '{}'", pattern);
    trigger();
}

storage::StoreResult CleanupService::protect(const std::string& hash) {
    auto result = store_->protect(hash);
    record_action("protect", hash, "", 0, "manual", false);
    LOG_INFO("Protected {}", StringUtils::short_hash(hash));
    return result;
}

storage::StoreResult CleanupService::unprotect(const std::string& hash) {
    auto result = store_->unprotect(hash);
    record_action("unprotect", hash, "", 0, "manual", false);
    LOG_INFO("Unprotected {}", StringUtils::short_hash(hash));
    return result;
}

void CleanupService::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
    }
    
    // A reannounce wait runs to completion; only the cool-down is cut short.
    boost::asio::post(strand_, [self = shared_from_this()] {
        if (self->cooling_down_) {
            self->timer_.cancel();
        }
    });
}

bool CleanupService::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return !busy_; });
}

CleanupStatus CleanupService::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CleanupStatus status;
    status.enabled = enabled_;
    status.in_progress = busy_;
    status.pending = pending_;
    status.last_action = last_action_;
    status.deleted = deleted_;
    status.abandoned = abandoned_;
    status.manual_queued = manual_.size();
    return status;
}

void CleanupService::next_step() {
    refresh_settings();
    
    bool enabled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_ || (!enabled_ && manual_.empty())) {
            busy_ = false;
            idle_cv_.notify_all();
            return;
        }
        enabled = enabled_;
    }
    
    std::vector<client::TransferSnapshot> transfers;
    auto listed = session_->list_transfers(transfers);
    if (!listed) {
        LOG_WARN("Cleanup cycle skipped, cannot list transfers: {}", listed.message);
        finish_cycle();
        return;
    }
    
    auto protected_hashes = store_->protected_hashes();
    auto candidate = next_manual(transfers, protected_hashes);
    if (!candidate && enabled) {
        candidate = engine_->evaluate(transfers, probe_->probe(), protected_hashes);
    }
    
    if (!candidate) {
        finish_cycle();
        return;
    }
    begin(std::move(*candidate));
}

std::optional<PendingDeletion> CleanupService::next_manual(
    const std::vector<client::TransferSnapshot>& transfers,
    const std::unordered_set<std::string>& protected_hashes) {
    
    std::lock_guard<std::mutex> lock(mutex_);
    while (!manual_.empty()) {
        auto request = std::move(manual_.front());
        manual_.pop_front();
        
        if (!request.name_pattern.empty()) {
            std::vector<ManualRequest> expanded;
            for (const auto& transfer : transfers) {
                if (StringUtils::contains_ignore_case(transfer.name, request.name_pattern) &&
                    protected_hashes.count(transfer.hash) == 0) {
                    expanded.push_back(ManualRequest{transfer.hash, "", request.delete_files, request.reason});
                }
            }
            LOG_INFO("Pattern '{}' matched {} transfer(s)", request.name_pattern, expanded.size());
            manual_.insert(manual_.begin(), expanded.begin(), expanded.end());
            continue;
        }
        
        auto it = std::find_if(transfers.begin(), transfers.end(),
                               [&](const client::TransferSnapshot& t) { return t.hash == request.hash; });
        if (it == transfers.end()) {
            LOG_WARN("Manual delete target {} not found", StringUtils::short_hash(request.hash));
            continue;
        }
        if (protected_hashes.count(request.hash) > 0) {
            LOG_WARN("Manual delete target {} is protected, skipping", StringUtils::short_hash(request.hash));
            continue;
        }
        
        PendingDeletion pending;
        pending.hash = it->hash;
        pending.name = it->name;
        pending.tier = 0;
        pending.reason = "manual";
        pending.detail = request.reason.empty() ? "manual request" : request.reason;
        pending.delete_files = request.delete_files.value_or(active_settings_->cleanup_delete_files);
        pending.requested_at = std::chrono::system_clock::now();
        pending.total_size = it->total_size;
        pending.uploaded = it->uploaded;
        pending.downloaded = it->downloaded;
        return pending;
    }
    return std::nullopt;
}

void CleanupService::begin(PendingDeletion candidate) {
    LOG_INFO("Cleanup selected {} [{}]: {}", candidate.name, candidate.reason, candidate.detail);
    
    bool reannounce = active_settings_->cleanup_reannounce_before_delete;
    if (reannounce) {
        auto result = session_->reannounce(candidate.hash);
        candidate.phase = DeletionPhase::REANNOUNCE_REQUESTED;
        candidate.reannounce_issued = result.success();
        if (!result) {
            LOG_WARN("Reannounce of {} failed: {}", candidate.name, result.message);
        }
    }
    candidate.phase = DeletionPhase::WAITING;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = std::move(candidate);
    }
    
    auto wait = reannounce ? active_settings_->cleanup_reannounce_wait : std::chrono::milliseconds(0);
    timer_.expires_after(wait);
    timer_.async_wait(boost::asio::bind_executor(strand_,
        [self = shared_from_this()](const boost::system::error_code& ec) {
            self->on_wait_complete(ec);
        }));
}

void CleanupService::on_wait_complete(const boost::system::error_code& ec) {
    if (ec) {
        conclude(DeletionPhase::ABANDONED, "wait interrupted: " + ec.message());
        finish_cycle();
        return;
    }
    
    PendingDeletion pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = *pending_;
    }
    
    std::vector<client::TransferSnapshot> transfers;
    auto listed = session_->list_transfers(transfers);
    if (!listed) {
        conclude(DeletionPhase::ABANDONED, "re-verify failed: " + listed.message);
        schedule_cooldown();
        return;
    }
    
    bool present = std::any_of(transfers.begin(), transfers.end(),
                               [&](const client::TransferSnapshot& t) { return t.hash == pending.hash; });
    if (!present) {
        conclude(DeletionPhase::ABANDONED, "no longer present");
        schedule_cooldown();
        return;
    }
    if (store_->is_protected(pending.hash)) {
        conclude(DeletionPhase::ABANDONED, "protected while pending");
        schedule_cooldown();
        return;
    }
    
    auto removed = session_->remove(pending.hash, pending.delete_files);
    if (!removed) {
        conclude(DeletionPhase::ABANDONED, "delete failed: " + removed.message);
        schedule_cooldown();
        return;
    }
    
    conclude(DeletionPhase::DELETED, pending.detail);
    schedule_cooldown();
}

void CleanupService::conclude(DeletionPhase phase, const std::string& note) {
    PendingDeletion pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = *pending_;
        pending_.reset();
        
        if (phase == DeletionPhase::DELETED) {
            deleted_++;
            last_action_ = "deleted " + pending.name + " (" + pending.reason + ")";
        } else {
            abandoned_++;
            last_action_ = "abandoned " + pending.name + " (" + note + ")";
        }
    }
    
    if (phase == DeletionPhase::DELETED) {
        record_action("delete", pending.hash, pending.name, pending.tier,
                      pending.reason + ": " + note, pending.delete_files);
        LOG_INFO("Deleted {} [{}]{}", pending.name, pending.reason,
                 pending.delete_files ? " with data" : "");
        events_->publish(EventSeverity::INFO, "cleanup", fmt::format(
            "Deleted {} [{}] {}, size {}, uploaded {}", pending.name, pending.reason, pending.detail,
            StringUtils::format_bytes(pending.total_size), StringUtils::format_bytes(pending.uploaded)));
    } else {
        record_action("abandon", pending.hash, pending.name, pending.tier,
                      pending.reason + ": " + note, pending.delete_files);
        LOG_WARN("Abandoned deletion of {}: {}", pending.name, note);
        events_->publish(EventSeverity::WARNING, "cleanup",
                         "Abandoned deletion of " + pending.name + ": " + note);
    }
}

void CleanupService::schedule_cooldown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            busy_ = false;
            idle_cv_.notify_all();
            return;
        }
    }
    
    cooling_down_ = true;
    timer_.expires_after(active_settings_->cleanup_cooldown);
    timer_.async_wait(boost::asio::bind_executor(strand_,
        [self = shared_from_this()](const boost::system::error_code&) {
            self->cooling_down_ = false;
            self->next_step();
        }));
}

void CleanupService::finish_cycle() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!manual_.empty() && !shutting_down_) {
            boost::asio::post(strand_, [self = shared_from_this()] {
                self->next_step();
            });
            return;
        }
        busy_ = false;
    }
    idle_cv_.notify_all();
}

void CleanupService::refresh_settings() {
    auto generation = settings_->generation();
    if (engine_ && generation == settings_generation_) {
        return;
    }
    
    active_settings_ = settings_->current();
    settings_generation_ = generation;
    
    auto rules = CleanupRules::from_settings(*active_settings_);
    auto serialized = rules.serialize();
    engine_ = std::make_unique<CleanupEngine>(std::move(rules), active_settings_->cleanup_delete_files);
    probe_ = std::make_unique<FreeSpaceProbe>(session_, active_settings_->cleanup_free_space_path);
    
    if (store_->latest_rule_snapshot() != serialized) {
        auto saved = store_->save_rule_snapshot(serialized);
        if (!saved) {
            LOG_WARN("Rule snapshot not recorded: {}", saved.message);
        }
    }
}

void CleanupService::record_action(const std::string& action, const std::string& hash,
                                   const std::string& name, int tier, const std::string& reason,
                                   bool delete_files) {
    storage::ActionLogEntry entry;
    entry.at = std::chrono::system_clock::now();
    entry.action = action;
    entry.hash = hash;
    entry.name = name;
    entry.tier = tier;
    entry.reason = reason;
    entry.delete_files = delete_files;
    
    auto result = store_->append_action(entry);
    if (!result) {
        LOG_WARN("Action '{}' for {} not logged: {}", action, StringUtils::short_hash(hash), result.message);
    }
}

} // namespace seedkeeper::cleanup
