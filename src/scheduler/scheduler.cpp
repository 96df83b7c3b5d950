#include "seedkeeper/scheduler/scheduler.hpp"
#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/utils.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace seedkeeper::scheduler {

using core::utils::StringUtils;
using core::utils::TimeUtils;

Scheduler::Scheduler(std::shared_ptr<client::TransferClient> client,
                     std::shared_ptr<core::SettingsProvider> settings,
                     std::shared_ptr<storage::StateStore> store,
                     std::shared_ptr<control::ProcessVariableSource> source,
                     size_t worker_threads)
    : settings_(std::move(settings))
    , events_(std::make_shared<EventChannel>())
    , worker_count_(std::max<size_t>(2, worker_threads)) {
    
    auto current = settings_->current();
    session_ = std::make_shared<client::ClientSession>(
        std::move(client), current->api_call_budget, current->api_call_timeout);
    store_ = store ? std::move(store) : std::make_shared<storage::StateStore>(current->database_path);
    if (!source) {
        source = std::make_shared<control::UploadThroughputSource>(session_);
    }
    
    rate_control_ = std::make_shared<control::RateControlService>(
        session_, store_, std::move(source), events_, settings_);
    cleanup_ = std::make_shared<cleanup::CleanupService>(
        io_context_, session_, store_, events_, settings_);
    
    rate_task_ = std::make_shared<PeriodicTask>(io_context_, "rate_control", current->control_interval,
        [this] { rate_control_->tick(); });
    cleanup_task_ = std::make_shared<PeriodicTask>(io_context_, "cleanup", current->cleanup_interval,
        [this] { cleanup_->trigger(); });
    intake_task_ = std::make_shared<PeriodicTask>(io_context_, "command_intake", current->command_poll_interval,
        [this] { intake(); });
}

Scheduler::~Scheduler() {
    if (running_) {
        shutdown(std::chrono::seconds(5));
    }
}

bool Scheduler::start() {
    if (running_) {
        LOG_WARN("Scheduler already running");
        return false;
    }
    
    if (!store_->is_open()) {
        auto opened = store_->initialize();
        if (!opened) {
            LOG_ERROR("State store unavailable, running in memory: {}", opened.message);
            events_->publish(EventSeverity::ERROR, "store", "State store unavailable: " + opened.message);
        }
    }
    
    auto login = session_->login();
    if (!login) {
        LOG_WARN("Initial login failed, will retry on demand: {}", login.message);
        events_->publish(EventSeverity::WARNING, "session", "Initial login failed: " + login.message);
    }
    
    rate_control_->start();
    
    work_.emplace(boost::asio::make_work_guard(io_context_));
    running_ = true;
    
    for (size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this]() {
            while (true) {
                try {
                    io_context_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("Worker error: {}", e.what());
                    if (!running_) break;
                }
            }
        });
    }
    
    rate_task_->start();
    cleanup_task_->start();
    intake_task_->start();
    
    LOG_INFO("Scheduler started with {} workers", worker_count_);
    return true;
}

void Scheduler::shutdown(std::chrono::milliseconds grace) {
    if (!running_.exchange(false)) {
        return;
    }
    
    LOG_INFO("Scheduler shutting down (grace {} ms)", grace.count());
    auto deadline = std::chrono::steady_clock::now() + grace;
    auto remaining = [deadline] {
        auto left = deadline - std::chrono::steady_clock::now();
        return std::max(std::chrono::milliseconds(0),
                        std::chrono::duration_cast<std::chrono::milliseconds>(left));
    };
    
    rate_task_->stop();
    cleanup_task_->stop();
    intake_task_->stop();
    cleanup_->shutdown();
    commands_.close("scheduler is shutting down");
    
    bool clean = rate_task_->wait_idle(remaining());
    clean = cleanup_->wait_idle(remaining()) && clean;
    clean = intake_task_->wait_idle(remaining()) && clean;
    clean = cleanup_task_->wait_idle(remaining()) && clean;
    if (!clean) {
        LOG_WARN("Grace period expired with work still in flight");
    }
    
    rate_control_->stop();
    
    work_.reset();
    io_context_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    LOG_INFO("Scheduler stopped");
}

std::future<CommandReply> Scheduler::submit(Command command) {
    return commands_.submit(std::move(command));
}

void Scheduler::intake() {
    CommandQueue::Entry entry;
    while (commands_.try_pop(entry)) {
        entry.reply.set_value(dispatch(entry.command));
    }
    
    cleanup_->process_directives();
}

CommandReply Scheduler::dispatch(const Command& command) {
    LOG_DEBUG("Dispatching command '{}'", to_string(command.type));
    CommandReply reply;
    
    switch (command.type) {
        case CommandType::STATUS:
            break;
            
        case CommandType::SPEED: {
            auto controller = rate_control_->status();
            reply.lines.push_back("applied limit: " +
                StringUtils::format_speed(static_cast<double>(controller.applied_limit)));
            reply.lines.push_back("computed limit: " +
                StringUtils::format_speed(static_cast<double>(controller.last_computed_limit)));
            reply.lines.push_back(fmt::format("process variable: {:.1f} (estimate {:.1f}, covariance {:.3f})",
                                              controller.last_sample, controller.estimate,
                                              controller.covariance));
            break;
        }
        
        case CommandType::LIST: {
            std::vector<client::TransferSnapshot> transfers;
            auto result = session_->list_transfers(transfers);
            if (!result) {
                reply.ok = false;
                reply.message = "cannot list transfers: " + result.message;
                break;
            }
            for (const auto& transfer : transfers) {
                reply.lines.push_back(fmt::format("{} {} [{}] {:.0f}% up {} down {}{}",
                    StringUtils::short_hash(transfer.hash, 8), transfer.name,
                    client::to_string(transfer.state), transfer.progress * 100.0,
                    transfer.upload_rate ? StringUtils::format_speed(static_cast<double>(*transfer.upload_rate)) : "-",
                    transfer.download_rate ? StringUtils::format_speed(static_cast<double>(*transfer.download_rate)) : "-",
                    store_->is_protected(transfer.hash) ? " (protected)" : ""));
            }
            reply.message = std::to_string(transfers.size()) + " transfer(s)";
            break;
        }
        
        case CommandType::START_CONTROLLER:
            rate_control_->start();
            reply.message = "rate controller running";
            break;
            
        case CommandType::STOP_CONTROLLER:
            rate_control_->stop();
            reply.message = "rate controller stopped";
            break;
            
        case CommandType::START_CLEANUP:
            cleanup_->set_enabled(true);
            reply.message = "cleanup enabled";
            break;
            
        case CommandType::STOP_CLEANUP:
            cleanup_->set_enabled(false);
            reply.message = "cleanup disabled";
            break;
            
        case CommandType::RELOAD:
            reply = reload();
            break;
            
        case CommandType::PROTECT:
        case CommandType::UNPROTECT: {
            if (command.target.empty()) {
                reply.ok = false;
                reply.message = "missing transfer hash";
                break;
            }
            bool protecting = command.type == CommandType::PROTECT;
            auto result = protecting ? cleanup_->protect(command.target) : cleanup_->unprotect(command.target);
            reply.message = std::string(protecting ? "protected " : "unprotected ") +
                            StringUtils::short_hash(command.target);
            if (!result) {
                reply.message += " (not persisted: " + result.message + ")";
            }
            break;
        }
        
        case CommandType::DELETE: {
            if (command.target.empty()) {
                reply.ok = false;
                reply.message = "missing transfer hash";
                break;
            }
            std::string error;
            if (!cleanup_->request_delete(command.target, command.delete_files, command.reason, error)) {
                reply.ok = false;
                reply.message = error;
                break;
            }
            reply.message = "deletion of " + StringUtils::short_hash(command.target) + " queued";
            break;
        }
        
        case CommandType::LOG:
            reply.lines = core::Logger::recent(command.count);
            break;
    }
    
    reply.status = status();
    if (command.type == CommandType::STATUS) {
        reply.lines = describe(reply.status);
    }
    return reply;
}

CommandReply Scheduler::reload() {
    CommandReply reply;
    auto previous = settings_->current();
    
    std::string error;
    if (!settings_->reload(error)) {
        reply.ok = false;
        reply.message = "reload rejected: " + error;
        LOG_WARN("{}", reply.message);
        events_->publish(EventSeverity::WARNING, "settings", reply.message);
        return reply;
    }
    
    auto current = settings_->current();
    session_->configure(current->api_call_budget, current->api_call_timeout);
    apply_intervals(*current);
    if (current->cleanup_enabled != previous->cleanup_enabled) {
        cleanup_->set_enabled(current->cleanup_enabled);
    }
    if (current->log_level != previous->log_level) {
        auto level = core::Logger::parse_level(current->log_level);
        if (level) {
            core::Logger::get()->set_level(static_cast<spdlog::level::level_enum>(*level));
        }
    }
    
    reply.message = "settings reloaded (generation " + std::to_string(settings_->generation()) + ")";
    LOG_INFO("{}", reply.message);
    return reply;
}

void Scheduler::apply_intervals(const core::Settings& settings) {
    rate_task_->set_interval(settings.control_interval);
    cleanup_task_->set_interval(settings.cleanup_interval);
    intake_task_->set_interval(settings.command_poll_interval);
}

SchedulerStatus Scheduler::status() const {
    SchedulerStatus status;
    status.controller = rate_control_->status();
    status.cleanup = cleanup_->status();
    status.protected_count = store_->protected_count();
    status.store_degraded = store_->degraded();
    status.settings_generation = settings_->generation();
    status.authenticated = session_->authenticated();
    status.events_pending = events_->size();
    status.taken_at = TimeUtils::now();
    return status;
}

std::vector<std::string> Scheduler::describe(const SchedulerStatus& status) const {
    std::vector<std::string> lines;
    lines.push_back(fmt::format("controller: {} at {}, {} consecutive failure(s)",
        control::to_string(status.controller.mode),
        StringUtils::format_speed(static_cast<double>(status.controller.applied_limit)),
        status.controller.consecutive_failures));
    lines.push_back(fmt::format("estimator: {:.1f} (covariance {:.3f})",
                                status.controller.estimate, status.controller.covariance));
    
    std::string cleanup_line = fmt::format("cleanup: {}{}",
        status.cleanup.enabled ? "enabled" : "disabled",
        status.cleanup.in_progress ? ", in progress" : "");
    if (status.cleanup.pending) {
        cleanup_line += fmt::format(", pending {} [{}] {}", status.cleanup.pending->name,
                               status.cleanup.pending->reason,
                               cleanup::to_string(status.cleanup.pending->phase));
    }
    lines.push_back(cleanup_line);
    if (!status.cleanup.last_action.empty()) {
        lines.push_back("last cleanup action: " + status.cleanup.last_action);
    }
    
    lines.push_back(fmt::format("protected: {}, store {}, settings generation {}",
        status.protected_count, status.store_degraded ? "DEGRADED" : "ok",
        status.settings_generation));
    return lines;
}

} // namespace seedkeeper::scheduler
