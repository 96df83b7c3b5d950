#pragma once

#include "command_queue.hpp"
#include "event_channel.hpp"
#include "periodic_task.hpp"
#include "seedkeeper/cleanup/cleanup_service.hpp"
#include "seedkeeper/client/client_session.hpp"
#include "seedkeeper/control/rate_control_service.hpp"
#include "seedkeeper/core/settings.hpp"
#include "seedkeeper/storage/state_store.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace seedkeeper::scheduler {

// Owns the worker pool and the shared session, store and settings, and runs
// three periodic tasks on it: rate control, cleanup and command intake.
// Commands arrive through submit() and are answered with a status snapshot.
class Scheduler {
public:
    static constexpr size_t DEFAULT_WORKER_THREADS = 4;
    
    // A null store is opened from Settings::database_path; a null source
    // defaults to upload throughput.
    Scheduler(std::shared_ptr<client::TransferClient> client,
              std::shared_ptr<core::SettingsProvider> settings,
              std::shared_ptr<storage::StateStore> store = nullptr,
              std::shared_ptr<control::ProcessVariableSource> source = nullptr,
              size_t worker_threads = DEFAULT_WORKER_THREADS);
    ~Scheduler();
    
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    
    bool start();
    // Stops new ticks, lets in-flight work finish, persists controller
    // state, then stops the pool. Work still running at the deadline is
    // abandoned.
    void shutdown(std::chrono::milliseconds grace);
    bool running() const { return running_.load(); }
    
    std::future<CommandReply> submit(Command command);
    CommandReply dispatch(const Command& command);
    
    SchedulerStatus status() const;
    
    std::shared_ptr<EventChannel> events() const { return events_; }
    std::shared_ptr<client::ClientSession> session() const { return session_; }
    std::shared_ptr<storage::StateStore> store() const { return store_; }

private:
    void intake();
    CommandReply reload();
    void apply_intervals(const core::Settings& settings);
    std::vector<std::string> describe(const SchedulerStatus& status) const;
    
    std::shared_ptr<core::SettingsProvider> settings_;
    std::shared_ptr<EventChannel> events_;
    std::shared_ptr<client::ClientSession> session_;
    std::shared_ptr<storage::StateStore> store_;
    
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::vector<std::thread> workers_;
    size_t worker_count_;
    
    std::shared_ptr<control::RateControlService> rate_control_;
    std::shared_ptr<cleanup::CleanupService> cleanup_;
    CommandQueue commands_;
    
    std::shared_ptr<PeriodicTask> rate_task_;
    std::shared_ptr<PeriodicTask> cleanup_task_;
    std::shared_ptr<PeriodicTask> intake_task_;
    
    std::atomic<bool> running_{false};
};

} // namespace seedkeeper::scheduler
