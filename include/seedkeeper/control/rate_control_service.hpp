#pragma once

#include "process_variable.hpp"
#include "rate_controller.hpp"
#include "seedkeeper/client/client_session.hpp"
#include "seedkeeper/core/settings.hpp"
#include "seedkeeper/scheduler/event_channel.hpp"
#include "seedkeeper/storage/state_store.hpp"
#include <memory>
#include <mutex>

namespace seedkeeper::control {

enum class ControllerMode {
    STOPPED,
    RUNNING
};

const char* to_string(ControllerMode mode);

enum class TickOutcome {
    STOPPED,
    APPLIED,
    HELD,
    SAMPLE_FAILED,
    APPLY_FAILED
};

const char* to_string(TickOutcome outcome);

struct ControllerStatus {
    ControllerMode mode = ControllerMode::STOPPED;
    uint64_t applied_limit = 0;
    uint64_t last_computed_limit = 0;
    double estimate = 0.0;
    double covariance = 0.0;
    double integral = 0.0;
    double last_sample = 0.0;
    uint32_t consecutive_failures = 0;
    uint64_t ticks = 0;
};

// Runs one rate-control tick per call: sample, compute, maybe apply,
// persist. Failed ticks roll the controller back to its pre-tick state.
class RateControlService {
public:
    using Clock = RateController::Clock;
    
    RateControlService(std::shared_ptr<client::ClientSession> session,
                       std::shared_ptr<storage::StateStore> store,
                       std::shared_ptr<ProcessVariableSource> source,
                       std::shared_ptr<scheduler::EventChannel> events,
                       std::shared_ptr<core::SettingsProvider> settings);
    
    // Loads persisted state (or neutral defaults) before the first tick.
    void start();
    // Persists state; the last applied limit stays in force on the client.
    void stop();
    
    TickOutcome tick();
    TickOutcome tick(Clock::time_point now);
    
    ControllerMode mode() const;
    ControllerStatus status() const;

private:
    void apply_settings_if_changed();
    void record_failure(const char* what);
    void persist();
    void publish_status();
    
    std::shared_ptr<client::ClientSession> session_;
    std::shared_ptr<storage::StateStore> store_;
    std::shared_ptr<ProcessVariableSource> source_;
    std::shared_ptr<scheduler::EventChannel> events_;
    std::shared_ptr<core::SettingsProvider> settings_;
    
    std::mutex tick_mutex_;
    std::shared_ptr<const core::Settings> active_settings_;
    uint64_t settings_generation_;
    RateController controller_;
    ControllerMode mode_ = ControllerMode::STOPPED;
    uint32_t consecutive_failures_ = 0;
    uint64_t ticks_ = 0;
    uint64_t last_computed_limit_ = 0;
    double last_sample_ = 0.0;
    
    mutable std::mutex status_mutex_;
    ControllerStatus status_;
};

} // namespace seedkeeper::control
