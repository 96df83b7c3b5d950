#include "seedkeeper/control/rate_control_service.hpp"
#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/utils.hpp"

namespace seedkeeper::control {

using core::utils::StringUtils;

const char* to_string(ControllerMode mode) {
    switch (mode) {
        case ControllerMode::STOPPED: return "stopped";
        case ControllerMode::RUNNING: return "running";
    }
    return "stopped";
}

const char* to_string(TickOutcome outcome) {
    switch (outcome) {
        case TickOutcome::STOPPED: return "stopped";
        case TickOutcome::APPLIED: return "applied";
        case TickOutcome::HELD: return "held";
        case TickOutcome::SAMPLE_FAILED: return "sample_failed";
        case TickOutcome::APPLY_FAILED: return "apply_failed";
    }
    return "stopped";
}

RateControlService::RateControlService(std::shared_ptr<client::ClientSession> session,
                                       std::shared_ptr<storage::StateStore> store,
                                       std::shared_ptr<ProcessVariableSource> source,
                                       std::shared_ptr<scheduler::EventChannel> events,
                                       std::shared_ptr<core::SettingsProvider> settings)
    : session_(std::move(session))
    , store_(std::move(store))
    , source_(std::move(source))
    , events_(std::move(events))
    , settings_(std::move(settings))
    , active_settings_(settings_->current())
    , settings_generation_(settings_->generation())
    , controller_(*active_settings_) {
    publish_status();
}

void RateControlService::start() {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    if (mode_ == ControllerMode::RUNNING) {
        return;
    }
    
    apply_settings_if_changed();
    
    auto persisted = store_->load_controller_state();
    if (persisted) {
        controller_.restore(*persisted);
        LOG_INFO("Rate controller resumed: limit {}, integral {:.3f}",
                 StringUtils::format_speed(static_cast<double>(persisted->limit_bytes_per_sec)),
                 persisted->integral_term);
    } else {
        auto initial = storage::ControllerState::initial(active_settings_->max_upload_speed);
        controller_.restore(initial);
        persist();
        LOG_INFO("Rate controller starting from defaults, limit {}",
                 StringUtils::format_speed(static_cast<double>(initial.limit_bytes_per_sec)));
    }
    
    consecutive_failures_ = 0;
    mode_ = ControllerMode::RUNNING;
    publish_status();
}

void RateControlService::stop() {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    if (mode_ == ControllerMode::STOPPED) {
        return;
    }
    
    mode_ = ControllerMode::STOPPED;
    persist();
    LOG_INFO("Rate controller stopped, limit left at {}",
             StringUtils::format_speed(static_cast<double>(controller_.applied_limit())));
    publish_status();
}

TickOutcome RateControlService::tick() {
    return tick(Clock::now());
}

TickOutcome RateControlService::tick(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    if (mode_ != ControllerMode::RUNNING) {
        return TickOutcome::STOPPED;
    }
    
    apply_settings_if_changed();
    auto checkpoint = controller_.state();
    
    auto sample = source_->sample();
    auto limit = controller_.tick(now, sample);
    if (!limit) {
        controller_.restore(checkpoint);
        record_failure("process variable read");
        publish_status();
        return TickOutcome::SAMPLE_FAILED;
    }
    
    ticks_++;
    last_sample_ = *sample;
    last_computed_limit_ = *limit;
    
    auto outcome = TickOutcome::HELD;
    if (controller_.should_apply(*limit, now)) {
        auto result = session_->set_upload_limit(*limit);
        if (!result) {
            controller_.restore(checkpoint);
            record_failure("upload limit apply");
            publish_status();
            return TickOutcome::APPLY_FAILED;
        }
        controller_.mark_applied(*limit, now);
        outcome = TickOutcome::APPLIED;
        LOG_DEBUG("Upload limit set to {} (sample {:.1f}, estimate {:.1f})",
                  StringUtils::format_speed(static_cast<double>(*limit)),
                  *sample, controller_.estimate());
    }
    
    if (consecutive_failures_ >= static_cast<uint32_t>(active_settings_->failure_threshold)) {
        events_->publish(scheduler::EventSeverity::INFO, "rate_control",
                         "Rate control recovered after " + std::to_string(consecutive_failures_) +
                         " failed ticks");
    }
    consecutive_failures_ = 0;
    
    persist();
    publish_status();
    return outcome;
}

void RateControlService::record_failure(const char* what) {
    consecutive_failures_++;
    LOG_WARN("Rate control tick abandoned: {} failed ({} consecutive)", what, consecutive_failures_);
    
    auto threshold = static_cast<uint32_t>(active_settings_->failure_threshold);
    if (threshold > 0 && consecutive_failures_ % threshold == 0) {
        auto login = session_->reauthenticate();
        std::string message = std::to_string(consecutive_failures_) +
            " consecutive rate control failures (" + what + "), re-login " +
            (login ? "succeeded" : "failed: " + login.message);
        LOG_ERROR("{}", message);
        events_->publish(scheduler::EventSeverity::WARNING, "rate_control", std::move(message));
    }
}

void RateControlService::persist() {
    auto result = store_->save_controller_state(controller_.state());
    if (!result) {
        LOG_DEBUG("Controller state kept in memory only: {}", result.message);
    }
}

void RateControlService::apply_settings_if_changed() {
    auto generation = settings_->generation();
    if (generation == settings_generation_) {
        return;
    }
    active_settings_ = settings_->current();
    settings_generation_ = generation;
    controller_.configure(*active_settings_);
    LOG_INFO("Rate controller picked up settings generation {}", generation);
}

ControllerMode RateControlService::mode() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_.mode;
}

ControllerStatus RateControlService::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

void RateControlService::publish_status() {
    ControllerStatus status;
    status.mode = mode_;
    status.applied_limit = controller_.applied_limit();
    status.last_computed_limit = last_computed_limit_;
    status.estimate = controller_.estimate();
    status.covariance = controller_.covariance();
    status.integral = controller_.integral();
    status.last_sample = last_sample_;
    status.consecutive_failures = consecutive_failures_;
    status.ticks = ticks_;
    
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_ = status;
}

} // namespace seedkeeper::control
