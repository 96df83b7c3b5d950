#include "seedkeeper/control/rate_controller.hpp"
#include <cmath>

namespace seedkeeper::control {

namespace {

constexpr double BYTES_PER_KIB = 1024.0;

double to_kib(uint64_t bytes_per_second) {
    return static_cast<double>(bytes_per_second) / BYTES_PER_KIB;
}

} // namespace

RateController::RateController(const core::Settings& settings)
    : filter_(settings.kalman_q, settings.kalman_r)
    , pid_(PidGains{settings.pid_kp, settings.pid_ki, settings.pid_kd},
           to_kib(settings.min_upload_speed), to_kib(settings.max_upload_speed))
    , target_(settings.target_buffer_size)
    , max_tick_gap_(settings.max_tick_gap)
    , min_limit_delta_(settings.min_limit_delta)
    , min_reapply_interval_(settings.min_reapply_interval)
    , applied_limit_(settings.max_upload_speed) {
}

void RateController::configure(const core::Settings& settings) {
    filter_.set_noise(settings.kalman_q, settings.kalman_r);
    pid_.set_gains(PidGains{settings.pid_kp, settings.pid_ki, settings.pid_kd});
    pid_.set_limits(to_kib(settings.min_upload_speed), to_kib(settings.max_upload_speed));
    target_ = settings.target_buffer_size;
    max_tick_gap_ = settings.max_tick_gap;
    min_limit_delta_ = settings.min_limit_delta;
    min_reapply_interval_ = settings.min_reapply_interval;
}

void RateController::restore(const storage::ControllerState& state) {
    filter_.restore(state.kalman_estimate, state.kalman_covariance);
    pid_.restore(state.integral_term, state.previous_error);
    applied_limit_ = state.limit_bytes_per_sec;
    last_tick_at_ = state.last_tick_at;
}

storage::ControllerState RateController::state() const {
    storage::ControllerState state;
    state.limit_bytes_per_sec = applied_limit_;
    state.integral_term = pid_.integral();
    state.previous_error = pid_.previous_error();
    state.kalman_estimate = filter_.estimate();
    state.kalman_covariance = filter_.covariance();
    state.last_tick_at = last_tick_at_;
    return state;
}

std::optional<uint64_t> RateController::tick(Clock::time_point now,
                                             std::optional<double> process_variable) {
    if (!process_variable || !std::isfinite(*process_variable)) {
        return std::nullopt;
    }
    
    double filtered = filter_.update(*process_variable);
    double error = target_ - filtered;
    
    std::optional<double> dt_seconds;
    if (last_tick_at_ && now > *last_tick_at_) {
        auto gap = now - *last_tick_at_;
        if (gap <= max_tick_gap_) {
            dt_seconds = std::chrono::duration<double>(gap).count();
        }
    }
    
    double output_kib = pid_.compute(error, dt_seconds);
    last_tick_at_ = now;
    
    return static_cast<uint64_t>(std::llround(output_kib * BYTES_PER_KIB));
}

bool RateController::should_apply(uint64_t limit, Clock::time_point now) const {
    if (!last_applied_at_) {
        return true;
    }
    
    uint64_t delta = limit > applied_limit_ ? limit - applied_limit_ : applied_limit_ - limit;
    if (delta > min_limit_delta_) {
        return true;
    }
    return now - *last_applied_at_ >= min_reapply_interval_;
}

void RateController::mark_applied(uint64_t limit, Clock::time_point now) {
    applied_limit_ = limit;
    last_applied_at_ = now;
}

} // namespace seedkeeper::control
