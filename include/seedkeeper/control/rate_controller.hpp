#pragma once

#include "kalman_filter.hpp"
#include "pid_controller.hpp"
#include "seedkeeper/core/settings.hpp"
#include "seedkeeper/storage/controller_state.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

namespace seedkeeper::control {

// Control law only: filter the process variable, run the PID and decide
// whether the result is worth applying. No I/O happens here; the caller
// snapshots state() before a tick and restores it when the tick fails.
//
// The PID works in process-variable units (KiB/s); limits are converted to
// bytes/s on the way out.
class RateController {
public:
    using Clock = std::chrono::system_clock;
    
    explicit RateController(const core::Settings& settings);
    
    void configure(const core::Settings& settings);
    void restore(const storage::ControllerState& state);
    storage::ControllerState state() const;
    
    // Returns the computed limit in bytes/s, or nothing when the sample is
    // missing or not finite (state left untouched).
    std::optional<uint64_t> tick(Clock::time_point now, std::optional<double> process_variable);
    
    bool should_apply(uint64_t limit, Clock::time_point now) const;
    void mark_applied(uint64_t limit, Clock::time_point now);
    
    uint64_t applied_limit() const { return applied_limit_; }
    bool applied_since_start() const { return last_applied_at_.has_value(); }
    double estimate() const { return filter_.estimate(); }
    double covariance() const { return filter_.covariance(); }
    double integral() const { return pid_.integral(); }
    std::optional<Clock::time_point> last_tick_at() const { return last_tick_at_; }

private:
    KalmanFilter filter_;
    PidController pid_;
    double target_;
    std::chrono::milliseconds max_tick_gap_;
    uint64_t min_limit_delta_;
    std::chrono::milliseconds min_reapply_interval_;
    
    uint64_t applied_limit_;
    std::optional<Clock::time_point> last_tick_at_;
    std::optional<Clock::time_point> last_applied_at_;
};

} // namespace seedkeeper::control
