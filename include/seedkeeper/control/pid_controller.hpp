#pragma once

#include <optional>

namespace seedkeeper::control {

struct PidGains {
    double kp = 0.6;
    double ki = 0.15;
    double kd = 0.08;
};

// Positional PID with output clamping and conditional integration: the
// integral is only committed when the unclamped output stays inside the
// bounds.
class PidController {
public:
    PidController(PidGains gains, double output_min, double output_max);
    
    // dt_seconds empty means "no usable previous sample": the tick neither
    // integrates nor differentiates, but the stored integral still counts.
    double compute(double error, std::optional<double> dt_seconds);
    
    double integral() const { return integral_; }
    double previous_error() const { return previous_error_; }
    bool saturated() const { return saturated_; }
    double last_unclamped() const { return last_unclamped_; }
    
    void restore(double integral, double previous_error);
    void reset();
    
    void set_gains(const PidGains& gains) { gains_ = gains; }
    void set_limits(double output_min, double output_max);
    const PidGains& gains() const { return gains_; }
    double output_min() const { return min_; }
    double output_max() const { return max_; }

private:
    PidGains gains_;
    double min_;
    double max_;
    double integral_ = 0.0;
    double previous_error_ = 0.0;
    bool saturated_ = false;
    double last_unclamped_ = 0.0;
};

} // namespace seedkeeper::control
