#include "seedkeeper/control/pid_controller.hpp"
#include <algorithm>

namespace seedkeeper::control {

PidController::PidController(PidGains gains, double output_min, double output_max)
    : gains_(gains), min_(output_min), max_(output_max) {
}

double PidController::compute(double error, std::optional<double> dt_seconds) {
    double candidate_integral = integral_;
    double derivative = 0.0;
    
    if (dt_seconds && *dt_seconds > 0.0) {
        candidate_integral += error * *dt_seconds;
        derivative = (error - previous_error_) / *dt_seconds;
    }
    
    double unclamped = gains_.kp * error + gains_.ki * candidate_integral + gains_.kd * derivative;
    last_unclamped_ = unclamped;
    saturated_ = unclamped > max_ || unclamped < min_;
    
    if (!saturated_) {
        integral_ = candidate_integral;
    }
    previous_error_ = error;
    
    return std::clamp(unclamped, min_, max_);
}

void PidController::restore(double integral, double previous_error) {
    integral_ = integral;
    previous_error_ = previous_error;
}

void PidController::reset() {
    integral_ = 0.0;
    previous_error_ = 0.0;
    saturated_ = false;
    last_unclamped_ = 0.0;
}

void PidController::set_limits(double output_min, double output_max) {
    min_ = output_min;
    max_ = output_max;
}

} // namespace seedkeeper::control
