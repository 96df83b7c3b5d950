#include "seedkeeper/control/kalman_filter.hpp"
#include <cmath>

namespace seedkeeper::control {

KalmanFilter::KalmanFilter(double process_noise, double measurement_noise)
    : q_(process_noise), r_(measurement_noise) {
}

double KalmanFilter::update(double measurement) {
    if (!std::isfinite(measurement)) {
        return estimate_;
    }
    
    double predicted = covariance_ + q_;
    double denominator = predicted + r_;
    double gain = denominator == 0.0 ? 1.0 : predicted / denominator;
    
    estimate_ += gain * (measurement - estimate_);
    covariance_ = predicted * (1.0 - gain);
    return estimate_;
}

double KalmanFilter::update(std::optional<double> measurement) {
    if (!measurement) {
        return estimate_;
    }
    return update(*measurement);
}

void KalmanFilter::restore(double estimate, double covariance) {
    estimate_ = std::isfinite(estimate) ? estimate : 0.0;
    covariance_ = std::isfinite(covariance) && covariance >= 0.0 ? covariance : DEFAULT_COVARIANCE;
}

void KalmanFilter::reset() {
    estimate_ = 0.0;
    covariance_ = DEFAULT_COVARIANCE;
}

void KalmanFilter::set_noise(double process_noise, double measurement_noise) {
    q_ = process_noise;
    r_ = measurement_noise;
}

} // namespace seedkeeper::control
