#pragma once

#include <optional>

namespace seedkeeper::control {

// Scalar Kalman filter smoothing the raw process-variable samples.
class KalmanFilter {
public:
    static constexpr double DEFAULT_COVARIANCE = 1000.0;
    
    KalmanFilter(double process_noise, double measurement_noise);
    
    // Predict then correct. A non-finite measurement leaves the state untouched.
    double update(double measurement);
    double update(std::optional<double> measurement);
    
    double estimate() const { return estimate_; }
    double covariance() const { return covariance_; }
    
    void restore(double estimate, double covariance);
    void reset();
    void set_noise(double process_noise, double measurement_noise);
    
    double process_noise() const { return q_; }
    double measurement_noise() const { return r_; }

private:
    double q_;
    double r_;
    double estimate_ = 0.0;
    double covariance_ = DEFAULT_COVARIANCE;
};

} // namespace seedkeeper::control
