#include <gtest/gtest.h>
#include "seedkeeper/control/kalman_filter.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using namespace seedkeeper::control;

TEST(KalmanFilterTest, StartsNeutral) {
    KalmanFilter filter(0.1, 0.5);
    EXPECT_DOUBLE_EQ(filter.estimate(), 0.0);
    EXPECT_DOUBLE_EQ(filter.covariance(), KalmanFilter::DEFAULT_COVARIANCE);
}

TEST(KalmanFilterTest, FirstSampleDominatesUncertainPrior) {
    KalmanFilter filter(0.1, 0.5);
    
    double estimate = filter.update(100.0);
    
    double predicted = 1000.0 + 0.1;
    double gain = predicted / (predicted + 0.5);
    EXPECT_NEAR(estimate, gain * 100.0, 1e-9);
    EXPECT_NEAR(filter.covariance(), predicted * (1.0 - gain), 1e-9);
    EXPECT_LT(filter.covariance(), 1.0);
}

TEST(KalmanFilterTest, ConvergesToConstantSignal) {
    KalmanFilter filter(0.1, 0.5);
    
    for (int i = 0; i < 200; ++i) {
        filter.update(2048.0);
    }
    
    EXPECT_NEAR(filter.estimate(), 2048.0, 1e-6);
}

TEST(KalmanFilterTest, SmoothsNoise) {
    KalmanFilter filter(0.01, 4.0);
    filter.restore(500.0, 1.0);
    
    double worst = 0.0;
    for (int i = 0; i < 100; ++i) {
        double noisy = 500.0 + (i % 2 == 0 ? 40.0 : -40.0);
        worst = std::max(worst, std::abs(filter.update(noisy) - 500.0));
    }
    
    EXPECT_LT(worst, 40.0);
}

TEST(KalmanFilterTest, MissingSampleLeavesStateUntouched) {
    KalmanFilter filter(0.1, 0.5);
    filter.update(300.0);
    auto estimate = filter.estimate();
    auto covariance = filter.covariance();
    
    filter.update(std::optional<double>());
    filter.update(std::numeric_limits<double>::quiet_NaN());
    filter.update(std::numeric_limits<double>::infinity());
    
    EXPECT_DOUBLE_EQ(filter.estimate(), estimate);
    EXPECT_DOUBLE_EQ(filter.covariance(), covariance);
}

TEST(KalmanFilterTest, ZeroNoiseTrustsMeasurement) {
    KalmanFilter filter(0.0, 0.0);
    filter.restore(10.0, 0.0);
    
    EXPECT_DOUBLE_EQ(filter.update(42.0), 42.0);
    EXPECT_FALSE(std::isnan(filter.covariance()));
}

TEST(KalmanFilterTest, RestoreAndReset) {
    KalmanFilter filter(0.1, 0.5);
    filter.restore(750.0, 2.5);
    EXPECT_DOUBLE_EQ(filter.estimate(), 750.0);
    EXPECT_DOUBLE_EQ(filter.covariance(), 2.5);
    
    filter.restore(std::numeric_limits<double>::quiet_NaN(), -1.0);
    EXPECT_DOUBLE_EQ(filter.estimate(), 0.0);
    EXPECT_DOUBLE_EQ(filter.covariance(), KalmanFilter::DEFAULT_COVARIANCE);
    
    filter.update(5.0);
    filter.reset();
    EXPECT_DOUBLE_EQ(filter.estimate(), 0.0);
    EXPECT_DOUBLE_EQ(filter.covariance(), KalmanFilter::DEFAULT_COVARIANCE);
}
