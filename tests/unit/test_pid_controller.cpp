#include <gtest/gtest.h>
#include "seedkeeper/control/pid_controller.hpp"

using namespace seedkeeper::control;

class PidControllerTest : public ::testing::Test {
protected:
    PidController make(double kp, double ki, double kd, double min = 0.0, double max = 100.0) {
        return PidController(PidGains{kp, ki, kd}, min, max);
    }
};

TEST_F(PidControllerTest, ProportionalOnly) {
    auto pid = make(1.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(pid.compute(50.0, 1.0), 50.0);
    EXPECT_DOUBLE_EQ(pid.compute(20.0, 1.0), 20.0);
}

TEST_F(PidControllerTest, OutputAlwaysWithinBounds) {
    auto pid = make(2.0, 0.5, 0.3, 10.0, 90.0);
    
    double errors[] = {1e6, -1e6, 0.0, 45.0, -3.0, 1e-9, 500.0};
    for (double error : errors) {
        double output = pid.compute(error, 1.0);
        EXPECT_GE(output, 10.0);
        EXPECT_LE(output, 90.0);
    }
}

TEST_F(PidControllerTest, IntegratesOverElapsedTime) {
    auto pid = make(0.0, 1.0, 0.0);
    
    pid.compute(10.0, 2.0);
    EXPECT_DOUBLE_EQ(pid.integral(), 20.0);
    
    EXPECT_DOUBLE_EQ(pid.compute(10.0, 0.5), 25.0);
}

TEST_F(PidControllerTest, DerivativeUsesPreviousError) {
    auto pid = make(0.0, 0.0, 1.0);
    
    pid.compute(0.0, 1.0);
    EXPECT_DOUBLE_EQ(pid.compute(10.0, 2.0), 5.0);
    EXPECT_DOUBLE_EQ(pid.previous_error(), 10.0);
}

TEST_F(PidControllerTest, AntiWindupHoldsIntegralWhileSaturated) {
    auto pid = make(1.0, 1.0, 0.0);
    
    for (int i = 0; i < 50; ++i) {
        EXPECT_DOUBLE_EQ(pid.compute(200.0, 1.0), 100.0);
        EXPECT_TRUE(pid.saturated());
    }
    EXPECT_DOUBLE_EQ(pid.integral(), 0.0);
    
    // No accumulated backlog: the output follows the error immediately.
    EXPECT_DOUBLE_EQ(pid.compute(10.0, 1.0), 20.0);
    EXPECT_FALSE(pid.saturated());
    EXPECT_DOUBLE_EQ(pid.integral(), 10.0);
}

TEST_F(PidControllerTest, AntiWindupAtLowerBound) {
    auto pid = make(1.0, 1.0, 0.0, 0.0, 100.0);
    
    pid.compute(-40.0, 1.0);
    EXPECT_TRUE(pid.saturated());
    EXPECT_DOUBLE_EQ(pid.integral(), 0.0);
}

TEST_F(PidControllerTest, NoElapsedTimeKeepsIntegralContribution) {
    auto pid = make(1.0, 1.0, 1.0);
    pid.restore(30.0, 80.0);
    
    // Neither integrates nor differentiates, but the stored integral counts.
    EXPECT_DOUBLE_EQ(pid.compute(10.0, std::nullopt), 40.0);
    EXPECT_DOUBLE_EQ(pid.integral(), 30.0);
    EXPECT_DOUBLE_EQ(pid.previous_error(), 10.0);
}

TEST_F(PidControllerTest, ResetClearsState) {
    auto pid = make(1.0, 1.0, 0.0);
    pid.compute(10.0, 1.0);
    pid.reset();
    
    EXPECT_DOUBLE_EQ(pid.integral(), 0.0);
    EXPECT_DOUBLE_EQ(pid.previous_error(), 0.0);
    EXPECT_FALSE(pid.saturated());
}

TEST_F(PidControllerTest, LimitsAndGainsCanChange) {
    auto pid = make(1.0, 0.0, 0.0);
    pid.set_limits(0.0, 30.0);
    EXPECT_DOUBLE_EQ(pid.compute(50.0, 1.0), 30.0);
    
    pid.set_gains(PidGains{0.5, 0.0, 0.0});
    pid.set_limits(0.0, 100.0);
    EXPECT_DOUBLE_EQ(pid.compute(50.0, 1.0), 25.0);
}
