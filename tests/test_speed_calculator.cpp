#include <gtest/gtest.h>
#include "transfer/speed_calculator.hpp"

using namespace zipline::transfer;
using namespace std::chrono_literals;

class SpeedCalculatorTest : public ::testing::Test {
protected:
    SpeedCalculator calc_;
    SpeedCalculator::Clock::time_point t0_ = SpeedCalculator::Clock::now();
};

TEST_F(SpeedCalculatorTest, ZeroDuringWarmup) {
    calc_.record(0, t0_);
    calc_.record(100000, t0_ + 150ms);
    EXPECT_EQ(calc_.current_speed(t0_ + 150ms), 0.0);
}

TEST_F(SpeedCalculatorTest, SteadyRateIsReported) {
    calc_.record(0, t0_);
    for (int i = 1; i <= 10; ++i) {
        calc_.record(i * 10000, t0_ + i * 100ms);
    }
    // 10000 bytes every 100 ms.
    EXPECT_NEAR(calc_.current_speed(t0_ + 1s), 100000.0, 1.0);
    EXPECT_NEAR(calc_.peak_speed(), 100000.0, 1.0);
    EXPECT_NEAR(calc_.average_speed(t0_ + 1s), 100000.0, 1.0);
}

TEST_F(SpeedCalculatorTest, SamplesCloserThanMinIntervalAreIgnored) {
    calc_.record(0, t0_);
    calc_.record(1000, t0_ + 100ms);
    calc_.record(1000000, t0_ + 150ms);
    EXPECT_NEAR(calc_.peak_speed(), 10000.0, 1.0);
}

TEST_F(SpeedCalculatorTest, SmoothingWeighsNewSamples) {
    calc_.record(0, t0_);
    calc_.record(10000, t0_ + 100ms);   // 100 KB/s
    calc_.record(30000, t0_ + 200ms);   // 200 KB/s
    // 0.8 * 200000 + 0.2 * 100000
    EXPECT_NEAR(calc_.current_speed(t0_ + 250ms), 180000.0, 1.0);
}

TEST_F(SpeedCalculatorTest, ResetClearsState) {
    calc_.record(0, t0_);
    calc_.record(10000, t0_ + 100ms);
    calc_.reset();
    EXPECT_EQ(calc_.peak_speed(), 0.0);
    EXPECT_EQ(calc_.current_speed(t0_ + 1s), 0.0);
    EXPECT_EQ(calc_.average_speed(t0_ + 1s), 0.0);
}
