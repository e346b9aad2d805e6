#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace zipline::transfer {

// Sliding-window transfer speed in bytes per second.
class SpeedCalculator {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t kMaxSamples = 12;
    static constexpr std::chrono::seconds kWindow{5};
    static constexpr std::chrono::milliseconds kMinInterval{100};
    static constexpr std::chrono::milliseconds kWarmup{200};
    static constexpr double kSmoothing = 0.8;
    static constexpr double kOutlierFactor = 2.0;

    // transferred is the running total, not a delta.
    void record(int64_t transferred, Clock::time_point now = Clock::now());

    // 0 until kWarmup has elapsed since the first sample.
    double current_speed(Clock::time_point now = Clock::now()) const;
    double average_speed(Clock::time_point now = Clock::now()) const;
    double peak_speed() const;

    void reset();

private:
    struct Sample {
        Clock::time_point at;
        double speed;
        double smoothed;
    };

    void add_sample(const Sample& sample);
    void remove_outliers();

    std::deque<Sample> samples_;
    std::optional<Clock::time_point> started_;
    std::optional<Clock::time_point> last_update_;
    int64_t last_transferred_ = 0;
    double smoothed_ = 0.0;
    double peak_ = 0.0;
    bool high_throughput_ = false;
};

} // namespace zipline::transfer
