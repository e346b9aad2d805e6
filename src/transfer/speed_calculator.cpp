#include "transfer/speed_calculator.hpp"
#include <algorithm>
#include <cmath>

namespace zipline::transfer {

namespace {

double seconds_between(SpeedCalculator::Clock::time_point from, SpeedCalculator::Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace

void SpeedCalculator::record(int64_t transferred, Clock::time_point now) {
    if (!started_) started_ = now;

    // More than 20 MiB within the first 2 s switches to recency-weighted output.
    if (!high_throughput_ && now - *started_ >= std::chrono::seconds(2) &&
        transferred > 20 * 1024 * 1024) {
        high_throughput_ = true;
    }

    auto interval = high_throughput_ ? kMinInterval / 2 : kMinInterval;
    if (last_update_ && now - *last_update_ < interval) return;

    if (last_update_) {
        double dt = seconds_between(*last_update_, now);
        int64_t delta = transferred - last_transferred_;
        if (dt > 0 && delta > 0) {
            double speed = static_cast<double>(delta) / dt;
            smoothed_ = smoothed_ == 0.0 ? speed : kSmoothing * speed + (1.0 - kSmoothing) * smoothed_;
            peak_ = std::max(peak_, speed);
            add_sample(Sample{now, speed, smoothed_});
        }
    }

    last_update_ = now;
    last_transferred_ = transferred;
}

void SpeedCalculator::add_sample(const Sample& sample) {
    samples_.push_back(sample);
    while (samples_.size() > kMaxSamples) samples_.pop_front();
    while (!samples_.empty() && sample.at - samples_.front().at > kWindow) samples_.pop_front();
    if (samples_.size() >= 3) remove_outliers();
}

void SpeedCalculator::remove_outliers() {
    std::size_t n = std::min<std::size_t>(samples_.size(), 5);
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) sum += samples_[i].speed;
    double mean = sum / static_cast<double>(n);
    double threshold = mean * kOutlierFactor;

    samples_.erase(std::remove_if(samples_.begin(), samples_.end(),
                                  [&](const Sample& s) { return std::abs(s.speed - mean) > threshold; }),
                   samples_.end());
}

double SpeedCalculator::current_speed(Clock::time_point now) const {
    if (!started_ || now - *started_ < kWarmup || samples_.empty()) return 0.0;
    if (!high_throughput_) return smoothed_;

    double weighted = 0.0, total = 0.0, weight = 1.0;
    for (const auto& s : samples_) {
        weighted += s.smoothed * weight;
        total += weight;
        weight *= 2.0;
    }
    return total > 0 ? weighted / total : 0.0;
}

double SpeedCalculator::average_speed(Clock::time_point now) const {
    if (!started_ || last_transferred_ == 0) return 0.0;
    double elapsed = seconds_between(*started_, now);
    return elapsed > 0 ? static_cast<double>(last_transferred_) / elapsed : 0.0;
}

double SpeedCalculator::peak_speed() const {
    return peak_;
}

void SpeedCalculator::reset() {
    samples_.clear();
    started_.reset();
    last_update_.reset();
    last_transferred_ = 0;
    smoothed_ = 0.0;
    peak_ = 0.0;
    high_throughput_ = false;
}

} // namespace zipline::transfer
