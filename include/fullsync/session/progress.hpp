#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace fullsync::session {

/**
 * @brief Speed and ETA from a stream of cumulative progress samples
 *
 * Speed is an exponentially weighted moving average of the rate between
 * consecutive samples, alpha = 2 / (window + 1). Samples closer together
 * than the clock resolution are folded into the next one.
 */
class ProgressEstimator {
public:
    using Clock = std::chrono::system_clock;

    explicit ProgressEstimator(std::size_t window_samples = 10);

    void reset(std::uint64_t units_done, Clock::time_point now);
    void sample(std::uint64_t units_done, Clock::time_point now);

    /// Units per second; 0 until two samples have been seen.
    [[nodiscard]] double speed() const noexcept { return speed_.value_or(0.0); }

    /// nullopt while speed is zero or unknown.
    [[nodiscard]] std::optional<Clock::time_point> estimate_completion(std::uint64_t units_done,
                                                                       std::uint64_t units_total,
                                                                       Clock::time_point now) const;

private:
    double alpha_;
    std::optional<double> speed_;
    std::optional<Clock::time_point> last_time_;
    std::uint64_t last_units_ = 0;
};

} // namespace fullsync::session
