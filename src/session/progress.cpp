#include "fullsync/session/progress.hpp"

namespace fullsync::session {

ProgressEstimator::ProgressEstimator(std::size_t window_samples)
    : alpha_(2.0 / (static_cast<double>(window_samples == 0 ? 1 : window_samples) + 1.0)) {}

void ProgressEstimator::reset(std::uint64_t units_done, Clock::time_point now) {
    speed_.reset();
    last_time_ = now;
    last_units_ = units_done;
}

void ProgressEstimator::sample(std::uint64_t units_done, Clock::time_point now) {
    if (!last_time_) {
        reset(units_done, now);
        return;
    }

    const double seconds = std::chrono::duration<double>(now - *last_time_).count();
    if (seconds <= 0.0) {
        return;
    }
    const double delta = units_done >= last_units_ ? static_cast<double>(units_done - last_units_) : 0.0;
    const double rate = delta / seconds;

    speed_ = speed_ ? alpha_ * rate + (1.0 - alpha_) * *speed_ : rate;
    last_time_ = now;
    last_units_ = units_done;
}

std::optional<ProgressEstimator::Clock::time_point>
ProgressEstimator::estimate_completion(std::uint64_t units_done,
                                       std::uint64_t units_total,
                                       Clock::time_point now) const {
    if (units_total == 0) {
        return std::nullopt;
    }
    if (units_done >= units_total) {
        return now;
    }
    if (!speed_ || *speed_ <= 0.0) {
        return std::nullopt;
    }
    const double remaining = static_cast<double>(units_total - units_done) / *speed_;
    return now + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(remaining));
}

} // namespace fullsync::session
