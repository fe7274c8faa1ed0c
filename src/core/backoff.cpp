#include "cvdr/core/backoff.hpp"

#include <algorithm>
#include <utility>

namespace cvdr {

ExponentialBackoff::ExponentialBackoff(const BackoffPolicy& policy, ClockFn clock)
    : policy_(policy),
      clock_(std::move(clock)),
      current_interval_(policy.initial_interval),
      start_(clock_()),
      rng_(std::random_device{}()) {
}

void ExponentialBackoff::reset() {
    current_interval_ = policy_.initial_interval;
    start_ = clock_();
}

std::chrono::milliseconds ExponentialBackoff::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - start_);
}

std::optional<std::chrono::milliseconds> ExponentialBackoff::next_backoff() {
    const auto elapsed_so_far = elapsed();

    const double current = static_cast<double>(current_interval_.count());
    const double delta = policy_.randomization_factor * current;
    const double low = current - delta;
    const double high = current + delta;
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    const auto next = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(low + dist(rng_) * (high - low)));

    increment_interval();

    if (policy_.max_elapsed_time.count() != 0 && elapsed_so_far + next > policy_.max_elapsed_time) {
        return std::nullopt;
    }
    return next;
}

void ExponentialBackoff::increment_interval() {
    const double current = static_cast<double>(current_interval_.count());
    const double max = static_cast<double>(policy_.max_interval.count());
    if (current >= max / policy_.multiplier) {
        current_interval_ = policy_.max_interval;
        return;
    }
    current_interval_ = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(std::min(current * policy_.multiplier, max)));
}

} // namespace cvdr
