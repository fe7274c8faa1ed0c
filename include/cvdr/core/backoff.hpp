#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <random>

namespace cvdr {

/**
 * @brief Immutable parameters for exponential retry delays
 *
 * Shared read-only by every upload worker; each worker derives its own
 * ExponentialBackoff state from it.
 */
struct BackoffPolicy {
    std::chrono::milliseconds initial_interval{500};
    double multiplier = 1.5;
    double randomization_factor = 0.5;
    std::chrono::milliseconds max_interval{60000};
    std::chrono::milliseconds max_elapsed_time{120000};  ///< 0 disables the budget

    static BackoffPolicy chunk_upload_default() { return BackoffPolicy{}; }
};

class ExponentialBackoff {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    explicit ExponentialBackoff(const BackoffPolicy& policy, ClockFn clock = &Clock::now);

    /**
     * @brief Delay to wait before the next attempt
     *
     * RETURNS: randomized delay, or nullopt when the elapsed-time budget
     * would be exceeded by waiting it
     */
    std::optional<std::chrono::milliseconds> next_backoff();

    /// Restart the interval and the elapsed-time budget
    void reset();

    [[nodiscard]] std::chrono::milliseconds current_interval() const noexcept { return current_interval_; }
    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    void increment_interval();

    BackoffPolicy policy_;
    ClockFn clock_;
    std::chrono::milliseconds current_interval_;
    Clock::time_point start_;
    std::mt19937_64 rng_;
};

} // namespace cvdr
