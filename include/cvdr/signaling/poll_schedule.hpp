#pragma once

#include <chrono>
#include <cstddef>

namespace cvdr::signaling {

/**
 * @brief Adaptive poll interval
 *
 * Doubles after an empty poll up to max, drops back to min after a poll that
 * returned anything. Always within [min, max].
 */
class PollSchedule {
public:
    PollSchedule(std::chrono::milliseconds min_interval, std::chrono::milliseconds max_interval);

    /// Records the size of the last poll result and returns the next interval
    std::chrono::milliseconds record(std::size_t message_count);

    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    std::chrono::milliseconds min_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds interval_;
};

} // namespace cvdr::signaling
