#include "cvdr/signaling/poll_schedule.hpp"

#include <algorithm>

namespace cvdr::signaling {

PollSchedule::PollSchedule(std::chrono::milliseconds min_interval, std::chrono::milliseconds max_interval)
    : min_(min_interval), max_(std::max(min_interval, max_interval)), interval_(min_interval) {
}

std::chrono::milliseconds PollSchedule::record(std::size_t message_count) {
    if (message_count > 0) {
        interval_ = min_;
    } else {
        interval_ = std::min(interval_ * 2, max_);
    }
    return interval_;
}

} // namespace cvdr::signaling
