#include "cvdr/core/cancellation.hpp"

namespace cvdr {

void CancellationToken::cancel() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard lock(mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        callbacks.swap(callbacks_);
    }
    cv_.notify_all();
    for (auto& callback : callbacks) {
        callback();
    }
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard lock(mutex_);
    return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
}

void CancellationToken::wait() const {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]() { return cancelled_; });
}

void CancellationToken::on_cancel(std::function<void()> callback) {
    {
        std::lock_guard lock(mutex_);
        if (!cancelled_) {
            callbacks_.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

} // namespace cvdr
