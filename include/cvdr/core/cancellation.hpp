#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace cvdr {

/**
 * @brief One-shot cancellation signal shared between cooperating threads
 *
 * Serves as the uploader's cancellation context and as the signaling bridge's
 * stop signal. cancel() is idempotent; callbacks registered with on_cancel()
 * run exactly once, on the cancelling thread (or immediately when registered
 * after cancellation).
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    [[nodiscard]] bool is_cancelled() const;

    /**
     * @brief Sleep for up to timeout, waking early on cancellation
     *
     * RETURNS: true if the token is cancelled
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

    /// Blocks until cancelled
    void wait() const;

    void on_cancel(std::function<void()> callback);

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
    std::vector<std::function<void()>> callbacks_;
};

} // namespace cvdr
