/**
 * @file channel.hpp
 * @brief Bounded, closeable FIFO used to hand work and messages between threads
 *
 * The uploader's job queue and result stream, and both directions of the
 * signaling bridge, are Channels. A closed channel refuses new items but still
 * yields the ones already queued, so consumers drain before seeing the end.
 *
 * EXAMPLE:
 * Channel<int> ch(4);
 * ch.send(1);            // Producer (blocks while full)
 * ch.close();
 * auto v = ch.receive(); // 1, then std::nullopt
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace cvdr {

/**
 * @brief Multi-producer / multi-consumer bounded channel
 *
 * THREAD SAFETY:
 * - Any number of threads may send, receive and close concurrently
 * - close() wakes every blocked sender and receiver
 */
template<typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity = 1) : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueue an item, waiting for room
     *
     * RETURNS: false if the channel was closed before the item was accepted
     * BLOCKS: Yes, while the channel is full
     */
    bool send(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return queue_.size() < capacity_ || closed_;
            });
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Dequeue the next item
     *
     * RETURNS: Item, or nullopt once the channel is closed and drained
     * BLOCKS: Yes, until an item arrives or the channel closes
     */
    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });
        return take_locked(lock);
    }

    /**
     * @brief Dequeue with a deadline
     *
     * RETURNS: Item if one arrived within timeout. nullopt on timeout or when
     * closed and drained; use is_closed() to tell the two apart.
     */
    template<typename Rep, typename Period>
    std::optional<T> receive_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || closed_;
        })) {
            return std::nullopt;
        }
        return take_locked(lock);
    }

    std::optional<T> try_receive() {
        std::unique_lock lock(mutex_);
        return take_locked(lock);
    }

    /**
     * @brief Refuse further sends and wake every waiter
     *
     * Idempotent. Items already queued remain receivable.
     */
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::optional<T> take_locked(std::unique_lock<std::mutex>& lock) {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const std::size_t capacity_;
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool closed_ = false;
};

} // namespace cvdr
