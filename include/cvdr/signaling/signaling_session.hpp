#pragma once

#include "cvdr/core/cancellation.hpp"
#include "cvdr/core/channel.hpp"
#include "cvdr/signaling/signaling_transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>

namespace cvdr::signaling {

using MessageChannel = Channel<nlohmann::json>;

struct SignalingOptions {
    std::chrono::milliseconds min_poll_interval{100};
    std::chrono::milliseconds max_poll_interval{2000};
    int max_consecutive_errors = 10;
    std::size_t receive_capacity = 64;
    std::size_t send_capacity = 16;
};

/**
 * Polling: waiting for work (a tick or an outbound message)
 * Draining: handing a fetched batch to the consumer, or forwarding a message
 * Closed: loop finished, its channel closed
 */
enum class LoopState {
    Polling,
    Draining,
    Closed
};

/**
 * @brief Bidirectional signaling channels over a polling-only transport
 *
 * Two threads start on construction:
 * - inbound: polls list_messages_since(cursor), pushes device message
 *   payloads onto the receive channel in server order and advances the
 *   cursor by the number delivered. Unrecognized envelopes are dropped.
 *   After max_consecutive_errors failed polls in a row it closes the receive
 *   channel and stops. Between polls it waits for the next tick or the stop
 *   signal; stop closes the receive channel.
 * - outbound: forwards every payload taken from the send channel, retrying a
 *   failing one up to max_consecutive_errors times. When the caller closes
 *   the send channel, or retries are exhausted, it fires the stop signal.
 *
 * The error counters of the two loops are independent.
 *
 * The destructor closes the send channel, fires stop, closes the receive
 * channel and joins both threads.
 */
class SignalingSession {
public:
    SignalingSession(std::shared_ptr<SignalingTransport> transport, SignalingOptions options = {});
    ~SignalingSession();

    SignalingSession(const SignalingSession&) = delete;
    SignalingSession& operator=(const SignalingSession&) = delete;

    /// Caller writes outbound payloads here and closes it to end the session
    const std::shared_ptr<MessageChannel>& send_channel() const noexcept { return send_; }

    /// Inbound device payloads; closed when the session ends
    const std::shared_ptr<MessageChannel>& receive_channel() const noexcept { return receive_; }

    const CancellationToken& stop_signal() const noexcept { return *stop_; }

    LoopState inbound_state() const noexcept { return inbound_state_.load(); }
    LoopState outbound_state() const noexcept { return outbound_state_.load(); }

    /// Waits for both loops to finish
    void join();

private:
    void run_inbound();
    void run_outbound();

    std::shared_ptr<SignalingTransport> transport_;
    SignalingOptions options_;

    std::shared_ptr<MessageChannel> send_;
    std::shared_ptr<MessageChannel> receive_;
    std::shared_ptr<CancellationToken> stop_;

    std::atomic<LoopState> inbound_state_{LoopState::Polling};
    std::atomic<LoopState> outbound_state_{LoopState::Polling};

    std::thread inbound_;
    std::thread outbound_;
};

/// Opens a session: the returned object owns both loop threads
std::unique_ptr<SignalingSession> open_signaling_session(std::shared_ptr<SignalingTransport> transport,
                                                         SignalingOptions options = {});

} // namespace cvdr::signaling
