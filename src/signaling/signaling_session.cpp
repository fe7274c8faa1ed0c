#include "cvdr/signaling/signaling_session.hpp"

#include "cvdr/signaling/envelope.hpp"
#include "cvdr/signaling/poll_schedule.hpp"

#include <spdlog/spdlog.h>

namespace cvdr::signaling {

SignalingSession::SignalingSession(std::shared_ptr<SignalingTransport> transport, SignalingOptions options)
    : transport_(std::move(transport)),
      options_(options),
      send_(std::make_shared<MessageChannel>(options.send_capacity)),
      receive_(std::make_shared<MessageChannel>(options.receive_capacity)),
      stop_(std::make_shared<CancellationToken>()) {
    inbound_ = std::thread([this]() { run_inbound(); });
    outbound_ = std::thread([this]() { run_outbound(); });
}

SignalingSession::~SignalingSession() {
    send_->close();
    stop_->cancel();
    receive_->close();
    join();
}

void SignalingSession::join() {
    if (inbound_.joinable()) {
        inbound_.join();
    }
    if (outbound_.joinable()) {
        outbound_.join();
    }
}

void SignalingSession::run_inbound() {
    std::size_t cursor = 0;
    int consecutive_errors = 0;
    PollSchedule schedule(options_.min_poll_interval, options_.max_poll_interval);

    for (;;) {
        inbound_state_ = LoopState::Polling;
        std::size_t received = 0;

        auto polled = transport_->list_messages_since(cursor);
        if (polled.is_error()) {
            spdlog::warn("Error polling messages: {}", polled.error().to_string());
            if (++consecutive_errors >= options_.max_consecutive_errors) {
                spdlog::error("Reached maximum number of consecutive polling errors, exiting");
                break;
            }
        } else {
            consecutive_errors = 0;
            received = polled.value().size();

            inbound_state_ = LoopState::Draining;
            for (const auto& raw : polled.value()) {
                auto envelope = decode_envelope(raw);
                if (envelope.is_error()) {
                    spdlog::warn("Dropping malformed signaling message: {}", envelope.error().message);
                    continue;
                }
                if (const auto* unrecognized = std::get_if<UnrecognizedMessage>(&envelope.value())) {
                    spdlog::warn("Unexpected message type: {}", unrecognized->message_type);
                    continue;
                }
                if (!receive_->send(std::get<DeviceMessage>(envelope.value()).payload)) {
                    spdlog::debug("Receive channel closed by consumer, stopping polling");
                    inbound_state_ = LoopState::Closed;
                    return;
                }
                ++cursor;
            }
        }

        inbound_state_ = LoopState::Polling;
        if (stop_->wait_for(schedule.record(received))) {
            break;
        }
    }

    receive_->close();
    inbound_state_ = LoopState::Closed;
}

void SignalingSession::run_outbound() {
    while (auto message = send_->receive()) {
        outbound_state_ = LoopState::Draining;
        const auto forward = encode_forward(*message);

        int attempt = 0;
        for (; attempt < options_.max_consecutive_errors; ++attempt) {
            auto sent = transport_->forward_message(forward);
            if (sent.is_ok()) {
                break;
            }
            spdlog::warn("Error sending message to device: {}", sent.error().to_string());
        }
        if (attempt == options_.max_consecutive_errors) {
            spdlog::error("Reached maximum number of sending errors, exiting");
            send_->close();
            break;
        }
        outbound_state_ = LoopState::Polling;
    }

    stop_->cancel();
    outbound_state_ = LoopState::Closed;
}

std::unique_ptr<SignalingSession> open_signaling_session(std::shared_ptr<SignalingTransport> transport,
                                                         SignalingOptions options) {
    return std::make_unique<SignalingSession>(std::move(transport), options);
}

} // namespace cvdr::signaling
