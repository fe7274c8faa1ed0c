#pragma once

#include "cvdr/core/result.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace cvdr::signaling {

inline constexpr const char* kDeviceMessageType = "device_msg";

/// A message from the device, relayed to the signaling consumer
struct DeviceMessage {
    nlohmann::json payload;
};

/// A well-formed envelope of a type this client does not relay
struct UnrecognizedMessage {
    std::string message_type;
};

using InboundEnvelope = std::variant<DeviceMessage, UnrecognizedMessage>;

/**
 * @brief Decode {"message_type": string, "payload": object}
 *
 * A missing or non-string message_type, or a device_msg without an object
 * payload, is a Decode error.
 */
Result<InboundEnvelope> decode_envelope(const nlohmann::json& raw);

/// {"payload": payload}
nlohmann::json encode_forward(const nlohmann::json& payload);

} // namespace cvdr::signaling
