#include "cvdr/signaling/envelope.hpp"

namespace cvdr::signaling {

Result<InboundEnvelope> decode_envelope(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return Err<InboundEnvelope>(Error(ErrorKind::Decode, "signaling message is not an object"));
    }
    const auto type = raw.find("message_type");
    if (type == raw.end() || !type->is_string()) {
        return Err<InboundEnvelope>(Error(ErrorKind::Decode, "signaling message has no message_type"));
    }

    auto message_type = type->get<std::string>();
    if (message_type != kDeviceMessageType) {
        return Ok(InboundEnvelope{UnrecognizedMessage{std::move(message_type)}});
    }

    const auto payload = raw.find("payload");
    if (payload == raw.end() || !payload->is_object()) {
        return Err<InboundEnvelope>(Error(ErrorKind::Decode, "device message has no object payload"));
    }
    return Ok(InboundEnvelope{DeviceMessage{*payload}});
}

nlohmann::json encode_forward(const nlohmann::json& payload) {
    return nlohmann::json{{"payload", payload}};
}

} // namespace cvdr::signaling
