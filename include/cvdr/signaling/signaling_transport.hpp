#pragma once

#include "cvdr/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <vector>

namespace cvdr::signaling {

/**
 * @brief Request/response calls the signaling bridge is built on
 *
 * list_messages_since() returns raw inbound envelopes starting at cursor, in
 * server order. forward_message() posts one outbound envelope
 * ({"payload": ...}) for the device. Both are called from the bridge's own
 * threads.
 */
class SignalingTransport {
public:
    virtual ~SignalingTransport() = default;
    virtual Result<std::vector<nlohmann::json>> list_messages_since(std::size_t cursor) = 0;
    virtual Result<void> forward_message(const nlohmann::json& envelope) = 0;
};

} // namespace cvdr::signaling
