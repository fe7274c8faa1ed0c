#pragma once

#include "cvdr/client/transport.hpp"
#include "cvdr/signaling/signaling_transport.hpp"

#include <memory>
#include <string>

namespace cvdr::client {

/**
 * @brief SignalingTransport backed by a host's polled connection endpoints
 *
 * GET  /hosts/{host}/polled_connections/{id}/messages?start={cursor}
 * POST /hosts/{host}/polled_connections/{id}/:forward
 */
class PolledConnectionTransport : public signaling::SignalingTransport {
public:
    PolledConnectionTransport(std::shared_ptr<const Transport> transport,
                              std::string host,
                              std::string connection_id);

    Result<std::vector<nlohmann::json>> list_messages_since(std::size_t cursor) override;
    Result<void> forward_message(const nlohmann::json& envelope) override;

    const std::string& connection_id() const noexcept { return connection_id_; }

private:
    std::string base_path() const;

    std::shared_ptr<const Transport> transport_;
    std::string host_;
    std::string connection_id_;
};

} // namespace cvdr::client
