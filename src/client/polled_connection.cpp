#include "cvdr/client/polled_connection.hpp"

namespace cvdr::client {

PolledConnectionTransport::PolledConnectionTransport(std::shared_ptr<const Transport> transport,
                                                     std::string host,
                                                     std::string connection_id)
    : transport_(std::move(transport)), host_(std::move(host)), connection_id_(std::move(connection_id)) {
}

std::string PolledConnectionTransport::base_path() const {
    return "/hosts/" + host_ + "/polled_connections/" + connection_id_;
}

Result<std::vector<nlohmann::json>> PolledConnectionTransport::list_messages_since(std::size_t cursor) {
    nlohmann::json payload;
    auto result = transport_->execute(http::HttpMethod::GET,
                                      base_path() + "/messages?start=" + std::to_string(cursor),
                                      nullptr, &payload);
    if (result.is_error()) {
        return Err<std::vector<nlohmann::json>>(result.error());
    }
    if (payload.is_null()) {
        return Ok(std::vector<nlohmann::json>{});
    }
    if (!payload.is_array()) {
        return Err<std::vector<nlohmann::json>>(
            Error(ErrorKind::Decode, "Error decoding response: expected an array of messages"));
    }
    return Ok(payload.get<std::vector<nlohmann::json>>());
}

Result<void> PolledConnectionTransport::forward_message(const nlohmann::json& envelope) {
    return transport_->execute(http::HttpMethod::POST, base_path() + "/:forward", &envelope, nullptr);
}

} // namespace cvdr::client
