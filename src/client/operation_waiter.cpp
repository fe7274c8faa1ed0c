#include "cvdr/client/operation_waiter.hpp"

namespace cvdr::client {

Result<OperationKind> classify_operation(const std::string& operation_type) {
    if (operation_type == "insert" || operation_type == "create") {
        return Ok(OperationKind::Create);
    }
    if (operation_type == "delete") {
        return Ok(OperationKind::Delete);
    }
    return Err<OperationKind>(Error(ErrorKind::Decode,
                                    "unhandled operation type: \"" + operation_type + "\""));
}

Result<std::string> parse_target_id(const std::string& target_link) {
    const auto slash = target_link.rfind('/');
    const std::string id = slash == std::string::npos ? target_link : target_link.substr(slash + 1);
    if (id.empty()) {
        return Err<std::string>(Error(ErrorKind::Decode,
                                      "cannot parse resource id from target link: \"" + target_link + "\""));
    }
    return Ok(id);
}

} // namespace cvdr::client
