#include "cvdr/core/error.hpp"

namespace cvdr {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Api: return "api";
        case ErrorKind::Decode: return "decode";
        case ErrorKind::Encode: return "encode";
        case ErrorKind::Io: return "io";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::Upload: return "upload";
        case ErrorKind::Closed: return "closed";
    }
    return "unknown";
}

std::string ApiError::to_string() const {
    std::string str = "api call error " + std::to_string(code) + ": " + message;
    if (!details.empty()) {
        str += "\n\nDETAILS: " + details;
    }
    return str;
}

Error Error::from_api(ApiError api_error) {
    Error error(ErrorKind::Api, api_error.to_string());
    error.api = std::move(api_error);
    return error;
}

std::string Error::to_string() const {
    if (kind == ErrorKind::Api) {
        return message;
    }
    return std::string(cvdr::to_string(kind)) + " error: " + message;
}

} // namespace cvdr
