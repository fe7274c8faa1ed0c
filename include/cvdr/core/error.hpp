#pragma once

#include <optional>
#include <string>

namespace cvdr {

enum class ErrorKind {
    Transport,        // connection, timeout, malformed HTTP exchange
    Api,              // declared error returned by the server
    Decode,           // response payload or operation could not be interpreted
    Encode,           // request payload could not be serialized
    Io,               // local file access
    Cancelled,        // cooperative cancellation observed
    InvalidArgument,  // caller contract violation
    Upload,           // chunk upload rejected by the server
    Closed            // a channel or session was already closed
};

const char* to_string(ErrorKind kind);

/**
 * @brief Error payload declared by the orchestration service
 *
 * Wire form: {"code": int, "error": string, "details": string}.
 * Two ApiErrors are equal when all three fields are equal, which lets callers
 * match an expected server error by value.
 */
struct ApiError {
    int code = 0;
    std::string message;
    std::string details;

    bool operator==(const ApiError& other) const {
        return code == other.code && message == other.message && details == other.details;
    }
    bool operator!=(const ApiError& other) const { return !(*this == other); }

    std::string to_string() const;
};

struct Error {
    ErrorKind kind = ErrorKind::Transport;
    std::string message;
    std::optional<ApiError> api;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    static Error from_api(ApiError api_error);

    bool is(ErrorKind k) const { return kind == k; }
    bool is(const ApiError& api_error) const { return api.has_value() && *api == api_error; }

    /// Status code of a declared API error, 0 for every other kind
    int status_code() const { return api ? api->code : 0; }

    std::string to_string() const;
};

} // namespace cvdr
