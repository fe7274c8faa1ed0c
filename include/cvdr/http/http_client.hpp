#pragma once

#include "cvdr/core/cancellation.hpp"
#include "cvdr/core/result.hpp"
#include "cvdr/http/http_types.hpp"

#include <optional>
#include <string>

namespace cvdr::http {

/**
 * @brief Pull-based producer of a request body
 *
 * next_block() returns the next piece of the body, std::nullopt once the body
 * is complete, or an error if the producer failed (the request is then
 * abandoned instead of being terminated as if the body were complete).
 */
class BodySource {
public:
    virtual ~BodySource() = default;
    virtual Result<std::optional<std::string>> next_block() = 0;
};

/**
 * @brief Blocking HTTP/1.1 client seam
 *
 * Implementations must be safe to call from many threads at once. Failures
 * to connect, write or read are ErrorKind::Transport; any HTTP status,
 * including 4xx/5xx, is a successful exchange.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;

    /**
     * @brief Send a request whose body is streamed from source
     *
     * request.body is ignored. The body is sent with chunked transfer
     * encoding. cancel is checked before every block and before the response
     * is read; once observed the connection is dropped and
     * ErrorKind::Cancelled returned.
     */
    virtual Result<HttpResponse> send_streaming(const HttpRequest& request,
                                                BodySource& source,
                                                const CancellationToken& cancel) = 0;
};

} // namespace cvdr::http
