#pragma once

#include "cvdr/core/result.hpp"
#include "cvdr/http/http_client.hpp"
#include "cvdr/http/http_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace cvdr::client {

/**
 * @brief Observer invoked once per HTTP attempt, whatever its outcome
 *
 * attempt is 1 for the first send and increases with every transient retry.
 */
using TraceHook = std::function<void(const http::HttpRequest& request,
                                     const Result<http::HttpResponse>& response,
                                     int attempt)>;

/// Logs every attempt at debug level, the equivalent of a request/response dump
void log_exchange(const http::HttpRequest& request,
                  const Result<http::HttpResponse>& response,
                  int attempt);

struct TransportOptions {
    std::string root_endpoint;                  ///< e.g. "http://localhost:8080/v1"
    int retry_attempts = 3;                     ///< Extra sends on 502/503
    std::chrono::milliseconds retry_delay{5000};
    TraceHook trace = &log_exchange;
};

/**
 * @brief Executes one logical API request against the orchestration service
 *
 * The request is JSON-encoded, sent, and resent unchanged while the server
 * answers 502 or 503 (at most retry_attempts extra times, retry_delay apart).
 * The final response is then interpreted:
 * - 2xx: decoded into decode_into when given (decode failure is
 *   ErrorKind::Decode)
 * - otherwise: the server's {code, error, details} payload as an Api error;
 *   DELETE responses carry no body, so they yield a status-based Api error
 *
 * Connection-level failures are returned immediately as ErrorKind::Transport.
 * The object is immutable after construction and safe to share between
 * threads.
 */
class Transport {
public:
    Transport(std::shared_ptr<http::HttpClient> client, TransportOptions options);

    Result<void> execute(http::HttpMethod method,
                         const std::string& path,
                         const nlohmann::json* body,
                         nlohmann::json* decode_into,
                         const http::Headers& headers = {}) const;

    /// execute() followed by conversion of the decoded payload to T
    template<typename T>
    Result<T> call(http::HttpMethod method,
                   const std::string& path,
                   const nlohmann::json* body = nullptr,
                   const http::Headers& headers = {}) const {
        nlohmann::json payload;
        auto result = execute(method, path, body, &payload, headers);
        if (result.is_error()) {
            return Err<T>(result.error());
        }
        try {
            return Ok(payload.get<T>());
        } catch (const nlohmann::json::exception& e) {
            return Err<T>(Error(ErrorKind::Decode, std::string("Error decoding response: ") + e.what()));
        }
    }

    std::string url_for(const std::string& path) const { return options_.root_endpoint + path; }

    const TransportOptions& options() const noexcept { return options_; }
    const std::shared_ptr<http::HttpClient>& http_client() const noexcept { return client_; }

    static bool is_retryable_status(int status_code);

private:
    Result<http::HttpResponse> send_with_retry(const http::HttpRequest& request) const;

    std::shared_ptr<http::HttpClient> client_;
    TransportOptions options_;
};

} // namespace cvdr::client
