#pragma once

#include "cvdr/core/result.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cvdr::http {

/**
 * @brief HTTP request methods used by the orchestration API
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // Renamed to avoid the Windows DELETE macro
    HEAD
};

using Headers = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Outgoing request
 *
 * url is absolute ("http://host:port/v1/hosts?x=y"). The body is a complete
 * buffer; requests whose body is produced incrementally go through
 * HttpClient::send_streaming with a BodySource instead.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    Headers headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value);
    std::string get_header(const std::string& name) const;
};

/**
 * @brief Response received from the server
 *
 * connection_reused reports whether the request travelled over a pooled
 * keep-alive connection, which is what upload diagnostics are tuned on.
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    Headers headers;
    std::string body;
    bool connection_reused = false;

    bool is_success() const { return status_code >= 200 && status_code <= 299; }

    /// "503 Service Unavailable"
    std::string status_line() const;

    std::string get_header(const std::string& name) const;
};

class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
        }
        return "UNKNOWN";
    }
};

/**
 * @brief Parsed http:// endpoint
 */
struct Url {
    std::string scheme;
    std::string host;
    std::uint16_t port = 80;
    std::string target;  ///< path plus query, always starts with '/'

    static Result<Url> parse(const std::string& text);

    /// "host" or "host:port" as sent in the Host header
    std::string authority() const;
};

} // namespace cvdr::http
