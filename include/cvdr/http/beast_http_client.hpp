#pragma once

#include "cvdr/http/http_client.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cvdr::http {

namespace asio = boost::asio;
namespace beast = boost::beast;

struct BeastHttpClientOptions {
    std::string proxy_url;               ///< Optional "http://proxy:port"
    std::size_t max_idle_per_host = 32;  ///< Matches the upload worker count
};

/**
 * @brief HttpClient over Boost.Beast synchronous I/O
 *
 * Keeps a pool of idle keep-alive connections per host:port so that
 * consecutive requests, in particular concurrent chunk uploads, reuse TCP
 * connections. A pooled connection that turns out to be stale when the
 * request is written is replaced by a fresh one once.
 *
 * Thread safety: send() and send_streaming() may be called concurrently.
 * Each call owns its connection exclusively; only the idle pool is shared.
 */
class BeastHttpClient : public HttpClient {
public:
    explicit BeastHttpClient(BeastHttpClientOptions options = {});
    ~BeastHttpClient() override;

    /// Validates the proxy URL before constructing the client
    static Result<std::shared_ptr<BeastHttpClient>> create(BeastHttpClientOptions options);

    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;

    Result<HttpResponse> send_streaming(const HttpRequest& request,
                                        BodySource& source,
                                        const CancellationToken& cancel) override;

private:
    struct Connection {
        explicit Connection(asio::io_context& io_context) : stream(io_context) {}
        beast::tcp_stream stream;
        std::string key;
    };

    struct Route {
        Url target;    ///< What the request addresses
        Url endpoint;  ///< Where the TCP connection goes (target or proxy)
        std::string request_target;
    };

    Result<Route> route_for(const std::string& url) const;

    Result<std::unique_ptr<Connection>> acquire(const Url& endpoint, bool& reused);
    void release(std::unique_ptr<Connection> connection);

    asio::io_context io_context_;
    BeastHttpClientOptions options_;
    std::optional<Url> proxy_;

    std::mutex pool_mutex_;
    std::unordered_map<std::string, std::vector<std::unique_ptr<Connection>>> idle_;
};

} // namespace cvdr::http
