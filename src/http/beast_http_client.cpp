#include "cvdr/http/beast_http_client.hpp"

#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include <limits>
#include <optional>

namespace cvdr::http {

namespace bhttp = boost::beast::http;
using tcp = asio::ip::tcp;

namespace {

bhttp::verb to_verb(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return bhttp::verb::get;
        case HttpMethod::POST: return bhttp::verb::post;
        case HttpMethod::PUT: return bhttp::verb::put;
        case HttpMethod::DELETE_METHOD: return bhttp::verb::delete_;
        case HttpMethod::HEAD: return bhttp::verb::head;
    }
    return bhttp::verb::unknown;
}

bool is_idempotent(HttpMethod method) {
    return method == HttpMethod::GET || method == HttpMethod::HEAD ||
           method == HttpMethod::PUT || method == HttpMethod::DELETE_METHOD;
}

std::string pool_key(const Url& endpoint) {
    return endpoint.host + ":" + std::to_string(endpoint.port);
}

template<typename Body>
void apply_headers(bhttp::request<Body>& req, const HttpRequest& request, const std::string& host) {
    req.set(bhttp::field::host, host);
    req.set(bhttp::field::user_agent, "cvdr");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.keep_alive(true);
}

struct ReadOutcome {
    HttpResponse response;
    bool keep_alive = false;
};

template<typename Stream>
Result<ReadOutcome> read_response(Stream& stream, bool head_request) {
    beast::flat_buffer buffer;
    bhttp::response_parser<bhttp::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    if (head_request) {
        parser.skip(true);
    }

    boost::system::error_code ec;
    bhttp::read(stream, buffer, parser, ec);
    if (ec) {
        return Err<ReadOutcome>(Error(ErrorKind::Transport, "reading response: " + ec.message()));
    }

    auto& res = parser.get();
    ReadOutcome outcome;
    outcome.response.status_code = static_cast<int>(res.result_int());
    const auto reason = res.reason();
    outcome.response.reason_phrase.assign(reason.data(), reason.size());
    for (const auto& field : res) {
        const auto name = field.name_string();
        const auto value = field.value();
        outcome.response.headers.emplace_back(std::string(name.data(), name.size()),
                                              std::string(value.data(), value.size()));
    }
    outcome.response.body = std::move(res.body());
    outcome.keep_alive = res.keep_alive();
    return Ok(std::move(outcome));
}

} // namespace

BeastHttpClient::BeastHttpClient(BeastHttpClientOptions options)
    : options_(std::move(options)) {
    if (!options_.proxy_url.empty()) {
        auto proxy = Url::parse(options_.proxy_url);
        if (proxy.is_error()) {
            spdlog::error("Ignoring invalid proxy URL '{}': {}", options_.proxy_url, proxy.error().message);
        } else {
            proxy_ = proxy.value();
        }
    }
}

BeastHttpClient::~BeastHttpClient() = default;

Result<std::shared_ptr<BeastHttpClient>> BeastHttpClient::create(BeastHttpClientOptions options) {
    if (!options.proxy_url.empty()) {
        auto proxy = Url::parse(options.proxy_url);
        if (proxy.is_error()) {
            return Err<std::shared_ptr<BeastHttpClient>>(proxy.error());
        }
    }
    return Ok(std::make_shared<BeastHttpClient>(std::move(options)));
}

Result<BeastHttpClient::Route> BeastHttpClient::route_for(const std::string& url) const {
    auto target = Url::parse(url);
    if (target.is_error()) {
        return Err<Route>(target.error());
    }
    Route route;
    route.target = target.value();
    if (proxy_) {
        route.endpoint = *proxy_;
        route.request_target = url;  // absolute-form for proxies
    } else {
        route.endpoint = route.target;
        route.request_target = route.target.target;
    }
    return Ok(std::move(route));
}

Result<std::unique_ptr<BeastHttpClient::Connection>> BeastHttpClient::acquire(const Url& endpoint, bool& reused) {
    const auto key = pool_key(endpoint);
    {
        std::lock_guard lock(pool_mutex_);
        auto it = idle_.find(key);
        if (it != idle_.end() && !it->second.empty()) {
            auto connection = std::move(it->second.back());
            it->second.pop_back();
            reused = true;
            return Ok(std::move(connection));
        }
    }

    reused = false;
    auto connection = std::make_unique<Connection>(io_context_);
    connection->key = key;

    boost::system::error_code ec;
    tcp::resolver resolver(io_context_);
    const auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port), ec);
    if (ec) {
        return Err<std::unique_ptr<Connection>>(
            Error(ErrorKind::Transport, "resolving " + key + ": " + ec.message()));
    }
    connection->stream.connect(results, ec);
    if (ec) {
        return Err<std::unique_ptr<Connection>>(
            Error(ErrorKind::Transport, "connecting to " + key + ": " + ec.message()));
    }
    spdlog::debug("Opened connection to {}", key);
    return Ok(std::move(connection));
}

void BeastHttpClient::release(std::unique_ptr<Connection> connection) {
    std::lock_guard lock(pool_mutex_);
    auto& idle = idle_[connection->key];
    if (idle.size() < options_.max_idle_per_host) {
        idle.push_back(std::move(connection));
    }
}

Result<HttpResponse> BeastHttpClient::send(const HttpRequest& request) {
    auto route = route_for(request.url);
    if (route.is_error()) {
        return Err<HttpResponse>(route.error());
    }
    const auto& r = route.value();

    bhttp::request<bhttp::string_body> req{to_verb(request.method), r.request_target, 11};
    apply_headers(req, request, r.target.authority());
    req.body() = request.body;
    req.prepare_payload();

    // A pooled connection may have been closed by the server while idle;
    // in that case retry once on a fresh connection. Non-idempotent requests
    // are only retried if writing them failed.
    for (int attempt = 0; attempt < 2; ++attempt) {
        bool reused = false;
        auto acquired = acquire(r.endpoint, reused);
        if (acquired.is_error()) {
            return Err<HttpResponse>(acquired.error());
        }
        auto connection = std::move(acquired.value());

        boost::system::error_code ec;
        bhttp::write(connection->stream, req, ec);
        if (ec) {
            if (reused) {
                spdlog::debug("Stale connection to {}: {}", connection->key, ec.message());
                continue;
            }
            return Err<HttpResponse>(Error(ErrorKind::Transport, "writing request: " + ec.message()));
        }

        auto outcome = read_response(connection->stream, request.method == HttpMethod::HEAD);
        if (outcome.is_error()) {
            // The request reached the server; only replay it when that is harmless
            if (reused && is_idempotent(request.method)) {
                spdlog::debug("Stale connection to {}: {}", connection->key, outcome.error().message);
                continue;
            }
            return Err<HttpResponse>(outcome.error());
        }

        auto response = std::move(outcome.value().response);
        response.connection_reused = reused;
        if (outcome.value().keep_alive) {
            release(std::move(connection));
        }
        return Ok(std::move(response));
    }
    return Err<HttpResponse>(Error(ErrorKind::Transport, "connection closed by " + r.endpoint.authority()));
}

Result<HttpResponse> BeastHttpClient::send_streaming(const HttpRequest& request,
                                                     BodySource& source,
                                                     const CancellationToken& cancel) {
    auto route = route_for(request.url);
    if (route.is_error()) {
        return Err<HttpResponse>(route.error());
    }
    const auto& r = route.value();

    bhttp::request<bhttp::buffer_body> req{to_verb(request.method), r.request_target, 11};
    apply_headers(req, request, r.target.authority());
    req.chunked(true);
    req.body().data = nullptr;
    req.body().more = true;

    bool reused = false;
    std::unique_ptr<Connection> connection;
    std::optional<bhttp::request_serializer<bhttp::buffer_body>> serializer;
    boost::system::error_code ec;

    // Nothing from the body has been consumed until the header is written,
    // so a stale pooled connection can still be swapped for a fresh one.
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto acquired = acquire(r.endpoint, reused);
        if (acquired.is_error()) {
            return Err<HttpResponse>(acquired.error());
        }
        connection = std::move(acquired.value());
        serializer.emplace(req);
        ec = {};
        bhttp::write_header(connection->stream, *serializer, ec);
        if (!ec) {
            break;
        }
        if (!reused) {
            return Err<HttpResponse>(Error(ErrorKind::Transport, "writing request header: " + ec.message()));
        }
        spdlog::debug("Stale connection to {}: {}", connection->key, ec.message());
        connection.reset();
    }
    if (!connection) {
        return Err<HttpResponse>(Error(ErrorKind::Transport, "connection closed by " + r.endpoint.authority()));
    }

    std::string block;
    for (;;) {
        if (cancel.is_cancelled()) {
            return Err<HttpResponse>(Error(ErrorKind::Cancelled, "request cancelled"));
        }
        auto next = source.next_block();
        if (next.is_error()) {
            return Err<HttpResponse>(next.error());
        }
        if (next.value().has_value()) {
            block = std::move(*next.value());
            if (block.empty()) {
                continue;
            }
            req.body().data = block.data();
            req.body().size = block.size();
            req.body().more = true;
        } else {
            req.body().data = nullptr;
            req.body().size = 0;
            req.body().more = false;
        }

        bhttp::write(connection->stream, *serializer, ec);
        if (ec == bhttp::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            return Err<HttpResponse>(Error(ErrorKind::Transport, "writing request body: " + ec.message()));
        }
        if (!req.body().more) {
            break;
        }
    }

    if (cancel.is_cancelled()) {
        return Err<HttpResponse>(Error(ErrorKind::Cancelled, "request cancelled"));
    }

    auto outcome = read_response(connection->stream, false);
    if (outcome.is_error()) {
        return Err<HttpResponse>(outcome.error());
    }
    auto response = std::move(outcome.value().response);
    response.connection_reused = reused;
    if (outcome.value().keep_alive) {
        release(std::move(connection));
    }
    return Ok(std::move(response));
}

} // namespace cvdr::http
