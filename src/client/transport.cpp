#include "cvdr/client/transport.hpp"

#include "cvdr/client/api_types.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace cvdr::client {

void log_exchange(const http::HttpRequest& request,
                  const Result<http::HttpResponse>& response,
                  int attempt) {
    const auto method = http::HttpMethodUtils::to_string(request.method);
    if (response.is_error()) {
        spdlog::debug("{} {} (attempt {}) failed: {}", method, request.url, attempt,
                      response.error().to_string());
        return;
    }
    spdlog::debug("{} {} (attempt {}) -> {} reused={}\n{}\n{}", method, request.url, attempt,
                  response.value().status_line(), response.value().connection_reused,
                  request.body, response.value().body);
}

Transport::Transport(std::shared_ptr<http::HttpClient> client, TransportOptions options)
    : client_(std::move(client)), options_(std::move(options)) {
}

bool Transport::is_retryable_status(int status_code) {
    return status_code == 503 || status_code == 502;
}

Result<http::HttpResponse> Transport::send_with_retry(const http::HttpRequest& request) const {
    int attempt = 1;
    auto response = client_->send(request);
    if (options_.trace) {
        options_.trace(request, response, attempt);
    }
    for (int i = 0; i < options_.retry_attempts; ++i) {
        if (response.is_error() || !is_retryable_status(response.value().status_code)) {
            break;
        }
        spdlog::debug("{} {} answered {}, retrying in {} ms",
                      http::HttpMethodUtils::to_string(request.method), request.url,
                      response.value().status_code, options_.retry_delay.count());
        std::this_thread::sleep_for(options_.retry_delay);
        response = client_->send(request);
        ++attempt;
        if (options_.trace) {
            options_.trace(request, response, attempt);
        }
    }
    return response;
}

Result<void> Transport::execute(http::HttpMethod method,
                                const std::string& path,
                                const nlohmann::json* body,
                                nlohmann::json* decode_into,
                                const http::Headers& headers) const {
    http::HttpRequest request;
    request.method = method;
    request.url = url_for(path);
    request.headers = headers;
    if (body != nullptr) {
        try {
            request.body = body->dump();
        } catch (const nlohmann::json::exception& e) {
            return Err<void>(Error(ErrorKind::Encode, std::string("Error marshaling request: ") + e.what()));
        }
    }
    request.set_header("Content-Type", "application/json");

    auto sent = send_with_retry(request);
    if (sent.is_error()) {
        return Err<void>(Error(sent.error().kind, "Error sending request: " + sent.error().message));
    }
    const auto& response = sent.value();

    if (!response.is_success()) {
        if (method == http::HttpMethod::DELETE_METHOD) {
            return Err<void>(Error::from_api(ApiError{response.status_code, response.status_line(), ""}));
        }
        try {
            auto api_error = nlohmann::json::parse(response.body).get<ApiError>();
            return Err<void>(Error::from_api(std::move(api_error)));
        } catch (const nlohmann::json::exception& e) {
            return Err<void>(Error(ErrorKind::Decode,
                                   "Error decoding " + response.status_line() + " response: " + e.what()));
        }
    }

    if (decode_into != nullptr) {
        try {
            *decode_into = nlohmann::json::parse(response.body);
        } catch (const nlohmann::json::exception& e) {
            return Err<void>(Error(ErrorKind::Decode, std::string("Error decoding response: ") + e.what()));
        }
    }
    return Ok();
}

} // namespace cvdr::client
