#include "cvdr/http/http_types.hpp"

#include <strings.h>

#include <charconv>

namespace cvdr::http {
namespace {

std::string find_header(const Headers& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

} // namespace

void HttpRequest::set_header(const std::string& name, const std::string& value) {
    for (auto& [key, existing] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            existing = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string HttpRequest::get_header(const std::string& name) const {
    return find_header(headers, name);
}

std::string HttpResponse::get_header(const std::string& name) const {
    return find_header(headers, name);
}

std::string HttpResponse::status_line() const {
    if (reason_phrase.empty()) {
        return std::to_string(status_code);
    }
    return std::to_string(status_code) + " " + reason_phrase;
}

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(Error(ErrorKind::InvalidArgument, "URL has no scheme: " + text));
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    if (url.scheme != "http") {
        return Err<Url>(Error(ErrorKind::InvalidArgument, "unsupported URL scheme: " + url.scheme));
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = text.find_first_of("/?", authority_start);
    const std::string authority = text.substr(authority_start, path_start == std::string::npos
                                                                   ? std::string::npos
                                                                   : path_start - authority_start);
    if (authority.empty()) {
        return Err<Url>(Error(ErrorKind::InvalidArgument, "URL has no host: " + text));
    }

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        url.host = authority;
    } else {
        url.host = authority.substr(0, colon);
        const std::string port = authority.substr(colon + 1);
        unsigned value = 0;
        const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc() || ptr != port.data() + port.size() || value == 0 || value > 65535) {
            return Err<Url>(Error(ErrorKind::InvalidArgument, "invalid port in URL: " + text));
        }
        url.port = static_cast<std::uint16_t>(value);
    }

    url.target = path_start == std::string::npos ? "/" : text.substr(path_start);
    if (url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }
    return Ok(std::move(url));
}

std::string Url::authority() const {
    if (port == 80) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

} // namespace cvdr::http
