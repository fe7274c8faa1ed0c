#include "cvdr/http/beast_http_client.hpp"
#include "cvdr/http/http_types.hpp"

#include <gtest/gtest.h>

using cvdr::ErrorKind;
using cvdr::http::HttpRequest;
using cvdr::http::HttpResponse;
using cvdr::http::Url;

TEST(UrlTest, ParsesHostPortAndTarget) {
    auto url = Url::parse("http://localhost:8080/v1/hosts?start=3");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().host, "localhost");
    EXPECT_EQ(url.value().port, 8080);
    EXPECT_EQ(url.value().target, "/v1/hosts?start=3");
    EXPECT_EQ(url.value().authority(), "localhost:8080");
}

TEST(UrlTest, DefaultsPortAndPath) {
    auto url = Url::parse("http://example.com");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().port, 80);
    EXPECT_EQ(url.value().target, "/");
    EXPECT_EQ(url.value().authority(), "example.com");
}

TEST(UrlTest, RejectsUnsupportedInput) {
    EXPECT_TRUE(Url::parse("https://example.com/").error().is(ErrorKind::InvalidArgument));
    EXPECT_TRUE(Url::parse("example.com/path").is_error());
    EXPECT_TRUE(Url::parse("http://host:99999/").is_error());
    EXPECT_TRUE(Url::parse("http:///path").is_error());
}

TEST(HttpTypesTest, HeadersAreCaseInsensitive) {
    HttpRequest request;
    request.set_header("Content-Type", "text/plain");
    request.set_header("content-type", "application/json");
    ASSERT_EQ(request.headers.size(), 1u);
    EXPECT_EQ(request.get_header("CONTENT-TYPE"), "application/json");
}

TEST(HttpTypesTest, StatusLineAndSuccess) {
    HttpResponse response;
    response.status_code = 503;
    response.reason_phrase = "Service Unavailable";
    EXPECT_FALSE(response.is_success());
    EXPECT_EQ(response.status_line(), "503 Service Unavailable");

    response.status_code = 204;
    response.reason_phrase.clear();
    EXPECT_TRUE(response.is_success());
    EXPECT_EQ(response.status_line(), "204");
}

TEST(BeastHttpClientTest, RejectsInvalidProxy) {
    cvdr::http::BeastHttpClientOptions options;
    options.proxy_url = "socks5://proxy:1080";
    auto client = cvdr::http::BeastHttpClient::create(options);
    ASSERT_TRUE(client.is_error());
    EXPECT_TRUE(client.error().is(ErrorKind::InvalidArgument));
}

TEST(BeastHttpClientTest, ConnectionFailureIsTransportError) {
    auto client = cvdr::http::BeastHttpClient::create({});
    ASSERT_TRUE(client.is_ok());

    HttpRequest request;
    request.url = "http://127.0.0.1:1/unreachable";
    auto response = client.value()->send(request);
    ASSERT_TRUE(response.is_error());
    EXPECT_TRUE(response.error().is(ErrorKind::Transport));
}
