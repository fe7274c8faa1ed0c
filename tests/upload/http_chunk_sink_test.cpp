#include "cvdr/upload/http_chunk_sink.hpp"

#include "../support/fake_http_client.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using cvdr::CancellationToken;
using cvdr::ErrorKind;
using cvdr::testing::FakeHttpClient;
using cvdr::upload::HttpChunkSink;
using cvdr::upload::HttpChunkSinkOptions;
using cvdr::upload::UploadChunkJob;

namespace {

fs::path write_file(const std::string& contents) {
    static std::atomic<uint64_t> counter{0};
    const auto path = fs::temp_directory_path() / ("cvdr_sink_test_" + std::to_string(counter++) + ".img");
    std::ofstream out(path, std::ios::binary);
    out << contents;
    return path;
}

std::string boundary_of(const std::string& content_type) {
    const std::string marker = "boundary=";
    return content_type.substr(content_type.find(marker) + marker.size());
}

} // namespace

TEST(HttpChunkSinkTest, PutsMultipartChunk) {
    const auto path = write_file("0123456789");
    auto http = std::make_shared<FakeHttpClient>();
    http->enqueue(FakeHttpClient::response(200));

    HttpChunkSinkOptions options;
    options.block_size = 2;
    HttpChunkSink sink(http, options);
    CancellationToken cancel;

    auto result = sink.put_chunk("http://h/v1/hosts/h1/userartifacts/d1", UploadChunkJob{path.string(), 2, 3, 4}, cancel);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    const auto request = http->requests().at(0);
    EXPECT_EQ(request.method, cvdr::http::HttpMethod::PUT);
    EXPECT_EQ(request.url, "http://h/v1/hosts/h1/userartifacts/d1");

    const auto content_type = request.get_header("Content-Type");
    ASSERT_EQ(content_type.rfind("multipart/form-data; boundary=", 0), 0u);
    const auto boundary = boundary_of(content_type);
    const auto filename = path.filename().string();

    const std::string expected =
        "--" + boundary + "\r\nContent-Disposition: form-data; name=\"chunk_number\"\r\n\r\n2" +
        "\r\n--" + boundary + "\r\nContent-Disposition: form-data; name=\"chunk_total\"\r\n\r\n3" +
        "\r\n--" + boundary + "\r\nContent-Disposition: form-data; name=\"chunk_size_bytes\"\r\n\r\n4" +
        "\r\n--" + boundary + "\r\nContent-Disposition: form-data; name=\"file\"; filename=\"" + filename +
        "\"\r\nContent-Type: application/octet-stream\r\n\r\n4567" +
        "\r\n--" + boundary + "--\r\n";
    EXPECT_EQ(request.body, expected);
    fs::remove(path);
}

TEST(HttpChunkSinkTest, NonOkStatusIsUploadError) {
    const auto path = write_file("abc");
    auto http = std::make_shared<FakeHttpClient>();
    http->enqueue(FakeHttpClient::response(201, "", "Created"));
    HttpChunkSink sink(http);
    CancellationToken cancel;

    auto result = sink.put_chunk("http://h/upload", UploadChunkJob{path.string(), 1, 1, 3}, cancel);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Upload));
    EXPECT_NE(result.error().message.find("201 Created"), std::string::npos);
    fs::remove(path);
}

TEST(HttpChunkSinkTest, MissingFileFailsRequest) {
    auto http = std::make_shared<FakeHttpClient>();
    http->enqueue(FakeHttpClient::response(200));
    HttpChunkSink sink(http);
    CancellationToken cancel;

    auto result = sink.put_chunk("http://h/upload", UploadChunkJob{"/nonexistent/cvdr.img", 1, 1, 3}, cancel);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Io));
    EXPECT_EQ(http->request_count(), 0u);
}

TEST(HttpChunkSinkTest, CancelledBeforeSendIsCancelled) {
    const auto path = write_file("abc");
    auto http = std::make_shared<FakeHttpClient>();
    http->enqueue(FakeHttpClient::response(200));
    HttpChunkSink sink(http);
    CancellationToken cancel;
    cancel.cancel();

    auto result = sink.put_chunk("http://h/upload", UploadChunkJob{path.string(), 1, 1, 3}, cancel);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Cancelled));
    fs::remove(path);
}
