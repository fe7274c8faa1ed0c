#include "cvdr/config/service_options.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using cvdr::ErrorKind;
using cvdr::config::build_root_endpoint;
using cvdr::config::load_service_options;
using cvdr::config::load_service_options_file;
using json = nlohmann::json;
using namespace std::chrono_literals;

TEST(ServiceOptionsTest, DefaultsMatchClientSettings) {
    auto options = load_service_options(json{{"root_endpoint", "http://localhost:8080/v1"}});
    ASSERT_TRUE(options.is_ok()) << options.error().to_string();

    const auto& o = options.value();
    EXPECT_EQ(o.retry_attempts, 3);
    EXPECT_EQ(o.retry_delay, 5s);
    EXPECT_EQ(o.upload_workers, 32u);
    EXPECT_EQ(o.chunk_upload_backoff.initial_interval, 500ms);
    EXPECT_EQ(o.chunk_upload_backoff.max_elapsed_time, 2min);
    EXPECT_EQ(o.signaling.min_poll_interval, 100ms);
    EXPECT_EQ(o.signaling.max_poll_interval, 2s);
    EXPECT_EQ(o.signaling.max_consecutive_errors, 10);
}

TEST(ServiceOptionsTest, ReadsNestedSections) {
    const auto doc = json::parse(R"({
        "root_endpoint": "http://svc/v1",
        "proxy_url": "http://proxy:3128",
        "chunk_size_bytes": 1048576,
        "upload_workers": 8,
        "chunk_upload_backoff": {"initial_interval_ms": 100, "multiplier": 2.0, "max_elapsed_time_ms": 0},
        "signaling": {"max_consecutive_errors": 4},
        "waiter": {"poll_interval_ms": 250, "max_polls": 10}
    })");
    auto options = load_service_options(doc);
    ASSERT_TRUE(options.is_ok()) << options.error().to_string();

    const auto& o = options.value();
    EXPECT_EQ(o.proxy_url, "http://proxy:3128");
    EXPECT_EQ(o.chunk_size_bytes, 1048576u);
    EXPECT_EQ(o.upload_workers, 8u);
    EXPECT_EQ(o.chunk_upload_backoff.initial_interval, 100ms);
    EXPECT_DOUBLE_EQ(o.chunk_upload_backoff.multiplier, 2.0);
    EXPECT_EQ(o.chunk_upload_backoff.max_elapsed_time, 0ms);
    EXPECT_EQ(o.signaling.max_consecutive_errors, 4);
    EXPECT_EQ(o.waiter.poll_interval, 250ms);
    EXPECT_EQ(o.waiter.max_polls, 10);
}

TEST(ServiceOptionsTest, RejectsUnknownKeys) {
    auto top = load_service_options(json{{"root_endpoint", "http://svc"}, {"chunksize", 10}});
    ASSERT_TRUE(top.is_error());
    EXPECT_TRUE(top.error().is(ErrorKind::InvalidArgument));
    EXPECT_NE(top.error().message.find("chunksize"), std::string::npos);

    auto nested = load_service_options(json{{"root_endpoint", "http://svc"}, {"waiter", {{"polls", 1}}}});
    ASSERT_TRUE(nested.is_error());
    EXPECT_NE(nested.error().message.find("waiter.polls"), std::string::npos);
}

TEST(ServiceOptionsTest, RejectsInvalidValues) {
    EXPECT_TRUE(load_service_options(json::object()).is_error());
    EXPECT_TRUE(load_service_options(json{{"root_endpoint", 5}}).is_error());
    EXPECT_TRUE(load_service_options(json{{"root_endpoint", "http://svc"}, {"chunk_size_bytes", -1}}).is_error());
    EXPECT_TRUE(load_service_options(json{{"root_endpoint", "http://svc"}, {"upload_workers", 0}}).is_error());
    EXPECT_TRUE(load_service_options(
        json{{"root_endpoint", "http://svc"}, {"signaling", {{"min_poll_interval_ms", 500}, {"max_poll_interval_ms", 100}}}})
                    .is_error());
    EXPECT_TRUE(load_service_options(json::array()).is_error());
}

TEST(ServiceOptionsTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "cvdr_service_options_test.json";
    {
        std::ofstream out(path);
        out << R"({"root_endpoint": "http://svc/v1", "retry_attempts": 1})";
    }
    auto options = load_service_options_file(path.string());
    ASSERT_TRUE(options.is_ok());
    EXPECT_EQ(options.value().retry_attempts, 1);
    std::filesystem::remove(path);

    EXPECT_TRUE(load_service_options_file("/nonexistent/cvdr.json").error().is(ErrorKind::Io));
}

TEST(ServiceOptionsTest, BuildsRootEndpoint) {
    EXPECT_EQ(build_root_endpoint("http://svc", "v1", ""), "http://svc/v1");
    EXPECT_EQ(build_root_endpoint("http://svc", "v1", "us-central1-b"), "http://svc/v1/zones/us-central1-b");
}
