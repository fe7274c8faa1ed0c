#include "cvdr/client/api_types.hpp"
#include "cvdr/core/error.hpp"
#include "cvdr/core/result.hpp"

#include <gtest/gtest.h>

using cvdr::ApiError;
using cvdr::Error;
using cvdr::ErrorKind;

TEST(ErrorTest, ApiErrorsCompareByValue) {
    const ApiError a{404, "not found", ""};
    EXPECT_EQ(a, (ApiError{404, "not found", ""}));
    EXPECT_NE(a, (ApiError{404, "not found", "host foo"}));
    EXPECT_NE(a, (ApiError{500, "not found", ""}));
}

TEST(ErrorTest, FromApiMatchesDeclaredError) {
    const auto error = Error::from_api(ApiError{409, "conflict", "already exists"});
    EXPECT_TRUE(error.is(ErrorKind::Api));
    EXPECT_TRUE(error.is(ApiError{409, "conflict", "already exists"}));
    EXPECT_EQ(error.status_code(), 409);
}

TEST(ErrorTest, ApiErrorMessageIncludesDetails) {
    EXPECT_EQ((ApiError{500, "boom", ""}).to_string(), "api call error 500: boom");
    EXPECT_EQ((ApiError{500, "boom", "stack"}).to_string(), "api call error 500: boom\n\nDETAILS: stack");
}

TEST(ErrorTest, ApiErrorJsonUsesWireKeys) {
    const auto parsed = nlohmann::json::parse(R"({"code": 403, "error": "denied", "details": "x"})").get<ApiError>();
    EXPECT_EQ(parsed, (ApiError{403, "denied", "x"}));

    const nlohmann::json encoded = ApiError{403, "denied", ""};
    EXPECT_EQ(encoded.at("error").get<std::string>(), "denied");
    EXPECT_FALSE(encoded.contains("details"));
}

TEST(ErrorTest, NonApiErrorsHaveNoStatus) {
    const Error error(ErrorKind::Io, "disk");
    EXPECT_EQ(error.status_code(), 0);
    EXPECT_FALSE(error.is(ApiError{}));
}

TEST(ResultTest, VoidResultCarriesError) {
    cvdr::Result<void> ok = cvdr::Ok();
    EXPECT_TRUE(ok.is_ok());

    auto err = cvdr::Err<void>(Error(ErrorKind::Closed, "closed"));
    ASSERT_TRUE(err.is_error());
    EXPECT_TRUE(err.error().is(ErrorKind::Closed));
}
