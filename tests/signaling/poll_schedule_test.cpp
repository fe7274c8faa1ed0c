#include "cvdr/signaling/envelope.hpp"
#include "cvdr/signaling/poll_schedule.hpp"

#include <gtest/gtest.h>

using cvdr::signaling::PollSchedule;
using namespace std::chrono_literals;

TEST(PollScheduleTest, DoublesWhenIdleUpToMax) {
    PollSchedule schedule(100ms, 2s);
    EXPECT_EQ(schedule.interval(), 100ms);
    EXPECT_EQ(schedule.record(0), 200ms);
    EXPECT_EQ(schedule.record(0), 400ms);
    EXPECT_EQ(schedule.record(0), 800ms);
    EXPECT_EQ(schedule.record(0), 1600ms);
    EXPECT_EQ(schedule.record(0), 2s);
    EXPECT_EQ(schedule.record(0), 2s);
}

TEST(PollScheduleTest, ResetsAfterTraffic) {
    PollSchedule schedule(100ms, 2s);
    schedule.record(0);
    schedule.record(0);
    EXPECT_EQ(schedule.record(3), 100ms);
}

TEST(EnvelopeTest, DecodesDeviceMessage) {
    auto env = cvdr::signaling::decode_envelope(
        nlohmann::json::parse(R"({"message_type": "device_msg", "payload": {"sdp": "x"}})"));
    ASSERT_TRUE(env.is_ok());
    const auto* msg = std::get_if<cvdr::signaling::DeviceMessage>(&env.value());
    ASSERT_NE(msg, nullptr);
    EXPECT_EQ(msg->payload.at("sdp").get<std::string>(), "x");
}

TEST(EnvelopeTest, ReportsOtherTypes) {
    auto env = cvdr::signaling::decode_envelope(nlohmann::json::parse(R"({"message_type": "ping"})"));
    ASSERT_TRUE(env.is_ok());
    const auto* other = std::get_if<cvdr::signaling::UnrecognizedMessage>(&env.value());
    ASSERT_NE(other, nullptr);
    EXPECT_EQ(other->message_type, "ping");
}

TEST(EnvelopeTest, RejectsMalformed) {
    using cvdr::signaling::decode_envelope;
    EXPECT_TRUE(decode_envelope(nlohmann::json::array()).is_error());
    EXPECT_TRUE(decode_envelope(nlohmann::json::parse(R"({"payload": {}})")).is_error());
    EXPECT_TRUE(decode_envelope(nlohmann::json::parse(R"({"message_type": "device_msg", "payload": 3})")).is_error());
}

TEST(EnvelopeTest, EncodesForward) {
    const auto payload = nlohmann::json::parse(R"({"type": "answer"})");
    EXPECT_EQ(cvdr::signaling::encode_forward(payload), (nlohmann::json{{"payload", payload}}));
}
