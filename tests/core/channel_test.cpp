#include "cvdr/core/channel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using cvdr::Channel;
using namespace std::chrono_literals;

TEST(ChannelTest, DeliversInOrder) {
    Channel<int> ch(8);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(ch.send(i));
    }
    for (int i = 0; i < 5; ++i) {
        auto v = ch.receive();
        ASSERT_TRUE(v.has_value());
        EXPECT_EQ(*v, i);
    }
}

TEST(ChannelTest, ClosedChannelDrainsThenEnds) {
    Channel<int> ch(4);
    ch.send(1);
    ch.send(2);
    ch.close();

    EXPECT_FALSE(ch.send(3));
    EXPECT_EQ(ch.receive(), 1);
    EXPECT_EQ(ch.receive(), 2);
    EXPECT_EQ(ch.receive(), std::nullopt);
    EXPECT_TRUE(ch.is_closed());
}

TEST(ChannelTest, SendBlocksWhileFull) {
    Channel<int> ch(1);
    ASSERT_TRUE(ch.send(1));

    std::atomic<bool> second_sent{false};
    std::thread producer([&]() {
        ch.send(2);
        second_sent = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(second_sent);

    EXPECT_EQ(ch.receive(), 1);
    producer.join();
    EXPECT_TRUE(second_sent);
    EXPECT_EQ(ch.receive(), 2);
}

TEST(ChannelTest, CloseWakesBlockedSender) {
    Channel<int> ch(1);
    ch.send(1);

    std::atomic<bool> result{true};
    std::thread producer([&]() { result = ch.send(2); });
    std::this_thread::sleep_for(20ms);
    ch.close();
    producer.join();

    EXPECT_FALSE(result);
    EXPECT_EQ(ch.size(), 1u);
}

TEST(ChannelTest, ReceiveForTimesOut) {
    Channel<int> ch(1);
    auto v = ch.receive_for(10ms);
    EXPECT_FALSE(v.has_value());
    EXPECT_FALSE(ch.is_closed());
}

TEST(ChannelTest, ManyProducersOneConsumer) {
    Channel<int> ch(4);
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&ch]() {
            for (int i = 0; i < 100; ++i) {
                ch.send(1);
            }
        });
    }
    std::thread closer([&]() {
        for (auto& t : producers) {
            t.join();
        }
        ch.close();
    });

    int total = 0;
    while (auto v = ch.receive()) {
        total += *v;
    }
    closer.join();
    EXPECT_EQ(total, 400);
}
