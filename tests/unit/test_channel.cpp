/**
 * @file test_channel.cpp
 * @brief Unit tests for the blocking Channel.
 */

#include "executor/channel.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace bundle_forwarder;
using namespace std::chrono_literals;

TEST(ChannelTest, FifoOrder) {
    Channel<int> ch;
    for (int i = 0; i < 5; ++i) ASSERT_TRUE(ch.push(i));
    for (int i = 0; i < 5; ++i) {
        auto v = ch.try_pop();
        ASSERT_TRUE(v.has_value());
        EXPECT_EQ(*v, i);
    }
    EXPECT_FALSE(ch.try_pop().has_value());
}

TEST(ChannelTest, PushBlocksAtCapacity) {
    Channel<int> ch(1);
    ASSERT_TRUE(ch.push(1));

    std::atomic<bool> pushed{false};
    std::jthread producer([&] {
        EXPECT_TRUE(ch.push(2));
        pushed.store(true);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(*ch.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(*ch.pop(), 2);
}

TEST(ChannelTest, PostIgnoresCapacity) {
    Channel<int> ch(1);
    ASSERT_TRUE(ch.push(1));
    ASSERT_TRUE(ch.post(2));
    ASSERT_TRUE(ch.post(3));
    EXPECT_EQ(ch.size(), 3u);
}

TEST(ChannelTest, PopUntilTimesOut) {
    Channel<std::string> ch;
    auto start = std::chrono::steady_clock::now();
    auto v = ch.pop_until(start + 30ms);
    EXPECT_FALSE(v.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(ChannelTest, CloseDrainsThenReportsEmpty) {
    Channel<int> ch;
    ch.push(7);
    ch.close();

    EXPECT_TRUE(ch.closed());
    EXPECT_FALSE(ch.push(8));
    EXPECT_FALSE(ch.post(9));
    EXPECT_EQ(*ch.pop(), 7);
    EXPECT_FALSE(ch.pop().has_value());
}

TEST(ChannelTest, CloseWakesBlockedConsumer) {
    Channel<int> ch;
    std::jthread consumer([&] {
        EXPECT_FALSE(ch.pop().has_value());
    });
    std::this_thread::sleep_for(20ms);
    ch.close();
}

TEST(ChannelTest, StopTokenWakesBlockedProducer) {
    Channel<int> ch(1);
    ch.push(1);

    std::stop_source source;
    std::atomic<bool> result{true};
    std::jthread producer([&] { result.store(ch.push(2, source.get_token())); });

    std::this_thread::sleep_for(20ms);
    source.request_stop();
    producer.join();

    EXPECT_FALSE(result.load());
    EXPECT_EQ(ch.size(), 1u);
}
