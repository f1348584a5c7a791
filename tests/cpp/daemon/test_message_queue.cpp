#include "daemon/core/message_queue.h"

#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>

using namespace std::chrono_literals;

TEST(MessageQueueTest, PreservesFifoOrder) {
    daemon_core::MessageQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.tryPop(), 1);
    EXPECT_EQ(queue.tryPop(), 2);
    EXPECT_EQ(queue.tryPop(), 3);
    EXPECT_FALSE(queue.tryPop().has_value());
    EXPECT_TRUE(queue.empty());
}

TEST(MessageQueueTest, DrainIsBoundedAndLeavesRemainder) {
    daemon_core::MessageQueue<int> queue;
    for (int i = 0; i < 10; ++i) {
        queue.push(i);
    }

    auto first = queue.drain(4);
    ASSERT_EQ(first.size(), 4u);
    EXPECT_EQ(first.front(), 0);
    EXPECT_EQ(first.back(), 3);
    EXPECT_EQ(queue.size(), 6u);

    auto rest = queue.drain(100);
    ASSERT_EQ(rest.size(), 6u);
    EXPECT_EQ(rest.front(), 4);
    EXPECT_TRUE(queue.empty());
}

TEST(MessageQueueTest, WaitForItemTimesOutWhenEmpty) {
    daemon_core::MessageQueue<int> queue;
    EXPECT_FALSE(queue.waitForItem(20ms));
}

TEST(MessageQueueTest, WaitForItemWakesOnPush) {
    daemon_core::MessageQueue<std::string> queue;
    std::thread producer([&queue] {
        std::this_thread::sleep_for(20ms);
        queue.push("hello");
    });

    EXPECT_TRUE(queue.waitForItem(2000ms));
    producer.join();
    EXPECT_EQ(queue.tryPop(), "hello");
}

TEST(MessageQueueTest, ClearDropsEverything) {
    daemon_core::MessageQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.clear();
    EXPECT_TRUE(queue.empty());
}

TEST(BoundedChannelTest, RejectsWhenFullWithoutTakingItem) {
    daemon_core::BoundedChannel<std::string> channel(2);
    std::string a = "a";
    std::string b = "b";
    std::string c = "c";

    EXPECT_TRUE(channel.tryPush(a));
    EXPECT_TRUE(channel.tryPush(b));
    EXPECT_FALSE(channel.tryPush(c));
    EXPECT_EQ(c, "c");

    EXPECT_EQ(channel.pop(10ms), "a");
    EXPECT_TRUE(channel.tryPush(c));
}

TEST(BoundedChannelTest, PopTimesOutWhenEmpty) {
    daemon_core::BoundedChannel<int> channel(4);
    EXPECT_FALSE(channel.pop(10ms).has_value());
    EXPECT_FALSE(channel.finished());
}

TEST(BoundedChannelTest, CloseDrainsRemainingItemsThenFinishes) {
    daemon_core::BoundedChannel<int> channel(4);
    int one = 1;
    int two = 2;
    channel.tryPush(one);
    channel.tryPush(two);
    channel.close();

    int three = 3;
    EXPECT_FALSE(channel.tryPush(three));
    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.finished());

    EXPECT_EQ(channel.pop(10ms), 1);
    EXPECT_EQ(channel.pop(10ms), 2);
    EXPECT_TRUE(channel.finished());
    EXPECT_FALSE(channel.pop(10ms).has_value());
}

TEST(BoundedChannelTest, CloseWakesBlockedConsumer) {
    daemon_core::BoundedChannel<int> channel(4);
    std::thread closer([&channel] {
        std::this_thread::sleep_for(20ms);
        channel.close();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.pop(5000ms).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4000ms);
    closer.join();
}
