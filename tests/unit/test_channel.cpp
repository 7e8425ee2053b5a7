#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mcpcli/channel.hpp>
#include <string>
#include <thread>
#include <vector>

using namespace mcpcli;
using namespace std::chrono_literals;

TEST(ChannelTest, BufferedFifo)
{
    Channel<int> channel(3);
    EXPECT_TRUE(channel.send(1));
    EXPECT_TRUE(channel.send(2));
    EXPECT_TRUE(channel.send(3));

    EXPECT_EQ(channel.receive(), 1);
    EXPECT_EQ(channel.receive(), 2);
    EXPECT_EQ(channel.receive(), 3);
}

TEST(ChannelTest, BufferedSendBlocksWhenFull)
{
    Channel<int> channel(1);
    ASSERT_TRUE(channel.send(1));

    std::atomic<bool> sent{false};
    std::thread producer(
        [&]
        {
            channel.send(2);
            sent = true;
        });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(sent);

    EXPECT_EQ(channel.receive(), 1);
    producer.join();
    EXPECT_TRUE(sent);
    EXPECT_EQ(channel.receive(), 2);
}

TEST(ChannelTest, RendezvousWaitsForReceiver)
{
    Channel<std::string> channel; // capacity 0

    std::atomic<bool> delivered{false};
    std::thread producer(
        [&]
        {
            EXPECT_TRUE(channel.send("hello"));
            delivered = true;
        });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(delivered);

    EXPECT_EQ(channel.receive(), "hello");
    producer.join();
    EXPECT_TRUE(delivered);
}

TEST(ChannelTest, CloseFailsPendingRendezvous)
{
    Channel<int> channel;

    std::atomic<bool> result{true};
    std::thread producer([&] { result = channel.send(7); });

    std::this_thread::sleep_for(50ms);
    channel.close();
    producer.join();

    EXPECT_FALSE(result);
    // The withdrawn item is never delivered
    EXPECT_FALSE(channel.receive().has_value());
}

TEST(ChannelTest, CloseWakesReceiver)
{
    Channel<int> channel(2);

    std::optional<int> received = 0;
    std::thread consumer([&] { received = channel.receive(); });

    std::this_thread::sleep_for(50ms);
    channel.close();
    consumer.join();

    EXPECT_FALSE(received.has_value());
}

TEST(ChannelTest, ReceiveDrainsAfterClose)
{
    Channel<int> channel(4);
    channel.send(1);
    channel.send(2);
    channel.close();

    EXPECT_FALSE(channel.send(3));
    EXPECT_EQ(channel.receive(), 1);
    EXPECT_EQ(channel.receive(), 2);
    EXPECT_FALSE(channel.receive().has_value());
    EXPECT_TRUE(channel.is_closed());
}

TEST(ChannelTest, CloseIsIdempotent)
{
    Channel<int> channel;
    channel.close();
    channel.close();
    EXPECT_TRUE(channel.is_closed());
}

TEST(ChannelTest, ReceiveForTimesOut)
{
    Channel<int> channel(1);
    auto start = std::chrono::steady_clock::now();
    auto value = channel.receive_for(50ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(value.has_value());
    EXPECT_FALSE(channel.is_closed());
    EXPECT_GE(elapsed, 40ms);
}

TEST(ChannelTest, TryReceive)
{
    Channel<int> channel(1);
    EXPECT_FALSE(channel.try_receive().has_value());
    channel.send(5);
    EXPECT_EQ(channel.try_receive(), 5);
}

TEST(ChannelTest, OrderPreservedAcrossThreads)
{
    Channel<int> channel(0);
    constexpr int count = 500;

    std::thread producer(
        [&]
        {
            for (int i = 0; i < count; ++i)
                channel.send(i);
            channel.close();
        });

    std::vector<int> received;
    while (auto value = channel.receive())
        received.push_back(*value);
    producer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(count));
    for (int i = 0; i < count; ++i)
        EXPECT_EQ(received[i], i);
}
