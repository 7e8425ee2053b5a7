#include "../../src/internal/transport/stdio_loops.hpp"
#include "../test_utils.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <mcpcli/codec.hpp>
#include <thread>
#include <vector>

using namespace mcpcli;
using namespace mcpcli::internal;
using namespace std::chrono_literals;

namespace
{

constexpr auto POLL = 20ms;

std::string line_with_id(int id)
{
    return "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) + ",\"result\":{}}\n";
}

std::vector<Message> drain(Channel<Message>& channel)
{
    std::vector<Message> messages;
    while (auto message = channel.receive())
        messages.push_back(std::move(*message));
    return messages;
}

} // namespace

// ============================================================================
// Stdout reader
// ============================================================================

TEST(StdoutReaderTest, DeliversLinesInOrderAcrossChunks)
{
    auto [out, in] = subprocess::make_pipe();
    Channel<Message> inbound(64);
    std::atomic<bool> cancelled{false};
    Logger logger(LogLevel::Off, std::nullopt);

    std::string stream;
    for (int i = 1; i <= 20; ++i)
        stream += line_with_id(i);

    // Odd-sized writes so lines straddle reads
    std::thread producer(
        [&in = in, &stream]
        {
            for (size_t offset = 0; offset < stream.size(); offset += 7)
            {
                test::write_all(in, stream.substr(offset, 7));
                std::this_thread::sleep_for(1ms);
            }
            in.close();
        });

    auto result = run_stdout_reader(out, inbound, cancelled, logger, POLL, 5);
    producer.join();
    inbound.close();

    EXPECT_EQ(result.exit, LoopExit::EndOfStream);
    auto messages = drain(inbound);
    ASSERT_EQ(messages.size(), 20u);
    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(*messages[i].id, i + 1);
}

TEST(StdoutReaderTest, SkipsMalformedLines)
{
    auto [out, in] = subprocess::make_pipe();
    Channel<Message> inbound(16);
    std::atomic<bool> cancelled{false};
    test::LogCapture capture;
    Logger logger(LogLevel::Debug, capture.callback());

    test::write_all(in, "not json at all\n" + line_with_id(1) + "\n   \n[1,2]\n" + line_with_id(2));
    in.close();

    auto result = run_stdout_reader(out, inbound, cancelled, logger, POLL, 4096);
    inbound.close();

    EXPECT_EQ(result.exit, LoopExit::EndOfStream);
    auto messages = drain(inbound);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(*messages[0].id, 1);
    EXPECT_EQ(*messages[1].id, 2);

    EXPECT_EQ(capture.count(LogLevel::Error), 2u);
    EXPECT_TRUE(capture.contains(LogLevel::Error, "MalformedJSON"));
    EXPECT_TRUE(capture.contains(LogLevel::Error, "InvalidMessageShape"));
    EXPECT_TRUE(capture.contains(LogLevel::Error, "not json at all"));
}

TEST(StdoutReaderTest, DecodesUnterminatedTailAtEof)
{
    auto [out, in] = subprocess::make_pipe();
    Channel<Message> inbound(4);
    std::atomic<bool> cancelled{false};
    Logger logger(LogLevel::Off, std::nullopt);

    test::write_all(in, line_with_id(1) + "{\"jsonrpc\":\"2.0\",\"method\":\"last\"}");
    in.close();

    auto result = run_stdout_reader(out, inbound, cancelled, logger, POLL, 4096);
    inbound.close();

    EXPECT_EQ(result.exit, LoopExit::EndOfStream);
    auto messages = drain(inbound);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(*messages[1].method, "last");
}

TEST(StdoutReaderTest, ObservesCancellationOnSilentPipe)
{
    auto [out, in] = subprocess::make_pipe();
    Channel<Message> inbound(1);
    std::atomic<bool> cancelled{false};
    Logger logger(LogLevel::Off, std::nullopt);

    auto future = std::async(std::launch::async,
                             [&, &out = out]
                             { return run_stdout_reader(out, inbound, cancelled, logger, POLL, 64); });

    std::this_thread::sleep_for(50ms);
    cancelled = true;

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(future.get().exit, LoopExit::Cancelled);
}

TEST(StdoutReaderTest, BlocksOnFullInboundWithoutLoss)
{
    auto [out, in] = subprocess::make_pipe();
    Channel<Message> inbound(0);
    std::atomic<bool> cancelled{false};
    Logger logger(LogLevel::Off, std::nullopt);

    for (int i = 1; i <= 5; ++i)
        test::write_all(in, line_with_id(i));
    in.close();

    auto future = std::async(std::launch::async,
                             [&, &out = out]
                             { return run_stdout_reader(out, inbound, cancelled, logger, POLL, 4096); });

    // Reader cannot finish until the consumer has taken every message
    EXPECT_EQ(future.wait_for(100ms), std::future_status::timeout);

    for (int i = 1; i <= 5; ++i)
    {
        std::this_thread::sleep_for(10ms);
        auto message = inbound.receive_for(2s);
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(*message->id, i);
    }

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(future.get().exit, LoopExit::EndOfStream);
}

TEST(StdoutReaderTest, StopsWhenInboundClosed)
{
    auto [out, in] = subprocess::make_pipe();
    Channel<Message> inbound(0);
    std::atomic<bool> cancelled{false};
    Logger logger(LogLevel::Off, std::nullopt);

    inbound.close();
    test::write_all(in, line_with_id(1));

    auto result = run_stdout_reader(out, inbound, cancelled, logger, POLL, 4096);
    EXPECT_EQ(result.exit, LoopExit::ChannelClosed);
}

TEST(StdoutReaderTest, UnopenedPipeEndsStream)
{
    subprocess::ReadPipe never_opened;
    Channel<Message> inbound(1);
    std::atomic<bool> cancelled{false};
    Logger logger(LogLevel::Off, std::nullopt);

    auto result = run_stdout_reader(never_opened, inbound, cancelled, logger, POLL, 16);
    EXPECT_EQ(result.exit, LoopExit::EndOfStream);
}

// ============================================================================
// Stdin writer
// ============================================================================

TEST(StdinWriterTest, OneLinePerMessageInOrder)
{
    auto [out, in] = subprocess::make_pipe();
    in.set_nonblocking();
    Channel<Message> outbound(8);
    std::atomic<bool> cancelled{false};
    Logger logger(LogLevel::Off, std::nullopt);

    for (int i = 1; i <= 3; ++i)
    {
        Message msg;
        msg.id = i;
        msg.method = "echo";
        msg.params = json{{"text", "multi\nline"}};
        ASSERT_TRUE(outbound.send(msg));
    }
    outbound.close();

    auto result = run_stdin_writer(outbound, in, cancelled, logger, POLL);
    EXPECT_EQ(result.exit, LoopExit::ChannelClosed);
    in.close();

    std::vector<std::string> lines;
    while (out.has_data(1000))
    {
        std::string line = test::read_line(out);
        if (line.empty())
            break;
        lines.push_back(line);
    }

    ASSERT_EQ(lines.size(), 3u);
    for (int i = 0; i < 3; ++i)
    {
        EXPECT_EQ(lines[i].back(), '\n');
        auto decoded = decode_message(lines[i]);
        ASSERT_TRUE(is_decoded(decoded));
        EXPECT_EQ(*std::get<Message>(decoded).id, i + 1);
        EXPECT_EQ((*std::get<Message>(decoded).params)["text"], "multi\nline");
    }
}

TEST(StdinWriterTest, ClosedReaderIsFatal)
{
    subprocess::suppress_sigpipe_on_this_thread();

    auto [out, in] = subprocess::make_pipe();
    in.set_nonblocking();
    out.close();

    Channel<Message> outbound(1);
    std::atomic<bool> cancelled{false};
    test::LogCapture capture;
    Logger logger(LogLevel::Debug, capture.callback());

    Message msg;
    msg.method = "notifications/initialized";
    outbound.send(msg);

    auto result = run_stdin_writer(outbound, in, cancelled, logger, POLL);

    EXPECT_TRUE(result.failed());
    EXPECT_FALSE(result.error.empty());
    EXPECT_TRUE(capture.contains(LogLevel::Error, "Write to server stdin failed"));
}

TEST(StdinWriterTest, ObservesCancellationWhilePipeIsFull)
{
    auto [out, in] = subprocess::make_pipe();
    in.set_nonblocking();
    Channel<Message> outbound(1);
    std::atomic<bool> cancelled{false};
    Logger logger(LogLevel::Off, std::nullopt);

    // Far larger than any pipe buffer, and nobody reads
    Message big;
    big.method = "bulk";
    big.params = json{{"data", std::string(4 * 1024 * 1024, 'x')}};
    outbound.send(big);

    auto future = std::async(std::launch::async,
                             [&, &in = in]
                             { return run_stdin_writer(outbound, in, cancelled, logger, POLL); });

    EXPECT_EQ(future.wait_for(100ms), std::future_status::timeout);
    cancelled = true;

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(future.get().exit, LoopExit::Cancelled);
}

TEST(StdinWriterTest, StopsWhenOutboundClosed)
{
    auto [out, in] = subprocess::make_pipe();
    Channel<Message> outbound(0);
    std::atomic<bool> cancelled{false};
    Logger logger(LogLevel::Off, std::nullopt);

    auto future = std::async(std::launch::async,
                             [&, &in = in]
                             { return run_stdin_writer(outbound, in, cancelled, logger, POLL); });

    std::this_thread::sleep_for(30ms);
    outbound.close();

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(future.get().exit, LoopExit::ChannelClosed);
}
