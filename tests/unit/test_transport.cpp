#include "../test_utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <gtest/gtest.h>
#include <mcpcli/errors.hpp>
#include <mcpcli/messages.hpp>
#include <mcpcli/session.hpp>
#include <mcpcli/transport.hpp>
#include <pthread.h>
#include <signal.h>
#include <thread>
#include <vector>

using namespace mcpcli;
using namespace std::chrono_literals;

namespace
{

std::string notification_script(const std::string& method)
{
    return "echo '{\"jsonrpc\":\"2.0\",\"method\":\"" + method + "\"}'";
}

} // namespace

// ============================================================================
// Message flow
// ============================================================================

TEST(StdioSessionTest, EchoRoundTrip)
{
    StdioSession session(test::echo_server(), test::test_options());
    EXPECT_EQ(session.state(), SessionState::Running);
    EXPECT_TRUE(session.is_running());
    EXPECT_GT(session.get_pid(), 0);

    Message request = make_request(1, "ping");
    ASSERT_TRUE(session.send(request));

    auto reply = session.receive_for(5s);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(*reply, request);

    session.close();
    EXPECT_EQ(session.state(), SessionState::Closed);
    EXPECT_TRUE(session.exit_code().has_value());
    EXPECT_FALSE(session.failure().has_value());
}

TEST(StdioSessionTest, PreservesOrder)
{
    StdioSession session(test::echo_server(), test::test_options());
    constexpr int count = 50;

    std::thread sender(
        [&session]
        {
            for (int i = 0; i < count; ++i)
                session.send(make_notification("tick", {{"n", i}}));
        });

    for (int i = 0; i < count; ++i)
    {
        auto message = session.receive_for(5s);
        ASSERT_TRUE(message.has_value()) << "message " << i;
        EXPECT_EQ((*message->params)["n"], i);
    }
    sender.join();
}

TEST(StdioSessionTest, SkipsMalformedServerOutput)
{
    test::LogCapture capture;
    StdioSession session(test::shell_server("echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}';"
                                            "echo 'this is not json';"
                                            "echo '{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{}}'"),
                         test::test_options(&capture));

    auto first = session.receive_for(5s);
    auto second = session.receive_for(5s);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first->id, 1);
    EXPECT_EQ(*second->id, 2);

    // Server exited: end of stream, not an error
    EXPECT_FALSE(session.receive().has_value());
    EXPECT_TRUE(capture.contains(LogLevel::Error, "this is not json"));
}

// Servers may answer ping with a null result; it must still read as the matching response
TEST(StdioSessionTest, NullResultResponseMatchesRequest)
{
    StdioSession session(test::shell_server("read request; "
                                            "echo '{\"jsonrpc\":\"2.0\",\"id\":7,\"result\":null}'; "
                                            "exec cat"),
                         test::test_options());

    ASSERT_TRUE(session.send(make_ping_request(7)));

    auto reply = session.receive_for(5s);
    ASSERT_TRUE(reply.has_value());
    EXPECT_TRUE(reply->is_response());
    ASSERT_TRUE(reply->id.has_value());
    EXPECT_EQ(*reply->id, 7);
    ASSERT_TRUE(reply->result.has_value());
    EXPECT_TRUE(reply->result->is_null());
    EXPECT_FALSE(reply->error.has_value());
}

TEST(StdioSessionTest, EndOfStreamWhenServerExits)
{
    StdioSession session(test::shell_server("exit 3"), test::test_options());

    EXPECT_FALSE(session.receive().has_value());

    session.close();
    EXPECT_EQ(session.exit_code(), 3);
    EXPECT_FALSE(session.failure().has_value());
}

TEST(StdioSessionTest, EndpointsUsableFromOtherThreads)
{
    StdioSession session(test::echo_server(), test::test_options());
    MessageSender& outbound = session.outbound();
    MessageReceiver& inbound = session.inbound();

    std::vector<Message> received;
    std::atomic<int> count{0};
    std::thread consumer(
        [&]
        {
            while (auto message = inbound.receive())
            {
                received.push_back(*message);
                ++count;
            }
        });

    for (int i = 1; i <= 3; ++i)
        EXPECT_TRUE(outbound.send(make_ping_request(i)));

    EXPECT_TRUE(test::wait_until([&] { return count == 3; }));
    session.close();
    consumer.join();

    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(*received[2].id, 3);

    EXPECT_TRUE(inbound.is_closed());
    EXPECT_TRUE(outbound.is_closed());
    EXPECT_FALSE(outbound.send(make_ping_request(4)));
}

// ============================================================================
// Open failures
// ============================================================================

TEST(StdioSessionTest, EmptyCommandIsInvalid)
{
    EXPECT_THROW(StdioSession(ServerParameters{}, test::test_options()), InvalidParametersError);
}

TEST(StdioSessionTest, MissingCommandIsSpawnError)
{
    EXPECT_THROW(StdioSession({"mcpcli_no_such_server_12345", {}, std::nullopt},
                              test::test_options()),
                 SpawnError);
}

TEST(StdioTransportTest, LifecycleWithoutOpen)
{
    auto transport = create_stdio_transport(test::echo_server(), test::test_options());
    EXPECT_EQ(transport->state(), SessionState::Opening);
    EXPECT_THROW(transport->inbound(), McpError);
    EXPECT_FALSE(transport->is_running());

    transport->close();
    EXPECT_EQ(transport->state(), SessionState::Closed);
    EXPECT_THROW(transport->open(), McpError);
}

TEST(StdioTransportTest, FailedOpenEndsClosed)
{
    auto transport =
        create_stdio_transport({"/nonexistent/mcp/server", {}, std::nullopt}, test::test_options());

    EXPECT_THROW(transport->open(), SpawnError);
    EXPECT_EQ(transport->state(), SessionState::Closed);
    EXPECT_NO_THROW(transport->close());
    EXPECT_EQ(transport->get_pid(), 0);
}

TEST(StdioTransportTest, OpenTwiceFails)
{
    auto transport = create_stdio_transport(test::echo_server(), test::test_options());
    transport->open();
    EXPECT_THROW(transport->open(), McpError);
    transport->close();
}

// ============================================================================
// Shutdown
// ============================================================================

TEST(StdioSessionTest, CloseRightAfterSend)
{
    StdioSession session(test::echo_server(), test::test_options());
    ASSERT_TRUE(session.send(make_ping_request(1)));

    EXPECT_NO_THROW(session.close());
    EXPECT_EQ(session.state(), SessionState::Closed);
    EXPECT_TRUE(session.exit_code().has_value());
}

TEST(StdioSessionTest, CloseForcesStubbornServer)
{
    test::LogCapture capture;
    SessionOptions options = test::test_options(&capture);
    options.graceful_timeout = 300ms;

    StdioSession session(test::shell_server("trap '' TERM; " + notification_script("ready") +
                                            "; exec sleep 30"),
                         options);
    auto ready = session.receive_for(5s);
    ASSERT_TRUE(ready.has_value());
    EXPECT_EQ(*ready->method, "ready");

    auto start = std::chrono::steady_clock::now();
    session.close();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, options.graceful_timeout + options.close_grace + 2s);
    EXPECT_EQ(session.exit_code(), 128 + SIGKILL);
    EXPECT_TRUE(capture.contains(LogLevel::Warning, "Forcefully killing"));
}

// The opening thread may block SIGTERM for its own sigwait; the server must not inherit it
TEST(StdioSessionTest, GracefulCloseWhenOpenerBlocksSigterm)
{
    test::LogCapture capture;
    SessionOptions options = test::test_options(&capture);

    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    sigset_t previous;
    ASSERT_EQ(pthread_sigmask(SIG_BLOCK, &blocked, &previous), 0);

    StdioSession session(test::echo_server(), options);
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    ASSERT_TRUE(session.is_running());

    auto start = std::chrono::steady_clock::now();
    session.close();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, options.graceful_timeout);
    EXPECT_EQ(session.exit_code(), 128 + SIGTERM);
    EXPECT_FALSE(capture.contains(LogLevel::Warning, "Forcefully killing"));
}

TEST(StdioSessionTest, ConcurrentCloseIsIdempotent)
{
    StdioSession session(test::echo_server(), test::test_options());

    std::vector<std::thread> closers;
    for (int i = 0; i < 8; ++i)
        closers.emplace_back([&session] { session.close(); });
    for (auto& closer : closers)
        closer.join();

    EXPECT_EQ(session.state(), SessionState::Closed);
    EXPECT_NO_THROW(session.close());
    EXPECT_FALSE(session.send(make_ping_request(1)));
    EXPECT_FALSE(session.receive().has_value());
}

TEST(StdioSessionTest, DestructorTerminatesServer)
{
    long pid = 0;
    {
        StdioSession session({"/bin/sleep", {"30"}, std::nullopt}, test::test_options());
        pid = session.get_pid();
        ASSERT_GT(pid, 0);
    }
    EXPECT_EQ(::kill(static_cast<pid_t>(pid), 0), -1);
}

TEST(StdioSessionTest, WriteFailureClosesWholeSession)
{
    test::LogCapture capture;
    // The server stops reading stdin but stays alive
    StdioSession session(test::shell_server("exec 0<&-; " + notification_script("ready") +
                                            "; exec sleep 30"),
                         test::test_options(&capture));

    auto ready = session.receive_for(5s);
    ASSERT_TRUE(ready.has_value());

    // Taken by the writer, then the write hits a pipe with no reader
    session.send(make_ping_request(1));

    ASSERT_TRUE(test::wait_until([&] { return session.state() == SessionState::Closed; }));
    EXPECT_FALSE(session.send(make_ping_request(2)));
    EXPECT_FALSE(session.receive().has_value());

    auto failure = session.failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_NE(failure->find("stdin writer"), std::string::npos);
    EXPECT_EQ(session.exit_code(), 128 + SIGTERM);
    EXPECT_TRUE(capture.contains(LogLevel::Error, "Write to server stdin failed"));
}

TEST(StdioSessionTest, LogsLifecycle)
{
    test::LogCapture capture;
    {
        StdioSession session(test::echo_server(), test::test_options(&capture));
        session.send(make_ping_request(1));
        session.receive_for(5s);
    }

    EXPECT_TRUE(capture.contains(LogLevel::Debug, "Subprocess started with PID"));
    EXPECT_TRUE(capture.contains(LogLevel::Debug, "Sending:"));
    EXPECT_TRUE(capture.contains(LogLevel::Info, "Server exited with code"));
}

TEST(StdioSessionTest, MoveTransfersOwnership)
{
    StdioSession first(test::echo_server(), test::test_options());
    long pid = first.get_pid();

    StdioSession second(std::move(first));
    EXPECT_EQ(second.get_pid(), pid);
    EXPECT_EQ(first.state(), SessionState::Closed);
    EXPECT_THROW(first.inbound(), McpError);

    ASSERT_TRUE(second.send(make_ping_request(9)));
    auto reply = second.receive_for(5s);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(*reply->id, 9);
}
