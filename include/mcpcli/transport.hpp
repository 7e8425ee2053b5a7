#ifndef MCPCLI_TRANSPORT_HPP
#define MCPCLI_TRANSPORT_HPP

#include <chrono>
#include <mcpcli/channel.hpp>
#include <mcpcli/types.hpp>
#include <memory>
#include <optional>
#include <string>

namespace mcpcli
{

/**
 * Receiving end handed to the caller: decoded messages from the server, in
 * the order their lines appeared on stdout.
 */
class MessageReceiver
{
  public:
    explicit MessageReceiver(Channel<Message>& channel) : channel_(channel) {}

    // Blocks for the next message. std::nullopt means the stream has ended.
    std::optional<Message> receive()
    {
        return channel_.receive();
    }

    std::optional<Message> receive_for(std::chrono::milliseconds timeout)
    {
        return channel_.receive_for(timeout);
    }

    bool is_closed() const
    {
        return channel_.is_closed();
    }

  private:
    Channel<Message>& channel_;
};

/**
 * Sending end handed to the caller: messages written to the server's stdin,
 * one line each, in send order.
 */
class MessageSender
{
  public:
    explicit MessageSender(Channel<Message>& channel) : channel_(channel) {}

    // Blocks while the channel is full. False once the session is closing.
    bool send(Message message)
    {
        return channel_.send(std::move(message));
    }

    bool is_closed() const
    {
        return channel_.is_closed();
    }

  private:
    Channel<Message>& channel_;
};

/**
 * Abstract message transport to one MCP server.
 *
 * A transport moves through Opening -> Running -> Closing -> Closed. open()
 * acquires the server, close() releases it; close() is idempotent and safe to
 * call from several threads at once.
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Start the server and its I/O loops.
     * Throws InvalidParametersError or SpawnError; the transport is Closed afterwards.
     */
    virtual void open() = 0;

    /**
     * Stop the I/O loops, terminate the server and release its pipes.
     * Never throws. Returns once the transport is Closed.
     */
    virtual void close() = 0;

    // Endpoints stay valid until the transport is destroyed. Throws McpError before open().
    virtual MessageReceiver& inbound() = 0;
    virtual MessageSender& outbound() = 0;

    virtual SessionState state() const = 0;

    // True while the session is Running and the server has not exited
    virtual bool is_running() const = 0;

    // Server exit status, if it has been observed
    virtual std::optional<int> exit_code() const = 0;

    // The I/O failure that shut the session down, if any
    virtual std::optional<std::string> failure() const = 0;

    // First error met while terminating the server, if any
    virtual std::optional<std::string> termination_error() const = 0;

    /**
     * Get the process ID for subprocess transports.
     * Returns 0 for non-subprocess transports.
     */
    virtual long get_pid() const
    {
        return 0;
    }
};

// Unopened stdio transport for params. Call open() to start the server.
std::unique_ptr<Transport> create_stdio_transport(const ServerParameters& params,
                                                  const SessionOptions& options = {});

} // namespace mcpcli

#endif // MCPCLI_TRANSPORT_HPP
