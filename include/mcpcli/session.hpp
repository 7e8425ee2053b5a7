#ifndef MCPCLI_SESSION_HPP
#define MCPCLI_SESSION_HPP

#include <chrono>
#include <mcpcli/transport.hpp>
#include <mcpcli/types.hpp>
#include <memory>
#include <optional>
#include <string>

namespace mcpcli
{

/**
 * Scoped connection to one MCP server over stdio.
 *
 * Construction spawns the server and starts the I/O loops; destruction (or
 * close()) terminates it. Between the two, messages flow through send() and
 * receive(), or through the endpoints returned by inbound() and outbound(),
 * which may be handed to other threads.
 *
 * Example:
 *   mcpcli::StdioSession session({"my-server", {"--stdio"}, std::nullopt});
 *   session.send(mcpcli::make_ping_request(1));
 *   auto reply = session.receive_for(std::chrono::seconds(5));
 */
class StdioSession
{
  public:
    // Throws InvalidParametersError or SpawnError
    explicit StdioSession(const ServerParameters& params, const SessionOptions& options = {});

    // Test-only/advanced: take over an unopened transport and open it.
    explicit StdioSession(std::unique_ptr<Transport> transport);

    ~StdioSession();

    // No copy, move only
    StdioSession(const StdioSession&) = delete;
    StdioSession& operator=(const StdioSession&) = delete;
    StdioSession(StdioSession&&) noexcept;
    StdioSession& operator=(StdioSession&&) noexcept;

    MessageReceiver& inbound();
    MessageSender& outbound();

    // Shorthands for outbound().send() and inbound().receive()
    bool send(Message message);
    std::optional<Message> receive();
    std::optional<Message> receive_for(std::chrono::milliseconds timeout);

    // Idempotent; safe to call from several threads
    void close();

    SessionState state() const;
    bool is_running() const;
    long get_pid() const;
    std::optional<int> exit_code() const;
    std::optional<std::string> failure() const;
    std::optional<std::string> termination_error() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpcli

#endif // MCPCLI_SESSION_HPP
