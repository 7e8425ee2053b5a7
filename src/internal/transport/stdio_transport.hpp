#ifndef MCPCLI_INTERNAL_TRANSPORT_STDIO_TRANSPORT_HPP
#define MCPCLI_INTERNAL_TRANSPORT_STDIO_TRANSPORT_HPP

#include "../logger.hpp"
#include "process_supervisor.hpp"
#include "stdio_loops.hpp"

#include <atomic>
#include <condition_variable>
#include <mcpcli/transport.hpp>
#include <memory>
#include <mutex>
#include <thread>

namespace mcpcli
{
namespace internal
{

/**
 * Transport to an MCP server running as a child process, one JSON-RPC
 * message per line over its stdin/stdout. The child's stderr is inherited.
 *
 * Three threads run while the session is open: the stdout reader, the stdin
 * writer, and a monitor that owns shutdown. The monitor sleeps until close()
 * is requested or a loop fails, then runs the Closing sequence exactly once.
 */
class StdioTransport : public Transport
{
  public:
    StdioTransport(ServerParameters params, SessionOptions options);
    ~StdioTransport() override;

    // No copy
    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    // Transport interface
    void open() override;
    void close() override;
    MessageReceiver& inbound() override;
    MessageSender& outbound() override;
    SessionState state() const override;
    bool is_running() const override;
    std::optional<int> exit_code() const override;
    std::optional<std::string> failure() const override;
    std::optional<std::string> termination_error() const override;
    long get_pid() const override;

  private:
    void reader_main();
    void writer_main();
    void monitor_main();

    // Called by a loop thread when it stops
    void report_loop_exit(const char* loop, const LoopResult& result);

    // Closing sequence; runs on the monitor thread, or inline if open() fails midway
    void shutdown();

    void set_state(SessionState state);

    const ServerParameters params_;
    const SessionOptions options_;
    Logger logger_;
    // mutable: is_running() polls the child
    mutable ProcessSupervisor supervisor_;

    std::unique_ptr<Channel<Message>> inbound_channel_;
    std::unique_ptr<Channel<Message>> outbound_channel_;
    std::unique_ptr<MessageReceiver> receiver_;
    std::unique_ptr<MessageSender> sender_;

    std::thread reader_thread_;
    std::thread writer_thread_;
    std::thread monitor_thread_;
    std::atomic<bool> cancelled_{false};

    // Guards state_, opened_, close_requested_ and failure_
    mutable std::mutex mutex_;
    std::condition_variable wake_monitor_;
    SessionState state_ = SessionState::Opening;
    bool opened_ = false;
    bool close_requested_ = false;
    std::optional<std::string> failure_;

    // Serializes callers of close() waiting for the monitor
    std::mutex close_mutex_;
};

} // namespace internal
} // namespace mcpcli

#endif // MCPCLI_INTERNAL_TRANSPORT_STDIO_TRANSPORT_HPP
