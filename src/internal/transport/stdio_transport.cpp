#include "stdio_transport.hpp"

#include <mcpcli/errors.hpp>

namespace mcpcli
{
namespace internal
{

StdioTransport::StdioTransport(ServerParameters params, SessionOptions options)
    : params_(std::move(params)), options_(std::move(options)),
      logger_(options_.log_level, options_.log_callback), supervisor_(logger_)
{
}

StdioTransport::~StdioTransport()
{
    close();
}

// ============================================================================
// Lifecycle
// ============================================================================

void StdioTransport::open()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (opened_ || state_ != SessionState::Opening)
            throw McpError("Transport has already been opened");
        opened_ = true;
    }

    try
    {
        supervisor_.spawn(params_, options_);
    }
    catch (const std::exception& e)
    {
        // Nothing was acquired: straight to Closed
        logger_.error(std::string("Failed to start server: ") + e.what());
        set_state(SessionState::Closed);
        throw;
    }

    try
    {
        inbound_channel_ = std::make_unique<Channel<Message>>(options_.inbound_capacity);
        outbound_channel_ = std::make_unique<Channel<Message>>(options_.outbound_capacity);
        receiver_ = std::make_unique<MessageReceiver>(*inbound_channel_);
        sender_ = std::make_unique<MessageSender>(*outbound_channel_);

        set_state(SessionState::Running);

        reader_thread_ = std::thread(&StdioTransport::reader_main, this);
        writer_thread_ = std::thread(&StdioTransport::writer_main, this);
        monitor_thread_ = std::thread(&StdioTransport::monitor_main, this);
    }
    catch (const std::exception& e)
    {
        // The child is already running; release it before reporting
        logger_.error(std::string("Failed to start session: ") + e.what());
        shutdown();
        throw SpawnError(std::string("Failed to start session: ") + e.what());
    }

    logger_.info("Session started for " + params_.command + " (PID " +
                 std::to_string(supervisor_.pid()) + ")");
}

void StdioTransport::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!opened_)
        {
            state_ = SessionState::Closed;
            return;
        }
        close_requested_ = true;
    }
    wake_monitor_.notify_all();

    // Later callers block here until the first one has seen the monitor finish
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (monitor_thread_.joinable() && monitor_thread_.get_id() != std::this_thread::get_id())
        monitor_thread_.join();
}

void StdioTransport::shutdown()
{
    set_state(SessionState::Closing);
    logger_.debug("Closing session for " + params_.command);

    // Loops stop at their next suspension point
    cancelled_ = true;
    if (inbound_channel_)
        inbound_channel_->close();
    if (outbound_channel_)
        outbound_channel_->close();

    supervisor_.terminate(options_.graceful_timeout);

    if (reader_thread_.joinable())
        reader_thread_.join();
    if (writer_thread_.joinable())
        writer_thread_.join();

    supervisor_.close_pipes();

    if (auto code = supervisor_.wait_exit(options_.close_grace))
        logger_.info("Server exited with code " + std::to_string(*code));
    else
        logger_.warning("Exit status of server process " + std::to_string(supervisor_.pid()) +
                        " is not available");

    set_state(SessionState::Closed);
}

// ============================================================================
// Threads
// ============================================================================

void StdioTransport::reader_main()
{
    auto result = run_stdout_reader(supervisor_.stdout_pipe(), *inbound_channel_, cancelled_,
                                    logger_, options_.read_poll_interval,
                                    options_.read_chunk_size);

    // Nothing more can arrive; the caller sees the end of the stream
    inbound_channel_->close();
    report_loop_exit("stdout reader", result);
}

void StdioTransport::writer_main()
{
    // A dead child must surface as EPIPE, not kill the whole process
    subprocess::suppress_sigpipe_on_this_thread();

    auto result = run_stdin_writer(*outbound_channel_, supervisor_.stdin_pipe(), cancelled_,
                                   logger_, options_.read_poll_interval);
    report_loop_exit("stdin writer", result);
}

void StdioTransport::monitor_main()
{
    std::optional<std::string> failure;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        wake_monitor_.wait(lock, [this] { return close_requested_ || failure_.has_value(); });
        if (!close_requested_)
            failure = failure_;
    }

    if (failure)
        logger_.error("Closing session after I/O failure in " + *failure);

    shutdown();
}

void StdioTransport::report_loop_exit(const char* loop, const LoopResult& result)
{
    if (!result.failed())
        return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_)
            failure_ = std::string(loop) + ": " + result.error;
    }
    wake_monitor_.notify_all();
}

// ============================================================================
// Accessors
// ============================================================================

MessageReceiver& StdioTransport::inbound()
{
    if (!receiver_)
        throw McpError("Transport is not open");
    return *receiver_;
}

MessageSender& StdioTransport::outbound()
{
    if (!sender_)
        throw McpError("Transport is not open");
    return *sender_;
}

void StdioTransport::set_state(SessionState state)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
    }
    logger_.debug(std::string("Session state: ") + to_string(state));
}

SessionState StdioTransport::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool StdioTransport::is_running() const
{
    return state() == SessionState::Running && supervisor_.is_running();
}

std::optional<int> StdioTransport::exit_code() const
{
    return supervisor_.exit_code();
}

std::optional<std::string> StdioTransport::failure() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

std::optional<std::string> StdioTransport::termination_error() const
{
    return supervisor_.termination_error();
}

long StdioTransport::get_pid() const
{
    return supervisor_.pid();
}

} // namespace internal

std::unique_ptr<Transport> create_stdio_transport(const ServerParameters& params,
                                                  const SessionOptions& options)
{
    return std::make_unique<internal::StdioTransport>(params, options);
}

} // namespace mcpcli
