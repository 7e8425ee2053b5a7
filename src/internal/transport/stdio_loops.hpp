#ifndef MCPCLI_INTERNAL_TRANSPORT_STDIO_LOOPS_HPP
#define MCPCLI_INTERNAL_TRANSPORT_STDIO_LOOPS_HPP

#include "../logger.hpp"
#include "../subprocess/process.hpp"

#include <atomic>
#include <chrono>
#include <mcpcli/channel.hpp>
#include <mcpcli/types.hpp>
#include <string>

namespace mcpcli
{
namespace internal
{

enum class LoopExit
{
    EndOfStream,   // stdout reached EOF
    ChannelClosed, // the channel this loop feeds or drains was closed
    Cancelled,     // the session asked the loop to stop
    Failed         // read or write error; the session must shut down
};

const char* to_string(LoopExit exit);

struct LoopResult
{
    LoopExit exit = LoopExit::EndOfStream;
    std::string error;

    bool failed() const
    {
        return exit == LoopExit::Failed;
    }
};

/**
 * Read the child's stdout until EOF, cancellation or a read error.
 *
 * Chunks are reassembled into lines; every non-blank line is decoded and
 * forwarded to inbound in order. Lines that fail to decode are logged and
 * dropped. A non-blank unterminated tail is decoded once at EOF.
 */
LoopResult run_stdout_reader(subprocess::ReadPipe& pipe, Channel<Message>& inbound,
                             const std::atomic<bool>& cancelled, const Logger& logger,
                             std::chrono::milliseconds poll_interval, size_t chunk_size);

/**
 * Drain outbound into the child's stdin until the channel closes or a write fails.
 * The pipe is expected to be non-blocking so a full pipe cannot hide cancellation.
 */
LoopResult run_stdin_writer(Channel<Message>& outbound, subprocess::WritePipe& pipe,
                            const std::atomic<bool>& cancelled, const Logger& logger,
                            std::chrono::milliseconds poll_interval);

} // namespace internal
} // namespace mcpcli

#endif // MCPCLI_INTERNAL_TRANSPORT_STDIO_LOOPS_HPP
