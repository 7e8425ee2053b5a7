#include "stdio_loops.hpp"

#include "../line_buffer.hpp"

#include <algorithm>
#include <mcpcli/codec.hpp>
#include <mcpcli/errors.hpp>
#include <vector>

namespace mcpcli
{
namespace internal
{

const char* to_string(LoopExit exit)
{
    switch (exit)
    {
    case LoopExit::EndOfStream:
        return "EndOfStream";
    case LoopExit::ChannelClosed:
        return "ChannelClosed";
    case LoopExit::Cancelled:
        return "Cancelled";
    case LoopExit::Failed:
        return "Failed";
    }
    return "Unknown";
}

namespace
{

// Decode one line and hand it to the caller. False once the inbound side is gone.
bool forward_line(const std::string& line, Channel<Message>& inbound, const Logger& logger)
{
    if (logger.enabled(LogLevel::Debug))
        logger.debug("Processing line: " + preview_line(line));

    auto decoded = decode_message(line);
    if (auto* error = std::get_if<DecodeError>(&decoded))
    {
        logger.error(std::string(to_string(error->kind)) + ": " + error->message +
                     ". Line: " + preview_line(line));
        return true;
    }

    return inbound.send(std::get<Message>(std::move(decoded)));
}

LoopResult stopped(const std::atomic<bool>& cancelled)
{
    return LoopResult{cancelled ? LoopExit::Cancelled : LoopExit::ChannelClosed, {}};
}

} // namespace

LoopResult run_stdout_reader(subprocess::ReadPipe& pipe, Channel<Message>& inbound,
                             const std::atomic<bool>& cancelled, const Logger& logger,
                             std::chrono::milliseconds poll_interval, size_t chunk_size)
{
    logger.debug("Starting stdout reader");

    LineBuffer lines;
    std::vector<char> buffer(std::max<size_t>(chunk_size, 1));
    const int poll_ms = static_cast<int>(std::max<long long>(poll_interval.count(), 1));
    LoopResult result;

    try
    {
        while (true)
        {
            if (cancelled)
            {
                result = LoopResult{LoopExit::Cancelled, {}};
                break;
            }

            if (!pipe.is_open())
            {
                result = LoopResult{LoopExit::EndOfStream, {}};
                break;
            }

            // Wake up periodically so cancellation is noticed on a silent child
            if (!pipe.has_data(poll_ms))
                continue;

            size_t n = pipe.read(buffer.data(), buffer.size());
            if (n == 0)
            {
                // EOF: best effort for a last line without its terminator
                if (auto tail = lines.flush(); tail && !cancelled)
                {
                    if (!forward_line(*tail, inbound, logger))
                    {
                        result = stopped(cancelled);
                        break;
                    }
                }
                logger.debug("Server stdout closed.");
                result = LoopResult{LoopExit::EndOfStream, {}};
                break;
            }

            bool open = true;
            for (const auto& line : lines.add_data(buffer.data(), n))
            {
                if (cancelled || !forward_line(line, inbound, logger))
                {
                    open = false;
                    break;
                }
            }

            if (!open)
            {
                result = stopped(cancelled);
                break;
            }
        }
    }
    catch (const std::exception& e)
    {
        logger.error(std::string("Unexpected error in stdout reader: ") + e.what());
        result = LoopResult{LoopExit::Failed, e.what()};
    }

    logger.debug(std::string("Exiting stdout reader (") + to_string(result.exit) + ")");
    return result;
}

LoopResult run_stdin_writer(Channel<Message>& outbound, subprocess::WritePipe& pipe,
                            const std::atomic<bool>& cancelled, const Logger& logger,
                            std::chrono::milliseconds poll_interval)
{
    logger.debug("Starting stdin writer");

    const int poll_ms = static_cast<int>(std::max<long long>(poll_interval.count(), 1));
    LoopResult result;

    try
    {
        while (true)
        {
            auto message = outbound.receive();
            if (!message || cancelled)
            {
                result = stopped(cancelled);
                break;
            }

            const std::string line = encode_message(*message);
            if (logger.enabled(LogLevel::Debug))
                logger.debug("Sending: " + preview_line(line));

            size_t offset = 0;
            while (offset < line.size() && !cancelled)
            {
                size_t n = pipe.write(line.data() + offset, line.size() - offset);
                if (n == 0)
                {
                    // Child is not reading; wait for room without blocking cancellation
                    pipe.wait_writable(poll_ms);
                    continue;
                }
                offset += n;
            }

            if (offset < line.size())
            {
                // Cancelled mid-message; the rest is dropped
                result = LoopResult{LoopExit::Cancelled, {}};
                break;
            }
        }
    }
    catch (const WriteFailureError& e)
    {
        logger.error(std::string("Write to server stdin failed: ") + e.what());
        result = LoopResult{LoopExit::Failed, e.what()};
    }
    catch (const std::exception& e)
    {
        logger.error(std::string("Unexpected error in stdin writer: ") + e.what());
        result = LoopResult{LoopExit::Failed, e.what()};
    }

    logger.debug(std::string("Exiting stdin writer (") + to_string(result.exit) + ")");
    return result;
}

} // namespace internal
} // namespace mcpcli
