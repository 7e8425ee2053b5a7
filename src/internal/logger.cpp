#include "logger.hpp"

#include <iostream>

namespace mcpcli
{
namespace internal
{

Logger::Logger(LogLevel threshold, std::optional<LogCallback> callback)
    : threshold_(threshold), callback_(std::move(callback))
{
}

bool Logger::enabled(LogLevel level) const
{
    return level != LogLevel::Off && threshold_ != LogLevel::Off && level >= threshold_;
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (!enabled(level))
        return;

    if (!callback_.has_value())
    {
        write_stderr(level, message);
        return;
    }

    try
    {
        (*callback_)(level, message);
    }
    catch (const std::exception& e)
    {
        // A broken sink must not take the transport down with it
        write_stderr(LogLevel::Warning, std::string("log callback threw: ") + e.what());
        write_stderr(level, message);
    }
}

void Logger::write_stderr(LogLevel level, const std::string& message) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[mcpcli] " << to_string(level) << ": " << message << std::endl;
}

} // namespace internal
} // namespace mcpcli
