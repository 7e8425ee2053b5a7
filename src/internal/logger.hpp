#ifndef MCPCLI_INTERNAL_LOGGER_HPP
#define MCPCLI_INTERNAL_LOGGER_HPP

#include <mcpcli/types.hpp>
#include <mutex>
#include <optional>
#include <string>

namespace mcpcli
{
namespace internal
{

// Per-session log sink: the user callback when set, std::cerr otherwise
class Logger
{
  public:
    Logger() = default;
    Logger(LogLevel threshold, std::optional<LogCallback> callback);

    // No copy
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool enabled(LogLevel level) const;
    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

  private:
    void write_stderr(LogLevel level, const std::string& message) const;

    LogLevel threshold_ = LogLevel::Warning;
    std::optional<LogCallback> callback_;
    mutable std::mutex mutex_;
};

} // namespace internal
} // namespace mcpcli

#endif // MCPCLI_INTERNAL_LOGGER_HPP
