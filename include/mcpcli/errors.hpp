#ifndef MCPCLI_ERRORS_HPP
#define MCPCLI_ERRORS_HPP

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace mcpcli
{

// Base exception
class McpError : public std::runtime_error
{
  public:
    explicit McpError(const std::string& message) : std::runtime_error(message) {}
};

// Bad ServerParameters (empty command, args not a list)
class InvalidParametersError : public McpError
{
  public:
    explicit InvalidParametersError(const std::string& message) : McpError(message) {}
};

// Process failed to start
class SpawnError : public McpError
{
  public:
    explicit SpawnError(const std::string& message, int error_number = 0)
        : McpError(message), error_number_(error_number)
    {
    }

    // errno reported by pipe/fork/exec, 0 when the failure was not an OS error
    int error_number() const
    {
        return error_number_;
    }

  private:
    int error_number_;
};

// Writing to the child's stdin failed
class WriteFailureError : public McpError
{
  public:
    explicit WriteFailureError(const std::string& message) : McpError(message) {}
};

// Server configuration file problems
class ConfigError : public McpError
{
  public:
    explicit ConfigError(const std::string& message) : McpError(message) {}
};

// JSON decode error
class JSONDecodeError : public McpError
{
  public:
    explicit JSONDecodeError(const std::string& message) : McpError(message) {}
};

// Message parse error (valid JSON, wrong shape)
class MessageParseError : public McpError
{
  public:
    explicit MessageParseError(const std::string& message) : McpError(message), data_(nullptr) {}

    MessageParseError(const std::string& message, const nlohmann::json& data)
        : McpError(message), data_(std::make_shared<nlohmann::json>(data))
    {
    }

    // Get the optional data associated with the parse error
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    std::shared_ptr<nlohmann::json> data_;
};

} // namespace mcpcli

#endif // MCPCLI_ERRORS_HPP
