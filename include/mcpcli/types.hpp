#ifndef MCPCLI_TYPES_HPP
#define MCPCLI_TYPES_HPP

#include <chrono>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpcli
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Server launch parameters
// ============================================================================

/// How to launch one server process. Immutable once handed to a session.
struct ServerParameters
{
    std::string command;                               // Required, non-empty
    std::vector<std::string> args;                     // Ordered argument list
    std::optional<std::map<std::string, std::string>> env; // Added/overriding variables
};

// ============================================================================
// JSON-RPC message
// ============================================================================

/// One line of the wire protocol. The transport only checks the shape;
/// method names and ids are never interpreted here.
struct Message
{
    std::string jsonrpc = "2.0";
    std::optional<json> id; // string or integer
    std::optional<std::string> method;
    std::optional<json> params;
    std::optional<json> result; // present even when the value is null
    std::optional<json> error;
    json extra = json::object(); // Unrecognized top-level fields, kept verbatim

    bool is_request() const
    {
        return method.has_value() && id.has_value();
    }

    bool is_notification() const
    {
        return method.has_value() && !id.has_value();
    }

    bool is_response() const
    {
        return !method.has_value() && (result.has_value() || error.has_value());
    }

    /// Convert to JSON, leaving out absent fields
    json to_json() const;

    /// Create from JSON. Throws MessageParseError if the value has the wrong shape.
    static Message from_json(const json& j);
};

bool operator==(const Message& lhs, const Message& rhs);
bool operator!=(const Message& lhs, const Message& rhs);

// ============================================================================
// Decode results
// ============================================================================

enum class DecodeErrorKind
{
    MalformedJSON,
    InvalidMessageShape
};

struct DecodeError
{
    DecodeErrorKind kind;
    std::string message;
};

using DecodeResult = std::variant<Message, DecodeError>;

inline bool is_decoded(const DecodeResult& result)
{
    return std::holds_alternative<Message>(result);
}

const char* to_string(DecodeErrorKind kind);

// ============================================================================
// Session configuration
// ============================================================================

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

const char* to_string(LogLevel level);

using LogCallback = std::function<void(LogLevel, const std::string&)>;

enum class SessionState
{
    Opening,
    Running,
    Closing,
    Closed
};

const char* to_string(SessionState state);

struct SessionOptions
{
    // Channel buffering. 0 means a send blocks until the other side takes the message.
    size_t inbound_capacity = 0;
    size_t outbound_capacity = 0;

    // Time the child gets to exit after the termination request before it is killed
    std::chrono::milliseconds graceful_timeout{5000};
    // Extra bound close() waits on top of graceful_timeout
    std::chrono::milliseconds close_grace{1000};

    // How often the stdout reader wakes up to check for cancellation
    std::chrono::milliseconds read_poll_interval{100};
    size_t read_chunk_size = 4096;

    // Launch environment. When base_environment is unset, default_environment() is used.
    // When inherit_environment is true the child also sees the full parent environment.
    std::optional<std::map<std::string, std::string>> base_environment;
    bool inherit_environment = false;
    std::optional<std::string> working_directory;

    // Security: restrict which executables may be launched
    std::vector<std::string> allowed_command_paths; // empty = no restriction
    std::optional<std::string> command_sha256;      // hex SHA-256 of the resolved executable

    /// Minimum level of records passed to the log sink.
    LogLevel log_level = LogLevel::Warning;

    /// Log sink. When unset, records go to std::cerr.
    /// Note: Invoked from the reader and writer threads - ensure callback is thread-safe.
    std::optional<LogCallback> log_callback;
};

} // namespace mcpcli

#endif // MCPCLI_TYPES_HPP
