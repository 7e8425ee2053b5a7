#ifndef MCPCLI_MESSAGES_HPP
#define MCPCLI_MESSAGES_HPP

#include <mcpcli/types.hpp>
#include <string>

namespace mcpcli
{

// MCP protocol revision announced in initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Request with the given id. params is omitted from the wire when null.
Message make_request(const json& id, const std::string& method, const json& params = nullptr);

// Notification (no id). params is omitted from the wire when null.
Message make_notification(const std::string& method, const json& params = nullptr);

Message make_ping_request(const json& id);

// initialize with PROTOCOL_VERSION, client capabilities and clientInfo {mcpcli, version}
Message make_initialize_request(const json& id);

// notifications/initialized, sent once the initialize response has arrived
Message make_initialized_notification();

Message make_tools_list_request(const json& id);
Message make_call_tool_request(const json& id, const std::string& name,
                               const json& arguments = json::object());
Message make_resources_list_request(const json& id);
Message make_prompts_list_request(const json& id);

} // namespace mcpcli

#endif // MCPCLI_MESSAGES_HPP
