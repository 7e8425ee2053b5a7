#include <mcpcli/errors.hpp>
#include <mcpcli/messages.hpp>
#include <mcpcli/version.hpp>

namespace mcpcli
{

Message make_request(const json& id, const std::string& method, const json& params)
{
    if (!id.is_string() && !id.is_number())
        throw InvalidParametersError("Request id must be a string or a number");

    Message message;
    message.id = id;
    message.method = method;
    if (!params.is_null())
        message.params = params;
    return message;
}

Message make_notification(const std::string& method, const json& params)
{
    Message message;
    message.method = method;
    if (!params.is_null())
        message.params = params;
    return message;
}

Message make_ping_request(const json& id)
{
    return make_request(id, "ping");
}

Message make_initialize_request(const json& id)
{
    json params = {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {{"roots", {{"listChanged", true}}}, {"sampling", json::object()}}},
        {"clientInfo", {{"name", "mcpcli"}, {"version", version_string()}}}};
    return make_request(id, "initialize", params);
}

Message make_initialized_notification()
{
    return make_notification("notifications/initialized");
}

Message make_tools_list_request(const json& id)
{
    return make_request(id, "tools/list", json::object());
}

Message make_call_tool_request(const json& id, const std::string& name, const json& arguments)
{
    if (name.empty())
        throw InvalidParametersError("Tool name must not be empty");
    return make_request(id, "tools/call", {{"name", name}, {"arguments", arguments}});
}

Message make_resources_list_request(const json& id)
{
    return make_request(id, "resources/list", json::object());
}

Message make_prompts_list_request(const json& id)
{
    return make_request(id, "prompts/list", json::object());
}

} // namespace mcpcli
