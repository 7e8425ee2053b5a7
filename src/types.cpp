#include <mcpcli/errors.hpp>
#include <mcpcli/types.hpp>

namespace mcpcli
{

namespace
{

bool is_present(const json& j, const char* key)
{
    auto it = j.find(key);
    return it != j.end() && !it->is_null();
}

} // namespace

json Message::to_json() const
{
    json j = json::object();
    j["jsonrpc"] = jsonrpc;

    if (id.has_value() && !id->is_null())
        j["id"] = *id;
    if (method.has_value())
        j["method"] = *method;
    if (params.has_value() && !params->is_null())
        j["params"] = *params;
    // A null result is still a successful response
    if (result.has_value())
        j["result"] = *result;
    if (error.has_value() && !error->is_null())
        j["error"] = *error;

    // Extra fields never override the recognized ones
    if (extra.is_object())
    {
        for (auto it = extra.begin(); it != extra.end(); ++it)
            if (!it->is_null() && !j.contains(it.key()))
                j[it.key()] = it.value();
    }

    return j;
}

Message Message::from_json(const json& j)
{
    if (!j.is_object())
        throw MessageParseError("Message must be a JSON object", j);

    Message msg;

    if (is_present(j, "jsonrpc"))
    {
        if (!j["jsonrpc"].is_string())
            throw MessageParseError("Field 'jsonrpc' must be a string", j);
        msg.jsonrpc = j["jsonrpc"].get<std::string>();
    }

    if (is_present(j, "id"))
    {
        const json& id = j["id"];
        if (!id.is_string() && !id.is_number())
            throw MessageParseError("Field 'id' must be a string or a number", j);
        msg.id = id;
    }

    if (is_present(j, "method"))
    {
        if (!j["method"].is_string())
            throw MessageParseError("Field 'method' must be a string", j);
        msg.method = j["method"].get<std::string>();
    }

    if (is_present(j, "params"))
    {
        const json& params = j["params"];
        if (!params.is_object() && !params.is_array())
            throw MessageParseError("Field 'params' must be an object or an array", j);
        msg.params = params;
    }

    if (j.contains("result"))
        msg.result = j["result"];

    if (is_present(j, "error"))
    {
        if (!j["error"].is_object())
            throw MessageParseError("Field 'error' must be an object", j);
        msg.error = j["error"];
    }

    for (auto it = j.begin(); it != j.end(); ++it)
    {
        const std::string& key = it.key();
        if (key == "jsonrpc" || key == "id" || key == "method" || key == "params" ||
            key == "result" || key == "error")
            continue;
        if (!it->is_null())
            msg.extra[key] = it.value();
    }

    return msg;
}

bool operator==(const Message& lhs, const Message& rhs)
{
    return lhs.to_json() == rhs.to_json();
}

bool operator!=(const Message& lhs, const Message& rhs)
{
    return !(lhs == rhs);
}

const char* to_string(DecodeErrorKind kind)
{
    switch (kind)
    {
    case DecodeErrorKind::MalformedJSON:
        return "MalformedJSON";
    case DecodeErrorKind::InvalidMessageShape:
        return "InvalidMessageShape";
    }
    return "Unknown";
}

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "UNKNOWN";
}

const char* to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Opening:
        return "Opening";
    case SessionState::Running:
        return "Running";
    case SessionState::Closing:
        return "Closing";
    case SessionState::Closed:
        return "Closed";
    }
    return "Unknown";
}

} // namespace mcpcli
