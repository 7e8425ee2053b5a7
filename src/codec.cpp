#include <algorithm>
#include <mcpcli/codec.hpp>
#include <mcpcli/errors.hpp>

namespace mcpcli
{

std::string encode_message(const Message& message)
{
    // Invalid UTF-8 is replaced instead of failing the whole message
    std::string line = message.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

std::variant<json, DecodeError> parse_json_line(const std::string& line)
{
    try
    {
        return std::variant<json, DecodeError>(std::in_place_type<json>, json::parse(line));
    }
    catch (const json::exception& e)
    {
        return std::variant<json, DecodeError>(
            std::in_place_type<DecodeError>,
            DecodeError{DecodeErrorKind::MalformedJSON, std::string("JSON parse error: ") + e.what()});
    }
}

DecodeResult validate_message_shape(const json& value)
{
    try
    {
        return Message::from_json(value);
    }
    catch (const MessageParseError& e)
    {
        return DecodeError{DecodeErrorKind::InvalidMessageShape, e.what()};
    }
}

DecodeResult decode_message(const std::string& line)
{
    auto parsed = parse_json_line(line);
    if (auto* error = std::get_if<DecodeError>(&parsed))
        return *error;
    return validate_message_shape(std::get<json>(parsed));
}

Message parse_message(const std::string& line)
{
    json j;
    try
    {
        j = json::parse(line);
    }
    catch (const json::exception& e)
    {
        throw JSONDecodeError(std::string("JSON parse error: ") + e.what());
    }
    return Message::from_json(j);
}

std::string preview_line(const std::string& line, size_t max_length)
{
    std::string out;
    out.reserve(std::min(line.size(), max_length) + 3);
    for (char c : line)
    {
        if (out.size() >= max_length)
        {
            out += "...";
            break;
        }
        if (c == '\n' || c == '\r')
            continue;
        out.push_back(c);
    }
    return out;
}

} // namespace mcpcli
