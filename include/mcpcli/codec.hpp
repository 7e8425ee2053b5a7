#ifndef MCPCLI_CODEC_HPP
#define MCPCLI_CODEC_HPP

#include <mcpcli/types.hpp>
#include <string>
#include <variant>

namespace mcpcli
{

/**
 * Serialize a message to one wire line: compact JSON without absent fields,
 * terminated by a single '\n'. Control characters inside strings are escaped
 * by the JSON encoder, so the payload itself never contains a raw newline.
 */
std::string encode_message(const Message& message);

/**
 * Decode one line (with or without its trailing newline).
 * Never throws: failures come back as DecodeError with kind MalformedJSON
 * or InvalidMessageShape.
 */
DecodeResult decode_message(const std::string& line);

// First decode step: text -> JSON value
std::variant<json, DecodeError> parse_json_line(const std::string& line);

// Second decode step: JSON value -> Message
DecodeResult validate_message_shape(const json& value);

// Throwing variant of decode_message (JSONDecodeError / MessageParseError)
Message parse_message(const std::string& line);

// Single-line preview of a wire line for log output
std::string preview_line(const std::string& line, size_t max_length = 200);

} // namespace mcpcli

#endif // MCPCLI_CODEC_HPP
