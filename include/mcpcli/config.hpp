#ifndef MCPCLI_CONFIG_HPP
#define MCPCLI_CONFIG_HPP

#include <mcpcli/types.hpp>
#include <string>
#include <vector>

namespace mcpcli
{

constexpr const char* DEFAULT_CONFIG_FILE = "server_config.json";

/**
 * Server entry from a JSON config file of the form
 *   {"mcpServers": {"<name>": {"command": "...", "args": [...], "env": {...}}}}
 *
 * Throws ConfigError if the file cannot be read or parsed or has no such
 * server, InvalidParametersError if the entry itself is malformed.
 */
ServerParameters load_config(const std::string& path, const std::string& server_name);

// Names under "mcpServers", sorted by name
std::vector<std::string> list_servers(const std::string& path);

// Same as load_config, from an already parsed document
ServerParameters parse_server_config(const json& document, const std::string& server_name);

} // namespace mcpcli

#endif // MCPCLI_CONFIG_HPP
