#include <fstream>
#include <mcpcli/config.hpp>
#include <mcpcli/errors.hpp>

namespace mcpcli
{

namespace
{

json read_config_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
        throw ConfigError("Configuration file not found: " + path);

    try
    {
        return json::parse(file);
    }
    catch (const json::parse_error& e)
    {
        throw ConfigError("Invalid JSON in configuration file " + path + ": " + e.what());
    }
}

const json& servers_section(const json& document)
{
    if (!document.is_object() || !document.contains("mcpServers") ||
        !document["mcpServers"].is_object())
        throw ConfigError("Configuration has no \"mcpServers\" object");
    return document["mcpServers"];
}

} // namespace

ServerParameters parse_server_config(const json& document, const std::string& server_name)
{
    const json& servers = servers_section(document);
    auto it = servers.find(server_name);
    if (it == servers.end())
        throw ConfigError("Server '" + server_name + "' not found in configuration file.");

    const json& entry = *it;
    if (!entry.is_object())
        throw InvalidParametersError("Server '" + server_name + "' must be a JSON object");

    ServerParameters params;

    auto command = entry.find("command");
    if (command == entry.end() || !command->is_string() || command->get<std::string>().empty())
        throw InvalidParametersError("Server '" + server_name + "' has no command");
    params.command = command->get<std::string>();

    if (auto args = entry.find("args"); args != entry.end() && !args->is_null())
    {
        if (!args->is_array())
            throw InvalidParametersError("Server '" + server_name + "': args must be an array");
        for (const auto& arg : *args)
        {
            if (!arg.is_string())
                throw InvalidParametersError("Server '" + server_name +
                                             "': args must contain only strings");
            params.args.push_back(arg.get<std::string>());
        }
    }

    if (auto env = entry.find("env"); env != entry.end() && !env->is_null())
    {
        if (!env->is_object())
            throw InvalidParametersError("Server '" + server_name + "': env must be an object");
        std::map<std::string, std::string> vars;
        for (const auto& item : env->items())
        {
            if (!item.value().is_string())
                throw InvalidParametersError("Server '" + server_name + "': env value for " +
                                             item.key() + " must be a string");
            vars[item.key()] = item.value().get<std::string>();
        }
        params.env = std::move(vars);
    }

    return params;
}

ServerParameters load_config(const std::string& path, const std::string& server_name)
{
    return parse_server_config(read_config_file(path), server_name);
}

std::vector<std::string> list_servers(const std::string& path)
{
    const json document = read_config_file(path);
    std::vector<std::string> names;
    for (const auto& item : servers_section(document).items())
        names.push_back(item.key());
    return names;
}

} // namespace mcpcli
