/**
 * @file error_handling.cpp
 * @brief How each failure of a stdio session shows up
 *
 * Demonstrates:
 * - Parameter and spawn errors thrown when a session opens
 * - A server that exits: end of stream on receive, false from send
 * - Malformed server output, which is logged and skipped
 * - Configuration file errors
 */

#include <iostream>
#include <mcpcli/mcpcli.hpp>
#include <string>

void banner(const std::string& scenario)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Scenario: " << scenario << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void example_invalid_parameters()
{
    banner("Empty command");

    try
    {
        mcpcli::StdioSession session(mcpcli::ServerParameters{});
    }
    catch (const mcpcli::InvalidParametersError& e)
    {
        std::cout << "InvalidParametersError: " << e.what() << "\n";
    }
}

void example_missing_command()
{
    banner("Command that does not exist");

    try
    {
        mcpcli::StdioSession session({"mcpcli-no-such-server", {}, std::nullopt});
    }
    catch (const mcpcli::SpawnError& e)
    {
        std::cout << "SpawnError: " << e.what() << " (errno " << e.error_number() << ")\n";
    }
}

void example_server_exits()
{
    banner("Server exits on its own");

    mcpcli::StdioSession session({"/bin/sh", {"-c", "exit 3"}, std::nullopt});

    // End of stream, not an exception
    auto message = session.receive();
    std::cout << "receive() returned " << (message ? "a message" : "end of stream") << "\n";

    // The first write hits a closed pipe and the session shuts itself down
    while (session.send(mcpcli::make_ping_request(1)))
        ;
    session.close();

    std::cout << "send() now returns false\n";
    std::cout << "exit code: " << session.exit_code().value_or(-1) << "\n";
    if (auto failure = session.failure())
        std::cout << "failure: " << *failure << "\n";
}

void example_malformed_output()
{
    banner("Server prints garbage between messages");

    mcpcli::SessionOptions options;
    options.log_callback = [](mcpcli::LogLevel level, const std::string& text)
    { std::cout << "  log " << mcpcli::to_string(level) << ": " << text << "\n"; };

    mcpcli::StdioSession session(
        {"/bin/sh",
         {"-c", "echo 'not json'; echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}'"},
         std::nullopt},
        options);

    while (auto message = session.receive())
        std::cout << "received: " << message->to_json().dump() << "\n";
}

void example_config_errors()
{
    banner("Configuration errors");

    try
    {
        mcpcli::load_config("does-not-exist.json", "sqlite");
    }
    catch (const mcpcli::ConfigError& e)
    {
        std::cout << "ConfigError: " << e.what() << "\n";
    }
}

int main()
{
    std::cout << "mcpcli version: " << mcpcli::version_string() << "\n";

    try
    {
        example_invalid_parameters();
        example_missing_command();
        example_server_exits();
        example_malformed_output();
        example_config_errors();
    }
    catch (const mcpcli::McpError& e)
    {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
