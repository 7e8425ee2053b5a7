/**
 * mcpcli.cpp - MCP command-line client
 *
 * Starts one or more MCP servers listed in a JSON config file, performs the
 * initialize handshake with each, then runs a single command against all of
 * them and prints the results.
 *
 * Usage:
 *   mcpcli [--config-file PATH] [--server NAME]... [--all] [--timeout MS] [--verbose]
 *          [ping | list-tools | list-resources | list-prompts]
 *
 * Ctrl+C (or SIGTERM) closes every open session and exits.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mcpcli/mcpcli.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

using namespace mcpcli;

// ============================================================================
// Command line
// ============================================================================

namespace
{

const std::vector<std::string> COMMANDS = {"ping", "list-tools", "list-resources",
                                           "list-prompts"};

struct CliArgs
{
    std::string config_file = DEFAULT_CONFIG_FILE;
    std::vector<std::string> servers;
    bool all = false;
    std::optional<std::string> command;
    std::chrono::milliseconds timeout{30000};
    bool verbose = false;
    bool help = false;
};

void print_usage(std::ostream& out)
{
    out << "Usage: mcpcli [--config-file PATH] [--server NAME]... [--all] [--timeout MS]\n"
           "              [--verbose] [ping | list-tools | list-resources | list-prompts]\n"
           "\n"
           "  --config-file PATH  JSON file with an \"mcpServers\" object (default "
        << DEFAULT_CONFIG_FILE
        << ")\n"
           "  --server NAME       Server to start; may be given more than once\n"
           "  --all               Start every server in the config file\n"
           "  --timeout MS        How long to wait for each response (default 30000)\n"
           "  --verbose           Log transport activity to stderr\n";
}

CliArgs parse_args(int argc, char** argv)
{
    CliArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto value = [&](const std::string& flag) -> std::string
        {
            if (i + 1 >= argc)
                throw ConfigError("Missing value for " + flag);
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h")
            args.help = true;
        else if (arg == "--config-file")
            args.config_file = value(arg);
        else if (arg == "--server")
            args.servers.push_back(value(arg));
        else if (arg == "--all")
            args.all = true;
        else if (arg == "--verbose")
            args.verbose = true;
        else if (arg == "--timeout")
        {
            std::string text = value(arg);
            try
            {
                args.timeout = std::chrono::milliseconds(std::stol(text));
            }
            catch (const std::exception&)
            {
                throw ConfigError("Invalid --timeout value: " + text);
            }
        }
        else if (!arg.empty() && arg[0] == '-')
            throw ConfigError("Unknown option: " + arg);
        else if (args.command)
            throw ConfigError("Only one command may be given");
        else if (std::find(COMMANDS.begin(), COMMANDS.end(), arg) == COMMANDS.end())
            throw ConfigError("Unknown command: " + arg);
        else
            args.command = arg;
    }
    return args;
}

// ============================================================================
// Sessions and interrupt handling
// ============================================================================

struct Server
{
    std::string name;
    std::unique_ptr<StdioSession> session;
    int64_t next_id = 0;
};

/**
 * Waits for SIGINT/SIGTERM on its own thread and closes every registered
 * session. The signals must be blocked in all threads before any is started.
 */
class InterruptWatcher
{
  public:
    InterruptWatcher()
    {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGUSR1); // internal: stop watching
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
        thread_ = std::thread(&InterruptWatcher::run, this);
    }

    ~InterruptWatcher()
    {
        stop();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    void watch(StdioSession* session)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.push_back(session);
        if (interrupted_)
            session->close();
    }

    bool interrupted() const
    {
        return interrupted_;
    }

    void stop()
    {
        if (!thread_.joinable())
            return;
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

  private:
    void run()
    {
        int sig = 0;
        while (sigwait(&signals_, &sig) == 0)
        {
            if (sig == SIGUSR1)
                return;

            std::cerr << "\nInterrupted, closing sessions..." << std::endl;
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = true;
            for (auto* session : sessions_)
                session->close();
        }
    }

    sigset_t signals_;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<StdioSession*> sessions_;
    std::atomic<bool> interrupted_{false};
};

// ============================================================================
// Requests
// ============================================================================

// Send request and wait for the response carrying its id. Other traffic is skipped.
std::optional<Message> call(Server& server, Message request, std::chrono::milliseconds timeout,
                            bool verbose)
{
    const json id = *request.id;
    if (!server.session->send(std::move(request)))
        return std::nullopt;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return std::nullopt;

        auto message = server.session->receive_for(remaining);
        if (!message)
        {
            if (server.session->inbound().is_closed())
                return std::nullopt;
            continue;
        }

        if (message->is_response() && message->id && *message->id == id)
            return message;

        if (verbose)
            std::cerr << "[" << server.name << "] skipped: " << message->to_json().dump()
                      << std::endl;
    }
}

json next_id(Server& server)
{
    return ++server.next_id;
}

bool initialize(Server& server, const CliArgs& args)
{
    auto response = call(server, make_initialize_request(next_id(server)), args.timeout,
                         args.verbose);
    if (!response || response->error)
        return false;

    if (args.verbose && response->result)
        std::cerr << "[" << server.name << "] initialized: " << response->result->dump()
                  << std::endl;

    return server.session->send(make_initialized_notification());
}

void print_result(const Server& server, const std::string& title, const Message& response)
{
    std::cout << "== " << server.name << ": " << title << " ==\n";
    if (response.error)
        std::cout << "Error: " << response.error->dump(2) << "\n";
    else
        std::cout << response.result.value_or(json::object()).dump(2) << "\n";
}

bool run_command(Server& server, const std::string& command, const CliArgs& args)
{
    if (command == "ping")
    {
        auto response = call(server, make_ping_request(next_id(server)), args.timeout,
                             args.verbose);
        bool ok = response && !response->error;
        std::cout << "== " << server.name << ": ping ==\n"
                  << (ok ? "Server is up and running" : "Server ping failed") << "\n";
        return ok;
    }

    if (command == "list-tools")
    {
        auto response = call(server, make_tools_list_request(next_id(server)), args.timeout,
                             args.verbose);
        if (!response)
            return false;
        if (!response->error && response->result && response->result->contains("tools"))
        {
            std::cout << "== " << server.name << ": tools ==\n";
            const json& tools = (*response->result)["tools"];
            if (!tools.is_array() || tools.empty())
                std::cout << "No tools available.\n";
            for (const auto& tool : tools)
            {
                if (!tool.is_object())
                    continue;
                std::cout << "- " << tool.value("name", "?") << ": "
                          << tool.value("description", "No description") << "\n";
            }
            return true;
        }
        print_result(server, "tools", *response);
        return !response->error;
    }

    Message request = command == "list-resources"
                          ? make_resources_list_request(next_id(server))
                          : make_prompts_list_request(next_id(server));
    auto response = call(server, std::move(request), args.timeout, args.verbose);
    if (!response)
        return false;
    print_result(server, command == "list-resources" ? "resources" : "prompts", *response);
    return !response->error;
}

int run(const CliArgs& args, InterruptWatcher& watcher, std::vector<Server>& servers)
{
    std::vector<std::string> names = args.servers;
    if (args.all)
        names = list_servers(args.config_file);
    if (names.empty())
    {
        std::cerr << "No servers selected; use --server NAME or --all\n";
        return 1;
    }

    SessionOptions options;
    options.log_level = args.verbose ? LogLevel::Debug : LogLevel::Warning;

    for (const auto& name : names)
    {
        Server server;
        server.name = name;
        server.session = std::make_unique<StdioSession>(load_config(args.config_file, name),
                                                        options);
        watcher.watch(server.session.get());
        servers.push_back(std::move(server));

        if (!initialize(servers.back(), args))
        {
            std::cerr << "Server initialization failed for " << name << "\n";
            return 1;
        }
    }

    if (!args.command)
    {
        for (const auto& server : servers)
            std::cout << server.name << ": ready (PID " << server.session->get_pid() << ")\n";
        return 0;
    }

    int status = 0;
    for (auto& server : servers)
    {
        if (watcher.interrupted())
            return 130;
        if (!run_command(server, *args.command, args))
            status = 1;
    }
    return watcher.interrupted() ? 130 : status;
}

} // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv)
{
    CliArgs args;
    try
    {
        args = parse_args(argc, argv);
    }
    catch (const ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return 2;
    }

    if (args.help)
    {
        print_usage(std::cout);
        return 0;
    }

    // Declared first so the sessions outlive the watcher that may close them
    std::vector<Server> servers;

    // Before any session thread exists, so they all inherit the blocked mask
    InterruptWatcher watcher;

    try
    {
        int status = run(args, watcher, servers);
        watcher.stop();
        return status;
    }
    catch (const McpError& e)
    {
        watcher.stop();
        std::cerr << "Error occurred: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        watcher.stop();
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }
}
