// Round trips through /bin/cat, which echoes every line it reads.
// Any line-delimited JSON-RPC server can be used the same way.

#include <chrono>
#include <iostream>
#include <mcpcli/mcpcli.hpp>
#include <vector>

constexpr bool TIMING = true;
constexpr bool DUMP_JSON = false; // Enable to see the raw lines

int main()
{
    std::cout << "mcpcli version: " << mcpcli::version_string() << "\n\n";

    mcpcli::ServerParameters params;
    params.command = "cat";

    std::vector<mcpcli::Message> requests = {
        mcpcli::make_initialize_request(1), mcpcli::make_ping_request(2),
        mcpcli::make_tools_list_request(3),
        mcpcli::make_call_tool_request(4, "add", {{"a", 2}, {"b", 2}})};

    std::vector<double> timings;

    try
    {
        mcpcli::StdioSession session(params);
        std::cout << "Server started (PID " << session.get_pid() << ")\n\n";

        for (auto& request : requests)
        {
            const std::string method = *request.method;
            auto start = std::chrono::steady_clock::now();

            if (!session.send(request))
            {
                std::cerr << "Session closed while sending " << method << "\n";
                return 1;
            }

            auto reply = session.receive_for(std::chrono::seconds(5));
            auto end = std::chrono::steady_clock::now();
            if (!reply)
            {
                std::cerr << "No reply to " << method << "\n";
                return 1;
            }

            double ms = std::chrono::duration<double, std::milli>(end - start).count();
            timings.push_back(ms);

            std::cout << method << " -> id " << reply->id.value_or(nullptr).dump();
            if (TIMING)
                std::cout << " (" << ms << " ms)";
            std::cout << "\n";
            if (DUMP_JSON)
                std::cout << "  " << mcpcli::encode_message(*reply);
        }

        session.close();
        if (auto code = session.exit_code())
            std::cout << "\nServer exited with code " << *code << "\n";
    }
    catch (const mcpcli::InvalidParametersError& e)
    {
        std::cerr << "Error: invalid server parameters - " << e.what() << "\n";
        return 1;
    }
    catch (const mcpcli::SpawnError& e)
    {
        std::cerr << "Error: could not start server - " << e.what() << "\n";
        return 1;
    }
    catch (const mcpcli::McpError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (TIMING && !timings.empty())
    {
        double total = 0;
        for (double t : timings)
            total += t;
        std::cout << "Average round trip: " << total / timings.size() << " ms\n";
    }

    return 0;
}
