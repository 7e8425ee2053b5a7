#include "process_supervisor.hpp"

#include "command_verification.hpp"
#include "subprocess_env.hpp"

#include <cerrno>
#include <cstdlib>
#include <mcpcli/errors.hpp>

namespace mcpcli
{
namespace internal
{

void validate_server_parameters(const ServerParameters& params)
{
    if (params.command.empty())
        throw InvalidParametersError("Server command must not be empty.");

    if (params.command.find('\0') != std::string::npos)
        throw InvalidParametersError("Server command must not contain NUL characters.");

    for (const auto& arg : params.args)
        if (arg.find('\0') != std::string::npos)
            throw InvalidParametersError("Server arguments must not contain NUL characters.");

    if (params.env)
    {
        for (const auto& [key, value] : *params.env)
        {
            if (key.empty() || key.find('=') != std::string::npos ||
                key.find('\0') != std::string::npos)
                throw InvalidParametersError("Invalid environment variable name: '" + key + "'");
            if (value.find('\0') != std::string::npos)
                throw InvalidParametersError("Environment variable " + key +
                                             " must not contain NUL characters.");
        }
    }
}

ProcessSupervisor::ProcessSupervisor(const Logger& logger) : logger_(logger) {}

ProcessSupervisor::~ProcessSupervisor() = default;

void ProcessSupervisor::spawn(const ServerParameters& params, const SessionOptions& options)
{
    validate_server_parameters(params);

    subprocess::ProcessOptions proc_opts;
    apply_server_environment(proc_opts, params, options);

    std::string executable = params.command;

    // Security: resolve and check the executable before anything runs
    if (!options.allowed_command_paths.empty() || options.command_sha256)
    {
        std::string search_path;
        if (auto it = proc_opts.environment.find("PATH"); it != proc_opts.environment.end())
            search_path = it->second;
        else if (const char* parent_path = std::getenv("PATH"))
            search_path = parent_path;

        auto resolved = subprocess::find_executable(params.command, search_path);
        if (!resolved)
            throw SpawnError("Executable not found: " + params.command, ENOENT);

        if (!verify_command_path_allowed(*resolved, options.allowed_command_paths))
        {
            throw SpawnError("Command path not in allowlist: " + *resolved +
                             ". Configure allowed_command_paths or use an allowed path.");
        }

        std::string error_msg;
        if (!verify_command_hash(*resolved, options.command_sha256, error_msg))
            throw SpawnError("Command integrity check failed: " + error_msg);

        // Run exactly the file that was verified
        executable = *resolved;
    }

    auto process = std::make_unique<subprocess::Process>();
    process->spawn(executable, params.args, proc_opts);

    try
    {
        process->stdin_pipe().set_nonblocking();
    }
    catch (const std::runtime_error& e)
    {
        // process is killed and reaped by its destructor
        throw SpawnError(std::string("Failed to configure stdin pipe: ") + e.what());
    }

    pid_ = process->pid();
    process_ = std::move(process);

    logger_.debug("Subprocess started with PID " + std::to_string(pid_.load()) +
                  ", command: " + params.command);
}

void ProcessSupervisor::terminate(std::chrono::milliseconds graceful_timeout)
{
    if (!process_)
        return;

    if (poll_exit())
    {
        logger_.info("Process already terminated.");
        return;
    }

    logger_.debug("Terminating subprocess " + std::to_string(pid()) + "...");
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_->terminate();
    }

    if (wait_exit(graceful_timeout))
        return;

    logger_.warning("Process " + std::to_string(pid()) + " did not terminate within " +
                    std::to_string(graceful_timeout.count()) +
                    " ms. Forcefully killing it.");
    try
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_->kill();
    }
    catch (const std::exception& e)
    {
        record_termination_error(std::string("Error killing process: ") + e.what());
    }
}

std::optional<int> ProcessSupervisor::wait_exit(std::chrono::milliseconds timeout)
{
    if (auto code = exit_code())
        return code;
    if (!process_)
        return std::nullopt;

    std::optional<int> code;
    try
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        code = process_->wait_for(timeout);
    }
    catch (const std::exception& e)
    {
        record_termination_error(std::string("Error waiting for process: ") + e.what());
        return std::nullopt;
    }

    if (code)
        record_exit(*code);
    return code;
}

bool ProcessSupervisor::is_running()
{
    if (!process_)
        return false;

    // terminate() may hold the process for a while; fall back to what is known
    std::unique_lock<std::mutex> lock(process_mutex_, std::try_to_lock);
    if (!lock.owns_lock())
        return !exit_code().has_value();
    lock.unlock();

    return !poll_exit().has_value();
}

std::optional<int> ProcessSupervisor::exit_code() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_code_;
}

std::optional<std::string> ProcessSupervisor::termination_error() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return termination_error_;
}

int ProcessSupervisor::pid() const
{
    return pid_;
}

subprocess::ReadPipe& ProcessSupervisor::stdout_pipe()
{
    if (!process_)
        throw std::runtime_error("Process not spawned");
    return process_->stdout_pipe();
}

subprocess::WritePipe& ProcessSupervisor::stdin_pipe()
{
    if (!process_)
        throw std::runtime_error("Process not spawned");
    return process_->stdin_pipe();
}

void ProcessSupervisor::close_pipes()
{
    if (!process_)
        return;
    process_->stdin_pipe().close();
    process_->stdout_pipe().close();
}

std::optional<int> ProcessSupervisor::poll_exit()
{
    if (auto code = exit_code())
        return code;
    if (!process_)
        return std::nullopt;

    std::optional<int> code;
    try
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        code = process_->try_wait();
    }
    catch (const std::exception& e)
    {
        record_termination_error(std::string("Error waiting for process: ") + e.what());
        return std::nullopt;
    }

    if (code)
        record_exit(*code);
    return code;
}

void ProcessSupervisor::record_exit(int code)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!exit_code_)
        exit_code_ = code;
}

void ProcessSupervisor::record_termination_error(const std::string& error)
{
    logger_.error(error);
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!termination_error_)
        termination_error_ = error;
}

} // namespace internal
} // namespace mcpcli
