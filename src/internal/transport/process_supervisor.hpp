#ifndef MCPCLI_INTERNAL_TRANSPORT_PROCESS_SUPERVISOR_HPP
#define MCPCLI_INTERNAL_TRANSPORT_PROCESS_SUPERVISOR_HPP

#include "../logger.hpp"
#include "../subprocess/process.hpp"

#include <atomic>
#include <chrono>
#include <mcpcli/types.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcpcli
{
namespace internal
{

// Throws InvalidParametersError if params cannot describe a launchable command
void validate_server_parameters(const ServerParameters& params);

/**
 * Owns one server child process: launch, exit status, and the two-phase
 * (terminate, then kill) shutdown. Termination never throws; problems are
 * logged and kept in termination_error().
 */
class ProcessSupervisor
{
  public:
    explicit ProcessSupervisor(const Logger& logger);
    ~ProcessSupervisor();

    // No copy
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Throws InvalidParametersError or SpawnError
    void spawn(const ServerParameters& params, const SessionOptions& options);

    // Graceful termination request, forced kill if the child outlives graceful_timeout.
    // No-op if the process already exited.
    void terminate(std::chrono::milliseconds graceful_timeout);

    // Wait up to timeout for the child to exit; returns the exit code if it did
    std::optional<int> wait_exit(std::chrono::milliseconds timeout);

    bool is_running();
    std::optional<int> exit_code() const;
    std::optional<std::string> termination_error() const;
    int pid() const;

    subprocess::ReadPipe& stdout_pipe();
    subprocess::WritePipe& stdin_pipe();

    // Close the parent's pipe ends (after the loops stopped using them)
    void close_pipes();

  private:
    std::optional<int> poll_exit();
    void record_exit(int code);
    void record_termination_error(const std::string& error);

    const Logger& logger_;
    std::unique_ptr<subprocess::Process> process_;
    std::mutex process_mutex_;

    mutable std::mutex state_mutex_;
    std::optional<int> exit_code_;
    std::optional<std::string> termination_error_;
    std::atomic<int> pid_{0};
};

} // namespace internal
} // namespace mcpcli

#endif // MCPCLI_INTERNAL_TRANSPORT_PROCESS_SUPERVISOR_HPP
