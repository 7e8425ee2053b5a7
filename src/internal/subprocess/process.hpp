#ifndef MCPCLI_SUBPROCESS_PROCESS_HPP
#define MCPCLI_SUBPROCESS_PROCESS_HPP

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcpcli
{
namespace subprocess
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

class ReadPipe;
class WritePipe;
std::pair<ReadPipe, WritePipe> make_pipe();

// Pipe for reading from subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    // No copy, move only
    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Read up to size bytes, returns actual bytes read
    // Returns 0 on EOF, throws on error
    size_t read(char* buffer, size_t size);

    // Check if data (or EOF) is available without blocking
    bool has_data(int timeout_ms = 0);

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    friend std::pair<ReadPipe, WritePipe> make_pipe();
    std::unique_ptr<PipeHandle> handle_;
};

// Pipe for writing to subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    // No copy, move only
    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Single write call, returns bytes written (0 if a non-blocking pipe is full).
    // Throws WriteFailureError.
    size_t write(const char* data, size_t size);

    // Wait until the pipe can take more data (or the reader is gone)
    bool wait_writable(int timeout_ms = 0);

    // Make write() return instead of blocking when the pipe is full
    void set_nonblocking();

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    friend std::pair<ReadPipe, WritePipe> make_pipe();
    std::unique_ptr<PipeHandle> handle_;
};

// Anonymous pipe not attached to any process (both ends close-on-exec)
std::pair<ReadPipe, WritePipe> make_pipe();

// Process configuration
struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    // If false, the child sees only `environment`
    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    // stderr is always shared with the parent
};

// Main Process class
class Process
{
  public:
    Process();
    ~Process();

    // No copy, move only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. Throws SpawnError if the executable cannot be started.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Get pipes (only valid if redirected)
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();

    // Process control
    std::optional<int> try_wait(); // Non-blocking wait, returns exit code if done
    // Polls until exit or timeout, returns exit code if the process exited in time
    std::optional<int> wait_for(std::chrono::milliseconds timeout);
    void terminate(); // Graceful termination (SIGTERM)
    void kill();      // Forceful kill (SIGKILL)

    // Process ID
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
};

// Find an executable by name in a PATH-style list of directories
std::optional<std::string> find_executable(const std::string& name, const std::string& search_path);

// Block SIGPIPE for the calling thread so a write to a closed pipe fails with EPIPE
// instead of killing the process. Other threads are unaffected.
void suppress_sigpipe_on_this_thread();

} // namespace subprocess
} // namespace mcpcli

#endif // MCPCLI_SUBPROCESS_PROCESS_HPP
