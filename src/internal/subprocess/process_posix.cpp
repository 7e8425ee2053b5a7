// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <mcpcli/errors.hpp>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace mcpcli
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string errno_message(int err)
{
    return std::strerror(err);
}

static std::string get_errno_message()
{
    return errno_message(errno);
}

// Both ends close-on-exec, so concurrently spawned children never inherit them
static int make_cloexec_pipe(int fds[2])
{
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC);
#else
    if (::pipe(fds) != 0)
        return -1;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return 0;
#endif
}

static void close_pipe(int fds[2])
{
    for (int i = 0; i < 2; ++i)
    {
        if (fds[i] >= 0)
        {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

static int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

static void set_nonblocking(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1)
        throw std::runtime_error("fcntl F_GETFL failed: " + get_errno_message());
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw std::runtime_error("fcntl F_SETFL failed: " + get_errno_message());
}

// Child side: make fd the given standard descriptor, keeping it across exec
static bool redirect_fd(int fd, int target)
{
    if (fd == target)
        return fcntl(fd, F_SETFD, 0) != -1;
    return dup2(fd, target) >= 0;
}

// Child side: report errno to the parent and exit
[[noreturn]] static void report_child_failure(int error_fd)
{
    int err = errno;
    ssize_t ignored = ::write(error_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

// A SIGPIPE raised by a failed write stays pending while it is blocked; consume it
static void drain_pending_sigpipe()
{
    sigset_t blocked;
    if (pthread_sigmask(SIG_BLOCK, nullptr, &blocked) != 0 || !sigismember(&blocked, SIGPIPE))
        return;

    sigset_t pending;
    if (sigpending(&pending) != 0 || !sigismember(&pending, SIGPIPE))
        return;

    sigset_t only_sigpipe;
    sigemptyset(&only_sigpipe);
    sigaddset(&only_sigpipe, SIGPIPE);
    int sig = 0;
    sigwait(&only_sigpipe, &sig);
}

// Wait for events on fd. Hangup and error count as ready so the caller sees EOF or EPIPE.
static bool wait_for_fd(int fd, short events, int timeout_ms)
{
    struct pollfd entry;
    entry.fd = fd;
    entry.events = events;
    entry.revents = 0;

    int result = ::poll(&entry, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("poll failed: " + get_errno_message());
    }

    return result > 0 && (entry.revents & (events | POLLHUP | POLLERR | POLLNVAL)) != 0;
}

// Child side: undo what the parent's threads may have set up for themselves
static void reset_child_signals()
{
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    signal(SIGPIPE, SIG_DFL);
}

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0; // No data available (non-blocking)
        throw std::runtime_error("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;
    return wait_for_fd(handle_->fd, POLLIN, timeout_ms);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw WriteFailureError("Pipe is not open");

    ssize_t bytes_written;
    do
    {
        bytes_written = ::write(handle_->fd, data, size);
    } while (bytes_written < 0 && errno == EINTR);

    if (bytes_written < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0; // Pipe full (non-blocking)
        if (errno == EPIPE)
        {
            drain_pending_sigpipe();
            throw WriteFailureError("Broken pipe (process closed stdin)");
        }
        throw WriteFailureError("Write failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_written);
}

bool WritePipe::wait_writable(int timeout_ms)
{
    if (!is_open())
        return false;

    try
    {
        return wait_for_fd(handle_->fd, POLLOUT, timeout_ms);
    }
    catch (const std::runtime_error& e)
    {
        throw WriteFailureError(e.what());
    }
}

void WritePipe::set_nonblocking()
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");
    subprocess::set_nonblocking(handle_->fd);
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

std::pair<ReadPipe, WritePipe> make_pipe()
{
    int fds[2] = {-1, -1};
    if (make_cloexec_pipe(fds) != 0)
        throw std::runtime_error("Failed to create pipe: " + get_errno_message());

    ReadPipe reader;
    reader.handle_->fd = fds[0];
    WritePipe writer;
    writer.handle_->fd = fds[1];
    return {std::move(reader), std::move(writer)};
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    // Never leave a child behind; a graceful stop is the owner's job
    if (handle_ && handle_->running && handle_->pid > 0)
    {
        ::kill(handle_->pid, SIGKILL);
        int status;
        while (waitpid(handle_->pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        handle_->running = false;
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (executable.empty())
        throw SpawnError("Executable must not be empty");

    // Build the child environment
    std::map<std::string, std::string> env;
    if (options.inherit_environment)
    {
        for (char** entry = environ; entry && *entry; ++entry)
        {
            std::string kv(*entry);
            size_t eq = kv.find('=');
            if (eq == std::string::npos || eq == 0)
                continue;
            env[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        env[key] = value; // Overwrite if exists

    // Resolve the executable against the PATH the child will see
    std::string resolved = executable;
    if (executable.find('/') == std::string::npos)
    {
        std::string search_path;
        if (auto it = env.find("PATH"); it != env.end())
            search_path = it->second;
        else if (const char* parent_path = std::getenv("PATH"))
            search_path = parent_path;

        auto found = find_executable(executable, search_path);
        if (!found)
            throw SpawnError("Executable not found in PATH: " + executable, ENOENT);
        resolved = *found;
    }

    // Everything the child needs is allocated before fork()
    std::vector<std::string> env_entries;
    env_entries.reserve(env.size());
    for (const auto& [key, value] : env)
        env_entries.push_back(key + "=" + value);

    std::vector<char*> envp;
    for (auto& entry : env_entries)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    // Create pipes for stdin
    int stdin_pipe[2] = {-1, -1};
    if (options.redirect_stdin && make_cloexec_pipe(stdin_pipe) != 0)
    {
        int err = errno;
        throw SpawnError("Failed to create stdin pipe: " + errno_message(err), err);
    }

    // Create pipes for stdout
    int stdout_pipe[2] = {-1, -1};
    if (options.redirect_stdout && make_cloexec_pipe(stdout_pipe) != 0)
    {
        int err = errno;
        close_pipe(stdin_pipe);
        throw SpawnError("Failed to create stdout pipe: " + errno_message(err), err);
    }

    // Exec failures are reported over this pipe; it closes by itself on a successful exec
    int error_pipe[2] = {-1, -1};
    if (make_cloexec_pipe(error_pipe) != 0)
    {
        int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        throw SpawnError("Failed to create status pipe: " + errno_message(err), err);
    }

    // Fork the process
    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(error_pipe);
        throw SpawnError("Failed to fork process: " + errno_message(err), err);
    }

    if (pid == 0)
    {
        // Child process: async-signal-safe calls only
        ::close(error_pipe[0]);

        // Blocked signals and an ignored SIGPIPE would otherwise survive exec
        reset_child_signals();

        if (options.redirect_stdin && !redirect_fd(stdin_pipe[0], STDIN_FILENO))
            report_child_failure(error_pipe[1]);

        if (options.redirect_stdout && !redirect_fd(stdout_pipe[1], STDOUT_FILENO))
            report_child_failure(error_pipe[1]);

        // stderr stays connected to the parent's stderr; every other pipe fd is close-on-exec

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            report_child_failure(error_pipe[1]);

        execve(resolved.c_str(), argv.data(), envp.data());

        // If execve returns, it failed
        report_child_failure(error_pipe[1]);
    }

    // Parent process

    // Close unused pipe ends
    ::close(error_pipe[1]);
    if (options.redirect_stdin)
        ::close(stdin_pipe[0]);
    if (options.redirect_stdout)
        ::close(stdout_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(error_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        // The child never reached the new program; reap it
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        if (options.redirect_stdin)
            ::close(stdin_pipe[1]);
        if (options.redirect_stdout)
            ::close(stdout_pipe[0]);
        throw SpawnError("Failed to execute " + executable + ": " + errno_message(child_errno),
                         child_errno);
    }

    // Store handles
    if (options.redirect_stdin)
    {
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }

    // Store process information
    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        // Process has exited
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        // Process is still running
        return std::nullopt;
    }
    else if (errno == ECHILD)
    {
        // Reaped elsewhere; the exit code is lost
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto exit_code = try_wait())
            return exit_code;

        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
    {
        if (::kill(handle_->pid, SIGKILL) != 0 && errno != ESRCH)
            throw std::runtime_error("kill failed: " + get_errno_message());
    }
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name, const std::string& search_path)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    // If it's an absolute path and exists, check if it's executable
    fs::path exe_path(name);
    if (exe_path.is_absolute())
    {
        if (fs::exists(exe_path) && access(exe_path.c_str(), X_OK) == 0)
            return name;
        return std::nullopt;
    }

    // If name contains a path separator, treat as relative path
    if (name.find('/') != std::string::npos)
    {
        if (fs::exists(name) && access(name.c_str(), X_OK) == 0)
            return fs::absolute(name).string();
        return std::nullopt;
    }

    if (search_path.empty())
    {
        // No PATH set - try current directory
        if (fs::exists(name) && access(name.c_str(), X_OK) == 0)
            return fs::absolute(name).string();
        return std::nullopt;
    }

    // Split PATH by colon on POSIX
    size_t start = 0;
    while (start <= search_path.size())
    {
        size_t end = search_path.find(':', start);
        if (end == std::string::npos)
            end = search_path.size();

        std::string dir = search_path.substr(start, end - start);
        if (!dir.empty())
        {
            std::error_code ec;
            fs::path test_path = fs::path(dir) / name;
            if (fs::is_regular_file(test_path, ec) && access(test_path.c_str(), X_OK) == 0)
                return test_path.string();
        }

        start = end + 1;
    }

    return std::nullopt;
}

void suppress_sigpipe_on_this_thread()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

} // namespace subprocess
} // namespace mcpcli
