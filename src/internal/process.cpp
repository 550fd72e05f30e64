// POSIX implementation of subprocess management

#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern "C" char** environ;

namespace mcpmux::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

namespace
{

std::string errno_message(int err)
{
    return std::strerror(err);
}

/// Both ends of a pipe, closed on scope exit unless released
struct FdPair
{
    int read_end = -1;
    int write_end = -1;

    FdPair() = default;
    FdPair(const FdPair&) = delete;
    FdPair& operator=(const FdPair&) = delete;

    ~FdPair()
    {
        close_read();
        close_write();
    }

    void open(const char* what)
    {
        int fds[2] = {-1, -1};
        // O_CLOEXEC keeps these ends out of sibling children spawned concurrently
        if (::pipe2(fds, O_CLOEXEC) != 0)
            throw SpawnFailure(std::string("Failed to create ") + what +
                                   " pipe: " + errno_message(errno),
                               errno);
        read_end = fds[0];
        write_end = fds[1];
    }

    void close_read()
    {
        if (read_end >= 0)
            ::close(read_end);
        read_end = -1;
    }

    void close_write()
    {
        if (write_end >= 0)
            ::close(write_end);
        write_end = -1;
    }

    int release_read()
    {
        int fd = read_end;
        read_end = -1;
        return fd;
    }

    int release_write()
    {
        int fd = write_end;
        write_end = -1;
        return fd;
    }
};

void ignore_sigpipe_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

[[noreturn]] void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

} // namespace

std::string describe_exit_code(int exit_code)
{
    if (exit_code > 128)
        return "killed by signal " + std::to_string(exit_code - 128);
    return "exit code " + std::to_string(exit_code);
}

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open", EBADF);

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno == EINTR)
            continue;
        throw ProcessError("Read failed: " + errno_message(errno), errno);
    }
}

bool ReadPipe::wait_readable(std::chrono::milliseconds timeout)
{
    if (!is_open())
        return false;

    struct pollfd pfd{};
    pfd.fd = handle_->fd;
    pfd.events = POLLIN;

    int result = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("poll failed: " + errno_message(errno), errno);
    }
    // POLLHUP without POLLIN still means read() returns 0 (EOF) right away
    return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
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

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

size_t WritePipe::write(const std::string& data)
{
    if (!is_open())
        throw ProcessError("Pipe is not open", EBADF);

    size_t total_written = 0;
    while (total_written < data.size())
    {
        ssize_t bytes_written =
            ::write(handle_->fd, data.data() + total_written, data.size() - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)", EPIPE);
            throw ProcessError("Write failed: " + errno_message(errno), errno);
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
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

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    stdin_->close();
    stdout_->close();

    if (handle_->running)
    {
        kill();
        try
        {
            wait();
        }
        catch (const ProcessError&)
        {
            // Already reaped elsewhere; nothing left to release
        }
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->running)
        throw ProcessError("Process already running");

    ignore_sigpipe_once();

    FdPair to_child;
    FdPair from_child;
    FdPair error_pipe;
    to_child.open("stdin");
    from_child.open("stdout");
    error_pipe.open("error");

    // Everything the child needs is prepared before fork(); only
    // async-signal-safe calls happen between fork() and exec.
    std::vector<std::string> env_storage;
    if (options.inherit_environment && environ)
    {
        for (char** e = environ; *e; ++e)
        {
            std::string entry(*e);
            auto key = entry.substr(0, entry.find('='));
            if (options.environment.count(key) == 0)
                env_storage.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : options.environment)
        env_storage.push_back(key + "=" + value);

    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
        throw SpawnFailure("Failed to fork process: " + errno_message(errno), errno);

    if (pid == 0)
    {
        // Child: dup2 clears O_CLOEXEC on the standard descriptors
        if (dup2(to_child.read_end, STDIN_FILENO) < 0)
            child_fail(error_pipe.write_end);
        if (dup2(from_child.write_end, STDOUT_FILENO) < 0)
            child_fail(error_pipe.write_end);

        if (!options.working_directory.empty() &&
            chdir(options.working_directory.c_str()) != 0)
            child_fail(error_pipe.write_end);

        environ = envp.data();
        execvp(executable.c_str(), argv.data());
        child_fail(error_pipe.write_end);
    }

    // Parent: the error pipe's write end closes on exec, so read() returns
    // 0 on success and the child's errno on failure.
    error_pipe.close_write();
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe.read_end, &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        throw SpawnFailure("Failed to execute '" + executable + "': " +
                               errno_message(child_errno),
                           child_errno);
    }

    stdin_->handle_->fd = to_child.release_write();
    stdout_->handle_->fd = from_child.release_read();

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    return *stdout_;
}

bool Process::is_running() const
{
    if (handle_->pid == 0 || !handle_->running)
        return false;

    if (::kill(handle_->pid, 0) == 0)
        return true;

    return errno != ESRCH;
}

std::optional<int> Process::try_wait()
{
    if (handle_->pid == 0 || !handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    throw ProcessError("waitpid failed: " + errno_message(errno), errno);
}

int Process::wait()
{
    if (handle_->pid == 0 || !handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw ProcessError("waitpid failed: " + errno_message(errno), errno);
}

int Process::terminate_and_wait(std::chrono::milliseconds grace)
{
    if (!handle_->running)
        return handle_->exit_code;

    terminate();

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (auto code = try_wait())
            return *code;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    kill();
    return wait();
}

void Process::terminate()
{
    if (handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return static_cast<int>(handle_->pid);
}

} // namespace mcpmux::process
