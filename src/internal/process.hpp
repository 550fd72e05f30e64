// Subprocess management for StdioTransport (POSIX)

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpmux::process
{

struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message, int error_number = 0)
        : std::runtime_error(message), error_number_(error_number)
    {
    }

    int error_number() const
    {
        return error_number_;
    }

  private:
    int error_number_;
};

/// Raised by spawn() when fork/exec of the child fails
class SpawnFailure : public ProcessError
{
  public:
    using ProcessError::ProcessError;
};

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Wait until data (or EOF) is readable
    /// @param timeout Maximum wait; zero performs a non-blocking check
    bool wait_readable(std::chrono::milliseconds timeout);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Pipe for writing input to a subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;

    /// Write all of data; throws ProcessError with EPIPE when the reader is gone
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Options for spawning a subprocess
struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
};

/// A child process with its stdin and stdout redirected to pipes.
/// stderr is inherited from the parent.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Spawn a new process; throws SpawnFailure if the executable cannot be started
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();

    bool is_running() const;

    /// Non-blocking wait for process termination
    std::optional<int> try_wait();

    /// Blocking wait for process termination
    int wait();

    /// SIGTERM, wait up to grace, then SIGKILL and reap
    int terminate_and_wait(std::chrono::milliseconds grace);

    void terminate();
    void kill();

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
};

/// Describe an exit code from try_wait()/wait() (128+N means killed by signal N)
std::string describe_exit_code(int exit_code);

} // namespace mcpmux::process
