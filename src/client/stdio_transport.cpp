#include "mcpmux/client/stdio_transport.hpp"

#include "../internal/process.hpp"
#include "mcpmux/exceptions.hpp"

#include <array>
#include <cerrno>
#include <thread>

namespace mcpmux::client
{

namespace
{
constexpr size_t kReadChunk = 4096;
constexpr auto kExitProbe = std::chrono::milliseconds(200);
} // namespace

StdioTransport::StdioTransport(std::chrono::milliseconds shutdown_grace)
    : shutdown_grace_(shutdown_grace), process_(std::make_unique<process::Process>())
{
}

StdioTransport::~StdioTransport()
{
    try
    {
        close();
    }
    catch (const TransportError&)
    {
        // The child is killed by ~Process regardless
    }
}

void StdioTransport::open(const ServerDescriptor& descriptor)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (open_)
        throw SpawnError("StdioTransport for '" + descriptor.name + "' is already open");

    process::ProcessOptions options;
    options.environment = descriptor.env;
    if (descriptor.cwd)
        options.working_directory = *descriptor.cwd;

    try
    {
        process_->spawn(descriptor.command, descriptor.args, options);
    }
    catch (const process::ProcessError& e)
    {
        throw SpawnError(e.what());
    }

    command_ = descriptor.command;
    read_buffer_.clear();
    exit_code_.reset();
    open_ = true;
}

void StdioTransport::send_line(const std::string& line)
{
    // Only stdin is touched here; the reader keeps draining stdout while a
    // large write is blocked on a full pipe.
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    if (!is_open())
        throw TransportError(TransportError::Reason::Closed, "StdioTransport is closed");

    try
    {
        process_->stdin_pipe().write(line + "\n");
    }
    catch (const process::ProcessError& e)
    {
        if (e.error_number() != EPIPE)
            throw TransportError(TransportError::Reason::Io,
                                 "StdioTransport write failed: " + std::string(e.what()));
        if (!is_open())
            throw TransportError(TransportError::Reason::Closed, "StdioTransport is closed");

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (auto code = process_->try_wait())
        {
            exit_code_ = code;
            throw TransportError(TransportError::Reason::ProcessExited,
                                 "MCP server '" + command_ + "' exited (" +
                                     process::describe_exit_code(*code) + ")");
        }
        throw TransportError(TransportError::Reason::BrokenPipe,
                             "MCP server '" + command_ + "' closed its stdin");
    }
}

std::optional<std::string> StdioTransport::take_buffered_line()
{
    while (true)
    {
        auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
            return std::nullopt;

        std::string line = read_buffer_.substr(0, pos);
        read_buffer_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            return line;
    }
}

void StdioTransport::throw_stream_ended()
{
    // A child that closes stdout is usually on its way out; give it a moment
    // so the error names the real cause.
    auto deadline = std::chrono::steady_clock::now() + kExitProbe;
    while (true)
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        std::optional<int> code;
        try
        {
            code = process_->try_wait();
        }
        catch (const process::ProcessError& e)
        {
            throw TransportError(TransportError::Reason::Io, e.what());
        }
        if (code)
        {
            exit_code_ = code;
            throw TransportError(TransportError::Reason::ProcessExited,
                                 "MCP server '" + command_ + "' exited (" +
                                     process::describe_exit_code(*code) + ")");
        }
        lock.unlock();
        if (std::chrono::steady_clock::now() >= deadline)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    throw TransportError(TransportError::Reason::Eof,
                         "MCP server '" + command_ + "' closed its stdout");
}

std::optional<std::string> StdioTransport::poll_line(std::chrono::milliseconds wait)
{
    std::lock_guard<std::mutex> read_lock(read_mutex_);
    if (!is_open())
        throw TransportError(TransportError::Reason::Closed, "StdioTransport is closed");

    if (auto line = take_buffered_line())
        return line;

    auto& out = process_->stdout_pipe();
    auto deadline = std::chrono::steady_clock::now() + wait;
    std::array<char, kReadChunk> buf{};

    while (true)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0)
            remaining = std::chrono::milliseconds(0);

        bool readable = false;
        try
        {
            readable = out.wait_readable(remaining);
        }
        catch (const process::ProcessError& e)
        {
            throw TransportError(TransportError::Reason::Io, e.what());
        }

        if (!is_open())
            throw TransportError(TransportError::Reason::Closed, "StdioTransport is closed");
        if (!readable)
            return std::nullopt;

        size_t n = 0;
        try
        {
            n = out.read(buf.data(), buf.size());
        }
        catch (const process::ProcessError& e)
        {
            throw TransportError(TransportError::Reason::Io, e.what());
        }
        if (n == 0)
            throw_stream_ended();

        read_buffer_.append(buf.data(), n);
        if (auto line = take_buffered_line())
            return line;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
    }
}

std::string StdioTransport::receive_line()
{
    while (true)
    {
        if (auto line = poll_line(std::chrono::seconds(1)))
            return *line;
    }
}

void StdioTransport::close()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!open_)
            return;
        open_ = false;
    }

    // EOF on stdin is the polite shutdown request for stdio servers. A writer
    // blocked on a full pipe holds write_mutex_; it fails with EPIPE once the
    // child is gone, and stdin is closed after that.
    {
        std::unique_lock<std::mutex> write_lock(write_mutex_, std::try_to_lock);
        if (write_lock.owns_lock())
            process_->stdin_pipe().close();
    }

    std::string failure;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        try
        {
            exit_code_ = process_->terminate_and_wait(shutdown_grace_);
        }
        catch (const process::ProcessError& e)
        {
            failure = e.what();
        }
    }

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        process_->stdin_pipe().close();
    }
    {
        std::lock_guard<std::mutex> read_lock(read_mutex_);
        process_->stdout_pipe().close();
        read_buffer_.clear();
    }

    if (!failure.empty())
        throw TransportError(TransportError::Reason::Io,
                             "Failed to stop MCP server '" + command_ + "': " + failure);
}

bool StdioTransport::is_open() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return open_;
}

int StdioTransport::pid() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return process_->pid();
}

std::optional<int> StdioTransport::exit_code() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_code_;
}

} // namespace mcpmux::client
