#pragma once
#include "mcpmux/client/transport.hpp"
#include "mcpmux/types.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcpmux::process
{
class Process;
}

namespace mcpmux::client
{

/// Launches an MCP stdio server as a subprocess and exchanges
/// newline-delimited JSON-RPC documents over its stdin/stdout.
class StdioTransport : public ITransport
{
  public:
    /// @param shutdown_grace How long close() waits after SIGTERM before SIGKILL
    explicit StdioTransport(std::chrono::milliseconds shutdown_grace = std::chrono::seconds(2));
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// Spawn the server described by descriptor
    /// @throws SpawnError if the executable cannot be started
    void open(const ServerDescriptor& descriptor);

    void send_line(const std::string& line) override;

    /// Block until one complete line is available
    std::string receive_line();

    std::optional<std::string> poll_line(std::chrono::milliseconds wait) override;

    void close() override;
    bool is_open() const override;
    int pid() const override;

    /// Exit code once the child has been reaped
    std::optional<int> exit_code() const;

  private:
    std::optional<std::string> take_buffered_line();
    [[noreturn]] void throw_stream_ended();

    std::chrono::milliseconds shutdown_grace_;
    std::unique_ptr<process::Process> process_;
    std::string command_;
    std::string read_buffer_;
    std::optional<int> exit_code_;
    /// Guards open_, exit_code_ and the process handle
    mutable std::mutex state_mutex_;
    /// Serializes stdin writes against close()
    std::mutex write_mutex_;
    /// Owned by the reading thread; guards stdout and read_buffer_
    std::mutex read_mutex_;
    bool open_{false};
};

} // namespace mcpmux::client
