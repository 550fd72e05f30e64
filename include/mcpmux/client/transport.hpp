#pragma once
#include "mcpmux/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace mcpmux::client
{

/// Line-oriented byte stream to one MCP server.
///
/// Writers may call send_line() from several threads only when the caller
/// serializes them (RequestDispatcher holds a writer mutex). Exactly one
/// thread reads.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Write one JSON document followed by a newline
    /// @throws TransportError if the stream is closed or the peer is gone
    virtual void send_line(const std::string& line) = 0;

    /// Wait up to `wait` for one complete line (without the newline)
    /// @return std::nullopt if no complete line arrived in time
    /// @throws TransportError on EOF or when the peer process exited
    virtual std::optional<std::string> poll_line(std::chrono::milliseconds wait) = 0;

    /// Release the stream and its peer. Idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /// OS process id of the peer, or 0 when there is none
    virtual int pid() const
    {
        return 0;
    }
};

} // namespace mcpmux::client
