#pragma once
#include "mcpmux/types.hpp"

#include <stdexcept>
#include <string>

namespace mcpmux
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// The subprocess could not be started
struct SpawnError : public Error
{
    using Error::Error;
};

class TransportError : public Error
{
  public:
    enum class Reason
    {
        Closed,        ///< Transport was never opened or already closed
        Eof,           ///< Child closed its stdout
        ProcessExited, ///< Child terminated
        BrokenPipe,    ///< Child closed its stdin
        Io             ///< Any other read/write failure
    };

    TransportError(Reason reason, const std::string& message)
        : Error(message), reason_(reason)
    {
    }

    Reason reason() const noexcept
    {
        return reason_;
    }

  private:
    Reason reason_;
};

/// Malformed JSON or an envelope that is not valid JSON-RPC 2.0
struct ProtocolError : public Error
{
    using Error::Error;
};

class HandshakeError : public Error
{
  public:
    enum class Reason
    {
        VersionMismatch,
        MalformedResponse,
        Rejected ///< Server answered initialize with a JSON-RPC error
    };

    HandshakeError(Reason reason, const std::string& message)
        : Error(message), reason_(reason)
    {
    }

    Reason reason() const noexcept
    {
        return reason_;
    }

  private:
    Reason reason_;
};

struct TimeoutError : public Error
{
    using Error::Error;
};

struct UnknownServerError : public Error
{
    using Error::Error;
};

struct UnknownToolError : public Error
{
    using Error::Error;
};

/// A JSON-RPC error object returned by the server, kept verbatim
class RemoteError : public Error
{
  public:
    RemoteError(int code, const std::string& message, Json data = nullptr)
        : Error(message), code_(code), data_(std::move(data))
    {
    }

    int code() const noexcept
    {
        return code_;
    }

    const Json& data() const noexcept
    {
        return data_;
    }

  private:
    int code_;
    Json data_;
};

struct CancelledError : public Error
{
    using Error::Error;
};

struct NotInitializedError : public Error
{
    using Error::Error;
};

struct DuplicateServerError : public Error
{
    using Error::Error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

} // namespace mcpmux
