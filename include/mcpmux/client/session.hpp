#pragma once
/// @file client/session.hpp
/// @brief One MCP conversation with one server: handshake, state, typed requests

#include "mcpmux/client/dispatcher.hpp"
#include "mcpmux/client/transport.hpp"
#include "mcpmux/client/types.hpp"
#include "mcpmux/settings.hpp"
#include "mcpmux/types.hpp"
#include "mcpmux/util/log.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcpmux::client
{

/// Lifecycle of a session. Closed is terminal and reachable from every state.
enum class SessionState
{
    Unconnected,
    Initializing,
    Ready,
    Closed
};

const char* to_string(SessionState state);

/// MCP session over an already opened transport.
///
/// Example usage:
/// @code
/// auto transport = std::make_shared<StdioTransport>();
/// transport->open(descriptor);
/// ProtocolSession session(descriptor, transport, Settings{}, logger);
/// session.initialize();
/// auto page = session.list_tools();
/// auto result = session.call_tool("add", {{"a", 2}, {"b", 3}});
/// session.close();
/// @endcode
class ProtocolSession
{
  public:
    ProtocolSession(ServerDescriptor descriptor, std::shared_ptr<ITransport> transport,
                    const Settings& settings, util::LoggerPtr logger);
    ~ProtocolSession();

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    /// Run the initialize handshake. Legal only from Unconnected.
    /// On failure the session is Closed before the error propagates.
    /// @throws HandshakeError, TransportError, TimeoutError, ProtocolError
    void initialize();

    /// Send any request; requires Ready
    /// @throws NotInitializedError without touching the transport when not Ready
    Json request(const std::string& method, const Json& params,
                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // ==========================================================================
    // MCP operations
    // ==========================================================================

    ToolPage list_tools(const std::optional<std::string>& cursor = std::nullopt);

    /// @return The server's result object verbatim
    Json call_tool(const std::string& name, const Json& arguments,
                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    ResourcePage list_resources(const std::optional<std::string>& cursor = std::nullopt);
    Json read_resource(const std::string& uri);

    PromptPage list_prompts(const std::optional<std::string>& cursor = std::nullopt);
    Json get_prompt(const std::string& name, const Json& arguments = Json::object());

    void ping();

    /// Cancel pending requests, stop the reader, close the transport. Idempotent.
    /// @throws TransportError if the server process could not be stopped
    void close();

    // ==========================================================================
    // Negotiated state
    // ==========================================================================

    SessionState state() const;
    const ServerDescriptor& descriptor() const
    {
        return descriptor_;
    }
    const std::string& name() const
    {
        return descriptor_.name;
    }
    std::string protocol_version() const;
    ServerCapabilities capabilities() const;
    Implementation server_info() const;
    std::optional<std::string> instructions() const;
    std::chrono::milliseconds request_timeout() const
    {
        return request_timeout_;
    }
    int pid() const;

    RequestDispatcher& dispatcher()
    {
        return *dispatcher_;
    }

  private:
    [[noreturn]] void abort_handshake(std::exception_ptr error);

    ServerDescriptor descriptor_;
    std::shared_ptr<ITransport> transport_;
    Implementation client_info_;
    std::chrono::milliseconds request_timeout_;
    util::LoggerPtr logger_;
    std::string component_;
    std::unique_ptr<RequestDispatcher> dispatcher_;

    mutable std::mutex state_mutex_;
    SessionState state_{SessionState::Unconnected};
    bool closed_{false};
    std::string protocol_version_;
    ServerCapabilities capabilities_;
    Implementation server_info_;
    std::optional<std::string> instructions_;
};

} // namespace mcpmux::client
