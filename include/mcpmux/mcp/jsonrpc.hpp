#pragma once
/// @file mcp/jsonrpc.hpp
/// @brief JSON-RPC 2.0 envelopes and MCP method names used by the stdio client

#include "mcpmux/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcpmux::mcp
{

namespace error_code
{
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
} // namespace error_code

namespace method
{
constexpr const char* Initialize = "initialize";
constexpr const char* Initialized = "notifications/initialized";
constexpr const char* Ping = "ping";
constexpr const char* ToolsList = "tools/list";
constexpr const char* ToolsCall = "tools/call";
constexpr const char* ResourcesList = "resources/list";
constexpr const char* ResourcesRead = "resources/read";
constexpr const char* PromptsList = "prompts/list";
constexpr const char* PromptsGet = "prompts/get";
} // namespace method

// ============================================================================
// Incoming messages
// ============================================================================

/// Successful answer to one of our requests
struct Response
{
    Json id;
    Json result;
};

/// Error answer to one of our requests (id may be null for parse errors)
struct ErrorResponse
{
    Json id;
    int code{0};
    std::string message;
    Json data;
};

/// Server-to-client message without an id; never answered
struct Notification
{
    std::string method;
    Json params = Json::object();
};

/// Server-to-client request; must be answered with the same id
struct ServerRequest
{
    Json id;
    std::string method;
    Json params = Json::object();
};

using Message = std::variant<Response, ErrorResponse, Notification, ServerRequest>;

/// Classify one line read from a server
/// @throws ProtocolError for malformed JSON or an invalid JSON-RPC envelope
Message parse_message(const std::string& line);

/// Integer view of a JSON-RPC id ("7" and 7 both map to 7)
std::optional<int64_t> numeric_id(const Json& id);

// ============================================================================
// Outgoing messages
// ============================================================================

Json make_request(int64_t id, const std::string& method, const Json& params);
Json make_notification(const std::string& method, const Json& params = Json::object());
Json make_result_response(const Json& id, const Json& result);
Json make_error_response(const Json& id, int code, const std::string& message);

// ============================================================================
// Notifications known to the client
// ============================================================================

enum class NotificationKind
{
    Initialized,
    ToolsListChanged,
    ResourcesListChanged,
    ResourceUpdated,
    PromptsListChanged,
    Progress,
    LoggingMessage,
    Cancelled,
    Unknown
};

NotificationKind notification_kind(const std::string& method);
const char* to_string(NotificationKind kind);

} // namespace mcpmux::mcp
