#pragma once
/// @file client/manager.hpp
/// @brief Named collection of MCP sessions behind one qualified namespace

#include "mcpmux/client/catalog.hpp"
#include "mcpmux/client/session.hpp"
#include "mcpmux/client/transport.hpp"
#include "mcpmux/client/types.hpp"
#include "mcpmux/settings.hpp"
#include "mcpmux/types.hpp"
#include "mcpmux/util/log.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mcpmux::client
{

/// Separator between server name and tool/resource/prompt name
constexpr char kQualifiedSeparator = '_';

inline std::string qualify(const std::string& server, const std::string& name)
{
    return server + kQualifiedSeparator + name;
}

/// Produces an opened transport for a descriptor. The default spawns a
/// StdioTransport; tests substitute in-memory transports.
using TransportFactory =
    std::function<std::shared_ptr<ITransport>(const ServerDescriptor& descriptor)>;

/// Outcome of add_servers(): what came up and what did not
struct AddServersReport
{
    std::vector<ServerSummary> added;
    std::vector<std::pair<std::string, std::string>> failed; ///< (server, error message)
};

/// Owns every session and routes qualified names to them.
///
/// Tool, resource and prompt names are exposed as `<server>_<name>`.
/// Several threads may call call_tool() concurrently; no lock is held while
/// a request is in flight.
///
/// Example usage:
/// @code
/// McpManager manager(Settings::from_env());
/// manager.add_server({"calc", "./calc_server", {}, {}, std::nullopt, std::nullopt});
/// for (const auto& [qualified, tool] : manager.list_all_tools())
///     std::cout << qualified << ": " << tool.description << "\n";
/// auto result = manager.call_tool("calc_add", {{"a", 2}, {"b", 3}});
/// manager.close_all();
/// @endcode
class McpManager
{
  public:
    explicit McpManager(Settings settings = Settings(), util::LoggerPtr logger = nullptr,
                        TransportFactory factory = nullptr);
    ~McpManager();

    McpManager(const McpManager&) = delete;
    McpManager& operator=(const McpManager&) = delete;

    /// Spawn, initialize and catalog a server. Atomic: on any failure nothing
    /// stays registered and the specific error propagates.
    /// @throws DuplicateServerError, SpawnError, HandshakeError, TransportError,
    ///         TimeoutError, RemoteError; CancelledError if close_all() ran meanwhile
    ServerSummary add_server(const ServerDescriptor& descriptor);

    /// Add several servers, continuing past failures
    AddServersReport add_servers(const std::vector<ServerDescriptor>& descriptors);

    /// @throws UnknownServerError if name is not registered
    void remove_server(const std::string& name);

    /// Re-list one server's tools, resources and prompts
    void refresh(const std::string& name);

    /// Qualified name to descriptor. When two servers produce the same
    /// qualified name the longer server name wins and a warning is logged.
    std::map<std::string, ToolDescriptor> list_all_tools() const;
    std::map<std::string, ResourceDescriptor> list_all_resources() const;
    std::map<std::string, PromptDescriptor> list_all_prompts() const;

    /// Route `<server>_<tool>` to its server
    /// @return The server's tools/call result verbatim
    /// @throws UnknownServerError, UnknownToolError before any I/O
    Json call_tool(const std::string& qualified_name, const Json& arguments);

    /// Route `<server>_<resource name>` to resources/read on its URI
    Json read_resource(const std::string& qualified_name);

    /// Route `<server>_<prompt>` to prompts/get
    Json get_prompt(const std::string& qualified_name, const Json& arguments = Json::object());

    std::vector<std::string> server_names() const;
    bool has_server(const std::string& name) const;
    ServerSummary summary(const std::string& name) const;

    /// Close every session concurrently and wait for all of them.
    /// Never throws; returns one message per session that failed to close.
    std::vector<std::string> close_all();

    const Settings& settings() const
    {
        return settings_;
    }

  private:
    struct ServerEntry
    {
        std::unique_ptr<ProtocolSession> session;
        std::unique_ptr<ToolCatalog> catalog;
    };
    using EntryPtr = std::shared_ptr<ServerEntry>;

    enum class Kind
    {
        Tool,
        Resource,
        Prompt
    };

    struct Route
    {
        EntryPtr entry;
        std::string local_name;
    };

    Route route(const std::string& qualified_name, Kind kind) const;
    EntryPtr find_entry(const std::string& name) const;
    ServerSummary summarize(const ServerEntry& entry) const;

    Settings settings_;
    util::LoggerPtr logger_;
    TransportFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, EntryPtr> servers_;
    std::set<std::string> reserved_; ///< names with an add_server in progress
    /// Bumped by close_all(); an add_server that started earlier does not register
    uint64_t close_generation_{0};
};

} // namespace mcpmux::client
