#pragma once
#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpmux
{

using Json = nlohmann::json;

/// Launch description for one MCP stdio server.
/// A session copies its descriptor, so later edits never reach a live server.
struct ServerDescriptor
{
    std::string name;    ///< Unique key within a manager
    std::string command; ///< Executable path, or a name looked up in PATH
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Overrides on top of the inherited environment
    std::optional<std::chrono::milliseconds> timeout; ///< Per-request deadline
    std::optional<std::string> cwd;
};

/// Identity block exchanged during the handshake (clientInfo / serverInfo)
struct Implementation
{
    std::string name;
    std::string version;
};

/// Capabilities a server declared in its initialize result
struct ServerCapabilities
{
    bool tools{false};
    bool resources{false};
    bool prompts{false};
    bool logging{false};
    bool tools_list_changed{false};
    Json raw = Json::object();
};

inline void to_json(Json& j, const Implementation& impl)
{
    j = Json{{"name", impl.name}, {"version", impl.version}};
}

inline void from_json(const Json& j, Implementation& impl)
{
    impl.name = j.value("name", std::string());
    impl.version = j.value("version", std::string());
}

inline void from_json(const Json& j, ServerCapabilities& caps)
{
    caps.raw = j.is_object() ? j : Json::object();
    caps.tools = caps.raw.contains("tools");
    caps.resources = caps.raw.contains("resources");
    caps.prompts = caps.raw.contains("prompts");
    caps.logging = caps.raw.contains("logging");
    if (caps.tools && caps.raw["tools"].is_object())
        caps.tools_list_changed = caps.raw["tools"].value("listChanged", false);
}

} // namespace mcpmux
