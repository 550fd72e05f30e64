#pragma once
/// @file client/types.hpp
/// @brief Descriptors a server advertises through tools/list, resources/list
///        and prompts/list, plus the summary returned when a server is added

#include "mcpmux/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mcpmux::client
{

// ============================================================================
// Tool Types
// ============================================================================

/// Tool information as returned by tools/list
struct ToolDescriptor
{
    std::string name;
    std::optional<std::string> title; ///< Human-readable title
    std::string description;
    Json input_schema = Json{{"type", "object"}, {"properties", Json::object()}};
    std::optional<Json> output_schema;
};

// ============================================================================
// Resource Types
// ============================================================================

/// Resource information as returned by resources/list
struct ResourceDescriptor
{
    std::string name;
    std::string uri;
    std::string description;
    std::optional<std::string> mime_type;
};

// ============================================================================
// Prompt Types
// ============================================================================

struct PromptArgument
{
    std::string name;
    std::string description;
    bool required{false};
};

/// Prompt information as returned by prompts/list
struct PromptDescriptor
{
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
};

/// One page of a paginated listing
template <typename T>
struct Page
{
    std::vector<T> items;
    std::optional<std::string> next_cursor;
};

using ToolPage = Page<ToolDescriptor>;
using ResourcePage = Page<ResourceDescriptor>;
using PromptPage = Page<PromptDescriptor>;

/// What McpManager::add_server reports about a freshly connected server
struct ServerSummary
{
    std::string name;
    std::string protocol_version;
    Implementation server_info;
    ServerCapabilities capabilities;
    std::optional<std::string> instructions;
    size_t tool_count{0};
    size_t resource_count{0};
    size_t prompt_count{0};
    int pid{0};
};

// nlohmann::json adapters

inline void from_json(const Json& j, ToolDescriptor& t)
{
    t.name = j.at("name").get<std::string>();
    if (j.contains("title") && j["title"].is_string())
        t.title = j["title"].get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        t.description = j["description"].get<std::string>();
    if (j.contains("inputSchema") && j["inputSchema"].is_object())
        t.input_schema = j["inputSchema"];
    if (j.contains("outputSchema") && j["outputSchema"].is_object())
        t.output_schema = j["outputSchema"];
}

inline void to_json(Json& j, const ToolDescriptor& t)
{
    j = Json{{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
    if (t.title)
        j["title"] = *t.title;
    if (t.output_schema)
        j["outputSchema"] = *t.output_schema;
}

inline void from_json(const Json& j, ResourceDescriptor& r)
{
    r.uri = j.at("uri").get<std::string>();
    r.name = j.value("name", r.uri);
    if (j.contains("description") && j["description"].is_string())
        r.description = j["description"].get<std::string>();
    if (j.contains("mimeType") && j["mimeType"].is_string())
        r.mime_type = j["mimeType"].get<std::string>();
}

inline void to_json(Json& j, const ResourceDescriptor& r)
{
    j = Json{{"name", r.name}, {"uri", r.uri}, {"description", r.description}};
    if (r.mime_type)
        j["mimeType"] = *r.mime_type;
}

inline void from_json(const Json& j, PromptArgument& a)
{
    a.name = j.at("name").get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        a.description = j["description"].get<std::string>();
    a.required = j.value("required", false);
}

inline void to_json(Json& j, const PromptArgument& a)
{
    j = Json{{"name", a.name}, {"description", a.description}, {"required", a.required}};
}

inline void from_json(const Json& j, PromptDescriptor& p)
{
    p.name = j.at("name").get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        p.description = j["description"].get<std::string>();
    if (j.contains("arguments") && j["arguments"].is_array())
        p.arguments = j["arguments"].get<std::vector<PromptArgument>>();
}

inline void to_json(Json& j, const PromptDescriptor& p)
{
    j = Json{{"name", p.name}, {"description", p.description}, {"arguments", p.arguments}};
}

} // namespace mcpmux::client
