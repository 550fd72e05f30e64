#include "mcpmux/mcp/jsonrpc.hpp"

#include "mcpmux/exceptions.hpp"
#include "mcpmux/util/json.hpp"
#include "mcpmux/version.hpp"

namespace mcpmux::mcp
{

namespace
{

bool is_valid_id(const Json& id)
{
    return id.is_number_integer() || id.is_number_unsigned() || id.is_string() || id.is_null();
}

Json params_or_empty(const Json& msg)
{
    auto it = msg.find("params");
    if (it == msg.end() || it->is_null())
        return Json::object();
    if (!it->is_object() && !it->is_array())
        throw ProtocolError("JSON-RPC params must be an object or array");
    return *it;
}

} // namespace

Message parse_message(const std::string& line)
{
    Json msg;
    try
    {
        msg = util::json::parse(line);
    }
    catch (const Json::parse_error& e)
    {
        throw ProtocolError(std::string("Malformed JSON: ") + e.what());
    }

    if (!msg.is_object())
        throw ProtocolError("JSON-RPC message must be an object");

    auto version = msg.find("jsonrpc");
    if (version == msg.end() || !version->is_string() ||
        version->get<std::string>() != JSONRPC_VERSION)
        throw ProtocolError("Missing or unsupported jsonrpc version");

    auto id_it = msg.find("id");
    bool has_id = id_it != msg.end() && !id_it->is_null();
    if (id_it != msg.end() && !is_valid_id(*id_it))
        throw ProtocolError("JSON-RPC id must be a number or string");

    auto method_it = msg.find("method");
    if (method_it != msg.end())
    {
        if (!method_it->is_string())
            throw ProtocolError("JSON-RPC method must be a string");
        std::string name = method_it->get<std::string>();
        if (has_id)
            return ServerRequest{*id_it, std::move(name), params_or_empty(msg)};
        return Notification{std::move(name), params_or_empty(msg)};
    }

    if (id_it == msg.end())
        throw ProtocolError("JSON-RPC message has neither method nor id");

    bool has_result = msg.contains("result");
    bool has_error = msg.contains("error");
    if (has_result == has_error)
        throw ProtocolError("JSON-RPC response must carry exactly one of result or error");

    if (has_result)
    {
        if (!has_id)
            throw ProtocolError("JSON-RPC result without id");
        return Response{*id_it, msg["result"]};
    }

    const Json& err = msg["error"];
    if (!err.is_object() || !err.contains("code") || !err["code"].is_number_integer() ||
        !err.contains("message") || !err["message"].is_string())
        throw ProtocolError("JSON-RPC error object must have integer code and string message");

    ErrorResponse out;
    out.id = *id_it;
    out.code = err["code"].get<int>();
    out.message = err["message"].get<std::string>();
    out.data = err.value("data", Json());
    return out;
}

std::optional<int64_t> numeric_id(const Json& id)
{
    if (id.is_number_integer() || id.is_number_unsigned())
        return id.get<int64_t>();
    if (id.is_string())
    {
        const auto& s = id.get_ref<const std::string&>();
        if (s.empty())
            return std::nullopt;
        try
        {
            size_t pos = 0;
            int64_t v = std::stoll(s, &pos, 10);
            if (pos == s.size())
                return v;
        }
        catch (const std::logic_error&)
        {
            // invalid_argument / out_of_range: not one of ours
        }
    }
    return std::nullopt;
}

Json make_request(int64_t id, const std::string& method, const Json& params)
{
    return Json{{"jsonrpc", JSONRPC_VERSION},
                {"id", id},
                {"method", method},
                {"params", params.is_null() ? Json::object() : params}};
}

Json make_notification(const std::string& method, const Json& params)
{
    return Json{{"jsonrpc", JSONRPC_VERSION},
                {"method", method},
                {"params", params.is_null() ? Json::object() : params}};
}

Json make_result_response(const Json& id, const Json& result)
{
    return Json{{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", result}};
}

Json make_error_response(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", JSONRPC_VERSION},
                {"id", id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

NotificationKind notification_kind(const std::string& method)
{
    if (method == "notifications/initialized")
        return NotificationKind::Initialized;
    if (method == "notifications/tools/list_changed")
        return NotificationKind::ToolsListChanged;
    if (method == "notifications/resources/list_changed")
        return NotificationKind::ResourcesListChanged;
    if (method == "notifications/resources/updated")
        return NotificationKind::ResourceUpdated;
    if (method == "notifications/prompts/list_changed")
        return NotificationKind::PromptsListChanged;
    if (method == "notifications/progress")
        return NotificationKind::Progress;
    if (method == "notifications/message")
        return NotificationKind::LoggingMessage;
    if (method == "notifications/cancelled")
        return NotificationKind::Cancelled;
    return NotificationKind::Unknown;
}

const char* to_string(NotificationKind kind)
{
    switch (kind)
    {
    case NotificationKind::Initialized:
        return "initialized";
    case NotificationKind::ToolsListChanged:
        return "tools/list_changed";
    case NotificationKind::ResourcesListChanged:
        return "resources/list_changed";
    case NotificationKind::ResourceUpdated:
        return "resources/updated";
    case NotificationKind::PromptsListChanged:
        return "prompts/list_changed";
    case NotificationKind::Progress:
        return "progress";
    case NotificationKind::LoggingMessage:
        return "message";
    case NotificationKind::Cancelled:
        return "cancelled";
    case NotificationKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

} // namespace mcpmux::mcp
