#include "mcpmux/exceptions.hpp"
#include "mcpmux/mcp/jsonrpc.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <variant>

using namespace mcpmux;
using namespace mcpmux::mcp;

static bool rejects(const std::string& line)
{
    try
    {
        (void)parse_message(line);
    }
    catch (const ProtocolError&)
    {
        return true;
    }
    return false;
}

int main()
{
    // Responses
    {
        auto m = parse_message(R"({"jsonrpc":"2.0","id":7,"result":{"x":1}})");
        assert(std::holds_alternative<Response>(m));
        const auto& r = std::get<Response>(m);
        assert(r.id == 7);
        assert(r.result["x"] == 1);

        auto null_result = parse_message(R"({"jsonrpc":"2.0","id":8,"result":null})");
        assert(std::holds_alternative<Response>(null_result));
        assert(std::get<Response>(null_result).result.is_null());
        std::cout << "[PASS] result responses" << std::endl;
    }

    // Error responses keep code, message and data verbatim
    {
        auto m = parse_message(
            R"({"jsonrpc":"2.0","id":3,"error":{"code":-32602,"message":"bad","data":{"k":"v"}}})");
        assert(std::holds_alternative<ErrorResponse>(m));
        const auto& e = std::get<ErrorResponse>(m);
        assert(e.id == 3);
        assert(e.code == error_code::InvalidParams);
        assert(e.message == "bad");
        assert(e.data["k"] == "v");

        auto anonymous =
            parse_message(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"x"}})");
        assert(std::holds_alternative<ErrorResponse>(anonymous));
        assert(std::get<ErrorResponse>(anonymous).id.is_null());
        std::cout << "[PASS] error responses" << std::endl;
    }

    // Notifications and server requests
    {
        auto n = parse_message(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");
        assert(std::holds_alternative<Notification>(n));
        assert(std::get<Notification>(n).method == "notifications/tools/list_changed");
        assert(std::get<Notification>(n).params.is_object());

        auto r = parse_message(R"({"jsonrpc":"2.0","id":"s1","method":"ping"})");
        assert(std::holds_alternative<ServerRequest>(r));
        assert(std::get<ServerRequest>(r).id == "s1");
        assert(std::get<ServerRequest>(r).method == "ping");
        std::cout << "[PASS] notifications and server requests" << std::endl;
    }

    // Malformed input
    {
        assert(rejects("not json"));
        assert(rejects("[1,2,3]"));
        assert(rejects(R"({"id":1,"result":{}})"));
        assert(rejects(R"({"jsonrpc":"1.0","id":1,"result":{}})"));
        assert(rejects(R"({"jsonrpc":"2.0","id":1})"));
        assert(rejects(R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"m"}})"));
        assert(rejects(R"({"jsonrpc":"2.0","id":1,"error":{"message":"no code"}})"));
        assert(rejects(R"({"jsonrpc":"2.0","id":{"nested":true},"result":{}})"));
        assert(rejects(R"({"jsonrpc":"2.0","method":42})"));
        assert(rejects(R"({"jsonrpc":"2.0","method":"x","params":"scalar"})"));
        assert(rejects(R"({"jsonrpc":"2.0"})"));
        std::cout << "[PASS] malformed messages rejected" << std::endl;
    }

    // Id normalization
    {
        assert(numeric_id(Json(12)) == 12);
        assert(numeric_id(Json("12")) == 12);
        assert(!numeric_id(Json("srv-1")));
        assert(!numeric_id(Json("")));
        assert(!numeric_id(Json()));
        std::cout << "[PASS] numeric ids" << std::endl;
    }

    // Outgoing envelopes
    {
        auto req = make_request(5, method::ToolsCall, Json{{"name", "add"}});
        assert(req["jsonrpc"] == "2.0");
        assert(req["id"] == 5);
        assert(req["method"] == "tools/call");
        assert(req["params"]["name"] == "add");

        auto bare = make_request(6, method::Ping, Json());
        assert(bare["params"].is_object() && bare["params"].empty());

        auto note = make_notification(method::Initialized);
        assert(!note.contains("id"));
        assert(note["method"] == "notifications/initialized");

        auto err = make_error_response("s1", error_code::MethodNotFound, "nope");
        assert(err["id"] == "s1");
        assert(err["error"]["code"] == -32601);

        auto ok = make_result_response(9, Json::object());
        assert(ok["result"].is_object());
        std::cout << "[PASS] outgoing envelopes" << std::endl;
    }

    // Notification kinds
    {
        assert(notification_kind("notifications/tools/list_changed") ==
               NotificationKind::ToolsListChanged);
        assert(notification_kind("notifications/message") == NotificationKind::LoggingMessage);
        assert(notification_kind("notifications/progress") == NotificationKind::Progress);
        assert(notification_kind("notifications/whatever") == NotificationKind::Unknown);
        assert(std::string(to_string(NotificationKind::Cancelled)) == "cancelled");
        std::cout << "[PASS] notification kinds" << std::endl;
    }

    std::cout << "\n[OK] jsonrpc codec tests passed" << std::endl;
    return 0;
}
