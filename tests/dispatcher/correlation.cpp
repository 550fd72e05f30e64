#include "mcpmux/client/dispatcher.hpp"
#include "mcpmux/exceptions.hpp"
#include "support/scripted_transport.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

using namespace mcpmux;
using namespace mcpmux::client;
using mcpmux::testing::ScriptedTransport;
using namespace std::chrono_literals;

namespace
{

struct Fixture
{
    std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();
    std::ostringstream log;
    util::LoggerPtr logger = std::make_shared<util::Logger>(util::LogLevel::Debug, &log);
    RequestDispatcher dispatcher{transport, "test", logger,
                                 RequestDispatcher::Options{10ms, 200ms}};

    Fixture()
    {
        dispatcher.start();
    }
};

Json result_for(const Json& id, const Json& result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

} // namespace

static void test_out_of_order_responses()
{
    Fixture f;
    // Hold replies until all three requests are in flight, then answer in reverse
    std::vector<Json> held;
    std::mutex held_mutex;
    f.transport->set_responder(
        [&](const Json& msg, ScriptedTransport& t)
        {
            std::lock_guard<std::mutex> lock(held_mutex);
            held.push_back(msg);
            if (held.size() == 3)
            {
                for (auto it = held.rbegin(); it != held.rend(); ++it)
                    t.push(result_for((*it)["id"], Json{{"echo", (*it)["params"]["n"]}}));
            }
        });

    std::vector<std::future<Json>> calls;
    for (int n = 0; n < 3; ++n)
        calls.push_back(std::async(std::launch::async,
                                   [&f, n]()
                                   { return f.dispatcher.call("work", Json{{"n", n}}, 5s); }));

    for (int n = 0; n < 3; ++n)
        assert(calls[static_cast<size_t>(n)].get()["echo"] == n);
    assert(f.dispatcher.pending_count() == 0);
    std::cout << "[PASS] out-of-order responses reach their own callers" << std::endl;
}

static void test_ids_strictly_increase()
{
    Fixture f;
    f.transport->set_responder([](const Json& msg, ScriptedTransport& t)
                               { t.push(result_for(msg["id"], Json::object())); });

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i)
        threads.emplace_back(
            [&f]()
            {
                for (int k = 0; k < 25; ++k)
                    (void)f.dispatcher.call("ping", Json::object(), 5s);
            });
    for (auto& t : threads)
        t.join();

    std::set<int64_t> ids;
    for (const auto& m : f.transport->sent())
        ids.insert(m["id"].get<int64_t>());
    assert(ids.size() == 100);
    assert(*ids.begin() == 1);
    assert(*ids.rbegin() == 100);
    assert(f.dispatcher.last_issued_id() == 100);

    // A single caller observes strictly increasing ids on the wire
    auto before = f.transport->sent().size();
    (void)f.dispatcher.call("ping", Json::object(), 5s);
    (void)f.dispatcher.call("ping", Json::object(), 5s);
    auto sent = f.transport->sent();
    assert(sent[before]["id"].get<int64_t>() < sent[before + 1]["id"].get<int64_t>());
    std::cout << "[PASS] ids are unique and increasing" << std::endl;
}

static void test_timeout_then_late_response()
{
    Fixture f;
    auto start = std::chrono::steady_clock::now();
    bool timed_out = false;
    try
    {
        (void)f.dispatcher.call("slow", Json::object(), 100ms);
    }
    catch (const TimeoutError& e)
    {
        timed_out = true;
        assert(std::string(e.what()).find("slow") != std::string::npos);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(timed_out);
    assert(elapsed >= 100ms);
    assert(elapsed < 2s);
    assert(f.dispatcher.pending_count() == 0);

    // The late answer is dropped and the dispatcher keeps working
    int64_t late_id = f.transport->sent().back()["id"].get<int64_t>();
    f.transport->push(result_for(late_id, Json{{"late", true}}));
    f.transport->set_responder([](const Json& msg, ScriptedTransport& t)
                               { t.push(result_for(msg["id"], Json{{"fresh", true}})); });
    auto r = f.dispatcher.call("next", Json::object(), 5s);
    assert(r["fresh"] == true);
    assert(f.dispatcher.last_issued_id() == late_id + 1);
    std::cout << "[PASS] timeout resolves once; late response discarded" << std::endl;
}

static void test_remote_error()
{
    Fixture f;
    f.transport->set_responder(
        [](const Json& msg, ScriptedTransport& t)
        {
            t.push(Json{{"jsonrpc", "2.0"},
                        {"id", msg["id"]},
                        {"error", {{"code", -32602}, {"message", "bad args"}, {"data", {1, 2}}}}});
        });
    bool caught = false;
    try
    {
        (void)f.dispatcher.call("tools/call", Json::object(), 5s);
    }
    catch (const RemoteError& e)
    {
        caught = true;
        assert(e.code() == -32602);
        assert(std::string(e.what()) == "bad args");
        assert(e.data() == Json::array({1, 2}));
    }
    assert(caught);
    std::cout << "[PASS] JSON-RPC errors surface verbatim" << std::endl;
}

static void test_malformed_lines_are_dropped()
{
    Fixture f;
    f.transport->set_responder(
        [](const Json& msg, ScriptedTransport& t)
        {
            t.push_line("{ this is not json");
            t.push_line(R"({"jsonrpc":"2.0","id":99999,"result":{}})");
            t.push_line(R"({"jsonrpc":"1.0","id":1,"result":{}})");
            t.push(result_for(msg["id"], Json{{"ok", true}}));
        });
    auto r = f.dispatcher.call("x", Json::object(), 5s);
    assert(r["ok"] == true);
    assert(f.dispatcher.is_running());
    assert(f.log.str().find("dropping invalid message") != std::string::npos);
    std::cout << "[PASS] malformed and unmatched lines do not stop the reader" << std::endl;
}

static void test_string_ids_are_matched()
{
    Fixture f;
    f.transport->set_responder(
        [](const Json& msg, ScriptedTransport& t)
        { t.push(result_for(std::to_string(msg["id"].get<int64_t>()), Json{{"ok", 1}})); });
    auto r = f.dispatcher.call("x", Json::object(), 5s);
    assert(r["ok"] == 1);
    std::cout << "[PASS] numeric string ids resolve their request" << std::endl;
}

static void test_notifications_routed()
{
    Fixture f;
    std::promise<mcp::NotificationKind> seen;
    auto seen_future = seen.get_future();
    std::atomic<bool> delivered{false};
    f.dispatcher.set_notification_handler(
        [&](mcp::NotificationKind kind, const mcp::Notification&)
        {
            if (!delivered.exchange(true))
                seen.set_value(kind);
        });

    f.transport->push(Json{{"jsonrpc", "2.0"}, {"method", "notifications/tools/list_changed"}});
    assert(seen_future.wait_for(2s) == std::future_status::ready);
    assert(seen_future.get() == mcp::NotificationKind::ToolsListChanged);
    assert(f.dispatcher.pending_count() == 0);
    std::cout << "[PASS] notifications reach the handler" << std::endl;
}

static void test_server_requests_answered()
{
    Fixture f;
    f.transport->push(Json{{"jsonrpc", "2.0"}, {"id", "srv-1"}, {"method", "ping"}});
    f.transport->push(
        Json{{"jsonrpc", "2.0"}, {"id", "srv-2"}, {"method", "sampling/createMessage"}});
    assert(f.transport->wait_for_sent(2, 2s));

    auto sent = f.transport->sent();
    assert(sent[0]["id"] == "srv-1");
    assert(sent[0]["result"].is_object() && sent[0]["result"].empty());
    assert(sent[1]["id"] == "srv-2");
    assert(sent[1]["error"]["code"] == -32601);
    // Answers are not requests: no id was consumed
    assert(f.dispatcher.last_issued_id() == 0);
    std::cout << "[PASS] server ping answered, other requests refused" << std::endl;
}

static void test_cancel_all()
{
    Fixture f;
    auto pending = std::async(std::launch::async,
                              [&f]() { return f.dispatcher.call("never", Json::object(), 30s); });
    assert(f.transport->wait_for_sent(1, 2s));
    while (f.dispatcher.pending_count() == 0)
        std::this_thread::sleep_for(1ms);

    f.dispatcher.cancel_all("shutting down");
    bool cancelled = false;
    try
    {
        (void)pending.get();
    }
    catch (const CancelledError& e)
    {
        cancelled = true;
        assert(std::string(e.what()).find("shutting down") != std::string::npos);
    }
    assert(cancelled);

    // New calls are refused without touching the transport
    auto before = f.transport->sent().size();
    bool refused = false;
    try
    {
        (void)f.dispatcher.call("later", Json::object(), 1s);
    }
    catch (const CancelledError&)
    {
        refused = true;
    }
    assert(refused);
    assert(f.transport->sent().size() == before);
    std::cout << "[PASS] cancel_all resolves waiters with CancelledError" << std::endl;
}

static void test_transport_failure()
{
    Fixture f;
    auto pending = std::async(std::launch::async,
                              [&f]() { return f.dispatcher.call("never", Json::object(), 30s); });
    assert(f.transport->wait_for_sent(1, 2s));
    f.transport->kill_peer();

    bool failed = false;
    try
    {
        (void)pending.get();
    }
    catch (const TransportError& e)
    {
        failed = true;
        assert(e.reason() == TransportError::Reason::ProcessExited);
    }
    assert(failed);

    bool next_failed = false;
    try
    {
        (void)f.dispatcher.call("again", Json::object(), 1s);
    }
    catch (const TransportError&)
    {
        next_failed = true;
    }
    assert(next_failed);
    std::cout << "[PASS] stream failure fails in-flight and later calls" << std::endl;
}

static void test_write_failure()
{
    Fixture f;
    f.transport->fail_writes(true);
    bool failed = false;
    try
    {
        (void)f.dispatcher.call("x", Json::object(), 1s);
    }
    catch (const TransportError& e)
    {
        failed = true;
        assert(e.reason() == TransportError::Reason::BrokenPipe);
    }
    assert(failed);
    assert(f.dispatcher.pending_count() == 0);
    std::cout << "[PASS] write failure leaves no pending entry" << std::endl;
}

static void test_stop_cancels()
{
    auto transport = std::make_shared<ScriptedTransport>();
    auto logger = std::make_shared<util::Logger>(util::LogLevel::Off);
    RequestDispatcher dispatcher(transport, "stop", logger, RequestDispatcher::Options{10ms, 200ms});

    bool not_running = false;
    try
    {
        (void)dispatcher.call("x", Json::object(), 1s);
    }
    catch (const TransportError& e)
    {
        not_running = e.reason() == TransportError::Reason::Closed;
    }
    assert(not_running);
    assert(transport->sent().empty());

    dispatcher.start();
    auto pending = std::async(std::launch::async,
                              [&]() { return dispatcher.call("never", Json::object(), 30s); });
    assert(transport->wait_for_sent(1, 2s));
    while (dispatcher.pending_count() == 0)
        std::this_thread::sleep_for(1ms);
    dispatcher.stop();
    assert(!dispatcher.is_running());

    bool cancelled = false;
    try
    {
        (void)pending.get();
    }
    catch (const CancelledError&)
    {
        cancelled = true;
    }
    assert(cancelled);
    std::cout << "[PASS] stop() joins the reader and cancels waiters" << std::endl;
}

static void test_reader_not_blocked_by_slow_write()
{
    Fixture f;
    std::promise<void> drained;
    auto drained_future = drained.get_future();
    std::atomic<bool> signalled{false};
    f.dispatcher.set_notification_handler(
        [&](mcp::NotificationKind, const mcp::Notification&)
        {
            if (!signalled.exchange(true))
                drained.set_value();
        });

    // While the upload is still being written the peer talks back; the reader
    // has to keep consuming instead of queueing behind the writer.
    std::atomic<bool> reader_progressed{false};
    f.transport->set_responder(
        [&](const Json& msg, ScriptedTransport& t)
        {
            if (msg.value("method", std::string()) != "upload")
                return;
            t.push(Json{{"jsonrpc", "2.0"}, {"id", "srv-9"}, {"method", "ping"}});
            t.push(Json{{"jsonrpc", "2.0"},
                        {"method", "notifications/message"},
                        {"params", {{"data", "busy"}}}});
            reader_progressed = drained_future.wait_for(2s) == std::future_status::ready;
            t.push(result_for(msg["id"], Json{{"stored", true}}));
        });

    auto result = f.dispatcher.call("upload", Json{{"blob", std::string(1 << 17, 'x')}}, 5s);
    assert(reader_progressed);
    assert(result["stored"] == true);

    // The ping answer goes out once the writer is free
    assert(f.transport->wait_for_sent(2, 2s));
    auto sent = f.transport->sent();
    assert(sent[1]["id"] == "srv-9");
    assert(sent[1]["result"].is_object() && sent[1]["result"].empty());
    std::cout << "[PASS] reader keeps draining while a large request is written" << std::endl;
}

static void test_handler_may_destroy_dispatcher()
{
    auto transport = std::make_shared<ScriptedTransport>();
    auto logger = std::make_shared<util::Logger>(util::LogLevel::Off);
    auto dispatcher = std::make_unique<RequestDispatcher>(transport, "gone", logger,
                                                          RequestDispatcher::Options{10ms, 200ms});
    std::promise<int> destroyed;
    auto destroyed_future = destroyed.get_future();
    dispatcher->set_notification_handler(
        [&](mcp::NotificationKind, const mcp::Notification&)
        {
            dispatcher.reset();
            destroyed.set_value(transport->poll_count());
        });
    dispatcher->start();

    transport->push(Json{{"jsonrpc", "2.0"}, {"method", "notifications/tools/list_changed"}});
    assert(destroyed_future.wait_for(2s) == std::future_status::ready);
    int polls = destroyed_future.get();

    // The detached reader must not come back to a destroyed dispatcher
    std::this_thread::sleep_for(100ms);
    assert(transport->poll_count() == polls);
    std::cout << "[PASS] notification handler may destroy the dispatcher" << std::endl;
}

int main()
{
    test_out_of_order_responses();
    test_ids_strictly_increase();
    test_timeout_then_late_response();
    test_remote_error();
    test_malformed_lines_are_dropped();
    test_string_ids_are_matched();
    test_notifications_routed();
    test_server_requests_answered();
    test_cancel_all();
    test_transport_failure();
    test_write_failure();
    test_stop_cancels();
    test_reader_not_blocked_by_slow_write();
    test_handler_may_destroy_dispatcher();
    std::cout << "\n[OK] dispatcher tests passed" << std::endl;
    return 0;
}
