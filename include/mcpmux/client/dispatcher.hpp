#pragma once
/// @file client/dispatcher.hpp
/// @brief JSON-RPC request/response correlation over one ITransport

#include "mcpmux/client/transport.hpp"
#include "mcpmux/mcp/jsonrpc.hpp"
#include "mcpmux/types.hpp"
#include "mcpmux/util/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcpmux::client
{

/// Issues requests over a transport and delivers each response to the
/// caller waiting on the matching id.
///
/// A single reader thread owns all reads. Callers may invoke call() from any
/// number of threads; only the act of writing a line is serialized. Every
/// pending request is resolved exactly once: by its response, by its
/// deadline (TimeoutError), by cancel_all() (CancelledError) or by a stream
/// failure (TransportError).
class RequestDispatcher
{
  public:
    using NotificationHandler =
        std::function<void(mcp::NotificationKind kind, const mcp::Notification& notification)>;

    struct Options
    {
        /// Reader poll slice; bounds how late a deadline or stop() is noticed
        std::chrono::milliseconds poll_interval{50};
        /// Extra wait the caller allows beyond the deadline before resolving itself
        std::chrono::milliseconds backstop_slack{1000};
    };

    RequestDispatcher(std::shared_ptr<ITransport> transport, std::string server_name,
                      util::LoggerPtr logger);
    RequestDispatcher(std::shared_ptr<ITransport> transport, std::string server_name,
                      util::LoggerPtr logger, Options options);
    ~RequestDispatcher();

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    /// Launch the reader thread. Must be called once before call().
    void start();

    /// Send a request and wait for its result
    /// @return The response's `result` member
    /// @throws RemoteError, TimeoutError, CancelledError, TransportError
    Json call(const std::string& method, const Json& params, std::chrono::milliseconds timeout);

    /// Send a notification (no id, no response, never pending)
    void notify(const std::string& method, const Json& params = Json::object());

    /// Handler runs on the reader thread; keep it short. It may stop or
    /// destroy the dispatcher, after which the reader exits without touching it.
    void set_notification_handler(NotificationHandler handler);

    /// Resolve every pending request with CancelledError; new calls are refused
    void cancel_all(const std::string& reason);

    /// Stop and join the reader thread. Does not close the transport.
    void stop();

    size_t pending_count() const;

    /// Highest id issued so far (0 before the first request)
    int64_t last_issued_id() const;

    bool is_running() const
    {
        return running_.load(std::memory_order_acquire);
    }

  private:
    struct PendingRequest
    {
        std::string method;
        std::promise<Json> promise;
        std::chrono::steady_clock::time_point created;
        std::chrono::steady_clock::time_point deadline;
    };

    void reader_loop(const std::atomic<bool>& detached);
    void handle_line(const std::string& line);
    void resolve(const Json& id, const Json* result, const mcp::ErrorResponse* error);
    void handle_server_request(const mcp::ServerRequest& request);
    void handle_notification(const mcp::Notification& notification);
    void expire_deadlines();
    void fail_all(std::exception_ptr error);
    void write_line(const std::string& line);
    void flush_replies();

    std::shared_ptr<ITransport> transport_;
    std::string server_name_;
    util::LoggerPtr logger_;
    Options options_;
    std::string component_;

    mutable std::mutex pending_mutex_;
    std::map<int64_t, PendingRequest> pending_;
    int64_t next_id_{1};
    /// Set once the dispatcher can no longer complete requests
    std::exception_ptr terminal_error_;

    std::mutex write_mutex_;
    /// Replies to server requests; reader thread only
    std::deque<std::string> pending_replies_;

    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::unique_ptr<std::thread> reader_thread_;
    /// Set when stop() runs on the reader thread itself; outlives the dispatcher
    std::shared_ptr<std::atomic<bool>> reader_detached_;
};

} // namespace mcpmux::client
