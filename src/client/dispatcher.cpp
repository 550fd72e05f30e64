#include "mcpmux/client/dispatcher.hpp"

#include "mcpmux/exceptions.hpp"

#include <optional>
#include <variant>
#include <vector>

namespace mcpmux::client
{

namespace
{

constexpr size_t kMaxLoggedLine = 200;

std::string clip(const std::string& line)
{
    if (line.size() <= kMaxLoggedLine)
        return line;
    return line.substr(0, kMaxLoggedLine) + "...";
}

std::string describe_request(const std::string& method, int64_t id, const std::string& server)
{
    return "request '" + method + "' (id " + std::to_string(id) + ") to server '" + server + "'";
}

} // namespace

RequestDispatcher::RequestDispatcher(std::shared_ptr<ITransport> transport,
                                     std::string server_name, util::LoggerPtr logger)
    : RequestDispatcher(std::move(transport), std::move(server_name), std::move(logger),
                        Options{})
{
}

RequestDispatcher::RequestDispatcher(std::shared_ptr<ITransport> transport,
                                     std::string server_name, util::LoggerPtr logger,
                                     Options options)
    : transport_(std::move(transport)), server_name_(std::move(server_name)),
      logger_(logger ? std::move(logger) : std::make_shared<util::Logger>()),
      options_(options), component_("dispatcher:" + server_name_)
{
}

RequestDispatcher::~RequestDispatcher()
{
    stop();
}

void RequestDispatcher::start()
{
    if (reader_thread_)
        return;
    stop_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    reader_detached_ = std::make_shared<std::atomic<bool>>(false);
    auto detached = reader_detached_;
    reader_thread_ =
        std::make_unique<std::thread>([this, detached]() { reader_loop(*detached); });
}

void RequestDispatcher::set_notification_handler(NotificationHandler handler)
{
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

// =============================================================================
// Issuing side
// =============================================================================

void RequestDispatcher::write_line(const std::string& line)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    transport_->send_line(line);
}

Json RequestDispatcher::call(const std::string& method, const Json& params,
                             std::chrono::milliseconds timeout)
{
    int64_t id = 0;
    std::future<Json> response;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (terminal_error_)
            std::rethrow_exception(terminal_error_);
        if (!running_.load(std::memory_order_acquire))
            throw TransportError(TransportError::Reason::Closed,
                                 "Dispatcher for server '" + server_name_ + "' is not running");

        id = next_id_++;
        PendingRequest req;
        req.method = method;
        req.created = std::chrono::steady_clock::now();
        req.deadline = req.created + timeout;
        response = req.promise.get_future();
        pending_.emplace(id, std::move(req));
    }

    try
    {
        write_line(mcp::make_request(id, method, params).dump());
    }
    catch (const std::exception&)
    {
        bool owned = false;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            owned = pending_.erase(id) > 0;
        }
        // If the reader already failed this entry, report its error instead
        if (owned)
            throw;
    }

    logger_->debug(component_, "sent " + describe_request(method, id, server_name_));

    if (response.wait_for(timeout + options_.backstop_slack) == std::future_status::timeout)
    {
        bool owned = false;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            owned = pending_.erase(id) > 0;
        }
        if (owned)
            throw TimeoutError(describe_request(method, id, server_name_) + " timed out after " +
                               std::to_string(timeout.count()) + "ms");
    }

    return response.get();
}

void RequestDispatcher::notify(const std::string& method, const Json& params)
{
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (terminal_error_)
            std::rethrow_exception(terminal_error_);
    }
    write_line(mcp::make_notification(method, params).dump());
    logger_->debug(component_, "sent notification '" + method + "'");
}

// =============================================================================
// Reader side
// =============================================================================

void RequestDispatcher::reader_loop(const std::atomic<bool>& detached)
{
    while (!stop_requested_.load(std::memory_order_acquire))
    {
        std::optional<std::string> line;
        try
        {
            line = transport_->poll_line(options_.poll_interval);
        }
        catch (const TransportError& e)
        {
            if (!stop_requested_.load(std::memory_order_acquire))
                logger_->warning(component_, std::string("stream ended: ") + e.what());
            fail_all(std::current_exception());
            break;
        }

        if (line)
        {
            handle_line(*line);
            // A notification handler may have stopped or destroyed us
            if (detached.load(std::memory_order_acquire))
                return;
        }
        expire_deadlines();
        flush_replies();
    }
    running_.store(false, std::memory_order_release);
}

namespace
{

/// Closed dispatch over every message shape a server can send
struct IncomingVisitor
{
    std::function<void(const mcp::Response&)> on_response;
    std::function<void(const mcp::ErrorResponse&)> on_error;
    std::function<void(const mcp::Notification&)> on_notification;
    std::function<void(const mcp::ServerRequest&)> on_request;

    void operator()(const mcp::Response& m) const
    {
        on_response(m);
    }
    void operator()(const mcp::ErrorResponse& m) const
    {
        on_error(m);
    }
    void operator()(const mcp::Notification& m) const
    {
        on_notification(m);
    }
    void operator()(const mcp::ServerRequest& m) const
    {
        on_request(m);
    }
};

} // namespace

void RequestDispatcher::handle_line(const std::string& line)
{
    mcp::Message message;
    try
    {
        message = mcp::parse_message(line);
    }
    catch (const ProtocolError& e)
    {
        logger_->warning(component_,
                         std::string("dropping invalid message: ") + e.what() + ": " + clip(line));
        return;
    }

    IncomingVisitor visitor{
        [this](const mcp::Response& r) { resolve(r.id, &r.result, nullptr); },
        [this](const mcp::ErrorResponse& e) { resolve(e.id, nullptr, &e); },
        [this](const mcp::Notification& n) { handle_notification(n); },
        [this](const mcp::ServerRequest& r) { handle_server_request(r); }};
    std::visit(visitor, message);
}

void RequestDispatcher::resolve(const Json& id, const Json* result,
                                const mcp::ErrorResponse* error)
{
    auto numeric = mcp::numeric_id(id);
    if (!numeric)
    {
        if (error)
            logger_->warning(component_, "server reported error without request id: " +
                                             std::to_string(error->code) + " " + error->message);
        else
            logger_->debug(component_, "discarding response with foreign id " + id.dump());
        return;
    }

    std::optional<PendingRequest> req;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(*numeric);
        if (it != pending_.end())
        {
            req.emplace(std::move(it->second));
            pending_.erase(it);
        }
    }

    if (!req)
    {
        // Typically the late answer to a request that already timed out
        logger_->debug(component_,
                       "discarding response for unknown id " + std::to_string(*numeric));
        return;
    }

    if (error)
        req->promise.set_exception(
            std::make_exception_ptr(RemoteError(error->code, error->message, error->data)));
    else
        req->promise.set_value(*result);
}

void RequestDispatcher::handle_server_request(const mcp::ServerRequest& request)
{
    Json reply;
    if (request.method == mcp::method::Ping)
    {
        reply = mcp::make_result_response(request.id, Json::object());
    }
    else
    {
        logger_->debug(component_, "rejecting server request '" + request.method + "'");
        reply = mcp::make_error_response(request.id, mcp::error_code::MethodNotFound,
                                         "Method not found: " + request.method);
    }

    pending_replies_.push_back(reply.dump());
    flush_replies();
}

void RequestDispatcher::flush_replies()
{
    if (pending_replies_.empty())
        return;

    // The reader never waits for the writer mutex: a caller blocked on a full
    // stdin pipe only gets unstuck while the reader keeps draining stdout.
    std::unique_lock<std::mutex> lock(write_mutex_, std::try_to_lock);
    if (!lock.owns_lock())
        return;

    try
    {
        while (!pending_replies_.empty())
        {
            transport_->send_line(pending_replies_.front());
            pending_replies_.pop_front();
        }
    }
    catch (const TransportError& e)
    {
        // The next poll reports the broken stream to every waiter
        pending_replies_.clear();
        logger_->warning(component_, std::string("failed to answer server request: ") + e.what());
    }
}

void RequestDispatcher::handle_notification(const mcp::Notification& notification)
{
    auto kind = mcp::notification_kind(notification.method);
    switch (kind)
    {
    case mcp::NotificationKind::LoggingMessage:
        if (notification.params.is_object())
            logger_->info(component_,
                          "server log: " + notification.params.value("data", Json()).dump());
        break;
    case mcp::NotificationKind::Unknown:
        logger_->debug(component_, "unrecognized notification '" + notification.method + "'");
        break;
    default:
        logger_->debug(component_, std::string("notification ") + mcp::to_string(kind));
        break;
    }

    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = notification_handler_;
    }
    if (!handler)
        return;

    try
    {
        handler(kind, notification);
    }
    catch (const std::exception& e)
    {
        logger_->error(component_, std::string("notification handler threw: ") + e.what());
    }
}

void RequestDispatcher::expire_deadlines()
{
    auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<int64_t, PendingRequest>> expired;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        for (auto it = pending_.begin(); it != pending_.end();)
        {
            if (it->second.deadline <= now)
            {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (auto& [id, req] : expired)
    {
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(req.deadline -
                                                                            req.created);
        logger_->warning(component_, describe_request(req.method, id, server_name_) +
                                         " timed out");
        req.promise.set_exception(std::make_exception_ptr(
            TimeoutError(describe_request(req.method, id, server_name_) + " timed out after " +
                         std::to_string(waited.count()) + "ms")));
    }
}

// =============================================================================
// Teardown
// =============================================================================

void RequestDispatcher::fail_all(std::exception_ptr error)
{
    std::map<int64_t, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!terminal_error_)
            terminal_error_ = error;
        failed.swap(pending_);
    }
    for (auto& [id, req] : failed)
        req.promise.set_exception(error);
}

void RequestDispatcher::cancel_all(const std::string& reason)
{
    std::map<int64_t, PendingRequest> cancelled;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!terminal_error_)
            terminal_error_ = std::make_exception_ptr(CancelledError(reason));
        cancelled.swap(pending_);
    }
    for (auto& [id, req] : cancelled)
        req.promise.set_exception(std::make_exception_ptr(
            CancelledError(describe_request(req.method, id, server_name_) + " cancelled: " +
                           reason)));
}

void RequestDispatcher::stop()
{
    stop_requested_.store(true, std::memory_order_release);
    if (reader_thread_ && reader_thread_->joinable())
    {
        if (reader_thread_->get_id() == std::this_thread::get_id())
        {
            reader_detached_->store(true, std::memory_order_release);
            reader_thread_->detach();
        }
        else
            reader_thread_->join();
    }
    running_.store(false, std::memory_order_release);
    fail_all(std::make_exception_ptr(
        CancelledError("Dispatcher for server '" + server_name_ + "' stopped")));
}

size_t RequestDispatcher::pending_count() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

int64_t RequestDispatcher::last_issued_id() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return next_id_ - 1;
}

} // namespace mcpmux::client
