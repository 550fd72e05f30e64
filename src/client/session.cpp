#include "mcpmux/client/session.hpp"

#include "mcpmux/exceptions.hpp"
#include "mcpmux/mcp/jsonrpc.hpp"
#include "mcpmux/version.hpp"

namespace mcpmux::client
{

namespace
{

Json cursor_params(const std::optional<std::string>& cursor)
{
    Json params = Json::object();
    if (cursor)
        params["cursor"] = *cursor;
    return params;
}

template <typename T>
Page<T> parse_page(const Json& result, const char* key, util::Logger& logger,
                   const std::string& component)
{
    if (!result.is_object())
        throw ProtocolError(std::string("listing result for '") + key + "' is not an object");

    Page<T> page;
    if (result.contains(key) && result[key].is_array())
    {
        for (const auto& item : result[key])
        {
            try
            {
                page.items.push_back(item.get<T>());
            }
            catch (const Json::exception& e)
            {
                logger.warning(component, std::string("skipping malformed ") + key +
                                              " entry: " + e.what());
            }
        }
    }
    if (result.contains("nextCursor") && result["nextCursor"].is_string())
        page.next_cursor = result["nextCursor"].get<std::string>();
    return page;
}

std::string supported_versions_list()
{
    std::string out;
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS)
    {
        if (!out.empty())
            out += ", ";
        out += v;
    }
    return out;
}

} // namespace

const char* to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Unconnected:
        return "Unconnected";
    case SessionState::Initializing:
        return "Initializing";
    case SessionState::Ready:
        return "Ready";
    case SessionState::Closed:
        return "Closed";
    }
    return "Closed";
}

ProtocolSession::ProtocolSession(ServerDescriptor descriptor,
                                 std::shared_ptr<ITransport> transport,
                                 const Settings& settings, util::LoggerPtr logger)
    : descriptor_(std::move(descriptor)), transport_(std::move(transport)),
      client_info_{settings.client_name, settings.client_version},
      request_timeout_(descriptor_.timeout.value_or(settings.request_timeout)),
      logger_(logger ? std::move(logger) : std::make_shared<util::Logger>()),
      component_("session:" + descriptor_.name),
      dispatcher_(std::make_unique<RequestDispatcher>(transport_, descriptor_.name, logger_))
{
}

ProtocolSession::~ProtocolSession()
{
    try
    {
        close();
    }
    catch (const Error& e)
    {
        logger_->warning(component_, std::string("close during destruction failed: ") + e.what());
    }
}

// =============================================================================
// Handshake
// =============================================================================

void ProtocolSession::abort_handshake(std::exception_ptr error)
{
    try
    {
        close();
    }
    catch (const Error& e)
    {
        logger_->warning(component_, std::string("teardown after failed handshake: ") + e.what());
    }
    std::rethrow_exception(error);
}

void ProtocolSession::initialize()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Unconnected)
            throw ProtocolError("initialize() on server '" + descriptor_.name + "' in state " +
                                to_string(state_));
        state_ = SessionState::Initializing;
    }

    dispatcher_->start();

    Json params = {{"protocolVersion", LATEST_PROTOCOL_VERSION},
                   {"capabilities", Json::object()},
                   {"clientInfo", client_info_}};

    Json result;
    try
    {
        result = dispatcher_->call(mcp::method::Initialize, params, request_timeout_);
    }
    catch (const RemoteError& e)
    {
        abort_handshake(std::make_exception_ptr(
            HandshakeError(HandshakeError::Reason::Rejected,
                           "Server '" + descriptor_.name + "' rejected initialize: " + e.what())));
    }
    catch (const Error&)
    {
        abort_handshake(std::current_exception());
    }

    if (!result.is_object() || !result.contains("protocolVersion") ||
        !result["protocolVersion"].is_string())
    {
        abort_handshake(std::make_exception_ptr(
            HandshakeError(HandshakeError::Reason::MalformedResponse,
                           "Server '" + descriptor_.name +
                               "' sent an initialize result without protocolVersion")));
    }

    std::string version = result["protocolVersion"].get<std::string>();
    if (!is_supported_protocol_version(version))
    {
        abort_handshake(std::make_exception_ptr(HandshakeError(
            HandshakeError::Reason::VersionMismatch,
            "Server '" + descriptor_.name + "' speaks protocol " + version +
                "; supported: " + supported_versions_list())));
    }

    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
    try
    {
        capabilities = result.value("capabilities", Json::object()).get<ServerCapabilities>();
        if (result.contains("serverInfo") && result["serverInfo"].is_object())
            server_info = result["serverInfo"].get<Implementation>();
        if (result.contains("instructions") && result["instructions"].is_string())
            instructions = result["instructions"].get<std::string>();
    }
    catch (const Json::exception& e)
    {
        abort_handshake(std::make_exception_ptr(
            HandshakeError(HandshakeError::Reason::MalformedResponse,
                           "Server '" + descriptor_.name +
                               "' sent a malformed initialize result: " + e.what())));
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Initializing)
            throw CancelledError("Session '" + descriptor_.name + "' closed during handshake");
        protocol_version_ = version;
        capabilities_ = std::move(capabilities);
        server_info_ = std::move(server_info);
        instructions_ = std::move(instructions);
        state_ = SessionState::Ready;
    }

    try
    {
        dispatcher_->notify(mcp::method::Initialized);
    }
    catch (const Error&)
    {
        abort_handshake(std::current_exception());
    }

    logger_->info(component_, "initialized (protocol " + version + ", server " +
                                  server_info_.name + " " + server_info_.version + ")");
}

// =============================================================================
// Requests
// =============================================================================

Json ProtocolSession::request(const std::string& method, const Json& params,
                              std::optional<std::chrono::milliseconds> timeout)
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Ready)
            throw NotInitializedError("Server '" + descriptor_.name + "' is not ready (state " +
                                      to_string(state_) + ")");
    }
    return dispatcher_->call(method, params, timeout.value_or(request_timeout_));
}

ToolPage ProtocolSession::list_tools(const std::optional<std::string>& cursor)
{
    auto result = request(mcp::method::ToolsList, cursor_params(cursor));
    return parse_page<ToolDescriptor>(result, "tools", *logger_, component_);
}

Json ProtocolSession::call_tool(const std::string& name, const Json& arguments,
                                std::optional<std::chrono::milliseconds> timeout)
{
    Json params = {{"name", name},
                   {"arguments", arguments.is_null() ? Json::object() : arguments}};
    return request(mcp::method::ToolsCall, params, timeout);
}

ResourcePage ProtocolSession::list_resources(const std::optional<std::string>& cursor)
{
    auto result = request(mcp::method::ResourcesList, cursor_params(cursor));
    return parse_page<ResourceDescriptor>(result, "resources", *logger_, component_);
}

Json ProtocolSession::read_resource(const std::string& uri)
{
    return request(mcp::method::ResourcesRead, Json{{"uri", uri}});
}

PromptPage ProtocolSession::list_prompts(const std::optional<std::string>& cursor)
{
    auto result = request(mcp::method::PromptsList, cursor_params(cursor));
    return parse_page<PromptDescriptor>(result, "prompts", *logger_, component_);
}

Json ProtocolSession::get_prompt(const std::string& name, const Json& arguments)
{
    Json params = {{"name", name}};
    if (!arguments.is_null() && !arguments.empty())
        params["arguments"] = arguments;
    return request(mcp::method::PromptsGet, params);
}

void ProtocolSession::ping()
{
    (void)request(mcp::method::Ping, Json::object());
}

// =============================================================================
// Teardown
// =============================================================================

void ProtocolSession::close()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = SessionState::Closed;
        if (closed_)
            return;
        closed_ = true;
    }

    // Waiters are released before the server is terminated
    dispatcher_->cancel_all("session '" + descriptor_.name + "' closed");
    dispatcher_->stop();
    transport_->close();
    logger_->debug(component_, "closed");
}

// =============================================================================
// Accessors
// =============================================================================

SessionState ProtocolSession::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string ProtocolSession::protocol_version() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return protocol_version_;
}

ServerCapabilities ProtocolSession::capabilities() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return capabilities_;
}

Implementation ProtocolSession::server_info() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

std::optional<std::string> ProtocolSession::instructions() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return instructions_;
}

int ProtocolSession::pid() const
{
    return transport_->pid();
}

} // namespace mcpmux::client
