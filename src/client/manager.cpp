#include "mcpmux/client/manager.hpp"

#include "mcpmux/client/stdio_transport.hpp"
#include "mcpmux/exceptions.hpp"

#include <algorithm>
#include <cstdint>
#include <future>
#include <optional>

namespace mcpmux::client
{

namespace
{

constexpr const char* kComponent = "manager";

TransportFactory make_stdio_factory(std::chrono::milliseconds shutdown_grace)
{
    return [shutdown_grace](const ServerDescriptor& descriptor) -> std::shared_ptr<ITransport>
    {
        auto transport = std::make_shared<StdioTransport>(shutdown_grace);
        transport->open(descriptor);
        return transport;
    };
}

/// Qualify item under server and add it to out. Server names containing the
/// separator can produce the same qualified name twice; the server iterated
/// last (the longer name, which routing also prefers) keeps it.
template <typename Descriptor>
void merge_qualified(std::map<std::string, Descriptor>& out,
                     std::map<std::string, std::string>& owners, const std::string& server,
                     Descriptor item, const char* kind, util::Logger& logger)
{
    item.name = qualify(server, item.name);
    std::string key = item.name;
    auto owner = owners.find(key);
    if (owner != owners.end() && owner->second != server)
        logger.warning(kComponent, std::string(kind) + " '" + key + "' of server '" + server +
                                       "' hides the one of server '" + owner->second + "'");
    owners[key] = server;
    out[key] = std::move(item);
}

const char* kind_name(bool tool, bool resource)
{
    if (tool)
        return "tool";
    return resource ? "resource" : "prompt";
}

} // namespace

McpManager::McpManager(Settings settings, util::LoggerPtr logger, TransportFactory factory)
    : settings_(std::move(settings)),
      logger_(logger ? std::move(logger) : util::make_logger(settings_.log_level)),
      factory_(factory ? std::move(factory) : make_stdio_factory(settings_.shutdown_grace))
{
}

McpManager::~McpManager()
{
    close_all();
}

// =============================================================================
// Registration
// =============================================================================

ServerSummary McpManager::add_server(const ServerDescriptor& descriptor)
{
    const std::string& name = descriptor.name;
    if (name.empty())
        throw ConfigError("server name must not be empty");

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (servers_.count(name) != 0 || reserved_.count(name) != 0)
            throw DuplicateServerError("MCP server '" + name + "' is already registered");
        reserved_.insert(name);
        generation = close_generation_;
    }

    // Releases the name reservation on every exit path
    struct Reservation
    {
        McpManager& owner;
        std::string name;
        ~Reservation()
        {
            std::lock_guard<std::mutex> lock(owner.mutex_);
            owner.reserved_.erase(name);
        }
    } reservation{*this, name};

    logger_->info(kComponent, "starting server '" + name + "' (" + descriptor.command + ")");

    auto entry = std::make_shared<ServerEntry>();
    std::shared_ptr<ITransport> transport = factory_(descriptor);
    entry->session = std::make_unique<ProtocolSession>(descriptor, transport, settings_, logger_);
    entry->catalog = std::make_unique<ToolCatalog>(*entry->session, logger_);

    try
    {
        entry->session->initialize();
        entry->catalog->refresh();
    }
    catch (const Error& e)
    {
        logger_->warning(kComponent, "server '" + name + "' failed to start: " + e.what());
        try
        {
            entry->session->close();
        }
        catch (const Error& close_error)
        {
            logger_->warning(kComponent, "teardown of '" + name + "' failed: " +
                                             close_error.what());
        }
        throw;
    }

    ServerSummary summary = summarize(*entry);
    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_generation_ == generation)
        {
            servers_.emplace(name, entry);
            registered = true;
        }
    }
    if (!registered)
    {
        // close_all() ran while this server was starting
        try
        {
            entry->session->close();
        }
        catch (const Error& e)
        {
            logger_->warning(kComponent, "teardown of '" + name + "' failed: " + e.what());
        }
        throw CancelledError("MCP server '" + name + "' was closed while starting");
    }

    logger_->info(kComponent, "server '" + name + "' ready with " +
                                  std::to_string(summary.tool_count) + " tools");
    return summary;
}

AddServersReport McpManager::add_servers(const std::vector<ServerDescriptor>& descriptors)
{
    AddServersReport report;
    for (const auto& descriptor : descriptors)
    {
        try
        {
            report.added.push_back(add_server(descriptor));
        }
        catch (const Error& e)
        {
            report.failed.emplace_back(descriptor.name, e.what());
        }
    }
    return report;
}

void McpManager::remove_server(const std::string& name)
{
    EntryPtr entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end())
            throw UnknownServerError("Unknown MCP server '" + name + "'");
        entry = std::move(it->second);
        servers_.erase(it);
    }

    try
    {
        entry->session->close();
    }
    catch (const Error& e)
    {
        logger_->warning(kComponent, "closing '" + name + "' failed: " + e.what());
    }
    logger_->info(kComponent, "removed server '" + name + "'");
}

void McpManager::refresh(const std::string& name)
{
    auto entry = find_entry(name);
    if (!entry)
        throw UnknownServerError("Unknown MCP server '" + name + "'");
    entry->catalog->refresh();
}

// =============================================================================
// Aggregated views
// =============================================================================

std::map<std::string, ToolDescriptor> McpManager::list_all_tools() const
{
    std::map<std::string, EntryPtr> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries = servers_;
    }

    std::map<std::string, ToolDescriptor> out;
    std::map<std::string, std::string> owners;
    for (const auto& [server, entry] : entries)
    {
        for (const auto& tool : entry->catalog->snapshot()->tools)
            merge_qualified(out, owners, server, tool, "tool", *logger_);
    }
    return out;
}

std::map<std::string, ResourceDescriptor> McpManager::list_all_resources() const
{
    std::map<std::string, EntryPtr> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries = servers_;
    }

    std::map<std::string, ResourceDescriptor> out;
    std::map<std::string, std::string> owners;
    for (const auto& [server, entry] : entries)
    {
        for (const auto& resource : entry->catalog->snapshot()->resources)
            merge_qualified(out, owners, server, resource, "resource", *logger_);
    }
    return out;
}

std::map<std::string, PromptDescriptor> McpManager::list_all_prompts() const
{
    std::map<std::string, EntryPtr> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries = servers_;
    }

    std::map<std::string, PromptDescriptor> out;
    std::map<std::string, std::string> owners;
    for (const auto& [server, entry] : entries)
    {
        for (const auto& prompt : entry->catalog->snapshot()->prompts)
            merge_qualified(out, owners, server, prompt, "prompt", *logger_);
    }
    return out;
}

// =============================================================================
// Routing
// =============================================================================

McpManager::Route McpManager::route(const std::string& qualified_name, Kind kind) const
{
    // Server names may themselves contain the separator, so every registered
    // prefix is a candidate; longer prefixes are tried first.
    std::vector<std::pair<std::string, EntryPtr>> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : servers_)
        {
            if (qualified_name.size() > name.size() + 1 &&
                qualified_name.compare(0, name.size(), name) == 0 &&
                qualified_name[name.size()] == kQualifiedSeparator)
                candidates.emplace_back(name, entry);
        }
    }

    if (candidates.empty())
        throw UnknownServerError("No MCP server matches '" + qualified_name + "'");

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });

    for (const auto& [name, entry] : candidates)
    {
        std::string local = qualified_name.substr(name.size() + 1);
        auto snapshot = entry->catalog->snapshot();
        bool found = false;
        switch (kind)
        {
        case Kind::Tool:
            found = snapshot->find_tool(local) != nullptr;
            break;
        case Kind::Resource:
            found = snapshot->find_resource(local) != nullptr;
            break;
        case Kind::Prompt:
            found = snapshot->find_prompt(local) != nullptr;
            break;
        }
        if (found)
            return Route{entry, std::move(local)};
    }

    const auto& best = candidates.front().first;
    throw UnknownToolError("MCP server '" + best + "' has no " +
                           kind_name(kind == Kind::Tool, kind == Kind::Resource) + " '" +
                           qualified_name.substr(best.size() + 1) + "'");
}

Json McpManager::call_tool(const std::string& qualified_name, const Json& arguments)
{
    auto target = route(qualified_name, Kind::Tool);
    logger_->debug(kComponent, "routing " + qualified_name + " to server '" +
                                   target.entry->session->name() + "'");
    return target.entry->session->call_tool(target.local_name, arguments);
}

Json McpManager::read_resource(const std::string& qualified_name)
{
    auto target = route(qualified_name, Kind::Resource);
    auto snapshot = target.entry->catalog->snapshot();
    const auto* resource = snapshot->find_resource(target.local_name);
    if (!resource)
        throw UnknownToolError("MCP resource '" + qualified_name + "' disappeared");
    return target.entry->session->read_resource(resource->uri);
}

Json McpManager::get_prompt(const std::string& qualified_name, const Json& arguments)
{
    auto target = route(qualified_name, Kind::Prompt);
    return target.entry->session->get_prompt(target.local_name, arguments);
}

// =============================================================================
// Introspection
// =============================================================================

McpManager::EntryPtr McpManager::find_entry(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    return it == servers_.end() ? nullptr : it->second;
}

std::vector<std::string> McpManager::server_names() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(servers_.size());
    for (const auto& [name, entry] : servers_)
        names.push_back(name);
    return names;
}

bool McpManager::has_server(const std::string& name) const
{
    return find_entry(name) != nullptr;
}

ServerSummary McpManager::summary(const std::string& name) const
{
    auto entry = find_entry(name);
    if (!entry)
        throw UnknownServerError("Unknown MCP server '" + name + "'");
    return summarize(*entry);
}

ServerSummary McpManager::summarize(const ServerEntry& entry) const
{
    const auto& session = *entry.session;
    auto snapshot = entry.catalog->snapshot();

    ServerSummary s;
    s.name = session.name();
    s.protocol_version = session.protocol_version();
    s.server_info = session.server_info();
    s.capabilities = session.capabilities();
    s.instructions = session.instructions();
    s.tool_count = snapshot->tools.size();
    s.resource_count = snapshot->resources.size();
    s.prompt_count = snapshot->prompts.size();
    s.pid = session.pid();
    return s;
}

// =============================================================================
// Shutdown
// =============================================================================

std::vector<std::string> McpManager::close_all()
{
    std::map<std::string, EntryPtr> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++close_generation_;
        entries.swap(servers_);
    }
    if (entries.empty())
        return {};

    std::vector<std::future<std::optional<std::string>>> pending;
    pending.reserve(entries.size());
    for (const auto& [name, entry] : entries)
    {
        pending.push_back(std::async(
            std::launch::async,
            [name = name, entry = entry]() -> std::optional<std::string>
            {
                try
                {
                    entry->session->close();
                    return std::nullopt;
                }
                catch (const std::exception& e)
                {
                    return name + ": " + e.what();
                }
            }));
    }

    std::vector<std::string> errors;
    for (auto& f : pending)
    {
        if (auto message = f.get())
        {
            logger_->warning(kComponent, "close failed for " + *message);
            errors.push_back(std::move(*message));
        }
    }

    logger_->info(kComponent, "closed " + std::to_string(entries.size()) + " server(s)");
    return errors;
}

} // namespace mcpmux::client
