#include "mcpmux/client/catalog.hpp"

#include "mcpmux/client/session.hpp"
#include "mcpmux/exceptions.hpp"
#include "mcpmux/mcp/jsonrpc.hpp"

#include <algorithm>
#include <unordered_map>

namespace mcpmux::client
{

namespace
{

/// Collect every page of one listing. A repeated name replaces the earlier
/// entry in place, so the first position is kept and the last content wins.
template <typename T, typename ListFn>
std::vector<T> collect_all(ListFn list_page, const std::string& what)
{
    std::vector<T> items;
    std::unordered_map<std::string, size_t> index;
    std::optional<std::string> cursor;

    for (int page_no = 0; page_no < ToolCatalog::kMaxPages; ++page_no)
    {
        Page<T> page = list_page(cursor);
        for (auto& item : page.items)
        {
            auto it = index.find(item.name);
            if (it != index.end())
            {
                items[it->second] = std::move(item);
            }
            else
            {
                index.emplace(item.name, items.size());
                items.push_back(std::move(item));
            }
        }
        if (!page.next_cursor || page.next_cursor->empty() || page.next_cursor == cursor)
            return items;
        cursor = page.next_cursor;
    }
    throw ProtocolError(what + " pagination did not terminate");
}

template <typename T, typename ListFn>
std::vector<T> collect_if_supported(bool advertised, ListFn list_page, const std::string& what)
{
    if (!advertised)
        return {};
    try
    {
        return collect_all<T>(list_page, what);
    }
    catch (const RemoteError& e)
    {
        if (e.code() == mcp::error_code::MethodNotFound)
            return {};
        throw;
    }
}

template <typename T>
const T* find_by_name(const std::vector<T>& items, const std::string& name)
{
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const T& item) { return item.name == name; });
    return it == items.end() ? nullptr : &*it;
}

} // namespace

const ToolDescriptor* CatalogSnapshot::find_tool(const std::string& name) const
{
    return find_by_name(tools, name);
}

const ResourceDescriptor* CatalogSnapshot::find_resource(const std::string& name) const
{
    return find_by_name(resources, name);
}

const PromptDescriptor* CatalogSnapshot::find_prompt(const std::string& name) const
{
    return find_by_name(prompts, name);
}

ToolCatalog::ToolCatalog(ProtocolSession& session, util::LoggerPtr logger)
    : session_(session), logger_(logger ? std::move(logger) : std::make_shared<util::Logger>()),
      snapshot_(std::make_shared<const CatalogSnapshot>())
{
}

void ToolCatalog::refresh()
{
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    auto caps = session_.capabilities();
    auto next = std::make_shared<CatalogSnapshot>();

    next->tools = collect_if_supported<ToolDescriptor>(
        caps.tools, [this](const auto& cursor) { return session_.list_tools(cursor); },
        "tools/list");
    next->resources = collect_if_supported<ResourceDescriptor>(
        caps.resources, [this](const auto& cursor) { return session_.list_resources(cursor); },
        "resources/list");
    next->prompts = collect_if_supported<PromptDescriptor>(
        caps.prompts, [this](const auto& cursor) { return session_.list_prompts(cursor); },
        "prompts/list");
    next->refreshed_at = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        next->generation = snapshot_->generation + 1;
        snapshot_ = std::move(next);
    }

    auto current = snapshot();
    logger_->debug("catalog:" + session_.name(),
                   "refreshed: " + std::to_string(current->tools.size()) + " tools, " +
                       std::to_string(current->resources.size()) + " resources, " +
                       std::to_string(current->prompts.size()) + " prompts");
}

std::shared_ptr<const CatalogSnapshot> ToolCatalog::snapshot() const
{
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

} // namespace mcpmux::client
