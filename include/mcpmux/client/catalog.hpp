#pragma once
/// @file client/catalog.hpp
/// @brief Cached tools/resources/prompts advertised by one session

#include "mcpmux/client/types.hpp"
#include "mcpmux/util/log.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcpmux::client
{

class ProtocolSession;

/// Immutable result of one complete refresh
struct CatalogSnapshot
{
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;
    std::vector<PromptDescriptor> prompts;
    std::chrono::system_clock::time_point refreshed_at{};
    uint64_t generation{0}; ///< 0 until the first successful refresh

    const ToolDescriptor* find_tool(const std::string& name) const;
    const ResourceDescriptor* find_resource(const std::string& name) const;
    const PromptDescriptor* find_prompt(const std::string& name) const;
};

/// Holds the latest listings for one session. Only refresh() changes it;
/// readers always get a complete snapshot, never a half-updated one.
class ToolCatalog
{
  public:
    explicit ToolCatalog(ProtocolSession& session, util::LoggerPtr logger = nullptr);

    /// Re-list tools, resources and prompts and swap the result in.
    /// On failure the previous snapshot stays in place and the error propagates.
    void refresh();

    std::shared_ptr<const CatalogSnapshot> snapshot() const;

    /// Upper bound on pages followed per listing
    static constexpr int kMaxPages = 1000;

  private:
    ProtocolSession& session_;
    util::LoggerPtr logger_;
    std::mutex refresh_mutex_;
    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const CatalogSnapshot> snapshot_;
};

} // namespace mcpmux::client
