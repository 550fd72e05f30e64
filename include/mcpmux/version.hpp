#pragma once

#include <array>
#include <string>

namespace mcpmux
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

constexpr const char* JSONRPC_VERSION = "2.0";

/// Protocol revision sent in initialize
constexpr const char* LATEST_PROTOCOL_VERSION = "2025-06-18";

/// Revisions this client accepts back from a server, newest first
constexpr std::array<const char*, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18", "2025-03-26", "2024-11-05"};

inline bool is_supported_protocol_version(const std::string& version)
{
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS)
        if (version == v)
            return true;
    return false;
}

inline std::string version_string()
{
    return std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace mcpmux
