#pragma once
/// @file config.hpp
/// @brief Server descriptors from JSON / JSONC configuration files
///
/// Accepted shapes:
/// @code
/// { "mcpServers": { "time": { "command": ["python", "time.py"], "env": {"TZ": "UTC"} } } }
/// { "time": { "command": "python", "args": ["time.py"], "timeout": 60 } }
/// @endcode
/// `//` and `/* */` comments are allowed. `timeout` is in seconds.

#include "mcpmux/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mcpmux::config
{

/// Parse one server entry
/// @throws ConfigError naming the server and the offending field
ServerDescriptor parse_server_descriptor(const std::string& name, const Json& entry);

/// Parse a whole configuration document; entries with "disabled": true are skipped
std::vector<ServerDescriptor> parse_server_descriptors(const Json& root);

/// Parse configuration text (JSON or JSONC)
std::vector<ServerDescriptor> parse_server_descriptors(const std::string& text);

/// Read and parse a configuration file
/// @throws ConfigError if the file cannot be read or is invalid
std::vector<ServerDescriptor> load_server_descriptors(const std::filesystem::path& path);

} // namespace mcpmux::config
