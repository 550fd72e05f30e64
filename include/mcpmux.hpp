#pragma once

/// @file mcpmux.hpp
/// @brief Main header for mcpmux - includes the commonly used components
///
/// Usage:
/// @code
/// #include <mcpmux.hpp>
///
/// int main() {
///     mcpmux::client::McpManager manager(mcpmux::Settings::from_env());
///     manager.add_servers(mcpmux::config::load_server_descriptors("servers.json"));
///     auto result = manager.call_tool("time_now", {{"tz", "UTC"}});
/// }
/// @endcode

// Core types, settings and exceptions
#include "mcpmux/types.hpp"
#include "mcpmux/exceptions.hpp"
#include "mcpmux/settings.hpp"
#include "mcpmux/version.hpp"
#include "mcpmux/config.hpp"

// Protocol
#include "mcpmux/mcp/jsonrpc.hpp"

// Client
#include "mcpmux/client/types.hpp"
#include "mcpmux/client/transport.hpp"
#include "mcpmux/client/stdio_transport.hpp"
#include "mcpmux/client/dispatcher.hpp"
#include "mcpmux/client/session.hpp"
#include "mcpmux/client/catalog.hpp"
#include "mcpmux/client/manager.hpp"

// Utilities
#include "mcpmux/util/json.hpp"
#include "mcpmux/util/log.hpp"
