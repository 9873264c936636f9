#pragma once
#include <string_view>

namespace mcpconf {

constexpr std::string_view LIBRARY_VERSION = "0.1.0";

/// Top-level field of the host application's config that holds the servers.
constexpr std::string_view SERVERS_KEY = "mcpServers";

} // namespace mcpconf
