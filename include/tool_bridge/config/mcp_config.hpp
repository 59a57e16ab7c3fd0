#pragma once

#include <tool_bridge/config/server_spec.hpp>
#include <tool_bridge/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace tool_bridge {

// ---------------------------------------------------------------------------
// McpConfig — the parsed "mcpServers" document.
//
// Servers keep their declaration order. An entry with a wrongly typed field
// is left out of `servers` and reported in `entry_errors`; it does not fail
// the whole document.
// ---------------------------------------------------------------------------
struct McpConfig {
    std::vector<ServerEntry> servers;
    std::vector<Error> entry_errors;
};

/// Parse the JSON text of an MCP configuration. Fails only when the text is
/// not JSON or its top level is not an object.
Result<McpConfig, Error> ParseMcpConfig(std::string_view text);

/// Read and parse an MCP configuration file.
Result<McpConfig, Error> LoadMcpConfig(const std::string& path);

[[nodiscard]] bool McpConfigExists(const std::string& path);

} // namespace tool_bridge
