#pragma once

#include <tool_bridge/bridge/lifecycle_manager.hpp>
#include <tool_bridge/bridge/remote_tool.hpp>
#include <tool_bridge/config/mcp_config.hpp>
#include <tool_bridge/config/server_spec.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tool_bridge {

/// Resolve the entries of a parsed MCP configuration into launch specs.
/// Disabled entries are logged and left out; entries that fail to resolve
/// (no command) are logged and left out.
std::vector<ServerSpec> ResolveServerSpecs(const McpConfig& config,
                                           const EnvLookup& ambient);

// ---------------------------------------------------------------------------
// LoadToolsFromConfig — read the MCP configuration at `path`, connect every
// enabled server through `manager` and return the discovered tools.
//
// Never fails: a missing or unreadable file, an empty server list and
// servers that fail to start all yield fewer (possibly zero) tools plus a
// diagnostic in the log.
// ---------------------------------------------------------------------------
std::vector<std::shared_ptr<RemoteTool>> LoadToolsFromConfig(
    const std::string& path,
    LifecycleManager& manager,
    const EnvLookup& ambient);

} // namespace tool_bridge
