#pragma once

#include <tool_bridge/core/result.hpp>
#include <tool_bridge/protocol/i_channel.hpp>
#include <tool_bridge/protocol/types.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tool_bridge {

constexpr const char* kProtocolVersion = "2024-11-05";

// Upper bound on tools/list pages followed for one server.
constexpr int kMaxToolPages = 100;

// ---------------------------------------------------------------------------
// Protocol operations on an open channel. Each one is a single round trip
// (ListTools may take several when the server paginates).
// ---------------------------------------------------------------------------

/// Send "initialize" followed by "notifications/initialized".
/// Failures are reported as ErrorCategory::Handshake unless the channel
/// itself reported a more specific category (Timeout, ChannelClosed, ...).
Result<ServerInfo, Error> Initialize(IChannel& channel,
                                     const ClientInfo& client,
                                     const std::string& server,
                                     std::optional<std::chrono::milliseconds> timeout);

/// Collect every tool the server advertises, following "nextCursor".
Result<std::vector<ToolDescriptor>, Error> ListTools(
    IChannel& channel,
    const std::string& server,
    std::optional<std::chrono::milliseconds> timeout);

Result<CallToolResult, Error> CallTool(IChannel& channel,
                                       const std::string& server,
                                       const std::string& tool_name,
                                       const nlohmann::json& arguments,
                                       std::optional<std::chrono::milliseconds> timeout);

/// Parse one raw "tools/list" entry.
Result<ToolDescriptor, Error> ParseToolDescriptor(const nlohmann::json& raw,
                                                  const std::string& server);

} // namespace tool_bridge
