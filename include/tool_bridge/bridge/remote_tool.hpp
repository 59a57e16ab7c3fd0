#pragma once

#include <tool_bridge/bridge/i_tool.hpp>
#include <tool_bridge/protocol/i_channel.hpp>
#include <tool_bridge/protocol/types.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tool_bridge {

constexpr const char* kToolReturnedError = "Tool returned error";
constexpr const char* kExecutionFailedPrefix = "MCP tool execution failed: ";

/// Join content fragments with newlines; non-text fragments contribute their
/// generic rendering.
std::string JoinContent(const std::vector<ContentFragment>& content);

// ---------------------------------------------------------------------------
// RemoteTool — one tool discovered on a server, callable through the
// server's channel.
//
// The channel is held weakly: a RemoteTool never keeps a connection alive.
// Once the connection is closed every Invoke() fails with ok=false.
// ---------------------------------------------------------------------------
class RemoteTool : public ITool {
public:
    RemoteTool(ToolDescriptor descriptor,
               std::string server,
               std::weak_ptr<IChannel> channel,
               std::optional<std::chrono::milliseconds> invoke_timeout);

    [[nodiscard]] const std::string& Name() const override { return descriptor_.name; }
    [[nodiscard]] const std::string& Description() const override {
        return descriptor_.description;
    }
    [[nodiscard]] const nlohmann::json& ParametersSchema() const override {
        return descriptor_.input_schema;
    }
    [[nodiscard]] const std::string& Server() const noexcept { return server_; }

    InvocationResult Invoke(const nlohmann::json& arguments) override;

private:
    const ToolDescriptor descriptor_;
    const std::string server_;
    const std::weak_ptr<IChannel> channel_;
    const std::optional<std::chrono::milliseconds> invoke_timeout_;
};

} // namespace tool_bridge
