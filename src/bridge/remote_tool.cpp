#include <tool_bridge/bridge/remote_tool.hpp>

#include <tool_bridge/core/log.hpp>
#include <tool_bridge/protocol/session.hpp>

namespace tool_bridge {

std::string JoinContent(const std::vector<ContentFragment>& content) {
    std::string joined;
    for (size_t i = 0; i < content.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += RenderFragment(content[i]);
    }
    return joined;
}

RemoteTool::RemoteTool(ToolDescriptor descriptor,
                       std::string server,
                       std::weak_ptr<IChannel> channel,
                       std::optional<std::chrono::milliseconds> invoke_timeout)
    : descriptor_(std::move(descriptor)),
      server_(std::move(server)),
      channel_(std::move(channel)),
      invoke_timeout_(invoke_timeout) {}

InvocationResult RemoteTool::Invoke(const nlohmann::json& arguments) {
    auto channel = channel_.lock();
    if (!channel) {
        return InvocationResult::Failure(
            std::string(kExecutionFailedPrefix) + "connection to '" + server_ +
            "' is closed");
    }

    try {
        auto result = CallTool(*channel, server_, descriptor_.name, arguments,
                               invoke_timeout_);
        if (result.IsErr()) {
            LogDebug("bridge", "[" + server_ + "] " + descriptor_.name + ": " +
                                   result.Error().ToString());
            return InvocationResult::Failure(
                std::string(kExecutionFailedPrefix) + result.Error().message);
        }

        const auto& call = result.Value();
        auto content = JoinContent(call.content);
        if (call.is_error) {
            return InvocationResult::Failure(kToolReturnedError, std::move(content));
        }
        return InvocationResult::Success(std::move(content));
    } catch (const std::exception& e) {
        // nlohmann::json may throw on arguments it cannot serialize.
        return InvocationResult::Failure(std::string(kExecutionFailedPrefix) + e.what());
    }
}

} // namespace tool_bridge
