#include <tool_bridge/bridge/launcher.hpp>

#include <tool_bridge/core/log.hpp>
#include <tool_bridge/protocol/stdio_channel.hpp>

namespace tool_bridge {

ChildServerProcess::ChildServerProcess(std::unique_ptr<ChildProcess> child)
    : child_(std::move(child)) {}

Result<void, Error> ChildServerProcess::Terminate(std::chrono::milliseconds grace) {
    return child_->Terminate(grace);
}

Result<LaunchedServer, Error> StdioLauncher::Launch(const ServerSpec& spec) {
    using R = Result<LaunchedServer, Error>;

    SpawnOptions options;
    options.command = spec.command;
    options.args = spec.args;
    options.environment = BuildChildEnvironment(spec.env);
    options.label = spec.name;

    auto spawned = ChildProcess::Spawn(options);
    if (spawned.IsErr()) {
        return R::Err(std::move(spawned).Error());
    }
    auto child = std::move(spawned).Value();
    LogDebug("process", "[" + spec.name + "] started pid " +
                            std::to_string(child->Pid()) + ": " + spec.command);

    const int write_fd = child->TakeStdin();
    const int read_fd = child->TakeStdout();
    auto channel = StdioChannel::Open(write_fd, read_fd, spec.name);
    if (channel.IsErr()) {
        // The child still runs; it is stopped when `child` goes out of scope.
        return R::Err(std::move(channel).Error());
    }

    LaunchedServer launched;
    launched.process = std::make_unique<ChildServerProcess>(std::move(child));
    launched.channel = std::move(channel).Value();
    return R::Ok(std::move(launched));
}

} // namespace tool_bridge
