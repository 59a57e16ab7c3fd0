#pragma once

#include <tool_bridge/config/server_spec.hpp>
#include <tool_bridge/core/process.hpp>
#include <tool_bridge/core/result.hpp>
#include <tool_bridge/protocol/i_channel.hpp>

#include <chrono>
#include <memory>

namespace tool_bridge {

// ---------------------------------------------------------------------------
// IServerProcess — the process side of a launched tool server.
// ---------------------------------------------------------------------------
class IServerProcess {
public:
    virtual ~IServerProcess() = default;

    /// Stop the server and reap it. Idempotent.
    virtual Result<void, Error> Terminate(std::chrono::milliseconds grace) = 0;
};

struct LaunchedServer {
    std::unique_ptr<IServerProcess> process;
    std::shared_ptr<IChannel> channel;
};

// ---------------------------------------------------------------------------
// ILauncher — spawns a tool server and opens a channel to it.
//
// On failure nothing is left running: whatever was acquired before the
// failing step has been released.
// ---------------------------------------------------------------------------
class ILauncher {
public:
    virtual ~ILauncher() = default;

    virtual Result<LaunchedServer, Error> Launch(const ServerSpec& spec) = 0;
};

// IServerProcess over a ChildProcess.
class ChildServerProcess : public IServerProcess {
public:
    explicit ChildServerProcess(std::unique_ptr<ChildProcess> child);

    Result<void, Error> Terminate(std::chrono::milliseconds grace) override;

    [[nodiscard]] pid_t Pid() const noexcept { return child_->Pid(); }

private:
    std::unique_ptr<ChildProcess> child_;
};

// ---------------------------------------------------------------------------
// StdioLauncher — fork/exec the server with pipes on stdin/stdout and bind a
// StdioChannel to them.
// ---------------------------------------------------------------------------
class StdioLauncher : public ILauncher {
public:
    Result<LaunchedServer, Error> Launch(const ServerSpec& spec) override;
};

} // namespace tool_bridge
