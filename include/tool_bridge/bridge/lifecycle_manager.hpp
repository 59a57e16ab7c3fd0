#pragma once

#include <tool_bridge/bridge/connection.hpp>
#include <tool_bridge/bridge/launcher.hpp>
#include <tool_bridge/bridge/remote_tool.hpp>
#include <tool_bridge/config/server_spec.hpp>

#include <memory>
#include <mutex>
#include <vector>

namespace tool_bridge {

struct LifecycleOptions {
    ConnectionOptions connection;
    bool parallel = false;
};

// ---------------------------------------------------------------------------
// LifecycleManager — owns every live Connection of one program run.
//
// ConnectAll() isolates failures: a server that cannot be started or
// initialized is logged and skipped. DisconnectAll() tears every connection
// down, suppressing teardown errors, and may be called repeatedly and from
// any thread (typically a signal watcher). Connects still in flight when it
// runs are torn down as well, and are never registered afterwards.
// ---------------------------------------------------------------------------
class LifecycleManager {
public:
    LifecycleManager(ILauncher& launcher, LifecycleOptions options);
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    /// Attempt every enabled spec. Returns the tools of the servers that
    /// connected, in input order when sequential and in completion order
    /// when parallel.
    std::vector<std::shared_ptr<RemoteTool>> ConnectAll(
        const std::vector<ServerSpec>& specs);

    void DisconnectAll();

    [[nodiscard]] std::vector<std::shared_ptr<RemoteTool>> Tools() const;
    [[nodiscard]] std::vector<std::shared_ptr<Connection>> Connections() const;
    [[nodiscard]] size_t ConnectionCount() const;
    [[nodiscard]] bool ShuttingDown() const;

private:
    std::vector<std::shared_ptr<RemoteTool>> ConnectOne(const ServerSpec& spec);

    ILauncher& launcher_;
    const LifecycleOptions options_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Connection>> connections_;
    std::vector<std::shared_ptr<Connection>> pending_;
    bool shutting_down_ = false;
};

} // namespace tool_bridge
