#pragma once

#include <tool_bridge/bridge/launcher.hpp>
#include <tool_bridge/bridge/remote_tool.hpp>
#include <tool_bridge/config/server_spec.hpp>
#include <tool_bridge/protocol/types.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tool_bridge {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Ready,
    Failed,
    Closed,
};

[[nodiscard]] const char* StateName(ConnectionState state) noexcept;

struct ConnectionOptions {
    ClientInfo client;
    std::optional<std::chrono::milliseconds> handshake_timeout =
        std::chrono::milliseconds(30000);
    std::optional<std::chrono::milliseconds> invoke_timeout;
    std::chrono::milliseconds shutdown_grace{2000};
};

// ---------------------------------------------------------------------------
// Connection — one tool server: its process, its channel and the tools it
// advertised.
//
//   Disconnected -> Connecting -> Ready
//                            \-> Failed
//   Ready | Failed -> Closed   (Disconnect)
//
// Disconnect() may run on any thread, also while Connect() is still
// handshaking elsewhere; the handshake then fails and Connect() returns
// false with the connection left Closed.
// ---------------------------------------------------------------------------
class Connection {
public:
    Connection(ServerSpec spec, ILauncher& launcher, ConnectionOptions options);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Launch, initialize, list tools. Returns false on any failure, with
    /// every partially acquired resource released.
    bool Connect();

    /// Release the channel, then the process. Idempotent; never throws.
    void Disconnect();

    [[nodiscard]] const std::string& Name() const noexcept { return spec_.name; }
    [[nodiscard]] ConnectionState State() const;
    [[nodiscard]] std::vector<std::shared_ptr<RemoteTool>> Tools() const;
    [[nodiscard]] std::optional<ServerInfo> Info() const;
    [[nodiscard]] std::optional<Error> LastError() const;

private:
    // Runs when a connect step fails: records the error and releases what
    // was acquired so far, unless Disconnect() already took over.
    void Fail(Error error);

    void Release(std::shared_ptr<IChannel> channel,
                 std::unique_ptr<IServerProcess> process);
    void ReportTeardown(const Error& error);

    const ServerSpec spec_;
    ILauncher& launcher_;
    const ConnectionOptions options_;
    const std::thread::id creator_thread_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::unique_ptr<IServerProcess> process_;
    std::shared_ptr<IChannel> channel_;
    std::vector<std::shared_ptr<RemoteTool>> tools_;
    std::optional<ServerInfo> info_;
    std::optional<Error> last_error_;
};

} // namespace tool_bridge
