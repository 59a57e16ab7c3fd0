#include <tool_bridge/bridge/connection.hpp>

#include <tool_bridge/bridge/shutdown.hpp>
#include <tool_bridge/core/log.hpp>
#include <tool_bridge/protocol/session.hpp>

namespace tool_bridge {

const char* StateName(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Ready:        return "ready";
        case ConnectionState::Failed:       return "failed";
        case ConnectionState::Closed:       return "closed";
    }
    return "unknown";
}

Connection::Connection(ServerSpec spec, ILauncher& launcher, ConnectionOptions options)
    : spec_(std::move(spec)),
      launcher_(launcher),
      options_(std::move(options)),
      creator_thread_(std::this_thread::get_id()) {}

Connection::~Connection() {
    Disconnect();
}

// ---------------------------------------------------------------------------
// Connect
// ---------------------------------------------------------------------------
bool Connection::Connect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Disconnected) {
            LogWarn("connection", "[" + spec_.name + "] connect called in state " +
                                      StateName(state_));
            return false;
        }
        state_ = ConnectionState::Connecting;
    }

    auto launched = launcher_.Launch(spec_);
    if (launched.IsErr()) {
        Fail(std::move(launched).Error());
        return false;
    }

    std::shared_ptr<IChannel> channel;
    {
        auto server = std::move(launched).Value();
        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Closed) {
            // Disconnect() ran while the process was being spawned.
            lock.unlock();
            Release(std::move(server.channel), std::move(server.process));
            return false;
        }
        process_ = std::move(server.process);
        channel_ = std::move(server.channel);
        channel = channel_;
    }

    // The protocol exchanges run without the lock held so that Disconnect()
    // can close the channel underneath them.
    auto info = Initialize(*channel, options_.client, spec_.name,
                           options_.handshake_timeout);
    if (info.IsErr()) {
        Fail(std::move(info).Error());
        return false;
    }

    auto descriptors = ListTools(*channel, spec_.name, options_.handshake_timeout);
    if (descriptors.IsErr()) {
        Fail(std::move(descriptors).Error());
        return false;
    }

    std::vector<std::shared_ptr<RemoteTool>> tools;
    for (auto& descriptor : std::move(descriptors).Value()) {
        tools.push_back(std::make_shared<RemoteTool>(
            std::move(descriptor), spec_.name, channel, options_.invoke_timeout));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConnectionState::Closed) {
        return false;
    }
    info_ = std::move(info).Value();
    tools_ = std::move(tools);
    state_ = ConnectionState::Ready;
    return true;
}

void Connection::Fail(Error error) {
    std::shared_ptr<IChannel> channel;
    std::unique_ptr<IServerProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = error;
        if (state_ == ConnectionState::Closed) {
            LogDebug("connection", "[" + spec_.name + "] connect aborted by disconnect: " +
                                       error.ToString());
            return;
        }
        state_ = ConnectionState::Failed;
        channel = std::move(channel_);
        process = std::move(process_);
    }
    LogWarn("connection", "Failed to connect to MCP server '" + spec_.name +
                              "': " + error.ToString());
    Release(std::move(channel), std::move(process));
}

// ---------------------------------------------------------------------------
// Disconnect
// ---------------------------------------------------------------------------
void Connection::Disconnect() {
    std::shared_ptr<IChannel> channel;
    std::unique_ptr<IServerProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Closed) {
            return;
        }
        state_ = ConnectionState::Closed;
        channel = std::move(channel_);
        process = std::move(process_);
        tools_.clear();
    }

    if (std::this_thread::get_id() != creator_thread_) {
        LogDebug("connection", "[" + spec_.name + "] disconnecting from another thread");
    }
    Release(std::move(channel), std::move(process));
    LogDebug("connection", "[" + spec_.name + "] closed");
}

void Connection::Release(std::shared_ptr<IChannel> channel,
                         std::unique_ptr<IServerProcess> process) {
    // Channel first: the server sees EOF on stdin and can exit on its own
    // before the process is signalled.
    if (channel) {
        try {
            auto closed = channel->Close();
            if (closed.IsErr()) {
                ReportTeardown(closed.Error());
            }
        } catch (const std::exception& e) {
            ReportTeardown(Error{"CloseChannel", spec_.name, e.what(),
                                 ErrorCategory::Teardown, std::nullopt});
        }
        channel.reset();
    }

    if (process) {
        try {
            auto terminated = process->Terminate(options_.shutdown_grace);
            if (terminated.IsErr()) {
                ReportTeardown(terminated.Error());
            }
        } catch (const std::exception& e) {
            ReportTeardown(Error{"Terminate", spec_.name, e.what(),
                                 ErrorCategory::Teardown, std::nullopt});
        }
        process.reset();
    }
}

void Connection::ReportTeardown(const Error& error) {
    if (IsBenignShutdownError(error)) {
        LogDebug("connection", "Ignoring teardown error: " + error.ToString());
    } else {
        LogWarn("connection", "Teardown error: " + error.ToString());
    }
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
ConnectionState Connection::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<std::shared_ptr<RemoteTool>> Connection::Tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_;
}

std::optional<ServerInfo> Connection::Info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_;
}

std::optional<Error> Connection::LastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

} // namespace tool_bridge
