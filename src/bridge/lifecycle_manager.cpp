#include <tool_bridge/bridge/lifecycle_manager.hpp>

#include <tool_bridge/core/log.hpp>

#include <algorithm>
#include <system_error>
#include <thread>

namespace tool_bridge {

LifecycleManager::LifecycleManager(ILauncher& launcher, LifecycleOptions options)
    : launcher_(launcher), options_(std::move(options)) {}

LifecycleManager::~LifecycleManager() {
    DisconnectAll();
}

// ---------------------------------------------------------------------------
// ConnectAll
// ---------------------------------------------------------------------------
std::vector<std::shared_ptr<RemoteTool>> LifecycleManager::ConnectAll(
    const std::vector<ServerSpec>& specs) {
    std::vector<const ServerSpec*> enabled;
    for (const auto& spec : specs) {
        if (!spec.enabled) {
            LogInfo("lifecycle", "Skipping disabled server: " + spec.name);
            continue;
        }
        enabled.push_back(&spec);
    }

    std::vector<std::shared_ptr<RemoteTool>> all_tools;

    if (!options_.parallel || enabled.size() < 2) {
        for (const auto* spec : enabled) {
            auto tools = ConnectOne(*spec);
            all_tools.insert(all_tools.end(), tools.begin(), tools.end());
        }
        return all_tools;
    }

    std::mutex results_mutex;
    std::vector<std::thread> workers;
    workers.reserve(enabled.size());
    for (const auto* spec : enabled) {
        auto connect = [this, spec, &results_mutex, &all_tools] {
            auto tools = ConnectOne(*spec);
            std::lock_guard<std::mutex> lock(results_mutex);
            all_tools.insert(all_tools.end(), tools.begin(), tools.end());
        };
        try {
            workers.emplace_back(connect);
        } catch (const std::system_error& e) {
            LogWarn("lifecycle", "Cannot start connect thread for '" + spec->name +
                                     "', connecting inline: " + e.what());
            connect();
        }
    }
    for (auto& worker : workers) {
        worker.join();
    }
    return all_tools;
}

std::vector<std::shared_ptr<RemoteTool>> LifecycleManager::ConnectOne(
    const ServerSpec& spec) {
    auto connection = std::make_shared<Connection>(spec, launcher_, options_.connection);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            LogDebug("lifecycle", "Not connecting '" + spec.name + "': shutting down");
            return {};
        }
        pending_.push_back(connection);
    }

    bool connected = false;
    try {
        connected = connection->Connect();
    } catch (const std::exception& e) {
        LogError("lifecycle", "Unexpected error connecting to '" + spec.name +
                                  "': " + e.what());
    }

    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(std::remove(pending_.begin(), pending_.end(), connection),
                       pending_.end());
        if (connected && !shutting_down_) {
            connections_.push_back(connection);
            registered = true;
        }
    }

    if (!registered) {
        if (connected) {
            LogDebug("lifecycle", "Connected to '" + spec.name +
                                      "' after shutdown began, closing it");
        }
        connection->Disconnect();
        return {};
    }
    return connection->Tools();
}

// ---------------------------------------------------------------------------
// DisconnectAll
// ---------------------------------------------------------------------------
void LifecycleManager::DisconnectAll() {
    std::vector<std::shared_ptr<Connection>> live;
    std::vector<std::shared_ptr<Connection>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        live.swap(connections_);
        pending = pending_;
    }

    // Interrupts handshakes running on other threads; ConnectOne() finishes
    // the cleanup of those connections.
    for (const auto& connection : pending) {
        connection->Disconnect();
    }

    for (const auto& connection : live) {
        try {
            connection->Disconnect();
        } catch (const std::exception& e) {
            LogWarn("lifecycle", "Error disconnecting '" + connection->Name() +
                                     "': " + e.what());
        }
    }

    if (!live.empty()) {
        LogDebug("lifecycle", "Disconnected " + std::to_string(live.size()) +
                                  " MCP server(s)");
    }
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
std::vector<std::shared_ptr<RemoteTool>> LifecycleManager::Tools() const {
    std::vector<std::shared_ptr<RemoteTool>> tools;
    for (const auto& connection : Connections()) {
        auto connection_tools = connection->Tools();
        tools.insert(tools.end(), connection_tools.begin(), connection_tools.end());
    }
    return tools;
}

std::vector<std::shared_ptr<Connection>> LifecycleManager::Connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_;
}

size_t LifecycleManager::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

bool LifecycleManager::ShuttingDown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutting_down_;
}

} // namespace tool_bridge
