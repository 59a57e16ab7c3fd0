#pragma once

#include <tool_bridge/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tool_bridge {

// ---------------------------------------------------------------------------
// IChannel — request/response channel to one tool server.
//
// The bridge's protocol operations (Initialize, ListTools, CallTool) depend
// on this interface rather than on pipes, so connections can be tested with
// MockChannel.
//
// Request() returns the "result" member of the matching response. A JSON-RPC
// error response comes back as ErrorCategory::Protocol, a closed channel as
// ChannelClosed, an expired timeout as Timeout.
//
// Close() may be called from any thread, also while a Request() is blocked;
// that request then fails with ChannelClosed. Close() is idempotent.
// ---------------------------------------------------------------------------
class IChannel {
public:
    virtual ~IChannel() = default;

    IChannel(const IChannel&) = delete;
    IChannel& operator=(const IChannel&) = delete;
    IChannel(IChannel&&) = delete;
    IChannel& operator=(IChannel&&) = delete;

    /// Send a request and wait for its response. No timeout when `timeout`
    /// is nullopt.
    [[nodiscard]] virtual Result<nlohmann::json, Error> Request(
        const std::string& method,
        const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> timeout) = 0;

    [[nodiscard]] virtual Result<void, Error> Notify(
        const std::string& method,
        const nlohmann::json& params) = 0;

    virtual Result<void, Error> Close() = 0;

    [[nodiscard]] virtual bool IsOpen() const = 0;

protected:
    IChannel() = default;
};

} // namespace tool_bridge
