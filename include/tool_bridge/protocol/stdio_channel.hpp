#pragma once

#include <tool_bridge/protocol/i_channel.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tool_bridge {

// ---------------------------------------------------------------------------
// StdioChannel — newline-delimited JSON-RPC over a pair of pipe ends.
//
// Requests are serialized; each waits for the response carrying its id.
// Notifications from the server are logged and skipped, server-to-client
// "ping" requests are answered, other server requests get "method not
// found". Non-JSON lines on the server's stdout are skipped.
//
// A self-pipe wakes a blocked request when Close() runs on another thread.
// ---------------------------------------------------------------------------
class StdioChannel : public IChannel {
public:
    /// Take ownership of `write_fd` (server stdin) and `read_fd` (server
    /// stdout). Both are switched to non-blocking mode.
    static Result<std::shared_ptr<StdioChannel>, Error> Open(int write_fd,
                                                             int read_fd,
                                                             std::string label);

    ~StdioChannel() override;

    [[nodiscard]] Result<nlohmann::json, Error> Request(
        const std::string& method,
        const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> timeout) override;

    [[nodiscard]] Result<void, Error> Notify(
        const std::string& method,
        const nlohmann::json& params) override;

    Result<void, Error> Close() override;

    [[nodiscard]] bool IsOpen() const override;

private:
    using Clock = std::chrono::steady_clock;

    StdioChannel(int write_fd, int read_fd, int wake_read, int wake_write,
                 std::string label);

    Result<void, Error> WriteLine(const std::string& method, const std::string& line);
    Result<nlohmann::json, Error> ReadResponse(const std::string& method,
                                               int64_t id,
                                               std::optional<Clock::time_point> deadline);
    void HandleUnsolicited(const nlohmann::json& message);
    Error ClosedError(const std::string& method) const;

    int write_fd_;
    int read_fd_;
    int wake_read_;
    int wake_write_;
    std::string label_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> eof_{false};
    std::mutex io_mutex_;
    std::string read_buffer_;
    int64_t next_id_ = 1;
};

} // namespace tool_bridge
