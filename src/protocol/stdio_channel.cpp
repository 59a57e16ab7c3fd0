#include <tool_bridge/protocol/stdio_channel.hpp>

#include <tool_bridge/core/log.hpp>
#include <tool_bridge/protocol/json_rpc.hpp>

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace tool_bridge {

namespace {

constexpr size_t kReadChunk = 4096;

Result<void, Error> SetNonBlocking(int fd, const std::string& label) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return Result<void, Error>::Err(Error::FromErrno(
            "StdioChannel", label, "fcntl(O_NONBLOCK) failed", errno));
    }
    return Result<void, Error>::Ok();
}

// Close a descriptor and classify the outcome for teardown reporting.
std::optional<Error> CloseFd(int& fd, const std::string& label) {
    if (fd == -1) {
        return std::nullopt;
    }
    const int rc = ::close(fd);
    const int err = errno;
    fd = -1;
    if (rc == 0) {
        return std::nullopt;
    }
    // Linux releases the descriptor even when close() reports EINTR.
    const auto category = err == EINTR ? ErrorCategory::Cancelled : ErrorCategory::Teardown;
    return Error::FromErrno("CloseChannel", label, "close failed", err, category);
}

int PollTimeoutMs(std::optional<std::chrono::steady_clock::time_point> deadline) {
    if (!deadline.has_value()) {
        return -1;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<long long>(remaining.count(), 60 * 60 * 1000));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Open / Close
// ---------------------------------------------------------------------------
Result<std::shared_ptr<StdioChannel>, Error> StdioChannel::Open(int write_fd,
                                                                int read_fd,
                                                                std::string label) {
    using R = Result<std::shared_ptr<StdioChannel>, Error>;

    auto fail = [&](Error error) {
        if (write_fd != -1) ::close(write_fd);
        if (read_fd != -1) ::close(read_fd);
        return R::Err(std::move(error));
    };

    if (write_fd < 0 || read_fd < 0) {
        return fail(Error{"StdioChannel", label, "Invalid file descriptor",
                          ErrorCategory::Transport, std::nullopt});
    }
    for (int fd : {write_fd, read_fd}) {
        auto nb = SetNonBlocking(fd, label);
        if (nb.IsErr()) {
            return fail(std::move(nb).Error());
        }
    }

    int wake[2] = {-1, -1};
    if (pipe2(wake, O_CLOEXEC | O_NONBLOCK) != 0) {
        return fail(Error::FromErrno("StdioChannel", label,
                                     "Failed to create wake pipe", errno));
    }

    return R::Ok(std::shared_ptr<StdioChannel>(
        new StdioChannel(write_fd, read_fd, wake[0], wake[1], std::move(label))));
}

StdioChannel::StdioChannel(int write_fd, int read_fd, int wake_read, int wake_write,
                           std::string label)
    : write_fd_(write_fd),
      read_fd_(read_fd),
      wake_read_(wake_read),
      wake_write_(wake_write),
      label_(std::move(label)) {}

StdioChannel::~StdioChannel() {
    auto result = Close();
    if (result.IsErr()) {
        LogDebug("channel", "Close in destructor: " + result.Error().ToString());
    }
}

Result<void, Error> StdioChannel::Close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return Result<void, Error>::Ok();
    }

    // Wake a request blocked in poll(). The byte is never drained, so every
    // later poll() sees the channel as closed too.
    const char byte = 'x';
    ssize_t ignored = ::write(wake_write_, &byte, 1);
    (void)ignored;

    // Wait for the in-flight request (if any) to notice and return.
    std::lock_guard<std::mutex> lock(io_mutex_);

    std::optional<Error> first_error;
    for (int* fd : {&write_fd_, &read_fd_, &wake_read_, &wake_write_}) {
        auto err = CloseFd(*fd, label_);
        if (err.has_value() && !first_error.has_value()) {
            first_error = std::move(err);
        }
    }
    read_buffer_.clear();
    LogDebug("channel", "Channel to '" + label_ + "' closed");

    if (first_error.has_value()) {
        return Result<void, Error>::Err(std::move(*first_error));
    }
    return Result<void, Error>::Ok();
}

bool StdioChannel::IsOpen() const {
    return !closed_.load() && !eof_.load();
}

Error StdioChannel::ClosedError(const std::string& method) const {
    return Error{method, label_, "Channel closed", ErrorCategory::ChannelClosed,
                 std::nullopt};
}

// ---------------------------------------------------------------------------
// Request / Notify
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> StdioChannel::Request(
    const std::string& method,
    const nlohmann::json& params,
    std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (closed_.load()) {
        return Result<nlohmann::json, Error>::Err(ClosedError(method));
    }
    if (eof_.load()) {
        return Result<nlohmann::json, Error>::Err(Error{
            method, label_, "Server closed stdout", ErrorCategory::Transport,
            std::nullopt});
    }

    std::optional<Clock::time_point> deadline;
    if (timeout.has_value()) {
        deadline = Clock::now() + *timeout;
    }

    const int64_t id = next_id_++;
    auto written = WriteLine(method, jsonrpc::MakeRequest(id, method, params).dump());
    if (written.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(written).Error());
    }

    auto response = ReadResponse(method, id, deadline);
    if (response.IsErr()) {
        return response;
    }
    return jsonrpc::ExtractResult(response.Value(), method, label_);
}

Result<void, Error> StdioChannel::Notify(const std::string& method,
                                         const nlohmann::json& params) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (closed_.load()) {
        return Result<void, Error>::Err(ClosedError(method));
    }
    return WriteLine(method, jsonrpc::MakeNotification(method, params).dump());
}

// ---------------------------------------------------------------------------
// Wire I/O (io_mutex_ held)
// ---------------------------------------------------------------------------
Result<void, Error> StdioChannel::WriteLine(const std::string& method,
                                            const std::string& line) {
    std::string data = line;
    data += '\n';
    size_t offset = 0;

    while (offset < data.size()) {
        const ssize_t n = ::write(write_fd_, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            return Result<void, Error>::Err(Error::FromErrno(
                method, label_, "Failed to write to server stdin", errno));
        }

        // Pipe full: wait until the server drains it or we are closed.
        std::array<pollfd, 2> fds{};
        fds[0] = {write_fd_, POLLOUT, 0};
        fds[1] = {wake_read_, POLLIN, 0};
        const int rc = ::poll(fds.data(), fds.size(), -1);
        if (rc < 0 && errno != EINTR) {
            return Result<void, Error>::Err(Error::FromErrno(
                method, label_, "poll failed", errno));
        }
        if (closed_.load() || (fds[1].revents & POLLIN) != 0) {
            return Result<void, Error>::Err(ClosedError(method));
        }
        if ((fds[0].revents & (POLLERR | POLLHUP)) != 0) {
            return Result<void, Error>::Err(Error::FromErrno(
                method, label_, "Failed to write to server stdin", EPIPE));
        }
    }
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> StdioChannel::ReadResponse(
    const std::string& method,
    int64_t id,
    std::optional<Clock::time_point> deadline) {
    using R = Result<nlohmann::json, Error>;

    for (;;) {
        // Drain complete lines already buffered.
        auto newline = read_buffer_.find('\n');
        while (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                nlohmann::json message = nlohmann::json::parse(line, nullptr, false);
                if (message.is_discarded()) {
                    LogDebug("channel", "[" + label_ + "] skipping non-JSON output: " +
                                            line.substr(0, 120));
                } else if (jsonrpc::ResponseId(message) == id) {
                    return R::Ok(std::move(message));
                } else {
                    HandleUnsolicited(message);
                }
            }
            newline = read_buffer_.find('\n');
        }

        if (closed_.load()) {
            return R::Err(ClosedError(method));
        }

        std::array<pollfd, 2> fds{};
        fds[0] = {read_fd_, POLLIN, 0};
        fds[1] = {wake_read_, POLLIN, 0};
        const int rc = ::poll(fds.data(), fds.size(), PollTimeoutMs(deadline));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return R::Err(Error::FromErrno(method, label_, "poll failed", errno));
        }
        if ((fds[1].revents & POLLIN) != 0 || closed_.load()) {
            return R::Err(ClosedError(method));
        }
        if (rc == 0) {
            return R::Err(Error{method, label_, "Timed out waiting for response",
                                ErrorCategory::Timeout, std::nullopt});
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            std::array<char, kReadChunk> buf{};
            const ssize_t n = ::read(read_fd_, buf.data(), buf.size());
            if (n > 0) {
                read_buffer_.append(buf.data(), static_cast<size_t>(n));
            } else if (n == 0) {
                eof_.store(true);
                return R::Err(Error{method, label_, "Server closed stdout",
                                    ErrorCategory::Transport, std::nullopt});
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                return R::Err(Error::FromErrno(method, label_,
                                               "Failed to read server stdout", errno));
            }
        }
    }
}

void StdioChannel::HandleUnsolicited(const nlohmann::json& message) {
    if (jsonrpc::IsServerRequest(message)) {
        const auto server_method = message["method"].is_string()
            ? message["method"].get<std::string>() : std::string();
        const auto reply = server_method == "ping"
            ? jsonrpc::MakeResult(message["id"], nlohmann::json::object())
            : jsonrpc::MakeError(message["id"], jsonrpc::kMethodNotFound,
                                 "Method not supported by client: " + server_method);
        auto written = WriteLine(server_method, reply.dump());
        if (written.IsErr()) {
            LogDebug("channel", written.Error().ToString());
        }
        return;
    }
    if (message.contains("method")) {
        LogDebug("channel", "[" + label_ + "] notification " + message["method"].dump());
        return;
    }
    LogDebug("channel", "[" + label_ + "] ignoring unmatched message " +
                            message.dump().substr(0, 120));
}

} // namespace tool_bridge
