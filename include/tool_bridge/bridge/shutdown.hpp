#pragma once

#include <tool_bridge/core/result.hpp>

#include <atomic>
#include <functional>
#include <thread>

#include <signal.h>

namespace tool_bridge {

/// Errors that are expected while tearing down during shutdown and are only
/// logged at debug level: cancellation, reaping or closing done from another
/// context, and a server that already went away (EPIPE).
[[nodiscard]] bool IsBenignShutdownError(const Error& error);

// ---------------------------------------------------------------------------
// ShutdownWatcher — turns SIGINT/SIGTERM into a callback on a dedicated
// thread.
//
// The constructor blocks both signals in the calling thread, so it must run
// before any other thread is started; threads created afterwards inherit the
// mask and the watcher thread is the only one that receives them. The
// destructor stops the thread and restores the previous mask.
// ---------------------------------------------------------------------------
class ShutdownWatcher {
public:
    using Callback = std::function<void(int signal_number)>;

    explicit ShutdownWatcher(Callback on_signal);
    ~ShutdownWatcher();

    ShutdownWatcher(const ShutdownWatcher&) = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;

    [[nodiscard]] bool Triggered() const noexcept { return signal_ != 0; }
    [[nodiscard]] int Signal() const noexcept { return signal_; }

private:
    void Run();

    Callback on_signal_;
    std::atomic<bool> stop_{false};
    std::atomic<int> signal_{0};
    std::thread thread_;
    sigset_t previous_mask_;
    bool restore_mask_ = false;
};

} // namespace tool_bridge
