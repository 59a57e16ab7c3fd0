#include <tool_bridge/bridge/shutdown.hpp>

#include <tool_bridge/core/log.hpp>

#include <cerrno>
#include <cstring>
#include <ctime>

#include <pthread.h>

namespace tool_bridge {

bool IsBenignShutdownError(const Error& error) {
    switch (error.category) {
        case ErrorCategory::Cancelled:
        case ErrorCategory::ForeignContext:
        case ErrorCategory::ChannelClosed:
            return true;
        default:
            break;
    }
    if (error.sys_errno.has_value()) {
        const int err = *error.sys_errno;
        return err == EINTR || err == ECHILD || err == EPIPE;
    }
    return false;
}

namespace {

sigset_t ShutdownSignals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // anonymous namespace

ShutdownWatcher::ShutdownWatcher(Callback on_signal)
    : on_signal_(std::move(on_signal)) {
    sigemptyset(&previous_mask_);
    const sigset_t set = ShutdownSignals();
    const int rc = pthread_sigmask(SIG_BLOCK, &set, &previous_mask_);
    if (rc != 0) {
        LogWarn("shutdown", std::string("pthread_sigmask failed: ") + std::strerror(rc) +
                                "; signals keep their default action");
        return;
    }
    restore_mask_ = true;
    thread_ = std::thread([this] { Run(); });
}

ShutdownWatcher::~ShutdownWatcher() {
    stop_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (restore_mask_) {
        pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
    }
}

void ShutdownWatcher::Run() {
    const sigset_t set = ShutdownSignals();
    const timespec poll_interval{0, 100 * 1000 * 1000};

    while (!stop_) {
        const int sig = sigtimedwait(&set, nullptr, &poll_interval);
        if (sig < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                LogWarn("shutdown", std::string("sigtimedwait failed: ") +
                                        std::strerror(errno));
                return;
            }
            continue;
        }
        if (signal_.exchange(sig) != 0) {
            // Second signal while shutting down: keep waiting for teardown.
            LogWarn("shutdown", "Shutdown already in progress");
            continue;
        }
        LogInfo("shutdown", std::string("Received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") +
                                ", disconnecting tool servers");
        try {
            on_signal_(sig);
        } catch (const std::exception& e) {
            LogError("shutdown", std::string("Shutdown callback failed: ") + e.what());
        }
    }
}

} // namespace tool_bridge
