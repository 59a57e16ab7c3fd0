#pragma once

#include <tool_bridge/core/result.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace tool_bridge {

// Variables copied from the bridge's own environment into every child, before
// the configured env mapping is overlaid.
extern const std::vector<std::string> kInheritedEnvVars;

/// Build the environment for a child process: the inherited allow-list from
/// the current process, overlaid with `overlay`.
std::map<std::string, std::string> BuildChildEnvironment(
    const std::map<std::string, std::string>& overlay);

struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> environment;  // complete, not merged
    std::string label;                               // used in errors and logs
};

// ---------------------------------------------------------------------------
// ChildProcess — one spawned child with pipes on its stdin and stdout.
//
// The pipe ends can be handed to a channel with TakeStdin()/TakeStdout(); any
// end still held is closed by Terminate() or the destructor. stderr is
// inherited from the bridge.
//
// Terminate() is idempotent and safe to call from a thread other than the
// one that spawned the process.
// ---------------------------------------------------------------------------
class ChildProcess {
public:
    /// Fork and exec. Exec failures (command not found, not executable) are
    /// reported here, not as a later EOF, via a close-on-exec status pipe.
    static Result<std::unique_ptr<ChildProcess>, Error> Spawn(
        const SpawnOptions& options);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }
    [[nodiscard]] bool IsRunning() const noexcept { return pid_ != -1; }

    /// Raw wait status from waitpid once reaped.
    [[nodiscard]] std::optional<int> WaitStatus() const noexcept { return wait_status_; }

    /// Transfer ownership of a pipe end to the caller. Returns -1 if it was
    /// already taken.
    [[nodiscard]] int TakeStdin() noexcept;
    [[nodiscard]] int TakeStdout() noexcept;

    /// Close our pipe ends, give the child `grace` to exit on EOF, then
    /// SIGTERM, another `grace`, then SIGKILL, and reap it.
    ///
    /// ECHILD (reaped by someone else) comes back as ForeignContext, EINTR
    /// from a blocking wait as Cancelled. The process is considered gone in
    /// both cases.
    Result<void, Error> Terminate(std::chrono::milliseconds grace);

private:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, std::string label);

    // Returns true if the child was reaped before the deadline.
    Result<bool, Error> WaitFor(std::chrono::milliseconds timeout);
    Result<void, Error> WaitBlocking();
    void CloseOwnedFds() noexcept;

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    std::string label_;
    std::optional<int> wait_status_;
};

} // namespace tool_bridge
