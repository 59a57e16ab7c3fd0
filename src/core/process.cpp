#include <tool_bridge/core/process.hpp>

#include <tool_bridge/core/log.hpp>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tool_bridge {

const std::vector<std::string> kInheritedEnvVars = {
    "HOME", "LOGNAME", "PATH", "SHELL", "TERM", "USER",
};

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

// Writing to a server that already exited must come back as EPIPE, not kill
// the bridge.
void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseQuietly(int& fd) noexcept {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

Error SpawnError(const std::string& label, const std::string& message, int err) {
    return Error::FromErrno("Spawn", label, message, err, ErrorCategory::Spawn);
}

} // anonymous namespace

std::map<std::string, std::string> BuildChildEnvironment(
    const std::map<std::string, std::string>& overlay) {
    std::map<std::string, std::string> env;
    for (const auto& name : kInheritedEnvVars) {
        const char* value = std::getenv(name.c_str());
        if (value != nullptr) {
            env[name] = value;
        }
    }
    for (const auto& [key, value] : overlay) {
        env[key] = value;
    }
    return env;
}

// ---------------------------------------------------------------------------
// Spawn
// ---------------------------------------------------------------------------
Result<std::unique_ptr<ChildProcess>, Error> ChildProcess::Spawn(
    const SpawnOptions& options) {
    using R = Result<std::unique_ptr<ChildProcess>, Error>;

    if (options.command.empty()) {
        return R::Err(Error{"Spawn", options.label, "Empty command",
                            ErrorCategory::Spawn, std::nullopt});
    }

    IgnoreSigpipeOnce();

    // Everything the child needs is built before fork(): no allocation
    // happens between fork() and exec.
    std::vector<std::string> env_entries;
    env_entries.reserve(options.environment.size());
    for (const auto& [key, value] : options.environment) {
        env_entries.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_entries) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::string command = options.command;
    std::vector<std::string> args = options.args;
    std::vector<char*> argv;
    argv.push_back(command.data());
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe2(to_child, O_CLOEXEC) != 0) {
        return R::Err(SpawnError(options.label, "Failed to create stdin pipe", errno));
    }
    if (pipe2(from_child, O_CLOEXEC) != 0) {
        const int err = errno;
        CloseQuietly(to_child[0]);
        CloseQuietly(to_child[1]);
        return R::Err(SpawnError(options.label, "Failed to create stdout pipe", err));
    }
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        CloseQuietly(to_child[0]);
        CloseQuietly(to_child[1]);
        CloseQuietly(from_child[0]);
        CloseQuietly(from_child[1]);
        return R::Err(SpawnError(options.label, "Failed to create status pipe", err));
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        for (int* fd : {&to_child[0], &to_child[1], &from_child[0],
                        &from_child[1], &status_pipe[0], &status_pipe[1]}) {
            CloseQuietly(*fd);
        }
        return R::Err(SpawnError(options.label, "Failed to fork", err));
    }

    if (pid == 0) {
        // Child: undo the parent's signal setup, wire up stdio, exec.
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        std::signal(SIGPIPE, SIG_DFL);

        dup2(to_child[0], STDIN_FILENO);
        dup2(from_child[1], STDOUT_FILENO);

        execvpe(argv[0], argv.data(), envp.data());

        const int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent.
    CloseQuietly(to_child[0]);
    CloseQuietly(from_child[1]);
    CloseQuietly(status_pipe[1]);

    // EOF means exec succeeded (the status pipe was closed on exec).
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseQuietly(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        CloseQuietly(to_child[1]);
        CloseQuietly(from_child[0]);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return R::Err(SpawnError(options.label,
                                 "Failed to execute '" + options.command + "'",
                                 child_errno));
    }

    LogDebug("process", "Spawned '" + options.command + "' as pid " +
                            std::to_string(pid));
    return R::Ok(std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, to_child[1], from_child[0], options.label)));
}

ChildProcess::ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, std::string label)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), label_(std::move(label)) {}

ChildProcess::~ChildProcess() {
    if (pid_ != -1) {
        auto result = Terminate(std::chrono::milliseconds(0));
        if (result.IsErr()) {
            LogDebug("process", "Terminate in destructor: " + result.Error().ToString());
        }
    }
    CloseOwnedFds();
}

int ChildProcess::TakeStdin() noexcept {
    const int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ChildProcess::TakeStdout() noexcept {
    const int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

void ChildProcess::CloseOwnedFds() noexcept {
    CloseQuietly(stdin_fd_);
    CloseQuietly(stdout_fd_);
}

// ---------------------------------------------------------------------------
// Terminate
// ---------------------------------------------------------------------------
Result<void, Error> ChildProcess::Terminate(std::chrono::milliseconds grace) {
    CloseOwnedFds();
    if (pid_ == -1) {
        return Result<void, Error>::Ok();
    }

    auto exited = WaitFor(grace);
    if (exited.IsErr()) {
        return Result<void, Error>::Err(std::move(exited).Error());
    }
    if (exited.Value()) {
        return Result<void, Error>::Ok();
    }

    LogDebug("process", "Sending SIGTERM to pid " + std::to_string(pid_));
    if (::kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
        LogWarn("process", "kill(SIGTERM) failed: " + std::string(std::strerror(errno)));
    }
    exited = WaitFor(grace);
    if (exited.IsErr()) {
        return Result<void, Error>::Err(std::move(exited).Error());
    }
    if (exited.Value()) {
        return Result<void, Error>::Ok();
    }

    LogDebug("process", "Sending SIGKILL to pid " + std::to_string(pid_));
    if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
        LogWarn("process", "kill(SIGKILL) failed: " + std::string(std::strerror(errno)));
    }
    return WaitBlocking();
}

Result<bool, Error> ChildProcess::WaitFor(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        int status = 0;
        const pid_t r = waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            wait_status_ = status;
            pid_ = -1;
            return Result<bool, Error>::Ok(true);
        }
        if (r < 0 && errno != EINTR) {
            const int err = errno;
            pid_ = -1;
            return Result<bool, Error>::Err(Error::FromErrno(
                "Terminate", label_, "waitpid failed", err,
                err == ECHILD ? ErrorCategory::ForeignContext : ErrorCategory::Teardown));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return Result<bool, Error>::Ok(false);
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

Result<void, Error> ChildProcess::WaitBlocking() {
    int status = 0;
    const pid_t r = waitpid(pid_, &status, 0);
    if (r == pid_) {
        wait_status_ = status;
        pid_ = -1;
        return Result<void, Error>::Ok();
    }
    const int err = errno;
    // After SIGKILL the child cannot outlive us; a wait interrupted by a
    // signal leaves it to be reaped at exit.
    pid_ = -1;
    ErrorCategory category = ErrorCategory::Teardown;
    if (err == ECHILD) {
        category = ErrorCategory::ForeignContext;
    } else if (err == EINTR) {
        category = ErrorCategory::Cancelled;
    }
    return Result<void, Error>::Err(
        Error::FromErrno("Terminate", label_, "waitpid failed", err, category));
}

} // namespace tool_bridge
