#include <mcp_adapter/process/server_process.hpp>

#include <mcp_adapter/config/config_loader.hpp>
#include <mcp_adapter/core/log.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_adapter {

namespace {

constexpr auto kTerminateGrace = std::chrono::milliseconds(200);
constexpr size_t kReadChunk = 64 * 1024;
constexpr auto kReapInterval = std::chrono::milliseconds(50);

Error SpawnError(const std::string& server, const std::string& message) {
    return Error::Make(ErrorCategory::Spawn, "ServerProcess::Spawn", server, message);
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Owns the three pipe pairs until they are handed over to the child and
// the ServerProcess.
struct Pipes {
    int in[2] = {-1, -1};
    int out[2] = {-1, -1};
    int err[2] = {-1, -1};

    ~Pipes() {
        for (int* p : {in, out, err}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    }

    bool Open() {
        return ::pipe2(in, O_CLOEXEC) == 0 && ::pipe2(out, O_CLOEXEC) == 0 &&
               ::pipe2(err, O_CLOEXEC) == 0;
    }
};

std::string DescribeExit(int status) {
    if (WIFEXITED(status)) {
        return "exited with status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "stopped";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Environment
// ---------------------------------------------------------------------------
std::vector<std::string> BuildChildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        merged.emplace(kv.substr(0, eq), kv.substr(eq + 1));
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Spawn
// ---------------------------------------------------------------------------
Result<std::unique_ptr<ServerProcess>, Error> ServerProcess::Spawn(
    const ServerConfig& config, EventLoopBridge& bridge) {
    using R = Result<std::unique_ptr<ServerProcess>, Error>;

    const std::string command = ResolveCommand(config);
    if (command.empty()) {
        return R::Err(SpawnError(config.name, "empty command"));
    }

    Pipes pipes;
    if (!pipes.Open()) {
        return R::Err(SpawnError(config.name,
                                 std::string("pipe2 failed: ") + std::strerror(errno)));
    }

    // posix_spawn wants mutable char* arrays.
    std::vector<std::string> args;
    args.push_back(command);
    args.insert(args.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    auto env = BuildChildEnvironment(config.env);
    std::vector<char*> envp;
    for (auto& e : env) envp.push_back(e.data());
    envp.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, pipes.in[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, pipes.out[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, pipes.err[1], STDERR_FILENO);

    // The loop thread blocks SIGPIPE; the child starts with a clean mask
    // and default dispositions.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    posix_spawnattr_setsigmask(&attr, &empty_mask);
    posix_spawnattr_setsigdefault(&attr, &default_signals);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, command.c_str(), &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    if (rc != 0) {
        return R::Err(SpawnError(config.name, "cannot start '" + command +
                                              "': " + std::strerror(rc)));
    }

    CloseFd(pipes.in[0]);
    CloseFd(pipes.out[1]);
    CloseFd(pipes.err[1]);
    for (int fd : {pipes.in[1], pipes.out[0], pipes.err[0]}) {
        if (!SetNonBlocking(fd)) {
            LogWarn("process", "Could not make pipe non-blocking for '" + config.name + "'");
        }
    }

    std::unique_ptr<ServerProcess> process(new ServerProcess(
        config.name, config.framing, bridge, pid, pipes.in[1], pipes.out[0], pipes.err[0]));
    pipes.in[1] = -1;
    pipes.out[0] = -1;
    pipes.err[0] = -1;

    LogInfo("process", "Started server '" + config.name + "' (pid " +
                       std::to_string(pid) + "): " + command);
    return R::Ok(std::move(process));
}

ServerProcess::ServerProcess(std::string name, Framing framing, EventLoopBridge& bridge,
                             pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : name_(std::move(name)),
      framing_(framing),
      bridge_(bridge),
      pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd) {}

ServerProcess::~ServerProcess() {
    ReleaseResources();
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------
void ServerProcess::Start(MessageHandler on_message, ClosedHandler on_closed) {
    on_message_ = std::move(on_message);
    on_closed_ = std::move(on_closed);
    if (stdout_fd_ >= 0) {
        bridge_.WatchFd(stdout_fd_, POLLIN, [this](short revents) { OnStdout(revents); });
    }
    if (stderr_fd_ >= 0) {
        bridge_.WatchFd(stderr_fd_, POLLIN, [this](short revents) { OnStderr(revents); });
    }
}

void ServerProcess::OnStdout(short revents) {
    bool eof = false;
    char buf[kReadChunk];
    for (;;) {
        ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
        if (n > 0) {
            for (auto& message : decoder_.Feed(std::string_view(buf, static_cast<size_t>(n)))) {
                inbound_.push_back(std::move(message));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // POLLHUP with nothing left to read is end of stream too.
            eof = (revents & (POLLHUP | POLLERR | POLLNVAL)) != 0 &&
                  (revents & POLLIN) == 0;
            break;
        }
        eof = true;
        break;
    }

    DrainInbound();
    if (!eof || terminated_) {
        return;
    }

    bridge_.UnwatchFd(stdout_fd_);
    CloseFd(stdout_fd_);
    if (decoder_.Buffered() > 0) {
        LogDebug("process", "Server '" + name_ + "' closed stdout with " +
                            std::to_string(decoder_.Buffered()) + " undecoded bytes");
    }
    if (!Reap(false)) {
        ScheduleReap();
    }
    LogInfo("process", "Server '" + name_ + "' closed its output");
    if (!closed_notified_) {
        closed_notified_ = true;
        if (on_closed_) on_closed_();
    }
}

void ServerProcess::DrainInbound() {
    if (draining_) return;
    draining_ = true;
    while (!inbound_.empty() && !terminated_) {
        auto message = std::move(inbound_.front());
        inbound_.pop_front();
        if (on_message_) on_message_(message);
    }
    draining_ = false;
}

void ServerProcess::OnStderr(short revents) {
    bool eof = false;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
        if (n > 0) {
            stderr_partial_.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            eof = (revents & (POLLHUP | POLLERR | POLLNVAL)) != 0 &&
                  (revents & POLLIN) == 0;
            break;
        }
        eof = true;
        break;
    }

    size_t start = 0;
    for (auto nl = stderr_partial_.find('\n'); nl != std::string::npos;
         nl = stderr_partial_.find('\n', start)) {
        std::string line = stderr_partial_.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) {
            LogDebug("process", "[stderr:" + name_ + "] " + line);
        }
        start = nl + 1;
    }
    stderr_partial_.erase(0, start);

    if (eof) {
        if (!stderr_partial_.empty()) {
            LogDebug("process", "[stderr:" + name_ + "] " + stderr_partial_);
            stderr_partial_.clear();
        }
        bridge_.UnwatchFd(stderr_fd_);
        CloseFd(stderr_fd_);
    }
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------
Result<void, Error> ServerProcess::Send(const nlohmann::json& message) {
    if (terminated_ || stdin_fd_ < 0) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::ServerNotReady, "ServerProcess::Send", name_,
            "server stdin is closed"));
    }

    outbound_ += framing_ == Framing::ContentLength ? EncodeFramed(message)
                                                    : EncodeLine(message);
    int err = FlushOutbound();
    if (err != 0) {
        CloseStdin();
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::ServerNotReady, "ServerProcess::Send", name_,
            std::string("write to server stdin failed: ") + std::strerror(err)));
    }
    return Result<void, Error>::Ok();
}

// Returns 0, or the errno of a failed write.
int ServerProcess::FlushOutbound() {
    while (!outbound_.empty()) {
        ssize_t n = ::write(stdin_fd_, outbound_.data(), outbound_.size());
        if (n > 0) {
            outbound_.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!stdin_watched_) {
                bridge_.WatchFd(stdin_fd_, POLLOUT,
                                [this](short revents) { OnStdinWritable(revents); });
                stdin_watched_ = true;
            }
            return 0;
        }
        return n < 0 ? errno : EIO;
    }
    if (stdin_watched_) {
        bridge_.UnwatchFd(stdin_fd_);
        stdin_watched_ = false;
    }
    return 0;
}

void ServerProcess::OnStdinWritable(short revents) {
    if ((revents & POLLOUT) == 0) {
        LogWarn("process", "Server '" + name_ + "' closed its input; dropping " +
                           std::to_string(outbound_.size()) + " queued bytes");
        CloseStdin();
        return;
    }
    int err = FlushOutbound();
    if (err != 0) {
        LogWarn("process", "Write to server '" + name_ + "' failed: " + std::strerror(err));
        CloseStdin();
    }
}

void ServerProcess::CloseStdin() {
    if (stdin_watched_) {
        bridge_.UnwatchFd(stdin_fd_);
        stdin_watched_ = false;
    }
    outbound_.clear();
    CloseFd(stdin_fd_);
}

// ---------------------------------------------------------------------------
// Termination
// ---------------------------------------------------------------------------
void ServerProcess::Terminate() {
    if (terminated_) {
        // Called again after the loop stopped: the scheduled kill will never
        // fire, so finish the child here.
        if (!bridge_.IsLoopThread()) {
            CancelTimers();
            StopChild();
        }
        return;
    }
    terminated_ = true;

    CloseStdin();
    if (stdout_fd_ >= 0) bridge_.UnwatchFd(stdout_fd_);
    if (stderr_fd_ >= 0) bridge_.UnwatchFd(stderr_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);

    if (!bridge_.IsLoopThread()) {
        CancelTimers();
        StopChild();
        return;
    }
    if (pid_ <= 0 || Reap(false)) {
        CancelTimers();
        return;
    }

    ::kill(pid_, SIGTERM);
    sigterm_sent_ = true;
    if (reap_timer_ == 0) {
        ScheduleReap();
    }
    kill_timer_ = bridge_.ScheduleAfter(kTerminateGrace, [this]() {
        kill_timer_ = 0;
        ForceKill();
    });
}

void ServerProcess::ReleaseResources() {
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
    StopChild();
}

void ServerProcess::CancelTimers() {
    if (reap_timer_ != 0) {
        bridge_.CancelTimer(reap_timer_);
        reap_timer_ = 0;
    }
    if (kill_timer_ != 0) {
        bridge_.CancelTimer(kill_timer_);
        kill_timer_ = 0;
    }
}

// Blocking SIGTERM, grace, SIGKILL sequence. Only used off the loop thread
// (destructor, or after the loop stopped).
void ServerProcess::StopChild() {
    if (pid_ <= 0 || Reap(false)) return;

    if (!sigterm_sent_) {
        ::kill(pid_, SIGTERM);
        sigterm_sent_ = true;
    }
    auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (Reap(false)) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ForceKill();
}

void ServerProcess::ForceKill() {
    if (pid_ <= 0 || Reap(false)) return;
    LogWarn("process", "Server '" + name_ + "' ignored SIGTERM; sending SIGKILL");
    ::kill(pid_, SIGKILL);
    Reap(true);
}

// Polls for the child's exit: after stdout EOF it may still be running
// briefly, and after SIGTERM until it exits or the kill timer fires.
void ServerProcess::ScheduleReap() {
    reap_timer_ = bridge_.ScheduleAfter(kReapInterval, [this]() {
        reap_timer_ = 0;
        if (!Reap(false)) {
            ScheduleReap();
        } else if (kill_timer_ != 0) {
            bridge_.CancelTimer(kill_timer_);
            kill_timer_ = 0;
        }
    });
}

bool ServerProcess::Reap(bool block) {
    if (exited_.load()) return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        exited_.store(true);
        LogDebug("process", "Server '" + name_ + "' " + DescribeExit(status));
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere.
        exited_.store(true);
    }
    return exited_.load();
}

} // namespace mcp_adapter
