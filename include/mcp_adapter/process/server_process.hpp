#pragma once

#include <mcp_adapter/config/adapter_config.hpp>
#include <mcp_adapter/process/i_server_process.hpp>
#include <mcp_adapter/runtime/event_loop_bridge.hpp>
#include <mcp_adapter/wire/wire_codec.hpp>

#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mcp_adapter {

// ---------------------------------------------------------------------------
// ServerProcess: a spawned tool server with its stdin, stdout and stderr
// connected to pipes serviced by the EventLoopBridge.
//
// Outbound messages are encoded in the configured framing, appended to a
// buffer and flushed with non-blocking writes, so one server's messages go
// out in send order and never interleave. Inbound stdout bytes are decoded
// by a FrameDecoder; stderr is logged at debug level.
//
// Terminate() on the loop sends SIGTERM and schedules SIGKILL for when the
// grace period passes; it never blocks the loop. Destroy the process after
// the loop stopped: the destructor closes the pipes and finishes stopping
// the child but does not touch the loop's fd watches or timers.
// ---------------------------------------------------------------------------
class ServerProcess : public IServerProcess {
public:
    // Spawn `config.command` (after interpreter resolution) with its args and
    // environment overrides. Fails with ErrorCategory::Spawn.
    [[nodiscard]] static Result<std::unique_ptr<ServerProcess>, Error> Spawn(
        const ServerConfig& config, EventLoopBridge& bridge);

    ~ServerProcess() override;

    [[nodiscard]] const std::string& Name() const override { return name_; }
    void Start(MessageHandler on_message, ClosedHandler on_closed) override;
    [[nodiscard]] Result<void, Error> Send(const nlohmann::json& message) override;
    void Terminate() override;
    [[nodiscard]] bool IsRunning() const override { return !exited_.load(); }
    [[nodiscard]] int Pid() const override { return static_cast<int>(pid_); }

    [[nodiscard]] uint64_t MalformedFrameCount() const noexcept {
        return decoder_.MalformedFrameCount();
    }

private:
    ServerProcess(std::string name, Framing framing, EventLoopBridge& bridge,
                  pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    void OnStdout(short revents);
    void OnStderr(short revents);
    void OnStdinWritable(short revents);
    void DrainInbound();
    int FlushOutbound();
    void CloseStdin();
    void ReleaseResources();
    void StopChild();
    void ForceKill();
    void CancelTimers();
    bool Reap(bool block);
    void ScheduleReap();

    std::string name_;
    Framing framing_;
    EventLoopBridge& bridge_;
    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    bool stdin_watched_ = false;

    FrameDecoder decoder_;
    std::deque<nlohmann::json> inbound_;
    bool draining_ = false;
    std::string outbound_;
    std::string stderr_partial_;

    MessageHandler on_message_;
    ClosedHandler on_closed_;
    bool closed_notified_ = false;
    bool terminated_ = false;
    bool sigterm_sent_ = false;
    TimerId reap_timer_ = 0;
    TimerId kill_timer_ = 0;
    std::atomic<bool> exited_{false};
};

// The environment a child is started with: the current process environment
// with `overrides` applied on top, as "KEY=VALUE" strings.
std::vector<std::string> BuildChildEnvironment(
    const std::map<std::string, std::string>& overrides);

} // namespace mcp_adapter
