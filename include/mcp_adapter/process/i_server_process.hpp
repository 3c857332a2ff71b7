#pragma once

#include <mcp_adapter/core/result.hpp>

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_adapter {

// ---------------------------------------------------------------------------
// IServerProcess: a tool server subprocess as seen by the protocol client.
//
// ProtocolClient depends on this interface rather than on ServerProcess so
// the handshake, discovery and call paths can be tested offline against
// MockServerProcess.
//
// Every method except Name() is called on the event loop thread. Handlers
// passed to Start() are invoked on that thread as well.
// ---------------------------------------------------------------------------
class IServerProcess {
public:
    using MessageHandler = std::function<void(const nlohmann::json&)>;
    using ClosedHandler = std::function<void()>;

    virtual ~IServerProcess() = default;

    // Non-copyable, non-movable (polymorphic base).
    IServerProcess(const IServerProcess&) = delete;
    IServerProcess& operator=(const IServerProcess&) = delete;
    IServerProcess(IServerProcess&&) = delete;
    IServerProcess& operator=(IServerProcess&&) = delete;

    [[nodiscard]] virtual const std::string& Name() const = 0;

    // Begin delivering decoded messages in arrival order. `on_closed` runs
    // once when the server's stdout reaches EOF.
    virtual void Start(MessageHandler on_message, ClosedHandler on_closed) = 0;

    // Queue one encoded message for the server's stdin.
    [[nodiscard]] virtual Result<void, Error> Send(const nlohmann::json& message) = 0;

    // Stop the process. Idempotent.
    virtual void Terminate() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;
    [[nodiscard]] virtual int Pid() const = 0;

protected:
    IServerProcess() = default;
};

} // namespace mcp_adapter
