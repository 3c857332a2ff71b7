#pragma once

#include <mcp_adapter/config/adapter_config.hpp>
#include <mcp_adapter/core/result.hpp>
#include <mcp_adapter/process/i_server_process.hpp>
#include <mcp_adapter/runtime/event_loop_bridge.hpp>
#include <mcp_adapter/runtime/server_runtime.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_adapter {

// ---------------------------------------------------------------------------
// ClientState: lifecycle of one server connection.
//
//   Spawned -> Initializing -> ListingTools -> Ready -> ShuttingDown -> Stopped
//
// Initializing ends in Failed when no initialize variant is accepted. An
// exited process moves any state to Stopped.
// ---------------------------------------------------------------------------
enum class ClientState {
    Spawned,
    Initializing,
    ListingTools,
    Ready,
    ShuttingDown,
    Stopped,
    Failed,
};

const char* ClientStateName(ClientState state);

struct ClientOptions {
    std::chrono::milliseconds request_timeout{5000};
    std::chrono::milliseconds call_timeout{30000};
    NegotiationConfig negotiation;  // both tables must be non-empty
    int max_list_pages = 16;
};

// ---------------------------------------------------------------------------
// ProtocolClient: drives the request/response protocol for one server:
// handshake with variant retries, tool discovery, tool calls, and
// correlation of replies to pending requests by id.
//
// Every method except State() runs on the event loop thread. The client must
// outlive the loop's use of it: destroy it after Shutdown() ran or after the
// loop stopped.
// ---------------------------------------------------------------------------
class ProtocolClient {
public:
    using SettledCallback = std::function<void()>;
    using ToolCompletion = EventLoopBridge::Completion<nlohmann::json>;

    ProtocolClient(std::shared_ptr<ServerRuntime> runtime,
                   std::unique_ptr<IServerProcess> process,
                   EventLoopBridge& bridge,
                   ClientOptions options);
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    // Begin the handshake. `on_settled` runs once when handshake and
    // discovery have finished, successfully or not.
    void Start(SettledCallback on_settled = {});

    // Send tools/call for a local tool name. `done` runs exactly once with
    // the normalized result or an error.
    void CallTool(const std::string& tool, const nlohmann::json& arguments,
                  ToolCompletion done);

    // Fail pending requests and terminate the process. Idempotent.
    void Shutdown();

    [[nodiscard]] ClientState State() const noexcept { return state_.load(); }
    [[nodiscard]] const std::string& Name() const { return runtime_->Name(); }
    [[nodiscard]] int Pid() const { return process_ ? process_->Pid() : -1; }
    [[nodiscard]] const std::shared_ptr<ServerRuntime>& Runtime() const { return runtime_; }

    // Requests sent and still waiting for a reply.
    [[nodiscard]] size_t PendingCount() const { return pending_.size(); }

private:
    using ReplyHandler = std::function<void(Result<nlohmann::json, Error>)>;

    struct PendingRequest {
        std::string method;
        ReplyHandler handler;
        TimerId timer = 0;
        std::chrono::milliseconds timeout{0};
    };

    void SendRequest(const std::string& method, const nlohmann::json& params,
                     std::chrono::milliseconds timeout, ReplyHandler handler);
    void OnMessage(const nlohmann::json& message);
    void OnServerRequest(const nlohmann::json& message);
    void OnRequestTimeout(int64_t id);
    void OnClosed();
    void FailAllPending(const std::string& reason);

    void TryInitialize(size_t variant);
    void ListTools(size_t variant);
    void FetchNextPage(std::optional<nlohmann::json> cursor,
                       std::vector<ToolMeta> tools, int page);
    void FinishDiscovery(std::vector<ToolMeta> tools);
    void Fail(ErrorCategory category, const std::string& message);
    void Settle();

    std::shared_ptr<ServerRuntime> runtime_;
    std::unique_ptr<IServerProcess> process_;
    EventLoopBridge& bridge_;
    ClientOptions options_;

    std::atomic<ClientState> state_{ClientState::Spawned};
    int64_t next_id_ = 1;
    std::map<int64_t, PendingRequest> pending_;
    SettledCallback on_settled_;
    bool settled_ = false;
};

} // namespace mcp_adapter
