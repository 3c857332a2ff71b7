#pragma once

#include <mcp_adapter/client/protocol_client.hpp>
#include <mcp_adapter/config/adapter_config.hpp>
#include <mcp_adapter/core/result.hpp>
#include <mcp_adapter/mcp/tool_registry.hpp>
#include <mcp_adapter/process/i_server_process.hpp>
#include <mcp_adapter/runtime/event_loop_bridge.hpp>
#include <mcp_adapter/runtime/server_runtime.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_adapter {

// ---------------------------------------------------------------------------
// ServerStatus: diagnostic snapshot of one configured server.
// ---------------------------------------------------------------------------
struct ServerStatus {
    std::string name;
    std::string state;
    size_t tool_count = 0;
    int pid = -1;
    bool ready = false;
};

// Creates the process for one server entry. The default spawns a
// ServerProcess; tests substitute scripted processes.
using ProcessFactory = std::function<Result<std::unique_ptr<IServerProcess>, Error>(
    const ServerConfig& config, EventLoopBridge& bridge)>;

// ---------------------------------------------------------------------------
// Adapter: the public facade. Owns the event loop, one ProtocolClient per
// enabled server and the aggregated ToolRegistry, and offers a blocking
// interface to callers on any thread.
//
// Usage:
//   Adapter adapter(config);
//   adapter.Start();
//   auto spec = adapter.BuildToolSpecs();
//   auto result = adapter.CallTool("get_weather", {{"city", "Oslo"}});
//   adapter.Shutdown();
// ---------------------------------------------------------------------------
class Adapter {
public:
    explicit Adapter(AdapterConfig config, ProcessFactory factory = {});
    ~Adapter();

    Adapter(const Adapter&) = delete;
    Adapter& operator=(const Adapter&) = delete;

    // Spawn every enabled server not yet running, wait for each to finish
    // its handshake (bounded by its init timeout), then aggregate the
    // registry. Servers that fail are logged and skipped. Errs only when
    // called after Shutdown() or when the event loop cannot start.
    [[nodiscard]] Result<void, Error> Start();

    // Stop every server and the event loop. Idempotent; safe before Start().
    void Shutdown();

    [[nodiscard]] nlohmann::json BuildToolSpecs();
    [[nodiscard]] std::vector<ExposedTool> ExposedTools();
    [[nodiscard]] std::optional<std::string> Resolve(const std::string& exposed_name) const;

    // `name` is an exposed name or a qualified "server:tool".
    [[nodiscard]] Result<nlohmann::json, Error> CallTool(const std::string& name,
                                                         const nlohmann::json& arguments);
    // The normalized result, or {"error": {...}}.
    [[nodiscard]] nlohmann::json CallToolValue(const std::string& name,
                                               const nlohmann::json& arguments);

    [[nodiscard]] std::vector<ServerStatus> ServerStates() const;

private:
    struct Entry {
        std::string name;
        std::shared_ptr<ServerRuntime> runtime;
        std::shared_ptr<ProtocolClient> client;
        std::chrono::milliseconds call_timeout{0};
    };

    std::optional<Entry> FindEntry(const std::string& server) const;

    AdapterConfig config_;
    NegotiationConfig negotiation_;
    ProcessFactory factory_;
    std::shared_ptr<EventLoopBridge> bridge_;
    ToolRegistry registry_;

    std::mutex lifecycle_mutex_;          // serializes Start and Shutdown
    mutable std::mutex entries_mutex_;
    std::vector<Entry> entries_;
    std::map<std::string, std::string> spawn_failures_;  // server -> message
    bool bridge_started_ = false;
    bool shut_down_ = false;
};

} // namespace mcp_adapter
