#include <mcp_adapter/mcp/adapter.hpp>

#include <mcp_adapter/client/negotiation.hpp>
#include <mcp_adapter/core/log.hpp>
#include <mcp_adapter/core/types.hpp>
#include <mcp_adapter/process/server_process.hpp>

namespace mcp_adapter {

namespace {

// Added to the client's own call timeout so its CallTimeout error, which
// names the tool, normally arrives before RunSync gives up.
constexpr auto kCallGrace = std::chrono::milliseconds(1000);

Result<std::unique_ptr<IServerProcess>, Error> SpawnServerProcess(
    const ServerConfig& config, EventLoopBridge& bridge) {
    using R = Result<std::unique_ptr<IServerProcess>, Error>;
    auto spawned = ServerProcess::Spawn(config, bridge);
    if (spawned.IsErr()) {
        return R::Err(spawned.Error());
    }
    return R::Ok(std::unique_ptr<IServerProcess>(std::move(spawned).Value()));
}

} // anonymous namespace

Adapter::Adapter(AdapterConfig config, ProcessFactory factory)
    : config_(std::move(config)),
      negotiation_(ResolveNegotiation(config_.negotiation, config_.client_name,
                                      config_.client_version)),
      factory_(factory ? std::move(factory) : ProcessFactory(SpawnServerProcess)),
      bridge_(std::make_shared<EventLoopBridge>()) {}

Adapter::~Adapter() {
    Shutdown();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<void, Error> Adapter::Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (shut_down_) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "Adapter::Start", "", "adapter was shut down"));
    }
    if (!bridge_started_) {
        auto started = bridge_->Start();
        if (started.IsErr()) {
            return started;
        }
        bridge_started_ = true;
    }

    struct Waiting {
        std::shared_ptr<ServerRuntime> runtime;
        std::chrono::steady_clock::time_point deadline;
        std::chrono::milliseconds window;
    };
    std::vector<Waiting> waiting;
    const auto start_time = std::chrono::steady_clock::now();

    for (const auto& server : config_.servers) {
        if (!server.enabled) {
            LogDebug("adapter", "Server '" + server.name + "' is disabled");
            continue;
        }
        if (FindEntry(server.name).has_value()) {
            continue;
        }

        auto process = factory_(server, *bridge_);
        if (process.IsErr()) {
            LogError("adapter", process.Error().ToString());
            std::lock_guard<std::mutex> lock(entries_mutex_);
            spawn_failures_[server.name] = process.Error().message;
            continue;
        }

        ClientOptions options;
        options.request_timeout = config_.request_timeout;
        options.call_timeout = server.call_timeout.value_or(config_.call_timeout);
        options.negotiation = negotiation_;

        auto runtime = std::make_shared<ServerRuntime>(server.name);
        auto client = std::make_shared<ProtocolClient>(
            runtime, std::move(process).Value(), *bridge_, options);
        {
            std::lock_guard<std::mutex> lock(entries_mutex_);
            spawn_failures_.erase(server.name);
            entries_.push_back({server.name, runtime, client, options.call_timeout});
        }

        if (!bridge_->Post([client]() { client->Start(); })) {
            LogError("adapter", "Event loop is not running; cannot start '" + server.name + "'");
            continue;
        }
        auto window = server.init_timeout.value_or(config_.init_timeout);
        waiting.push_back({runtime, start_time + window, window});
    }

    for (const auto& w : waiting) {
        if (!w.runtime->WaitSettledUntil(w.deadline)) {
            LogWarn("adapter", "Server '" + w.runtime->Name() + "' did not finish its "
                               "handshake within " + std::to_string(w.window.count()) +
                               " ms; continuing without its tools");
        }
    }

    std::vector<std::shared_ptr<ServerRuntime>> runtimes;
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        for (const auto& entry : entries_) {
            runtimes.push_back(entry.runtime);
        }
    }
    registry_.Aggregate(runtimes);
    return Result<void, Error>::Ok();
}

void Adapter::Shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (shut_down_) return;
    shut_down_ = true;

    std::vector<Entry> entries;
    {
        std::lock_guard<std::mutex> lock(entries_mutex_);
        entries = entries_;
    }
    if (!bridge_started_) {
        return;
    }

    // Runtimes are marked stopping by the client's shutdown on the loop.
    for (const auto& entry : entries) {
        auto client = entry.client;
        bridge_->Post([client]() { client->Shutdown(); });
    }

    if (!bridge_->Stop(config_.shutdown_timeout)) {
        // The loop thread still runs and may touch the clients and the
        // bridge; keep them alive for the rest of the process.
        for (const auto& entry : entries) {
            bridge_->KeepAlive(entry.client);
        }
        bridge_->KeepAlive(bridge_);
        LogWarn("adapter", "Shutdown finished with the event loop still running");
        return;
    }

    // The loop has exited; finish any client whose shutdown task never ran.
    for (const auto& entry : entries) {
        entry.client->Shutdown();
    }
    LogInfo("adapter", "Shut down " + std::to_string(entries.size()) + " servers");
}

// ---------------------------------------------------------------------------
// Tool spec
// ---------------------------------------------------------------------------
nlohmann::json Adapter::BuildToolSpecs() {
    return ToolRegistry::ToFunctionSpec(registry_.BuildExposedSpec());
}

std::vector<ExposedTool> Adapter::ExposedTools() {
    return registry_.BuildExposedSpec();
}

std::optional<std::string> Adapter::Resolve(const std::string& exposed_name) const {
    return registry_.Resolve(exposed_name);
}

// ---------------------------------------------------------------------------
// Tool calls
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> Adapter::CallTool(const std::string& name,
                                                const nlohmann::json& arguments) {
    using R = Result<nlohmann::json, Error>;

    std::string qualified;
    if (auto resolved = registry_.Resolve(name)) {
        qualified = *resolved;
    } else if (registry_.Lookup(name).has_value()) {
        qualified = name;
    } else {
        return R::Err(Error::Make(ErrorCategory::UnknownTool, "CallTool", "",
                                  "unknown tool '" + name + "'"));
    }

    auto parsed = QualifiedName::Parse(qualified);
    if (parsed.IsErr()) {
        return R::Err(Error::Make(ErrorCategory::Internal, "CallTool", "", parsed.Error()));
    }
    const std::string server(parsed.Value().Server());
    const std::string tool(parsed.Value().Tool());

    auto entry = FindEntry(server);
    if (!entry.has_value() || !entry->runtime->IsActive()) {
        return R::Err(Error::Make(ErrorCategory::ServerNotReady, "CallTool", server,
                                  "server is not ready"));
    }

    LogDebug("adapter", "Calling " + qualified);
    auto client = entry->client;
    auto result = bridge_->RunSync<nlohmann::json>(
        [client, tool, arguments](EventLoopBridge::Completion<nlohmann::json> done) {
            client->CallTool(tool, arguments, std::move(done));
        },
        entry->call_timeout + kCallGrace, "tools/call");

    if (result.IsErr()) {
        auto error = std::move(result).Error();
        if (error.server.empty()) {
            error.server = server;
        }
        LogWarn("adapter", error.ToString());
        return R::Err(std::move(error));
    }
    return result;
}

nlohmann::json Adapter::CallToolValue(const std::string& name,
                                      const nlohmann::json& arguments) {
    auto result = CallTool(name, arguments);
    if (result.IsErr()) {
        return result.Error().ToJson();
    }
    return result.Value();
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------
std::vector<ServerStatus> Adapter::ServerStates() const {
    std::vector<ServerStatus> out;
    std::lock_guard<std::mutex> lock(entries_mutex_);
    for (const auto& server : config_.servers) {
        ServerStatus status;
        status.name = server.name;
        if (!server.enabled) {
            status.state = "disabled";
            out.push_back(std::move(status));
            continue;
        }
        auto failed = spawn_failures_.find(server.name);
        if (failed != spawn_failures_.end()) {
            status.state = "spawn_failed";
            out.push_back(std::move(status));
            continue;
        }
        for (const auto& entry : entries_) {
            if (entry.name != server.name) continue;
            status.state = ClientStateName(entry.client->State());
            status.tool_count = entry.runtime->ToolCount();
            status.pid = entry.client->Pid();
            status.ready = entry.runtime->IsActive();
            break;
        }
        if (status.state.empty()) {
            status.state = "not_started";
        }
        out.push_back(std::move(status));
    }
    return out;
}

std::optional<Adapter::Entry> Adapter::FindEntry(const std::string& server) const {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    for (const auto& entry : entries_) {
        if (entry.name == server) {
            return entry;
        }
    }
    return std::nullopt;
}

} // namespace mcp_adapter
