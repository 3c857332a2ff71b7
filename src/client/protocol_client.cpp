#include <mcp_adapter/client/protocol_client.hpp>

#include <mcp_adapter/client/negotiation.hpp>
#include <mcp_adapter/client/result_normalizer.hpp>
#include <mcp_adapter/core/log.hpp>
#include <mcp_adapter/wire/wire_codec.hpp>

namespace mcp_adapter {

namespace {

constexpr int kMethodNotFound = -32601;

std::string RemoteErrorMessage(const nlohmann::json& error) {
    if (error.is_object()) {
        auto it = error.find("message");
        if (it != error.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    if (error.is_string()) {
        return error.get<std::string>();
    }
    return error.dump();
}

std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // anonymous namespace

const char* ClientStateName(ClientState state) {
    switch (state) {
        case ClientState::Spawned:      return "spawned";
        case ClientState::Initializing: return "initializing";
        case ClientState::ListingTools: return "listing_tools";
        case ClientState::Ready:        return "ready";
        case ClientState::ShuttingDown: return "shutting_down";
        case ClientState::Stopped:      return "stopped";
        case ClientState::Failed:       return "failed";
    }
    return "unknown";
}

ProtocolClient::ProtocolClient(std::shared_ptr<ServerRuntime> runtime,
                               std::unique_ptr<IServerProcess> process,
                               EventLoopBridge& bridge,
                               ClientOptions options)
    : runtime_(std::move(runtime)),
      process_(std::move(process)),
      bridge_(bridge),
      options_(std::move(options)) {}

ProtocolClient::~ProtocolClient() = default;

// ---------------------------------------------------------------------------
// Request plumbing
// ---------------------------------------------------------------------------
void ProtocolClient::SendRequest(const std::string& method, const nlohmann::json& params,
                                 std::chrono::milliseconds timeout, ReplyHandler handler) {
    const int64_t id = next_id_++;
    TimerId timer = bridge_.ScheduleAfter(timeout, [this, id]() { OnRequestTimeout(id); });
    pending_.emplace(id, PendingRequest{method, std::move(handler), timer, timeout});

    auto sent = process_->Send(MakeRequest(id, method, params));
    if (sent.IsErr()) {
        auto it = pending_.find(id);
        if (it == pending_.end()) return;
        auto failed = std::move(it->second.handler);
        bridge_.CancelTimer(it->second.timer);
        pending_.erase(it);
        auto error = sent.Error();
        error.operation = method;
        failed(Result<nlohmann::json, Error>::Err(std::move(error)));
        return;
    }
    LogDebug("client", "[" + Name() + "] -> " + method + " (id " + std::to_string(id) + ")");
}

void ProtocolClient::OnMessage(const nlohmann::json& message) {
    if (IsResponse(message)) {
        auto id = ResponseId(message);
        auto it = id.has_value() ? pending_.find(*id) : pending_.end();
        if (it == pending_.end()) {
            LogDebug("client", "[" + Name() + "] Ignoring reply with unknown id " +
                               message["id"].dump());
            return;
        }
        auto handler = std::move(it->second.handler);
        bridge_.CancelTimer(it->second.timer);
        pending_.erase(it);
        handler(Result<nlohmann::json, Error>::Ok(message));
        return;
    }
    if (IsServerRequest(message)) {
        OnServerRequest(message);
        return;
    }
    if (IsNotification(message)) {
        LogDebug("client", "[" + Name() + "] Notification " +
                           message["method"].dump() + " ignored");
        return;
    }
    LogDebug("client", "[" + Name() + "] Ignoring unrecognised message");
}

void ProtocolClient::OnServerRequest(const nlohmann::json& message) {
    const auto& id = message["id"];
    const auto& method = message["method"];
    nlohmann::json reply;
    if (method.is_string() && method.get<std::string>() == "ping") {
        reply = MakeResult(id, nlohmann::json::object());
    } else {
        reply = MakeErrorReply(id, kMethodNotFound, "Method not found: " + method.dump());
    }
    auto sent = process_->Send(reply);
    if (sent.IsErr()) {
        LogWarn("client", "[" + Name() + "] Could not answer server request: " +
                          sent.Error().message);
    }
}

void ProtocolClient::OnRequestTimeout(int64_t id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) return;
    auto handler = std::move(it->second.handler);
    auto method = it->second.method;
    auto timeout = it->second.timeout;
    pending_.erase(it);
    handler(Result<nlohmann::json, Error>::Err(Error::Make(
        ErrorCategory::CallTimeout, method, Name(),
        "no reply within " + std::to_string(timeout.count()) + " ms")));
}

void ProtocolClient::FailAllPending(const std::string& reason) {
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& [id, request] : pending) {
        bridge_.CancelTimer(request.timer);
    }
    for (auto& [id, request] : pending) {
        request.handler(Result<nlohmann::json, Error>::Err(Error::Make(
            ErrorCategory::ServerNotReady, request.method, Name(), reason)));
    }
}

void ProtocolClient::OnClosed() {
    auto state = state_.load();
    if (state == ClientState::ShuttingDown || state == ClientState::Stopped) return;

    LogWarn("client", "[" + Name() + "] Server exited (state " +
                      ClientStateName(state) + ")");
    state_ = ClientState::Stopped;
    runtime_->MarkStopping();
    FailAllPending("server exited");
    Settle();
}

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------
void ProtocolClient::Start(SettledCallback on_settled) {
    on_settled_ = std::move(on_settled);
    if (state_ != ClientState::Spawned) {
        LogWarn("client", "[" + Name() + "] Start called twice");
        return;
    }
    state_ = ClientState::Initializing;
    process_->Start([this](const nlohmann::json& message) { OnMessage(message); },
                    [this]() { OnClosed(); });
    TryInitialize(0);
}

void ProtocolClient::TryInitialize(size_t variant) {
    const auto& variants = options_.negotiation.initialize_variants;
    if (variant >= variants.size()) {
        Fail(ErrorCategory::Handshake, "no initialize variant was accepted");
        return;
    }

    SendRequest("initialize", variants[variant], options_.request_timeout,
                [this, variant](Result<nlohmann::json, Error> reply) {
        if (state_ != ClientState::Initializing) return;

        if (reply.IsOk() && AcceptsInitializeReply(reply.Value())) {
            auto result = reply.Value().find("result");
            if (result != reply.Value().end() && result->is_object() &&
                result->contains("serverInfo")) {
                runtime_->SetServerInfo(result->at("serverInfo"));
            }
            auto sent = process_->Send(MakeNotification("notifications/initialized"));
            if (sent.IsErr()) {
                Fail(ErrorCategory::Handshake, sent.Error().message);
                return;
            }
            runtime_->MarkReady();
            LogInfo("client", "[" + Name() + "] Handshake accepted (variant " +
                              std::to_string(variant + 1) + ")");
            state_ = ClientState::ListingTools;
            ListTools(0);
            return;
        }

        std::string why = reply.IsOk() ? RemoteErrorMessage(reply.Value()["error"])
                                       : reply.Error().message;
        LogDebug("client", "[" + Name() + "] initialize variant " +
                           std::to_string(variant + 1) + " rejected: " + why);
        TryInitialize(variant + 1);
    });
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------
void ProtocolClient::ListTools(size_t variant) {
    const auto& variants = options_.negotiation.list_tools_variants;
    if (variant >= variants.size()) {
        LogWarn("client", "[" + Name() + "] Discovery failed: no tools/list variant "
                          "returned any tools");
        FinishDiscovery({});
        return;
    }

    SendRequest("tools/list", variants[variant], options_.request_timeout,
                [this, variant](Result<nlohmann::json, Error> reply) {
        if (state_ != ClientState::ListingTools) return;

        if (reply.IsOk()) {
            if (auto tools = ParseToolList(Name(), reply.Value())) {
                FetchNextPage(NextCursor(reply.Value()), std::move(*tools), 1);
                return;
            }
        }
        LogDebug("client", "[" + Name() + "] tools/list variant " +
                           std::to_string(variant + 1) + " gave no tools");
        ListTools(variant + 1);
    });
}

void ProtocolClient::FetchNextPage(std::optional<nlohmann::json> cursor,
                                   std::vector<ToolMeta> tools, int page) {
    if (!cursor.has_value()) {
        FinishDiscovery(std::move(tools));
        return;
    }
    if (page >= options_.max_list_pages) {
        LogWarn("client", "[" + Name() + "] Stopped listing tools after " +
                          std::to_string(page) + " pages");
        FinishDiscovery(std::move(tools));
        return;
    }

    nlohmann::json params = {{"cursor", *cursor}};
    SendRequest("tools/list", params, options_.request_timeout,
                [this, tools = std::move(tools), page](Result<nlohmann::json, Error> reply) mutable {
        if (state_ != ClientState::ListingTools) return;

        if (reply.IsErr()) {
            LogWarn("client", "[" + Name() + "] tools/list page " +
                              std::to_string(page + 1) + " failed: " + reply.Error().message);
            FinishDiscovery(std::move(tools));
            return;
        }
        if (auto more = ParseToolList(Name(), reply.Value())) {
            tools.insert(tools.end(), std::make_move_iterator(more->begin()),
                         std::make_move_iterator(more->end()));
        }
        FetchNextPage(NextCursor(reply.Value()), std::move(tools), page + 1);
    });
}

void ProtocolClient::FinishDiscovery(std::vector<ToolMeta> tools) {
    runtime_->SetTools(std::move(tools));
    state_ = ClientState::Ready;
    LogInfo("client", "[" + Name() + "] Ready with " +
                      std::to_string(runtime_->ToolCount()) + " tools");
    Settle();
}

void ProtocolClient::Fail(ErrorCategory category, const std::string& message) {
    state_ = ClientState::Failed;
    auto error = Error::Make(category, "initialize", Name(), message);
    LogError("client", error.ToString());
    Settle();
}

void ProtocolClient::Settle() {
    if (settled_) return;
    settled_ = true;
    runtime_->MarkSettled();
    if (on_settled_) {
        auto callback = std::move(on_settled_);
        callback();
    }
}

// ---------------------------------------------------------------------------
// Tool calls
// ---------------------------------------------------------------------------
void ProtocolClient::CallTool(const std::string& tool, const nlohmann::json& arguments,
                              ToolCompletion done) {
    auto state = state_.load();
    if ((state != ClientState::Ready && state != ClientState::ListingTools) ||
        !runtime_->IsActive()) {
        done(Result<nlohmann::json, Error>::Err(Error::Make(
            ErrorCategory::ServerNotReady, "tools/call", Name(),
            std::string("server is ") + ClientStateName(state))));
        return;
    }

    nlohmann::json params = {
        {"name", tool},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments},
    };
    SendRequest("tools/call", params, options_.call_timeout,
                [this, tool, done = std::move(done)](Result<nlohmann::json, Error> reply) {
        using R = Result<nlohmann::json, Error>;
        if (reply.IsErr()) {
            auto error = reply.Error();
            error.message = "tool '" + tool + "': " + error.message;
            done(R::Err(std::move(error)));
            return;
        }

        const auto& message = reply.Value();
        auto remote = message.find("error");
        if (remote != message.end()) {
            auto error = Error::Make(ErrorCategory::CallError, "tools/call", Name(),
                                     "tool '" + tool + "' failed: " +
                                     RemoteErrorMessage(*remote));
            error.remote_error = *remote;
            done(R::Err(std::move(error)));
            return;
        }

        auto it = message.find("result");
        const nlohmann::json result = it != message.end() ? *it : nlohmann::json();
        if (result.is_object()) {
            auto flag = result.find("isError");
            if (flag != result.end() && flag->is_boolean() && flag->get<bool>()) {
                auto texts = ExtractContentText(result);
                auto error = Error::Make(ErrorCategory::CallError, "tools/call", Name(),
                                         texts.empty() ? "tool '" + tool + "' reported an error"
                                                       : Join(texts, "\n"));
                error.remote_error = result;
                done(R::Err(std::move(error)));
                return;
            }
        }
        done(R::Ok(NormalizeCallResult(result)));
    });
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------
void ProtocolClient::Shutdown() {
    runtime_->MarkStopping();
    auto state = state_.load();
    if (state != ClientState::ShuttingDown && state != ClientState::Stopped) {
        state_ = ClientState::ShuttingDown;
        FailAllPending("server is shutting down");
    }
    if (process_) {
        process_->Terminate();
    }
    state_ = ClientState::Stopped;
    Settle();
}

} // namespace mcp_adapter
