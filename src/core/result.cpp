#include <mcp_adapter/core/result.hpp>

#include <ostream>
#include <sstream>

namespace mcp_adapter {

namespace {

// JSON-RPC error objects usually carry {"code", "message"}; some servers
// send a bare string instead.
std::string RemoteMessage(const nlohmann::json& remote) {
    if (remote.is_string()) {
        return remote.get<std::string>();
    }
    if (remote.is_object()) {
        auto it = remote.find("message");
        if (it != remote.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return remote.dump();
}

} // anonymous namespace

Error Error::Make(ErrorCategory category, std::string operation,
                  std::string server, std::string message) {
    Error e;
    e.operation = std::move(operation);
    e.server = std::move(server);
    e.message = std::move(message);
    e.category = category;
    return e;
}

int Error::ExitCode() const noexcept {
    switch (category) {
        case ErrorCategory::Config:         return 1;
        case ErrorCategory::UnknownTool:    return 2;
        case ErrorCategory::ServerNotReady: return 3;
        case ErrorCategory::CallError:      return 4;
        case ErrorCategory::CallTimeout:    return 5;
        case ErrorCategory::Spawn:          return 6;
        case ErrorCategory::Handshake:      return 7;
        case ErrorCategory::Discovery:      return 7;
        case ErrorCategory::MalformedFrame: return 8;
        case ErrorCategory::Internal:       return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:         return "config";
        case ErrorCategory::Spawn:          return "spawn";
        case ErrorCategory::Handshake:      return "handshake";
        case ErrorCategory::Discovery:      return "discovery";
        case ErrorCategory::UnknownTool:    return "unknown_tool";
        case ErrorCategory::ServerNotReady: return "server_not_ready";
        case ErrorCategory::CallTimeout:    return "call_timeout";
        case ErrorCategory::CallError:      return "call_error";
        case ErrorCategory::MalformedFrame: return "malformed_frame";
        case ErrorCategory::Internal:       return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!server.empty()) {
        oss << " [" << server << "]";
    }
    oss << ": " << message;
    if (remote_error.has_value()) {
        oss << " (server: " << RemoteMessage(*remote_error) << ")";
    }
    return oss.str();
}

nlohmann::json Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
    };
    if (!server.empty()) {
        body["server"] = server;
    }
    if (remote_error.has_value()) {
        body["remote_error"] = *remote_error;
    }
    return {{"error", body}};
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
    return os << e.ToString();
}

} // namespace mcp_adapter
