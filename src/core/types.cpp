#include <mcp_adapter/core/types.hpp>

#include <algorithm>

namespace mcp_adapter {

namespace {

bool IsServerNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ServerName
// ---------------------------------------------------------------------------
Result<ServerName, std::string> ServerName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ServerName, std::string>::Err("Server name must not be empty");
    }
    if (name.size() > 64) {
        return Result<ServerName, std::string>::Err(
            "Server name must be at most 64 characters, got " +
            std::to_string(name.size()));
    }
    if (!std::all_of(name.begin(), name.end(), IsServerNameChar)) {
        return Result<ServerName, std::string>::Err(
            "Server name '" + std::string(name) +
            "' may only contain letters, digits, '-', '_' and '.'");
    }
    return Result<ServerName, std::string>::Ok(ServerName(std::string(name)));
}

// ---------------------------------------------------------------------------
// QualifiedName
// ---------------------------------------------------------------------------
Result<QualifiedName, std::string> QualifiedName::Parse(std::string_view text) {
    auto sep = text.find(':');
    if (sep == std::string_view::npos) {
        return Result<QualifiedName, std::string>::Err(
            "Qualified name '" + std::string(text) + "' has no ':' separator");
    }
    if (sep == 0) {
        return Result<QualifiedName, std::string>::Err(
            "Qualified name '" + std::string(text) + "' has an empty server part");
    }
    if (sep + 1 == text.size()) {
        return Result<QualifiedName, std::string>::Err(
            "Qualified name '" + std::string(text) + "' has an empty tool part");
    }
    return Result<QualifiedName, std::string>::Ok(
        QualifiedName(std::string(text), sep));
}

QualifiedName QualifiedName::Of(std::string_view server, std::string_view tool) {
    std::string value;
    value.reserve(server.size() + 1 + tool.size());
    value.append(server).append(":").append(tool);
    return QualifiedName(std::move(value), server.size());
}

} // namespace mcp_adapter
