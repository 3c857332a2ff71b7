#pragma once

#include <mcp_adapter/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_adapter {

// ---------------------------------------------------------------------------
// ServerName: validated key of one configured tool server.
//
// Rules:
//   - Non-empty, max 64 characters
//   - ASCII letters, digits, '-', '_' and '.'
//   - No ':' (it separates server and tool in qualified names)
// ---------------------------------------------------------------------------
class ServerName {
public:
    static Result<ServerName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ServerName& other) const { return value_ == other.value_; }
    bool operator!=(const ServerName& other) const { return value_ != other.value_; }
    bool operator<(const ServerName& other) const { return value_ < other.value_; }

private:
    explicit ServerName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// QualifiedName: "server:tool", unique across all running servers.
// The server part never contains ':'; the tool part may.
// ---------------------------------------------------------------------------
class QualifiedName {
public:
    static Result<QualifiedName, std::string> Parse(std::string_view text);
    static QualifiedName Of(std::string_view server, std::string_view tool);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] std::string_view Server() const noexcept {
        return std::string_view(value_).substr(0, separator_);
    }
    [[nodiscard]] std::string_view Tool() const noexcept {
        return std::string_view(value_).substr(separator_ + 1);
    }

    bool operator==(const QualifiedName& other) const { return value_ == other.value_; }
    bool operator!=(const QualifiedName& other) const { return value_ != other.value_; }
    bool operator<(const QualifiedName& other) const { return value_ < other.value_; }

private:
    QualifiedName(std::string value, size_t separator)
        : value_(std::move(value)), separator_(separator) {}
    std::string value_;
    size_t separator_;
};

} // namespace mcp_adapter

