#include <mcp_adapter/wire/wire_codec.hpp>

#include <mcp_adapter/core/log.hpp>

#include <cctype>
#include <charconv>
#include <string>

namespace mcp_adapter {

namespace {

constexpr std::string_view kContentLength = "content-length:";

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool StartsWithNoCase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

// "Content-Type: ..." and friends may sit between Content-Length and the
// blank separator.
bool LooksLikeHeader(std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) return false;
    for (size_t i = 0; i < colon; ++i) {
        char c = line[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
    }
    return true;
}

std::string Preview(std::string_view s) {
    constexpr size_t kMax = 120;
    if (s.size() <= kMax) return std::string(s);
    return std::string(s.substr(0, kMax)) + "...";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// FrameDecoder
// ---------------------------------------------------------------------------
std::vector<nlohmann::json> FrameDecoder::Feed(std::string_view bytes) {
    std::vector<nlohmann::json> out;
    buffer_.append(bytes.data(), bytes.size());

    size_t pos = 0;
    while (pos < buffer_.size()) {
        if (state_ == State::Body) {
            if (buffer_.size() - pos < body_length_) break;
            std::string_view body(buffer_.data() + pos, body_length_);
            pos += body_length_;
            state_ = State::Line;
            HandleBody(body, out);
            continue;
        }

        auto nl = buffer_.find('\n', pos);
        if (nl == std::string::npos) break;
        std::string_view line(buffer_.data() + pos, nl - pos);
        pos = nl + 1;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (state_ == State::Separator) {
            auto trimmed = Trim(line);
            if (trimmed.empty()) {
                state_ = State::Body;
            } else if (LooksLikeHeader(trimmed) && trimmed.front() != '{') {
                LogDebug("wire", "Skipping extra header: " + Preview(trimmed));
            } else {
                // Header block without a separator; recover by treating the
                // line as ordinary input.
                ++malformed_;
                LogDebug("wire", "Expected blank line after Content-Length, got: " +
                                 Preview(trimmed));
                state_ = State::Line;
                HandleLine(line, out);
            }
            continue;
        }

        HandleLine(line, out);
    }

    buffer_.erase(0, pos);
    return out;
}

void FrameDecoder::HandleLine(std::string_view line, std::vector<nlohmann::json>& out) {
    auto trimmed = Trim(line);
    if (trimmed.empty()) {
        return;
    }

    if (StartsWithNoCase(trimmed, kContentLength)) {
        auto length = ParseContentLength(trimmed);
        if (!length.has_value() || *length == 0) {
            ++malformed_;
            LogDebug("wire", "Malformed Content-Length header: " + Preview(trimmed));
            return;
        }
        if (*length > max_frame_size_) {
            ++malformed_;
            LogDebug("wire", "Content-Length " + std::to_string(*length) +
                             " exceeds the " + std::to_string(max_frame_size_) +
                             " byte frame limit");
            return;
        }
        body_length_ = *length;
        state_ = State::Separator;
        return;
    }

    if (trimmed.front() == '{') {
        HandleBody(trimmed, out);
        return;
    }

    ++noise_;
    LogDebug("wire", "Ignoring non-protocol line: " + Preview(trimmed));
}

void FrameDecoder::HandleBody(std::string_view body, std::vector<nlohmann::json>& out) {
    auto message = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        ++malformed_;
        LogDebug("wire", "Dropping malformed frame: " + Preview(Trim(body)));
        return;
    }
    out.push_back(std::move(message));
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
std::string EncodeLine(const nlohmann::json& message) {
    auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    text.push_back('\n');
    return text;
}

std::string EncodeFramed(const nlohmann::json& message) {
    auto body = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::string frame = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    frame += body;
    return frame;
}

std::optional<size_t> ParseContentLength(std::string_view line) {
    line = Trim(line);
    if (!StartsWithNoCase(line, kContentLength)) {
        return std::nullopt;
    }
    auto value = Trim(line.substr(kContentLength.size()));
    if (value.empty()) {
        return std::nullopt;
    }
    size_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return length;
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------
nlohmann::json MakeRequest(int64_t id, const std::string& method,
                           const nlohmann::json& params) {
    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
    };
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg;
}

nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params) {
    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"method", method},
    };
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg;
}

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result},
    };
}

nlohmann::json MakeErrorReply(const nlohmann::json& id, int code,
                              const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message},
        }},
    };
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------
bool IsResponse(const nlohmann::json& message) {
    return message.is_object() && message.contains("id") &&
           !message.contains("method") &&
           (message.contains("result") || message.contains("error"));
}

bool IsNotification(const nlohmann::json& message) {
    return message.is_object() && message.contains("method") &&
           !message.contains("id");
}

bool IsServerRequest(const nlohmann::json& message) {
    return message.is_object() && message.contains("method") &&
           message.contains("id");
}

std::optional<int64_t> ResponseId(const nlohmann::json& message) {
    auto it = message.find("id");
    if (it == message.end()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec == std::errc() && ptr == s.data() + s.size() && !s.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace mcp_adapter
