#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_adapter {

// ---------------------------------------------------------------------------
// FrameDecoder: turns the byte stream read from a server's stdout into
// discrete JSON messages.
//
// Two framings are accepted on the same stream:
//   Content-Length: <n>\r\n\r\n<n bytes>       (header block)
//   {"jsonrpc":"2.0",...}\n                    (one object per line)
// Lines that are neither are diagnostic noise and are dropped. Malformed
// frames are counted and skipped; decoding always continues. A
// Content-Length above the maximum frame size is malformed.
// ---------------------------------------------------------------------------
class FrameDecoder {
public:
    static constexpr size_t kDefaultMaxFrameSize = 32 * 1024 * 1024;

    explicit FrameDecoder(size_t max_frame_size = kDefaultMaxFrameSize)
        : max_frame_size_(max_frame_size) {}

    // Append raw bytes; returns every message completed by them, in order.
    std::vector<nlohmann::json> Feed(std::string_view bytes);

    // Bytes received but not yet part of a complete frame.
    [[nodiscard]] size_t Buffered() const noexcept { return buffer_.size(); }

    [[nodiscard]] uint64_t MalformedFrameCount() const noexcept { return malformed_; }
    [[nodiscard]] uint64_t NoiseLineCount() const noexcept { return noise_; }

private:
    enum class State {
        Line,       // waiting for a header or a JSON line
        Separator,  // header seen, waiting for the blank line
        Body,       // reading body_remaining_ bytes
    };

    void HandleLine(std::string_view line, std::vector<nlohmann::json>& out);
    void HandleBody(std::string_view body, std::vector<nlohmann::json>& out);

    size_t max_frame_size_;
    std::string buffer_;
    State state_ = State::Line;
    size_t body_length_ = 0;
    uint64_t malformed_ = 0;
    uint64_t noise_ = 0;
};

// Compact JSON followed by a single '\n'.
std::string EncodeLine(const nlohmann::json& message);

// "Content-Length: <n>\r\n\r\n" followed by the compact JSON body.
std::string EncodeFramed(const nlohmann::json& message);

// Parse the value of a "Content-Length:" header line. Returns nullopt if the
// line is not such a header or the length is not a non-negative integer.
std::optional<size_t> ParseContentLength(std::string_view line);

// -- Message builders --------------------------------------------------------

nlohmann::json MakeRequest(int64_t id, const std::string& method,
                           const nlohmann::json& params);
nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params = nullptr);
nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeErrorReply(const nlohmann::json& id, int code,
                              const std::string& message);

// -- Message classification -------------------------------------------------

// Has an id and a result or error, and no method.
bool IsResponse(const nlohmann::json& message);
// Has a method and no id.
bool IsNotification(const nlohmann::json& message);
// Has a method and an id (server-to-client request, e.g. "ping").
bool IsServerRequest(const nlohmann::json& message);

// Integer request id of a response, if it has one. Numeric strings are
// accepted because some servers echo ids back as strings.
std::optional<int64_t> ResponseId(const nlohmann::json& message);

} // namespace mcp_adapter
