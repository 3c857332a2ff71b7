#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_adapter {

// ---------------------------------------------------------------------------
// ToolMeta: one tool as discovered from a server. Immutable after discovery.
// ---------------------------------------------------------------------------
struct ToolMeta {
    std::string server;
    std::string local_name;
    std::string description;
    nlohmann::json input_schema;

    bool operator==(const ToolMeta& other) const {
        return server == other.server && local_name == other.local_name &&
               description == other.description && input_schema == other.input_schema;
    }
};

// ---------------------------------------------------------------------------
// ServerRuntime: the state of one running server that caller threads may
// observe. The event loop writes it; callers read it.
//
// `ready` and `stopping` are set at most once. The tool map is replaced as a
// whole under an exclusive lock and read under a shared one.
// ---------------------------------------------------------------------------
class ServerRuntime {
public:
    explicit ServerRuntime(std::string name);

    ServerRuntime(const ServerRuntime&) = delete;
    ServerRuntime& operator=(const ServerRuntime&) = delete;

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    // Return true only for the call that actually set the flag.
    bool MarkReady();
    bool MarkStopping();

    [[nodiscard]] bool IsReady() const noexcept { return ready_.load(); }
    [[nodiscard]] bool IsStopping() const noexcept { return stopping_.load(); }
    // Ready and not stopping: tool calls may be dispatched.
    [[nodiscard]] bool IsActive() const noexcept { return IsReady() && !IsStopping(); }

    // Replace the tool map. Duplicate local names keep the first entry.
    void SetTools(std::vector<ToolMeta> tools);
    [[nodiscard]] std::vector<ToolMeta> Tools() const;
    [[nodiscard]] std::optional<ToolMeta> FindTool(const std::string& local_name) const;
    [[nodiscard]] size_t ToolCount() const;

    void SetServerInfo(nlohmann::json info);
    [[nodiscard]] nlohmann::json ServerInfo() const;

    // Settled: handshake and discovery finished, successfully or not.
    void MarkSettled();
    [[nodiscard]] bool IsSettled() const;
    bool WaitSettledUntil(std::chrono::steady_clock::time_point deadline) const;

private:
    const std::string name_;
    std::atomic<bool> ready_{false};
    std::atomic<bool> stopping_{false};

    mutable std::shared_mutex tools_mutex_;
    std::vector<ToolMeta> tools_;
    std::map<std::string, size_t> tool_index_;
    nlohmann::json server_info_;

    mutable std::mutex settle_mutex_;
    mutable std::condition_variable settle_cv_;
    bool settled_ = false;
};

} // namespace mcp_adapter
