#include <mcp_adapter/runtime/server_runtime.hpp>

#include <mcp_adapter/core/log.hpp>

namespace mcp_adapter {

ServerRuntime::ServerRuntime(std::string name) : name_(std::move(name)) {}

bool ServerRuntime::MarkReady() {
    bool expected = false;
    return ready_.compare_exchange_strong(expected, true);
}

bool ServerRuntime::MarkStopping() {
    bool expected = false;
    return stopping_.compare_exchange_strong(expected, true);
}

void ServerRuntime::SetTools(std::vector<ToolMeta> tools) {
    std::vector<ToolMeta> unique;
    std::map<std::string, size_t> index;
    unique.reserve(tools.size());
    for (auto& tool : tools) {
        if (index.count(tool.local_name) > 0) {
            LogWarn("runtime", "Server '" + name_ + "' listed tool '" +
                               tool.local_name + "' twice; keeping the first");
            continue;
        }
        index.emplace(tool.local_name, unique.size());
        unique.push_back(std::move(tool));
    }

    std::unique_lock<std::shared_mutex> lock(tools_mutex_);
    tools_ = std::move(unique);
    tool_index_ = std::move(index);
}

std::vector<ToolMeta> ServerRuntime::Tools() const {
    std::shared_lock<std::shared_mutex> lock(tools_mutex_);
    return tools_;
}

std::optional<ToolMeta> ServerRuntime::FindTool(const std::string& local_name) const {
    std::shared_lock<std::shared_mutex> lock(tools_mutex_);
    auto it = tool_index_.find(local_name);
    if (it == tool_index_.end()) {
        return std::nullopt;
    }
    return tools_[it->second];
}

size_t ServerRuntime::ToolCount() const {
    std::shared_lock<std::shared_mutex> lock(tools_mutex_);
    return tools_.size();
}

void ServerRuntime::SetServerInfo(nlohmann::json info) {
    std::unique_lock<std::shared_mutex> lock(tools_mutex_);
    server_info_ = std::move(info);
}

nlohmann::json ServerRuntime::ServerInfo() const {
    std::shared_lock<std::shared_mutex> lock(tools_mutex_);
    return server_info_;
}

void ServerRuntime::MarkSettled() {
    {
        std::lock_guard<std::mutex> lock(settle_mutex_);
        settled_ = true;
    }
    settle_cv_.notify_all();
}

bool ServerRuntime::IsSettled() const {
    std::lock_guard<std::mutex> lock(settle_mutex_);
    return settled_;
}

bool ServerRuntime::WaitSettledUntil(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(settle_mutex_);
    return settle_cv_.wait_until(lock, deadline, [this] { return settled_; });
}

} // namespace mcp_adapter
