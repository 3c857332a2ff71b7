#pragma once

#include <mcp_adapter/runtime/server_runtime.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_adapter {

// ---------------------------------------------------------------------------
// ExposedTool: one entry of the published tool spec.
// ---------------------------------------------------------------------------
struct ExposedTool {
    std::string exposed_name;
    std::string qualified_name;
    std::string description;
    nlohmann::json schema;
};

// ---------------------------------------------------------------------------
// ToolRegistry: aggregated catalog of every running server's tools.
//
// Tools are keyed by qualified name ("server:tool"). The published (exposed)
// name is the local name, or "server_local" when several servers share that
// local name; a remaining clash gets a "_2", "_3"... suffix. Unknown names
// yield nullopt. All methods are thread-safe.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Rebuild the catalog from the runtimes' tool maps: runtime order, then
    // discovery order. Also refreshes the exposed-name map.
    void Aggregate(const std::vector<std::shared_ptr<ServerRuntime>>& runtimes);

    // Assign exposed names and return the tools in catalog order.
    [[nodiscard]] std::vector<ExposedTool> BuildExposedSpec();

    [[nodiscard]] std::optional<std::string> Resolve(const std::string& exposed_name) const;
    [[nodiscard]] std::optional<ToolMeta> Lookup(const std::string& qualified_name) const;
    [[nodiscard]] size_t Size() const;

    // [{type:"function", function:{name, description, parameters}}, ...]
    static nlohmann::json ToFunctionSpec(const std::vector<ExposedTool>& tools);

private:
    std::vector<ExposedTool> BuildExposedLocked();

    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, ToolMeta>> tools_;  // qualified -> meta, ordered
    std::map<std::string, size_t> by_qualified_;
    std::map<std::string, std::string> exposed_;           // exposed -> qualified
};

} // namespace mcp_adapter
