#include <mcp_adapter/mcp/tool_registry.hpp>

#include <mcp_adapter/core/log.hpp>
#include <mcp_adapter/core/types.hpp>

#include <set>

namespace mcp_adapter {

void ToolRegistry::Aggregate(const std::vector<std::shared_ptr<ServerRuntime>>& runtimes) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_.clear();
    by_qualified_.clear();

    for (const auto& runtime : runtimes) {
        if (!runtime) continue;
        for (auto& tool : runtime->Tools()) {
            auto qualified = QualifiedName::Of(runtime->Name(), tool.local_name).Value();
            if (by_qualified_.count(qualified) > 0) {
                LogWarn("registry", "Duplicate tool '" + qualified + "' ignored");
                continue;
            }
            by_qualified_.emplace(qualified, tools_.size());
            tools_.emplace_back(std::move(qualified), std::move(tool));
        }
    }
    BuildExposedLocked();
    LogInfo("registry", "Aggregated " + std::to_string(tools_.size()) + " tools from " +
                        std::to_string(runtimes.size()) + " servers");
}

std::vector<ExposedTool> ToolRegistry::BuildExposedSpec() {
    std::lock_guard<std::mutex> lock(mutex_);
    return BuildExposedLocked();
}

std::vector<ExposedTool> ToolRegistry::BuildExposedLocked() {
    std::map<std::string, int> local_counts;
    for (const auto& [qualified, meta] : tools_) {
        ++local_counts[meta.local_name];
    }

    std::vector<ExposedTool> out;
    std::set<std::string> taken;
    exposed_.clear();
    for (const auto& [qualified, meta] : tools_) {
        std::string base = local_counts[meta.local_name] > 1
                               ? meta.server + "_" + meta.local_name
                               : meta.local_name;
        std::string name = base;
        for (int n = 2; taken.count(name) > 0; ++n) {
            name = base + "_" + std::to_string(n);
        }
        if (name != base) {
            LogDebug("registry", "Exposed name '" + base + "' clashes; using '" + name + "'");
        }
        taken.insert(name);
        exposed_.emplace(name, qualified);
        out.push_back({name, qualified, meta.description, meta.input_schema});
    }
    return out;
}

std::optional<std::string> ToolRegistry::Resolve(const std::string& exposed_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = exposed_.find(exposed_name);
    if (it == exposed_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ToolMeta> ToolRegistry::Lookup(const std::string& qualified_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_qualified_.find(qualified_name);
    if (it == by_qualified_.end()) {
        return std::nullopt;
    }
    return tools_[it->second].second;
}

size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

nlohmann::json ToolRegistry::ToFunctionSpec(const std::vector<ExposedTool>& tools) {
    auto spec = nlohmann::json::array();
    for (const auto& tool : tools) {
        nlohmann::json parameters = tool.schema;
        if (!parameters.is_object() || parameters.empty()) {
            parameters = {{"type", "object"}, {"properties", nlohmann::json::object()}};
        }
        spec.push_back({
            {"type", "function"},
            {"function", {
                {"name", tool.exposed_name},
                {"description", tool.description},
                {"parameters", parameters},
            }},
        });
    }
    return spec;
}

} // namespace mcp_adapter
