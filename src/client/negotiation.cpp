#include <mcp_adapter/client/negotiation.hpp>

namespace mcp_adapter {

namespace {

nlohmann::json InitializeParams(const std::string& name, const std::string& version,
                                const char* protocol_version) {
    nlohmann::json params = {
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", name}, {"version", version}}},
    };
    if (protocol_version != nullptr) {
        params["protocolVersion"] = protocol_version;
    }
    return params;
}

const nlohmann::json* ResultObject(const nlohmann::json& reply) {
    if (!reply.is_object()) return nullptr;
    auto it = reply.find("result");
    if (it == reply.end() || !it->is_object()) return nullptr;
    return &*it;
}

} // anonymous namespace

std::vector<nlohmann::json> DefaultInitializeVariants(const std::string& client_name,
                                                      const std::string& client_version) {
    return {
        InitializeParams(client_name, client_version, nullptr),
        InitializeParams(client_name, client_version, "2024-11-05"),
        InitializeParams(client_name, client_version, "2024-06-01"),
    };
}

std::vector<nlohmann::json> DefaultListToolsVariants() {
    return {
        nullptr,
        nlohmann::json::object(),
        {{"cursor", nullptr}},
        {{"cursor", 0}},
        {{"limit", 100}},
        {{"pageSize", 100}},
    };
}

NegotiationConfig ResolveNegotiation(const std::optional<NegotiationConfig>& configured,
                                     const std::string& client_name,
                                     const std::string& client_version) {
    NegotiationConfig out;
    if (configured.has_value()) {
        out = *configured;
    }
    if (out.initialize_variants.empty()) {
        out.initialize_variants = DefaultInitializeVariants(client_name, client_version);
    }
    if (out.list_tools_variants.empty()) {
        out.list_tools_variants = DefaultListToolsVariants();
    }
    return out;
}

bool AcceptsInitializeReply(const nlohmann::json& reply) {
    return reply.is_object() && !reply.contains("error");
}

std::optional<std::vector<ToolMeta>> ParseToolList(const std::string& server,
                                                   const nlohmann::json& reply) {
    const auto* result = ResultObject(reply);
    if (result == nullptr) return std::nullopt;
    auto tools = result->find("tools");
    if (tools == result->end() || !tools->is_array() || tools->empty()) {
        return std::nullopt;
    }

    std::vector<ToolMeta> out;
    for (const auto& entry : *tools) {
        if (!entry.is_object()) continue;
        auto name = entry.find("name");
        if (name == entry.end() || !name->is_string() || name->get<std::string>().empty()) {
            continue;
        }

        ToolMeta meta;
        meta.server = server;
        meta.local_name = name->get<std::string>();
        auto description = entry.find("description");
        if (description != entry.end() && description->is_string()) {
            meta.description = description->get<std::string>();
        }
        // Older servers publish the schema as "schema".
        auto schema = entry.find("inputSchema");
        if (schema == entry.end() || schema->is_null()) {
            schema = entry.find("schema");
        }
        meta.input_schema = schema != entry.end() ? *schema : nlohmann::json::object();
        out.push_back(std::move(meta));
    }
    return out;
}

std::optional<nlohmann::json> NextCursor(const nlohmann::json& reply) {
    const auto* result = ResultObject(reply);
    if (result == nullptr) return std::nullopt;
    auto it = result->find("nextCursor");
    if (it == result->end() || it->is_null()) return std::nullopt;
    if (it->is_string() && it->get<std::string>().empty()) return std::nullopt;
    return *it;
}

} // namespace mcp_adapter
