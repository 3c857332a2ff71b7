#pragma once

#include <mcp_adapter/config/adapter_config.hpp>
#include <mcp_adapter/runtime/server_runtime.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_adapter {

// ---------------------------------------------------------------------------
// Negotiation tables. Servers disagree on protocol versions and pagination
// parameters, so handshake and discovery walk an ordered list of parameter
// variants until one is accepted. A null variant sends the request without
// params.
// ---------------------------------------------------------------------------

// initialize: no protocolVersion, then "2024-11-05", then "2024-06-01".
std::vector<nlohmann::json> DefaultInitializeVariants(const std::string& client_name,
                                                      const std::string& client_version);

// tools/list: no params, {}, {"cursor":null}, {"cursor":0}, {"limit":100},
// {"pageSize":100}.
std::vector<nlohmann::json> DefaultListToolsVariants();

// The tables to use: configured ones where given, defaults otherwise.
NegotiationConfig ResolveNegotiation(const std::optional<NegotiationConfig>& configured,
                                     const std::string& client_name,
                                     const std::string& client_version);

// An initialize reply is accepted when it has no "error" member.
bool AcceptsInitializeReply(const nlohmann::json& reply);

// Tools from a tools/list reply, or nullopt when its result carries no
// non-empty "tools" array. Entries without a string name are skipped.
std::optional<std::vector<ToolMeta>> ParseToolList(const std::string& server,
                                                   const nlohmann::json& reply);

// The "nextCursor" of a tools/list reply, when present and not null.
std::optional<nlohmann::json> NextCursor(const nlohmann::json& reply);

} // namespace mcp_adapter
