#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_adapter {

// Outbound framing used when writing to a server's stdin. Inbound decoding
// always accepts both styles.
enum class Framing {
    Newline,
    ContentLength,
};

struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // overrides on top of the inherited environment
    bool enabled = false;
    std::optional<std::string> venv;          // interpreter root for python/python3 commands
    Framing framing = Framing::Newline;
    std::optional<std::chrono::milliseconds> init_timeout;
    std::optional<std::chrono::milliseconds> call_timeout;
};

// Ordered parameter variants tried during negotiation. A null entry means
// "send the request without params".
struct NegotiationConfig {
    std::vector<nlohmann::json> initialize_variants;
    std::vector<nlohmann::json> list_tools_variants;
};

struct AdapterConfig {
    std::vector<ServerConfig> servers;
    std::chrono::milliseconds init_timeout{6000};
    std::chrono::milliseconds request_timeout{5000};
    std::chrono::milliseconds call_timeout{30000};
    std::chrono::milliseconds shutdown_timeout{2000};
    std::string client_name = "mcp-adapter";
    std::string client_version = "0.1.0";
    std::optional<NegotiationConfig> negotiation;  // defaults when unset
};

} // namespace mcp_adapter
