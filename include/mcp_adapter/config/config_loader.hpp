#pragma once

#include <mcp_adapter/config/adapter_config.hpp>
#include <mcp_adapter/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_adapter {

// Parse a YAML config file into an AdapterConfig.
Result<AdapterConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse YAML text (same schema as LoadFromYaml).
Result<AdapterConfig, Error> LoadFromYamlString(std::string_view yaml_text);

// Validate names, commands, timeouts and framing.
Result<void, Error> ValidateConfig(const AdapterConfig& config);

// Resolve the interpreter for python/python3 commands.
// Precedence: MCP_PYTHON (if it exists) > server venv > MCP_VENV > command.
// Other commands are returned unchanged.
std::string ResolveCommand(const ServerConfig& server);

} // namespace mcp_adapter
