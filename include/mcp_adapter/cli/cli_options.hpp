#pragma once

#include <mcp_adapter/core/log.hpp>
#include <mcp_adapter/core/result.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_adapter {

enum class CliCommand {
    Tools,    // print the published tool spec
    Servers,  // print per-server state
    Resolve,  // print the qualified name behind an exposed name
    Call,     // call one tool and print its result
};

struct CliOptions {
    std::string config_path;
    std::optional<LogLevel> log_level;  // falls back to MCP_ADAPTER_LOG, then warn
    bool json_logs = false;
    CliCommand command = CliCommand::Tools;
    std::string tool_name;              // resolve / call
    nlohmann::json arguments = nlohmann::json::object();  // call --args
};

// Parse the mcp-adapter command line. --help and --version are handled by
// argparse (they print and exit).
Result<CliOptions, Error> ParseCliOptions(int argc, const char* const* argv);

} // namespace mcp_adapter
