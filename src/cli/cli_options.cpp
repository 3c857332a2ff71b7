#include <mcp_adapter/cli/cli_options.hpp>

#include <mcp_adapter/core/version.hpp>

#include <argparse/argparse.hpp>

namespace mcp_adapter {

namespace {

Error MakeCliError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "CLI", "", message);
}

} // anonymous namespace

Result<CliOptions, Error> ParseCliOptions(int argc, const char* const* argv) {
    using R = Result<CliOptions, Error>;

    argparse::ArgumentParser program("mcp-adapter", kVersion);
    program.add_description("Run MCP tool servers and expose their tools.");
    program.add_argument("-c", "--config")
        .help("Path to the servers YAML file")
        .required();
    program.add_argument("--log-level")
        .help("debug, info, warn or error (default: $MCP_ADAPTER_LOG or warn)");
    program.add_argument("--json-logs")
        .help("Write log lines as JSON")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser tools_command("tools");
    tools_command.add_description("Print the published tool spec");

    argparse::ArgumentParser servers_command("servers");
    servers_command.add_description("Print the state of every configured server");

    argparse::ArgumentParser resolve_command("resolve");
    resolve_command.add_description("Print the qualified name behind an exposed tool name");
    resolve_command.add_argument("name")
        .help("Exposed tool name");

    argparse::ArgumentParser call_command("call");
    call_command.add_description("Call a tool and print its result");
    call_command.add_argument("name")
        .help("Exposed or qualified (server:tool) name");
    call_command.add_argument("--args")
        .help("Tool arguments as a JSON object")
        .default_value(std::string("{}"));

    program.add_subparser(tools_command);
    program.add_subparser(servers_command);
    program.add_subparser(resolve_command);
    program.add_subparser(call_command);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return R::Err(MakeCliError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;
    options.config_path = program.get<std::string>("--config");
    options.json_logs = program.get<bool>("--json-logs");
    if (auto level = program.present("--log-level")) {
        auto parsed = ParseLogLevel(*level);
        if (!parsed.has_value()) {
            return R::Err(MakeCliError("Invalid --log-level: " + *level));
        }
        options.log_level = *parsed;
    }

    if (program.is_subcommand_used(tools_command)) {
        options.command = CliCommand::Tools;
    } else if (program.is_subcommand_used(servers_command)) {
        options.command = CliCommand::Servers;
    } else if (program.is_subcommand_used(resolve_command)) {
        options.command = CliCommand::Resolve;
        options.tool_name = resolve_command.get<std::string>("name");
    } else if (program.is_subcommand_used(call_command)) {
        options.command = CliCommand::Call;
        options.tool_name = call_command.get<std::string>("name");
        auto text = call_command.get<std::string>("--args");
        auto arguments = nlohmann::json::parse(text, nullptr, false);
        if (arguments.is_discarded() || !arguments.is_object()) {
            return R::Err(MakeCliError("--args must be a JSON object"));
        }
        options.arguments = std::move(arguments);
    } else {
        return R::Err(MakeCliError("Missing command: tools, servers, resolve or call"));
    }

    return R::Ok(std::move(options));
}

} // namespace mcp_adapter
