#include <mcp_adapter/cli/cli_options.hpp>
#include <mcp_adapter/config/config_loader.hpp>
#include <mcp_adapter/core/log.hpp>
#include <mcp_adapter/mcp/adapter.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

void PrintError(const mcp_adapter::Error& error) {
    std::cerr << error.ToString() << "\n";
}

nlohmann::json StatusToJson(const mcp_adapter::ServerStatus& status) {
    nlohmann::json j = {
        {"name", status.name},
        {"state", status.state},
        {"ready", status.ready},
        {"tools", status.tool_count},
    };
    if (status.pid > 0) {
        j["pid"] = status.pid;
    }
    return j;
}

int RunCommand(mcp_adapter::Adapter& adapter, const mcp_adapter::CliOptions& options) {
    using namespace mcp_adapter;

    switch (options.command) {
        case CliCommand::Tools:
            std::cout << adapter.BuildToolSpecs().dump(2) << "\n";
            return kExitSuccess;

        case CliCommand::Servers: {
            auto out = nlohmann::json::array();
            for (const auto& status : adapter.ServerStates()) {
                out.push_back(StatusToJson(status));
            }
            std::cout << out.dump(2) << "\n";
            return kExitSuccess;
        }

        case CliCommand::Resolve: {
            auto qualified = adapter.Resolve(options.tool_name);
            if (!qualified.has_value()) {
                auto error = Error::Make(ErrorCategory::UnknownTool, "resolve", "",
                                         "unknown tool '" + options.tool_name + "'");
                PrintError(error);
                return error.ExitCode();
            }
            std::cout << *qualified << "\n";
            return kExitSuccess;
        }

        case CliCommand::Call: {
            auto result = adapter.CallTool(options.tool_name, options.arguments);
            if (result.IsErr()) {
                std::cout << result.Error().ToJson().dump(2) << "\n";
                return result.Error().ExitCode();
            }
            const auto& value = result.Value();
            std::cout << (value.is_string() ? value.get<std::string>() : value.dump(2)) << "\n";
            return kExitSuccess;
        }
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace mcp_adapter;

    auto parsed = ParseCliOptions(argc, argv);
    if (parsed.IsErr()) {
        PrintError(parsed.Error());
        return parsed.Error().ExitCode();
    }
    auto options = std::move(parsed).Value();

    auto level = options.log_level.value_or(LogLevelFromEnv(LogLevel::Warn));
    if (options.json_logs) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(std::cerr), level);
    }

    auto loaded = LoadFromYaml(options.config_path);
    if (loaded.IsErr()) {
        PrintError(loaded.Error());
        return loaded.Error().ExitCode();
    }
    auto config = std::move(loaded).Value();
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    Adapter adapter(std::move(config));
    auto started = adapter.Start();
    if (started.IsErr()) {
        PrintError(started.Error());
        return started.Error().ExitCode();
    }

    int rc = RunCommand(adapter, options);
    adapter.Shutdown();
    return rc;
}
