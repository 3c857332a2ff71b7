#include <mcp_adapter/config/config_loader.hpp>

#include <mcp_adapter/core/types.hpp>

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <set>

namespace mcp_adapter {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", "", message);
}

// Convert a YAML node into JSON. Plain scalars are typed (null, bool, int,
// float); quoted scalars always stay strings.
nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(YamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Scalar:
            break;
    }

    const auto& text = node.Scalar();
    if (node.Tag() == "!") {
        return text;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        return b;
    }
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) {
        return i;
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) {
        return d;
    }
    return text;
}

// Timeouts are written in (possibly fractional) seconds.
Result<std::chrono::milliseconds, Error> ParseSeconds(const YAML::Node& node,
                                                      const std::string& key) {
    double seconds = 0.0;
    try {
        seconds = node.as<double>();
    } catch (const YAML::Exception&) {
        return Result<std::chrono::milliseconds, Error>::Err(
            MakeConfigError("'" + key + "' must be a number of seconds"));
    }
    return Result<std::chrono::milliseconds, Error>::Ok(
        std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0))));
}

Result<Framing, Error> ParseFraming(const std::string& text) {
    if (text == "newline" || text == "jsonl") {
        return Result<Framing, Error>::Ok(Framing::Newline);
    }
    if (text == "content-length" || text == "content_length") {
        return Result<Framing, Error>::Ok(Framing::ContentLength);
    }
    return Result<Framing, Error>::Err(
        MakeConfigError("Unknown framing '" + text +
                        "' (expected 'newline' or 'content-length')"));
}

Result<ServerConfig, Error> ParseYamlServer(const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Server entry must be a mapping"));
    }
    if (!node["name"]) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Server entry missing 'name' field"));
    }
    if (!node["command"]) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Server '" + node["name"].as<std::string>() +
                            "' missing 'command' field"));
    }

    ServerConfig server;
    server.name = node["name"].as<std::string>();
    server.command = node["command"].as<std::string>();

    if (node["args"]) {
        for (const auto& arg : node["args"]) {
            server.args.push_back(arg.as<std::string>());
        }
    }
    if (node["env"] && node["env"].IsMap()) {
        for (const auto& kv : node["env"]) {
            server.env[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (node["enabled"]) {
        server.enabled = node["enabled"].as<bool>();
    }
    if (node["venv"]) {
        server.venv = node["venv"].as<std::string>();
    }
    if (node["framing"]) {
        auto framing = ParseFraming(node["framing"].as<std::string>());
        if (framing.IsErr()) {
            return Result<ServerConfig, Error>::Err(framing.Error());
        }
        server.framing = framing.Value();
    }
    if (node["init_timeout"]) {
        auto t = ParseSeconds(node["init_timeout"], "init_timeout");
        if (t.IsErr()) return Result<ServerConfig, Error>::Err(t.Error());
        server.init_timeout = t.Value();
    }
    if (node["call_timeout"]) {
        auto t = ParseSeconds(node["call_timeout"], "call_timeout");
        if (t.IsErr()) return Result<ServerConfig, Error>::Err(t.Error());
        server.call_timeout = t.Value();
    }
    return Result<ServerConfig, Error>::Ok(std::move(server));
}

Result<std::vector<nlohmann::json>, Error> ParseVariantList(const YAML::Node& node,
                                                           const std::string& key) {
    if (!node.IsSequence() || node.size() == 0) {
        return Result<std::vector<nlohmann::json>, Error>::Err(
            MakeConfigError("'" + key + "' must be a non-empty list"));
    }
    std::vector<nlohmann::json> variants;
    for (const auto& item : node) {
        auto value = YamlToJson(item);
        if (!value.is_null() && !value.is_object()) {
            return Result<std::vector<nlohmann::json>, Error>::Err(
                MakeConfigError("Entries of '" + key + "' must be mappings or null"));
        }
        variants.push_back(std::move(value));
    }
    return Result<std::vector<nlohmann::json>, Error>::Ok(std::move(variants));
}

Result<AdapterConfig, Error> ParseRoot(const YAML::Node& root) {
    AdapterConfig config;
    if (!root || root.IsNull()) {
        return Result<AdapterConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AdapterConfig, Error>::Err(
            MakeConfigError("Config root must be a mapping"));
    }

    // -- Servers --
    if (root["servers"]) {
        for (const auto& server_node : root["servers"]) {
            auto server = ParseYamlServer(server_node);
            if (server.IsErr()) {
                return Result<AdapterConfig, Error>::Err(std::move(server).Error());
            }
            config.servers.push_back(std::move(server).Value());
        }
    }

    // -- Timeouts --
    struct TimeoutKey {
        const char* key;
        std::chrono::milliseconds* target;
    };
    const TimeoutKey timeout_keys[] = {
        {"init_timeout", &config.init_timeout},
        {"request_timeout", &config.request_timeout},
        {"call_timeout", &config.call_timeout},
        {"shutdown_timeout", &config.shutdown_timeout},
    };
    for (const auto& tk : timeout_keys) {
        if (root[tk.key]) {
            auto t = ParseSeconds(root[tk.key], tk.key);
            if (t.IsErr()) return Result<AdapterConfig, Error>::Err(t.Error());
            *tk.target = t.Value();
        }
    }

    // -- Client identity --
    if (root["client_name"]) {
        config.client_name = root["client_name"].as<std::string>();
    }
    if (root["client_version"]) {
        config.client_version = root["client_version"].as<std::string>();
    }

    // -- Negotiation tables --
    if (root["initialize_variants"] || root["list_tools_variants"]) {
        NegotiationConfig negotiation;
        if (root["initialize_variants"]) {
            auto v = ParseVariantList(root["initialize_variants"], "initialize_variants");
            if (v.IsErr()) return Result<AdapterConfig, Error>::Err(v.Error());
            negotiation.initialize_variants = std::move(v).Value();
        }
        if (root["list_tools_variants"]) {
            auto v = ParseVariantList(root["list_tools_variants"], "list_tools_variants");
            if (v.IsErr()) return Result<AdapterConfig, Error>::Err(v.Error());
            negotiation.list_tools_variants = std::move(v).Value();
        }
        config.negotiation = std::move(negotiation);
    }

    return Result<AdapterConfig, Error>::Ok(std::move(config));
}

std::optional<std::string> VenvPython(const std::string& root) {
    if (root.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    auto candidate = std::filesystem::path(root) / "bin" / "python";
    if (std::filesystem::exists(candidate, ec)) {
        return candidate.string();
    }
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AdapterConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
        return ParseRoot(root);
    } catch (const YAML::Exception& e) {
        return Result<AdapterConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
}

Result<AdapterConfig, Error> LoadFromYamlString(std::string_view yaml_text) {
    try {
        return ParseRoot(YAML::Load(std::string(yaml_text)));
    } catch (const YAML::Exception& e) {
        return Result<AdapterConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AdapterConfig& config) {
    std::set<std::string> seen;
    for (const auto& server : config.servers) {
        auto name = ServerName::Create(server.name);
        if (name.IsErr()) {
            return Result<void, Error>::Err(MakeConfigError(name.Error()));
        }
        if (!seen.insert(server.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate server name: " + server.name));
        }
        if (server.command.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Server '" + server.name + "' has an empty command"));
        }
        if (server.init_timeout && server.init_timeout->count() <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError("Server '" + server.name + "': init_timeout must be positive"));
        }
        if (server.call_timeout && server.call_timeout->count() <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError("Server '" + server.name + "': call_timeout must be positive"));
        }
    }
    if (config.init_timeout.count() <= 0 || config.request_timeout.count() <= 0 ||
        config.call_timeout.count() <= 0 || config.shutdown_timeout.count() <= 0) {
        return Result<void, Error>::Err(MakeConfigError("Timeouts must be positive"));
    }
    if (config.negotiation) {
        if (config.negotiation->initialize_variants.empty() &&
            config.negotiation->list_tools_variants.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Negotiation override has no variants"));
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveCommand
// ---------------------------------------------------------------------------
std::string ResolveCommand(const ServerConfig& server) {
    if (server.command != "python" && server.command != "python3") {
        return server.command;
    }

    if (const char* global_python = std::getenv("MCP_PYTHON")) {
        std::error_code ec;
        if (std::filesystem::exists(global_python, ec)) {
            return global_python;
        }
    }
    if (server.venv) {
        if (auto python = VenvPython(*server.venv)) {
            return *python;
        }
        return server.command;
    }
    if (const char* global_venv = std::getenv("MCP_VENV")) {
        if (auto python = VenvPython(global_venv)) {
            return *python;
        }
    }
    return server.command;
}

} // namespace mcp_adapter
