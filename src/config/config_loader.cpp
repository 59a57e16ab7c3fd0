#include <tool_bridge/config/config_loader.hpp>

#include <tool_bridge/core/log.hpp>
#include <tool_bridge/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace tool_bridge {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", message, ErrorCategory::Config, std::nullopt};
}

Result<ColorMode, Error> ParseColorMode(const std::string& text) {
    if (text == "auto") return Result<ColorMode, Error>::Ok(ColorMode::Auto);
    if (text == "always") return Result<ColorMode, Error>::Ok(ColorMode::Always);
    if (text == "never") return Result<ColorMode, Error>::Ok(ColorMode::Never);
    return Result<ColorMode, Error>::Err(
        MakeConfigError("Invalid log.color '" + text + "' (expected auto, always or never)"));
}

Result<Command, Error> ParseCommand(const std::string& text) {
    if (text == "list") return Result<Command, Error>::Ok(Command::List);
    if (text == "call") return Result<Command, Error>::Ok(Command::Call);
    return Result<Command, Error>::Err(
        MakeConfigError("Unknown command '" + text + "' (expected list or call)"));
}

Result<void, Error> ParseMcpSection(const YAML::Node& node, McpSettings& mcp) {
    if (node["enabled"]) {
        mcp.enabled = node["enabled"].as<bool>();
    }
    if (node["config_path"]) {
        mcp.config_path = node["config_path"].as<std::string>();
    }
    if (node["parallel_connect"]) {
        mcp.parallel_connect = node["parallel_connect"].as<bool>();
    }
    if (node["handshake_timeout_ms"]) {
        mcp.handshake_timeout_ms = node["handshake_timeout_ms"].as<int>();
    }
    if (node["invoke_timeout_ms"]) {
        mcp.invoke_timeout_ms = node["invoke_timeout_ms"].as<int>();
    }
    if (node["shutdown_grace_ms"]) {
        mcp.shutdown_grace_ms = node["shutdown_grace_ms"].as<int>();
    }
    if (node["excluded_tools"]) {
        if (!node["excluded_tools"].IsSequence()) {
            return Result<void, Error>::Err(
                MakeConfigError("mcp.excluded_tools must be a list"));
        }
        for (const auto& name : node["excluded_tools"]) {
            mcp.excluded_tools.push_back(name.as<std::string>());
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ParseLogSection(const YAML::Node& node, LogSettings& log) {
    if (node["level"]) {
        log.level = node["level"].as<std::string>();
    }
    if (node["json"]) {
        log.json = node["json"].as<bool>();
    }
    if (node["file"]) {
        log.file = node["file"].as<std::string>();
    }
    if (node["color"]) {
        auto color = ParseColorMode(node["color"].as<std::string>());
        if (color.IsErr()) {
            return Result<void, Error>::Err(std::move(color).Error());
        }
        log.color = color.Value();
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (!root.IsDefined() || root.IsNull()) {
            return Result<AppConfig, Error>::Ok(std::move(config));
        }
        if (!root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Settings file must contain a mapping"));
        }

        if (root["mcp"]) {
            auto parsed = ParseMcpSection(root["mcp"], config.mcp);
            if (parsed.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(parsed).Error());
            }
        }
        if (root["log"]) {
            auto parsed = ParseLogSection(root["log"], config.log);
            if (parsed.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(parsed).Error());
            }
        }
        if (root["env_file"]) {
            config.env_file = root["env_file"].as<std::string>();
        }
        if (root["client_name"]) {
            config.client_name = root["client_name"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("tool-bridge", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("command")
        .help("list | call");
    program.add_argument("tool")
        .help("Tool name (call only)")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string(""));

    program.add_argument("--args")
        .help("Tool arguments as a JSON object (call only)")
        .default_value(std::string("{}"));

    program.add_argument("-c", "--config")
        .help("Path to YAML settings file");
    program.add_argument("--mcp-config")
        .help("Path to the MCP server configuration (JSON)");
    program.add_argument("--env-file")
        .help("Path to a .env file loaded before env resolution");
    program.add_argument("--parallel")
        .help("Connect to servers concurrently")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--handshake-timeout")
        .help("Handshake and discovery timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--invoke-timeout")
        .help("Tool invocation timeout in milliseconds (0: none)")
        .scan<'i', int>();
    program.add_argument("--exclude")
        .help("Drop remote tools with this name (repeatable)")
        .default_value(std::vector<std::string>{})
        .append();

    program.add_argument("--json")
        .help("JSON log lines and JSON tool listing")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Also write log lines to this file");
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Errors only")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliInvocation, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliInvocation invocation;

    auto command = ParseCommand(program.get<std::string>("command"));
    if (command.IsErr()) {
        return Result<CliInvocation, Error>::Err(std::move(command).Error());
    }
    invocation.command = command.Value();
    invocation.tool_name = program.get<std::string>("tool");
    invocation.tool_args_json = program.get<std::string>("--args");

    if (invocation.command == Command::Call && invocation.tool_name.empty()) {
        return Result<CliInvocation, Error>::Err(
            MakeConfigError("'call' needs a tool name"));
    }
    if (!nlohmann::json::accept(invocation.tool_args_json)) {
        return Result<CliInvocation, Error>::Err(
            MakeConfigError("--args is not valid JSON"));
    }

    if (auto val = program.present("--config")) {
        invocation.config_file = *val;
    }

    auto& config = invocation.config;
    if (auto val = program.present("--mcp-config")) {
        config.mcp.config_path = *val;
    }
    if (auto val = program.present("--env-file")) {
        config.env_file = *val;
    }
    if (program.get<bool>("--parallel")) {
        config.mcp.parallel_connect = true;
    }
    if (auto val = program.present<int>("--handshake-timeout")) {
        config.mcp.handshake_timeout_ms = *val;
    }
    if (auto val = program.present<int>("--invoke-timeout")) {
        config.mcp.invoke_timeout_ms = *val;
    }
    config.mcp.excluded_tools = program.get<std::vector<std::string>>("--exclude");

    if (program.get<bool>("--json")) {
        config.log.json = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log.file = *val;
    }
    if (program.get<bool>("--verbose")) {
        config.log.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.log.quiet = true;
    }
    if (program.get<bool>("--color")) {
        config.log.color = ColorMode::Always;
    }
    if (program.get<bool>("--no-color")) {
        config.log.color = ColorMode::Never;
    }

    return Result<CliInvocation, Error>::Ok(std::move(invocation));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    const auto& cli_mcp = cli_overrides.mcp;
    if (cli_mcp.config_path != defaults.mcp.config_path) {
        merged.mcp.config_path = cli_mcp.config_path;
    }
    if (cli_mcp.parallel_connect) {
        merged.mcp.parallel_connect = true;
    }
    if (cli_mcp.handshake_timeout_ms != defaults.mcp.handshake_timeout_ms) {
        merged.mcp.handshake_timeout_ms = cli_mcp.handshake_timeout_ms;
    }
    if (cli_mcp.invoke_timeout_ms != defaults.mcp.invoke_timeout_ms) {
        merged.mcp.invoke_timeout_ms = cli_mcp.invoke_timeout_ms;
    }
    for (const auto& name : cli_mcp.excluded_tools) {
        if (std::find(merged.mcp.excluded_tools.begin(),
                      merged.mcp.excluded_tools.end(),
                      name) == merged.mcp.excluded_tools.end()) {
            merged.mcp.excluded_tools.push_back(name);
        }
    }

    if (cli_overrides.env_file.has_value()) {
        merged.env_file = cli_overrides.env_file;
    }

    const auto& cli_log = cli_overrides.log;
    if (cli_log.json) {
        merged.log.json = true;
    }
    if (cli_log.file.has_value()) {
        merged.log.file = cli_log.file;
    }
    if (cli_log.verbose) {
        merged.log.verbose = true;
    }
    if (cli_log.quiet) {
        merged.log.quiet = true;
    }
    if (cli_log.color != ColorMode::Auto) {
        merged.log.color = cli_log.color;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.mcp.enabled && config.mcp.config_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError("mcp.config_path is empty"));
    }
    if (config.mcp.handshake_timeout_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Handshake timeout must be positive, got " +
                            std::to_string(config.mcp.handshake_timeout_ms)));
    }
    if (config.mcp.invoke_timeout_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Invoke timeout must not be negative, got " +
                            std::to_string(config.mcp.invoke_timeout_ms)));
    }
    if (config.mcp.shutdown_grace_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Shutdown grace period must not be negative, got " +
                            std::to_string(config.mcp.shutdown_grace_ms)));
    }
    auto level = ParseLogLevel(config.log.level);
    if (level.IsErr()) {
        return Result<void, Error>::Err(std::move(level).Error());
    }
    if (config.log.verbose && config.log.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace tool_bridge
