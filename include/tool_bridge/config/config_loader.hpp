#pragma once

#include <tool_bridge/config/app_config.hpp>
#include <tool_bridge/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace tool_bridge {

enum class Command {
    List,  // connect, print the discovered tools, disconnect
    Call,  // connect, invoke one tool, disconnect
};

// ---------------------------------------------------------------------------
// CliInvocation — everything the command line asked for. `config` holds only
// the values given as flags; merge it over the YAML file with MergeConfigs.
// ---------------------------------------------------------------------------
struct CliInvocation {
    Command command = Command::List;
    std::string tool_name;
    std::string tool_args_json = "{}";
    std::optional<std::string> config_file;
    AppConfig config;
};

// Parse a YAML settings file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments.
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields that differ from the defaults in cli_overrides
// replace those in yaml_base. Excluded tool lists are concatenated.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace tool_bridge
