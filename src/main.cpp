#include <tool_bridge/bridge/launcher.hpp>
#include <tool_bridge/bridge/lifecycle_manager.hpp>
#include <tool_bridge/bridge/shutdown.hpp>
#include <tool_bridge/bridge/tool_loader.hpp>
#include <tool_bridge/bridge/tool_registry.hpp>
#include <tool_bridge/cli/bridge_commands.hpp>
#include <tool_bridge/config/config_loader.hpp>
#include <tool_bridge/config/dotenv.hpp>
#include <tool_bridge/core/log.hpp>
#include <tool_bridge/core/version.hpp>

#include <iostream>
#include <set>
#include <string>
#include <string_view>

namespace {

using namespace tool_bridge;

// Check for --version before the command argument, which argparse would
// otherwise require.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "tool-bridge " << kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

bool WantsJson(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

void LoadEnvironmentFile(const AppConfig& config) {
    if (config.env_file.has_value()) {
        auto loaded = LoadDotEnv(*config.env_file);
        if (loaded.IsErr()) {
            LogWarn("config", loaded.Error().ToString());
        } else {
            LogDebug("config", "Loaded " + std::to_string(loaded.Value()) +
                                   " variable(s) from " + *config.env_file);
        }
        return;
    }
    if (auto path = LoadDefaultDotEnv()) {
        LogDebug("config", "Loaded environment from " + *path);
    }
}

LifecycleOptions MakeLifecycleOptions(const AppConfig& config) {
    LifecycleOptions options;
    options.parallel = config.mcp.parallel_connect;
    options.connection.client = ClientInfo{config.client_name, kVersion};
    options.connection.handshake_timeout =
        std::chrono::milliseconds(config.mcp.handshake_timeout_ms);
    if (config.mcp.invoke_timeout_ms > 0) {
        options.connection.invoke_timeout =
            std::chrono::milliseconds(config.mcp.invoke_timeout_ms);
    }
    options.connection.shutdown_grace =
        std::chrono::milliseconds(config.mcp.shutdown_grace_ms);
    return options;
}

int RunBridge(const CliInvocation& invocation, const AppConfig& config) {
    StdioLauncher launcher;
    LifecycleManager manager(launcher, MakeLifecycleOptions(config));

    // Constructed after the manager so it is destroyed (and its thread
    // joined) before the manager disconnects.
    ShutdownWatcher watcher([&manager](int) { manager.DisconnectAll(); });

    ToolRegistry registry;
    if (config.mcp.enabled) {
        registry.RegisterAll(LoadToolsFromConfig(config.mcp.config_path, manager,
                                                 ProcessEnvLookup()));
    } else {
        LogInfo("bridge", "MCP tools disabled by configuration");
    }

    if (!config.mcp.excluded_tools.empty()) {
        const std::set<std::string> excluded(config.mcp.excluded_tools.begin(),
                                             config.mcp.excluded_tools.end());
        const auto removed = registry.ExcludeNames(excluded);
        if (removed > 0) {
            LogInfo("bridge", "Excluded " + std::to_string(removed) + " tool(s) by name");
        }
    }

    if (watcher.Triggered()) {
        return kExitInterrupted;
    }

    int exit_code = kExitSuccess;
    switch (invocation.command) {
        case Command::List:
            exit_code = RunList(registry, std::cout, config.log.json);
            break;
        case Command::Call:
            exit_code = RunCall(registry, invocation.tool_name, invocation.tool_args_json,
                                std::cout, config.log.json);
            break;
    }

    manager.DisconnectAll();
    return watcher.Triggered() ? kExitInterrupted : exit_code;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace tool_bridge;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        PrintError(cli.Error(), WantsJson(argc, argv), std::cerr);
        return cli.Error().ExitCode();
    }
    auto invocation = std::move(cli).Value();

    AppConfig config = invocation.config;
    if (invocation.config_file.has_value()) {
        auto yaml = LoadFromYaml(*invocation.config_file);
        if (yaml.IsErr()) {
            PrintError(yaml.Error(), invocation.config.log.json, std::cerr);
            return yaml.Error().ExitCode();
        }
        config = MergeConfigs(yaml.Value(), invocation.config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error(), config.log.json, std::cerr);
        return valid.Error().ExitCode();
    }

    auto logging = ConfigureLogging(config.log);
    if (logging.IsErr()) {
        PrintError(logging.Error(), config.log.json, std::cerr);
        return logging.Error().ExitCode();
    }

    LoadEnvironmentFile(config);

    try {
        return RunBridge(invocation, config);
    } catch (const std::exception& e) {
        PrintError(Error{"main", "", e.what(), ErrorCategory::Internal, std::nullopt},
                   config.log.json, std::cerr);
        return kExitInternal;
    }
}
