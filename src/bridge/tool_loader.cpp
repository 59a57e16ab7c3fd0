#include <tool_bridge/bridge/tool_loader.hpp>

#include <tool_bridge/core/log.hpp>

namespace tool_bridge {

namespace {

constexpr size_t kDescriptionPreview = 60;

void LogConnectedServers(const LifecycleManager& manager) {
    for (const auto& connection : manager.Connections()) {
        const auto tools = connection->Tools();
        LogInfo("loader", "Connected to MCP server '" + connection->Name() +
                              "' - loaded " + std::to_string(tools.size()) + " tools");
        for (const auto& tool : tools) {
            auto preview = tool->Description();
            if (preview.size() > kDescriptionPreview) {
                preview = preview.substr(0, kDescriptionPreview) + "...";
            }
            LogInfo("loader", "  - " + tool->Name() + ": " + preview);
        }
    }
}

} // anonymous namespace

std::vector<ServerSpec> ResolveServerSpecs(const McpConfig& config,
                                           const EnvLookup& ambient) {
    std::vector<ServerSpec> specs;
    for (const auto& entry : config.servers) {
        if (entry.disabled) {
            LogInfo("loader", "Skipping disabled server: " + entry.name);
            continue;
        }
        auto spec = ResolveServerSpec(entry, ambient);
        if (spec.IsErr()) {
            LogWarn("loader", spec.Error().message + ": " + entry.name);
            continue;
        }
        specs.push_back(std::move(spec).Value());
    }
    return specs;
}

std::vector<std::shared_ptr<RemoteTool>> LoadToolsFromConfig(
    const std::string& path,
    LifecycleManager& manager,
    const EnvLookup& ambient) {
    if (!McpConfigExists(path)) {
        LogWarn("loader", "MCP config not found: " + path);
        return {};
    }

    auto config = LoadMcpConfig(path);
    if (config.IsErr()) {
        LogError("loader", "Error loading MCP config: " + config.Error().ToString());
        return {};
    }

    for (const auto& error : config.Value().entry_errors) {
        LogWarn("loader", error.ToString());
    }

    if (config.Value().servers.empty()) {
        LogWarn("loader", "No MCP servers configured");
        return {};
    }

    auto specs = ResolveServerSpecs(config.Value(), ambient);
    auto tools = manager.ConnectAll(specs);

    LogConnectedServers(manager);
    LogInfo("loader", "Total MCP tools loaded: " + std::to_string(tools.size()));
    return tools;
}

} // namespace tool_bridge
