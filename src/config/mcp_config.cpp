#include <tool_bridge/config/mcp_config.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace tool_bridge {

namespace {

// ordered_json keeps the servers in the order they were declared.
using OrderedJson = nlohmann::ordered_json;

Error MakeConfigError(const std::string& server, const std::string& message) {
    return Error{"McpConfig", server, message, ErrorCategory::Config, std::nullopt};
}

Result<ServerEntry, Error> ParseServerEntry(const std::string& name,
                                            const OrderedJson& node) {
    using R = Result<ServerEntry, Error>;
    if (!node.is_object()) {
        return R::Err(MakeConfigError(name, "Server entry must be an object"));
    }

    ServerEntry entry;
    entry.name = name;

    if (node.contains("command") && !node["command"].is_null()) {
        if (!node["command"].is_string()) {
            return R::Err(MakeConfigError(name, "'command' must be a string"));
        }
        entry.command = node["command"].get<std::string>();
    }

    if (node.contains("args") && !node["args"].is_null()) {
        const auto& args = node["args"];
        if (!args.is_array()) {
            return R::Err(MakeConfigError(name, "'args' must be an array of strings"));
        }
        for (const auto& arg : args) {
            if (!arg.is_string()) {
                return R::Err(MakeConfigError(name, "'args' must be an array of strings"));
            }
            entry.args.push_back(arg.get<std::string>());
        }
    }

    if (node.contains("env") && !node["env"].is_null()) {
        const auto& env = node["env"];
        if (!env.is_object()) {
            return R::Err(MakeConfigError(name, "'env' must be an object of strings"));
        }
        for (auto it = env.begin(); it != env.end(); ++it) {
            if (!it.value().is_string()) {
                return R::Err(MakeConfigError(
                    name, "env value for '" + it.key() + "' must be a string"));
            }
            entry.env[it.key()] = it.value().get<std::string>();
        }
    }

    if (node.contains("disabled") && !node["disabled"].is_null()) {
        if (!node["disabled"].is_boolean()) {
            return R::Err(MakeConfigError(name, "'disabled' must be a boolean"));
        }
        entry.disabled = node["disabled"].get<bool>();
    }

    return R::Ok(std::move(entry));
}

} // anonymous namespace

Result<McpConfig, Error> ParseMcpConfig(std::string_view text) {
    OrderedJson root;
    try {
        root = OrderedJson::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<McpConfig, Error>::Err(
            MakeConfigError("", "Invalid JSON: " + std::string(e.what())));
    }
    if (!root.is_object()) {
        return Result<McpConfig, Error>::Err(
            MakeConfigError("", "Top level must be an object"));
    }

    McpConfig config;
    if (!root.contains("mcpServers") || root["mcpServers"].is_null()) {
        return Result<McpConfig, Error>::Ok(std::move(config));
    }

    const auto& servers = root["mcpServers"];
    if (!servers.is_object()) {
        return Result<McpConfig, Error>::Err(
            MakeConfigError("", "'mcpServers' must be an object keyed by server name"));
    }

    for (auto it = servers.begin(); it != servers.end(); ++it) {
        auto entry = ParseServerEntry(it.key(), it.value());
        if (entry.IsErr()) {
            config.entry_errors.push_back(std::move(entry).Error());
            continue;
        }
        config.servers.push_back(std::move(entry).Value());
    }

    return Result<McpConfig, Error>::Ok(std::move(config));
}

Result<McpConfig, Error> LoadMcpConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<McpConfig, Error>::Err(
            MakeConfigError("", "Cannot read MCP config '" + path + "'"));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return ParseMcpConfig(contents.str());
}

bool McpConfigExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace tool_bridge
