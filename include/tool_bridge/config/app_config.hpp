#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tool_bridge {

enum class ColorMode {
    Auto,
    Always,
    Never,
};

struct McpSettings {
    bool enabled = true;
    std::string config_path = "mcp.json";
    bool parallel_connect = false;
    int handshake_timeout_ms = 30000;
    int invoke_timeout_ms = 0;  // 0: no bound on tool invocations
    int shutdown_grace_ms = 2000;
    std::vector<std::string> excluded_tools;
};

struct LogSettings {
    std::string level = "info";
    bool json = false;
    std::optional<std::string> file;
    ColorMode color = ColorMode::Auto;
    bool verbose = false;
    bool quiet = false;
};

struct AppConfig {
    McpSettings mcp;
    LogSettings log;
    std::optional<std::string> env_file;  // unset: search the default locations
    std::string client_name = "tool-bridge";
};

} // namespace tool_bridge
