#pragma once

#include <tool_bridge/bridge/tool_registry.hpp>
#include <tool_bridge/config/app_config.hpp>
#include <tool_bridge/core/log.hpp>
#include <tool_bridge/core/result.hpp>

#include <memory>
#include <ostream>
#include <string>

namespace tool_bridge {

// Exit codes of the tool-bridge executable.
constexpr int kExitSuccess = 0;
constexpr int kExitToolFailed = 1;
constexpr int kExitConfig = 2;
constexpr int kExitInterrupted = 130;
constexpr int kExitInternal = 99;

/// Log level after applying --verbose / --quiet over log.level.
Result<LogLevel, Error> EffectiveLogLevel(const LogSettings& settings);

/// Whether console log lines are colored: explicit mode, else NO_COLOR and
/// whether stderr is a terminal.
bool ResolveLogColor(ColorMode mode);

/// Build the log sink described by `settings` (console or JSON lines on
/// stderr, optionally teed into a file).
Result<std::unique_ptr<ILogSink>, Error> MakeLogSink(const LogSettings& settings);

/// Install the global logger from `settings`.
Result<void, Error> ConfigureLogging(const LogSettings& settings);

// ---------------------------------------------------------------------------
// Commands. Both write their result to `out` and return the exit code.
// ---------------------------------------------------------------------------

/// `list`: one "name: description" line per tool, or a JSON array of
/// {name, description, inputSchema} objects.
int RunList(const ToolRegistry& registry, std::ostream& out, bool json);

/// `call`: invoke `tool_name` with the JSON object in `args_json`.
int RunCall(const ToolRegistry& registry,
            const std::string& tool_name,
            const std::string& args_json,
            std::ostream& out,
            bool json);

void PrintError(const Error& error, bool json, std::ostream& err);

} // namespace tool_bridge
