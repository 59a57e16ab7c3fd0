#pragma once

#include <tool_bridge/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tool_bridge {

// ---------------------------------------------------------------------------
// ServerEntry — one server as written in the MCP configuration file, before
// validation and env resolution.
// ---------------------------------------------------------------------------
struct ServerEntry {
    std::string name;
    std::optional<std::string> command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool disabled = false;
};

// ---------------------------------------------------------------------------
// ServerSpec — validated launch specification for one tool server.
// ---------------------------------------------------------------------------
struct ServerSpec {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled = true;
};

// Looks a variable up in the ambient environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// EnvLookup over the real process environment.
EnvLookup ProcessEnvLookup();

/// EnvLookup over a fixed map (tests, embedding).
EnvLookup MapEnvLookup(std::map<std::string, std::string> vars);

/// True for values that ask to be filled from the ambient environment:
/// empty, or starting with "YOUR_" or "your-".
[[nodiscard]] bool IsPlaceholderValue(std::string_view value);

/// Resolve placeholder values against `ambient`. A placeholder is replaced
/// only when the ambient variable exists and is non-empty; otherwise the
/// configured value is kept as is. Literal values are never looked up.
std::map<std::string, std::string> ResolveEnv(
    const std::map<std::string, std::string>& env, const EnvLookup& ambient);

/// Turn a configuration entry into a ServerSpec. Fails with a Config error
/// when the command is missing or empty. Disabled entries resolve to a spec
/// with enabled=false.
Result<ServerSpec, Error> ResolveServerSpec(const ServerEntry& entry,
                                            const EnvLookup& ambient);

} // namespace tool_bridge
