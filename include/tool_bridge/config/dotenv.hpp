#pragma once

#include <tool_bridge/core/result.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tool_bridge {

/// Parse .env text: KEY=VALUE lines, optional "export " prefix, '#' comments,
/// single- or double-quoted values. Malformed lines are skipped.
std::map<std::string, std::string> ParseDotEnv(std::string_view text);

/// Load a .env file into the process environment. Existing variables are
/// kept unless `override_existing` is set. Returns the number of variables
/// that were set.
Result<int, Error> LoadDotEnv(const std::string& path, bool override_existing = false);

/// Candidate .env locations, in search order: ./config/.env,
/// ~/.tool-bridge/.env, ./.env.
std::vector<std::string> DefaultDotEnvPaths();

/// Load the first existing file from DefaultDotEnvPaths(). Returns its path,
/// or nullopt if none exists.
std::optional<std::string> LoadDefaultDotEnv();

} // namespace tool_bridge
