#pragma once

#include <tool_bridge/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tool_bridge {
namespace jsonrpc {

constexpr int kMethodNotFound = -32601;

nlohmann::json MakeRequest(int64_t id, const std::string& method,
                           const nlohmann::json& params);

nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params);

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);

nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message);

/// The integer id of a response, if the message is one.
std::optional<int64_t> ResponseId(const nlohmann::json& message);

/// True for requests sent by the server to us (they carry both "method" and
/// "id").
bool IsServerRequest(const nlohmann::json& message);

/// The "result" member of a response, or a Protocol error built from its
/// "error" member.
Result<nlohmann::json, Error> ExtractResult(const nlohmann::json& response,
                                            const std::string& method,
                                            const std::string& server);

} // namespace jsonrpc
} // namespace tool_bridge
