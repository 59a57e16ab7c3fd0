#include <tool_bridge/protocol/json_rpc.hpp>

namespace tool_bridge {
namespace jsonrpc {

nlohmann::json MakeRequest(int64_t id, const std::string& method,
                           const nlohmann::json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };
}

nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };
}

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

std::optional<int64_t> ResponseId(const nlohmann::json& message) {
    if (!message.is_object() || message.contains("method")) {
        return std::nullopt;
    }
    auto it = message.find("id");
    if (it == message.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<int64_t>();
}

bool IsServerRequest(const nlohmann::json& message) {
    return message.is_object() && message.contains("method") &&
           message.contains("id");
}

Result<nlohmann::json, Error> ExtractResult(const nlohmann::json& response,
                                            const std::string& method,
                                            const std::string& server) {
    if (response.contains("error")) {
        const auto& error = response["error"];
        std::string message = error.dump();
        if (error.is_object() && error.contains("message") &&
            error["message"].is_string()) {
            message = error["message"].get<std::string>();
        }
        if (error.is_object() && error.contains("code")) {
            message += " (code " + error["code"].dump() + ")";
        }
        return Result<nlohmann::json, Error>::Err(Error{
            method, server, "Server returned error: " + message,
            ErrorCategory::Protocol, std::nullopt});
    }
    if (!response.contains("result")) {
        return Result<nlohmann::json, Error>::Err(Error{
            method, server, "Response has neither result nor error",
            ErrorCategory::Protocol, std::nullopt});
    }
    return Result<nlohmann::json, Error>::Ok(response["result"]);
}

} // namespace jsonrpc
} // namespace tool_bridge
