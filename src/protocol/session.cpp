#include <tool_bridge/protocol/session.hpp>

#include <tool_bridge/core/log.hpp>

namespace tool_bridge {

namespace {

// A JSON-RPC error from the server during connect is reported in the terms of
// the phase it happened in. Transport-level categories pass through.
Error ForPhase(Error error, ErrorCategory phase) {
    if (error.category == ErrorCategory::Protocol) {
        error.category = phase;
    }
    return error;
}

nlohmann::json DefaultInputSchema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

std::string StringMember(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Initialize
// ---------------------------------------------------------------------------
Result<ServerInfo, Error> Initialize(IChannel& channel,
                                     const ClientInfo& client,
                                     const std::string& server,
                                     std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<ServerInfo, Error>;

    nlohmann::json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", client.name}, {"version", client.version}}}
    };

    auto response = channel.Request("initialize", params, timeout);
    if (response.IsErr()) {
        return R::Err(ForPhase(std::move(response).Error(), ErrorCategory::Handshake));
    }

    const auto& result = response.Value();
    if (!result.is_object()) {
        return R::Err(Error{"initialize", server,
                            "Initialize result is not an object",
                            ErrorCategory::Handshake, std::nullopt});
    }

    ServerInfo info;
    info.protocol_version = StringMember(result, "protocolVersion");
    auto server_info = result.find("serverInfo");
    if (server_info != result.end() && server_info->is_object()) {
        info.name = StringMember(*server_info, "name");
        info.version = StringMember(*server_info, "version");
    }
    auto caps = result.find("capabilities");
    if (caps != result.end() && caps->is_object()) {
        info.capabilities = *caps;
    }

    auto notified = channel.Notify("notifications/initialized", nlohmann::json::object());
    if (notified.IsErr()) {
        return R::Err(ForPhase(std::move(notified).Error(), ErrorCategory::Handshake));
    }

    LogDebug("connection", "[" + server + "] initialized: " + info.name + " " +
                               info.version + " (protocol " + info.protocol_version + ")");
    return R::Ok(std::move(info));
}

// ---------------------------------------------------------------------------
// ListTools
// ---------------------------------------------------------------------------
Result<ToolDescriptor, Error> ParseToolDescriptor(const nlohmann::json& raw,
                                                  const std::string& server) {
    using R = Result<ToolDescriptor, Error>;
    if (!raw.is_object()) {
        return R::Err(Error{"tools/list", server, "Tool entry is not an object",
                            ErrorCategory::Discovery, std::nullopt});
    }
    ToolDescriptor tool;
    tool.name = StringMember(raw, "name");
    if (tool.name.empty()) {
        return R::Err(Error{"tools/list", server, "Tool entry has no name",
                            ErrorCategory::Discovery, std::nullopt});
    }
    tool.description = StringMember(raw, "description");

    auto schema = raw.find("inputSchema");
    if (schema == raw.end() || schema->is_null()) {
        tool.input_schema = DefaultInputSchema();
    } else if (schema->is_object()) {
        tool.input_schema = *schema;
    } else {
        return R::Err(Error{"tools/list", server,
                            "Tool '" + tool.name + "' has a non-object inputSchema",
                            ErrorCategory::Discovery, std::nullopt});
    }
    return R::Ok(std::move(tool));
}

Result<std::vector<ToolDescriptor>, Error> ListTools(
    IChannel& channel,
    const std::string& server,
    std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<std::vector<ToolDescriptor>, Error>;

    std::vector<ToolDescriptor> tools;
    std::optional<std::string> cursor;

    for (int page = 0; page < kMaxToolPages; ++page) {
        nlohmann::json params = nlohmann::json::object();
        if (cursor.has_value()) {
            params["cursor"] = *cursor;
        }

        auto response = channel.Request("tools/list", params, timeout);
        if (response.IsErr()) {
            return R::Err(ForPhase(std::move(response).Error(), ErrorCategory::Discovery));
        }

        const auto& result = response.Value();
        if (!result.is_object() || !result.contains("tools") ||
            !result["tools"].is_array()) {
            return R::Err(Error{"tools/list", server,
                                "Malformed tools/list result: missing 'tools' array",
                                ErrorCategory::Discovery, std::nullopt});
        }

        for (const auto& raw : result["tools"]) {
            auto tool = ParseToolDescriptor(raw, server);
            if (tool.IsErr()) {
                return R::Err(std::move(tool).Error());
            }
            tools.push_back(std::move(tool).Value());
        }

        auto next = result.find("nextCursor");
        if (next == result.end() || !next->is_string() ||
            next->get<std::string>().empty()) {
            return R::Ok(std::move(tools));
        }
        cursor = next->get<std::string>();
    }

    return R::Err(Error{"tools/list", server,
                        "Too many tools/list pages (limit " +
                            std::to_string(kMaxToolPages) + ")",
                        ErrorCategory::Discovery, std::nullopt});
}

// ---------------------------------------------------------------------------
// CallTool
// ---------------------------------------------------------------------------
Result<CallToolResult, Error> CallTool(IChannel& channel,
                                       const std::string& server,
                                       const std::string& tool_name,
                                       const nlohmann::json& arguments,
                                       std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<CallToolResult, Error>;

    nlohmann::json params = {
        {"name", tool_name},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };

    auto response = channel.Request("tools/call", params, timeout);
    if (response.IsErr()) {
        return R::Err(std::move(response).Error());
    }

    const auto& result = response.Value();
    if (!result.is_object()) {
        return R::Err(Error{"tools/call", server, "tools/call result is not an object",
                            ErrorCategory::Protocol, std::nullopt});
    }

    CallToolResult call;
    auto content = result.find("content");
    if (content != result.end() && content->is_array()) {
        for (const auto& item : *content) {
            call.content.push_back(ParseContentFragment(item));
        }
    }
    auto is_error = result.find("isError");
    call.is_error = is_error != result.end() && is_error->is_boolean() &&
                    is_error->get<bool>();
    return R::Ok(std::move(call));
}

} // namespace tool_bridge
