#include <tool_bridge/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstring>
#include <sstream>

namespace tool_bridge {

Error Error::FromErrno(const std::string& operation,
                       const std::string& server,
                       const std::string& message,
                       int err,
                       ErrorCategory category) {
    return Error{operation, server,
                 message + ": " + std::strerror(err),
                 category, err};
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config:         return 2;
        case ErrorCategory::Cancelled:      return 130;
        case ErrorCategory::Internal:       return 99;
        case ErrorCategory::Spawn:
        case ErrorCategory::Handshake:
        case ErrorCategory::Discovery:
        case ErrorCategory::Protocol:
        case ErrorCategory::Transport:
        case ErrorCategory::Timeout:
        case ErrorCategory::ChannelClosed:
        case ErrorCategory::ForeignContext:
        case ErrorCategory::Teardown:       return 1;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:         return "config";
        case ErrorCategory::Spawn:          return "spawn";
        case ErrorCategory::Handshake:      return "handshake";
        case ErrorCategory::Discovery:      return "discovery";
        case ErrorCategory::Protocol:       return "protocol";
        case ErrorCategory::Transport:      return "transport";
        case ErrorCategory::Timeout:        return "timeout";
        case ErrorCategory::ChannelClosed:  return "channel_closed";
        case ErrorCategory::Cancelled:      return "cancelled";
        case ErrorCategory::ForeignContext: return "foreign_context";
        case ErrorCategory::Teardown:       return "teardown";
        case ErrorCategory::Internal:       return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!server.empty()) {
        oss << " [" << server << "]";
    }
    oss << ": " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!server.empty()) {
        body["server"] = server;
    }
    if (sys_errno.has_value()) {
        body["errno"] = *sys_errno;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace tool_bridge
