#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tool_bridge {

// ---------------------------------------------------------------------------
// InvocationResult — outcome of one tool call as seen by the agent runtime.
// ---------------------------------------------------------------------------
struct InvocationResult {
    bool ok = false;
    std::string content;
    std::optional<std::string> error_message;

    static InvocationResult Success(std::string content) {
        return InvocationResult{true, std::move(content), std::nullopt};
    }

    static InvocationResult Failure(std::string error_message,
                                    std::string content = "") {
        return InvocationResult{false, std::move(content), std::move(error_message)};
    }
};

// ---------------------------------------------------------------------------
// ITool — uniform call signature for local and remote tools.
// ---------------------------------------------------------------------------
class ITool {
public:
    virtual ~ITool() = default;

    [[nodiscard]] virtual const std::string& Name() const = 0;
    [[nodiscard]] virtual const std::string& Description() const = 0;
    [[nodiscard]] virtual const nlohmann::json& ParametersSchema() const = 0;

    /// Never throws for expected failures; they come back with ok=false.
    virtual InvocationResult Invoke(const nlohmann::json& arguments) = 0;
};

} // namespace tool_bridge
