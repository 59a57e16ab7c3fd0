#pragma once

#include <tool_bridge/bridge/i_tool.hpp>

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tool_bridge {

// A local tool handler takes the JSON arguments and returns the result.
using ToolHandler = std::function<InvocationResult(const nlohmann::json& arguments)>;

// ITool over a plain function, for tools implemented inside the runtime.
class FunctionTool : public ITool {
public:
    FunctionTool(std::string name, std::string description,
                 nlohmann::json parameters_schema, ToolHandler handler);

    [[nodiscard]] const std::string& Name() const override { return name_; }
    [[nodiscard]] const std::string& Description() const override { return description_; }
    [[nodiscard]] const nlohmann::json& ParametersSchema() const override {
        return schema_;
    }

    InvocationResult Invoke(const nlohmann::json& arguments) override;

private:
    std::string name_;
    std::string description_;
    nlohmann::json schema_;
    ToolHandler handler_;
};

// ---------------------------------------------------------------------------
// ToolRegistry — the tool set handed to the agent runtime.
//
// Keeps registration order. Names are not deduplicated; Find() returns the
// first tool registered under a name, so local tools registered before the
// remote ones take precedence.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(std::shared_ptr<ITool> tool);

    template <typename ToolPtr>
    void RegisterAll(const std::vector<ToolPtr>& tools) {
        for (const auto& tool : tools) {
            Register(tool);
        }
    }

    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& parameters_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<std::shared_ptr<ITool>>& Tools() const noexcept {
        return tools_;
    }

    [[nodiscard]] std::shared_ptr<ITool> Find(const std::string& name) const;

    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Invoke a tool by name. Unknown names and exceptions escaping the tool
    /// become failed results.
    [[nodiscard]] InvocationResult Execute(const std::string& name,
                                           const nlohmann::json& arguments) const;

    /// Drop every tool whose name is in `names`. Returns how many were
    /// removed.
    size_t ExcludeNames(const std::set<std::string>& names);

private:
    std::vector<std::shared_ptr<ITool>> tools_;
};

} // namespace tool_bridge
