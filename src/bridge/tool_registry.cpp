#include <tool_bridge/bridge/tool_registry.hpp>

#include <algorithm>

namespace tool_bridge {

FunctionTool::FunctionTool(std::string name, std::string description,
                           nlohmann::json parameters_schema, ToolHandler handler)
    : name_(std::move(name)),
      description_(std::move(description)),
      schema_(std::move(parameters_schema)),
      handler_(std::move(handler)) {}

InvocationResult FunctionTool::Invoke(const nlohmann::json& arguments) {
    return handler_(arguments);
}

void ToolRegistry::Register(std::shared_ptr<ITool> tool) {
    if (tool) {
        tools_.push_back(std::move(tool));
    }
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& parameters_schema,
                            ToolHandler handler) {
    tools_.push_back(std::make_shared<FunctionTool>(name, description,
                                                    parameters_schema,
                                                    std::move(handler)));
}

std::shared_ptr<ITool> ToolRegistry::Find(const std::string& name) const {
    auto it = std::find_if(tools_.begin(), tools_.end(),
                           [&](const auto& tool) { return tool->Name() == name; });
    return it == tools_.end() ? nullptr : *it;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return Find(name) != nullptr;
}

InvocationResult ToolRegistry::Execute(const std::string& name,
                                       const nlohmann::json& arguments) const {
    auto tool = Find(name);
    if (!tool) {
        return InvocationResult::Failure("Unknown tool: " + name);
    }

    try {
        return tool->Invoke(arguments);
    } catch (const std::exception& e) {
        return InvocationResult::Failure(std::string("Tool error: ") + e.what());
    }
}

size_t ToolRegistry::ExcludeNames(const std::set<std::string>& names) {
    const auto before = tools_.size();
    tools_.erase(std::remove_if(tools_.begin(), tools_.end(),
                                [&](const auto& tool) {
                                    return names.count(tool->Name()) > 0;
                                }),
                 tools_.end());
    return before - tools_.size();
}

} // namespace tool_bridge
