#include "tools/tool_registry.hpp"

#include <algorithm>

#include "utils/logging.hpp"

namespace chix::tools {

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_.emplace(std::move(name), std::move(tool));
}

const Tool* ToolRegistry::Get(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDefinition> defs;
    for (const auto& name : List()) {
        const auto& tool = tools_.at(name);
        ToolDefinition def{};
        def.name = name;
        def.description = tool->Description();
        def.parameters_json = tool->ParametersJson();
        defs.push_back(def);
    }
    return defs;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& params,
                                 const exec::CancellationTokenPtr& cancel) const {
    auto tool = Get(name);
    if (!tool) {
        return ToolResult::Error({exec::ErrorCode::kInvalidParams, "Unknown tool: " + name});
    }
    utils::LogInfo("tool", "start", {{"name", name}, {"params", params.dump()}});
    ToolResult result{};
    try {
        result = tool->Execute(params, cancel);
    } catch (const ToolError& ex) {
        result = ToolResult::Error(ex.GetFailure());
    } catch (const nlohmann::json::exception& ex) {
        result = ToolResult::Error({exec::ErrorCode::kInvalidParams, ex.what()});
    }
    utils::LogInfo("tool", "end", {
        {"name", name},
        {"error", result.is_error ? "true" : "false"}});
    return result;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace chix::tools
