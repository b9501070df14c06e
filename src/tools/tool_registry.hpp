#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "tools/tool.hpp"

namespace chix::tools {

struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

// Filled once at startup, then only read; safe to share between worker threads.
class ToolRegistry {
public:
    void Register(std::unique_ptr<Tool> tool);
    const Tool* Get(const std::string& name) const;
    bool Has(const std::string& name) const;
    std::vector<ToolDefinition> GetDefinitions() const;
    ToolResult Execute(const std::string& name,
                       const nlohmann::json& params,
                       const exec::CancellationTokenPtr& cancel) const;

    std::vector<std::string> List() const;

private:
    std::unordered_map<std::string, std::unique_ptr<Tool>> tools_;
};

}  // namespace chix::tools
