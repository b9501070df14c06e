#pragma once

#include <string>

#include "tools/nix_command.hpp"
#include "tools/tool.hpp"

namespace chix::tools {

// Hash of a path's NAR serialization.
class HashPathTool : public Tool {
public:
    explicit HashPathTool(NixToolSettings settings);

    std::string Name() const override { return "hash_path"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params,
                       const exec::CancellationTokenPtr& cancel) const override;

private:
    NixToolSettings settings_;
};

// Flat hash of a regular file's contents.
class HashFileTool : public Tool {
public:
    explicit HashFileTool(NixToolSettings settings);

    std::string Name() const override { return "hash_file"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params,
                       const exec::CancellationTokenPtr& cancel) const override;

private:
    NixToolSettings settings_;
};

}  // namespace chix::tools
