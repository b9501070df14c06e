#pragma once

#include <string>

#include "tools/nix_command.hpp"
#include "tools/tool.hpp"

namespace chix::tools {

class FlakeShowTool : public Tool {
public:
    explicit FlakeShowTool(NixToolSettings settings);

    std::string Name() const override { return "flake_show"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params,
                       const exec::CancellationTokenPtr& cancel) const override;

private:
    NixToolSettings settings_;
};

class FlakeCheckTool : public Tool {
public:
    explicit FlakeCheckTool(NixToolSettings settings);

    std::string Name() const override { return "flake_check"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params,
                       const exec::CancellationTokenPtr& cancel) const override;

private:
    NixToolSettings settings_;
};

class FlakeMetadataTool : public Tool {
public:
    explicit FlakeMetadataTool(NixToolSettings settings);

    std::string Name() const override { return "flake_metadata"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params,
                       const exec::CancellationTokenPtr& cancel) const override;

private:
    NixToolSettings settings_;
};

class FlakeUpdateTool : public Tool {
public:
    explicit FlakeUpdateTool(NixToolSettings settings);

    std::string Name() const override { return "flake_update"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params,
                       const exec::CancellationTokenPtr& cancel) const override;

private:
    NixToolSettings settings_;
};

class FlakeLockTool : public Tool {
public:
    explicit FlakeLockTool(NixToolSettings settings);

    std::string Name() const override { return "flake_lock"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params,
                       const exec::CancellationTokenPtr& cancel) const override;

private:
    NixToolSettings settings_;
};

class FlakeInitTool : public Tool {
public:
    explicit FlakeInitTool(NixToolSettings settings);

    std::string Name() const override { return "flake_init"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params,
                       const exec::CancellationTokenPtr& cancel) const override;

private:
    NixToolSettings settings_;
};

}  // namespace chix::tools
