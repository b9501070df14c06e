#pragma once

#include <string>

#include "tools/nix_command.hpp"
#include "tools/tool.hpp"

namespace chix::tools {

class DerivationShowTool : public Tool {
public:
    explicit DerivationShowTool(NixToolSettings settings);

    std::string Name() const override { return "derivation_show"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& params,
                       const exec::CancellationTokenPtr& cancel) const override;

private:
    NixToolSettings settings_;
};

}  // namespace chix::tools
