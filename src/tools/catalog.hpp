#pragma once

#include "tools/nix_command.hpp"
#include "tools/tool_registry.hpp"

namespace chix::tools {

// Registers every Nix tool the server exposes.
void RegisterNixTools(ToolRegistry& registry, const NixToolSettings& settings);

}  // namespace chix::tools
