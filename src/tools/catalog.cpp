#include "tools/catalog.hpp"

#include <memory>

#include "tools/build.hpp"
#include "tools/derivation.hpp"
#include "tools/eval.hpp"
#include "tools/flake.hpp"
#include "tools/hash.hpp"
#include "tools/log.hpp"
#include "tools/run.hpp"
#include "tools/search.hpp"

namespace chix::tools {

void RegisterNixTools(ToolRegistry& registry, const NixToolSettings& settings) {
    registry.Register(std::make_unique<RunTool>(settings));
    registry.Register(std::make_unique<DevelopRunTool>(settings));
    registry.Register(std::make_unique<BuildTool>(settings));
    registry.Register(std::make_unique<EvalTool>(settings));
    registry.Register(std::make_unique<FlakeShowTool>(settings));
    registry.Register(std::make_unique<FlakeCheckTool>(settings));
    registry.Register(std::make_unique<FlakeMetadataTool>(settings));
    registry.Register(std::make_unique<FlakeUpdateTool>(settings));
    registry.Register(std::make_unique<FlakeLockTool>(settings));
    registry.Register(std::make_unique<FlakeInitTool>(settings));
    registry.Register(std::make_unique<LogTool>(settings));
    registry.Register(std::make_unique<SearchTool>(settings));
    registry.Register(std::make_unique<HashPathTool>(settings));
    registry.Register(std::make_unique<HashFileTool>(settings));
    registry.Register(std::make_unique<DerivationShowTool>(settings));
}

}  // namespace chix::tools
