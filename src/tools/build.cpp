#include "tools/build.hpp"

#include "exec/sequential_executor.hpp"
#include "exec/validators.hpp"

namespace chix::tools {

BuildTool::BuildTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string BuildTool::Description() const {
    return "Build a flake output and return its store paths. The build log is bounded; "
           "use `log_tail` to keep only the last lines of a failing build.";
}

std::string BuildTool::ParametersJson() const {
    return R"({"type":"object","properties":{"installable":{"type":"string","description":"Flake installable to build. Defaults to '.#default'."},"print_build_logs":{"type":"boolean","description":"Pass -L to nix build. Defaults to true."},"flake_dir":{"type":"string","description":"Directory containing the flake. Defaults to the server's working directory."},"max_log_bytes":{"type":"integer","minimum":0,"description":"Maximum bytes of build log to return."},"log_tail":{"type":"integer","minimum":0,"description":"Return only the last N lines of the build log."}}})";
}

ToolResult BuildTool::Execute(const nlohmann::json& params,
                              const exec::CancellationTokenPtr& cancel) const {
    const auto installable = GetString(params, "installable").value_or(".#default");
    RequireValid(exec::ValidateReference(installable));
    const auto context = MakeContext(settings_, params, cancel);

    std::vector<std::string> nix_args = {"build", "--json", "--print-out-paths"};
    if (GetBool(params, "print_build_logs").value_or(true)) {
        nix_args.push_back("-L");
    }
    nix_args.push_back(installable);

    exec::OutputLimits log_limits{};
    log_limits.tail = GetSize(params, "log_tail");
    log_limits.max_bytes = GetSize(params, "max_log_bytes");

    const auto outcome = exec::SequentialExecutor::RunSingle(NixCommand(settings_, nix_args), context);
    const auto log = ShapeStream(outcome.stderr_text, log_limits);

    nlohmann::json json = {
        {"command", outcome.command_display},
        {"success", outcome.succeeded},
        {"store_paths", outcome.succeeded ? ParseStorePaths(outcome.stdout_text)
                                          : std::vector<std::string>{}},
        {"stderr", log.content},
        {"exit_code", outcome.exit_code.has_value() ? nlohmann::json(*outcome.exit_code)
                                                    : nlohmann::json(nullptr)}
    };
    AttachTruncation(json, {&log});
    if (outcome.failure) {
        json["error"] = BuildFailureJson(*outcome.failure);
    }
    return ToolResult::Ok(std::move(json));
}

}  // namespace chix::tools
