#include "tools/eval.hpp"

#include "exec/sequential_executor.hpp"
#include "exec/validators.hpp"

namespace chix::tools {

EvalTool::EvalTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string EvalTool::Description() const {
    return "Evaluate a flake attribute or a Nix expression and return the result as JSON. "
           "Provide `installable`, `expr`, or both; `apply` is a function applied to the result.";
}

std::string EvalTool::ParametersJson() const {
    return R"({"type":"object","properties":{"installable":{"type":"string","description":"Flake installable to evaluate, e.g. '.#packages.x86_64-linux.default.name'."},"expr":{"type":"string","description":"Nix expression to evaluate."},"apply":{"type":"string","description":"Function to apply to the result, e.g. 'builtins.attrNames'."},"flake_dir":{"type":"string","description":"Directory containing the flake. Defaults to the server's working directory."},"head":{"type":"integer","minimum":0,"description":"Keep only the first N lines of output."},"tail":{"type":"integer","minimum":0,"description":"Keep only the last N lines of output."},"max_bytes":{"type":"integer","minimum":0,"description":"Maximum bytes of output to return."}}})";
}

ToolResult EvalTool::Execute(const nlohmann::json& params,
                             const exec::CancellationTokenPtr& cancel) const {
    const auto installable = GetString(params, "installable");
    const auto expr = GetString(params, "expr");
    const auto apply = GetString(params, "apply");
    if (!installable && !expr) {
        throw ToolError(exec::ErrorCode::kInvalidParams,
                        "either 'installable' or 'expr' must be provided");
    }
    if (installable) {
        RequireValid(exec::ValidateReference(*installable));
    }
    if (expr) {
        RequireValid(exec::ValidateExpression(*expr));
    }
    if (apply) {
        RequireValid(exec::ValidateExpression(*apply));
    }
    const auto context = MakeContext(settings_, params, cancel);
    const auto limits = ReadOutputLimits(params, settings_.output_limits);

    std::vector<std::string> nix_args = {"eval", "--json"};
    if (installable) {
        nix_args.push_back(*installable);
    }
    auto command = NixCommand(settings_, std::move(nix_args));
    if (expr) {
        command.AppendVerbatim("--expr");
        command.AppendVerbatim(*expr);
    }
    if (apply) {
        command.AppendVerbatim("--apply");
        command.AppendVerbatim(*apply);
    }

    const auto outcome = exec::SequentialExecutor::RunSingle(command, context);
    return ToolResult::Ok(BuildValueJson(outcome, "value", limits));
}

}  // namespace chix::tools
