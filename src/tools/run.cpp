#include "tools/run.hpp"

#include "exec/sequential_executor.hpp"
#include "exec/validators.hpp"

namespace chix::tools {

RunTool::RunTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string RunTool::Description() const {
    return "Run a flake app. Use this tool over running `nix run` directly: it validates inputs, "
           "passes arguments without a shell and bounds the process lifetime.";
}

std::string RunTool::ParametersJson() const {
    return R"({"type":"object","properties":{"installable":{"type":"string","description":"Flake installable to run. Defaults to '.#default'."},"args":{"type":"array","items":{"type":"string"},"description":"Arguments to pass to the app."},"flake_dir":{"type":"string","description":"Directory containing the flake. Defaults to the server's working directory."}}})";
}

ToolResult RunTool::Execute(const nlohmann::json& params,
                            const exec::CancellationTokenPtr& cancel) const {
    const auto installable = GetString(params, "installable").value_or(".#default");
    RequireValid(exec::ValidateReference(installable));
    const auto context = MakeContext(settings_, params, cancel);
    const auto args = GetStringArray(params, "args").value_or(std::vector<std::string>{});
    RequireValid(exec::ValidateArguments(args));

    std::vector<std::string> nix_args = {"run", installable};
    if (!args.empty()) {
        nix_args.push_back("--");
        nix_args.insert(nix_args.end(), args.begin(), args.end());
    }

    const auto outcome = exec::SequentialExecutor::RunSingle(NixCommand(settings_, nix_args), context);
    return ToolResult::Ok(BuildOutcomeJson(outcome));
}

DevelopRunTool::DevelopRunTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string DevelopRunTool::Description() const {
    return "Run commands inside a flake's devShell. Use this tool over running `nix develop -c` "
           "directly. Use `flake_dir` to set the working directory instead of `cd`. Use separate "
           "entries in `commands` instead of shell operators like `&&`; execution stops at the "
           "first failing command. Shell metacharacters are not allowed in commands or arguments.";
}

std::string DevelopRunTool::ParametersJson() const {
    return R"({"type":"object","properties":{"flake_ref":{"type":"string","description":"Flake reference. Defaults to '.'."},"commands":{"type":"array","minItems":1,"items":{"type":"object","properties":{"command":{"type":"string","description":"Command to run in the devShell."},"args":{"type":"array","items":{"type":"string"},"description":"Arguments to pass to the command."}},"required":["command"]},"description":"Commands to run sequentially. Execution stops on the first failure (like && in a shell). Each command runs as a separate `nix develop -c` invocation."},"flake_dir":{"type":"string","description":"Directory containing the flake. Defaults to the server's working directory."}},"required":["commands"]})";
}

ToolResult DevelopRunTool::Execute(const nlohmann::json& params,
                                   const exec::CancellationTokenPtr& cancel) const {
    const auto flake_ref = GetString(params, "flake_ref").value_or(".");
    RequireValid(exec::ValidateReference(flake_ref));
    const auto context = MakeContext(settings_, params, cancel);

    if (!params.contains("commands") || !params["commands"].is_array()) {
        throw ToolError(exec::ErrorCode::kInvalidParams, "parameter 'commands' must be an array");
    }
    const auto& entries = params["commands"];
    if (entries.empty()) {
        throw ToolError(exec::ErrorCode::kInvalidParams, "commands array must not be empty");
    }

    std::vector<exec::CommandSpec> commands;
    std::vector<std::string> displays;
    for (const auto& entry : entries) {
        const auto command = GetString(entry, "command");
        if (!command || command->empty()) {
            throw ToolError(exec::ErrorCode::kInvalidParams, "each commands entry needs a 'command'");
        }
        const auto args = GetStringArray(entry, "args").value_or(std::vector<std::string>{});
        std::vector<std::string> nix_args = {"develop", flake_ref, "-c", *command};
        nix_args.insert(nix_args.end(), args.begin(), args.end());
        commands.push_back(NixCommand(settings_, std::move(nix_args)));
        displays.push_back(exec::CommandSpec(*command, args).Display());
    }

    auto result = exec::SequentialExecutor::Run(commands, context);
    // Report what the caller asked for, not the nix develop wrapper.
    for (std::size_t i = 0; i < result.outcomes.size(); ++i) {
        result.outcomes[i].command_display = displays[i];
    }
    return ToolResult::Ok(BuildSequenceJson(result));
}

}  // namespace chix::tools
