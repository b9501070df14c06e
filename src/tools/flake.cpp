#include "tools/flake.hpp"

#include "exec/sequential_executor.hpp"
#include "exec/validators.hpp"

namespace chix::tools {
namespace {

constexpr const char* kLimitProperties =
    R"("flake_ref":{"type":"string","description":"Flake reference. Defaults to '.'."},)"
    R"("flake_dir":{"type":"string","description":"Directory containing the flake. Defaults to the server's working directory."},)"
    R"("head":{"type":"integer","minimum":0,"description":"Keep only the first N lines of output."},)"
    R"("tail":{"type":"integer","minimum":0,"description":"Keep only the last N lines of output."},)"
    R"("max_bytes":{"type":"integer","minimum":0,"description":"Maximum bytes of output to return."})";

std::string FlakeRef(const nlohmann::json& params) {
    auto flake_ref = GetString(params, "flake_ref").value_or(".");
    RequireValid(exec::ValidateReference(flake_ref));
    return flake_ref;
}

// Input names, possibly nested through follows: "nixpkgs", "home-manager/nixpkgs".
void RequireInputName(const std::string& name) {
    std::size_t begin = 0;
    while (true) {
        const auto slash = name.find('/', begin);
        const auto segment = name.substr(begin, slash == std::string::npos ? std::string::npos : slash - begin);
        const auto verdict = exec::ValidateAttrPath(segment);
        if (!verdict) {
            throw ToolError(verdict.code, "invalid flake input: `" + name + "`");
        }
        if (slash == std::string::npos) {
            return;
        }
        begin = slash + 1;
    }
}

nlohmann::json BuildStreamsJson(const exec::ExecutionOutcome& outcome, const exec::OutputLimits& limits) {
    const auto out = exec::LimitOutput(outcome.stdout_text, limits);
    const auto err = ShapeStream(outcome.stderr_text, limits);

    nlohmann::json json = {
        {"command", outcome.command_display},
        {"success", outcome.succeeded},
        {"stdout", out.content},
        {"stderr", err.content},
        {"exit_code", outcome.exit_code.has_value() ? nlohmann::json(*outcome.exit_code)
                                                    : nlohmann::json(nullptr)}
    };
    AttachTruncation(json, {&err, &out});
    if (outcome.failure) {
        json["error"] = BuildFailureJson(*outcome.failure);
    }
    return json;
}

}  // namespace

FlakeShowTool::FlakeShowTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string FlakeShowTool::Description() const {
    return "List the outputs of a flake as JSON.";
}

std::string FlakeShowTool::ParametersJson() const {
    return std::string(R"({"type":"object","properties":{"all_systems":{"type":"boolean","description":"Show outputs for all systems, not only the current one."},)") +
           kLimitProperties + "}}";
}

ToolResult FlakeShowTool::Execute(const nlohmann::json& params,
                                  const exec::CancellationTokenPtr& cancel) const {
    const auto flake_ref = FlakeRef(params);
    const auto context = MakeContext(settings_, params, cancel);
    const auto limits = ReadOutputLimits(params, settings_.output_limits);

    std::vector<std::string> nix_args = {"flake", "show", "--json"};
    if (GetBool(params, "all_systems").value_or(false)) {
        nix_args.push_back("--all-systems");
    }
    nix_args.push_back(flake_ref);

    const auto outcome = exec::SequentialExecutor::RunSingle(NixCommand(settings_, nix_args), context);
    return ToolResult::Ok(BuildValueJson(outcome, "outputs", limits));
}

FlakeCheckTool::FlakeCheckTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string FlakeCheckTool::Description() const {
    return "Run `nix flake check`. With keep_going (the default) every failing check is reported, "
           "not only the first.";
}

std::string FlakeCheckTool::ParametersJson() const {
    return std::string(R"({"type":"object","properties":{"keep_going":{"type":"boolean","description":"Continue after the first failing check. Defaults to true."},)") +
           kLimitProperties + "}}";
}

ToolResult FlakeCheckTool::Execute(const nlohmann::json& params,
                                   const exec::CancellationTokenPtr& cancel) const {
    const auto flake_ref = FlakeRef(params);
    const auto context = MakeContext(settings_, params, cancel);
    const auto limits = ReadOutputLimits(params, settings_.output_limits);

    std::vector<std::string> nix_args = {"flake", "check"};
    if (GetBool(params, "keep_going").value_or(true)) {
        nix_args.push_back("--keep-going");
    }
    nix_args.push_back(flake_ref);

    const auto outcome = exec::SequentialExecutor::RunSingle(NixCommand(settings_, nix_args), context);
    return ToolResult::Ok(BuildStreamsJson(outcome, limits));
}

FlakeMetadataTool::FlakeMetadataTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string FlakeMetadataTool::Description() const {
    return "Show flake metadata (locked inputs, revisions, paths) as JSON.";
}

std::string FlakeMetadataTool::ParametersJson() const {
    return std::string(R"({"type":"object","properties":{)") + kLimitProperties + "}}";
}

ToolResult FlakeMetadataTool::Execute(const nlohmann::json& params,
                                      const exec::CancellationTokenPtr& cancel) const {
    const auto flake_ref = FlakeRef(params);
    const auto context = MakeContext(settings_, params, cancel);
    const auto limits = ReadOutputLimits(params, settings_.output_limits);

    const auto outcome = exec::SequentialExecutor::RunSingle(
        NixCommand(settings_, {"flake", "metadata", "--json", flake_ref}), context);
    return ToolResult::Ok(BuildValueJson(outcome, "metadata", limits));
}

FlakeUpdateTool::FlakeUpdateTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string FlakeUpdateTool::Description() const {
    return "Update flake.lock. Without inputs every input is updated.";
}

std::string FlakeUpdateTool::ParametersJson() const {
    return std::string(R"({"type":"object","properties":{"inputs":{"type":"array","items":{"type":"string"},"description":"Inputs to update. If empty, updates all inputs."},)") +
           kLimitProperties + "}}";
}

ToolResult FlakeUpdateTool::Execute(const nlohmann::json& params,
                                    const exec::CancellationTokenPtr& cancel) const {
    const auto flake_ref = FlakeRef(params);
    const auto inputs = GetStringArray(params, "inputs").value_or(std::vector<std::string>{});
    for (const auto& input : inputs) {
        RequireInputName(input);
    }
    const auto context = MakeContext(settings_, params, cancel);
    const auto limits = ReadOutputLimits(params, settings_.output_limits);

    std::vector<std::string> nix_args = {"flake", "update"};
    nix_args.insert(nix_args.end(), inputs.begin(), inputs.end());
    nix_args.push_back("--flake");
    nix_args.push_back(flake_ref);

    const auto outcome = exec::SequentialExecutor::RunSingle(NixCommand(settings_, nix_args), context);
    return ToolResult::Ok(BuildStreamsJson(outcome, limits));
}

FlakeLockTool::FlakeLockTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string FlakeLockTool::Description() const {
    return "Lock flake inputs without building, optionally updating or overriding some of them.";
}

std::string FlakeLockTool::ParametersJson() const {
    return std::string(R"({"type":"object","properties":{"update_inputs":{"type":"array","items":{"type":"string"},"description":"Inputs to update while locking."},"override_inputs":{"type":"object","additionalProperties":{"type":"string"},"description":"Map of input name to the flake reference that replaces it."},)") +
           kLimitProperties + "}}";
}

ToolResult FlakeLockTool::Execute(const nlohmann::json& params,
                                  const exec::CancellationTokenPtr& cancel) const {
    const auto flake_ref = FlakeRef(params);
    std::vector<std::string> nix_args = {"flake", "lock"};
    for (const auto& input : GetStringArray(params, "update_inputs").value_or(std::vector<std::string>{})) {
        RequireInputName(input);
        nix_args.push_back("--update-input");
        nix_args.push_back(input);
    }
    if (params.contains("override_inputs") && !params["override_inputs"].is_null()) {
        const auto& overrides = params["override_inputs"];
        if (!overrides.is_object()) {
            throw ToolError(exec::ErrorCode::kInvalidParams,
                            "parameter 'override_inputs' must be an object of strings");
        }
        for (auto it = overrides.begin(); it != overrides.end(); ++it) {
            if (!it.value().is_string()) {
                throw ToolError(exec::ErrorCode::kInvalidParams,
                                "parameter 'override_inputs' must be an object of strings");
            }
            const auto replacement = it.value().get<std::string>();
            RequireInputName(it.key());
            RequireValid(exec::ValidateReference(replacement));
            nix_args.push_back("--override-input");
            nix_args.push_back(it.key());
            nix_args.push_back(replacement);
        }
    }
    nix_args.push_back(flake_ref);
    const auto context = MakeContext(settings_, params, cancel);
    const auto limits = ReadOutputLimits(params, settings_.output_limits);

    const auto outcome = exec::SequentialExecutor::RunSingle(NixCommand(settings_, nix_args), context);
    return ToolResult::Ok(BuildStreamsJson(outcome, limits));
}

FlakeInitTool::FlakeInitTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string FlakeInitTool::Description() const {
    return "Create a flake in flake_dir from a template (the default template when none is given).";
}

std::string FlakeInitTool::ParametersJson() const {
    return R"({"type":"object","properties":{"template":{"type":"string","description":"Template flake reference, e.g. 'templates#rust'."},"flake_dir":{"type":"string","description":"Directory to initialize. Defaults to the server's working directory."}}})";
}

ToolResult FlakeInitTool::Execute(const nlohmann::json& params,
                                  const exec::CancellationTokenPtr& cancel) const {
    std::vector<std::string> nix_args = {"flake", "init"};
    if (const auto templ = GetString(params, "template")) {
        RequireValid(exec::ValidateReference(*templ));
        nix_args.push_back("--template");
        nix_args.push_back(*templ);
    }
    const auto context = MakeContext(settings_, params, cancel);
    const auto limits = ReadOutputLimits(params, settings_.output_limits);

    const auto outcome = exec::SequentialExecutor::RunSingle(NixCommand(settings_, nix_args), context);
    return ToolResult::Ok(BuildStreamsJson(outcome, limits));
}

}  // namespace chix::tools
