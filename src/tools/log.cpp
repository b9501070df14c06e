#include "tools/log.hpp"

#include "exec/sequential_executor.hpp"
#include "exec/validators.hpp"

namespace chix::tools {

LogTool::LogTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string LogTool::Description() const {
    return "Show the build log of a derivation or store path. Without head or tail only the "
           "last lines are returned.";
}

std::string LogTool::ParametersJson() const {
    return R"({"type":"object","properties":{"installable":{"type":"string","description":"Installable or store path whose build log to show."},"head":{"type":"integer","minimum":0,"description":"Keep only the first N lines of the log."},"tail":{"type":"integer","minimum":0,"description":"Keep only the last N lines of the log."},"max_bytes":{"type":"integer","minimum":0,"description":"Maximum bytes of log to return."},"flake_dir":{"type":"string","description":"Directory containing the flake. Defaults to the server's working directory."}},"required":["installable"]})";
}

ToolResult LogTool::Execute(const nlohmann::json& params,
                            const exec::CancellationTokenPtr& cancel) const {
    const auto installable = GetString(params, "installable");
    if (!installable) {
        throw ToolError(exec::ErrorCode::kInvalidParams, "parameter 'installable' is required");
    }
    RequireValid(exec::ValidateReference(*installable));
    const auto context = MakeContext(settings_, params, cancel);
    auto limits = ReadOutputLimits(params, settings_.output_limits);
    if (!limits.head && !limits.tail) {
        limits.tail = settings_.output_limits.log_tail_default;
    }

    const auto outcome = exec::SequentialExecutor::RunSingle(
        NixCommand(settings_, {"log", *installable}), context);
    const auto log = exec::LimitOutput(outcome.stdout_text, limits);

    nlohmann::json json = {
        {"command", outcome.command_display},
        {"success", outcome.succeeded},
        {"log", log.content},
        {"stderr", outcome.stderr_text.content},
        {"exit_code", outcome.exit_code.has_value() ? nlohmann::json(*outcome.exit_code)
                                                    : nlohmann::json(nullptr)}
    };
    AttachTruncation(json, {&log, &outcome.stderr_text});
    if (outcome.failure) {
        json["error"] = BuildFailureJson(*outcome.failure);
    }
    return ToolResult::Ok(std::move(json));
}

}  // namespace chix::tools
