#include "tools/derivation.hpp"

#include "exec/sequential_executor.hpp"
#include "exec/validators.hpp"

namespace chix::tools {
namespace {

nlohmann::json Summarize(const std::string& path, const nlohmann::json& drv) {
    nlohmann::json outputs = nlohmann::json::array();
    std::size_t input_count = 0;
    nlohmann::json name = nullptr;
    if (drv.is_object()) {
        if (drv.contains("name") && drv["name"].is_string()) {
            name = drv["name"];
        }
        if (drv.contains("outputs") && drv["outputs"].is_object()) {
            for (auto it = drv["outputs"].begin(); it != drv["outputs"].end(); ++it) {
                outputs.push_back(it.key());
            }
        }
        if (drv.contains("inputDrvs") && drv["inputDrvs"].is_object()) {
            input_count = drv["inputDrvs"].size();
        }
    }
    return {
        {"path", path},
        {"name", name},
        {"outputs", std::move(outputs)},
        {"input_count", input_count}
    };
}

}  // namespace

DerivationShowTool::DerivationShowTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string DerivationShowTool::Description() const {
    return "Show the derivation of an installable or .drv store path as JSON. With recursive the "
           "whole dependency tree is included; use summary_only and max_inputs to keep it small.";
}

std::string DerivationShowTool::ParametersJson() const {
    return R"({"type":"object","properties":{"installable":{"type":"string","description":"Installable or /nix/store path. Defaults to '.#default'."},"recursive":{"type":"boolean","description":"Include the derivations of all dependencies."},"summary_only":{"type":"boolean","description":"Return name, outputs and input count per derivation instead of the full derivation."},"max_inputs":{"type":"integer","minimum":0,"description":"Maximum number of derivations to return."},"inputs_offset":{"type":"integer","minimum":0,"description":"Number of derivations to skip."},"flake_dir":{"type":"string","description":"Directory containing the flake. Defaults to the server's working directory."}}})";
}

ToolResult DerivationShowTool::Execute(const nlohmann::json& params,
                                       const exec::CancellationTokenPtr& cancel) const {
    const auto installable = GetString(params, "installable").value_or(".#default");
    if (installable.rfind("/nix/store/", 0) == 0) {
        RequireValid(exec::ValidateStorePath(installable));
    } else {
        RequireValid(exec::ValidateReference(installable));
    }
    const auto paging = ReadArrayLimits(params, "inputs_offset", "max_inputs");
    const bool paged = paging.offset.has_value() || paging.limit.has_value();
    const bool summary_only = GetBool(params, "summary_only").value_or(false);
    const auto context = MakeContext(settings_, params, cancel);

    std::vector<std::string> nix_args = {"derivation", "show"};
    if (GetBool(params, "recursive").value_or(false)) {
        nix_args.push_back("--recursive");
    }
    nix_args.push_back(installable);

    const auto outcome = exec::SequentialExecutor::RunSingle(NixCommand(settings_, nix_args), context);
    nlohmann::json json = {
        {"command", outcome.command_display},
        {"success", outcome.succeeded},
        {"stderr", outcome.stderr_text.content},
        {"exit_code", outcome.exit_code.has_value() ? nlohmann::json(*outcome.exit_code)
                                                    : nlohmann::json(nullptr)}
    };
    AttachTruncation(json, {&outcome.stderr_text});
    if (outcome.failure) {
        json["error"] = BuildFailureJson(*outcome.failure);
    }
    if (!outcome.succeeded) {
        json["derivation"] = nullptr;
        return ToolResult::Ok(std::move(json));
    }

    auto parsed = nlohmann::json::parse(outcome.stdout_text, nullptr, false);
    if (parsed.is_discarded()) {
        parsed = nullptr;
    }
    // Newer nix releases wrap the map in {"derivations": {...}, "version": N}.
    if (parsed.is_object() && parsed.contains("derivations") && parsed["derivations"].is_object()) {
        parsed = parsed["derivations"];
    }
    if (!parsed.is_object()) {
        json["derivation"] = std::move(parsed);
        return ToolResult::Ok(std::move(json));
    }

    const auto page = exec::Paginate(parsed.size(), paging);
    const auto window = PaginateObject(parsed, page);
    if (summary_only) {
        nlohmann::json summary = nlohmann::json::array();
        for (auto it = window.begin(); it != window.end(); ++it) {
            summary.push_back(Summarize(it.key(), it.value()));
        }
        json["summary"] = std::move(summary);
    } else {
        json["derivation"] = window;
    }
    if (paged) {
        json["pagination"] = BuildPaginationJson(page);
    }
    return ToolResult::Ok(std::move(json));
}

}  // namespace chix::tools
