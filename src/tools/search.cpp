#include "tools/search.hpp"

#include "exec/sequential_executor.hpp"
#include "exec/validators.hpp"

namespace chix::tools {

SearchTool::SearchTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string SearchTool::Description() const {
    return "Search a flake (nixpkgs by default) for packages. Results are sorted by attribute "
           "name and paged with limit and offset.";
}

std::string SearchTool::ParametersJson() const {
    return R"({"type":"object","properties":{"query":{"type":"string","description":"Regular expression matched against package names and descriptions."},"flake_ref":{"type":"string","description":"Flake to search. Defaults to 'nixpkgs'."},"exclude":{"type":"array","items":{"type":"string"},"description":"Regular expressions of results to hide."},"limit":{"type":"integer","minimum":0,"description":"Maximum number of packages to return. Defaults to the configured search limit."},"offset":{"type":"integer","minimum":0,"description":"Number of packages to skip."},"flake_dir":{"type":"string","description":"Working directory for the search. Defaults to the server's working directory."}},"required":["query"]})";
}

ToolResult SearchTool::Execute(const nlohmann::json& params,
                               const exec::CancellationTokenPtr& cancel) const {
    const auto query = GetString(params, "query");
    if (!query) {
        throw ToolError(exec::ErrorCode::kInvalidParams, "parameter 'query' is required");
    }
    RequireValid(exec::ValidateArgument(*query));
    const auto flake_ref = GetString(params, "flake_ref").value_or("nixpkgs");
    RequireValid(exec::ValidateReference(flake_ref));
    const auto excludes = GetStringArray(params, "exclude").value_or(std::vector<std::string>{});
    RequireValid(exec::ValidateArguments(excludes));
    auto paging = ReadArrayLimits(params, "offset", "limit");
    if (!paging.limit) {
        paging.limit = settings_.output_limits.search_limit_default;
    }
    const auto context = MakeContext(settings_, params, cancel);

    std::vector<std::string> nix_args = {"search", "--json", flake_ref, *query};
    for (const auto& exclude : excludes) {
        nix_args.push_back("--exclude");
        nix_args.push_back(exclude);
    }

    const auto outcome = exec::SequentialExecutor::RunSingle(NixCommand(settings_, nix_args), context);
    nlohmann::json json = {
        {"command", outcome.command_display},
        {"success", outcome.succeeded},
        {"packages", nullptr},
        {"stderr", outcome.stderr_text.content},
        {"exit_code", outcome.exit_code.has_value() ? nlohmann::json(*outcome.exit_code)
                                                    : nlohmann::json(nullptr)}
    };
    if (outcome.succeeded) {
        const auto packages = nlohmann::json::parse(outcome.stdout_text, nullptr, false);
        if (packages.is_object()) {
            const auto page = exec::Paginate(packages.size(), paging);
            json["packages"] = PaginateObject(packages, page);
            json["pagination"] = BuildPaginationJson(page);
        } else if (!packages.is_discarded()) {
            json["packages"] = packages;
        }
    }
    AttachTruncation(json, {&outcome.stderr_text});
    if (outcome.failure) {
        json["error"] = BuildFailureJson(*outcome.failure);
    }
    return ToolResult::Ok(std::move(json));
}

}  // namespace chix::tools
