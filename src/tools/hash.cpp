#include "tools/hash.hpp"

#include <algorithm>
#include <array>

#include "exec/sequential_executor.hpp"
#include "exec/validators.hpp"
#include "utils/common.hpp"

namespace chix::tools {
namespace {

constexpr std::array<const char*, 4> kHashTypes = {"sha256", "sha512", "sha1", "md5"};

constexpr const char* kHashProperties =
    R"("path":{"type":"string","description":"Path to hash."},)"
    R"("hash_type":{"type":"string","enum":["sha256","sha512","sha1","md5"],"description":"Hash algorithm. Defaults to sha256."},)"
    R"("base32":{"type":"boolean","description":"Print the hash in Nix base32. Takes precedence over sri."},)"
    R"("sri":{"type":"boolean","description":"Print the hash in SRI format. Defaults to true."},)"
    R"("flake_dir":{"type":"string","description":"Directory relative paths are resolved against."})";

std::string Trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

ToolResult RunHash(const NixToolSettings& settings,
                   const char* mode,
                   const nlohmann::json& params,
                   const exec::CancellationTokenPtr& cancel) {
    const auto path = GetString(params, "path");
    if (!path) {
        throw ToolError(exec::ErrorCode::kInvalidParams, "parameter 'path' is required");
    }
    RequireValid(exec::ValidatePath(*path));
    if (path->rfind("/nix/store/", 0) == 0) {
        RequireValid(exec::ValidateStoreSubpath(*path));
    }
    const auto hash_type = GetString(params, "hash_type").value_or("sha256");
    const auto known = std::find_if(kHashTypes.begin(), kHashTypes.end(),
                                    [&hash_type](const char* type) { return hash_type == type; });
    if (known == kHashTypes.end()) {
        throw ToolError(exec::ErrorCode::kInvalidParams,
                        "invalid hash type: " + hash_type + ". Must be one of: sha256, sha512, sha1, md5");
    }
    const auto context = MakeContext(settings, params, cancel);

    std::vector<std::string> nix_args = {"hash", mode};
    if (GetBool(params, "base32").value_or(false)) {
        nix_args.push_back("--base32");
    } else if (GetBool(params, "sri").value_or(true)) {
        nix_args.push_back("--sri");
    }
    nix_args.push_back("--type");
    nix_args.push_back(hash_type);
    nix_args.push_back(utils::ExpandHome(*path));

    const auto outcome = exec::SequentialExecutor::RunSingle(NixCommand(settings, nix_args), context);
    nlohmann::json json = {
        {"command", outcome.command_display},
        {"success", outcome.succeeded},
        {"hash", outcome.succeeded ? Trim(outcome.stdout_text) : std::string()},
        {"stderr", outcome.stderr_text.content},
        {"exit_code", outcome.exit_code.has_value() ? nlohmann::json(*outcome.exit_code)
                                                    : nlohmann::json(nullptr)}
    };
    AttachTruncation(json, {&outcome.stderr_text});
    if (outcome.failure) {
        json["error"] = BuildFailureJson(*outcome.failure);
    }
    return ToolResult::Ok(std::move(json));
}

}  // namespace

HashPathTool::HashPathTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string HashPathTool::Description() const {
    return "Compute the hash of a path's NAR serialization, as used for fixed-output derivations.";
}

std::string HashPathTool::ParametersJson() const {
    return std::string(R"({"type":"object","properties":{)") + kHashProperties + R"(},"required":["path"]})";
}

ToolResult HashPathTool::Execute(const nlohmann::json& params,
                                 const exec::CancellationTokenPtr& cancel) const {
    return RunHash(settings_, "path", params, cancel);
}

HashFileTool::HashFileTool(NixToolSettings settings)
    : settings_(std::move(settings)) {}

std::string HashFileTool::Description() const {
    return "Compute the flat hash of a file's contents.";
}

std::string HashFileTool::ParametersJson() const {
    return std::string(R"({"type":"object","properties":{)") + kHashProperties + R"(},"required":["path"]})";
}

ToolResult HashFileTool::Execute(const nlohmann::json& params,
                                 const exec::CancellationTokenPtr& cancel) const {
    return RunHash(settings_, "file", params, cancel);
}

}  // namespace chix::tools
