#pragma once

#include <chrono>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "exec/limited_text.hpp"
#include "exec/types.hpp"
#include "exec/validators.hpp"
#include "nlohmann/json.hpp"

namespace chix::tools {

struct NixToolSettings {
    std::string nix_binary = "nix";
    std::chrono::seconds timeout = exec::kDefaultTimeout;
    config::OutputLimitsConfig output_limits;

    static NixToolSettings FromConfig(const config::Config& config);
};

// Parameter accessors. Absent or null yields nullopt; a value of the wrong
// type throws ToolError(InvalidParams).
std::optional<std::string> GetString(const nlohmann::json& params, const char* key);
std::optional<bool> GetBool(const nlohmann::json& params, const char* key);
std::optional<std::size_t> GetSize(const nlohmann::json& params, const char* key);
std::optional<std::vector<std::string>> GetStringArray(const nlohmann::json& params, const char* key);

// Throws ToolError with the verdict's code when `verdict` rejects.
void RequireValid(const exec::ValidationVerdict& verdict);

// Validates and expands `flake_dir` and fills the timeout and cancellation
// token from the settings.
exec::ExecutionContext MakeContext(const NixToolSettings& settings,
                                   const nlohmann::json& params,
                                   const exec::CancellationTokenPtr& cancel);

// head / tail / max_bytes from the caller, max_bytes and max_lines
// defaulting to the configured limits.
exec::OutputLimits ReadOutputLimits(const nlohmann::json& params,
                                    const config::OutputLimitsConfig& defaults);

// Applies caller-directed limits on top of an already limited stream,
// keeping the size of the stream as the process produced it.
exec::LimitedText ShapeStream(const exec::LimitedText& limited, const exec::OutputLimits& limits);

exec::CommandSpec NixCommand(const NixToolSettings& settings, std::vector<std::string> arguments);

// Parses `text` as JSON, falling back to a JSON string when it is not
// (for example after truncation).
nlohmann::json ParseJsonOrString(const std::string& text);

std::vector<std::string> ParseStorePaths(const std::string& stdout_text);

nlohmann::json BuildTruncationJson(const exec::TruncationInfo& info);
nlohmann::json BuildFailureJson(const exec::Failure& failure);
nlohmann::json BuildOutcomeJson(const exec::ExecutionOutcome& outcome);
nlohmann::json BuildSequenceJson(const exec::SequenceResult& result);

// Result of a command whose stdout is a JSON document: the document, shaped by
// `limits`, is parsed under `key` when the command succeeded and is null
// otherwise.
nlohmann::json BuildValueJson(const exec::ExecutionOutcome& outcome,
                              const char* key,
                              const exec::OutputLimits& limits);

// offset / limit style paging parameters, named by the tool.
exec::ArrayLimits ReadArrayLimits(const nlohmann::json& params,
                                  const char* offset_key,
                                  const char* limit_key);

nlohmann::json BuildPaginationJson(const exec::Pagination& page);

// Entries of a JSON object inside the window, in key order.
nlohmann::json PaginateObject(const nlohmann::json& object, const exec::Pagination& page);

// Adds "truncated" / "truncation_info" for the first truncated stream.
void AttachTruncation(nlohmann::json& target, std::initializer_list<const exec::LimitedText*> streams);

}  // namespace chix::tools
