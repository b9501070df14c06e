#include "tools/nix_command.hpp"

#include <sstream>

#include "tools/tool.hpp"
#include "utils/common.hpp"

namespace chix::tools {
namespace {

const nlohmann::json* Lookup(const nlohmann::json& params, const char* key) {
    if (!params.is_object()) {
        return nullptr;
    }
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

[[noreturn]] void ThrowTypeError(const char* key, const char* expected) {
    throw ToolError(exec::ErrorCode::kInvalidParams,
                    std::string("parameter '") + key + "' must be " + expected);
}

}  // namespace

NixToolSettings NixToolSettings::FromConfig(const config::Config& config) {
    NixToolSettings settings{};
    settings.nix_binary = config.exec.nix_binary;
    settings.timeout = std::chrono::seconds(config.exec.timeout_s);
    settings.output_limits = config.output_limits;
    return settings;
}

std::optional<std::string> GetString(const nlohmann::json& params, const char* key) {
    const auto* value = Lookup(params, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        ThrowTypeError(key, "a string");
    }
    return value->get<std::string>();
}

std::optional<bool> GetBool(const nlohmann::json& params, const char* key) {
    const auto* value = Lookup(params, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_boolean()) {
        ThrowTypeError(key, "a boolean");
    }
    return value->get<bool>();
}

std::optional<std::size_t> GetSize(const nlohmann::json& params, const char* key) {
    const auto* value = Lookup(params, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_number_unsigned()) {
        ThrowTypeError(key, "a non-negative integer");
    }
    return value->get<std::size_t>();
}

std::optional<std::vector<std::string>> GetStringArray(const nlohmann::json& params, const char* key) {
    const auto* value = Lookup(params, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_array()) {
        ThrowTypeError(key, "an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : *value) {
        if (!item.is_string()) {
            ThrowTypeError(key, "an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

void RequireValid(const exec::ValidationVerdict& verdict) {
    if (!verdict) {
        throw ToolError(verdict.ToFailure());
    }
}

exec::ExecutionContext MakeContext(const NixToolSettings& settings,
                                   const nlohmann::json& params,
                                   const exec::CancellationTokenPtr& cancel) {
    exec::ExecutionContext context{};
    if (const auto flake_dir = GetString(params, "flake_dir")) {
        RequireValid(exec::ValidatePath(*flake_dir));
        context.working_dir = utils::ExpandHome(*flake_dir);
    }
    context.timeout = settings.timeout;
    context.cancel = cancel;
    return context;
}

exec::OutputLimits ReadOutputLimits(const nlohmann::json& params,
                                    const config::OutputLimitsConfig& defaults) {
    exec::OutputLimits limits{};
    limits.head = GetSize(params, "head");
    limits.tail = GetSize(params, "tail");
    limits.max_bytes = GetSize(params, "max_bytes");
    if (!limits.max_bytes) {
        limits.max_bytes = defaults.default_max_bytes;
    }
    limits.max_lines = defaults.default_max_lines;
    return limits;
}

exec::LimitedText ShapeStream(const exec::LimitedText& limited, const exec::OutputLimits& limits) {
    auto shaped = exec::LimitOutput(limited.content, limits);
    if (limited.truncated && limited.truncation_info) {
        if (!shaped.truncation_info) {
            shaped.truncation_info = *limited.truncation_info;
        } else {
            shaped.truncation_info->original_size = limited.truncation_info->original_size;
        }
        shaped.truncated = true;
    }
    return shaped;
}

exec::CommandSpec NixCommand(const NixToolSettings& settings, std::vector<std::string> arguments) {
    return exec::CommandSpec(settings.nix_binary, std::move(arguments));
}

nlohmann::json ParseJsonOrString(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return nlohmann::json(text);
    }
    return parsed;
}

std::vector<std::string> ParseStorePaths(const std::string& stdout_text) {
    std::vector<std::string> paths;
    const auto parsed = nlohmann::json::parse(stdout_text, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_array()) {
        for (const auto& item : parsed) {
            if (!item.is_object() || !item.contains("outputs") || !item["outputs"].is_object()) {
                continue;
            }
            const auto& outputs = item["outputs"];
            if (outputs.contains("out") && outputs["out"].is_string()) {
                paths.push_back(outputs["out"].get<std::string>());
            }
        }
        if (!paths.empty()) {
            return paths;
        }
    }

    std::istringstream stream(stdout_text);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind("/nix/store/", 0) == 0) {
            paths.push_back(line);
        }
    }
    return paths;
}

nlohmann::json BuildTruncationJson(const exec::TruncationInfo& info) {
    nlohmann::json json = {
        {"original_bytes", info.original_size},
        {"kept_bytes", info.kept_size}
    };
    if (info.original_lines) {
        json["original_lines"] = *info.original_lines;
    }
    if (info.kept_lines) {
        json["kept_lines"] = *info.kept_lines;
    }
    if (info.position) {
        json["position"] = *info.position;
    }
    return json;
}

nlohmann::json BuildFailureJson(const exec::Failure& failure) {
    return {{"code", exec::ToString(failure.code)}, {"message", failure.message}};
}

nlohmann::json BuildOutcomeJson(const exec::ExecutionOutcome& outcome) {
    nlohmann::json json = {
        {"command", outcome.command_display},
        {"success", outcome.succeeded},
        {"stdout", outcome.stdout_text},
        {"stderr", outcome.stderr_text.content},
        {"exit_code", outcome.exit_code.has_value() ? nlohmann::json(*outcome.exit_code)
                                                    : nlohmann::json(nullptr)}
    };
    AttachTruncation(json, {&outcome.stderr_text});
    if (outcome.failure) {
        json["error"] = BuildFailureJson(*outcome.failure);
    }
    return json;
}

nlohmann::json BuildSequenceJson(const exec::SequenceResult& result) {
    nlohmann::json results = nlohmann::json::array();
    bool any_truncated = false;
    for (const auto& outcome : result.outcomes) {
        results.push_back(BuildOutcomeJson(outcome));
        any_truncated = any_truncated || outcome.stderr_text.truncated;
    }
    nlohmann::json json = {
        {"success", result.overall_succeeded},
        {"results", std::move(results)}
    };
    if (any_truncated) {
        json["truncated"] = true;
    }
    return json;
}

nlohmann::json BuildValueJson(const exec::ExecutionOutcome& outcome,
                              const char* key,
                              const exec::OutputLimits& limits) {
    nlohmann::json json = {
        {"command", outcome.command_display},
        {"success", outcome.succeeded},
        {key, nullptr},
        {"stderr", outcome.stderr_text.content},
        {"exit_code", outcome.exit_code.has_value() ? nlohmann::json(*outcome.exit_code)
                                                    : nlohmann::json(nullptr)}
    };
    if (outcome.succeeded) {
        const auto shaped = exec::LimitOutput(outcome.stdout_text, limits);
        json[key] = ParseJsonOrString(shaped.content);
        AttachTruncation(json, {&shaped, &outcome.stderr_text});
    } else {
        AttachTruncation(json, {&outcome.stderr_text});
    }
    if (outcome.failure) {
        json["error"] = BuildFailureJson(*outcome.failure);
    }
    return json;
}

exec::ArrayLimits ReadArrayLimits(const nlohmann::json& params,
                                  const char* offset_key,
                                  const char* limit_key) {
    exec::ArrayLimits limits{};
    limits.offset = GetSize(params, offset_key);
    limits.limit = GetSize(params, limit_key);
    return limits;
}

nlohmann::json BuildPaginationJson(const exec::Pagination& page) {
    return {
        {"offset", page.offset},
        {"limit", page.limit},
        {"total", page.total},
        {"has_more", page.has_more}
    };
}

nlohmann::json PaginateObject(const nlohmann::json& object, const exec::Pagination& page) {
    nlohmann::json window = nlohmann::json::object();
    std::size_t index = 0;
    for (auto it = object.begin(); it != object.end() && index < page.end; ++it, ++index) {
        if (index >= page.begin) {
            window[it.key()] = it.value();
        }
    }
    return window;
}

void AttachTruncation(nlohmann::json& target, std::initializer_list<const exec::LimitedText*> streams) {
    for (const auto* stream : streams) {
        if (stream && stream->truncated) {
            target["truncated"] = true;
            if (stream->truncation_info) {
                target["truncation_info"] = BuildTruncationJson(*stream->truncation_info);
            }
            return;
        }
    }
}

}  // namespace chix::tools
