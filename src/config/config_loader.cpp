#include "config/config_loader.hpp"

#include <cstdint>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace chix::config {
namespace {

void ApplyPositiveSize(std::size_t& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        const auto value = source[key].get<long long>();
        if (value > 0) {
            target = static_cast<std::size_t>(value);
        }
    }
}

long long ParseLong(const std::string& value, long long fallback) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        return consumed == value.size() ? parsed : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyPositiveSizeEnv(std::size_t& target, const char* name) {
    const auto raw = utils::GetEnv(name);
    if (raw.empty()) {
        return;
    }
    const auto value = ParseLong(raw, 0);
    if (value > 0) {
        target = static_cast<std::size_t>(value);
    }
}

void ApplyTimeout(int& target, long long value, const char* source) {
    if (value <= 0) {
        return;
    }
    if (value > kMaxTimeoutS) {
        utils::LogWarn("config", "timeout out of range, ignored", {
            {"source", source},
            {"value", std::to_string(value)},
            {"max", std::to_string(kMaxTimeoutS)}});
        return;
    }
    target = static_cast<int>(value);
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto override_path = utils::GetEnv("CHIX_CONFIG");
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    return utils::GetHomePath() / ".chix" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("exec") && data["exec"].is_object()) {
        const auto& exec = data["exec"];
        if (exec.contains("nixBinary") && exec["nixBinary"].is_string()) {
            const auto value = exec["nixBinary"].get<std::string>();
            if (!value.empty()) {
                config.exec.nix_binary = value;
            }
        }
        if (exec.contains("timeoutS") && exec["timeoutS"].is_number_unsigned()) {
            const auto value = exec["timeoutS"].get<std::uint64_t>();
            const auto clamped = value > static_cast<std::uint64_t>(kMaxTimeoutS)
                                     ? kMaxTimeoutS + 1
                                     : static_cast<long long>(value);
            ApplyTimeout(config.exec.timeout_s, clamped, "file");
        }
    }

    if (data.contains("outputLimits") && data["outputLimits"].is_object()) {
        const auto& limits = data["outputLimits"];
        ApplyPositiveSize(config.output_limits.default_max_bytes, limits, "defaultMaxBytes");
        ApplyPositiveSize(config.output_limits.default_max_lines, limits, "defaultMaxLines");
        ApplyPositiveSize(config.output_limits.log_tail_default, limits, "logTailDefault");
        ApplyPositiveSize(config.output_limits.search_limit_default, limits, "searchLimitDefault");
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            config.log.level = log["level"].get<std::string>();
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto nix_binary = utils::GetEnv("CHIX_EXEC__NIX_BINARY");
    if (!nix_binary.empty()) {
        config.exec.nix_binary = nix_binary;
    }

    const auto timeout = utils::GetEnv("CHIX_EXEC__TIMEOUT_S");
    if (!timeout.empty()) {
        ApplyTimeout(config.exec.timeout_s, ParseLong(timeout, 0), "env");
    }

    ApplyPositiveSizeEnv(config.output_limits.default_max_bytes, "CHIX_OUTPUT_LIMITS__DEFAULT_MAX_BYTES");
    ApplyPositiveSizeEnv(config.output_limits.default_max_lines, "CHIX_OUTPUT_LIMITS__DEFAULT_MAX_LINES");
    ApplyPositiveSizeEnv(config.output_limits.log_tail_default, "CHIX_OUTPUT_LIMITS__LOG_TAIL_DEFAULT");
    ApplyPositiveSizeEnv(config.output_limits.search_limit_default, "CHIX_OUTPUT_LIMITS__SEARCH_LIMIT_DEFAULT");

    const auto log_level = utils::GetEnv("CHIX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.level = log_level;
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        if (!input.is_open()) {
            utils::LogWarn("config", "failed to open config, using defaults", {{"path", path.string()}});
        } else {
            try {
                nlohmann::json data;
                input >> data;
                ApplyConfigFromJson(config, data);
            } catch (const nlohmann::json::exception& ex) {
                utils::LogWarn("config", "failed to parse config, using defaults", {
                    {"path", path.string()},
                    {"error", ex.what()}});
            }
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace chix::config
