#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace chix::config {

// ~/.chix/config.json unless CHIX_CONFIG points elsewhere.
std::filesystem::path GetConfigPath();

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

void ApplyConfigFromEnv(Config& config);

// Defaults, then the file (if readable and valid JSON), then the environment.
Config LoadConfig(const std::filesystem::path& path);

Config LoadConfig();

}  // namespace chix::config
