#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace warden::config {

// $WARDEN_CONFIG if set, ~/.warden/config.json otherwise.
std::filesystem::path GetConfigPath();

// Reads the config file (a missing file yields defaults) and applies the
// WARDEN_* environment overrides. Throws ConfigError on invalid content.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

}  // namespace warden::config
