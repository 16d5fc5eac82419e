#pragma once

#include <filesystem>
#include <stdexcept>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "session/session_types.hpp"

namespace sandcell::config {

// A configured value that is present but unusable (unknown provider,
// non-positive limit).
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// $SANDCELL_CONFIG or ~/.sandcell/config.json
std::filesystem::path GetConfigPath();

// File (when present) then SANDCELL_* environment overrides. A malformed
// file keeps the defaults and logs a warning.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironmentOverrides(Config& config);

// Throws ConfigError.
session::SessionConfig ToSessionConfig(const Config& config);

}  // namespace sandcell::config
