#pragma once

#include <date_mcp/config/app_config.hpp>
#include <date_mcp/core/result.hpp>
#include <date_mcp/time/location_table.hpp>

#include <string_view>

namespace date_mcp {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Read DATE_MCP_LOCATIONS into config.env_overrides (left unset when the
// variable is absent).
AppConfig LoadFromEnv(AppConfig config);

// Merge two configs: cli_overrides take precedence over yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Build the startup location table: built-ins, then YAML locations, then
// DATE_MCP_LOCATIONS, then --locations. Later sources win by exact name.
// Entries whose timezone is missing from the host database are kept and
// logged as warnings.
LocationTable BuildLocationTable(const AppConfig& config);

} // namespace date_mcp
