#pragma once

#include <date_mcp/core/log.hpp>
#include <date_mcp/time/location_table.hpp>

#include <optional>
#include <string>
#include <vector>

namespace date_mcp {

struct AppConfig {
    // Entries from the YAML "locations" map, in file order.
    std::vector<LocationEntry> locations;
    // Raw DATE_MCP_LOCATIONS value.
    std::optional<std::string> env_overrides;
    // Raw --locations value.
    std::optional<std::string> cli_overrides;

    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    LogLevel log_level = LogLevel::Warn;
    bool log_level_set = false;
    bool log_json = false;
    bool no_color = false;
    bool list_locations = false;
};

} // namespace date_mcp
