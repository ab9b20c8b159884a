#include <date_mcp/config/config_loader.hpp>

#include <date_mcp/core/log.hpp>
#include <date_mcp/core/types.hpp>
#include <date_mcp/core/version.hpp>
#include <date_mcp/time/zone_clock.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace date_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config, {}};
}

Result<std::vector<LocationEntry>, Error> ParseYamlLocations(const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<std::vector<LocationEntry>, Error>::Err(
            MakeConfigError("'locations' must be a map of name: Area/City"));
    }

    std::vector<LocationEntry> entries;
    for (const auto& item : node) {
        auto name = item.first.as<std::string>();
        if (!item.second.IsScalar()) {
            return Result<std::vector<LocationEntry>, Error>::Err(
                MakeConfigError("Location '" + name + "' must map to a timezone string"));
        }
        auto zone = item.second.as<std::string>();
        if (name.empty() || zone.empty()) {
            return Result<std::vector<LocationEntry>, Error>::Err(
                MakeConfigError("Location entries need a non-empty name and timezone"));
        }
        if (!IsValidUtf8(name) || !IsValidUtf8(zone)) {
            return Result<std::vector<LocationEntry>, Error>::Err(
                MakeConfigError("Location entries must be valid UTF-8"));
        }
        entries.push_back({std::move(name), std::move(zone)});
    }
    return Result<std::vector<LocationEntry>, Error>::Ok(std::move(entries));
}

void WarnIfUnavailable(const LocationEntry& entry) {
    auto zone = TimezoneId::Create(entry.timezone_id);
    if (zone.IsErr()) {
        LogWarn("config", "location '" + entry.name + "': " + zone.Error());
        return;
    }
    if (!TimezoneExists(zone.Value())) {
        LogWarn("config", "location '" + entry.name + "' uses timezone '" +
                              entry.timezone_id + "', which is not in " +
                              ZoneInfoDir());
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        if (root["locations"]) {
            auto locations = ParseYamlLocations(root["locations"]);
            if (locations.IsErr()) {
                return Result<AppConfig, Error>::Err(locations.Error());
            }
            config.locations = std::move(locations).Value();
        }

        if (root["log_level"]) {
            auto name = root["log_level"].as<std::string>();
            auto level = ParseLogLevel(name);
            if (!level) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Invalid log_level: " + name));
            }
            config.log_level = *level;
            config.log_level_set = true;
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_json"]) {
            config.log_json = root["log_json"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("date-mcp", kVersion);
    program.add_description(
        "MCP server answering date and time queries over stdio.");
    program.add_epilog(std::string("Extra locations can be supplied through ") +
                       kLocationsEnvVar + ", e.g. " + kLocationsEnvVar +
                       "=\"Vienna=Europe/Vienna,Springfield=America/Chicago\"");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--locations")
        .help("Extra locations as Name=Area/City pairs, comma-separated");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("--log-json")
        .help("JSON log lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--list-locations")
        .help("Print the effective location table and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--locations")) {
        config.cli_overrides = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --log-level: " + *val));
        }
        config.log_level = *level;
        config.log_level_set = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    config.log_json = program.get<bool>("--log-json");
    config.no_color = program.get<bool>("--no-color");
    config.list_locations = program.get<bool>("--list-locations");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
AppConfig LoadFromEnv(AppConfig config) {
    const char* value = std::getenv(kLocationsEnvVar);
    if (value != nullptr) {
        config.env_overrides = std::string(value);
    }
    return config;
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (!cli_overrides.locations.empty()) {
        merged.locations.insert(merged.locations.end(),
                                cli_overrides.locations.begin(),
                                cli_overrides.locations.end());
    }
    if (cli_overrides.env_overrides.has_value()) {
        merged.env_overrides = cli_overrides.env_overrides;
    }
    if (cli_overrides.cli_overrides.has_value()) {
        merged.cli_overrides = cli_overrides.cli_overrides;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_level_set) {
        merged.log_level = cli_overrides.log_level;
        merged.log_level_set = true;
    }
    if (cli_overrides.log_json) {
        merged.log_json = true;
    }
    if (cli_overrides.no_color) {
        merged.no_color = true;
    }
    if (cli_overrides.list_locations) {
        merged.list_locations = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// BuildLocationTable
// ---------------------------------------------------------------------------
LocationTable BuildLocationTable(const AppConfig& config) {
    auto table = LocationTable::WithDefaults();
    LogDebug("config", "seeded " + std::to_string(table.Size()) +
                           " built-in locations");

    for (const auto& entry : config.locations) {
        WarnIfUnavailable(entry);
        table.Upsert(entry);
    }

    auto apply = [&table](const std::optional<std::string>& raw,
                          const std::string& source) {
        if (!raw.has_value()) return;
        LocationTable parsed;
        auto count = parsed.ApplyOverrides(*raw);
        for (const auto& entry : parsed.Entries()) {
            WarnIfUnavailable(entry);
            table.Upsert(entry);
        }
        LogInfo("config", "applied " + std::to_string(count) +
                              " location override(s) from " + source);
    };
    apply(config.env_overrides, kLocationsEnvVar);
    apply(config.cli_overrides, "--locations");

    return table;
}

} // namespace date_mcp
