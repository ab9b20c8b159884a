#include <catch2/catch_test_macros.hpp>

#include <date_mcp/config/config_loader.hpp>
#include <date_mcp/core/types.hpp>

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <stdlib.h>  // _putenv_s
#endif

using namespace date_mcp;

namespace {
void SetEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void UnsetEnv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

// Restores DATE_MCP_LOCATIONS when a test is done with it.
class ScopedLocationsEnv {
public:
    explicit ScopedLocationsEnv(const char* value) {
        if (const char* old = std::getenv(kLocationsEnvVar)) {
            saved_ = std::string(old);
        }
        if (value != nullptr) {
            SetEnv(kLocationsEnvVar, value);
        } else {
            UnsetEnv(kLocationsEnvVar);
        }
    }
    ~ScopedLocationsEnv() {
        if (saved_) {
            SetEnv(kLocationsEnvVar, saved_->c_str());
        } else {
            UnsetEnv(kLocationsEnvVar);
        }
    }
private:
    std::optional<std::string> saved_;
};

// Derive the testdata directory from this file's location so tests work
// from any build directory.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    REQUIRE(config.locations.size() == 3);
    CHECK(config.locations[0] == LocationEntry{"Vienna", "Europe/Vienna"});
    CHECK(config.locations[1] == LocationEntry{"Springfield", "America/Chicago"});
    CHECK(config.locations[2] == LocationEntry{"Tokyo", "Asia/Seoul"});

    CHECK(config.log_level == LogLevel::Debug);
    CHECK(config.log_level_set);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/date-mcp-test.log");
    CHECK(config.log_json);
    REQUIRE(config.config_file.has_value());
    CHECK(*config.config_file == TestDataPath("valid_config.yaml"));
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    REQUIRE(config.locations.size() == 1);
    CHECK(config.locations[0].name == "Vienna");
    CHECK(config.log_level == LogLevel::Warn);
    CHECK_FALSE(config.log_level_set);
    CHECK_FALSE(config.log_file.has_value());
    CHECK_FALSE(config.log_json);
}

TEST_CASE("LoadFromYaml: missing file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("YAML") != std::string::npos);
}

TEST_CASE("LoadFromYaml: invalid log level", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_log_level.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("loud") != std::string::npos);
}

TEST_CASE("LoadFromYaml: locations must be a name to zone map", "[config][yaml]") {
    auto list = LoadFromYaml(TestDataPath("bad_locations.yaml"));
    REQUIRE(list.IsErr());
    CHECK(list.Error().message.find("locations") != std::string::npos);

    auto nested = LoadFromYaml(TestDataPath("nested_location.yaml"));
    REQUIRE(nested.IsErr());
    CHECK(nested.Error().message.find("Vienna") != std::string::npos);

    auto empty = LoadFromYaml(TestDataPath("empty_zone.yaml"));
    REQUIRE(empty.IsErr());
    CHECK(empty.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: Latin-1 location name never reaches the table", "[config][yaml]") {
    // yaml-cpp may substitute U+FFFD while reading; otherwise the loader
    // rejects the entry.
    auto result = LoadFromYaml(TestDataPath("latin1_location.yaml"));
    if (result.IsErr()) {
        CHECK(result.Error().category == ErrorCategory::Config);
        CHECK(result.Error().message.find("UTF-8") != std::string::npos);
        return;
    }
    for (const auto& entry : result.Value().locations) {
        CHECK(IsValidUtf8(entry.name));
    }
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no arguments", "[config][cli]") {
    const char* argv[] = {"date-mcp"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK_FALSE(config.config_file.has_value());
    CHECK_FALSE(config.cli_overrides.has_value());
    CHECK_FALSE(config.log_level_set);
    CHECK_FALSE(config.log_json);
    CHECK_FALSE(config.no_color);
    CHECK_FALSE(config.list_locations);
}

TEST_CASE("LoadFromCli: all options", "[config][cli]") {
    const char* argv[] = {
        "date-mcp",
        "-c", "/etc/date-mcp.yaml",
        "--locations", "Vienna=Europe/Vienna,Graz=Europe/Vienna",
        "--log-level", "INFO",
        "--log-file", "/tmp/date-mcp.log",
        "--log-json",
        "--no-color",
        "--list-locations"
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    REQUIRE(config.config_file.has_value());
    CHECK(*config.config_file == "/etc/date-mcp.yaml");
    REQUIRE(config.cli_overrides.has_value());
    CHECK(*config.cli_overrides == "Vienna=Europe/Vienna,Graz=Europe/Vienna");
    CHECK(config.log_level == LogLevel::Info);
    CHECK(config.log_level_set);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/date-mcp.log");
    CHECK(config.log_json);
    CHECK(config.no_color);
    CHECK(config.list_locations);
}

TEST_CASE("LoadFromCli: invalid log level", "[config][cli]") {
    const char* argv[] = {"date-mcp", "--log-level", "chatty"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("--log-level") != std::string::npos);
}

TEST_CASE("LoadFromCli: unknown argument", "[config][cli]") {
    const char* argv[] = {"date-mcp", "--frobnicate"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// LoadFromEnv
// ===========================================================================

TEST_CASE("LoadFromEnv: reads DATE_MCP_LOCATIONS", "[config][env]") {
    ScopedLocationsEnv env("Vienna=Europe/Vienna");

    auto config = LoadFromEnv(AppConfig{});
    REQUIRE(config.env_overrides.has_value());
    CHECK(*config.env_overrides == "Vienna=Europe/Vienna");
}

TEST_CASE("LoadFromEnv: absent variable leaves config untouched", "[config][env]") {
    ScopedLocationsEnv env(nullptr);

    AppConfig base;
    base.log_json = true;
    auto config = LoadFromEnv(base);
    CHECK_FALSE(config.env_overrides.has_value());
    CHECK(config.log_json);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML values", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml_result.IsOk());

    const char* argv[] = {
        "date-mcp",
        "--log-level", "error",
        "--log-file", "/var/log/date-mcp.log",
        "--locations", "Graz=Europe/Vienna"
    };
    int argc = sizeof(argv) / sizeof(argv[0]);
    auto cli_result = LoadFromCli(argc, argv);
    REQUIRE(cli_result.IsOk());

    auto merged = MergeConfigs(yaml_result.Value(), cli_result.Value());
    CHECK(merged.log_level == LogLevel::Error);
    CHECK(*merged.log_file == "/var/log/date-mcp.log");
    CHECK(*merged.cli_overrides == "Graz=Europe/Vienna");
    // Not given on the command line: YAML value stays.
    CHECK(merged.log_json);
    CHECK(merged.locations.size() == 3);
}

TEST_CASE("MergeConfigs: empty CLI keeps YAML values", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml_result.IsOk());

    auto merged = MergeConfigs(yaml_result.Value(), AppConfig{});
    CHECK(merged.log_level == LogLevel::Debug);
    CHECK(merged.log_level_set);
    CHECK(*merged.log_file == "/tmp/date-mcp-test.log");
    CHECK(merged.locations == yaml_result.Value().locations);
    CHECK(*merged.config_file == TestDataPath("valid_config.yaml"));
}

// ===========================================================================
// BuildLocationTable
// ===========================================================================

TEST_CASE("BuildLocationTable: defaults only", "[config][table]") {
    auto table = BuildLocationTable(AppConfig{});
    CHECK(table.Entries() == LocationTable::WithDefaults().Entries());
}

TEST_CASE("BuildLocationTable: YAML entries extend and overwrite built-ins", "[config][table]") {
    auto yaml_result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml_result.IsOk());

    auto table = BuildLocationTable(yaml_result.Value());
    CHECK(table.Get("Vienna") == "Europe/Vienna");
    CHECK(table.Get("Springfield") == "America/Chicago");
    CHECK(table.Get("Tokyo") == "Asia/Seoul");
    CHECK(table.Get("London") == "Europe/London");
    CHECK(table.Size() == LocationTable::WithDefaults().Size() + 2);
}

TEST_CASE("BuildLocationTable: later sources win", "[config][table]") {
    AppConfig config;
    config.locations = {{"Springfield", "America/Chicago"}, {"Vienna", "Europe/Vienna"}};
    config.env_overrides = "Springfield=America/New_York,Shelbyville=America/Chicago";
    config.cli_overrides = "Springfield=America/Denver";

    auto table = BuildLocationTable(config);
    CHECK(table.Get("Springfield") == "America/Denver");
    CHECK(table.Get("Shelbyville") == "America/Chicago");
    CHECK(table.Get("Vienna") == "Europe/Vienna");
}

TEST_CASE("BuildLocationTable: malformed overrides are skipped", "[config][table]") {
    AppConfig config;
    config.env_overrides = "garbage,=Europe/Vienna,Graz=";
    config.cli_overrides = ",,";

    auto table = BuildLocationTable(config);
    CHECK(table.Entries() == LocationTable::WithDefaults().Entries());
}

TEST_CASE("BuildLocationTable: non-UTF-8 overrides are skipped", "[config][table]") {
    AppConfig config;
    config.env_overrides = "Z\xFCrich=Europe/Zurich,Graz=Europe/Vienna";

    auto table = BuildLocationTable(config);
    CHECK(table.Get("Z\xFCrich") == std::nullopt);
    CHECK(table.Get("Graz") == "Europe/Vienna");
    CHECK(table.Size() == LocationTable::WithDefaults().Size() + 1);
}

TEST_CASE("BuildLocationTable: unknown zones are kept", "[config][table]") {
    AppConfig config;
    config.cli_overrides = "Atlantis=Ocean/Atlantis";

    auto table = BuildLocationTable(config);
    CHECK(table.Get("Atlantis") == "Ocean/Atlantis");
}
