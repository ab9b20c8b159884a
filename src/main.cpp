#include <date_mcp/config/config_loader.hpp>
#include <date_mcp/core/log.hpp>
#include <date_mcp/core/terminal.hpp>
#include <date_mcp/core/version.hpp>
#include <date_mcp/mcp/mcp_server.hpp>
#include <date_mcp/mcp/prompt_catalog.hpp>
#include <date_mcp/mcp/tool_dispatcher.hpp>
#include <date_mcp/mcp/tool_registry.hpp>
#include <date_mcp/time/location_table.hpp>
#include <date_mcp/time/timezone_resolver.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

using namespace date_mcp;

// CLI flags, then the YAML file they point at, then the environment.
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }

    AppConfig config = cli.Value();
    if (config.config_file.has_value()) {
        auto yaml = LoadFromYaml(*config.config_file);
        if (yaml.IsErr()) {
            return yaml;
        }
        config = MergeConfigs(yaml.Value(), cli.Value());
    }

    return Result<AppConfig, Error>::Ok(LoadFromEnv(std::move(config)));
}

// Logs go to stderr or a file; stdout carries protocol messages only.
void InitLogging(const AppConfig& config) {
    if (config.log_file.has_value()) {
        auto sink = std::make_unique<FileSink>(*config.log_file, config.log_json);
        if (sink->IsOpen()) {
            InitGlobalLogger(std::move(sink), config.log_level);
            return;
        }
        std::cerr << "date-mcp: cannot open log file " << *config.log_file
                  << ", logging to stderr\n";
    }

    if (config.log_json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), config.log_level);
        return;
    }

    bool use_color = !config.no_color && !NoColorEnvSet() && IsStderrTty();
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color),
                     config.log_level);
}

void PrintLocations(const LocationTable& table) {
    for (const auto& name : table.SortedNames()) {
        std::cout << name << " = " << *table.Get(name) << "\n";
    }
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace date_mcp;

    auto config = LoadConfig(argc, argv);
    if (config.IsErr()) {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(
                             !NoColorEnvSet() && IsStderrTty()),
                         LogLevel::Error);
        LogError("main", config.Error().message);
        return config.Error().ExitCode();
    }

    InitLogging(config.Value());
    LogInfo("main", std::string("date-mcp ") + kVersion + " starting");

    const auto table = BuildLocationTable(config.Value());
    LogInfo("main", std::to_string(table.Size()) + " locations available");

    if (config.Value().list_locations) {
        PrintLocations(table);
        return 0;
    }

    TimezoneResolver resolver(table);
    ToolDispatcher dispatcher(resolver);

    McpServer server(ToolRegistry{}, dispatcher, PromptCatalog{});
    server.Run();

    return 0;
}
