#pragma once

#include <date_mcp/core/result.hpp>
#include <date_mcp/mcp/tool_registry.hpp>
#include <date_mcp/time/timezone_resolver.hpp>
#include <date_mcp/time/zone_clock.hpp>

#include <chrono>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace date_mcp {

// Source of "now" for tool calls. Production uses the system clock; tests
// pin an instant.
using ClockFn = std::function<TimePoint()>;

// ---------------------------------------------------------------------------
// ToolDispatcher — executes tools/call requests.
//
// Failures:
//   UnknownTool          name is not in the catalog
//   InvalidArgument      required argument missing, not a string, or empty
//   LocationNotFound     resolver found no match (message carries remediation)
//   TimezoneUnavailable  resolved zone is missing from the host database
//
// The resolver is borrowed and must outlive the dispatcher.
// ---------------------------------------------------------------------------
class ToolDispatcher {
public:
    explicit ToolDispatcher(
        const TimezoneResolver& resolver,
        ClockFn clock = [] { return std::chrono::system_clock::now(); });

    [[nodiscard]] Result<ToolResult, Error> Dispatch(
        const std::string& name, const nlohmann::json& arguments) const;

private:
    [[nodiscard]] Result<ToolResult, Error> CurrentTimeAtLocation(
        const nlohmann::json& arguments) const;
    [[nodiscard]] ToolResult ListAvailableLocations() const;

    const TimezoneResolver& resolver_;
    ClockFn clock_;
};

} // namespace date_mcp
