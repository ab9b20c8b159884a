#include <date_mcp/mcp/tool_dispatcher.hpp>

#include <date_mcp/core/log.hpp>
#include <date_mcp/core/types.hpp>

#include <utility>

namespace date_mcp {

namespace {

Error MakeToolError(const std::string& operation, const std::string& message,
                    ErrorCategory category) {
    return Error{operation, message, category, {}};
}

// Get a required, non-empty string argument.
Result<std::string, Error> RequireString(const nlohmann::json& arguments,
                                         const std::string& tool,
                                         const std::string& key) {
    if (!arguments.is_object() || !arguments.contains(key)) {
        return Result<std::string, Error>::Err(MakeToolError(
            tool, "Missing required parameter: " + key,
            ErrorCategory::InvalidArgument));
    }
    const auto& value = arguments[key];
    if (!value.is_string()) {
        return Result<std::string, Error>::Err(MakeToolError(
            tool, "Parameter '" + key + "' must be a string",
            ErrorCategory::InvalidArgument));
    }
    auto str = value.get<std::string>();
    if (str.empty()) {
        return Result<std::string, Error>::Err(MakeToolError(
            tool, "Parameter '" + key + "' must not be empty",
            ErrorCategory::InvalidArgument));
    }
    return Result<std::string, Error>::Ok(std::move(str));
}

} // anonymous namespace

ToolDispatcher::ToolDispatcher(const TimezoneResolver& resolver, ClockFn clock)
    : resolver_(resolver), clock_(std::move(clock)) {}

Result<ToolResult, Error> ToolDispatcher::Dispatch(
    const std::string& name, const nlohmann::json& arguments) const {
    auto kind = ParseToolKind(name);
    if (!kind) {
        return Result<ToolResult, Error>::Err(MakeToolError(
            "tools/call", "Unknown tool: " + name, ErrorCategory::UnknownTool));
    }

    LogDebug("dispatch", "calling " + name);

    switch (*kind) {
        case ToolKind::DayName:
            return Result<ToolResult, Error>::Ok(
                MakeTextResult(WeekdayName(clock_())));
        case ToolKind::IsoDate:
            return Result<ToolResult, Error>::Ok(
                MakeTextResult(FormatIsoDate(clock_())));
        case ToolKind::CurrentTime:
            return Result<ToolResult, Error>::Ok(
                MakeTextResult(FormatIsoLocal(clock_())));
        case ToolKind::CurrentTimeUtc:
            return Result<ToolResult, Error>::Ok(
                MakeTextResult(FormatIsoUtc(clock_())));
        case ToolKind::CurrentTimeLocation:
            return CurrentTimeAtLocation(arguments);
        case ToolKind::ListAvailableLocations:
            return Result<ToolResult, Error>::Ok(ListAvailableLocations());
    }

    return Result<ToolResult, Error>::Err(MakeToolError(
        "tools/call", "Unhandled tool: " + name, ErrorCategory::Internal));
}

Result<ToolResult, Error> ToolDispatcher::CurrentTimeAtLocation(
    const nlohmann::json& arguments) const {
    const std::string tool(ToolName(ToolKind::CurrentTimeLocation));

    auto location = RequireString(arguments, tool, "location");
    if (location.IsErr()) {
        return Result<ToolResult, Error>::Err(location.Error());
    }

    auto resolved = resolver_.Resolve(location.Value())
        .MapErr([&tool](const ResolutionFailure& failure) {
            return Error{tool, failure.Message(),
                         ErrorCategory::LocationNotFound,
                         failure.known_sample};
        });
    if (resolved.IsErr()) {
        LogInfo("dispatch", "unknown location '" + location.Value() + "'");
        return Result<ToolResult, Error>::Err(resolved.Error());
    }

    auto zone = TimezoneId::Create(resolved.Value());
    if (zone.IsErr()) {
        return Result<ToolResult, Error>::Err(MakeToolError(
            tool,
            "Location '" + location.Value() + "' is configured with an invalid "
            "timezone identifier: " + zone.Error(),
            ErrorCategory::TimezoneUnavailable));
    }

    return FormatIsoInZone(clock_(), zone.Value()).Map(MakeTextResult);
}

ToolResult ToolDispatcher::ListAvailableLocations() const {
    std::string text;
    for (const auto& name : resolver_.Table().SortedNames()) {
        if (!text.empty()) text += '\n';
        text += name;
    }
    return MakeTextResult(text);
}

} // namespace date_mcp
