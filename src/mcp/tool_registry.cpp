#include <date_mcp/mcp/tool_registry.hpp>

#include <algorithm>
#include <utility>

namespace date_mcp {

namespace {

constexpr ToolKind kAllTools[] = {
    ToolKind::DayName,
    ToolKind::IsoDate,
    ToolKind::CurrentTime,
    ToolKind::CurrentTimeUtc,
    ToolKind::CurrentTimeLocation,
    ToolKind::ListAvailableLocations,
};

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json NoParams() {
    return MakeSchema(nlohmann::json::object(), nlohmann::json::array());
}

} // anonymous namespace

std::string_view ToolName(ToolKind kind) {
    switch (kind) {
        case ToolKind::DayName:                return "get_day_name";
        case ToolKind::IsoDate:                return "get_iso_date";
        case ToolKind::CurrentTime:            return "current_time";
        case ToolKind::CurrentTimeUtc:         return "current_time_utc";
        case ToolKind::CurrentTimeLocation:    return "current_time_location";
        case ToolKind::ListAvailableLocations: return "list_available_locations";
    }
    return "";
}

std::optional<ToolKind> ParseToolKind(std::string_view name) {
    auto it = std::find_if(std::begin(kAllTools), std::end(kAllTools),
                           [name](ToolKind kind) { return ToolName(kind) == name; });
    if (it == std::end(kAllTools)) {
        return std::nullopt;
    }
    return *it;
}

ToolResult MakeTextResult(const std::string& text) {
    return ToolResult{
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

ToolRegistry::ToolRegistry() {
    auto add = [this](ToolKind kind, const std::string& description,
                      nlohmann::json input_schema) {
        schemas_.push_back({kind, std::string(ToolName(kind)), description,
                            std::move(input_schema)});
    };

    add(ToolKind::DayName,
        "Get the name of the current day of the week",
        NoParams());
    add(ToolKind::IsoDate,
        "Get the current date in ISO 8601 format (YYYY-MM-DD)",
        NoParams());
    add(ToolKind::CurrentTime,
        "Get the current local time as an ISO 8601 timestamp with UTC offset",
        NoParams());
    add(ToolKind::CurrentTimeUtc,
        "Get the current UTC time as an ISO 8601 timestamp ending in 'Z'",
        NoParams());
    add(ToolKind::CurrentTimeLocation,
        "Get the current time at a named location (e.g. 'Tokyo', 'New York') "
        "as an ISO 8601 timestamp with UTC offset",
        MakeSchema(
            {{"location", StringProp("Location name, e.g. 'London'. "
                                     "Matching is case-insensitive.")}},
            nlohmann::json::array({"location"})));
    add(ToolKind::ListAvailableLocations,
        "List all location names accepted by current_time_location",
        NoParams());
}

} // namespace date_mcp
