#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace date_mcp {

// The date/time tools, in catalog order.
enum class ToolKind {
    DayName,
    IsoDate,
    CurrentTime,
    CurrentTimeUtc,
    CurrentTimeLocation,
    ListAvailableLocations,
};

// Wire name of a tool ("get_day_name", ...).
std::string_view ToolName(ToolKind kind);

// Inverse of ToolName; nullopt for names that are not tools.
std::optional<ToolKind> ParseToolKind(std::string_view name);

// ---------------------------------------------------------------------------
// ToolSchema — one catalog entry as advertised by tools/list.
// ---------------------------------------------------------------------------
struct ToolSchema {
    ToolKind kind;
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult — successful tool output: an array of content blocks.
// ---------------------------------------------------------------------------
struct ToolResult {
    nlohmann::json content = nlohmann::json::array();
};

// Single {"type": "text", "text": ...} block result.
ToolResult MakeTextResult(const std::string& text);

// ---------------------------------------------------------------------------
// ToolRegistry — the fixed catalog of date/time tools.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    ToolRegistry();

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

private:
    std::vector<ToolSchema> schemas_;
};

} // namespace date_mcp
