#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace date_mcp {

// Environment variable holding comma-separated "Name=Area/City" overrides.
constexpr const char* kLocationsEnvVar = "DATE_MCP_LOCATIONS";

struct LocationEntry {
    std::string name;
    std::string timezone_id;

    bool operator==(const LocationEntry& other) const {
        return name == other.name && timezone_id == other.timezone_id;
    }
};

// ---------------------------------------------------------------------------
// LocationTable — location name -> IANA timezone identifier.
//
// Built once during startup (SeedDefaults, then Upsert/ApplyOverrides from
// the configured sources) and read-only afterwards. Names are matched
// exactly here; case-insensitive matching is TimezoneResolver's job.
// Entries keep insertion order; overwriting a name keeps its position.
// ---------------------------------------------------------------------------
class LocationTable {
public:
    LocationTable() = default;

    // Table with the built-in entries already seeded.
    static LocationTable WithDefaults();

    void SeedDefaults();

    // Insert or overwrite one entry by exact name. Entries whose name or
    // timezone is not valid UTF-8 are not stored; returns false for those.
    bool Upsert(LocationEntry entry);

    // Parse "City=Area/City,Other=Area/Other". Both sides are trimmed.
    // Entries without '=', with an empty name or an empty timezone, or that
    // Upsert refuses are skipped. Returns the number of entries applied.
    std::size_t ApplyOverrides(std::string_view raw);

    [[nodiscard]] std::optional<std::string> Get(std::string_view name) const;

    [[nodiscard]] const std::vector<LocationEntry>& Entries() const noexcept {
        return entries_;
    }

    // All names in ascending ordinal order.
    [[nodiscard]] std::vector<std::string> SortedNames() const;

    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }

private:
    std::vector<LocationEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace date_mcp
