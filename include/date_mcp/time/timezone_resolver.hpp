#pragma once

#include <date_mcp/core/result.hpp>
#include <date_mcp/time/location_table.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace date_mcp {

// Number of known locations quoted back when a lookup fails.
constexpr std::size_t kResolutionSampleSize = 5;

// ---------------------------------------------------------------------------
// ResolutionFailure — a location that matched nothing, with enough context
// for the client to fix it: a sample of known names and instructions for
// adding the location through DATE_MCP_LOCATIONS.
// ---------------------------------------------------------------------------
struct ResolutionFailure {
    std::string queried_location;
    std::vector<std::string> known_sample;
    std::string remediation;

    // Single human-readable message: not-found line, sample, remediation.
    [[nodiscard]] std::string Message() const;
};

// ---------------------------------------------------------------------------
// TimezoneResolver — location name -> IANA timezone identifier.
//
// Lookup order, first match wins:
//   1. exact name
//   2. ASCII case-insensitive name, in table order
// The table is borrowed and must outlive the resolver.
// ---------------------------------------------------------------------------
class TimezoneResolver {
public:
    explicit TimezoneResolver(const LocationTable& table);

    [[nodiscard]] Result<std::string, ResolutionFailure> Resolve(
        std::string_view location) const;

    [[nodiscard]] const LocationTable& Table() const noexcept { return table_; }

private:
    [[nodiscard]] ResolutionFailure MakeFailure(std::string_view location) const;

    const LocationTable& table_;
};

} // namespace date_mcp
