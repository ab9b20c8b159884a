#include <date_mcp/time/location_table.hpp>

#include <date_mcp/core/types.hpp>

#include <algorithm>

namespace date_mcp {

namespace {

constexpr struct {
    const char* name;
    const char* timezone_id;
} kBuiltinLocations[] = {
    // North America
    {"New York", "America/New_York"},
    {"Los Angeles", "America/Los_Angeles"},
    {"Chicago", "America/Chicago"},
    {"Denver", "America/Denver"},
    {"Phoenix", "America/Phoenix"},
    {"Anchorage", "America/Anchorage"},
    {"Honolulu", "Pacific/Honolulu"},
    {"Toronto", "America/Toronto"},
    {"Vancouver", "America/Vancouver"},
    {"Mexico City", "America/Mexico_City"},
    // South America
    {"Sao Paulo", "America/Sao_Paulo"},
    {"Buenos Aires", "America/Argentina/Buenos_Aires"},
    {"Bogota", "America/Bogota"},
    {"Lima", "America/Lima"},
    {"Santiago", "America/Santiago"},
    // Europe
    {"London", "Europe/London"},
    {"Dublin", "Europe/Dublin"},
    {"Lisbon", "Europe/Lisbon"},
    {"Paris", "Europe/Paris"},
    {"Berlin", "Europe/Berlin"},
    {"Madrid", "Europe/Madrid"},
    {"Rome", "Europe/Rome"},
    {"Amsterdam", "Europe/Amsterdam"},
    {"Zurich", "Europe/Zurich"},
    {"Stockholm", "Europe/Stockholm"},
    {"Warsaw", "Europe/Warsaw"},
    {"Athens", "Europe/Athens"},
    {"Istanbul", "Europe/Istanbul"},
    {"Moscow", "Europe/Moscow"},
    // Africa and Middle East
    {"Cairo", "Africa/Cairo"},
    {"Lagos", "Africa/Lagos"},
    {"Nairobi", "Africa/Nairobi"},
    {"Johannesburg", "Africa/Johannesburg"},
    {"Dubai", "Asia/Dubai"},
    {"Tel Aviv", "Asia/Jerusalem"},
    // Asia
    {"Karachi", "Asia/Karachi"},
    {"Mumbai", "Asia/Kolkata"},
    {"New Delhi", "Asia/Kolkata"},
    {"Bangkok", "Asia/Bangkok"},
    {"Jakarta", "Asia/Jakarta"},
    {"Singapore", "Asia/Singapore"},
    {"Hong Kong", "Asia/Hong_Kong"},
    {"Shanghai", "Asia/Shanghai"},
    {"Beijing", "Asia/Shanghai"},
    {"Taipei", "Asia/Taipei"},
    {"Seoul", "Asia/Seoul"},
    {"Tokyo", "Asia/Tokyo"},
    // Oceania
    {"Perth", "Australia/Perth"},
    {"Sydney", "Australia/Sydney"},
    {"Melbourne", "Australia/Melbourne"},
    {"Auckland", "Pacific/Auckland"},
    // Reference
    {"UTC", "UTC"},
};

std::string_view Trim(std::string_view s) {
    const auto* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

LocationTable LocationTable::WithDefaults() {
    LocationTable table;
    table.SeedDefaults();
    return table;
}

void LocationTable::SeedDefaults() {
    for (const auto& builtin : kBuiltinLocations) {
        Upsert({builtin.name, builtin.timezone_id});
    }
}

bool LocationTable::Upsert(LocationEntry entry) {
    if (!IsValidUtf8(entry.name) || !IsValidUtf8(entry.timezone_id)) {
        return false;
    }
    auto it = index_.find(entry.name);
    if (it != index_.end()) {
        entries_[it->second].timezone_id = std::move(entry.timezone_id);
        return true;
    }
    index_.emplace(entry.name, entries_.size());
    entries_.push_back(std::move(entry));
    return true;
}

std::size_t LocationTable::ApplyOverrides(std::string_view raw) {
    std::size_t applied = 0;
    size_t start = 0;
    while (start <= raw.size()) {
        auto comma = raw.find(',', start);
        auto item = raw.substr(start, comma == std::string_view::npos
                                          ? std::string_view::npos
                                          : comma - start);

        auto eq = item.find('=');
        if (eq != std::string_view::npos) {
            auto name = Trim(item.substr(0, eq));
            auto zone = Trim(item.substr(eq + 1));
            if (!name.empty() && !zone.empty() &&
                Upsert({std::string(name), std::string(zone)})) {
                ++applied;
            }
        }

        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return applied;
}

std::optional<std::string> LocationTable::Get(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].timezone_id;
}

std::vector<std::string> LocationTable::SortedNames() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace date_mcp
