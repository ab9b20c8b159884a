#include <date_mcp/time/timezone_resolver.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace date_mcp {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string BuildRemediation(std::string_view location) {
    const std::string name(location);
    std::ostringstream oss;
    oss << "To add '" << name << "', set the " << kLocationsEnvVar
        << " environment variable to a comma-separated list of "
        << "Name=Area/City pairs using IANA timezone identifiers, "
        << "then restart the server.\n"
        << "Example: " << kLocationsEnvVar << "=\"" << name << "=Area/City\"\n"
        << "Multiple locations: " << kLocationsEnvVar << "=\"" << name
        << "=Area/City,Another Place=Area/Other_City\"";
    return oss.str();
}

} // anonymous namespace

std::string ResolutionFailure::Message() const {
    std::ostringstream oss;
    oss << "Location '" << queried_location << "' not found.";
    if (!known_sample.empty()) {
        oss << " Known locations include: ";
        for (size_t i = 0; i < known_sample.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << known_sample[i];
        }
        oss << " (use list_available_locations for the full list).";
    }
    oss << '\n' << remediation;
    return oss.str();
}

TimezoneResolver::TimezoneResolver(const LocationTable& table)
    : table_(table) {}

Result<std::string, ResolutionFailure> TimezoneResolver::Resolve(
    std::string_view location) const {
    if (auto exact = table_.Get(location)) {
        return Result<std::string, ResolutionFailure>::Ok(std::move(*exact));
    }

    for (const auto& entry : table_.Entries()) {
        if (EqualsIgnoreCase(entry.name, location)) {
            return Result<std::string, ResolutionFailure>::Ok(entry.timezone_id);
        }
    }

    return Result<std::string, ResolutionFailure>::Err(MakeFailure(location));
}

ResolutionFailure TimezoneResolver::MakeFailure(std::string_view location) const {
    ResolutionFailure failure;
    failure.queried_location = std::string(location);

    const auto& entries = table_.Entries();
    const auto count = std::min(entries.size(), kResolutionSampleSize);
    failure.known_sample.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        failure.known_sample.push_back(entries[i].name);
    }

    failure.remediation = BuildRemediation(location);
    return failure;
}

} // namespace date_mcp
