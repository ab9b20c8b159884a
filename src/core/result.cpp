#include <date_mcp/core/result.hpp>

#include <sstream>

namespace date_mcp {

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config:              return 2;
        case ErrorCategory::UnknownTool:         return 3;
        case ErrorCategory::InvalidArgument:     return 3;
        case ErrorCategory::LocationNotFound:    return 4;
        case ErrorCategory::TimezoneUnavailable: return 5;
        case ErrorCategory::UnknownPrompt:       return 3;
        case ErrorCategory::Internal:            return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:              return "config";
        case ErrorCategory::UnknownTool:         return "unknown_tool";
        case ErrorCategory::InvalidArgument:     return "invalid_argument";
        case ErrorCategory::LocationNotFound:    return "location_not_found";
        case ErrorCategory::TimezoneUnavailable: return "timezone_unavailable";
        case ErrorCategory::UnknownPrompt:       return "unknown_prompt";
        case ErrorCategory::Internal:            return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << " [" << CategoryName() << "]: " << message;
    return oss.str();
}

} // namespace date_mcp
