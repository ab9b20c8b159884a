#pragma once

#include <date_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace date_mcp {

// True if `s` is well-formed UTF-8 (no overlong forms, no surrogates, nothing
// above U+10FFFF). Everything sent to the client must pass this.
[[nodiscard]] bool IsValidUtf8(std::string_view s);

// ---------------------------------------------------------------------------
// TimezoneId — syntactically valid IANA timezone identifier.
//
// Rules:
//   - Non-empty, max 255 characters
//   - ASCII letters, digits, '_', '-', '+' and '/' as segment separator
//   - No leading or trailing '/', no empty segment
//
// Only the shape is checked here; whether the host database actually has
// the zone is answered by TimezoneExists() in time/zone_clock.hpp.
// ---------------------------------------------------------------------------
class TimezoneId {
public:
    static Result<TimezoneId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const TimezoneId& other) const { return value_ == other.value_; }
    bool operator!=(const TimezoneId& other) const { return value_ != other.value_; }

private:
    explicit TimezoneId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace date_mcp
