#pragma once

#include <date_mcp/core/result.hpp>
#include <date_mcp/core/types.hpp>

#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace date_mcp {

using TimePoint = std::chrono::system_clock::time_point;

// Host timezone database root: $TZDIR if set, else /usr/share/zoneinfo.
std::string ZoneInfoDir();

// True if the host timezone database has `zone`.
bool TimezoneExists(const TimezoneId& zone);

// English weekday name ("Monday") of tp's date in the host local timezone.
std::string WeekdayName(TimePoint tp);

// tp's date in the host local timezone as YYYY-MM-DD.
std::string FormatIsoDate(TimePoint tp);

// tp in the host local timezone, e.g. 2026-10-19T14:05:09.123456+02:00.
std::string FormatIsoLocal(TimePoint tp);

// tp in UTC with a literal Z suffix, e.g. 2026-10-19T12:05:09.123456Z.
std::string FormatIsoUtc(TimePoint tp);

// tp in the named IANA zone with its UTC offset. Fails with
// TimezoneUnavailable when the host database does not have the zone.
Result<std::string, Error> FormatIsoInZone(TimePoint tp, const TimezoneId& zone);

// ---------------------------------------------------------------------------
// ScopedTimezone — points the process TZ at `zone` for the guard's lifetime
// and restores the previous value afterwards.
//
// TZ is process-wide, so the guard holds a process-wide mutex that the
// local-time formatters above also take. Do not nest guards.
// ---------------------------------------------------------------------------
class ScopedTimezone {
public:
    explicit ScopedTimezone(const TimezoneId& zone);
    ~ScopedTimezone();

    ScopedTimezone(const ScopedTimezone&) = delete;
    ScopedTimezone& operator=(const ScopedTimezone&) = delete;

private:
    std::lock_guard<std::mutex> lock_;
    std::string old_tz_;
    bool had_tz_ = false;
};

} // namespace date_mcp
