#include <date_mcp/time/zone_clock.hpp>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace date_mcp {

namespace {

constexpr const char* kWeekdayNames[] = {
    "Sunday", "Monday", "Tuesday", "Wednesday",
    "Thursday", "Friday", "Saturday",
};

constexpr char kTzifMagic[4] = {'T', 'Z', 'i', 'f'};

std::mutex& ZoneMutex() {
    static std::mutex mutex;
    return mutex;
}

std::tm ToLocalTm(std::time_t t) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    return local;
}

std::tm ToUtcTm(std::time_t t) {
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif
    return utc;
}

// Seconds east of UTC for a broken-down local time of `t`.
long UtcOffset(std::time_t t, std::tm local) {
#ifdef _WIN32
    return static_cast<long>(_mkgmtime(&local) - t);
#else
    (void)t;
    return local.tm_gmtoff;
#endif
}

void SetTz(const char* value) {
#ifdef _WIN32
    _putenv_s("TZ", value);
    _tzset();
#else
    ::setenv("TZ", value, 1);
    ::tzset();
#endif
}

void ClearTz() {
#ifdef _WIN32
    _putenv_s("TZ", "");
    _tzset();
#else
    ::unsetenv("TZ");
    ::tzset();
#endif
}

// Whole seconds since the epoch plus the sub-second part in microseconds,
// floored so that pre-epoch instants still produce 0..999999.
std::pair<std::time_t, long> SplitMicros(TimePoint tp) {
    using std::chrono::duration_cast;
    using std::chrono::microseconds;

    auto micros = duration_cast<microseconds>(tp.time_since_epoch()).count();
    auto secs = micros / 1000000;
    auto frac = micros % 1000000;
    if (frac < 0) {
        frac += 1000000;
        --secs;
    }
    return {static_cast<std::time_t>(secs), static_cast<long>(frac)};
}

void WriteDateTime(std::ostream& out, const std::tm& tm, long micros) {
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(6) << micros;
}

// +HH:MM, or +HH:MM:SS for the rare zone with a seconds component.
void WriteOffset(std::ostream& out, long gmtoff) {
    out << (gmtoff < 0 ? '-' : '+');
    long abs_off = gmtoff < 0 ? -gmtoff : gmtoff;
    out << std::setfill('0') << std::setw(2) << abs_off / 3600
        << ':' << std::setw(2) << (abs_off % 3600) / 60;
    if (abs_off % 60 != 0) {
        out << ':' << std::setw(2) << abs_off % 60;
    }
}

// Caller holds ZoneMutex().
std::string FormatIsoLocalUnlocked(TimePoint tp) {
    auto [secs, micros] = SplitMicros(tp);
    auto local = ToLocalTm(secs);
    std::ostringstream oss;
    WriteDateTime(oss, local, micros);
    WriteOffset(oss, UtcOffset(secs, local));
    return oss.str();
}

} // anonymous namespace

std::string ZoneInfoDir() {
    const char* tzdir = std::getenv("TZDIR");
    if (tzdir != nullptr && *tzdir != '\0') {
        return tzdir;
    }
    return "/usr/share/zoneinfo";
}

bool TimezoneExists(const TimezoneId& zone) {
    // glibc resolves UTC without a database file.
    if (zone.Value() == "UTC") {
        return true;
    }
    std::error_code ec;
    auto path = std::filesystem::path(ZoneInfoDir()) / zone.Value();
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }

    // Only compiled zone files count; the database directory also holds
    // tables such as leapseconds and zone1970.tab.
    std::ifstream in(path, std::ios::binary);
    char magic[4] = {};
    if (!in.read(magic, sizeof(magic))) {
        return false;
    }
    return std::memcmp(magic, kTzifMagic, sizeof(magic)) == 0;
}

std::string WeekdayName(TimePoint tp) {
    std::lock_guard<std::mutex> lock(ZoneMutex());
    auto local = ToLocalTm(SplitMicros(tp).first);
    return kWeekdayNames[local.tm_wday];
}

std::string FormatIsoDate(TimePoint tp) {
    std::lock_guard<std::mutex> lock(ZoneMutex());
    auto local = ToLocalTm(SplitMicros(tp).first);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d");
    return oss.str();
}

std::string FormatIsoLocal(TimePoint tp) {
    std::lock_guard<std::mutex> lock(ZoneMutex());
    return FormatIsoLocalUnlocked(tp);
}

std::string FormatIsoUtc(TimePoint tp) {
    auto [secs, micros] = SplitMicros(tp);
    auto utc = ToUtcTm(secs);
    std::ostringstream oss;
    WriteDateTime(oss, utc, micros);
    oss << 'Z';
    return oss.str();
}

Result<std::string, Error> FormatIsoInZone(TimePoint tp, const TimezoneId& zone) {
    if (!TimezoneExists(zone)) {
        return Result<std::string, Error>::Err(Error{
            "FormatIsoInZone",
            "Timezone '" + zone.Value() + "' is not available in the host "
            "timezone database (" + ZoneInfoDir() + ")",
            ErrorCategory::TimezoneUnavailable,
            {}});
    }

    ScopedTimezone guard(zone);
    return Result<std::string, Error>::Ok(FormatIsoLocalUnlocked(tp));
}

// ---------------------------------------------------------------------------
// ScopedTimezone
// ---------------------------------------------------------------------------
ScopedTimezone::ScopedTimezone(const TimezoneId& zone)
    : lock_(ZoneMutex()) {
    const char* old_tz = std::getenv("TZ");
    had_tz_ = (old_tz != nullptr);
    if (had_tz_) {
        old_tz_ = old_tz;
    }
    SetTz(zone.Value().c_str());
}

ScopedTimezone::~ScopedTimezone() {
    if (had_tz_) {
        SetTz(old_tz_.c_str());
    } else {
        ClearTz();
    }
}

} // namespace date_mcp
