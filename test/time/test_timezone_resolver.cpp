#include <catch2/catch_test_macros.hpp>

#include <date_mcp/time/timezone_resolver.hpp>

#include <algorithm>
#include <cctype>
#include <string>

using namespace date_mcp;

namespace {

std::string Upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

// ===========================================================================
// Exact and case-insensitive lookup
// ===========================================================================

TEST_CASE("TimezoneResolver: every built-in resolves to its zone", "[time][resolver]") {
    auto table = LocationTable::WithDefaults();
    TimezoneResolver resolver(table);

    for (const auto& entry : table.Entries()) {
        INFO(entry.name);
        auto r = resolver.Resolve(entry.name);
        REQUIRE(r.IsOk());
        CHECK(r.Value() == entry.timezone_id);
    }
}

TEST_CASE("TimezoneResolver: upper and lower case match built-ins", "[time][resolver]") {
    auto table = LocationTable::WithDefaults();
    TimezoneResolver resolver(table);

    for (const auto& entry : table.Entries()) {
        INFO(entry.name);
        auto upper = resolver.Resolve(Upper(entry.name));
        auto lower = resolver.Resolve(Lower(entry.name));
        REQUIRE(upper.IsOk());
        REQUIRE(lower.IsOk());
        CHECK(upper.Value() == entry.timezone_id);
        CHECK(lower.Value() == entry.timezone_id);
    }
}

TEST_CASE("TimezoneResolver: configured entries resolve exactly", "[time][resolver]") {
    auto table = LocationTable::WithDefaults();
    table.ApplyOverrides("Vienna=Europe/Vienna,A=X/Y,B=P/Q");
    TimezoneResolver resolver(table);

    CHECK(resolver.Resolve("Vienna").Value() == "Europe/Vienna");
    CHECK(resolver.Resolve("A").Value() == "X/Y");
    CHECK(resolver.Resolve("B").Value() == "P/Q");
    CHECK(resolver.Resolve("VIENNA").Value() == "Europe/Vienna");
}

TEST_CASE("TimezoneResolver: exact match beats case-insensitive match", "[time][resolver]") {
    LocationTable table;
    table.Upsert({"Paris", "Europe/Paris"});
    table.Upsert({"paris", "America/Chicago"});  // Paris, Texas
    TimezoneResolver resolver(table);

    CHECK(resolver.Resolve("Paris").Value() == "Europe/Paris");
    CHECK(resolver.Resolve("paris").Value() == "America/Chicago");
    // No exact entry: first case-insensitive match in table order.
    CHECK(resolver.Resolve("PARIS").Value() == "Europe/Paris");
}

TEST_CASE("TimezoneResolver: override of a built-in is visible", "[time][resolver]") {
    auto table = LocationTable::WithDefaults();
    table.ApplyOverrides("Tokyo=Asia/Seoul");
    TimezoneResolver resolver(table);

    CHECK(resolver.Resolve("Tokyo").Value() == "Asia/Seoul");
    CHECK(resolver.Resolve("tokyo").Value() == "Asia/Seoul");
}

// ===========================================================================
// LocationNotFound
// ===========================================================================

TEST_CASE("TimezoneResolver: unknown location fails with remediation", "[time][resolver]") {
    auto table = LocationTable::WithDefaults();
    TimezoneResolver resolver(table);

    auto r = resolver.Resolve("Nonexistent City");
    REQUIRE(r.IsErr());
    const auto& failure = r.Error();

    CHECK(failure.queried_location == "Nonexistent City");
    CHECK(failure.known_sample.size() <= kResolutionSampleSize);
    CHECK(failure.known_sample.size() == 5);
    CHECK(failure.remediation.find("Nonexistent City") != std::string::npos);
    CHECK(failure.remediation.find(kLocationsEnvVar) != std::string::npos);
    CHECK(failure.remediation.find("Nonexistent City=Area/City") != std::string::npos);
    // Multi-location example.
    CHECK(failure.remediation.find("Nonexistent City=Area/City,") != std::string::npos);
}

TEST_CASE("TimezoneResolver: sample is the first five table entries", "[time][resolver]") {
    auto table = LocationTable::WithDefaults();
    TimezoneResolver resolver(table);

    auto r = resolver.Resolve("Atlantis");
    REQUIRE(r.IsErr());
    for (size_t i = 0; i < r.Error().known_sample.size(); ++i) {
        CHECK(r.Error().known_sample[i] == table.Entries()[i].name);
    }
}

TEST_CASE("TimezoneResolver: sample shrinks with a small table", "[time][resolver]") {
    LocationTable table;
    table.Upsert({"Vienna", "Europe/Vienna"});
    table.Upsert({"Graz", "Europe/Vienna"});
    TimezoneResolver resolver(table);

    auto r = resolver.Resolve("Linz");
    REQUIRE(r.IsErr());
    CHECK(r.Error().known_sample == std::vector<std::string>{"Vienna", "Graz"});
}

TEST_CASE("TimezoneResolver: empty table still produces remediation", "[time][resolver]") {
    LocationTable table;
    TimezoneResolver resolver(table);

    auto r = resolver.Resolve("Anywhere");
    REQUIRE(r.IsErr());
    CHECK(r.Error().known_sample.empty());
    CHECK(r.Error().Message().find("Anywhere") != std::string::npos);
}

TEST_CASE("ResolutionFailure: Message joins sample and remediation", "[time][resolver]") {
    auto table = LocationTable::WithDefaults();
    TimezoneResolver resolver(table);

    auto message = resolver.Resolve("Gotham").Error().Message();
    CHECK(message.find("Location 'Gotham' not found.") == 0);
    CHECK(message.find("New York") != std::string::npos);
    CHECK(message.find("list_available_locations") != std::string::npos);
    CHECK(message.find(kLocationsEnvVar) != std::string::npos);
}

TEST_CASE("TimezoneResolver: failure leaves the table untouched", "[time][resolver]") {
    auto table = LocationTable::WithDefaults();
    const auto before = table.Entries();
    TimezoneResolver resolver(table);

    (void)resolver.Resolve("Nowhere");
    CHECK(table.Entries() == before);
}
