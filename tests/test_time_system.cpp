/// @file test_time_system.cpp
/// @brief Unit tests for sunpath::astro::TimeSystem.
///
/// Verifies Julian Date conversion (Meeus algorithm), GMST (IAU 1982),
/// local sidereal time, instant handling and timestamp parsing.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cmath>

using namespace sunpath;
using namespace sunpath::astro;

// =================================================================
// Helper: approximate equality for floating-point comparisons
// =================================================================

static constexpr f64 kJdTolerance     = 1e-6;   // ~0.086 seconds
static constexpr f64 kAngleTolDeg     = 1e-6;
static constexpr f64 kSecondTolerance = 1e-3;

static Instant utc(i32 year, i32 month, i32 day, i32 hour, i32 minute, f64 second = 0.0)
{
    return TimeSystem::to_instant(DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    });
}

// =================================================================
// Julian Date conversion tests
// =================================================================

TEST_CASE("J2000.0 epoch gives JD 2451545.0")
{
    const DateTime j2000 = {
        .year   = 2000,
        .month  = 1,
        .day    = 1,
        .hour   = 12,
        .minute = 0,
        .second = 0.0,
    };

    const f64 jd = TimeSystem::to_julian_date(j2000);
    CHECK(std::abs(jd - 2451545.0) < kJdTolerance);
}

TEST_CASE("Known date: 1999-01-01 00:00 UTC → JD 2451179.5")
{
    const DateTime dt = {
        .year   = 1999,
        .month  = 1,
        .day    = 1,
        .hour   = 0,
        .minute = 0,
        .second = 0.0,
    };

    CHECK(std::abs(TimeSystem::to_julian_date(dt) - 2451179.5) < kJdTolerance);
}

TEST_CASE("Known date: 2024-06-15 22:30:00 UTC")
{
    // Reference value from USNO Julian Date converter
    const DateTime dt = {
        .year   = 2024,
        .month  = 6,
        .day    = 15,
        .hour   = 22,
        .minute = 30,
        .second = 0.0,
    };

    CHECK(std::abs(TimeSystem::to_julian_date(dt) - 2460477.4375) < kJdTolerance);
}

TEST_CASE("Known date: 2024-03-20 12:00 UTC → JD 2460390.0")
{
    CHECK(std::abs(TimeSystem::julian_day(utc(2024, 3, 20, 12, 0)) - 2460390.0) < kJdTolerance);
}

// =================================================================
// Instants
// =================================================================

TEST_CASE("to_date_time splits an instant into UTC fields with milliseconds")
{
    const Instant t = utc(2024, 6, 15, 22, 30) + std::chrono::milliseconds{45250};
    const DateTime dt = TimeSystem::to_date_time(t);

    CHECK(dt.year   == 2024);
    CHECK(dt.month  == 6);
    CHECK(dt.day    == 15);
    CHECK(dt.hour   == 22);
    CHECK(dt.minute == 30);
    CHECK(std::abs(dt.second - 45.25) < kSecondTolerance);

    CHECK(TimeSystem::to_instant(dt) == t);
}

TEST_CASE("to_instant matches the Unix epoch")
{
    const Instant epoch = utc(1970, 1, 1, 0, 0);
    CHECK(epoch.time_since_epoch().count() == 0);
    CHECK(std::abs(TimeSystem::julian_day(epoch) - 2440587.5) < kJdTolerance);
}

TEST_CASE("Julian Day keeps the millisecond fraction")
{
    const Instant noon = utc(2000, 1, 1, 12, 0);
    const Instant later = noon + std::chrono::milliseconds{500};

    const f64 delta = TimeSystem::julian_day(later) - TimeSystem::julian_day(noon);
    CHECK(std::abs(delta - 0.5 / astro_constants::kSecondsPerDay) < 1e-8);
}

TEST_CASE("days_since_j2000 is zero at the epoch and counts whole days")
{
    CHECK(std::abs(TimeSystem::days_since_j2000(utc(2000, 1, 1, 12, 0))) < kJdTolerance);
    CHECK(std::abs(TimeSystem::days_since_j2000(utc(2000, 1, 2, 12, 0)) - 1.0) < kJdTolerance);
    CHECK(std::abs(TimeSystem::days_since_j2000(utc(1999, 12, 31, 0, 0)) + 1.5) < kJdTolerance);
}

// =================================================================
// Julian centuries
// =================================================================

TEST_CASE("Julian centuries at J2000.0 is 0.0")
{
    const f64 t = TimeSystem::julian_centuries(astro_constants::kJ2000);
    CHECK(t == doctest::Approx(0.0).epsilon(1e-12));
}

TEST_CASE("Julian centuries at J2100.0")
{
    const f64 jd = TimeSystem::julian_day(utc(2100, 1, 1, 12, 0));
    CHECK(TimeSystem::julian_centuries(jd) == doctest::Approx(1.0).epsilon(0.001));
}

// =================================================================
// Sidereal time
// =================================================================

TEST_CASE("GMST at J2000.0 is 280.46061837°")
{
    const f64 gmst_deg = TimeSystem::gmst_degrees(astro_constants::kJ2000);
    CHECK(std::abs(gmst_deg - 280.46061837) < kAngleTolDeg);

    const f64 gmst_rad = TimeSystem::gmst(astro_constants::kJ2000);
    CHECK(std::abs(gmst_rad * astro_constants::kRadToDeg - 280.46061837) < kAngleTolDeg);
}

TEST_CASE("GMST is in range [0, 2π)")
{
    const f64 dates[] = {
        2451545.0,   // J2000.0
        2460000.0,   // ~2023
        2460476.0,   // ~2024-06
        2440587.5,   // Unix epoch
        2415020.5,   // 1900
    };

    for (const f64 jd : dates)
    {
        const f64 gmst_rad = TimeSystem::gmst(jd);
        CHECK(gmst_rad >= 0.0);
        CHECK(gmst_rad < astro_constants::kTwoPi);
    }
}

TEST_CASE("LMST at Greenwich (longitude 0) equals GMST")
{
    const f64 jd = astro_constants::kJ2000;
    CHECK(TimeSystem::lmst(jd, 0.0) == doctest::Approx(TimeSystem::gmst(jd)).epsilon(1e-12));
}

TEST_CASE("Local sidereal time shifts by longitude and wraps")
{
    const Instant j2000 = utc(2000, 1, 1, 12, 0);

    const f64 greenwich = TimeSystem::local_sidereal_time(j2000, 0.0) * astro_constants::kRadToDeg;
    CHECK(std::abs(greenwich - 280.46061837) < kAngleTolDeg);

    // 280.46 + 90 wraps past 360
    const f64 east = TimeSystem::local_sidereal_time(j2000, 90.0) * astro_constants::kRadToDeg;
    CHECK(std::abs(east - 10.46061837) < kAngleTolDeg);

    const f64 west = TimeSystem::local_sidereal_time(j2000, -90.0) * astro_constants::kRadToDeg;
    CHECK(std::abs(west - 190.46061837) < kAngleTolDeg);

    const f64 lst = TimeSystem::local_sidereal_time(utc(2024, 6, 21, 3, 17), -104.02);
    CHECK(lst >= 0.0);
    CHECK(lst < astro_constants::kTwoPi);
}

TEST_CASE("Local sidereal time of an instant matches LMST of its Julian Day")
{
    const Instant t = utc(2024, 6, 21, 3, 17);
    const f64 jd = TimeSystem::julian_day(t);

    for (const f64 lon : {-179.5, -104.02, 0.0, 15.0, 151.21})
    {
        const f64 lst = TimeSystem::local_sidereal_time(t, lon);
        CHECK(std::abs(lst - TimeSystem::lmst(jd, lon * astro_constants::kDegToRad)) < 1e-12);

        const f64 expected_deg = std::fmod(TimeSystem::gmst_degrees(jd) + lon + 360.0, 360.0);
        CHECK(std::abs(lst * astro_constants::kRadToDeg - expected_deg) < 1e-9);
    }
}

// =================================================================
// Timestamp parsing
// =================================================================

TEST_CASE("parse_iso8601 accepts the supported forms")
{
    const Instant expected = utc(2024, 3, 20, 12, 34, 56.0);

    SUBCASE("With seconds and Z")
    {
        const auto t = TimeSystem::parse_iso8601("2024-03-20T12:34:56Z");
        REQUIRE(t.has_value());
        CHECK(*t == expected);
    }

    SUBCASE("Without Z")
    {
        const auto t = TimeSystem::parse_iso8601("2024-03-20T12:34:56");
        REQUIRE(t.has_value());
        CHECK(*t == expected);
    }

    SUBCASE("Space separator, no seconds")
    {
        const auto t = TimeSystem::parse_iso8601("2024-03-20 12:34");
        REQUIRE(t.has_value());
        CHECK(*t == utc(2024, 3, 20, 12, 34));
    }
}

TEST_CASE("parse_iso8601 rejects malformed timestamps")
{
    CHECK_FALSE(TimeSystem::parse_iso8601("").has_value());
    CHECK_FALSE(TimeSystem::parse_iso8601("garbage").has_value());
    CHECK_FALSE(TimeSystem::parse_iso8601("2024/03/20T12:00Z").has_value());
    CHECK_FALSE(TimeSystem::parse_iso8601("2024-03-20T12:00:00+01:00").has_value());
    CHECK_FALSE(TimeSystem::parse_iso8601("2024-0X-20T12:00Z").has_value());
    CHECK_FALSE(TimeSystem::parse_iso8601("2024-02-30T12:00Z").has_value());
    CHECK_FALSE(TimeSystem::parse_iso8601("2024-03-20T24:00Z").has_value());
    CHECK_FALSE(TimeSystem::parse_iso8601("2024-03-20T12:60Z").has_value());
}

// =================================================================
// now() sanity check
// =================================================================

TEST_CASE("now() returns a reasonable Julian Date")
{
    const f64 jd = TimeSystem::julian_day(TimeSystem::now());

    // Should be after 2020-01-01 (JD ~2458849.5) and before 2100
    CHECK(jd > 2458849.5);
    CHECK(jd < 2488070.0);
}
