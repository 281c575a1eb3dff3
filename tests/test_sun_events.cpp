/// @file test_sun_events.cpp
/// @brief Unit tests for sunpath::astro::SunEvents.
///
/// Verifies sunrise/sunset bracketing and bisection, polar day/night,
/// fixed-offset local days and the solar transit search.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/sun_events.hpp"
#include "astro/sun_model.hpp"
#include "astro/time_system.hpp"
#include "astro/time_zone.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cmath>

using namespace sunpath;
using namespace sunpath::astro;
using namespace std::chrono_literals;

// =================================================================
// Helpers
// =================================================================

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

/// @brief |a - b| within a tolerance.
static bool near(Instant a, Instant b, std::chrono::milliseconds tolerance)
{
    const auto diff = a > b ? a - b : b - a;
    return diff <= tolerance;
}

static f64 altitude_deg(Instant t, const GeoCoordinate& location)
{
    return SunModel::horizontal(t, location).alt * astro_constants::kRadToDeg;
}

static const GeoCoordinate kGreenwich{51.4769, -0.0005};
static const GeoCoordinate kNullIsland{0.0, 0.0};
static const GeoCoordinate kSvalbard{78.0, 15.0};

// =================================================================
// Sunrise / sunset
// =================================================================

TEST_CASE("Greenwich midsummer rise and set")
{
    const auto events = SunEvents::rise_set(utc(2024, 6, 21, 12, 0), kGreenwich, TimeZone::utc());

    REQUIRE(events.rise.has_value());
    REQUIRE(events.set.has_value());

    CHECK(near(*events.rise, utc(2024, 6, 21, 3, 41, 1.8), 30s));
    CHECK(near(*events.set, utc(2024, 6, 21, 20, 19, 12.2), 30s));
    CHECK(events.rise_azimuth_deg == 49);
    CHECK(events.set_azimuth_deg == 311);
}

TEST_CASE("Greenwich midwinter rise and set")
{
    const auto events = SunEvents::rise_set(utc(2024, 12, 21, 0, 0), kGreenwich, TimeZone::utc());

    REQUIRE(events.rise.has_value());
    REQUIRE(events.set.has_value());

    CHECK(near(*events.rise, utc(2024, 12, 21, 8, 1, 28.8), 30s));
    CHECK(near(*events.set, utc(2024, 12, 21, 15, 51, 26.2), 30s));
    CHECK(events.rise_azimuth_deg == 128);
    CHECK(events.set_azimuth_deg == 232);
}

TEST_CASE("Refined crossings sit on the -0.833° threshold")
{
    const auto events = SunEvents::rise_set(utc(2024, 3, 20, 12, 0), kGreenwich, TimeZone::utc());

    REQUIRE(events.rise.has_value());
    REQUIRE(events.set.has_value());

    // 10 min / 2^14 ≈ 37 ms of solar motion is far below 0.01°
    CHECK(std::abs(altitude_deg(*events.rise, kGreenwich) - SunEvents::kRiseSetAltitudeDeg) < 0.01);
    CHECK(std::abs(altitude_deg(*events.set, kGreenwich) - SunEvents::kRiseSetAltitudeDeg) < 0.01);

    // Above the threshold just after rising, below it just after setting
    CHECK(altitude_deg(*events.rise + 1min, kGreenwich) > SunEvents::kRiseSetAltitudeDeg);
    CHECK(altitude_deg(*events.set + 1min, kGreenwich) < SunEvents::kRiseSetAltitudeDeg);
}

TEST_CASE("Equinox at the equator: rise due east, set due west, twelve hours apart")
{
    const auto events = SunEvents::rise_set(utc(2024, 3, 20, 12, 0), kNullIsland, TimeZone::utc());

    REQUIRE(events.rise.has_value());
    REQUIRE(events.set.has_value());

    CHECK(events.rise_azimuth_deg == 90);
    CHECK(events.set_azimuth_deg == 270);
    CHECK(events.rise_azimuth_deg + events.set_azimuth_deg == 360);

    const auto day_length = *events.set - *events.rise;
    CHECK(day_length > 12h);
    CHECK(day_length < 12h + 10min);
}

TEST_CASE("Rise precedes set inside the UTC day at mid latitudes")
{
    const Instant days[] = {
        utc(2024, 1, 15, 9, 0),
        utc(2024, 4, 1, 0, 0),
        utc(2024, 9, 22, 23, 59),
        utc(2024, 11, 5, 17, 30),
    };

    for (const Instant day : days)
    {
        const auto window = TimeZone::utc().day_window(day);
        REQUIRE(window.has_value());

        const auto events = SunEvents::rise_set(day, GeoCoordinate{40.0, 0.0}, TimeZone::utc());
        REQUIRE(events.rise.has_value());
        REQUIRE(events.set.has_value());

        CHECK(*events.rise < *events.set);
        CHECK(*events.rise >= window->start);
        CHECK(*events.set <= window->end);
        CHECK(events.rise_azimuth_deg >= 0);
        CHECK(events.rise_azimuth_deg <= 359);
        CHECK(events.set_azimuth_deg >= 0);
        CHECK(events.set_azimuth_deg <= 359);
    }
}

TEST_CASE("Any instant of the same day gives the same events")
{
    const auto morning = SunEvents::rise_set(utc(2024, 6, 21, 0, 0), kGreenwich, TimeZone::utc());
    const auto evening = SunEvents::rise_set(utc(2024, 6, 21, 23, 59, 59.0), kGreenwich, TimeZone::utc());

    CHECK(morning.rise == evening.rise);
    CHECK(morning.set == evening.set);
    CHECK(morning.rise_azimuth_deg == evening.rise_azimuth_deg);
    CHECK(morning.set_azimuth_deg == evening.set_azimuth_deg);
}

TEST_CASE("Polar day and polar night report no events")
{
    SUBCASE("Midnight sun")
    {
        const auto events = SunEvents::rise_set(utc(2024, 6, 21, 12, 0), kSvalbard, TimeZone::utc());
        CHECK_FALSE(events.rise.has_value());
        CHECK_FALSE(events.set.has_value());
        CHECK(events.rise_azimuth_deg == 0);
        CHECK(events.set_azimuth_deg == 0);
    }

    SUBCASE("Polar night")
    {
        const auto events = SunEvents::rise_set(utc(2024, 12, 21, 12, 0), kSvalbard, TimeZone::utc());
        CHECK_FALSE(events.rise.has_value());
        CHECK_FALSE(events.set.has_value());
    }

    SUBCASE("Southern polar day and night")
    {
        const GeoCoordinate antarctic{-78.0, 0.0};
        const auto june = SunEvents::rise_set(utc(2024, 6, 21, 12, 0), antarctic, TimeZone::utc());
        const auto december = SunEvents::rise_set(utc(2024, 12, 21, 12, 0), antarctic, TimeZone::utc());
        CHECK_FALSE(june.rise.has_value());
        CHECK_FALSE(june.set.has_value());
        CHECK_FALSE(december.rise.has_value());
        CHECK_FALSE(december.set.has_value());
    }
}

TEST_CASE("Fixed offset shifts the local day")
{
    SUBCASE("New York, UTC-05:00: set falls on the next UTC date")
    {
        const FixedOffsetZone eastern{-300min};
        const GeoCoordinate new_york{40.7128, -74.006};

        const auto events = SunEvents::rise_set(utc(2024, 6, 21, 12, 0), new_york, eastern);
        REQUIRE(events.rise.has_value());
        REQUIRE(events.set.has_value());

        CHECK(near(*events.rise, utc(2024, 6, 21, 9, 23, 18.3), 30s));
        CHECK(near(*events.set, utc(2024, 6, 22, 0, 29, 3.6), 30s));
        // Both azimuths sit close to a half degree
        CHECK(events.rise_azimuth_deg >= 57);
        CHECK(events.rise_azimuth_deg <= 58);
        CHECK(events.set_azimuth_deg >= 302);
        CHECK(events.set_azimuth_deg <= 303);
    }

    SUBCASE("Sydney, UTC+10:00: rise falls on the previous UTC date")
    {
        const FixedOffsetZone sydney_zone{600min};
        const GeoCoordinate sydney{-33.87, 151.21};

        const auto events = SunEvents::rise_set(utc(2024, 12, 21, 2, 0), sydney, sydney_zone);
        REQUIRE(events.rise.has_value());
        REQUIRE(events.set.has_value());

        CHECK(near(*events.rise, utc(2024, 12, 20, 18, 39, 0.9), 30s));
        CHECK(near(*events.set, utc(2024, 12, 21, 9, 3, 49.1), 30s));
    }
}

// =================================================================
// Solar transit
// =================================================================

TEST_CASE("Transit beats every coarse sample of the day")
{
    const Instant day = utc(2024, 6, 21, 12, 0);
    const auto transit = SunEvents::transit(day, kGreenwich, TimeZone::utc());
    REQUIRE(transit.has_value());

    const auto window = TimeZone::utc().day_window(day);
    REQUIRE(window.has_value());

    CHECK(*transit >= window->start);
    CHECK(*transit < window->end);

    const f64 best = std::abs(SunModel::hour_angle(*transit, kGreenwich.longitude_deg));
    for (Instant t = window->start; t < window->end; t += SunEvents::kScanStep)
    {
        CHECK(best <= std::abs(SunModel::hour_angle(t, kGreenwich.longitude_deg)));
    }

    // Whole-minute grid
    CHECK((*transit - window->start) % 1min == 0min);
}

TEST_CASE("Transit follows the equation of time")
{
    // Solar noon at Greenwich: ~12:06 at the March equinox, ~11:56 in late December
    const auto march = SunEvents::transit(utc(2024, 3, 20, 0, 0), kGreenwich, TimeZone::utc());
    const auto december = SunEvents::transit(utc(2024, 12, 21, 0, 0), kGreenwich, TimeZone::utc());

    REQUIRE(march.has_value());
    REQUIRE(december.has_value());

    CHECK(near(*march, utc(2024, 3, 20, 12, 6), 1min));
    CHECK(near(*december, utc(2024, 12, 21, 11, 56), 1min));
}

TEST_CASE("Transit lies between rise and set")
{
    const Instant day = utc(2024, 6, 21, 12, 0);
    const FixedOffsetZone eastern{-300min};
    const GeoCoordinate new_york{40.7128, -74.006};

    const auto events = SunEvents::rise_set(day, new_york, eastern);
    const auto transit = SunEvents::transit(day, new_york, eastern);

    REQUIRE(events.rise.has_value());
    REQUIRE(events.set.has_value());
    REQUIRE(transit.has_value());

    CHECK(*events.rise < *transit);
    CHECK(*transit < *events.set);
    CHECK(near(*transit, utc(2024, 6, 21, 16, 56), 1min));
}

TEST_CASE("Transit exists during polar day and night")
{
    const auto summer = SunEvents::transit(utc(2024, 6, 21, 12, 0), kSvalbard, TimeZone::utc());
    const auto winter = SunEvents::transit(utc(2024, 12, 21, 12, 0), kSvalbard, TimeZone::utc());

    REQUIRE(summer.has_value());
    REQUIRE(winter.has_value());

    // 15°E transits an hour before Greenwich
    CHECK(near(*summer, utc(2024, 6, 21, 11, 0), 1min));
    CHECK(near(*winter, utc(2024, 12, 21, 10, 56), 1min));
}
