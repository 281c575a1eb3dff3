/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "astro/angles.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <charconv>
#include <cmath>

namespace sunpath::astro
{

namespace
{

/// @brief Parse a fixed-width unsigned decimal field.
std::optional<i32> parse_field(std::string_view text, std::size_t pos, std::size_t width)
{
    if (pos + width > text.size())
    {
        return std::nullopt;
    }

    const char* first = text.data() + pos;
    const char* last  = first + width;
    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value < 0)
    {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Julian Date: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    const f64 day = static_cast<f64>(dt.day)
                  + static_cast<f64>(dt.hour) / 24.0
                  + static_cast<f64>(dt.minute) / 1440.0
                  + dt.second / astro_constants::kSecondsPerDay;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + day
         + static_cast<f64>(b)
         - 1524.5;
}

// -----------------------------------------------------------------
// Instant ↔ UTC calendar fields
// -----------------------------------------------------------------

DateTime TimeSystem::to_date_time(Instant instant)
{
    using namespace std::chrono;

    const auto day_point = floor<days>(instant);
    const year_month_day ymd{day_point};
    const hh_mm_ss<milliseconds> hms{instant - day_point};

    return DateTime{
        .year   = static_cast<i32>(ymd.year()),
        .month  = static_cast<i32>(static_cast<unsigned>(ymd.month())),
        .day    = static_cast<i32>(static_cast<unsigned>(ymd.day())),
        .hour   = static_cast<i32>(hms.hours().count()),
        .minute = static_cast<i32>(hms.minutes().count()),
        .second = static_cast<f64>(hms.seconds().count())
                + static_cast<f64>(hms.subseconds().count()) / 1000.0,
    };
}

Instant TimeSystem::to_instant(const DateTime& dt)
{
    using namespace std::chrono;

    const sys_days date{year{dt.year} / month{static_cast<unsigned>(dt.month)}
                        / day{static_cast<unsigned>(dt.day)}};

    return time_point_cast<milliseconds>(date)
         + hours{dt.hour}
         + minutes{dt.minute}
         + round<milliseconds>(duration<f64>{dt.second});
}

// -----------------------------------------------------------------
// Julian Day and day count of an instant
// -----------------------------------------------------------------

f64 TimeSystem::julian_day(Instant instant)
{
    return to_julian_date(to_date_time(instant));
}

f64 TimeSystem::days_since_j2000(Instant instant)
{
    return julian_day(instant) - astro_constants::kJ2000;
}

// -----------------------------------------------------------------
// Julian centuries since J2000.0
// -----------------------------------------------------------------

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / astro_constants::kDaysPerCentury;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
//
// Where T = Julian centuries from J2000.0
// -----------------------------------------------------------------

f64 TimeSystem::gmst_degrees(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    const f64 gmst_deg = 280.46061837
                       + 360.98564736629 * d
                       + 0.000387933 * t * t
                       - (t * t * t) / 38710000.0;

    return wrap_degrees(gmst_deg);
}

f64 TimeSystem::gmst(f64 jd)
{
    return gmst_degrees(jd) * astro_constants::kDegToRad;
}

// -----------------------------------------------------------------
// LMST = GMST + observer longitude
// -----------------------------------------------------------------

f64 TimeSystem::lmst(f64 jd, f64 longitude_rad)
{
    return normalize_radians(gmst(jd) + longitude_rad);
}

f64 TimeSystem::local_sidereal_time(Instant instant, f64 longitude_deg)
{
    return lmst(julian_day(instant), longitude_deg * astro_constants::kDegToRad);
}

// -----------------------------------------------------------------
// Current system time
// -----------------------------------------------------------------

Instant TimeSystem::now()
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

// -----------------------------------------------------------------
// ISO 8601 (UTC subset): YYYY-MM-DDTHH:MM[:SS][Z]
// -----------------------------------------------------------------

std::optional<Instant> TimeSystem::parse_iso8601(std::string_view text)
{
    if (!text.empty() && (text.back() == 'Z' || text.back() == 'z'))
    {
        text.remove_suffix(1);
    }

    if ((text.size() != 16 && text.size() != 19)
        || text[4] != '-' || text[7] != '-'
        || (text[10] != 'T' && text[10] != 't' && text[10] != ' ')
        || text[13] != ':'
        || (text.size() == 19 && text[16] != ':'))
    {
        SP_CORE_WARN("TimeSystem: Malformed timestamp '{}'", text);
        return std::nullopt;
    }

    const auto year   = parse_field(text, 0, 4);
    const auto month  = parse_field(text, 5, 2);
    const auto day    = parse_field(text, 8, 2);
    const auto hour   = parse_field(text, 11, 2);
    const auto minute = parse_field(text, 14, 2);
    const auto second = text.size() == 19 ? parse_field(text, 17, 2) : std::optional<i32>{0};

    if (!year || !month || !day || !hour || !minute || !second)
    {
        SP_CORE_WARN("TimeSystem: Non-numeric field in timestamp '{}'", text);
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{std::chrono::year{*year},
                                          std::chrono::month{static_cast<unsigned>(*month)},
                                          std::chrono::day{static_cast<unsigned>(*day)}};
    if (!ymd.ok() || *hour > 23 || *minute > 59 || *second > 59)
    {
        SP_CORE_WARN("TimeSystem: Out-of-range field in timestamp '{}'", text);
        return std::nullopt;
    }

    return to_instant(DateTime{
        .year   = *year,
        .month  = *month,
        .day    = *day,
        .hour   = *hour,
        .minute = *minute,
        .second = static_cast<f64>(*second),
    });
}

} // namespace sunpath::astro
