#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: instants, Julian Date, sidereal time.

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string_view>

namespace sunpath::astro
{
    /// @brief Absolute point in time (UTC, millisecond resolution).
    using Instant = std::chrono::sys_time<std::chrono::milliseconds>;

    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Date conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// Greenwich/Local Mean Sidereal Time (IAU 1982), and system clock access.
    /// All angular results are in radians unless noted otherwise.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Date as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Split an instant into UTC calendar fields.
        /// Seconds keep the millisecond fraction.
        [[nodiscard]] static DateTime to_date_time(Instant instant);

        /// @brief Build an instant from UTC calendar fields.
        [[nodiscard]] static Instant to_instant(const DateTime& dt);

        /// @brief Julian Day of an instant, read through its UTC calendar fields.
        [[nodiscard]] static f64 julian_day(Instant instant);

        /// @brief Days elapsed since J2000.0 (2000-01-01 12:00 UTC).
        [[nodiscard]] static f64 days_since_j2000(Instant instant);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @param jd Julian Date.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time in degrees, normalized to [0, 360).
        [[nodiscard]] static f64 gmst_degrees(f64 jd);

        /// @brief Greenwich Mean Sidereal Time (radians).
        /// @param jd Julian Date (UTC).
        /// @return GMST in radians, normalized to [0, 2π).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time (radians).
        /// @param jd Julian Date (UTC).
        /// @param longitude_rad Observer longitude in radians (east positive).
        /// @return LMST in radians, normalized to [0, 2π).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Local sidereal time at an instant for a longitude in degrees.
        /// Equivalent to lmst(julian_day(instant), longitude in radians).
        /// @return LST in radians, normalized to [0, 2π).
        [[nodiscard]] static f64 local_sidereal_time(Instant instant, f64 longitude_deg);

        /// @brief Current system time truncated to milliseconds.
        [[nodiscard]] static Instant now();

        /// @brief Parse a UTC timestamp of the form YYYY-MM-DDTHH:MM[:SS][Z].
        /// A space may replace the 'T'. Fractional seconds are not accepted.
        /// @return The instant, or std::nullopt when the text is malformed.
        [[nodiscard]] static std::optional<Instant> parse_iso8601(std::string_view text);
    };

} // namespace sunpath::astro
