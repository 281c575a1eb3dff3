#pragma once

/// @file solar_ephemeris.hpp
/// @brief Public solar ephemeris API: position, rise/set and transit in degrees.

#include "astro/coordinates.hpp"
#include "astro/sun_events.hpp"
#include "astro/time_system.hpp"
#include "astro/time_zone.hpp"
#include "core/types.hpp"

#include <optional>

namespace sunpath::astro
{
    /// @brief Sun direction in degrees (azimuth 0=N, 90=E).
    struct SunPosition
    {
        f64 azimuth_deg;   ///< [0, 360)
        f64 altitude_deg;  ///< [-90, 90]
    };

    /// @brief Sun direction rounded to whole degrees for display.
    struct SunPositionRounded
    {
        i32 azimuth_deg;   ///< [0, 359]
        i32 altitude_deg;  ///< [-90, 90]
    };

    /// @brief Entry points consumed by display code.
    ///
    /// Locations outside [-90, 90] latitude or [-180, 180] longitude are
    /// normalized (latitude clamped, longitude wrapped) and a warning is logged.
    /// All functions are reentrant and keep no state between calls.
    class SolarEphemeris
    {
    public:
        SolarEphemeris() = delete;

        /// @brief Sun azimuth and altitude at an instant.
        [[nodiscard]] static SunPosition compute_sun_position(Instant instant, const GeoCoordinate& location);

        /// @brief compute_sun_position() rounded to the nearest whole degree.
        [[nodiscard]] static SunPositionRounded compute_sun_position_rounded(Instant instant, const GeoCoordinate& location);

        /// @brief Sunrise/sunset (and their azimuths) for the local day containing an instant.
        [[nodiscard]] static SunEventResult compute_sun_rise_set(
            Instant instant,
            const GeoCoordinate& location,
            const TimeZone& zone
        );

        /// @brief Solar noon for the local day containing an instant.
        /// @param zone Defines the day boundaries; UTC when omitted.
        [[nodiscard]] static std::optional<Instant> compute_solar_transit(
            Instant instant,
            const GeoCoordinate& location,
            const TimeZone& zone = TimeZone::utc()
        );

        /// @brief True when the Sun's center is above the rise/set threshold (-0.833°).
        [[nodiscard]] static bool is_sun_visible(f64 altitude_deg);

    private:
        /// @brief Normalize a location, warning when it was out of range.
        [[nodiscard]] static GeoCoordinate checked(const GeoCoordinate& location);
    };

} // namespace sunpath::astro
