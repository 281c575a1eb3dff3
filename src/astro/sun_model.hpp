#pragma once

/// @file sun_model.hpp
/// @brief Low-order solar position model (mean anomaly + equation of center).

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

namespace sunpath::astro
{
    /// @brief Static utility class computing the Sun's apparent position.
    ///
    /// Single-term model without nutation or aberration, good to a few
    /// arcminutes in declination and about a minute of time.
    class SunModel
    {
    public:
        SunModel() = delete;

        /// Obliquity of the ecliptic, held fixed (radians).
        static constexpr f64 kObliquity = 23.4397 * astro_constants::kDegToRad;

        /// Longitude of perihelion (radians).
        static constexpr f64 kPerihelion = 102.9372 * astro_constants::kDegToRad;

        /// @brief Sun right ascension and declination.
        /// @param days_since_j2000 Days elapsed since J2000.0.
        [[nodiscard]] static EquatorialCoord equatorial(f64 days_since_j2000);

        /// @brief Sun altitude/azimuth for an observer at an instant.
        /// @param instant UTC instant.
        /// @param location Observer location (assumed already normalized).
        [[nodiscard]] static HorizontalCoord horizontal(Instant instant, const GeoCoordinate& location);

        /// @brief Hour angle of the Sun at an instant, in (-π, π].
        [[nodiscard]] static f64 hour_angle(Instant instant, f64 longitude_deg);
    };

} // namespace sunpath::astro
