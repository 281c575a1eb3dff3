#pragma once

/// @file coordinates.hpp
/// @brief Astronomical coordinate types and the equatorial → horizontal transform.

#include "core/types.hpp"

namespace sunpath::astro
{
    /// @brief Equatorial coordinate of date.
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (radians, -π/2..+π/2, negative = below horizon)
        f64 az;     ///< Azimuth (radians, 0..2π, 0=North, π/2=East)
    };

    /// @brief Observer geographic location in degrees.
    struct GeoCoordinate
    {
        f64 latitude_deg;   ///< Geographic latitude (north positive)
        f64 longitude_deg;  ///< Geographic longitude (east positive)

        /// @brief True when latitude is in [-90, 90] and longitude in [-180, 180].
        [[nodiscard]] bool is_valid() const;

        /// @brief Latitude clamped to [-90, 90], longitude wrapped to [-180, 180).
        [[nodiscard]] GeoCoordinate normalized() const;
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// All angular inputs and outputs are in radians.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Hour angle of an object, normalized to (-π, π].
        /// @param ra Right ascension (radians).
        /// @param local_sidereal_time_rad Local sidereal time (radians).
        [[nodiscard]] static f64 hour_angle(f64 ra, f64 local_sidereal_time_rad);

        /// @brief Equatorial (RA/Dec) → Horizontal (Alt/Az).
        /// @param eq Equatorial coordinates of the object.
        /// @param latitude_rad Observer latitude (radians, north positive).
        /// @param local_sidereal_time_rad Local sidereal time (radians).
        /// @return Horizontal coordinates, azimuth measured from North through East.
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            f64 latitude_rad,
            f64 local_sidereal_time_rad
        );
    };

} // namespace sunpath::astro
