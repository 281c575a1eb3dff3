/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include "astro/angles.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace sunpath::astro
{

// -----------------------------------------------------------------
// GeoCoordinate range handling
// -----------------------------------------------------------------

bool GeoCoordinate::is_valid() const
{
    return latitude_deg >= -90.0 && latitude_deg <= 90.0
        && longitude_deg >= -180.0 && longitude_deg <= 180.0;
}

GeoCoordinate GeoCoordinate::normalized() const
{
    const f64 longitude = wrap_degrees(longitude_deg + 180.0) - 180.0;

    return GeoCoordinate{
        .latitude_deg  = std::clamp(latitude_deg, -90.0, 90.0),
        .longitude_deg = longitude,
    };
}

// -----------------------------------------------------------------
// Hour angle: H = LST - RA, folded into (-π, π]
// -----------------------------------------------------------------

f64 Coordinates::hour_angle(f64 ra, f64 local_sidereal_time_rad)
{
    return normalize_signed_pi(local_sidereal_time_rad - ra);
}

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Horizontal (Alt/Az)
//
// sin(alt) = sin(lat) × sin(dec) + cos(lat) × cos(dec) × cos(H)
//
// South-referenced azimuth:
//   A = atan2(sin(H), cos(H) × sin(lat) - tan(dec) × cos(lat))
// North-referenced azimuth (0=N, 90°=E):
//   az = A + π, normalized to [0, 2π)
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    f64 latitude_rad,
    f64 local_sidereal_time_rad)
{
    const f64 h = hour_angle(eq.ra, local_sidereal_time_rad);

    const f64 sin_lat = std::sin(latitude_rad);
    const f64 cos_lat = std::cos(latitude_rad);
    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_h   = std::sin(h);
    const f64 cos_h   = std::cos(h);

    // Altitude
    const f64 sin_alt = sin_lat * sin_dec + cos_lat * cos_dec * cos_h;
    const f64 alt = std::asin(std::clamp(sin_alt, -1.0, 1.0));

    // Azimuth
    const f64 az = std::atan2(sin_h, cos_h * sin_lat - std::tan(eq.dec) * cos_lat)
                 + astro_constants::kPi;

    return HorizontalCoord{
        .alt = alt,
        .az  = normalize_radians(az),
    };
}

} // namespace sunpath::astro
