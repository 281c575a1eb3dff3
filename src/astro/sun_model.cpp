/// @file sun_model.cpp
/// @brief Implementation of the low-order solar position model.

#include "astro/sun_model.hpp"

#include "astro/angles.hpp"

#include <cmath>

namespace sunpath::astro
{

// -----------------------------------------------------------------
// Sun RA/Dec
//
// M = 357.5291° + 0.98560028° × d                (mean anomaly)
// C = 1.9148° sin M + 0.02° sin 2M + 0.0003° sin 3M   (equation of center)
// L = M + C + P + π                              (ecliptic longitude)
//
// RA  = atan2(sin L × cos ε, cos L)
// Dec = asin(sin L × sin ε)
// -----------------------------------------------------------------

EquatorialCoord SunModel::equatorial(f64 days_since_j2000)
{
    using astro_constants::kDegToRad;

    const f64 m = (357.5291 + 0.98560028 * days_since_j2000) * kDegToRad;

    const f64 c = 1.9148 * kDegToRad * std::sin(m)
                + 0.02 * kDegToRad * std::sin(2.0 * m)
                + 0.0003 * kDegToRad * std::sin(3.0 * m);

    const f64 l = m + c + kPerihelion + astro_constants::kPi;

    const f64 sin_l = std::sin(l);
    const f64 cos_l = std::cos(l);

    return EquatorialCoord{
        .ra  = normalize_radians(std::atan2(sin_l * std::cos(kObliquity), cos_l)),
        .dec = std::asin(sin_l * std::sin(kObliquity)),
    };
}

HorizontalCoord SunModel::horizontal(Instant instant, const GeoCoordinate& location)
{
    const EquatorialCoord sun = equatorial(TimeSystem::days_since_j2000(instant));
    const f64 lst = TimeSystem::local_sidereal_time(instant, location.longitude_deg);

    return Coordinates::equatorial_to_horizontal(
        sun, location.latitude_deg * astro_constants::kDegToRad, lst);
}

f64 SunModel::hour_angle(Instant instant, f64 longitude_deg)
{
    const EquatorialCoord sun = equatorial(TimeSystem::days_since_j2000(instant));
    return Coordinates::hour_angle(sun.ra, TimeSystem::local_sidereal_time(instant, longitude_deg));
}

} // namespace sunpath::astro
