/// @file solar_ephemeris.cpp
/// @brief Implementation of the public solar ephemeris API.

#include "astro/solar_ephemeris.hpp"

#include "astro/angles.hpp"
#include "astro/sun_model.hpp"
#include "core/logger.hpp"

#include <cmath>

namespace sunpath::astro
{

SunPosition SolarEphemeris::compute_sun_position(Instant instant, const GeoCoordinate& location)
{
    const HorizontalCoord hz = SunModel::horizontal(instant, checked(location));

    return SunPosition{
        .azimuth_deg  = wrap_degrees(hz.az * astro_constants::kRadToDeg),
        .altitude_deg = hz.alt * astro_constants::kRadToDeg,
    };
}

SunPositionRounded SolarEphemeris::compute_sun_position_rounded(Instant instant, const GeoCoordinate& location)
{
    const SunPosition position = compute_sun_position(instant, location);

    return SunPositionRounded{
        .azimuth_deg  = round_azimuth_deg(position.azimuth_deg),
        .altitude_deg = static_cast<i32>(std::lround(position.altitude_deg)),
    };
}

SunEventResult SolarEphemeris::compute_sun_rise_set(
    Instant instant,
    const GeoCoordinate& location,
    const TimeZone& zone)
{
    return SunEvents::rise_set(instant, checked(location), zone);
}

std::optional<Instant> SolarEphemeris::compute_solar_transit(
    Instant instant,
    const GeoCoordinate& location,
    const TimeZone& zone)
{
    return SunEvents::transit(instant, checked(location), zone);
}

bool SolarEphemeris::is_sun_visible(f64 altitude_deg)
{
    return altitude_deg >= SunEvents::kRiseSetAltitudeDeg;
}

GeoCoordinate SolarEphemeris::checked(const GeoCoordinate& location)
{
    if (!location.is_valid())
    {
        const GeoCoordinate fixed = location.normalized();
        SP_CORE_WARN("SolarEphemeris: Location ({}, {}) out of range, using ({}, {})",
                     location.latitude_deg, location.longitude_deg,
                     fixed.latitude_deg, fixed.longitude_deg);
        return fixed;
    }
    return location;
}

} // namespace sunpath::astro
