/// @file sun_events.cpp
/// @brief Implementation of the sunrise/sunset and transit searches.

#include "astro/sun_events.hpp"

#include "astro/angles.hpp"
#include "astro/sun_model.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <limits>

namespace sunpath::astro
{

// -----------------------------------------------------------------
// Sunrise / sunset
//
// f(t) = altitude(t) - (-0.833°)
//
// Sample f every 10 minutes from local midnight to the next midnight.
//   f: negative → non-negative   rise
//   f: non-negative → negative   set
// The first crossing of each kind wins; each is bisected inside its
// 10-minute bracket.
// -----------------------------------------------------------------

SunEventResult SunEvents::rise_set(
    Instant instant,
    const GeoCoordinate& location,
    const TimeZone& zone)
{
    SunEventResult result{};

    const auto window = zone.day_window(instant);
    if (!window)
    {
        return result;
    }

    const auto steps = (window->end - window->start) / kScanStep;
    const bool debug_enabled = core::Logger::get_core_logger()->should_log(spdlog::level::debug);

    Instant t0 = window->start;
    f64 y0 = altitude_above_threshold(t0, location);

    for (i64 i = 1; i <= steps; ++i)
    {
        const Instant t1 = window->start + i * kScanStep;
        const f64 y1 = altitude_above_threshold(t1, location);

        if (!result.rise && y0 < 0.0 && y1 >= 0.0)
        {
            const Instant refined = refine_crossing(t0, t1, location);
            result.rise = refined;
            result.rise_azimuth_deg = azimuth_at(refined, location);
            if (debug_enabled)
            {
                SP_CORE_DEBUG("SunEvents: Rise at JD {:.5f}, azimuth {}°",
                              TimeSystem::julian_day(refined), result.rise_azimuth_deg);
            }
        }

        if (!result.set && y0 >= 0.0 && y1 < 0.0)
        {
            const Instant refined = refine_crossing(t0, t1, location);
            result.set = refined;
            result.set_azimuth_deg = azimuth_at(refined, location);
            if (debug_enabled)
            {
                SP_CORE_DEBUG("SunEvents: Set at JD {:.5f}, azimuth {}°",
                              TimeSystem::julian_day(refined), result.set_azimuth_deg);
            }
        }

        if (result.rise && result.set)
        {
            break;
        }

        t0 = t1;
        y0 = y1;
    }

    if (!result.rise || !result.set)
    {
        SP_CORE_DEBUG("SunEvents: No {} crossing at lat {:.4f}, lon {:.4f} in zone {}",
                      !result.rise && !result.set ? "rise or set" : (!result.rise ? "rise" : "set"),
                      location.latitude_deg, location.longitude_deg, zone.name());
    }

    return result;
}

// -----------------------------------------------------------------
// Solar transit
//
// Minimize |H| = |LST - RA| (folded into (-180°, 180°]) over the day:
// 10-minute coarse grid, then 1-minute steps over ±15 minutes around
// the coarse minimum. Refinement samples are kept inside the day.
// -----------------------------------------------------------------

std::optional<Instant> SunEvents::transit(
    Instant instant,
    const GeoCoordinate& location,
    const TimeZone& zone)
{
    const auto window = zone.day_window(instant);
    if (!window)
    {
        return std::nullopt;
    }

    std::optional<Instant> coarse;
    f64 best = std::numeric_limits<f64>::max();

    for (Instant t = window->start; t < window->end; t += kScanStep)
    {
        const f64 value = abs_hour_angle_deg(t, location.longitude_deg);
        if (value < best)
        {
            best = value;
            coarse = t;
        }
    }

    if (!coarse)
    {
        SP_CORE_WARN("SunEvents: Empty day window in zone {}", zone.name());
        return std::nullopt;
    }

    Instant refined = *coarse;
    const Instant refine_start = *coarse - kTransitRefineHalfWindow;
    const auto refine_steps = (2 * kTransitRefineHalfWindow) / kTransitRefineStep;

    for (i64 i = 0; i <= refine_steps; ++i)
    {
        const Instant t = refine_start + i * kTransitRefineStep;
        if (t < window->start || t >= window->end)
        {
            continue;
        }

        const f64 value = abs_hour_angle_deg(t, location.longitude_deg);
        if (value < best)
        {
            best = value;
            refined = t;
        }
    }

    if (core::Logger::get_core_logger()->should_log(spdlog::level::debug))
    {
        SP_CORE_DEBUG("SunEvents: Transit at JD {:.5f}, |H| = {:.4f}°",
                      TimeSystem::julian_day(refined), best);
    }

    return refined;
}

// -----------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------

f64 SunEvents::altitude_above_threshold(Instant t, const GeoCoordinate& location)
{
    const f64 altitude_deg = SunModel::horizontal(t, location).alt * astro_constants::kRadToDeg;
    return altitude_deg - kRiseSetAltitudeDeg;
}

// Keeps [left, right] bracketing the sign change of f: whenever f(mid)
// has the same sign as f(left), the crossing lies in the right half.
Instant SunEvents::refine_crossing(Instant left, Instant right, const GeoCoordinate& location)
{
    f64 y_left = altitude_above_threshold(left, location);

    for (i32 i = 0; i < kBisectionIterations; ++i)
    {
        const Instant mid = left + (right - left) / 2;
        const f64 y_mid = altitude_above_threshold(mid, location);

        if ((y_left <= 0.0 && y_mid <= 0.0) || (y_left >= 0.0 && y_mid >= 0.0))
        {
            left = mid;
            y_left = y_mid;
        }
        else
        {
            right = mid;
        }
    }

    return right;
}

i32 SunEvents::azimuth_at(Instant t, const GeoCoordinate& location)
{
    return round_azimuth_deg(SunModel::horizontal(t, location).az * astro_constants::kRadToDeg);
}

f64 SunEvents::abs_hour_angle_deg(Instant t, f64 longitude_deg)
{
    return std::abs(SunModel::hour_angle(t, longitude_deg) * astro_constants::kRadToDeg);
}

} // namespace sunpath::astro
