#pragma once

/// @file sun_events.hpp
/// @brief Sunrise, sunset and solar transit search over one local day.

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "astro/time_zone.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>

namespace sunpath::astro
{
    /// @brief Sunrise/sunset instants and azimuths for one local day.
    ///
    /// An absent instant means the Sun does not cross the horizon that way
    /// during the day (polar day or night); its azimuth is then 0.
    struct SunEventResult
    {
        std::optional<Instant> rise;
        i32 rise_azimuth_deg = 0;
        std::optional<Instant> set;
        i32 set_azimuth_deg = 0;
    };

    /// @brief Static utility class locating horizon crossings and meridian transit.
    ///
    /// Both searches sample the day on a coarse grid, then refine locally:
    /// bisection for the horizon crossings, a 1-minute linear scan for the
    /// transit. Every call is a pure function of its arguments.
    class SunEvents
    {
    public:
        SunEvents() = delete;

        /// Apparent altitude of the Sun's center at rise/set: refraction (~34')
        /// plus solar semi-diameter (~16').
        static constexpr f64 kRiseSetAltitudeDeg = -0.833;

        /// Coarse sampling interval for both searches.
        static constexpr std::chrono::minutes kScanStep{10};

        /// Bisection steps per crossing (10 min / 2^14 ≈ 37 ms).
        static constexpr i32 kBisectionIterations = 14;

        /// Transit refinement: ±15 min around the coarse minimum, 1-min steps.
        static constexpr std::chrono::minutes kTransitRefineHalfWindow{15};
        static constexpr std::chrono::minutes kTransitRefineStep{1};

        /// @brief Sunrise and sunset during the local day containing an instant.
        /// @param instant Any instant inside the day of interest.
        /// @param location Observer location (normalized).
        /// @param zone Resolves the local-day boundaries.
        [[nodiscard]] static SunEventResult rise_set(
            Instant instant,
            const GeoCoordinate& location,
            const TimeZone& zone
        );

        /// @brief Time of minimum |hour angle| during the local day (solar noon).
        /// @return The transit instant, or std::nullopt if the day cannot be resolved.
        [[nodiscard]] static std::optional<Instant> transit(
            Instant instant,
            const GeoCoordinate& location,
            const TimeZone& zone
        );

    private:
        /// @brief Sun altitude minus the rise/set threshold, in degrees.
        [[nodiscard]] static f64 altitude_above_threshold(Instant t, const GeoCoordinate& location);

        /// @brief Bisect [left, right] down to the threshold crossing.
        [[nodiscard]] static Instant refine_crossing(Instant left, Instant right, const GeoCoordinate& location);

        /// @brief Rounded azimuth of the Sun at an instant.
        [[nodiscard]] static i32 azimuth_at(Instant t, const GeoCoordinate& location);

        /// @brief |hour angle| of the Sun in degrees.
        [[nodiscard]] static f64 abs_hour_angle_deg(Instant t, f64 longitude_deg);
    };

} // namespace sunpath::astro
