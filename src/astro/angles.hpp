#pragma once

/// @file angles.hpp
/// @brief Angle wrapping helpers shared by the time base and the sun model.

#include "core/types.hpp"

#include <cmath>

namespace sunpath::astro
{
    /// @brief Normalize an angle to the range [0, 2π).
    [[nodiscard]] inline f64 normalize_radians(f64 angle)
    {
        angle = std::fmod(angle, astro_constants::kTwoPi);
        if (angle < 0.0)
        {
            angle += astro_constants::kTwoPi;
        }
        return angle;
    }

    /// @brief Normalize an angle to the range (-π, π].
    [[nodiscard]] inline f64 normalize_signed_pi(f64 angle)
    {
        angle = std::fmod(angle, astro_constants::kTwoPi);
        if (angle <= -astro_constants::kPi)
        {
            angle += astro_constants::kTwoPi;
        }
        if (angle > astro_constants::kPi)
        {
            angle -= astro_constants::kTwoPi;
        }
        return angle;
    }

    /// @brief Wrap an angle in degrees to the range [0, 360).
    [[nodiscard]] inline f64 wrap_degrees(f64 degrees)
    {
        degrees = std::fmod(degrees, 360.0);
        if (degrees < 0.0)
        {
            degrees += 360.0;
        }
        return degrees;
    }

    /// @brief Round an azimuth in degrees to the nearest whole degree in [0, 360).
    [[nodiscard]] inline i32 round_azimuth_deg(f64 degrees)
    {
        return static_cast<i32>(std::lround(wrap_degrees(degrees))) % 360;
    }

} // namespace sunpath::astro
