#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace sunpath
{
    // Precision aliases
    using f64 = double;
    using i32 = int32_t;
    using i64 = int64_t;
    using u32 = uint32_t;

    // Screen-space direction for compass needles
    using Vec2d = glm::dvec2;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi              = glm::pi<f64>();
        constexpr f64 kTwoPi           = 2.0 * kPi;
        constexpr f64 kHalfPi          = kPi / 2.0;
        constexpr f64 kDegToRad        = kPi / 180.0;
        constexpr f64 kRadToDeg        = 180.0 / kPi;
        constexpr f64 kJ2000           = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kDaysPerCentury  = 36525.0;
        constexpr f64 kSecondsPerDay   = 86400.0;
    }
}
