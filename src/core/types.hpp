#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace jyotish
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for ephemeris work)
    using Vec2d = glm::dvec2;
    using Vec3d = glm::dvec3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi            = glm::pi<f64>();
        constexpr f64 kTwoPi         = 2.0 * kPi;
        constexpr f64 kDegToRad      = kPi / 180.0;
        constexpr f64 kRadToDeg      = 180.0 / kPi;
        constexpr f64 kArcSecToDeg   = 1.0 / 3600.0;
        constexpr f64 kJ2000         = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kDaysPerCentury = 36525.0;
        constexpr f64 kDaysPerYear   = 365.25;
    }

    // Zodiac geometry
    namespace zodiac_constants
    {
        constexpr f64 kFullCircle     = 360.0;
        constexpr f64 kRasiSpan       = 30.0;
        constexpr f64 kNakshatraSpan  = 360.0 / 27.0;       // 13°20'
        constexpr f64 kPadaSpan       = kNakshatraSpan / 4.0; // 3°20'
        constexpr f64 kNavamsaSpan    = kRasiSpan / 9.0;      // 3°20'
        constexpr i32 kRasiCount      = 12;
        constexpr i32 kNakshatraCount = 27;
        constexpr i32 kBhavaCount     = 12;
        constexpr i32 kGrahaCount     = 9;
    }
}
