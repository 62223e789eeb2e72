/// @file coordinates.cpp
/// @brief Implementation of ecliptic coordinate utilities.

#include "astro/coordinates.hpp"

#include <glm/glm.hpp>

#include <algorithm>
#include <cmath>

namespace jyotish::astro
{

f64 Coordinates::normalize_degrees(f64 angle)
{
    const f64 full = zodiac_constants::kFullCircle;
    // fmod is exact, so values already in range come back unchanged
    f64 result = std::fmod(angle, full);
    if (result < 0.0)
    {
        result += full;
    }
    // A tiny negative remainder can round up to exactly 360
    if (result >= full)
    {
        result = 0.0;
    }
    return result;
}

f64 Coordinates::angular_distance(f64 a_deg, f64 b_deg)
{
    const f64 diff = std::fabs(normalize_degrees(a_deg) - normalize_degrees(b_deg));
    return std::min(diff, zodiac_constants::kFullCircle - diff);
}

// -----------------------------------------------------------------
// Tropical ↔ sidereal
// -----------------------------------------------------------------

f64 Coordinates::to_sidereal_longitude(f64 tropical_deg, f64 jd, AyanamsaSystem system)
{
    return normalize_degrees(tropical_deg - Ayanamsa::offset(system, jd));
}

f64 Coordinates::to_sidereal_longitude(f64 tropical_deg, f64 jd, std::string_view ayanamsa_name)
{
    return to_sidereal_longitude(tropical_deg, jd, parse_ayanamsa(ayanamsa_name));
}

f64 Coordinates::to_tropical_longitude(f64 sidereal_deg, f64 jd, AyanamsaSystem system)
{
    return normalize_degrees(sidereal_deg + Ayanamsa::offset(system, jd));
}

f64 Coordinates::local_sidereal_time(const DateTime& utc, f64 longitude_deg)
{
    const f64 jd = TimeSystem::to_julian_date(utc);
    f64 hours = TimeSystem::lmst(jd, longitude_deg) / 15.0;
    if (hours >= 24.0)
    {
        hours = 0.0;
    }
    return hours;
}

// -----------------------------------------------------------------
// Ascendant and midheaven from RAMC
// -----------------------------------------------------------------

f64 Coordinates::ascendant_longitude(f64 lst_hours, f64 latitude_deg, f64 obliquity_deg)
{
    const f64 ramc = glm::radians(lst_hours * 15.0);
    const f64 eps  = glm::radians(obliquity_deg);
    const f64 phi  = glm::radians(latitude_deg);

    const f64 y = std::cos(ramc);
    const f64 x = -(std::sin(ramc) * std::cos(eps) + std::tan(phi) * std::sin(eps));

    return normalize_degrees(glm::degrees(std::atan2(y, x)));
}

f64 Coordinates::midheaven_longitude(f64 lst_hours, f64 obliquity_deg)
{
    const f64 ramc = glm::radians(lst_hours * 15.0);
    const f64 eps  = glm::radians(obliquity_deg);

    return normalize_degrees(glm::degrees(std::atan2(std::sin(ramc), std::cos(ramc) * std::cos(eps))));
}

Dms Coordinates::to_dms(f64 degrees)
{
    const f64 value = std::fabs(degrees);
    const i32 deg = static_cast<i32>(std::floor(value));
    const f64 minutes_total = (value - static_cast<f64>(deg)) * 60.0;
    const i32 minutes = static_cast<i32>(std::floor(minutes_total));
    const f64 seconds = (minutes_total - static_cast<f64>(minutes)) * 60.0;

    return Dms{
        .degrees = deg,
        .minutes = minutes,
        .seconds = seconds,
    };
}

} // namespace jyotish::astro
