/// @file ephemeris_provider.cpp
/// @brief Default obliquity for position providers.

#include "ephemeris/ephemeris_provider.hpp"

#include "astro/time_system.hpp"

namespace jyotish::ephemeris
{

f64 EphemerisProvider::obliquity(f64 jd_utc) const
{
    return astro::TimeSystem::mean_obliquity(jd_utc);
}

} // namespace jyotish::ephemeris
