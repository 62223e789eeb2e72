/// @file combustion.cpp
/// @brief Combustion detection against per-graha orbs.

#include "vedic/combustion.hpp"

#include "astro/coordinates.hpp"

namespace jyotish::vedic
{

bool CombustionDetector::is_combust(Graha graha, f64 distance_to_sun_deg) const
{
    const auto orb = m_tables.combustion_orb(graha);
    if (!orb)
    {
        return false;
    }
    return distance_to_sun_deg < *orb;
}

bool CombustionDetector::is_combust(Graha graha, f64 longitude_deg, f64 sun_longitude_deg) const
{
    return is_combust(graha, astro::Coordinates::angular_distance(longitude_deg, sun_longitude_deg));
}

CombustionFlags CombustionDetector::evaluate(const GrahaPositions& positions) const
{
    const f64 sun = positions[index_of(Graha::Sun)].point.longitude;

    CombustionFlags flags{};
    for (const GrahaPosition& pos : positions)
    {
        flags[index_of(pos.graha)] = is_combust(pos.graha, pos.point.longitude, sun);
    }
    return flags;
}

std::array<bool, 12> CombustionDetector::house_lord_combustion(const Bhavas& bhavas,
                                                               const CombustionFlags& flags)
{
    std::array<bool, 12> result{};
    for (const Bhava& bhava : bhavas)
    {
        result[static_cast<std::size_t>(bhava.number - 1)] = flags[index_of(bhava.lord)];
    }
    return result;
}

} // namespace jyotish::vedic
