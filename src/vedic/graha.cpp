/// @file graha.cpp
/// @brief Graha position derivation: rasi, nakshatra, pada, navamsa.

#include "vedic/graha.hpp"

#include "astro/coordinates.hpp"
#include "core/errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace jyotish::vedic
{

using zodiac_constants::kNakshatraSpan;
using zodiac_constants::kNavamsaSpan;
using zodiac_constants::kPadaSpan;
using zodiac_constants::kRasiSpan;

ZodiacPoint ZodiacPoint::at(f64 longitude_deg, const ReferenceTables& tables)
{
    const f64 lon = astro::Coordinates::normalize_degrees(longitude_deg);
    const i32 rasi_index = std::min(static_cast<i32>(std::floor(lon / kRasiSpan)), 11);
    const i32 nakshatra = GrahaCalculator::nakshatra_index(lon);

    return ZodiacPoint{
        .longitude      = lon,
        .rasi           = rasi_from_index(rasi_index),
        .degree_in_rasi = lon - static_cast<f64>(rasi_index) * kRasiSpan,
        .nakshatra      = nakshatra,
        .pada           = GrahaCalculator::pada(lon),
        .nakshatra_lord = tables.nakshatra_lord(nakshatra),
        .navamsa        = GrahaCalculator::navamsa_rasi(lon, tables),
    };
}

// -----------------------------------------------------------------
// Nakshatra / pada / navamsa
// -----------------------------------------------------------------

i32 GrahaCalculator::nakshatra_index(f64 longitude_deg)
{
    const f64 lon = astro::Coordinates::normalize_degrees(longitude_deg);
    return std::min(static_cast<i32>(std::floor(lon / kNakshatraSpan)),
                    zodiac_constants::kNakshatraCount - 1);
}

i32 GrahaCalculator::pada(f64 longitude_deg)
{
    const f64 lon = astro::Coordinates::normalize_degrees(longitude_deg);
    const f64 within = std::fmod(lon, kNakshatraSpan);
    return std::clamp(static_cast<i32>(std::floor(within / kPadaSpan)) + 1, 1, 4);
}

Rasi GrahaCalculator::navamsa_rasi(f64 longitude_deg, const ReferenceTables& tables)
{
    const f64 lon = astro::Coordinates::normalize_degrees(longitude_deg);
    const i32 rasi_index = std::min(static_cast<i32>(std::floor(lon / kRasiSpan)), 11);
    const f64 degree = lon - static_cast<f64>(rasi_index) * kRasiSpan;
    const i32 part = std::min(static_cast<i32>(std::floor(degree / kNavamsaSpan)), 8);

    // The first navamsa of a sign is the movable sign of its element
    i32 start = 0;
    switch (tables.rasi(rasi_from_index(rasi_index)).element)
    {
        case Element::Fire:  start = 0; break;  // Aries
        case Element::Earth: start = 9; break;  // Capricorn
        case Element::Air:   start = 6; break;  // Libra
        case Element::Water: start = 3; break;  // Cancer
    }
    return rasi_from_index(start + part);
}

// -----------------------------------------------------------------
// Provider boundary
// -----------------------------------------------------------------

ephemeris::BodyPosition GrahaCalculator::query(const ephemeris::EphemerisProvider& provider,
                                               Graha body, f64 jd_utc)
{
    ephemeris::BodyPosition pos{};
    try
    {
        pos = provider.position(body, jd_utc);
    }
    catch (const core::EphemerisError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw core::EphemerisError(
            fmt::format("Ephemeris provider failed for {}: {}", graha_name(body), e.what()),
            graha_name(body));
    }
    catch (...)
    {
        throw core::EphemerisError(
            fmt::format("Ephemeris provider failed for {} with an unknown exception", graha_name(body)),
            graha_name(body));
    }

    const f64 lon = pos.tropical_longitude_deg;
    if (!std::isfinite(lon) || lon < 0.0 || lon >= zodiac_constants::kFullCircle)
    {
        throw core::EphemerisError(
            fmt::format("Ephemeris provider returned out-of-range longitude {} for {}", lon, graha_name(body)),
            graha_name(body));
    }
    return pos;
}

GrahaPositions GrahaCalculator::compute(const ephemeris::EphemerisProvider& provider,
                                        f64 jd_utc,
                                        astro::AyanamsaSystem ayanamsa,
                                        const ReferenceTables& tables)
{
    GrahaPositions positions{};

    for (const Graha g : kAllGrahas)
    {
        if (g == Graha::Ketu)
        {
            continue;
        }
        const ephemeris::BodyPosition pos = query(provider, g, jd_utc);
        const f64 sidereal = astro::Coordinates::to_sidereal_longitude(pos.tropical_longitude_deg, jd_utc, ayanamsa);

        positions[index_of(g)] = GrahaPosition{
            .graha              = g,
            .point              = ZodiacPoint::at(sidereal, tables),
            .tropical_longitude = pos.tropical_longitude_deg,
            .is_retrograde      = is_node(g) || pos.is_retrograde,
            .house              = 0,
        };
    }

    const GrahaPosition& rahu = positions[index_of(Graha::Rahu)];
    positions[index_of(Graha::Ketu)] = GrahaPosition{
        .graha              = Graha::Ketu,
        .point              = ZodiacPoint::at(rahu.point.longitude + 180.0, tables),
        .tropical_longitude = astro::Coordinates::normalize_degrees(rahu.tropical_longitude + 180.0),
        .is_retrograde      = true,
        .house              = 0,
    };

    return positions;
}

} // namespace jyotish::vedic
