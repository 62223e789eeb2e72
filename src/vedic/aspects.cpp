/// @file aspects.cpp
/// @brief Graha drishti, rasi drishti and conjunction detection.

#include "vedic/aspects.hpp"

#include "astro/coordinates.hpp"
#include "vedic/bhava.hpp"

#include <algorithm>

namespace jyotish::vedic
{

const char* aspect_type_name(AspectType type)
{
    return type == AspectType::Full ? "Full" : "Special";
}

const char* conjunction_strength_name(ConjunctionStrength strength)
{
    switch (strength)
    {
        case ConjunctionStrength::VeryClose: return "Very Close";
        case ConjunctionStrength::Close:     return "Close";
        case ConjunctionStrength::Moderate:  return "Moderate";
        case ConjunctionStrength::Wide:      return "Wide";
    }
    return "Unknown";
}

// -----------------------------------------------------------------
// Drishti rules
// -----------------------------------------------------------------

std::vector<i32> AspectEngine::aspect_distances(Graha graha)
{
    std::vector<i32> distances{7};
    switch (graha)
    {
        case Graha::Mars:
            distances.insert(distances.end(), {4, 8});
            break;
        case Graha::Jupiter:
            distances.insert(distances.end(), {5, 9});
            break;
        case Graha::Saturn:
            distances.insert(distances.end(), {3, 10});
            break;
        default:
            break;
    }
    std::sort(distances.begin(), distances.end());
    distances.erase(std::unique(distances.begin(), distances.end()), distances.end());
    return distances;
}

bool AspectEngine::aspects_distance(Graha graha, i32 distance)
{
    const std::vector<i32> distances = aspect_distances(graha);
    return std::find(distances.begin(), distances.end(), distance) != distances.end();
}

AspectType AspectEngine::aspect_type(i32 distance)
{
    return distance == 7 ? AspectType::Full : AspectType::Special;
}

std::vector<Rasi> AspectEngine::rasi_aspects(Rasi rasi, const ReferenceTables& tables)
{
    const Modality own = tables.rasi(rasi).modality;
    const i32 from = static_cast<i32>(index_of(rasi));

    std::vector<Rasi> targets;
    for (i32 offset = 1; offset < 12; ++offset)
    {
        const Rasi target = rasi_from_index(from + offset);
        const Modality other = tables.rasi(target).modality;

        bool aspected = false;
        switch (own)
        {
            case Modality::Movable: aspected = other == Modality::Fixed; break;
            case Modality::Fixed:   aspected = other == Modality::Movable; break;
            case Modality::Dual:    aspected = other == Modality::Dual; break;
        }

        // Movable and fixed signs skip their neighbour
        const bool adjacent = offset == 1 || offset == 11;
        if (aspected && !(own != Modality::Dual && adjacent))
        {
            targets.push_back(target);
        }
    }
    return targets;
}

// -----------------------------------------------------------------
// Aspect lists
// -----------------------------------------------------------------

std::vector<Aspect> AspectEngine::graha_to_bhava(const GrahaPositions& positions)
{
    std::vector<Aspect> aspects;
    for (const GrahaPosition& pos : positions)
    {
        for (const i32 distance : aspect_distances(pos.graha))
        {
            const i32 target_house = (pos.house - 1 + distance - 1) % 12 + 1;
            aspects.push_back(Aspect{
                .system         = AspectSystem::Graha,
                .type           = aspect_type(distance),
                .source         = {PointKind::Graha, static_cast<i32>(index_of(pos.graha))},
                .target         = {PointKind::Bhava, target_house},
                .house_distance = distance,
                .arc_deg        = static_cast<f64>(distance - 1) * zodiac_constants::kRasiSpan,
            });
        }
    }
    return aspects;
}

std::vector<Aspect> AspectEngine::graha_to_graha(const GrahaPositions& positions)
{
    std::vector<Aspect> aspects;
    for (const GrahaPosition& source : positions)
    {
        for (const GrahaPosition& target : positions)
        {
            if (source.graha == target.graha)
            {
                continue;
            }
            const i32 distance = BhavaCalculator::house_distance(source.house, target.house);
            if (!aspects_distance(source.graha, distance))
            {
                continue;
            }
            aspects.push_back(Aspect{
                .system         = AspectSystem::Graha,
                .type           = aspect_type(distance),
                .source         = {PointKind::Graha, static_cast<i32>(index_of(source.graha))},
                .target         = {PointKind::Graha, static_cast<i32>(index_of(target.graha))},
                .house_distance = distance,
                .arc_deg        = astro::Coordinates::normalize_degrees(
                    target.point.longitude - source.point.longitude),
            });
        }
    }
    return aspects;
}

std::vector<Aspect> AspectEngine::rasi_to_rasi(const ReferenceTables& tables)
{
    std::vector<Aspect> aspects;
    for (i32 from = 0; from < zodiac_constants::kRasiCount; ++from)
    {
        const Rasi source = rasi_from_index(from);
        for (const Rasi target : rasi_aspects(source, tables))
        {
            const i32 to = static_cast<i32>(index_of(target));
            const i32 distance = ((to - from) % 12 + 12) % 12 + 1;
            aspects.push_back(Aspect{
                .system         = AspectSystem::Rasi,
                .type           = AspectType::Full,
                .source         = {PointKind::Rasi, from},
                .target         = {PointKind::Rasi, to},
                .house_distance = distance,
                .arc_deg        = static_cast<f64>(distance - 1) * zodiac_constants::kRasiSpan,
            });
        }
    }
    return aspects;
}

std::vector<Aspect> AspectEngine::compute(const GrahaPositions& positions, const ReferenceTables& tables)
{
    std::vector<Aspect> aspects = graha_to_bhava(positions);
    const std::vector<Aspect> between_grahas = graha_to_graha(positions);
    const std::vector<Aspect> between_rasis = rasi_to_rasi(tables);
    aspects.insert(aspects.end(), between_grahas.begin(), between_grahas.end());
    aspects.insert(aspects.end(), between_rasis.begin(), between_rasis.end());
    return aspects;
}

bool AspectEngine::graha_aspects(const GrahaPositions& positions, Graha from, Graha to)
{
    if (from == to)
    {
        return false;
    }
    const i32 distance = BhavaCalculator::house_distance(positions[index_of(from)].house,
                                                         positions[index_of(to)].house);
    return aspects_distance(from, distance);
}

bool AspectEngine::mutual_aspect(const GrahaPositions& positions, Graha a, Graha b)
{
    return graha_aspects(positions, a, b) && graha_aspects(positions, b, a);
}

// -----------------------------------------------------------------
// Conjunctions (degree based)
// -----------------------------------------------------------------

std::vector<Conjunction> AspectEngine::conjunctions(const GrahaPositions& positions, f64 orb_deg)
{
    std::vector<Conjunction> result;
    for (std::size_t i = 0; i < positions.size(); ++i)
    {
        for (std::size_t j = i + 1; j < positions.size(); ++j)
        {
            const f64 separation = astro::Coordinates::angular_distance(
                positions[i].point.longitude, positions[j].point.longitude);
            if (separation > orb_deg)
            {
                continue;
            }

            ConjunctionStrength strength = ConjunctionStrength::Wide;
            if (separation <= 1.0)
            {
                strength = ConjunctionStrength::VeryClose;
            }
            else if (separation <= 3.0)
            {
                strength = ConjunctionStrength::Close;
            }
            else if (separation <= 5.0)
            {
                strength = ConjunctionStrength::Moderate;
            }

            result.push_back(Conjunction{
                .first          = positions[i].graha,
                .second         = positions[j].graha,
                .separation_deg = separation,
                .strength       = strength,
            });
        }
    }
    return result;
}

} // namespace jyotish::vedic
