/// @file bhava.cpp
/// @brief Equal-house cusps and house assignment.

#include "vedic/bhava.hpp"

#include "astro/coordinates.hpp"
#include "core/errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace jyotish::vedic
{

const char* house_system_name(HouseSystem system)
{
    switch (system)
    {
        case HouseSystem::Equal: return "Equal";
    }
    return "Unknown";
}

HouseSystem parse_house_system(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "equal")
    {
        return HouseSystem::Equal;
    }
    throw core::ConfigurationError(fmt::format("Unsupported house system '{}'", name));
}

std::array<f64, 12> BhavaCalculator::cusps(HouseSystem system, f64 ascendant_deg)
{
    std::array<f64, 12> result{};
    switch (system)
    {
        case HouseSystem::Equal:
            for (std::size_t i = 0; i < result.size(); ++i)
            {
                result[i] = astro::Coordinates::normalize_degrees(
                    ascendant_deg + static_cast<f64>(i) * zodiac_constants::kRasiSpan);
            }
            return result;
    }
    throw core::ConfigurationError("House system has no cusp handler");
}

i32 BhavaCalculator::house_of(f64 longitude_deg, const std::array<f64, 12>& cusps)
{
    const f64 lon = astro::Coordinates::normalize_degrees(longitude_deg);
    for (std::size_t i = 0; i < cusps.size(); ++i)
    {
        const f64 start = cusps[i];
        const f64 span = astro::Coordinates::normalize_degrees(cusps[(i + 1) % cusps.size()] - start);
        if (astro::Coordinates::normalize_degrees(lon - start) < span)
        {
            return static_cast<i32>(i) + 1;
        }
    }
    // Only reachable through rounding at a cusp boundary
    const f64 offset = astro::Coordinates::normalize_degrees(lon - cusps[0]);
    return std::clamp(static_cast<i32>(std::floor(offset / zodiac_constants::kRasiSpan)) + 1, 1, 12);
}

i32 BhavaCalculator::house_distance(i32 from_house, i32 to_house)
{
    return ((to_house - from_house) % 12 + 12) % 12 + 1;
}

Bhavas BhavaCalculator::compute(HouseSystem system,
                                f64 ascendant_deg,
                                GrahaPositions& positions,
                                const ReferenceTables& tables)
{
    const std::array<f64, 12> cusp_list = cusps(system, ascendant_deg);

    Bhavas bhavas{};
    for (std::size_t i = 0; i < bhavas.size(); ++i)
    {
        const i32 number = static_cast<i32>(i) + 1;
        const ZodiacPoint cusp_point = ZodiacPoint::at(cusp_list[i], tables);
        const BhavaInfo& info = tables.bhava_info(number);

        bhavas[i] = Bhava{
            .number         = number,
            .cusp           = cusp_list[i],
            .rasi           = cusp_point.rasi,
            .lord           = tables.ruler(cusp_point.rasi),
            .occupants      = {},
            .name           = info.name,
            .significations = info.significations,
        };
    }

    for (GrahaPosition& pos : positions)
    {
        pos.house = house_of(pos.point.longitude, cusp_list);
        bhavas[static_cast<std::size_t>(pos.house - 1)].occupants.push_back(pos.graha);
    }

    return bhavas;
}

} // namespace jyotish::vedic
