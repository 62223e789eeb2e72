/// @file yoga.cpp
/// @brief Yoga detection over lordships and placements.

#include "vedic/yoga.hpp"

#include "vedic/aspects.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>

namespace jyotish::vedic
{

namespace
{
    std::vector<i32> ruled_matching(const GrahaLordship& lordship, bool (*predicate)(i32))
    {
        std::vector<i32> result;
        std::copy_if(lordship.houses_ruled.begin(), lordship.houses_ruled.end(),
                     std::back_inserter(result), predicate);
        return result;
    }

    std::vector<i32> merged(std::vector<i32> a, const std::vector<i32>& b)
    {
        a.insert(a.end(), b.begin(), b.end());
        std::sort(a.begin(), a.end());
        a.erase(std::unique(a.begin(), a.end()), a.end());
        return a;
    }

    bool is_wealth_house(i32 house) { return house == 2 || house == 11; }
    bool is_fortune_house(i32 house) { return house == 5 || house == 9; }
}

const char* yoga_category_name(YogaCategory category)
{
    switch (category)
    {
        case YogaCategory::Raj:         return "Raj";
        case YogaCategory::Dhana:       return "Dhana";
        case YogaCategory::Parivartana: return "Parivartana";
    }
    return "Unknown";
}

bool YogaDetector::is_exchange(const GrahaPositions& positions,
                               const ReferenceTables& tables,
                               Graha a, Graha b)
{
    if (a == b || is_node(a) || is_node(b))
    {
        return false;
    }
    return tables.ruler(positions[index_of(a)].point.rasi) == b
        && tables.ruler(positions[index_of(b)].point.rasi) == a;
}

// -----------------------------------------------------------------
// Raj yoga
// -----------------------------------------------------------------

std::vector<Yoga> YogaDetector::raj_yogas(const GrahaPositions& positions,
                                          const LordshipTable& lordships)
{
    std::vector<Yoga> yogas;

    for (std::size_t i = 0; i < kAllGrahas.size(); ++i)
    {
        for (std::size_t j = i + 1; j < kAllGrahas.size(); ++j)
        {
            const GrahaLordship& a = lordships.grahas[i];
            const GrahaLordship& b = lordships.grahas[j];

            // Either a rules a kendra and b a trikona, or the other way round
            const auto a_kendra = ruled_matching(a, HouseGroups::is_kendra);
            const auto a_trikona = ruled_matching(a, HouseGroups::is_trikona);
            const auto b_kendra = ruled_matching(b, HouseGroups::is_kendra);
            const auto b_trikona = ruled_matching(b, HouseGroups::is_trikona);

            const bool forward = !a_kendra.empty() && !b_trikona.empty();
            const bool reverse = !b_kendra.empty() && !a_trikona.empty();
            if (!forward && !reverse)
            {
                continue;
            }

            const GrahaPosition& pa = positions[i];
            const GrahaPosition& pb = positions[j];
            const bool conjunct = pa.house == pb.house;
            const bool mutual = AspectEngine::mutual_aspect(positions, a.graha, b.graha);
            if (!conjunct && !mutual)
            {
                continue;
            }

            std::vector<i32> houses;
            if (forward)
            {
                houses = merged(houses, merged(a_kendra, b_trikona));
            }
            if (reverse)
            {
                houses = merged(houses, merged(b_kendra, a_trikona));
            }

            yogas.push_back(Yoga{
                .name        = "Raj Yoga",
                .category    = YogaCategory::Raj,
                .grahas      = {a.graha, b.graha},
                .houses      = houses,
                .description = fmt::format("Kendra/trikona lords {} and {} {}",
                                           graha_name(a.graha), graha_name(b.graha),
                                           conjunct ? fmt::format("conjunct in house {}", pa.house)
                                                    : std::string("in mutual aspect")),
            });
        }
    }
    return yogas;
}

// -----------------------------------------------------------------
// Dhana yoga
// -----------------------------------------------------------------

std::vector<Yoga> YogaDetector::dhana_yogas(const GrahaPositions& positions,
                                            const LordshipTable& lordships,
                                            const ReferenceTables& tables)
{
    std::vector<Yoga> yogas;

    for (std::size_t i = 0; i < kAllGrahas.size(); ++i)
    {
        for (std::size_t j = i + 1; j < kAllGrahas.size(); ++j)
        {
            const GrahaLordship& a = lordships.grahas[i];
            const GrahaLordship& b = lordships.grahas[j];

            const auto a_wealth = ruled_matching(a, is_wealth_house);
            const auto b_wealth = ruled_matching(b, is_wealth_house);
            const auto a_fortune = ruled_matching(a, is_fortune_house);
            const auto b_fortune = ruled_matching(b, is_fortune_house);

            // 5th/9th lords join only when the partner rules 2 or 11
            const bool qualifies = (!a_wealth.empty() && (!b_wealth.empty() || !b_fortune.empty()))
                                || (!b_wealth.empty() && !a_fortune.empty());
            if (!qualifies)
            {
                continue;
            }

            const bool conjunct = positions[i].house == positions[j].house;
            const bool exchange = is_exchange(positions, tables, a.graha, b.graha);
            if (!conjunct && !exchange)
            {
                continue;
            }

            yogas.push_back(Yoga{
                .name        = "Dhana Yoga",
                .category    = YogaCategory::Dhana,
                .grahas      = {a.graha, b.graha},
                .houses      = merged(merged(a_wealth, a_fortune), merged(b_wealth, b_fortune)),
                .description = fmt::format("Wealth lords {} and {} {}",
                                           graha_name(a.graha), graha_name(b.graha),
                                           conjunct ? fmt::format("conjunct in house {}", positions[i].house)
                                                    : std::string("in sign exchange")),
            });
        }
    }
    return yogas;
}

// -----------------------------------------------------------------
// Parivartana yoga
// -----------------------------------------------------------------

std::vector<Yoga> YogaDetector::parivartana_yogas(const GrahaPositions& positions,
                                                  const ReferenceTables& tables)
{
    std::vector<Yoga> yogas;

    for (std::size_t i = 0; i < kAllGrahas.size(); ++i)
    {
        for (std::size_t j = i + 1; j < kAllGrahas.size(); ++j)
        {
            const Graha a = kAllGrahas[i];
            const Graha b = kAllGrahas[j];
            if (!is_exchange(positions, tables, a, b))
            {
                continue;
            }

            const i32 house_a = positions[i].house;
            const i32 house_b = positions[j].house;

            std::string name = "Maha Parivartana Yoga";
            if (HouseGroups::is_dusthana(house_a) || HouseGroups::is_dusthana(house_b))
            {
                name = "Dainya Parivartana Yoga";
            }
            else if (house_a == 3 || house_b == 3)
            {
                name = "Khala Parivartana Yoga";
            }

            yogas.push_back(Yoga{
                .name        = name,
                .category    = YogaCategory::Parivartana,
                .grahas      = {a, b},
                .houses      = {std::min(house_a, house_b), std::max(house_a, house_b)},
                .description = fmt::format("{} in {} and {} in {} exchange signs",
                                           graha_name(a), rasi_name(positions[i].point.rasi),
                                           graha_name(b), rasi_name(positions[j].point.rasi)),
            });
        }
    }
    return yogas;
}

std::vector<Yoga> YogaDetector::detect(const GrahaPositions& positions,
                                       const LordshipTable& lordships,
                                       const ReferenceTables& tables)
{
    std::vector<Yoga> yogas = raj_yogas(positions, lordships);
    const std::vector<Yoga> dhana = dhana_yogas(positions, lordships, tables);
    const std::vector<Yoga> exchanges = parivartana_yogas(positions, tables);
    yogas.insert(yogas.end(), dhana.begin(), dhana.end());
    yogas.insert(yogas.end(), exchanges.begin(), exchanges.end());
    return yogas;
}

} // namespace jyotish::vedic
