/// @file lordship.cpp
/// @brief Lordship analysis and the functional-nature policy table.

#include "vedic/lordship.hpp"

#include <algorithm>
#include <utility>

namespace jyotish::vedic
{

// -----------------------------------------------------------------
// House groups
// -----------------------------------------------------------------

bool HouseGroups::is_kendra(i32 house)
{
    return house == 1 || house == 4 || house == 7 || house == 10;
}

bool HouseGroups::is_trikona(i32 house)
{
    return house == 1 || house == 5 || house == 9;
}

bool HouseGroups::is_dusthana(i32 house)
{
    return house == 6 || house == 8 || house == 12;
}

bool HouseGroups::is_upachaya(i32 house)
{
    return house == 3 || house == 6 || house == 10 || house == 11;
}

bool HouseGroups::is_maraka(i32 house)
{
    return house == 2 || house == 7;
}

const char* functional_nature_name(FunctionalNature nature)
{
    switch (nature)
    {
        case FunctionalNature::Benefic:    return "Benefic";
        case FunctionalNature::Malefic:    return "Malefic";
        case FunctionalNature::Neutral:    return "Neutral";
        case FunctionalNature::YogaKaraka: return "Yoga Karaka";
    }
    return "Unknown";
}

// -----------------------------------------------------------------
// Policy
// -----------------------------------------------------------------

FunctionalNature LordshipPolicy::classify(const std::vector<i32>& houses_ruled)
{
    const auto rules = [&houses_ruled](auto predicate)
    {
        return std::any_of(houses_ruled.begin(), houses_ruled.end(), predicate);
    };
    const auto rules_house = [&houses_ruled](i32 house)
    {
        return std::find(houses_ruled.begin(), houses_ruled.end(), house) != houses_ruled.end();
    };

    if (houses_ruled.empty())
    {
        return FunctionalNature::Neutral;
    }

    const bool kendra = rules(HouseGroups::is_kendra);
    const bool trine = rules_house(5) || rules_house(9);

    if (kendra && trine && !rules_house(1))
    {
        return FunctionalNature::YogaKaraka;
    }
    if (rules_house(1) || trine)
    {
        return FunctionalNature::Benefic;
    }
    if (rules(HouseGroups::is_dusthana))
    {
        return FunctionalNature::Malefic;
    }
    if (kendra)
    {
        return (rules_house(2) || rules_house(3) || rules_house(11))
            ? FunctionalNature::Neutral
            : FunctionalNature::Benefic;
    }
    if (rules_house(3) || rules_house(11))
    {
        return FunctionalNature::Malefic;
    }
    return FunctionalNature::Neutral;
}

LordshipPolicy::LordshipPolicy(const ReferenceTables& tables)
{
    for (i32 asc = 0; asc < zodiac_constants::kRasiCount; ++asc)
    {
        for (const Graha g : kAllGrahas)
        {
            std::vector<i32> houses;
            for (const Rasi r : tables.ruled_rasis(g))
            {
                houses.push_back(((static_cast<i32>(index_of(r)) - asc) % 12 + 12) % 12 + 1);
            }
            std::sort(houses.begin(), houses.end());

            const auto a = static_cast<std::size_t>(asc);
            m_natures[a][index_of(g)] = classify(houses);
            m_houses[a][index_of(g)] = std::move(houses);
        }
    }
}

const LordshipPolicy& LordshipPolicy::instance()
{
    static const LordshipPolicy policy(ReferenceTables::instance());
    return policy;
}

const std::vector<i32>& LordshipPolicy::houses_ruled(Rasi ascendant, Graha graha) const
{
    return m_houses[index_of(ascendant)][index_of(graha)];
}

FunctionalNature LordshipPolicy::functional_nature(Rasi ascendant, Graha graha) const
{
    return m_natures[index_of(ascendant)][index_of(graha)];
}

bool LordshipPolicy::is_yoga_karaka(Rasi ascendant, Graha graha) const
{
    return functional_nature(ascendant, graha) == FunctionalNature::YogaKaraka;
}

std::vector<Graha> LordshipPolicy::yoga_karakas(Rasi ascendant) const
{
    std::vector<Graha> result;
    for (const Graha g : kAllGrahas)
    {
        if (is_yoga_karaka(ascendant, g))
        {
            result.push_back(g);
        }
    }
    return result;
}

// -----------------------------------------------------------------
// Per-chart table
// -----------------------------------------------------------------

LordshipTable LordshipAnalyzer::analyze(const LordshipPolicy& policy,
                                       Rasi ascendant,
                                       const GrahaPositions& positions,
                                       const Bhavas& bhavas,
                                       const CombustionFlags& combustion)
{
    LordshipTable table{};

    for (const Graha g : kAllGrahas)
    {
        table.grahas[index_of(g)] = GrahaLordship{
            .graha        = g,
            .houses_ruled = policy.houses_ruled(ascendant, g),
            .nature       = policy.functional_nature(ascendant, g),
        };
    }

    const std::array<bool, 12> lord_combust = CombustionDetector::house_lord_combustion(bhavas, combustion);
    for (const Bhava& bhava : bhavas)
    {
        const auto slot = static_cast<std::size_t>(bhava.number - 1);
        table.houses[slot] = HouseLordship{
            .house          = bhava.number,
            .lord           = bhava.lord,
            .lord_placement = positions[index_of(bhava.lord)].house,
            .lord_combust   = lord_combust[slot],
        };
    }

    return table;
}

} // namespace jyotish::vedic
