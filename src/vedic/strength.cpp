/// @file strength.cpp
/// @brief Weighted strength model for grahas and bhavas.

#include "vedic/strength.hpp"

#include <algorithm>

namespace jyotish::vedic
{

const char* strength_category_name(StrengthCategory category)
{
    switch (category)
    {
        case StrengthCategory::VeryStrong: return "Very Strong";
        case StrengthCategory::Strong:     return "Strong";
        case StrengthCategory::Moderate:   return "Moderate";
        case StrengthCategory::Weak:       return "Weak";
        case StrengthCategory::VeryWeak:   return "Very Weak";
    }
    return "Unknown";
}

StrengthCategory categorize(f64 score)
{
    if (score >= 0.8)
    {
        return StrengthCategory::VeryStrong;
    }
    if (score >= 0.6)
    {
        return StrengthCategory::Strong;
    }
    if (score >= 0.4)
    {
        return StrengthCategory::Moderate;
    }
    if (score >= 0.2)
    {
        return StrengthCategory::Weak;
    }
    return StrengthCategory::VeryWeak;
}

f64 StrengthAnalyzer::aspect_value(Graha source) const
{
    return m_tables.natural_nature(source) == NaturalNature::Benefic
        ? m_weights.benefic_aspect
        : m_weights.malefic_aspect;
}

// -----------------------------------------------------------------
// Graha strength
// -----------------------------------------------------------------

f64 StrengthAnalyzer::graha_strength(const GrahaPosition& position,
                                     const Dignity& dignity,
                                     bool is_combust,
                                     const std::vector<Aspect>& aspects) const
{
    f64 score = static_cast<f64>(dignity.score) / 9.0;

    if (HouseGroups::is_kendra(position.house))
    {
        score += m_weights.kendra_bonus;
    }
    else if (HouseGroups::is_trikona(position.house))
    {
        score += m_weights.trikona_bonus;
    }
    else if (HouseGroups::is_dusthana(position.house))
    {
        score -= m_weights.dusthana_penalty;
    }

    if (is_combust)
    {
        score -= m_weights.combust_penalty;
    }

    const i32 target = static_cast<i32>(index_of(position.graha));
    for (const Aspect& aspect : aspects)
    {
        if (aspect.system != AspectSystem::Graha
            || aspect.target.kind != PointKind::Graha
            || aspect.target.index != target)
        {
            continue;
        }
        const auto source = static_cast<Graha>(aspect.source.index);
        score += m_tables.natural_nature(source) == NaturalNature::Benefic
            ? m_weights.graha_aspect_step
            : -m_weights.graha_aspect_step;
    }

    return std::clamp(score, 0.0, 1.0);
}

// -----------------------------------------------------------------
// Bhava strength
// -----------------------------------------------------------------

f64 StrengthAnalyzer::bhava_strength(const Bhava& bhava,
                                     const std::array<Dignity, 9>& dignities,
                                     const std::array<f64, 9>& graha_scores,
                                     const CombustionFlags& combustion,
                                     const std::vector<Aspect>& aspects) const
{
    f64 occupant = m_weights.empty_house_score;
    if (!bhava.occupants.empty())
    {
        f64 total = 0.0;
        for (const Graha g : bhava.occupants)
        {
            total += static_cast<f64>(dignities[index_of(g)].score) / 9.0;
        }
        occupant = total / static_cast<f64>(bhava.occupants.size());
    }

    f64 aspect = m_weights.aspect_baseline;
    for (const Aspect& a : aspects)
    {
        if (a.system == AspectSystem::Graha
            && a.target.kind == PointKind::Bhava
            && a.target.index == bhava.number)
        {
            aspect += aspect_value(static_cast<Graha>(a.source.index));
        }
    }
    aspect = std::clamp(aspect, 0.0, 1.0);

    const f64 lord = graha_scores[index_of(bhava.lord)];
    const f64 not_combust = combustion[index_of(bhava.lord)] ? 0.0 : 1.0;

    const f64 score = m_weights.occupant_weight * occupant
                    + m_weights.aspect_weight * aspect
                    + m_weights.lord_weight * lord
                    + m_weights.combustion_weight * not_combust;

    return std::clamp(score, 0.0, 1.0);
}

StrengthTable StrengthAnalyzer::evaluate(const GrahaPositions& positions,
                                         const Bhavas& bhavas,
                                         const std::array<Dignity, 9>& dignities,
                                         const CombustionFlags& combustion,
                                         const std::vector<Aspect>& aspects) const
{
    StrengthTable table{};

    std::array<f64, 9> graha_scores{};
    for (const GrahaPosition& pos : positions)
    {
        const std::size_t i = index_of(pos.graha);
        graha_scores[i] = graha_strength(pos, dignities[i], combustion[i], aspects);
        table.grahas[i] = StrengthScore{graha_scores[i], categorize(graha_scores[i])};
    }

    for (const Bhava& bhava : bhavas)
    {
        const f64 score = bhava_strength(bhava, dignities, graha_scores, combustion, aspects);
        table.bhavas[static_cast<std::size_t>(bhava.number - 1)] = StrengthScore{score, categorize(score)};
    }

    return table;
}

} // namespace jyotish::vedic
