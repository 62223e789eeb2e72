#pragma once

/// @file strength.hpp
/// @brief Graha and bhava strength scores on a 0–1 scale.

#include "core/types.hpp"
#include "vedic/aspects.hpp"
#include "vedic/bhava.hpp"
#include "vedic/combustion.hpp"
#include "vedic/dignity.hpp"
#include "vedic/graha.hpp"
#include "vedic/lordship.hpp"
#include "vedic/reference_tables.hpp"

#include <array>
#include <vector>

namespace jyotish::vedic
{
    /// @brief Tunable weights for the strength model.
    ///
    /// Bhava strength = occupant_weight × occupants
    ///                + aspect_weight × aspects
    ///                + lord_weight × lord
    ///                + combustion_weight × (lord not combust)
    /// The four weights are expected to sum to 1 so the result stays in [0, 1].
    struct StrengthWeights
    {
        f64 occupant_weight   = 0.30;
        f64 aspect_weight     = 0.20;
        f64 lord_weight       = 0.35;
        f64 combustion_weight = 0.15;

        f64 empty_house_score = 0.30;   ///< Occupant component of an empty house

        f64 aspect_baseline   = 0.50;   ///< Aspect component with no aspects
        f64 benefic_aspect    = 0.25;   ///< Added per natural-benefic aspect
        f64 malefic_aspect    = -0.25;  ///< Added per natural-malefic aspect

        f64 kendra_bonus      = 0.20;   ///< Graha placed in 1, 4, 7, 10
        f64 trikona_bonus     = 0.20;   ///< Graha placed in 5, 9 (1 counts as kendra)
        f64 dusthana_penalty  = 0.20;   ///< Graha placed in 6, 8, 12
        f64 combust_penalty   = 0.30;   ///< Combust graha
        f64 graha_aspect_step = 0.05;   ///< Per benefic (+) / malefic (−) aspect received by a graha
    };

    enum class StrengthCategory
    {
        VeryStrong,  ///< ≥ 0.8
        Strong,      ///< ≥ 0.6
        Moderate,    ///< ≥ 0.4
        Weak,        ///< ≥ 0.2
        VeryWeak,
    };

    [[nodiscard]] const char* strength_category_name(StrengthCategory category);
    [[nodiscard]] StrengthCategory categorize(f64 score);

    struct StrengthScore
    {
        f64              score;
        StrengthCategory category;

        bool operator==(const StrengthScore&) const = default;
    };

    struct StrengthTable
    {
        std::array<StrengthScore, 9>  grahas;
        std::array<StrengthScore, 12> bhavas;  ///< Index 0 = house 1

        bool operator==(const StrengthTable&) const = default;
    };

    class StrengthAnalyzer
    {
    public:
        StrengthAnalyzer(const ReferenceTables& tables, const StrengthWeights& weights)
            : m_tables(tables)
            , m_weights(weights)
        {
        }

        /// @brief Graha strength from dignity, house placement, combustion and aspects received.
        [[nodiscard]] f64 graha_strength(const GrahaPosition& position,
                                         const Dignity& dignity,
                                         bool is_combust,
                                         const std::vector<Aspect>& aspects) const;

        /// @brief Bhava strength from occupants, aspects, lord strength and lord combustion.
        [[nodiscard]] f64 bhava_strength(const Bhava& bhava,
                                         const std::array<Dignity, 9>& dignities,
                                         const std::array<f64, 9>& graha_scores,
                                         const CombustionFlags& combustion,
                                         const std::vector<Aspect>& aspects) const;

        [[nodiscard]] StrengthTable evaluate(const GrahaPositions& positions,
                                             const Bhavas& bhavas,
                                             const std::array<Dignity, 9>& dignities,
                                             const CombustionFlags& combustion,
                                             const std::vector<Aspect>& aspects) const;

    private:
        [[nodiscard]] f64 aspect_value(Graha source) const;

        const ReferenceTables& m_tables;
        StrengthWeights m_weights;
    };

} // namespace jyotish::vedic
