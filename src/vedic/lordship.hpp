#pragma once

/// @file lordship.hpp
/// @brief House groupings, house lords and functional benefic/malefic classification.

#include "core/graha_id.hpp"
#include "core/types.hpp"
#include "vedic/bhava.hpp"
#include "vedic/combustion.hpp"
#include "vedic/graha.hpp"
#include "vedic/reference_tables.hpp"

#include <array>
#include <vector>

namespace jyotish::vedic
{
    /// @brief Traditional house groups.
    class HouseGroups
    {
    public:
        HouseGroups() = delete;

        [[nodiscard]] static bool is_kendra(i32 house);    ///< 1, 4, 7, 10
        [[nodiscard]] static bool is_trikona(i32 house);   ///< 1, 5, 9
        [[nodiscard]] static bool is_dusthana(i32 house);  ///< 6, 8, 12
        [[nodiscard]] static bool is_upachaya(i32 house);  ///< 3, 6, 10, 11
        [[nodiscard]] static bool is_maraka(i32 house);    ///< 2, 7
    };

    enum class FunctionalNature
    {
        Benefic,
        Malefic,
        Neutral,
        YogaKaraka,
    };

    [[nodiscard]] const char* functional_nature_name(FunctionalNature nature);

    /// @brief Lordship role of one graha for the chart's ascendant.
    struct GrahaLordship
    {
        Graha            graha;
        std::vector<i32> houses_ruled;  ///< Ascending
        FunctionalNature nature;

        bool operator==(const GrahaLordship&) const = default;
    };

    /// @brief Lord of one house and where that lord sits.
    struct HouseLordship
    {
        i32   house;
        Graha lord;
        i32   lord_placement;  ///< House occupied by the lord
        bool  lord_combust;

        bool operator==(const HouseLordship&) const = default;
    };

    struct LordshipTable
    {
        std::array<GrahaLordship, 9>  grahas;
        std::array<HouseLordship, 12> houses;

        bool operator==(const LordshipTable&) const = default;
    };

    /// @brief Functional-nature policy, precomputed for all 12 ascendants × 9 grahas.
    ///
    /// Precedence, first match wins:
    ///  1. rules no house (nodes)                      → Neutral
    ///  2. rules a kendra and a trikona among 5, 9      → YogaKaraka
    ///  3. rules house 1                                → Benefic
    ///  4. rules house 5 or 9                           → Benefic
    ///  5. rules house 6, 8 or 12                       → Malefic
    ///  6. rules a kendra together with 2, 3 or 11      → Neutral
    ///  7. rules a kendra                               → Benefic
    ///  8. rules house 3 or 11                          → Malefic
    ///  9. otherwise (house 2 alone)                    → Neutral
    class LordshipPolicy
    {
    public:
        explicit LordshipPolicy(const ReferenceTables& tables);

        /// @brief The policy for the standard tables, built on first use.
        [[nodiscard]] static const LordshipPolicy& instance();

        /// @brief Classify a set of ruled houses.
        [[nodiscard]] static FunctionalNature classify(const std::vector<i32>& houses_ruled);

        /// @brief Houses (1–12, ascending) ruled by `graha` when `ascendant` rises.
        [[nodiscard]] const std::vector<i32>& houses_ruled(Rasi ascendant, Graha graha) const;

        [[nodiscard]] FunctionalNature functional_nature(Rasi ascendant, Graha graha) const;
        [[nodiscard]] bool is_yoga_karaka(Rasi ascendant, Graha graha) const;

        /// @brief Grahas that are yoga karaka for the ascendant (at most one classically).
        [[nodiscard]] std::vector<Graha> yoga_karakas(Rasi ascendant) const;

    private:
        std::array<std::array<std::vector<i32>, 9>, 12>    m_houses{};
        std::array<std::array<FunctionalNature, 9>, 12>    m_natures{};
    };

    class LordshipAnalyzer
    {
    public:
        LordshipAnalyzer() = delete;

        /// @brief Full lordship table for one chart.
        [[nodiscard]] static LordshipTable analyze(const LordshipPolicy& policy,
                                                   Rasi ascendant,
                                                   const GrahaPositions& positions,
                                                   const Bhavas& bhavas,
                                                   const CombustionFlags& combustion);
    };

} // namespace jyotish::vedic
