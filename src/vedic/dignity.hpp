#pragma once

/// @file dignity.hpp
/// @brief Panchadha Maitri: five-fold friendship and the 1–9 dignity scale.

#include "core/graha_id.hpp"
#include "core/types.hpp"
#include "vedic/graha.hpp"
#include "vedic/reference_tables.hpp"

#include <array>
#include <optional>

namespace jyotish::vedic
{
    enum class DignityStatus
    {
        Exalted,
        Moolatrikona,
        OwnSign,
        GreatFriend,
        Friend,
        Neutral,
        Enemy,
        GreatEnemy,
        Debilitated,
    };

    /// @brief Tatkalika (temporary) relation from house placement.
    enum class TemporaryRelation
    {
        Friend,
        Enemy,
    };

    /// @brief Panchadha (compound) relation: natural joined with temporary.
    enum class CompoundRelation
    {
        GreatFriend,
        Friend,
        Neutral,
        Enemy,
        GreatEnemy,
    };

    struct Dignity
    {
        DignityStatus status;
        i32           score;  ///< 1 (debilitated) … 9 (exalted)

        bool operator==(const Dignity&) const = default;
    };

    /// @brief Row = graha, column = the graha it regards. The diagonal is Neutral.
    using CompoundMatrix = std::array<std::array<CompoundRelation, 9>, 9>;

    [[nodiscard]] const char* dignity_status_name(DignityStatus status);
    [[nodiscard]] const char* compound_relation_name(CompoundRelation relation);

    class DignityEngine
    {
    public:
        explicit DignityEngine(const ReferenceTables& tables)
            : m_tables(tables)
        {
        }

        /// @brief Fixed score of a status: exalted 9, moolatrikona 8, own 7,
        /// great friend 6, friend 5, neutral 4, enemy 3, great enemy 2, debilitated 1.
        [[nodiscard]] static i32 score(DignityStatus status);

        /// @brief Temporary friend iff the house distance (1–12) is 2, 3, 4, 10, 11 or 12.
        [[nodiscard]] static TemporaryRelation temporary_relation(i32 from_house, i32 to_house);

        [[nodiscard]] static CompoundRelation combine(NaturalRelation natural, TemporaryRelation temporary);

        /// @brief Dignity from the static tables only (natural relation to the rasi lord).
        [[nodiscard]] Dignity dignity(Graha graha, Rasi rasi) const;

        /// @brief Dignity with a known compound relation to the rasi lord.
        ///
        /// Exaltation and debilitation rasis take precedence over everything,
        /// then moolatrikona (checked against `degree_in_rasi` when given), then
        /// own sign, then the relation bucket.
        [[nodiscard]] Dignity dignity(Graha graha, Rasi rasi, std::optional<f64> degree_in_rasi,
                                      CompoundRelation relation_to_lord) const;

        /// @brief Compound relation of every graha toward every other graha.
        [[nodiscard]] CompoundMatrix compound_matrix(const GrahaPositions& positions) const;

        /// @brief Dignity of each graha in the rasi it occupies.
        [[nodiscard]] std::array<Dignity, 9> evaluate(const GrahaPositions& positions) const;

    private:
        [[nodiscard]] std::optional<Dignity> fixed_dignity(Graha graha, Rasi rasi,
                                                           std::optional<f64> degree_in_rasi) const;

        const ReferenceTables& m_tables;
    };

} // namespace jyotish::vedic
