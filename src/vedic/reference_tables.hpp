#pragma once

/// @file reference_tables.hpp
/// @brief Immutable classical reference data: rasis, rulers, friendships, dignities, orbs.

#include "core/graha_id.hpp"
#include "core/types.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jyotish::vedic
{
    enum class Element
    {
        Fire,
        Earth,
        Air,
        Water,
    };

    enum class Modality
    {
        Movable,
        Fixed,
        Dual,
    };

    /// @brief Natural (permanent) relationship of one graha toward another.
    enum class NaturalRelation
    {
        Friend,
        Neutral,
        Enemy,
    };

    /// @brief Natural benefic/malefic classification of a graha.
    enum class NaturalNature
    {
        Benefic,
        Malefic,
    };

    [[nodiscard]] const char* element_name(Element e);
    [[nodiscard]] const char* modality_name(Modality m);
    [[nodiscard]] const char* natural_nature_name(NaturalNature n);

    struct RasiInfo
    {
        Element  element;
        Modality modality;
        Graha    ruler;
    };

    /// @brief Exaltation, debilitation, moolatrikona and own-sign data for one graha.
    struct DignityInfo
    {
        Rasi              exaltation;
        f64               exaltation_degree;
        Rasi              debilitation;
        Rasi              moolatrikona;
        f64               moolatrikona_start;  ///< Degree within the moolatrikona rasi (inclusive)
        f64               moolatrikona_end;    ///< Degree within the moolatrikona rasi (inclusive)
        std::vector<Rasi> own_signs;
    };

    struct BhavaInfo
    {
        std::string              name;
        std::vector<std::string> significations;
        std::vector<Graha>       karakas;       ///< Natural significators of the house
    };

    /// @brief Declarative source data, keyed by enum.
    ///
    /// Holds the classical tables as maps so that a missing entry is detectable.
    /// ReferenceTables compiles this into dense lookup arrays after validating it.
    struct ReferenceData
    {
        std::map<Rasi, RasiInfo>                              rasis;
        std::map<Graha, std::map<Graha, NaturalRelation>>     natural_relations;
        std::map<Graha, DignityInfo>                          dignities;
        std::map<Graha, f64>                                  combustion_orbs;  ///< Absent = never combust
        std::map<Graha, NaturalNature>                        natures;
        std::vector<std::string>                              nakshatra_names;
        std::vector<Graha>                                    vimshottari_sequence;
        std::map<i32, BhavaInfo>                              bhavas;

        /// @brief The classical Parashari tables.
        [[nodiscard]] static ReferenceData standard();
    };

    /// @brief Process-wide immutable lookup tables.
    ///
    /// Built once, validated for completeness (every rasi has a ruler, every
    /// ordered graha pair has a natural relation, every graha has dignity data,
    /// 27 nakshatras, 12 bhavas) and never mutated. Safe for concurrent reads.
    class ReferenceTables
    {
    public:
        /// @brief Validate and compile a data set.
        /// @throws core::CalculationInvariantError if any table is incomplete.
        explicit ReferenceTables(const ReferenceData& data);

        /// @brief The standard tables, built on first use.
        [[nodiscard]] static const ReferenceTables& instance();

        [[nodiscard]] const RasiInfo& rasi(Rasi r) const { return m_rasis[index_of(r)]; }
        [[nodiscard]] Graha ruler(Rasi r) const { return m_rasis[index_of(r)].ruler; }

        /// @brief Natural relation of `from` toward `to`. A graha is Neutral to itself.
        [[nodiscard]] NaturalRelation natural_relation(Graha from, Graha to) const;

        [[nodiscard]] const DignityInfo& dignity_info(Graha g) const { return m_dignities[index_of(g)]; }
        [[nodiscard]] bool owns(Graha g, Rasi r) const;

        /// @brief Rasis ruled by a graha (empty for the nodes).
        [[nodiscard]] std::vector<Rasi> ruled_rasis(Graha g) const;

        [[nodiscard]] std::optional<f64> combustion_orb(Graha g) const { return m_orbs[index_of(g)]; }
        [[nodiscard]] NaturalNature natural_nature(Graha g) const { return m_natures[index_of(g)]; }

        [[nodiscard]] const std::string& nakshatra_name(i32 index) const;
        [[nodiscard]] Graha nakshatra_lord(i32 index) const;

        /// @param house Bhava number 1–12.
        [[nodiscard]] const BhavaInfo& bhava_info(i32 house) const;

    private:
        std::array<RasiInfo, 12>                            m_rasis{};
        std::array<std::array<NaturalRelation, 9>, 9>       m_relations{};
        std::array<DignityInfo, 9>                          m_dignities{};
        std::array<std::optional<f64>, 9>                   m_orbs{};
        std::array<NaturalNature, 9>                        m_natures{};
        std::vector<std::string>                            m_nakshatras;
        std::vector<Graha>                                  m_vimshottari;
        std::array<BhavaInfo, 12>                           m_bhavas{};
    };

} // namespace jyotish::vedic
