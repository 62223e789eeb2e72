#pragma once

/// @file chart.hpp
/// @brief Immutable birth chart: the aggregate of every analysis for one birth.

#include "astro/ayanamsa.hpp"
#include "astro/time_system.hpp"
#include "core/graha_id.hpp"
#include "core/types.hpp"
#include "ephemeris/ephemeris_provider.hpp"
#include "vedic/aspects.hpp"
#include "vedic/bhava.hpp"
#include "vedic/combustion.hpp"
#include "vedic/dignity.hpp"
#include "vedic/graha.hpp"
#include "vedic/karaka.hpp"
#include "vedic/lordship.hpp"
#include "vedic/panchanga.hpp"
#include "vedic/reference_tables.hpp"
#include "vedic/strength.hpp"
#include "vedic/yoga.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace jyotish::vedic
{
    /// @brief Birth instant, location and calculation choices.
    struct BirthInput
    {
        std::string           utc_instant;          ///< ISO-8601
        f64                   latitude  = 0.0;      ///< [-90, 90], north positive
        f64                   longitude = 0.0;      ///< [-180, 180], east positive
        astro::AyanamsaSystem ayanamsa  = astro::AyanamsaSystem::Lahiri;
        HouseSystem           house_system = HouseSystem::Equal;

        /// @brief Build an input from textual system names.
        /// @throws core::ConfigurationError for an unknown ayanamsa or house system.
        [[nodiscard]] static BirthInput from_names(std::string utc_instant, f64 latitude, f64 longitude,
                                                   std::string_view ayanamsa, std::string_view house_system);
    };

    /// @brief One graha as reported by a chart.
    struct GrahaReport
    {
        GrahaPosition    position;
        bool             is_combust;
        Dignity          dignity;
        StrengthScore    strength;
        FunctionalNature functional_nature;

        bool operator==(const GrahaReport&) const = default;
    };

    /// @brief One house as reported by a chart.
    struct BhavaReport
    {
        Bhava                    bhava;
        StrengthScore            strength;
        std::vector<std::string> classification;  ///< "Kendra", "Trikona", "Dusthana", "Upachaya", "Maraka"
        i32                      lord_placement;
        bool                     lord_combust;

        bool operator==(const BhavaReport&) const = default;
    };

    struct SpecialPoints
    {
        ZodiacPoint midheaven;
        ZodiacPoint part_of_fortune;  ///< Ascendant + Moon − Sun

        bool operator==(const SpecialPoints&) const = default;
    };

    struct ChartSummary
    {
        std::string        birth_instant;
        f64                latitude;
        f64                longitude;
        std::string        ayanamsa;
        f64                ayanamsa_offset;
        std::string        house_system;
        ZodiacPoint        ascendant;
        Rasi               moon_rasi;
        i32                moon_nakshatra;
        std::vector<Graha> retrograde_grahas;
        std::vector<Graha> combust_grahas;
        std::vector<Graha> strongest_grahas;  ///< Top three, strongest first
        std::vector<i32>   strongest_bhavas;  ///< Top three, strongest first
        Graha              atmakaraka;
        std::vector<Graha> yoga_karakas;
        std::size_t        aspect_count;
        std::size_t        conjunction_count;
        std::size_t        yoga_count;
        f64                overall_strength;  ///< Mean bhava strength
        StrengthCategory   overall_category;
        Panchanga          panchanga;
    };

    /// @brief Fully computed, immutable birth chart.
    ///
    /// The constructor is the only producer: it either completes every
    /// analysis or throws, so a partially populated chart is never observable.
    /// All accessors are const; a Chart can be shared read-only across threads.
    class Chart
    {
    public:
        /// @throws core::InputError for a malformed instant or out-of-range location.
        /// @throws core::ConfigurationError for an unsupported ayanamsa or house system.
        /// @throws core::EphemerisError if the provider fails for any body.
        /// @throws core::CalculationInvariantError if an internal consistency check fails.
        Chart(const BirthInput& input,
              const ephemeris::EphemerisProvider& provider,
              const ReferenceTables& tables = ReferenceTables::instance(),
              const StrengthWeights& weights = {});

        // -----------------------------------------------------------------
        // Query surface
        // -----------------------------------------------------------------
        [[nodiscard]] const ZodiacPoint& get_ascendant() const { return m_ascendant; }
        [[nodiscard]] const std::array<GrahaReport, 9>& get_graha_positions() const { return m_grahas; }
        [[nodiscard]] const std::array<BhavaReport, 12>& get_bhavas() const { return m_bhavas; }
        [[nodiscard]] const std::vector<Aspect>& get_aspects() const { return m_aspects; }
        [[nodiscard]] ChartSummary get_chart_summary() const;

        // -----------------------------------------------------------------
        // Details
        // -----------------------------------------------------------------
        [[nodiscard]] const astro::DateTime& birth_instant() const { return m_birth_instant; }
        [[nodiscard]] f64 julian_day() const { return m_julian_day; }
        [[nodiscard]] f64 latitude() const { return m_latitude; }
        [[nodiscard]] f64 longitude() const { return m_longitude; }
        [[nodiscard]] astro::AyanamsaSystem ayanamsa() const { return m_ayanamsa; }
        [[nodiscard]] f64 ayanamsa_offset() const { return m_ayanamsa_offset; }
        [[nodiscard]] HouseSystem house_system() const { return m_house_system; }
        [[nodiscard]] f64 obliquity() const { return m_obliquity; }

        [[nodiscard]] const GrahaReport& graha(Graha g) const { return m_grahas[index_of(g)]; }
        /// @param house 1–12
        [[nodiscard]] const BhavaReport& bhava(i32 house) const;

        [[nodiscard]] const std::vector<Yoga>& yogas() const { return m_yogas; }
        [[nodiscard]] const LordshipTable& lordships() const { return m_lordships; }
        [[nodiscard]] const CompoundMatrix& compound_relations() const { return m_compound; }
        [[nodiscard]] const CharaKarakas& chara_karakas() const { return m_karakas; }
        [[nodiscard]] const SpecialPoints& special_points() const { return m_special_points; }
        [[nodiscard]] const std::vector<Conjunction>& conjunctions() const { return m_conjunctions; }
        [[nodiscard]] const Panchanga& panchanga() const { return m_panchanga; }

        bool operator==(const Chart&) const = default;

    private:
        void check_invariants() const;
        [[noreturn]] void fail_invariant(const std::string& what) const;

        astro::DateTime          m_birth_instant{};
        f64                      m_julian_day = 0.0;
        f64                      m_latitude = 0.0;
        f64                      m_longitude = 0.0;
        astro::AyanamsaSystem    m_ayanamsa = astro::AyanamsaSystem::Lahiri;
        f64                      m_ayanamsa_offset = 0.0;
        HouseSystem              m_house_system = HouseSystem::Equal;
        f64                      m_obliquity = 0.0;

        ZodiacPoint                 m_ascendant{};
        std::array<GrahaReport, 9>  m_grahas{};
        std::array<BhavaReport, 12> m_bhavas{};
        std::vector<Aspect>         m_aspects;
        std::vector<Conjunction>    m_conjunctions;
        CompoundMatrix              m_compound{};
        LordshipTable               m_lordships{};
        std::vector<Yoga>           m_yogas;
        CharaKarakas                m_karakas{};
        SpecialPoints               m_special_points{};
        Panchanga                   m_panchanga{};
    };

} // namespace jyotish::vedic
