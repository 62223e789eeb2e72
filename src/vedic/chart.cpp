/// @file chart.cpp
/// @brief Chart construction pipeline, invariant checks and summary.

#include "vedic/chart.hpp"

#include "astro/coordinates.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>
#include <utility>

namespace jyotish::vedic
{

BirthInput BirthInput::from_names(std::string utc_instant, f64 latitude, f64 longitude,
                                  std::string_view ayanamsa, std::string_view house_system)
{
    return BirthInput{
        .utc_instant  = std::move(utc_instant),
        .latitude     = latitude,
        .longitude    = longitude,
        .ayanamsa     = astro::parse_ayanamsa(ayanamsa),
        .house_system = parse_house_system(house_system),
    };
}

namespace
{
    void validate_location(f64 latitude, f64 longitude)
    {
        if (!std::isfinite(latitude) || latitude < -90.0 || latitude > 90.0)
        {
            throw core::InputError(fmt::format("Latitude {} outside [-90, 90]", latitude));
        }
        if (!std::isfinite(longitude) || longitude < -180.0 || longitude > 180.0)
        {
            throw core::InputError(fmt::format("Longitude {} outside [-180, 180]", longitude));
        }
    }

    f64 provider_obliquity(const ephemeris::EphemerisProvider& provider, f64 jd)
    {
        f64 eps = 0.0;
        try
        {
            eps = provider.obliquity(jd);
        }
        catch (const core::EphemerisError&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            throw core::EphemerisError(fmt::format("Ephemeris provider failed for obliquity: {}", e.what()),
                                       "Obliquity");
        }
        catch (...)
        {
            throw core::EphemerisError("Ephemeris provider failed for obliquity with an unknown exception",
                                       "Obliquity");
        }
        if (!std::isfinite(eps) || eps < 20.0 || eps > 27.0)
        {
            throw core::EphemerisError(fmt::format("Implausible obliquity {}", eps), "Obliquity");
        }
        return eps;
    }

    std::vector<std::string> classify_house(i32 house)
    {
        std::vector<std::string> groups;
        if (HouseGroups::is_kendra(house))   { groups.emplace_back("Kendra"); }
        if (HouseGroups::is_trikona(house))  { groups.emplace_back("Trikona"); }
        if (HouseGroups::is_dusthana(house)) { groups.emplace_back("Dusthana"); }
        if (HouseGroups::is_upachaya(house)) { groups.emplace_back("Upachaya"); }
        if (HouseGroups::is_maraka(house))   { groups.emplace_back("Maraka"); }
        return groups;
    }
}

// -----------------------------------------------------------------
// Construction pipeline
//
// instant + location → graha positions + ascendant → bhavas →
// {aspects, dignity, combustion} → lordship → strength + yogas
// -----------------------------------------------------------------

Chart::Chart(const BirthInput& input,
             const ephemeris::EphemerisProvider& provider,
             const ReferenceTables& tables,
             const StrengthWeights& weights)
    : m_latitude(input.latitude)
    , m_longitude(input.longitude)
    , m_ayanamsa(input.ayanamsa)
    , m_house_system(input.house_system)
{
    validate_location(input.latitude, input.longitude);
    m_birth_instant = astro::TimeSystem::parse_iso8601(input.utc_instant);
    m_julian_day = astro::TimeSystem::to_julian_date(m_birth_instant);
    m_ayanamsa_offset = astro::Ayanamsa::offset(m_ayanamsa, m_julian_day);

    // ---- Positions ----
    GrahaPositions positions = GrahaCalculator::compute(provider, m_julian_day, m_ayanamsa, tables);

    m_obliquity = provider_obliquity(provider, m_julian_day);
    const f64 lst_hours = astro::Coordinates::local_sidereal_time(m_birth_instant, m_longitude);
    const f64 tropical_asc = astro::Coordinates::ascendant_longitude(lst_hours, m_latitude, m_obliquity);
    m_ascendant = ZodiacPoint::at(
        astro::Coordinates::to_sidereal_longitude(tropical_asc, m_julian_day, m_ayanamsa), tables);

    // ---- Houses ----
    const Bhavas bhavas = BhavaCalculator::compute(m_house_system, m_ascendant.longitude, positions, tables);

    // ---- Relations ----
    m_aspects = AspectEngine::compute(positions, tables);
    m_conjunctions = AspectEngine::conjunctions(positions);

    const DignityEngine dignity_engine(tables);
    m_compound = dignity_engine.compound_matrix(positions);
    const std::array<Dignity, 9> dignities = dignity_engine.evaluate(positions);

    const CombustionFlags combustion = CombustionDetector(tables).evaluate(positions);

    // ---- Lordship, strength, yogas ----
    std::optional<LordshipPolicy> custom_policy;
    if (&tables != &ReferenceTables::instance())
    {
        custom_policy.emplace(tables);
    }
    const LordshipPolicy& policy = custom_policy ? *custom_policy : LordshipPolicy::instance();
    m_lordships = LordshipAnalyzer::analyze(policy, m_ascendant.rasi, positions, bhavas, combustion);

    const StrengthTable strengths =
        StrengthAnalyzer(tables, weights).evaluate(positions, bhavas, dignities, combustion, m_aspects);

    m_yogas = YogaDetector::detect(positions, m_lordships, tables);
    m_karakas = KarakaCalculator::compute(positions);

    // ---- Special points ----
    const f64 tropical_mc = astro::Coordinates::midheaven_longitude(lst_hours, m_obliquity);
    const f64 sun = positions[index_of(Graha::Sun)].point.longitude;
    const f64 moon = positions[index_of(Graha::Moon)].point.longitude;
    m_special_points = SpecialPoints{
        .midheaven = ZodiacPoint::at(
            astro::Coordinates::to_sidereal_longitude(tropical_mc, m_julian_day, m_ayanamsa), tables),
        .part_of_fortune = ZodiacPoint::at(m_ascendant.longitude + moon - sun, tables),
    };
    m_panchanga = PanchangaCalculator::compute(sun, moon, m_julian_day, tables);

    // ---- Reports ----
    for (const GrahaPosition& pos : positions)
    {
        const std::size_t i = index_of(pos.graha);
        m_grahas[i] = GrahaReport{
            .position          = pos,
            .is_combust        = combustion[i],
            .dignity           = dignities[i],
            .strength          = strengths.grahas[i],
            .functional_nature = m_lordships.grahas[i].nature,
        };
    }
    for (const Bhava& bhava : bhavas)
    {
        const auto slot = static_cast<std::size_t>(bhava.number - 1);
        m_bhavas[slot] = BhavaReport{
            .bhava          = bhava,
            .strength       = strengths.bhavas[slot],
            .classification = classify_house(bhava.number),
            .lord_placement = m_lordships.houses[slot].lord_placement,
            .lord_combust   = m_lordships.houses[slot].lord_combust,
        };
    }

    check_invariants();

    JYO_CORE_DEBUG("Chart {} ({:.4f}, {:.4f}) {}: ascendant {} {:.2f}, {} yogas",
                   astro::TimeSystem::to_iso8601(m_birth_instant), m_latitude, m_longitude,
                   astro::ayanamsa_name(m_ayanamsa), rasi_name(m_ascendant.rasi),
                   m_ascendant.degree_in_rasi, m_yogas.size());
}

const BhavaReport& Chart::bhava(i32 house) const
{
    if (house < 1 || house > zodiac_constants::kBhavaCount)
    {
        throw core::InputError(fmt::format("House number {} outside 1-12", house));
    }
    return m_bhavas[static_cast<std::size_t>(house - 1)];
}

// -----------------------------------------------------------------
// Invariants
// -----------------------------------------------------------------

void Chart::fail_invariant(const std::string& what) const
{
    std::string longitudes;
    for (const GrahaReport& g : m_grahas)
    {
        longitudes += fmt::format(" {}={:.6f}", graha_name(g.position.graha), g.position.point.longitude);
    }
    JYO_CORE_CRITICAL("Chart invariant violated: {} | instant={} lat={} lon={} ayanamsa={} asc={:.6f} |{}",
                      what, astro::TimeSystem::to_iso8601(m_birth_instant), m_latitude, m_longitude,
                      astro::ayanamsa_name(m_ayanamsa), m_ascendant.longitude, longitudes);
    throw core::CalculationInvariantError(what);
}

void Chart::check_invariants() const
{
    const auto in_range = [](f64 lon) { return lon >= 0.0 && lon < zodiac_constants::kFullCircle; };

    if (!in_range(m_ascendant.longitude))
    {
        fail_invariant("ascendant longitude not normalized");
    }

    std::size_t placed = 0;
    for (const GrahaReport& g : m_grahas)
    {
        if (!in_range(g.position.point.longitude))
        {
            fail_invariant(fmt::format("{} longitude not normalized", graha_name(g.position.graha)));
        }
        if (g.position.house < 1 || g.position.house > 12)
        {
            fail_invariant(fmt::format("{} has no house", graha_name(g.position.graha)));
        }
    }

    const f64 rahu = m_grahas[index_of(Graha::Rahu)].position.point.longitude;
    const f64 ketu = m_grahas[index_of(Graha::Ketu)].position.point.longitude;
    if (std::fabs(astro::Coordinates::angular_distance(rahu, ketu) - 180.0) > 1e-9)
    {
        fail_invariant("Rahu and Ketu are not opposite");
    }

    // Houses must tile the ecliptic: cusp(1) = ascendant, each arc positive, total 360°
    if (std::fabs(astro::Coordinates::angular_distance(m_bhavas[0].bhava.cusp, m_ascendant.longitude)) > 1e-9)
    {
        fail_invariant("first cusp does not match the ascendant");
    }
    f64 total_arc = 0.0;
    for (std::size_t i = 0; i < m_bhavas.size(); ++i)
    {
        const f64 arc = astro::Coordinates::normalize_degrees(
            m_bhavas[(i + 1) % m_bhavas.size()].bhava.cusp - m_bhavas[i].bhava.cusp);
        if (arc <= 0.0)
        {
            fail_invariant(fmt::format("house {} has an empty arc", i + 1));
        }
        total_arc += arc;
        placed += m_bhavas[i].bhava.occupants.size();
    }
    if (std::fabs(total_arc - zodiac_constants::kFullCircle) > 1e-6)
    {
        fail_invariant(fmt::format("house arcs sum to {} degrees", total_arc));
    }
    if (placed != kAllGrahas.size())
    {
        fail_invariant(fmt::format("{} grahas placed in houses, expected 9", placed));
    }
}

// -----------------------------------------------------------------
// Summary
// -----------------------------------------------------------------

ChartSummary Chart::get_chart_summary() const
{
    ChartSummary summary{
        .birth_instant     = astro::TimeSystem::to_iso8601(m_birth_instant),
        .latitude          = m_latitude,
        .longitude         = m_longitude,
        .ayanamsa          = astro::ayanamsa_name(m_ayanamsa),
        .ayanamsa_offset   = m_ayanamsa_offset,
        .house_system      = house_system_name(m_house_system),
        .ascendant         = m_ascendant,
        .moon_rasi         = m_grahas[index_of(Graha::Moon)].position.point.rasi,
        .moon_nakshatra    = m_grahas[index_of(Graha::Moon)].position.point.nakshatra,
        .retrograde_grahas = {},
        .combust_grahas    = {},
        .strongest_grahas  = {},
        .strongest_bhavas  = {},
        .atmakaraka        = m_karakas[0].graha,
        .yoga_karakas      = {},
        .aspect_count      = m_aspects.size(),
        .conjunction_count = m_conjunctions.size(),
        .yoga_count        = m_yogas.size(),
        .overall_strength  = 0.0,
        .overall_category  = StrengthCategory::VeryWeak,
        .panchanga         = m_panchanga,
    };

    std::vector<Graha> by_strength;
    for (const GrahaReport& g : m_grahas)
    {
        if (g.position.is_retrograde)
        {
            summary.retrograde_grahas.push_back(g.position.graha);
        }
        if (g.is_combust)
        {
            summary.combust_grahas.push_back(g.position.graha);
        }
        if (g.functional_nature == FunctionalNature::YogaKaraka)
        {
            summary.yoga_karakas.push_back(g.position.graha);
        }
        by_strength.push_back(g.position.graha);
    }
    std::stable_sort(by_strength.begin(), by_strength.end(), [this](Graha a, Graha b)
    {
        return graha(a).strength.score > graha(b).strength.score;
    });
    summary.strongest_grahas.assign(by_strength.begin(), by_strength.begin() + 3);

    std::vector<i32> houses(12);
    std::iota(houses.begin(), houses.end(), 1);
    std::stable_sort(houses.begin(), houses.end(), [this](i32 a, i32 b)
    {
        return bhava(a).strength.score > bhava(b).strength.score;
    });
    summary.strongest_bhavas.assign(houses.begin(), houses.begin() + 3);

    f64 total = 0.0;
    for (const BhavaReport& b : m_bhavas)
    {
        total += b.strength.score;
    }
    summary.overall_strength = total / static_cast<f64>(m_bhavas.size());
    summary.overall_category = categorize(summary.overall_strength);

    return summary;
}

} // namespace jyotish::vedic
