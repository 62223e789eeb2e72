/// @file reference_tables.cpp
/// @brief Classical reference data and its load-time validation.

#include "vedic/reference_tables.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

namespace jyotish::vedic
{

const char* element_name(Element e)
{
    switch (e)
    {
        case Element::Fire:  return "Fire";
        case Element::Earth: return "Earth";
        case Element::Air:   return "Air";
        case Element::Water: return "Water";
    }
    return "Unknown";
}

const char* modality_name(Modality m)
{
    switch (m)
    {
        case Modality::Movable: return "Movable";
        case Modality::Fixed:   return "Fixed";
        case Modality::Dual:    return "Dual";
    }
    return "Unknown";
}

const char* natural_nature_name(NaturalNature n)
{
    return n == NaturalNature::Benefic ? "Benefic" : "Malefic";
}

// -----------------------------------------------------------------
// Standard (Parashari) data
// -----------------------------------------------------------------

ReferenceData ReferenceData::standard()
{
    using G = Graha;
    using R = Rasi;
    constexpr auto F = NaturalRelation::Friend;
    constexpr auto N = NaturalRelation::Neutral;
    constexpr auto E = NaturalRelation::Enemy;

    ReferenceData data;

    data.rasis = {
        {R::Aries,       {Element::Fire,  Modality::Movable, G::Mars}},
        {R::Taurus,      {Element::Earth, Modality::Fixed,   G::Venus}},
        {R::Gemini,      {Element::Air,   Modality::Dual,    G::Mercury}},
        {R::Cancer,      {Element::Water, Modality::Movable, G::Moon}},
        {R::Leo,         {Element::Fire,  Modality::Fixed,   G::Sun}},
        {R::Virgo,       {Element::Earth, Modality::Dual,    G::Mercury}},
        {R::Libra,       {Element::Air,   Modality::Movable, G::Venus}},
        {R::Scorpio,     {Element::Water, Modality::Fixed,   G::Mars}},
        {R::Sagittarius, {Element::Fire,  Modality::Dual,    G::Jupiter}},
        {R::Capricorn,   {Element::Earth, Modality::Movable, G::Saturn}},
        {R::Aquarius,    {Element::Air,   Modality::Fixed,   G::Saturn}},
        {R::Pisces,      {Element::Water, Modality::Dual,    G::Jupiter}},
    };

    // Naisargika maitri: row = graha, column = the graha it regards
    data.natural_relations = {
        {G::Sun,     {{G::Moon, F}, {G::Mars, F}, {G::Mercury, N}, {G::Jupiter, F}, {G::Venus, E},
                      {G::Saturn, E}, {G::Rahu, E}, {G::Ketu, E}}},
        {G::Moon,    {{G::Sun, F}, {G::Mars, N}, {G::Mercury, F}, {G::Jupiter, N}, {G::Venus, N},
                      {G::Saturn, N}, {G::Rahu, E}, {G::Ketu, E}}},
        {G::Mars,    {{G::Sun, F}, {G::Moon, F}, {G::Mercury, E}, {G::Jupiter, F}, {G::Venus, N},
                      {G::Saturn, N}, {G::Rahu, E}, {G::Ketu, E}}},
        {G::Mercury, {{G::Sun, F}, {G::Moon, E}, {G::Mars, N}, {G::Jupiter, N}, {G::Venus, F},
                      {G::Saturn, N}, {G::Rahu, E}, {G::Ketu, E}}},
        {G::Jupiter, {{G::Sun, F}, {G::Moon, F}, {G::Mars, F}, {G::Mercury, E}, {G::Venus, E},
                      {G::Saturn, N}, {G::Rahu, E}, {G::Ketu, E}}},
        {G::Venus,   {{G::Sun, E}, {G::Moon, E}, {G::Mars, N}, {G::Mercury, F}, {G::Jupiter, N},
                      {G::Saturn, F}, {G::Rahu, E}, {G::Ketu, E}}},
        {G::Saturn,  {{G::Sun, E}, {G::Moon, E}, {G::Mars, E}, {G::Mercury, F}, {G::Jupiter, N},
                      {G::Venus, F}, {G::Rahu, E}, {G::Ketu, E}}},
        {G::Rahu,    {{G::Sun, E}, {G::Moon, E}, {G::Mars, E}, {G::Mercury, F}, {G::Jupiter, E},
                      {G::Venus, F}, {G::Saturn, F}, {G::Ketu, N}}},
        {G::Ketu,    {{G::Sun, E}, {G::Moon, E}, {G::Mars, F}, {G::Mercury, E}, {G::Jupiter, E},
                      {G::Venus, F}, {G::Saturn, F}, {G::Rahu, N}}},
    };

    data.dignities = {
        {G::Sun,     {R::Aries,       10.0, R::Libra,       R::Leo,          0.0, 20.0, {R::Leo}}},
        {G::Moon,    {R::Taurus,       3.0, R::Scorpio,     R::Taurus,       4.0, 30.0, {R::Cancer}}},
        {G::Mars,    {R::Capricorn,   28.0, R::Cancer,      R::Aries,        0.0, 12.0, {R::Aries, R::Scorpio}}},
        {G::Mercury, {R::Virgo,       15.0, R::Pisces,      R::Virgo,       16.0, 20.0, {R::Gemini, R::Virgo}}},
        {G::Jupiter, {R::Cancer,       5.0, R::Capricorn,   R::Sagittarius,  0.0, 10.0, {R::Sagittarius, R::Pisces}}},
        {G::Venus,   {R::Pisces,      27.0, R::Virgo,       R::Libra,        0.0, 15.0, {R::Taurus, R::Libra}}},
        {G::Saturn,  {R::Libra,       20.0, R::Aries,       R::Aquarius,     0.0, 20.0, {R::Capricorn, R::Aquarius}}},
        {G::Rahu,    {R::Gemini,      15.0, R::Sagittarius, R::Gemini,       0.0, 30.0, {}}},
        {G::Ketu,    {R::Sagittarius, 15.0, R::Gemini,      R::Sagittarius,  0.0, 30.0, {}}},
    };

    data.combustion_orbs = {
        {G::Moon, 12.0}, {G::Mars, 17.0}, {G::Mercury, 14.0},
        {G::Jupiter, 11.0}, {G::Venus, 10.0}, {G::Saturn, 15.0},
    };

    data.natures = {
        {G::Sun, NaturalNature::Malefic},     {G::Moon, NaturalNature::Benefic},
        {G::Mars, NaturalNature::Malefic},    {G::Mercury, NaturalNature::Benefic},
        {G::Jupiter, NaturalNature::Benefic}, {G::Venus, NaturalNature::Benefic},
        {G::Saturn, NaturalNature::Malefic},  {G::Rahu, NaturalNature::Malefic},
        {G::Ketu, NaturalNature::Malefic},
    };

    data.nakshatra_names = {
        "Ashwini", "Bharani", "Krittika", "Rohini", "Mrigashira", "Ardra",
        "Punarvasu", "Pushya", "Ashlesha", "Magha", "Purva Phalguni",
        "Uttara Phalguni", "Hasta", "Chitra", "Swati", "Vishakha",
        "Anuradha", "Jyeshtha", "Mula", "Purva Ashadha", "Uttara Ashadha",
        "Shravana", "Dhanishta", "Shatabhisha", "Purva Bhadrapada",
        "Uttara Bhadrapada", "Revati",
    };

    data.vimshottari_sequence = {
        G::Ketu, G::Venus, G::Sun, G::Moon, G::Mars,
        G::Rahu, G::Jupiter, G::Saturn, G::Mercury,
    };

    data.bhavas = {
        {1,  {"Tanu",    {"Self", "Personality", "Physical body", "Health", "Appearance"}, {G::Sun}}},
        {2,  {"Dhana",   {"Wealth", "Family", "Speech", "Food", "Accumulated wealth"}, {G::Jupiter}}},
        {3,  {"Sahaja",  {"Siblings", "Courage", "Efforts", "Short journeys", "Communication"}, {G::Mars}}},
        {4,  {"Sukha",   {"Mother", "Home", "Property", "Vehicles", "Happiness"}, {G::Moon}}},
        {5,  {"Putra",   {"Children", "Creativity", "Intelligence", "Speculation", "Purva punya"}, {G::Jupiter}}},
        {6,  {"Ari",     {"Enemies", "Diseases", "Debts", "Service", "Litigation"}, {G::Mars, G::Saturn}}},
        {7,  {"Kalatra", {"Spouse", "Marriage", "Business partnerships", "Public life", "Trade"}, {G::Venus}}},
        {8,  {"Ayu",     {"Longevity", "Occult", "Transformation", "Inheritance", "Hidden wealth"}, {G::Saturn}}},
        {9,  {"Bhagya",  {"Fortune", "Religion", "Higher learning", "Father", "Long journeys"}, {G::Jupiter, G::Sun}}},
        {10, {"Karma",   {"Career", "Status", "Reputation", "Government", "Authority"},
                         {G::Sun, G::Mercury, G::Jupiter, G::Saturn}}},
        {11, {"Labha",   {"Gains", "Income", "Friends", "Elder siblings", "Hopes"}, {G::Jupiter}}},
        {12, {"Vyaya",   {"Losses", "Expenses", "Foreign lands", "Liberation", "Sleep"}, {G::Saturn}}},
    };

    return data;
}

// -----------------------------------------------------------------
// Validation + compilation
// -----------------------------------------------------------------

namespace
{
    [[noreturn]] void reject(const std::string& what)
    {
        JYO_CORE_CRITICAL("Reference tables incomplete: {}", what);
        throw core::CalculationInvariantError("Reference tables incomplete: " + what);
    }
}

ReferenceTables::ReferenceTables(const ReferenceData& data)
{
    for (i32 i = 0; i < zodiac_constants::kRasiCount; ++i)
    {
        const Rasi r = rasi_from_index(i);
        const auto it = data.rasis.find(r);
        if (it == data.rasis.end())
        {
            reject(fmt::format("no rasi record for {}", rasi_name(r)));
        }
        if (is_node(it->second.ruler))
        {
            reject(fmt::format("rasi {} is ruled by a node", rasi_name(r)));
        }
        m_rasis[index_of(r)] = it->second;
    }

    for (const Graha from : kAllGrahas)
    {
        const auto row = data.natural_relations.find(from);
        if (row == data.natural_relations.end())
        {
            reject(fmt::format("no natural relations for {}", graha_name(from)));
        }
        for (const Graha to : kAllGrahas)
        {
            if (from == to)
            {
                m_relations[index_of(from)][index_of(to)] = NaturalRelation::Neutral;
                continue;
            }
            const auto cell = row->second.find(to);
            if (cell == row->second.end())
            {
                reject(fmt::format("no natural relation {} -> {}", graha_name(from), graha_name(to)));
            }
            m_relations[index_of(from)][index_of(to)] = cell->second;
        }

        const auto dignity = data.dignities.find(from);
        if (dignity == data.dignities.end())
        {
            reject(fmt::format("no dignity data for {}", graha_name(from)));
        }
        if (dignity->second.exaltation == dignity->second.debilitation)
        {
            reject(fmt::format("{} exalted and debilitated in the same rasi", graha_name(from)));
        }
        m_dignities[index_of(from)] = dignity->second;

        const auto nature = data.natures.find(from);
        if (nature == data.natures.end())
        {
            reject(fmt::format("no natural nature for {}", graha_name(from)));
        }
        m_natures[index_of(from)] = nature->second;

        const auto orb = data.combustion_orbs.find(from);
        if (orb != data.combustion_orbs.end())
        {
            if (from == Graha::Sun || is_node(from) || orb->second <= 0.0)
            {
                reject(fmt::format("invalid combustion orb for {}", graha_name(from)));
            }
            m_orbs[index_of(from)] = orb->second;
        }
    }

    // Every owned sign must agree with the rasi ruler table
    for (i32 i = 0; i < zodiac_constants::kRasiCount; ++i)
    {
        const Rasi r = rasi_from_index(i);
        if (!owns(ruler(r), r))
        {
            reject(fmt::format("{} rules {} but does not list it as an own sign",
                               graha_name(ruler(r)), rasi_name(r)));
        }
    }

    if (data.nakshatra_names.size() != static_cast<std::size_t>(zodiac_constants::kNakshatraCount))
    {
        reject(fmt::format("expected 27 nakshatras, found {}", data.nakshatra_names.size()));
    }
    if (data.vimshottari_sequence.size() != kAllGrahas.size())
    {
        reject("vimshottari sequence must list all nine grahas");
    }
    m_nakshatras = data.nakshatra_names;
    m_vimshottari = data.vimshottari_sequence;

    for (i32 house = 1; house <= zodiac_constants::kBhavaCount; ++house)
    {
        const auto it = data.bhavas.find(house);
        if (it == data.bhavas.end())
        {
            reject(fmt::format("no bhava record for house {}", house));
        }
        m_bhavas[static_cast<std::size_t>(house - 1)] = it->second;
    }
}

const ReferenceTables& ReferenceTables::instance()
{
    static const ReferenceTables tables(ReferenceData::standard());
    return tables;
}

// -----------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------

NaturalRelation ReferenceTables::natural_relation(Graha from, Graha to) const
{
    return m_relations[index_of(from)][index_of(to)];
}

bool ReferenceTables::owns(Graha g, Rasi r) const
{
    for (const Rasi own : m_dignities[index_of(g)].own_signs)
    {
        if (own == r)
        {
            return true;
        }
    }
    return false;
}

std::vector<Rasi> ReferenceTables::ruled_rasis(Graha g) const
{
    std::vector<Rasi> result;
    for (i32 i = 0; i < zodiac_constants::kRasiCount; ++i)
    {
        if (m_rasis[static_cast<std::size_t>(i)].ruler == g)
        {
            result.push_back(rasi_from_index(i));
        }
    }
    return result;
}

const std::string& ReferenceTables::nakshatra_name(i32 index) const
{
    return m_nakshatras.at(static_cast<std::size_t>(index));
}

Graha ReferenceTables::nakshatra_lord(i32 index) const
{
    return m_vimshottari[static_cast<std::size_t>(index) % m_vimshottari.size()];
}

const BhavaInfo& ReferenceTables::bhava_info(i32 house) const
{
    return m_bhavas.at(static_cast<std::size_t>(house - 1));
}

} // namespace jyotish::vedic
