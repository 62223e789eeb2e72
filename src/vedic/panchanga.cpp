/// @file panchanga.cpp
/// @brief Vara, tithi, nakshatra, nitya yoga and karana calculation.

#include "vedic/panchanga.hpp"

#include "astro/coordinates.hpp"
#include "vedic/graha.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace jyotish::vedic
{

namespace
{
    constexpr std::array<const char*, 15> kTithiNames = {
        "Pratipada", "Dwitiya", "Tritiya", "Chaturthi", "Panchami",
        "Shashthi", "Saptami", "Ashtami", "Navami", "Dashami",
        "Ekadashi", "Dwadashi", "Trayodashi", "Chaturdashi", "Purnima",
    };

    constexpr std::array<const char*, 7> kVaraNames = {
        "Ravivara", "Somavara", "Mangalavara", "Budhavara", "Guruvara", "Shukravara", "Shanivara",
    };

    constexpr std::array<Graha, 7> kVaraLords = {
        Graha::Sun, Graha::Moon, Graha::Mars, Graha::Mercury, Graha::Jupiter, Graha::Venus, Graha::Saturn,
    };

    // Tithi n and n + 8 share a lord within each paksha; Amavasya belongs to Rahu
    constexpr std::array<Graha, 8> kTithiLords = {
        Graha::Sun, Graha::Moon, Graha::Mars, Graha::Mercury,
        Graha::Jupiter, Graha::Venus, Graha::Saturn, Graha::Rahu,
    };

    constexpr std::array<const char*, 27> kNityaYogaNames = {
        "Vishkambha", "Priti", "Ayushman", "Saubhagya", "Shobhana", "Atiganda", "Sukarma",
        "Dhriti", "Shula", "Ganda", "Vriddhi", "Dhruva", "Vyaghata", "Harshana",
        "Vajra", "Siddhi", "Vyatipata", "Variyana", "Parigha", "Shiva", "Siddha",
        "Sadhya", "Shubha", "Shukla", "Brahma", "Indra", "Vaidhriti",
    };

    bool is_malefic_nitya_yoga(i32 index)
    {
        switch (index)
        {
            case 0:   // Vishkambha
            case 5:   // Atiganda
            case 8:   // Shula
            case 9:   // Ganda
            case 12:  // Vyaghata
            case 14:  // Vajra
            case 16:  // Vyatipata
            case 18:  // Parigha
            case 26:  // Vaidhriti
                return true;
            default:
                return false;
        }
    }

    struct Division
    {
        i32 index;
        f64 elapsed;
    };

    Division divide(f64 angle_deg, f64 span, i32 count)
    {
        const f64 angle = astro::Coordinates::normalize_degrees(angle_deg);
        const i32 index = std::min(static_cast<i32>(std::floor(angle / span)), count - 1);
        return Division{index, (angle - static_cast<f64>(index) * span) / span};
    }
}

// -----------------------------------------------------------------
// Names
// -----------------------------------------------------------------

const char* paksha_name(Paksha paksha)
{
    switch (paksha)
    {
        case Paksha::Shukla:  return "Shukla";
        case Paksha::Krishna: return "Krishna";
    }
    return "Unknown";
}

const char* karana_name(Karana karana)
{
    switch (karana)
    {
        case Karana::Bava:        return "Bava";
        case Karana::Balava:      return "Balava";
        case Karana::Kaulava:     return "Kaulava";
        case Karana::Taitila:     return "Taitila";
        case Karana::Garaja:      return "Garaja";
        case Karana::Vanija:      return "Vanija";
        case Karana::Vishti:      return "Vishti";
        case Karana::Shakuni:     return "Shakuni";
        case Karana::Chatushpada: return "Chatushpada";
        case Karana::Naga:        return "Naga";
        case Karana::Kimstughna:  return "Kimstughna";
    }
    return "Unknown";
}

const char* tithi_name(i32 number)
{
    if (number < 1 || number > 30)
    {
        return "Unknown";
    }
    if (number == 30)
    {
        return "Amavasya";
    }
    return kTithiNames[static_cast<std::size_t>((number - 1) % 15)];
}

const char* vara_name(i32 weekday)
{
    if (weekday < 0 || weekday > 6)
    {
        return "Unknown";
    }
    return kVaraNames[static_cast<std::size_t>(weekday)];
}

const char* nitya_yoga_name(i32 index)
{
    if (index < 0 || index >= zodiac_constants::kNakshatraCount)
    {
        return "Unknown";
    }
    return kNityaYogaNames[static_cast<std::size_t>(index)];
}

// -----------------------------------------------------------------
// Limbs
// -----------------------------------------------------------------

VaraInfo PanchangaCalculator::vara(f64 jd_utc)
{
    // JD 0 began at noon on a Monday
    const auto day = static_cast<i64>(std::floor(jd_utc + 1.5));
    const auto weekday = static_cast<i32>(((day % 7) + 7) % 7);
    return VaraInfo{
        .weekday = weekday,
        .lord    = kVaraLords[static_cast<std::size_t>(weekday)],
    };
}

TithiInfo PanchangaCalculator::tithi(f64 sun_deg, f64 moon_deg)
{
    const Division d = divide(moon_deg - sun_deg, kTithiSpan, 30);
    const i32 number = d.index + 1;
    const i32 in_paksha = (number - 1) % 15 + 1;

    const Graha lord = number == 30
        ? Graha::Rahu
        : kTithiLords[static_cast<std::size_t>((in_paksha - 1) % 8)];

    return TithiInfo{
        .number  = number,
        .paksha  = number <= 15 ? Paksha::Shukla : Paksha::Krishna,
        .lord    = lord,
        .elapsed = d.elapsed,
    };
}

NakshatraInfo PanchangaCalculator::nakshatra(f64 moon_deg, const ReferenceTables& tables)
{
    const Division d = divide(moon_deg, zodiac_constants::kNakshatraSpan, zodiac_constants::kNakshatraCount);
    return NakshatraInfo{
        .index   = d.index,
        .pada    = GrahaCalculator::pada(astro::Coordinates::normalize_degrees(moon_deg)),
        .lord    = tables.nakshatra_lord(d.index),
        .elapsed = d.elapsed,
    };
}

NityaYogaInfo PanchangaCalculator::nitya_yoga(f64 sun_deg, f64 moon_deg)
{
    const Division d = divide(sun_deg + moon_deg, zodiac_constants::kNakshatraSpan,
                              zodiac_constants::kNakshatraCount);
    return NityaYogaInfo{
        .index      = d.index,
        .is_benefic = !is_malefic_nitya_yoga(d.index),
        .elapsed    = d.elapsed,
    };
}

KaranaInfo PanchangaCalculator::karana(f64 sun_deg, f64 moon_deg)
{
    const Division d = divide(moon_deg - sun_deg, kKaranaSpan, 60);

    // First half of Shukla Pratipada and the last three half-tithis are fixed;
    // the seven movable karanas repeat eight times in between
    Karana kind = Karana::Kimstughna;
    if (d.index >= 1 && d.index <= 56)
    {
        kind = static_cast<Karana>((d.index - 1) % 7);
    }
    else if (d.index == 57)
    {
        kind = Karana::Shakuni;
    }
    else if (d.index == 58)
    {
        kind = Karana::Chatushpada;
    }
    else if (d.index == 59)
    {
        kind = Karana::Naga;
    }

    const bool movable = d.index >= 1 && d.index <= 56;
    const bool malefic = kind == Karana::Vishti || kind == Karana::Shakuni
                      || kind == Karana::Chatushpada || kind == Karana::Naga;

    return KaranaInfo{
        .index      = d.index,
        .karana     = kind,
        .is_movable = movable,
        .is_benefic = !malefic,
        .elapsed    = d.elapsed,
    };
}

Panchanga PanchangaCalculator::compute(f64 sun_deg, f64 moon_deg, f64 jd_utc, const ReferenceTables& tables)
{
    return Panchanga{
        .vara      = vara(jd_utc),
        .tithi     = tithi(sun_deg, moon_deg),
        .nakshatra = nakshatra(moon_deg, tables),
        .yoga      = nitya_yoga(sun_deg, moon_deg),
        .karana    = karana(sun_deg, moon_deg),
    };
}

} // namespace jyotish::vedic
