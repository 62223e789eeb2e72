/// @file karaka.cpp
/// @brief Chara karaka ranking (eight-karaka scheme).

#include "vedic/karaka.hpp"

#include <algorithm>
#include <vector>

namespace jyotish::vedic
{

const char* chara_karaka_name(CharaKaraka karaka)
{
    switch (karaka)
    {
        case CharaKaraka::Atma:    return "Atmakaraka";
        case CharaKaraka::Amatya:  return "Amatyakaraka";
        case CharaKaraka::Bhratri: return "Bhratrikaraka";
        case CharaKaraka::Matri:   return "Matrikaraka";
        case CharaKaraka::Pitri:   return "Pitrikaraka";
        case CharaKaraka::Putra:   return "Putrakaraka";
        case CharaKaraka::Gnati:   return "Gnatikaraka";
        case CharaKaraka::Dara:    return "Darakaraka";
    }
    return "Unknown";
}

const char* chara_karaka_abbreviation(CharaKaraka karaka)
{
    switch (karaka)
    {
        case CharaKaraka::Atma:    return "AK";
        case CharaKaraka::Amatya:  return "AmK";
        case CharaKaraka::Bhratri: return "BK";
        case CharaKaraka::Matri:   return "MK";
        case CharaKaraka::Pitri:   return "PiK";
        case CharaKaraka::Putra:   return "PK";
        case CharaKaraka::Gnati:   return "GK";
        case CharaKaraka::Dara:    return "DK";
    }
    return "?";
}

CharaKarakas KarakaCalculator::compute(const GrahaPositions& positions)
{
    struct Candidate
    {
        Graha graha;
        f64   degree;
    };

    std::vector<Candidate> candidates;
    for (const GrahaPosition& pos : positions)
    {
        if (pos.graha == Graha::Ketu)
        {
            continue;
        }
        // Rahu moves backwards, so its progress through the sign is counted from the end
        const f64 degree = pos.graha == Graha::Rahu
            ? zodiac_constants::kRasiSpan - pos.point.degree_in_rasi
            : pos.point.degree_in_rasi;
        candidates.push_back(Candidate{pos.graha, degree});
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.degree > b.degree; });

    CharaKarakas result{};
    for (std::size_t i = 0; i < result.size(); ++i)
    {
        result[i] = KarakaAssignment{
            .karaka           = static_cast<CharaKaraka>(i),
            .graha            = candidates[i].graha,
            .effective_degree = candidates[i].degree,
        };
    }
    return result;
}

} // namespace jyotish::vedic
