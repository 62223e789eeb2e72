#pragma once

/// @file karaka.hpp
/// @brief Jaimini chara (variable) karakas.

#include "core/graha_id.hpp"
#include "core/types.hpp"
#include "vedic/graha.hpp"

#include <array>

namespace jyotish::vedic
{
    enum class CharaKaraka
    {
        Atma,      ///< AK
        Amatya,    ///< AmK
        Bhratri,   ///< BK
        Matri,     ///< MK
        Pitri,     ///< PiK
        Putra,     ///< PK
        Gnati,     ///< GK
        Dara,      ///< DK
    };

    [[nodiscard]] const char* chara_karaka_name(CharaKaraka karaka);
    [[nodiscard]] const char* chara_karaka_abbreviation(CharaKaraka karaka);

    struct KarakaAssignment
    {
        CharaKaraka karaka;
        Graha       graha;
        f64         effective_degree;  ///< Degree in rasi used for ranking (30 − d for Rahu)

        bool operator==(const KarakaAssignment&) const = default;
    };

    using CharaKarakas = std::array<KarakaAssignment, 8>;

    class KarakaCalculator
    {
    public:
        KarakaCalculator() = delete;

        /// @brief Rank Sun..Rahu (Ketu excluded) by descending degree in rasi.
        /// Ties keep enumeration order.
        [[nodiscard]] static CharaKarakas compute(const GrahaPositions& positions);
    };

} // namespace jyotish::vedic
