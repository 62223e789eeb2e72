#pragma once

/// @file graha_id.hpp
/// @brief Identifiers for the nine grahas and the twelve rasis.

#include "core/types.hpp"

#include <array>
#include <cstddef>

namespace jyotish
{
    /// @brief The nine grahas, in canonical enumeration order.
    enum class Graha : u8
    {
        Sun,
        Moon,
        Mars,
        Mercury,
        Jupiter,
        Venus,
        Saturn,
        Rahu,
        Ketu,
    };

    inline constexpr std::array<Graha, 9> kAllGrahas = {
        Graha::Sun, Graha::Moon, Graha::Mars,
        Graha::Mercury, Graha::Jupiter, Graha::Venus,
        Graha::Saturn, Graha::Rahu, Graha::Ketu,
    };

    /// @brief The twelve rasis (sidereal signs), Aries = 0.
    enum class Rasi : u8
    {
        Aries,
        Taurus,
        Gemini,
        Cancer,
        Leo,
        Virgo,
        Libra,
        Scorpio,
        Sagittarius,
        Capricorn,
        Aquarius,
        Pisces,
    };

    [[nodiscard]] constexpr std::size_t index_of(Graha g) { return static_cast<std::size_t>(g); }
    [[nodiscard]] constexpr std::size_t index_of(Rasi r) { return static_cast<std::size_t>(r); }

    /// @brief Rasi from a 0-based index; wraps cyclically.
    [[nodiscard]] constexpr Rasi rasi_from_index(i32 index)
    {
        return static_cast<Rasi>(((index % 12) + 12) % 12);
    }

    [[nodiscard]] constexpr bool is_node(Graha g) { return g == Graha::Rahu || g == Graha::Ketu; }

    [[nodiscard]] inline const char* graha_name(Graha g)
    {
        switch (g)
        {
            case Graha::Sun:     return "Sun";
            case Graha::Moon:    return "Moon";
            case Graha::Mars:    return "Mars";
            case Graha::Mercury: return "Mercury";
            case Graha::Jupiter: return "Jupiter";
            case Graha::Venus:   return "Venus";
            case Graha::Saturn:  return "Saturn";
            case Graha::Rahu:    return "Rahu";
            case Graha::Ketu:    return "Ketu";
        }
        return "Unknown";
    }

    [[nodiscard]] inline const char* rasi_name(Rasi r)
    {
        static constexpr std::array<const char*, 12> kNames = {
            "Aries", "Taurus", "Gemini", "Cancer", "Leo", "Virgo",
            "Libra", "Scorpio", "Sagittarius", "Capricorn", "Aquarius", "Pisces",
        };
        return kNames[index_of(r)];
    }

} // namespace jyotish
