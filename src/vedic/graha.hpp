#pragma once

/// @file graha.hpp
/// @brief Sidereal positions of the nine grahas and of arbitrary zodiac points.

#include "astro/ayanamsa.hpp"
#include "core/graha_id.hpp"
#include "core/types.hpp"
#include "ephemeris/ephemeris_provider.hpp"
#include "vedic/reference_tables.hpp"

#include <array>

namespace jyotish::vedic
{
    /// @brief Everything derived from one sidereal longitude.
    struct ZodiacPoint
    {
        f64   longitude;       ///< Sidereal longitude, [0, 360)
        Rasi  rasi;
        f64   degree_in_rasi;  ///< [0, 30)
        i32   nakshatra;       ///< 0–26
        i32   pada;            ///< 1–4
        Graha nakshatra_lord;  ///< Vimshottari lord of the nakshatra
        Rasi  navamsa;         ///< D9 rasi

        /// @brief Derive all fields from a longitude (normalized first).
        [[nodiscard]] static ZodiacPoint at(f64 longitude_deg, const ReferenceTables& tables);

        bool operator==(const ZodiacPoint&) const = default;
    };

    /// @brief One graha's placement in a chart.
    struct GrahaPosition
    {
        Graha       graha;
        ZodiacPoint point;
        f64         tropical_longitude;
        bool        is_retrograde;
        i32         house;            ///< 1–12, assigned by the bhava calculator

        bool operator==(const GrahaPosition&) const = default;
    };

    using GrahaPositions = std::array<GrahaPosition, 9>;

    /// @brief Builds graha positions from an ephemeris provider.
    class GrahaCalculator
    {
    public:
        GrahaCalculator() = delete;

        [[nodiscard]] static i32 nakshatra_index(f64 longitude_deg);
        [[nodiscard]] static i32 pada(f64 longitude_deg);
        [[nodiscard]] static Rasi navamsa_rasi(f64 longitude_deg, const ReferenceTables& tables);

        /// @brief Query the provider for every body and convert to sidereal positions.
        ///
        /// Rahu is taken from the provider; Ketu is always Rahu + 180°. Both nodes
        /// are flagged retrograde (mean-node convention). Houses are left at 0 until bhavas are assigned.
        /// @throws core::EphemerisError if the provider fails or returns a
        ///         non-finite or out-of-range longitude.
        [[nodiscard]] static GrahaPositions compute(const ephemeris::EphemerisProvider& provider,
                                                    f64 jd_utc,
                                                    astro::AyanamsaSystem ayanamsa,
                                                    const ReferenceTables& tables);

    private:
        [[nodiscard]] static ephemeris::BodyPosition query(const ephemeris::EphemerisProvider& provider,
                                                           Graha body, f64 jd_utc);
    };

} // namespace jyotish::vedic
