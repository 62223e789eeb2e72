#pragma once

/// @file coordinates.hpp
/// @brief Ecliptic longitude arithmetic, tropical/sidereal conversion, ascendant and midheaven.

#include "astro/ayanamsa.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <string_view>

namespace jyotish::astro
{
    /// @brief Degrees/minutes/seconds breakdown of a non-negative angle.
    struct Dms
    {
        i32 degrees;
        i32 minutes;
        f64 seconds;
    };

    /// @brief Static utility class for ecliptic coordinate work.
    ///
    /// All angles are in degrees. Longitudes are normalized with
    /// ((x mod 360) + 360) mod 360 so negative inputs never leak through.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Normalize an angle to [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 angle);

        /// @brief Shortest arc between two longitudes, in [0, 180].
        [[nodiscard]] static f64 angular_distance(f64 a_deg, f64 b_deg);

        /// @brief Tropical → sidereal longitude for the given system and Julian Date.
        [[nodiscard]] static f64 to_sidereal_longitude(f64 tropical_deg, f64 jd, AyanamsaSystem system);

        /// @brief Tropical → sidereal longitude, resolving the system by name.
        /// @throws core::ConfigurationError for an unknown system name.
        [[nodiscard]] static f64 to_sidereal_longitude(f64 tropical_deg, f64 jd, std::string_view ayanamsa_name);

        /// @brief Sidereal → tropical longitude (inverse of to_sidereal_longitude).
        [[nodiscard]] static f64 to_tropical_longitude(f64 sidereal_deg, f64 jd, AyanamsaSystem system);

        /// @brief Local sidereal time in hours, [0, 24).
        /// @param utc Civil date/time (UTC).
        /// @param longitude_deg Observer longitude (east positive).
        [[nodiscard]] static f64 local_sidereal_time(const DateTime& utc, f64 longitude_deg);

        /// @brief Ecliptic longitude rising on the eastern horizon (tropical), [0, 360).
        ///
        /// λ = atan2(cos RAMC, −(sin RAMC·cos ε + tan φ·sin ε)), RAMC = 15° × LST.
        /// @param lst_hours Local sidereal time in hours.
        /// @param latitude_deg Geographic latitude (north positive).
        /// @param obliquity_deg Obliquity of the ecliptic.
        [[nodiscard]] static f64 ascendant_longitude(f64 lst_hours, f64 latitude_deg, f64 obliquity_deg);

        /// @brief Ecliptic longitude culminating on the meridian (tropical), [0, 360).
        [[nodiscard]] static f64 midheaven_longitude(f64 lst_hours, f64 obliquity_deg);

        [[nodiscard]] static Dms to_dms(f64 degrees);
    };

} // namespace jyotish::astro
