#pragma once

/// @file ayanamsa.hpp
/// @brief Sidereal correction offsets for the supported ayanamsa systems.

#include "core/types.hpp"

#include <array>
#include <string_view>

namespace jyotish::astro
{
    /// @brief Supported ayanamsa systems. Adding a system means extending this
    /// enum and the switch in Ayanamsa::value_at_j2000().
    enum class AyanamsaSystem
    {
        Lahiri,
        Raman,
        Krishnamurti,
    };

    inline constexpr std::array<AyanamsaSystem, 3> kAllAyanamsaSystems = {
        AyanamsaSystem::Lahiri,
        AyanamsaSystem::Raman,
        AyanamsaSystem::Krishnamurti,
    };

    [[nodiscard]] const char* ayanamsa_name(AyanamsaSystem system);

    /// @brief Map a system name (case-insensitive) to its enum value.
    /// @throws core::ConfigurationError for an unknown name.
    [[nodiscard]] AyanamsaSystem parse_ayanamsa(std::string_view name);

    /// @brief Ayanamsa offset model.
    ///
    /// offset(jd) = value_at_j2000 + years_since_J2000 × 50.29″/yr
    class Ayanamsa
    {
    public:
        Ayanamsa() = delete;

        static constexpr f64 kPrecessionDegPerYear = 50.29 / 3600.0;

        /// @brief Offset (degrees) at the J2000.0 epoch.
        [[nodiscard]] static f64 value_at_j2000(AyanamsaSystem system);

        /// @brief Offset (degrees) to subtract from a tropical longitude at `jd`.
        [[nodiscard]] static f64 offset(AyanamsaSystem system, f64 jd);
    };

} // namespace jyotish::astro
