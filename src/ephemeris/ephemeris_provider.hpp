#pragma once

/// @file ephemeris_provider.hpp
/// @brief Position-source boundary consumed by the chart engine.

#include "core/graha_id.hpp"
#include "core/types.hpp"

namespace jyotish::ephemeris
{
    /// @brief Geocentric position of one body at one instant.
    struct BodyPosition
    {
        f64  tropical_longitude_deg; ///< Tropical ecliptic longitude, expected in [0, 360)
        bool is_retrograde;          ///< Apparent longitude decreasing at this instant
    };

    /// @brief Abstract source of body positions.
    ///
    /// Implementations may be analytic, table-driven or backed by a precision
    /// ephemeris. The engine calls position() once per body per chart and
    /// validates the result; implementations must be safe to call concurrently
    /// from several threads.
    class EphemerisProvider
    {
    public:
        virtual ~EphemerisProvider() = default;

        /// @brief Position of `body` at Julian Date `jd_utc`.
        /// @throws core::EphemerisError (or any std::exception) on failure.
        [[nodiscard]] virtual BodyPosition position(Graha body, f64 jd_utc) const = 0;

        /// @brief Obliquity of the ecliptic (degrees) at `jd_utc`.
        /// Defaults to the IAU 1980 mean obliquity.
        [[nodiscard]] virtual f64 obliquity(f64 jd_utc) const;
    };

} // namespace jyotish::ephemeris
