#pragma once

/// @file mean_element_ephemeris.hpp
/// @brief Built-in analytic ephemeris: Meeus Sun and Moon, Standish planets, mean lunar node.

#include "ephemeris/ephemeris_provider.hpp"

namespace jyotish::ephemeris
{
    /// @brief Low-precision analytic position provider.
    ///
    /// - Sun: Meeus low-precision solar coordinates (Astronomical Algorithms Ch. 25)
    /// - Moon: principal periodic terms of the lunar longitude (Meeus Ch. 47)
    /// - Mercury..Saturn: Standish (1992) mean Keplerian elements, heliocentric →
    ///   geocentric, precessed from the J2000 ecliptic to the ecliptic of date
    /// - Rahu: mean ascending lunar node; Ketu: Rahu + 180°
    ///
    /// Accuracy is at the arc-minute level for the Sun and a few tenths of a
    /// degree for the Moon and planets over 1800–2050. Stateless and thread-safe.
    class MeanElementEphemeris final : public EphemerisProvider
    {
    public:
        [[nodiscard]] BodyPosition position(Graha body, f64 jd_utc) const override;

        /// @brief Geocentric tropical longitude (degrees, [0, 360)) without the motion flag.
        [[nodiscard]] static f64 longitude(Graha body, f64 jd_utc);

    private:
        [[nodiscard]] static f64 sun_longitude(f64 t);
        [[nodiscard]] static f64 moon_longitude(f64 t);
        [[nodiscard]] static f64 mean_node_longitude(f64 t);
        [[nodiscard]] static f64 planet_longitude(Graha body, f64 t);
    };

} // namespace jyotish::ephemeris
