/// @file mean_element_ephemeris.cpp
/// @brief Implementation of the analytic ephemeris.

#include "ephemeris/mean_element_ephemeris.hpp"

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/errors.hpp"

#include <glm/glm.hpp>

#include <cmath>

namespace jyotish::ephemeris
{

namespace
{
    // -----------------------------------------------------------------
    // Standish (1992) mean orbital elements at J2000.0
    //
    // Referenced to the J2000 ecliptic and equinox. a in AU, angles in
    // degrees, rates per Julian century.
    // -----------------------------------------------------------------
    struct OrbitalElements
    {
        f64 a, da;
        f64 e, de;
        f64 i, di;
        f64 L, dL;
        f64 long_peri, dlong_peri;
        f64 long_node, dlong_node;
    };

    constexpr OrbitalElements kMercury{
        0.38709927, 0.00000037, 0.20563593, 0.00001906, 7.00497902, -0.00594749,
        252.25032350, 149472.67411175, 77.45779628, 0.16047689, 48.33076593, -0.12534081};
    constexpr OrbitalElements kVenus{
        0.72333566, 0.00000390, 0.00677672, -0.00004107, 3.39467605, -0.00078890,
        181.97909950, 58517.81538729, 131.60246718, 0.00268329, 76.67984255, -0.27769418};
    constexpr OrbitalElements kEarthMoon{
        1.00000261, 0.00000562, 0.01671123, -0.00004392, -0.00001531, -0.01294668,
        100.46457166, 35999.37244981, 102.93768193, 0.32327364, 0.0, 0.0};
    constexpr OrbitalElements kMars{
        1.52371034, 0.00001847, 0.09339410, 0.00007882, 1.84969142, -0.00813131,
        -4.55343205, 19140.30268499, -23.94362959, 0.44441088, 49.55953891, -0.29257343};
    constexpr OrbitalElements kJupiter{
        5.20288700, -0.00011607, 0.04838624, -0.00013253, 1.30439695, -0.00183714,
        34.39644051, 3034.74612775, 14.72847983, 0.21252668, 100.47390909, 0.20469106};
    constexpr OrbitalElements kSaturn{
        9.53667594, -0.00125060, 0.05386179, -0.00050991, 2.48599187, 0.00193609,
        49.95424423, 1222.49362201, 92.59887831, -0.41897216, 113.66242448, -0.28867794};

    // General precession in longitude, degrees per Julian century
    constexpr f64 kPrecessionPerCentury = 5029.0966 / 3600.0;

    // Half-width of the central difference used for the motion flag (days)
    constexpr f64 kRateStepDays = 0.5;

    f64 solve_kepler(f64 mean_anomaly, f64 e)
    {
        f64 ecc_anomaly = mean_anomaly + e * std::sin(mean_anomaly);
        for (int iter = 0; iter < 30; ++iter)
        {
            const f64 delta = (ecc_anomaly - e * std::sin(ecc_anomaly) - mean_anomaly)
                            / (1.0 - e * std::cos(ecc_anomaly));
            ecc_anomaly -= delta;
            if (std::fabs(delta) < 1e-12)
            {
                break;
            }
        }
        return ecc_anomaly;
    }

    /// Heliocentric ecliptic position (AU, J2000 frame).
    Vec3d heliocentric(const OrbitalElements& el, f64 t)
    {
        const f64 a      = el.a + el.da * t;
        const f64 e      = el.e + el.de * t;
        const f64 incl   = glm::radians(el.i + el.di * t);
        const f64 L      = glm::radians(el.L + el.dL * t);
        const f64 w_bar  = glm::radians(el.long_peri + el.dlong_peri * t);
        const f64 node   = glm::radians(el.long_node + el.dlong_node * t);

        const f64 omega = w_bar - node;
        const f64 mean_anomaly = std::remainder(L - w_bar, astro_constants::kTwoPi);

        const f64 E = solve_kepler(mean_anomaly, e);
        const f64 nu = std::atan2(std::sqrt(1.0 - e * e) * std::sin(E), std::cos(E) - e);
        const f64 r = a * (1.0 - e * std::cos(E));
        const f64 u = omega + nu;

        return Vec3d{
            r * (std::cos(node) * std::cos(u) - std::sin(node) * std::sin(u) * std::cos(incl)),
            r * (std::sin(node) * std::cos(u) + std::cos(node) * std::sin(u) * std::cos(incl)),
            r * (std::sin(u) * std::sin(incl)),
        };
    }

    const OrbitalElements& elements_for(Graha body)
    {
        switch (body)
        {
            case Graha::Mercury: return kMercury;
            case Graha::Venus:   return kVenus;
            case Graha::Mars:    return kMars;
            case Graha::Jupiter: return kJupiter;
            case Graha::Saturn:  return kSaturn;
            default:
                throw core::EphemerisError("No orbital elements for body", graha_name(body));
        }
    }

    f64 sin_deg(f64 deg) { return std::sin(glm::radians(deg)); }
}

// -----------------------------------------------------------------
// Public API
// -----------------------------------------------------------------

BodyPosition MeanElementEphemeris::position(Graha body, f64 jd_utc) const
{
    const f64 lon = longitude(body, jd_utc);

    // The lunar nodes move backwards by definition
    if (is_node(body))
    {
        return BodyPosition{.tropical_longitude_deg = lon, .is_retrograde = true};
    }

    const f64 ahead  = longitude(body, jd_utc + kRateStepDays);
    const f64 behind = longitude(body, jd_utc - kRateStepDays);
    const f64 rate = std::remainder(ahead - behind, 360.0);

    return BodyPosition{
        .tropical_longitude_deg = lon,
        .is_retrograde          = rate < 0.0,
    };
}

f64 MeanElementEphemeris::longitude(Graha body, f64 jd_utc)
{
    const f64 t = astro::TimeSystem::julian_centuries(jd_utc);

    switch (body)
    {
        case Graha::Sun:  return sun_longitude(t);
        case Graha::Moon: return moon_longitude(t);
        case Graha::Rahu: return mean_node_longitude(t);
        case Graha::Ketu: return astro::Coordinates::normalize_degrees(mean_node_longitude(t) + 180.0);
        default:          return planet_longitude(body, t);
    }
}

// -----------------------------------------------------------------
// Sun: Meeus Ch. 25, low precision
// L0 = 280.46646 + 36000.76983 T + 0.0003032 T²
// M  = 357.52911 + 35999.05029 T − 0.0001537 T²
// -----------------------------------------------------------------

f64 MeanElementEphemeris::sun_longitude(f64 t)
{
    const f64 L0 = 280.46646 + t * (36000.76983 + t * 0.0003032);
    const f64 M  = 357.52911 + t * (35999.05029 - t * 0.0001537);

    const f64 C = (1.914602 - t * (0.004817 + t * 0.000014)) * sin_deg(M)
                + (0.019993 - t * 0.000101) * sin_deg(2.0 * M)
                + 0.000289 * sin_deg(3.0 * M);

    return astro::Coordinates::normalize_degrees(L0 + C);
}

// -----------------------------------------------------------------
// Moon: Meeus Ch. 47, largest longitude terms (error ≲ 0.3°)
// -----------------------------------------------------------------

f64 MeanElementEphemeris::moon_longitude(f64 t)
{
    const f64 Lp = 218.3164477 + 481267.88123421 * t;  // mean longitude
    const f64 D  = 297.8501921 + 445267.1114034 * t;   // mean elongation
    const f64 M  = 357.5291092 + 35999.0502909 * t;    // Sun mean anomaly
    const f64 Mp = 134.9633964 + 477198.8675055 * t;   // Moon mean anomaly
    const f64 F  = 93.2720950 + 483202.0175233 * t;    // argument of latitude

    const f64 sum = 6.288774 * sin_deg(Mp)
                  + 1.274027 * sin_deg(2.0 * D - Mp)
                  + 0.658314 * sin_deg(2.0 * D)
                  + 0.213618 * sin_deg(2.0 * Mp)
                  - 0.185116 * sin_deg(M)
                  - 0.114332 * sin_deg(2.0 * F)
                  + 0.058793 * sin_deg(2.0 * D - 2.0 * Mp)
                  + 0.057066 * sin_deg(2.0 * D - M - Mp)
                  + 0.053322 * sin_deg(2.0 * D + Mp)
                  + 0.045758 * sin_deg(2.0 * D - M)
                  - 0.040923 * sin_deg(M - Mp)
                  - 0.034720 * sin_deg(D)
                  - 0.030383 * sin_deg(M + Mp);

    return astro::Coordinates::normalize_degrees(Lp + sum);
}

// -----------------------------------------------------------------
// Mean ascending node (Meeus 47.7)
// -----------------------------------------------------------------

f64 MeanElementEphemeris::mean_node_longitude(f64 t)
{
    const f64 omega = 125.0445479
                    - 1934.1362891 * t
                    + 0.0020754 * t * t
                    + t * t * t / 467441.0;
    return astro::Coordinates::normalize_degrees(omega);
}

// -----------------------------------------------------------------
// Planets: geocentric = heliocentric(planet) − heliocentric(Earth)
// -----------------------------------------------------------------

f64 MeanElementEphemeris::planet_longitude(Graha body, f64 t)
{
    const Vec3d planet = heliocentric(elements_for(body), t);
    const Vec3d earth  = heliocentric(kEarthMoon, t);
    const Vec3d geo    = planet - earth;

    const f64 lon_j2000 = glm::degrees(std::atan2(geo.y, geo.x));
    return astro::Coordinates::normalize_degrees(lon_j2000 + kPrecessionPerCentury * t);
}

} // namespace jyotish::ephemeris
