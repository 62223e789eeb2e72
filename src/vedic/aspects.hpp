#pragma once

/// @file aspects.hpp
/// @brief Drishti: graha aspects (house based), rasi aspects (sign based) and conjunctions.

#include "core/graha_id.hpp"
#include "core/types.hpp"
#include "vedic/graha.hpp"
#include "vedic/reference_tables.hpp"

#include <vector>

namespace jyotish::vedic
{
    /// @brief The two independent aspect systems. Never merged.
    enum class AspectSystem
    {
        Graha,  ///< Parashari graha drishti
        Rasi,   ///< Jaimini rasi drishti
    };

    enum class AspectType
    {
        Full,     ///< 7th-house aspect shared by every graha, and all rasi aspects
        Special,  ///< Mars 4/8, Jupiter 5/9, Saturn 3/10
    };

    enum class PointKind
    {
        Graha,
        Bhava,
        Rasi,
    };

    /// @brief Endpoint of an aspect. `index` is the Graha enum value, the
    /// house number (1–12) or the Rasi enum value depending on `kind`.
    struct AspectPoint
    {
        PointKind kind;
        i32       index;

        bool operator==(const AspectPoint&) const = default;
    };

    /// @brief One directed aspect.
    struct Aspect
    {
        AspectSystem system;
        AspectType   type;
        AspectPoint  source;
        AspectPoint  target;
        i32          house_distance;  ///< Inclusive count, source house = 1
        f64          arc_deg;         ///< Forward arc from source to target

        bool operator==(const Aspect&) const = default;
    };

    enum class ConjunctionStrength
    {
        VeryClose,  ///< ≤ 1°
        Close,      ///< ≤ 3°
        Moderate,   ///< ≤ 5°
        Wide,       ///< within the orb
    };

    /// @brief Two grahas within the conjunction orb of each other.
    struct Conjunction
    {
        Graha               first;
        Graha               second;
        f64                 separation_deg;
        ConjunctionStrength strength;

        bool operator==(const Conjunction&) const = default;
    };

    [[nodiscard]] const char* aspect_type_name(AspectType type);
    [[nodiscard]] const char* conjunction_strength_name(ConjunctionStrength strength);

    /// @brief Stateless drishti calculator.
    ///
    /// Drishti is house based: no orb applies. A graha aspects the 7th house
    /// from itself; Mars, Jupiter and Saturn add their special houses. Rasi
    /// drishti depends only on sign modality and ignores occupancy.
    class AspectEngine
    {
    public:
        AspectEngine() = delete;

        static constexpr f64 kConjunctionOrbDeg = 8.0;

        /// @brief House distances aspected by a graha, ascending, without duplicates.
        [[nodiscard]] static std::vector<i32> aspect_distances(Graha graha);

        /// @brief Whether `graha` casts drishti on a house `distance` houses away (1–12).
        [[nodiscard]] static bool aspects_distance(Graha graha, i32 distance);

        /// @brief Type tag of the aspect at `distance` (Full for 7, Special otherwise).
        [[nodiscard]] static AspectType aspect_type(i32 distance);

        /// @brief Rasis aspected by `rasi` under rasi drishti.
        [[nodiscard]] static std::vector<Rasi> rasi_aspects(Rasi rasi, const ReferenceTables& tables);

        /// @brief Every graha → bhava aspect.
        [[nodiscard]] static std::vector<Aspect> graha_to_bhava(const GrahaPositions& positions);

        /// @brief Every graha → graha aspect (target occupies an aspected house).
        [[nodiscard]] static std::vector<Aspect> graha_to_graha(const GrahaPositions& positions);

        /// @brief Every rasi → rasi aspect.
        [[nodiscard]] static std::vector<Aspect> rasi_to_rasi(const ReferenceTables& tables);

        /// @brief Graha→bhava, graha→graha, then rasi→rasi aspects.
        [[nodiscard]] static std::vector<Aspect> compute(const GrahaPositions& positions,
                                                      const ReferenceTables& tables);

        /// @brief Whether `from` aspects the graha `to` (graha drishti).
        [[nodiscard]] static bool graha_aspects(const GrahaPositions& positions, Graha from, Graha to);

        /// @brief Whether `a` and `b` aspect each other.
        [[nodiscard]] static bool mutual_aspect(const GrahaPositions& positions, Graha a, Graha b);

        /// @brief Graha pairs closer than the conjunction orb, in enumeration order.
        [[nodiscard]] static std::vector<Conjunction> conjunctions(const GrahaPositions& positions,
                                                                   f64 orb_deg = kConjunctionOrbDeg);
    };

} // namespace jyotish::vedic
