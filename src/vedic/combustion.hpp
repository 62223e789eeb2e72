#pragma once

/// @file combustion.hpp
/// @brief Combustion (asta): proximity of a graha to the Sun.

#include "core/graha_id.hpp"
#include "core/types.hpp"
#include "vedic/bhava.hpp"
#include "vedic/graha.hpp"
#include "vedic/reference_tables.hpp"

#include <array>

namespace jyotish::vedic
{
    using CombustionFlags = std::array<bool, 9>;

    class CombustionDetector
    {
    public:
        explicit CombustionDetector(const ReferenceTables& tables)
            : m_tables(tables)
        {
        }

        /// @brief Combust iff `distance_to_sun_deg` < orb(graha). The Sun and nodes never are.
        [[nodiscard]] bool is_combust(Graha graha, f64 distance_to_sun_deg) const;

        /// @brief Combustion from two longitudes, using the shortest arc between them.
        [[nodiscard]] bool is_combust(Graha graha, f64 longitude_deg, f64 sun_longitude_deg) const;

        [[nodiscard]] CombustionFlags evaluate(const GrahaPositions& positions) const;

        /// @brief Per-house flag (index 0 = house 1): the house lord is combust.
        [[nodiscard]] static std::array<bool, 12> house_lord_combustion(const Bhavas& bhavas,
                                                                        const CombustionFlags& flags);

    private:
        const ReferenceTables& m_tables;
    };

} // namespace jyotish::vedic
