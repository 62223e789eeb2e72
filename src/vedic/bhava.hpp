#pragma once

/// @file bhava.hpp
/// @brief House systems, house cusps and graha-to-house assignment.

#include "core/graha_id.hpp"
#include "core/types.hpp"
#include "vedic/graha.hpp"
#include "vedic/reference_tables.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace jyotish::vedic
{
    /// @brief Supported house systems. New systems extend this enum and
    /// BhavaCalculator::cusps().
    enum class HouseSystem
    {
        Equal,
    };

    [[nodiscard]] const char* house_system_name(HouseSystem system);

    /// @brief Map a house-system name (case-insensitive) to its enum value.
    /// @throws core::ConfigurationError for unknown or unsupported systems.
    [[nodiscard]] HouseSystem parse_house_system(std::string_view name);

    /// @brief One house of a chart.
    struct Bhava
    {
        i32                      number;          ///< 1–12
        f64                      cusp;            ///< Sidereal longitude of the cusp
        Rasi                     rasi;            ///< Rasi containing the cusp
        Graha                    lord;            ///< Ruler of that rasi
        std::vector<Graha>       occupants;       ///< Enumeration order
        std::string              name;
        std::vector<std::string> significations;

        bool operator==(const Bhava&) const = default;
    };

    using Bhavas = std::array<Bhava, 12>;

    class BhavaCalculator
    {
    public:
        BhavaCalculator() = delete;

        /// @brief House cusps, cusp(1) = ascendant.
        /// @throws core::ConfigurationError if the system has no handler.
        [[nodiscard]] static std::array<f64, 12> cusps(HouseSystem system, f64 ascendant_deg);

        /// @brief House (1–12) containing `longitude_deg` for the given cusps.
        [[nodiscard]] static i32 house_of(f64 longitude_deg, const std::array<f64, 12>& cusps);

        /// @brief Cyclic distance from one house to another, counting inclusively (same house = 1).
        [[nodiscard]] static i32 house_distance(i32 from_house, i32 to_house);

        /// @brief Build the 12 bhavas and write each graha's house into `positions`.
        [[nodiscard]] static Bhavas compute(HouseSystem system,
                                            f64 ascendant_deg,
                                            GrahaPositions& positions,
                                            const ReferenceTables& tables);
    };

} // namespace jyotish::vedic
