#pragma once

/// @file yoga.hpp
/// @brief Raj, Dhana and Parivartana yoga detection.

#include "core/graha_id.hpp"
#include "core/types.hpp"
#include "vedic/graha.hpp"
#include "vedic/lordship.hpp"
#include "vedic/reference_tables.hpp"

#include <string>
#include <vector>

namespace jyotish::vedic
{
    enum class YogaCategory
    {
        Raj,
        Dhana,
        Parivartana,
    };

    [[nodiscard]] const char* yoga_category_name(YogaCategory category);

    /// @brief A detected yoga with the reason it was detected.
    struct Yoga
    {
        std::string        name;
        YogaCategory       category;
        std::vector<Graha> grahas;       ///< Participants, enumeration order
        std::vector<i32>   houses;       ///< Houses whose lordship or occupancy forms the yoga
        std::string        description;

        bool operator==(const Yoga&) const = default;
    };

    class YogaDetector
    {
    public:
        YogaDetector() = delete;

        /// @brief A occupies a rasi ruled by B and B occupies a rasi ruled by A.
        /// Symmetric in its two arguments.
        [[nodiscard]] static bool is_exchange(const GrahaPositions& positions,
                                              const ReferenceTables& tables,
                                              Graha a, Graha b);

        /// @brief Kendra lord and trikona lord conjunct or in mutual aspect.
        [[nodiscard]] static std::vector<Yoga> raj_yogas(const GrahaPositions& positions,
                                                         const LordshipTable& lordships);

        /// @brief Lords of 2 and 11 (and of 5 or 9 paired with them) conjunct or exchanging.
        [[nodiscard]] static std::vector<Yoga> dhana_yogas(const GrahaPositions& positions,
                                                           const LordshipTable& lordships,
                                                           const ReferenceTables& tables);

        /// @brief Every pairwise sign exchange.
        [[nodiscard]] static std::vector<Yoga> parivartana_yogas(const GrahaPositions& positions,
                                                                 const ReferenceTables& tables);

        /// @brief Raj, then Dhana, then Parivartana yogas.
        [[nodiscard]] static std::vector<Yoga> detect(const GrahaPositions& positions,
                                                      const LordshipTable& lordships,
                                                      const ReferenceTables& tables);
    };

} // namespace jyotish::vedic
