#pragma once

/// @file panchanga.hpp
/// @brief Panchanga: the five limbs of time (vara, tithi, nakshatra, yoga, karana).

#include "core/graha_id.hpp"
#include "core/types.hpp"
#include "vedic/reference_tables.hpp"

namespace jyotish::vedic
{
    enum class Paksha
    {
        Shukla,   ///< Waxing, tithis 1–15
        Krishna,  ///< Waning, tithis 16–30
    };

    enum class Karana
    {
        Bava,
        Balava,
        Kaulava,
        Taitila,
        Garaja,
        Vanija,
        Vishti,
        Shakuni,
        Chatushpada,
        Naga,
        Kimstughna,
    };

    [[nodiscard]] const char* paksha_name(Paksha paksha);
    [[nodiscard]] const char* karana_name(Karana karana);

    /// @param number 1–30
    [[nodiscard]] const char* tithi_name(i32 number);

    /// @param weekday 0 = Sunday
    [[nodiscard]] const char* vara_name(i32 weekday);

    /// @param index 0–26
    [[nodiscard]] const char* nitya_yoga_name(i32 index);

    struct VaraInfo
    {
        i32   weekday;  ///< 0 = Sunday … 6 = Saturday, of the UTC civil date
        Graha lord;

        bool operator==(const VaraInfo&) const = default;
    };

    struct TithiInfo
    {
        i32    number;    ///< 1–30
        Paksha paksha;
        Graha  lord;
        f64    elapsed;   ///< Fraction of the tithi already passed, [0, 1)

        bool operator==(const TithiInfo&) const = default;
    };

    struct NakshatraInfo
    {
        i32   index;    ///< 0–26
        i32   pada;     ///< 1–4
        Graha lord;
        f64   elapsed;

        bool operator==(const NakshatraInfo&) const = default;
    };

    struct NityaYogaInfo
    {
        i32  index;  ///< 0–26
        bool is_benefic;
        f64  elapsed;

        bool operator==(const NityaYogaInfo&) const = default;
    };

    struct KaranaInfo
    {
        i32    index;  ///< 0–59 within the lunar month
        Karana karana;
        bool   is_movable;
        bool   is_benefic;
        f64    elapsed;

        bool operator==(const KaranaInfo&) const = default;
    };

    struct Panchanga
    {
        VaraInfo      vara;
        TithiInfo     tithi;
        NakshatraInfo nakshatra;
        NityaYogaInfo yoga;
        KaranaInfo    karana;

        bool operator==(const Panchanga&) const = default;
    };

    /// @brief Panchanga from the sidereal Sun and Moon at an instant.
    ///
    /// Vara is the weekday of the UTC date; sunrise is not modelled.
    class PanchangaCalculator
    {
    public:
        PanchangaCalculator() = delete;

        static constexpr f64 kTithiSpan  = 12.0;
        static constexpr f64 kKaranaSpan = 6.0;

        [[nodiscard]] static VaraInfo vara(f64 jd_utc);
        [[nodiscard]] static TithiInfo tithi(f64 sun_deg, f64 moon_deg);
        [[nodiscard]] static NakshatraInfo nakshatra(f64 moon_deg, const ReferenceTables& tables);
        [[nodiscard]] static NityaYogaInfo nitya_yoga(f64 sun_deg, f64 moon_deg);
        [[nodiscard]] static KaranaInfo karana(f64 sun_deg, f64 moon_deg);

        [[nodiscard]] static Panchanga compute(f64 sun_deg, f64 moon_deg, f64 jd_utc,
                                               const ReferenceTables& tables);
    };

} // namespace jyotish::vedic
