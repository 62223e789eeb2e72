#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: ISO-8601 parsing, Julian Date, sidereal time, obliquity.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace jyotish::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;

        bool operator==(const DateTime&) const = default;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Date conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// Greenwich/Local Mean Sidereal Time (IAU 1982) and the mean obliquity of the
    /// ecliptic (IAU 1980, epoch J2000.0). Angular results are in degrees unless noted.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Parse an ISO-8601 timestamp into a UTC civil date/time.
        ///
        /// Accepts `YYYY-MM-DDTHH:MM[:SS[.fff]]` followed by an optional `Z` or
        /// `±HH:MM` offset (no suffix means UTC). Offsets are removed so the
        /// result is always UTC.
        /// @throws core::InputError if the text is malformed or the calendar date is invalid.
        [[nodiscard]] static DateTime parse_iso8601(std::string_view text);

        /// @brief Format a UTC date/time as `YYYY-MM-DDTHH:MM:SSZ`.
        [[nodiscard]] static std::string to_iso8601(const DateTime& dt);

        /// @brief Check that month/day/hour/minute/second are in range for the calendar.
        [[nodiscard]] static bool is_valid(const DateTime& dt);

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Date as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @param jd Julian Date.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time (degrees).
        /// @param jd Julian Date (UTC).
        /// @return GMST in degrees, normalized to [0, 360).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time (degrees).
        /// @param jd Julian Date (UTC).
        /// @param longitude_deg Observer longitude in degrees (east positive).
        /// @return LMST in degrees, normalized to [0, 360).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_deg);

        /// @brief Mean obliquity of the ecliptic (degrees), IAU 1980 polynomial.
        [[nodiscard]] static f64 mean_obliquity(f64 jd);

        [[nodiscard]] static bool is_leap_year(i32 year);
        [[nodiscard]] static i32 days_in_month(i32 year, i32 month);

    private:
        [[nodiscard]] static std::optional<i32> parse_int(std::string_view sv);
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace jyotish::astro
