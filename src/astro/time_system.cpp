/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "astro/coordinates.hpp"
#include "core/errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <charconv>
#include <cmath>

namespace jyotish::astro
{

// -----------------------------------------------------------------
// ISO-8601 parsing
//
// Fixed-position layout:  YYYY-MM-DDTHH:MM[:SS[.fff]][Z|±HH:MM]
//                         0123456789012345678
// -----------------------------------------------------------------

DateTime TimeSystem::parse_iso8601(std::string_view text)
{
    const auto fail = [text](const char* what) -> core::InputError
    {
        return core::InputError(fmt::format("Malformed birth instant '{}': {}", text, what));
    };

    if (text.size() < 16)
    {
        throw fail("expected at least YYYY-MM-DDTHH:MM");
    }
    if (text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') || text[13] != ':')
    {
        throw fail("bad date/time separators");
    }

    const auto year   = parse_int(text.substr(0, 4));
    const auto month  = parse_int(text.substr(5, 2));
    const auto day    = parse_int(text.substr(8, 2));
    const auto hour   = parse_int(text.substr(11, 2));
    const auto minute = parse_int(text.substr(14, 2));
    if (!year || !month || !day || !hour || !minute)
    {
        throw fail("non-numeric date or time field");
    }

    std::size_t pos = 16;
    f64 second = 0.0;
    if (pos < text.size() && text[pos] == ':')
    {
        std::size_t end = pos + 1;
        while (end < text.size() && (std::isdigit(static_cast<unsigned char>(text[end])) || text[end] == '.'))
        {
            ++end;
        }
        const auto sec = parse_f64(text.substr(pos + 1, end - pos - 1));
        if (!sec)
        {
            throw fail("non-numeric seconds field");
        }
        second = *sec;
        pos = end;
    }

    // Timezone designator
    i32 offset_minutes = 0;
    if (pos < text.size())
    {
        const std::string_view zone = text.substr(pos);
        if (zone == "Z")
        {
            offset_minutes = 0;
        }
        else if ((zone[0] == '+' || zone[0] == '-') && zone.size() == 6 && zone[3] == ':')
        {
            const auto off_h = parse_int(zone.substr(1, 2));
            const auto off_m = parse_int(zone.substr(4, 2));
            if (!off_h || !off_m || *off_h > 14 || *off_m > 59)
            {
                throw fail("bad UTC offset");
            }
            offset_minutes = (*off_h * 60 + *off_m) * (zone[0] == '-' ? -1 : 1);
        }
        else
        {
            throw fail("unrecognized timezone designator");
        }
    }

    const DateTime local{
        .year   = *year,
        .month  = *month,
        .day    = *day,
        .hour   = *hour,
        .minute = *minute,
        .second = second,
    };

    if (!is_valid(local))
    {
        throw fail("calendar field out of range");
    }

    if (offset_minutes == 0)
    {
        return local;
    }

    // Shift clock minutes to UTC, carrying whole days through the calendar
    i32 total_minutes = local.hour * 60 + local.minute - offset_minutes;
    i32 day_shift = 0;
    while (total_minutes < 0)
    {
        total_minutes += 1440;
        --day_shift;
    }
    while (total_minutes >= 1440)
    {
        total_minutes -= 1440;
        ++day_shift;
    }

    DateTime utc = local;
    if (day_shift != 0)
    {
        const DateTime midnight{.year = local.year, .month = local.month, .day = local.day,
                                .hour = 0, .minute = 0, .second = 0.0};
        const DateTime shifted = from_julian_date(to_julian_date(midnight) + static_cast<f64>(day_shift));
        utc.year  = shifted.year;
        utc.month = shifted.month;
        utc.day   = shifted.day;
    }
    utc.hour   = total_minutes / 60;
    utc.minute = total_minutes % 60;
    return utc;
}

std::string TimeSystem::to_iso8601(const DateTime& dt)
{
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                       dt.year, dt.month, dt.day, dt.hour, dt.minute,
                       static_cast<i32>(std::floor(dt.second)));
}

bool TimeSystem::is_leap_year(i32 year)
{
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

i32 TimeSystem::days_in_month(i32 year, i32 month)
{
    constexpr i32 kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year))
    {
        return 29;
    }
    return kDays[month - 1];
}

bool TimeSystem::is_valid(const DateTime& dt)
{
    if (dt.month < 1 || dt.month > 12)
    {
        return false;
    }
    if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month))
    {
        return false;
    }
    return dt.hour >= 0 && dt.hour < 24
        && dt.minute >= 0 && dt.minute < 60
        && dt.second >= 0.0 && dt.second < 60.0;
}

// -----------------------------------------------------------------
// Julian Date: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + static_cast<f64>(dt.day)
         + day_fraction
         + static_cast<f64>(b)
         - 1524.5;
}

// -----------------------------------------------------------------
// Julian Date → civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor((static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(static_cast<f64>(b - d) / 30.6001));

    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    const f64 hours_total = day_frac * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));

    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    const f64 second = (minutes_total - static_cast<f64>(minute)) * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / astro_constants::kDaysPerCentury;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
// -----------------------------------------------------------------

f64 TimeSystem::gmst(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    const f64 gmst_deg = 280.46061837
                       + 360.98564736629 * d
                       + 0.000387933 * t * t
                       - (t * t * t) / 38710000.0;

    return Coordinates::normalize_degrees(gmst_deg);
}

f64 TimeSystem::lmst(f64 jd, f64 longitude_deg)
{
    return Coordinates::normalize_degrees(gmst(jd) + longitude_deg);
}

// -----------------------------------------------------------------
// Mean obliquity: IAU 1980
//
// ε₀ = 23°26'21.448" − 46.8150"T − 0.00059"T² + 0.001813"T³
// -----------------------------------------------------------------

f64 TimeSystem::mean_obliquity(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 arcsec = 21.448 - t * (46.8150 + t * (0.00059 - t * 0.001813));
    return 23.0 + 26.0 / 60.0 + arcsec * astro_constants::kArcSecToDeg;
}

// -----------------------------------------------------------------
// Token parsing
// -----------------------------------------------------------------

std::optional<i32> TimeSystem::parse_int(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

std::optional<f64> TimeSystem::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

} // namespace jyotish::astro
