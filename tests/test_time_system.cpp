/// @file test_time_system.cpp
/// @brief Unit tests for jyotish::astro::TimeSystem.
///
/// Verifies ISO-8601 birth-instant parsing and UTC normalization, Julian Date
/// conversion (Meeus), sidereal time and mean obliquity against reference values.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"

#include <cmath>
#include <string>

using namespace jyotish;
using namespace jyotish::astro;

static constexpr f64 kJdTolerance     = 1e-6;
static constexpr f64 kAngleTolDeg     = 1e-6;
static constexpr f64 kSecondTolerance = 1e-3;

// =================================================================
// ISO-8601 parsing
// =================================================================

TEST_CASE("UTC instant with Z designator parses field by field")
{
    const DateTime dt = TimeSystem::parse_iso8601("1990-05-15T09:00:00Z");

    CHECK(dt.year   == 1990);
    CHECK(dt.month  == 5);
    CHECK(dt.day    == 15);
    CHECK(dt.hour   == 9);
    CHECK(dt.minute == 0);
    CHECK(dt.second == 0.0);
}

TEST_CASE("Optional parts of the instant")
{
    SUBCASE("seconds omitted")
    {
        const DateTime dt = TimeSystem::parse_iso8601("1990-05-15T09:07");
        CHECK(dt.hour == 9);
        CHECK(dt.minute == 7);
        CHECK(dt.second == 0.0);
    }

    SUBCASE("fractional seconds")
    {
        const DateTime dt = TimeSystem::parse_iso8601("1990-05-15T09:00:30.5Z");
        CHECK(dt.second == doctest::Approx(30.5));
    }

    SUBCASE("space separator and no zone is taken as UTC")
    {
        const DateTime dt = TimeSystem::parse_iso8601("1990-05-15 09:00:00");
        CHECK(dt == TimeSystem::parse_iso8601("1990-05-15T09:00:00Z"));
    }
}

TEST_CASE("UTC offsets are normalized to UTC")
{
    SUBCASE("IST birth time 14:30 is 09:00 UTC")
    {
        const DateTime dt = TimeSystem::parse_iso8601("1990-05-15T14:30:00+05:30");
        CHECK(dt == TimeSystem::parse_iso8601("1990-05-15T09:00:00Z"));
    }

    SUBCASE("positive offset crossing back over a year boundary")
    {
        const DateTime dt = TimeSystem::parse_iso8601("2000-01-01T02:00:00+05:30");
        CHECK(dt.year   == 1999);
        CHECK(dt.month  == 12);
        CHECK(dt.day    == 31);
        CHECK(dt.hour   == 20);
        CHECK(dt.minute == 30);
    }

    SUBCASE("negative offset rolling into a leap day")
    {
        const DateTime dt = TimeSystem::parse_iso8601("2000-02-28T23:30-01:00");
        CHECK(dt.year   == 2000);
        CHECK(dt.month  == 2);
        CHECK(dt.day    == 29);
        CHECK(dt.hour   == 0);
        CHECK(dt.minute == 30);
    }

    SUBCASE("seconds survive the shift")
    {
        const DateTime dt = TimeSystem::parse_iso8601("1990-05-15T14:30:42+05:30");
        CHECK(dt.second == doctest::Approx(42.0));
    }
}

TEST_CASE("Malformed instants raise InputError")
{
    const char* bad[] = {
        "",
        "1990-05-15",
        "1990/05/15T09:00Z",
        "abcd-05-15T09:00Z",
        "1990-13-01T00:00Z",
        "1990-02-30T00:00Z",
        "1990-05-15T25:00Z",
        "1990-05-15T09:61Z",
        "1990-05-15T09:00:75Z",
        "1990-05-15T09:00:00+0530",
        "1990-05-15T09:00:00+15:00",
        "1990-05-15T09:00:00PST",
        "1990-05-15T09:00:xxZ",
    };

    for (const char* text : bad)
    {
        CAPTURE(text);
        CHECK_THROWS_AS((void)TimeSystem::parse_iso8601(text), core::InputError);
    }
}

TEST_CASE("to_iso8601 renders a canonical UTC instant")
{
    const DateTime dt = TimeSystem::parse_iso8601("1990-05-15T14:30:07+05:30");
    CHECK(TimeSystem::to_iso8601(dt) == "1990-05-15T09:00:07Z");
}

// =================================================================
// Calendar helpers
// =================================================================

TEST_CASE("Leap years follow the Gregorian rule")
{
    CHECK(TimeSystem::is_leap_year(2000));
    CHECK(TimeSystem::is_leap_year(1996));
    CHECK_FALSE(TimeSystem::is_leap_year(1900));
    CHECK_FALSE(TimeSystem::is_leap_year(1990));

    CHECK(TimeSystem::days_in_month(2000, 2) == 29);
    CHECK(TimeSystem::days_in_month(1900, 2) == 28);
    CHECK(TimeSystem::days_in_month(1990, 4) == 30);
}

// =================================================================
// Julian Date conversion
// =================================================================

TEST_CASE("J2000.0 epoch gives JD 2451545.0")
{
    const DateTime j2000 = {
        .year   = 2000,
        .month  = 1,
        .day    = 1,
        .hour   = 12,
        .minute = 0,
        .second = 0.0,
    };

    CHECK(TimeSystem::to_julian_date(j2000) == doctest::Approx(2451545.0).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 1999-01-01 00:00 UTC → JD 2451179.5")
{
    const DateTime dt = {
        .year   = 1999,
        .month  = 1,
        .day    = 1,
        .hour   = 0,
        .minute = 0,
        .second = 0.0,
    };

    CHECK(TimeSystem::to_julian_date(dt) == doctest::Approx(2451179.5).epsilon(kJdTolerance));
}

TEST_CASE("Reference birth instant 1990-05-15 09:00 UTC → JD 2448026.875")
{
    const f64 jd = TimeSystem::to_julian_date(TimeSystem::parse_iso8601("1990-05-15T09:00:00Z"));
    CHECK(jd == doctest::Approx(2448026.875).epsilon(kJdTolerance));
}

TEST_CASE("Round-trip: DateTime → JD → DateTime preserves values")
{
    const DateTime original = {
        .year   = 2025,
        .month  = 2,
        .day    = 14,
        .hour   = 8,
        .minute = 15,
        .second = 30.0,
    };

    const DateTime result = TimeSystem::from_julian_date(TimeSystem::to_julian_date(original));

    CHECK(result.year   == original.year);
    CHECK(result.month  == original.month);
    CHECK(result.day    == original.day);
    CHECK(result.hour   == original.hour);
    CHECK(result.minute == original.minute);
    CHECK(std::fabs(result.second - original.second) < kSecondTolerance);
}

TEST_CASE("Julian centuries at J2000.0 is 0.0")
{
    CHECK(TimeSystem::julian_centuries(astro_constants::kJ2000) == doctest::Approx(0.0));
}

// =================================================================
// Sidereal time and obliquity
// =================================================================

TEST_CASE("GMST at J2000.0 is 280.46061837°")
{
    CHECK(TimeSystem::gmst(astro_constants::kJ2000) == doctest::Approx(280.46061837).epsilon(kAngleTolDeg));
}

TEST_CASE("GMST and LMST stay in [0, 360)")
{
    const f64 dates[] = {2451545.0, 2448026.875, 2460476.0, 2440587.5};

    for (const f64 jd : dates)
    {
        const f64 gmst = TimeSystem::gmst(jd);
        CHECK(gmst >= 0.0);
        CHECK(gmst < 360.0);

        const f64 lmst = TimeSystem::lmst(jd, -104.02);
        CHECK(lmst >= 0.0);
        CHECK(lmst < 360.0);
    }
}

TEST_CASE("LMST shifts east by longitude")
{
    const f64 jd = astro_constants::kJ2000;
    const f64 expected = std::fmod(TimeSystem::gmst(jd) + 77.209, 360.0);

    CHECK(TimeSystem::lmst(jd, 0.0) == doctest::Approx(TimeSystem::gmst(jd)));
    CHECK(TimeSystem::lmst(jd, 77.209) == doctest::Approx(expected));
}

TEST_CASE("Mean obliquity at J2000.0 is 23°26'21.448\"")
{
    CHECK(TimeSystem::mean_obliquity(astro_constants::kJ2000) == doctest::Approx(23.4392911).epsilon(1e-8));
    // Decreases by about 47" per century
    CHECK(TimeSystem::mean_obliquity(astro_constants::kJ2000 + 36525.0)
          < TimeSystem::mean_obliquity(astro_constants::kJ2000));
}
