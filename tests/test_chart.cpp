/// @file test_chart.cpp
/// @brief Integration tests for the Chart aggregate: pipeline, invariants, summary and error paths.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "ephemeris/mean_element_ephemeris.hpp"
#include "vedic/chart.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

using namespace jyotish;
using namespace jyotish::vedic;

static constexpr f64 kTol = 1e-9;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    jyotish::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    jyotish::core::Logger::shutdown();
    return result;
}

namespace
{
    BirthInput delhi_1990(astro::AyanamsaSystem ayanamsa = astro::AyanamsaSystem::Lahiri)
    {
        return BirthInput{
            .utc_instant = "1990-05-15T09:00:00Z",
            .latitude    = 28.6139,
            .longitude   = 77.2090,
            .ayanamsa    = ayanamsa,
        };
    }

    const ephemeris::MeanElementEphemeris& analytic()
    {
        static const ephemeris::MeanElementEphemeris e;
        return e;
    }

    /// Records how often each body is requested.
    class CountingEphemeris final : public ephemeris::EphemerisProvider
    {
    public:
        [[nodiscard]] ephemeris::BodyPosition position(Graha body, f64 jd_utc) const override
        {
            ++m_calls[index_of(body)];
            return analytic().position(body, jd_utc);
        }

        [[nodiscard]] i32 calls(Graha body) const { return m_calls[index_of(body)]; }

    private:
        mutable std::array<i32, 9> m_calls{};
    };

    class ThrowingEphemeris final : public ephemeris::EphemerisProvider
    {
    public:
        [[nodiscard]] ephemeris::BodyPosition position(Graha body, f64 jd_utc) const override
        {
            if (body == Graha::Jupiter)
            {
                throw std::runtime_error("data file unavailable");
            }
            return analytic().position(body, jd_utc);
        }
    };

    /// Valid positions with a configurable obliquity.
    class ObliquityEphemeris final : public ephemeris::EphemerisProvider
    {
    public:
        explicit ObliquityEphemeris(f64 obliquity, bool fail = false)
            : m_obliquity(obliquity)
            , m_fail(fail)
        {
        }

        [[nodiscard]] ephemeris::BodyPosition position(Graha body, f64 jd_utc) const override
        {
            return analytic().position(body, jd_utc);
        }

        [[nodiscard]] f64 obliquity(f64 /*jd_utc*/) const override
        {
            if (m_fail)
            {
                throw std::runtime_error("nutation series missing");
            }
            return m_obliquity;
        }

    private:
        f64  m_obliquity;
        bool m_fail;
    };
}

// =================================================================
// End-to-end with the analytic ephemeris
// =================================================================

TEST_CASE("Chart from the analytic ephemeris")
{
    const Chart chart(delhi_1990(), analytic());

    CHECK(chart.julian_day() == doctest::Approx(2448026.875).epsilon(kTol));
    CHECK(chart.obliquity() == doctest::Approx(astro::TimeSystem::mean_obliquity(chart.julian_day())));
    CHECK(chart.ayanamsa_offset()
          == doctest::Approx(astro::Ayanamsa::offset(astro::AyanamsaSystem::Lahiri, chart.julian_day())));

    SUBCASE("graha longitudes come from the provider")
    {
        for (const Graha g : kAllGrahas)
        {
            if (g == Graha::Ketu)
            {
                continue;
            }
            CAPTURE(graha_name(g));
            const f64 tropical = ephemeris::MeanElementEphemeris::longitude(g, chart.julian_day());
            CHECK(chart.graha(g).position.tropical_longitude == doctest::Approx(tropical));
            const f64 sidereal = astro::Coordinates::normalize_degrees(tropical - chart.ayanamsa_offset());
            CHECK(astro::Coordinates::angular_distance(chart.graha(g).position.point.longitude, sidereal)
                  < 1e-9);
        }
    }

    SUBCASE("ascendant from local sidereal time, latitude and obliquity")
    {
        const f64 lst = astro::Coordinates::local_sidereal_time(chart.birth_instant(), chart.longitude());
        const f64 tropical = astro::Coordinates::ascendant_longitude(lst, chart.latitude(), chart.obliquity());
        const f64 sidereal = astro::Coordinates::to_sidereal_longitude(tropical, chart.julian_day(),
                                                                        astro::AyanamsaSystem::Lahiri);
        CHECK(astro::Coordinates::angular_distance(chart.get_ascendant().longitude, sidereal) < 1e-9);
        CHECK(chart.bhava(1).bhava.rasi == chart.get_ascendant().rasi);
    }

    SUBCASE("the Sun sits in sidereal Aries or Taurus in mid May")
    {
        const Rasi sun = chart.graha(Graha::Sun).position.point.rasi;
        CHECK((sun == Rasi::Aries || sun == Rasi::Taurus));
        CHECK_FALSE(chart.graha(Graha::Sun).position.is_retrograde);
    }
}

TEST_CASE("Identical inputs give identical charts")
{
    const Chart a(delhi_1990(), analytic());
    const Chart b(delhi_1990(), analytic());
    CHECK(a == b);

    const Chart c(delhi_1990(astro::AyanamsaSystem::Raman), analytic());
    CHECK_FALSE(a == c);
}

TEST_CASE("Changing the ayanamsa shifts every sidereal longitude by the offset difference")
{
    const Chart lahiri(delhi_1990(astro::AyanamsaSystem::Lahiri), analytic());
    const Chart raman(delhi_1990(astro::AyanamsaSystem::Raman), analytic());

    CHECK(astro::Coordinates::normalize_degrees(raman.get_ascendant().longitude - lahiri.get_ascendant().longitude)
          == doctest::Approx(1.35).epsilon(1e-9));

    for (const Graha g : kAllGrahas)
    {
        CAPTURE(graha_name(g));
        const f64 delta = astro::Coordinates::normalize_degrees(
            raman.graha(g).position.point.longitude - lahiri.graha(g).position.point.longitude);
        CHECK(delta == doctest::Approx(1.35).epsilon(1e-9));
        // Tropical positions do not depend on the ayanamsa
        CHECK(raman.graha(g).position.tropical_longitude == lahiri.graha(g).position.tropical_longitude);
    }
}

// =================================================================
// Invariants on table-driven charts
// =================================================================

TEST_CASE("Charts satisfy their structural invariants")
{
    const auto& tables = ReferenceTables::instance();

    for (i32 k = 0; k < 24; ++k)
    {
        CAPTURE(k);
        test::Longitudes tropical{};
        for (std::size_t i = 0; i < tropical.size(); ++i)
        {
            tropical[i] = std::fmod(23.0 * k + 47.0 * static_cast<f64>(i) + 0.37, 360.0);
        }
        const auto table = test::table_from(tropical);
        const BirthInput input{
            .utc_instant = "2001-03-21T06:30:00Z",
            .latitude    = -33.87 + 5.0 * k,
            .longitude   = 151.21 - 13.0 * k,
        };
        const Chart chart(input, table);

        const f64 asc = chart.get_ascendant().longitude;
        CHECK(asc >= 0.0);
        CHECK(asc < 360.0);
        CHECK(chart.get_bhavas()[0].bhava.cusp == doctest::Approx(asc));

        std::size_t occupants = 0;
        for (i32 house = 1; house <= 12; ++house)
        {
            const BhavaReport& b = chart.bhava(house);
            CHECK(b.bhava.number == house);
            CHECK(b.bhava.lord == tables.ruler(b.bhava.rasi));
            CHECK(b.lord_placement == chart.graha(b.bhava.lord).position.house);
            CHECK_FALSE(b.classification.empty());
            occupants += b.bhava.occupants.size();
            for (const Graha g : b.bhava.occupants)
            {
                CHECK(chart.graha(g).position.house == house);
            }
        }
        CHECK(occupants == 9);

        const f64 rahu = chart.graha(Graha::Rahu).position.point.longitude;
        const f64 ketu = chart.graha(Graha::Ketu).position.point.longitude;
        CHECK(astro::Coordinates::angular_distance(rahu, ketu) == doctest::Approx(180.0).epsilon(kTol));

        for (const GrahaReport& g : chart.get_graha_positions())
        {
            CHECK(g.position.point.longitude >= 0.0);
            CHECK(g.position.point.longitude < 360.0);
            CHECK(g.dignity.score >= 1);
            CHECK(g.dignity.score <= 9);
            CHECK(g.strength.score >= 0.0);
            CHECK(g.strength.score <= 1.0);
        }
    }
}

TEST_CASE("Special points")
{
    const auto table = test::table_from(test::kSampleTropical);
    const BirthInput input{
        .utc_instant = "1990-05-15T09:00:00Z",
        .latitude    = 51.5,
        .longitude   = -0.13,
    };
    const Chart chart(input, table);

    const f64 asc = chart.get_ascendant().longitude;
    const f64 sun = chart.graha(Graha::Sun).position.point.longitude;
    const f64 moon = chart.graha(Graha::Moon).position.point.longitude;
    const f64 fortune = astro::Coordinates::normalize_degrees(asc + moon - sun);

    CHECK(chart.special_points().part_of_fortune.longitude == doctest::Approx(fortune).epsilon(kTol));
    CHECK(chart.special_points().midheaven.longitude >= 0.0);
    CHECK(chart.special_points().midheaven.longitude < 360.0);
}

TEST_CASE("Bhava and aspect queries")
{
    const Chart chart(delhi_1990(), analytic());

    CHECK_THROWS_AS((void)chart.bhava(0), core::InputError);
    CHECK_THROWS_AS((void)chart.bhava(13), core::InputError);

    CHECK(chart.bhava(1).classification.front() == "Kendra");

    // Graha and rasi aspects are reported side by side, never merged
    const auto& aspects = chart.get_aspects();
    const auto graha_count = std::count_if(aspects.begin(), aspects.end(),
                                           [](const Aspect& a) { return a.system == AspectSystem::Graha; });
    const auto rasi_count = std::count_if(aspects.begin(), aspects.end(),
                                          [](const Aspect& a) { return a.system == AspectSystem::Rasi; });
    CHECK(rasi_count == 36);
    CHECK(graha_count + rasi_count == static_cast<std::ptrdiff_t>(aspects.size()));
}

// =================================================================
// Summary
// =================================================================

TEST_CASE("Chart summary")
{
    const Chart chart(delhi_1990(), analytic());
    const ChartSummary s = chart.get_chart_summary();

    CHECK(s.birth_instant == "1990-05-15T09:00:00Z");
    CHECK(s.latitude == 28.6139);
    CHECK(s.ayanamsa == "Lahiri");
    CHECK(s.house_system == "Equal");
    CHECK(s.ascendant == chart.get_ascendant());
    CHECK(s.moon_rasi == chart.graha(Graha::Moon).position.point.rasi);
    CHECK(s.moon_nakshatra == chart.graha(Graha::Moon).position.point.nakshatra);
    CHECK(s.atmakaraka == chart.chara_karakas()[0].graha);
    CHECK(s.aspect_count == chart.get_aspects().size());
    CHECK(s.conjunction_count == chart.conjunctions().size());
    CHECK(s.yoga_count == chart.yogas().size());

    // Nodes are always retrograde
    CHECK(std::find(s.retrograde_grahas.begin(), s.retrograde_grahas.end(), Graha::Rahu)
          != s.retrograde_grahas.end());
    CHECK(std::find(s.retrograde_grahas.begin(), s.retrograde_grahas.end(), Graha::Ketu)
          != s.retrograde_grahas.end());

    REQUIRE(s.strongest_grahas.size() == 3);
    for (std::size_t i = 1; i < s.strongest_grahas.size(); ++i)
    {
        CHECK(chart.graha(s.strongest_grahas[i - 1]).strength.score
              >= chart.graha(s.strongest_grahas[i]).strength.score);
    }
    const f64 third = chart.graha(s.strongest_grahas[2]).strength.score;
    for (const GrahaReport& g : chart.get_graha_positions())
    {
        if (std::find(s.strongest_grahas.begin(), s.strongest_grahas.end(), g.position.graha)
            == s.strongest_grahas.end())
        {
            CHECK(g.strength.score <= third);
        }
    }

    REQUIRE(s.strongest_bhavas.size() == 3);
    CHECK(chart.bhava(s.strongest_bhavas[0]).strength.score >= chart.bhava(s.strongest_bhavas[1]).strength.score);
    CHECK(chart.bhava(s.strongest_bhavas[1]).strength.score >= chart.bhava(s.strongest_bhavas[2]).strength.score);

    f64 total = 0.0;
    for (const BhavaReport& b : chart.get_bhavas())
    {
        total += b.strength.score;
    }
    CHECK(s.overall_strength == doctest::Approx(total / 12.0));
    CHECK(s.overall_category == categorize(s.overall_strength));
}

TEST_CASE("Ketu is never requested from the provider")
{
    const CountingEphemeris counting;
    const Chart chart(delhi_1990(), counting);

    CHECK(counting.calls(Graha::Ketu) == 0);
    for (const Graha g : kAllGrahas)
    {
        if (g != Graha::Ketu)
        {
            CHECK(counting.calls(g) == 1);
        }
    }
    CHECK(astro::Coordinates::angular_distance(chart.graha(Graha::Rahu).position.point.longitude,
                                               chart.graha(Graha::Ketu).position.point.longitude)
          == doctest::Approx(180.0).epsilon(kTol));
}

// =================================================================
// Error paths
// =================================================================

TEST_CASE("Malformed input raises InputError")
{
    const auto table = test::table_from(test::kSampleTropical);
    BirthInput input = delhi_1990();

    SUBCASE("unparseable instant")   { input.utc_instant = "15/05/1990 09:00"; }
    SUBCASE("impossible date")       { input.utc_instant = "1990-02-30T09:00:00Z"; }
    SUBCASE("latitude above 90")     { input.latitude = 91.0; }
    SUBCASE("latitude below -90")    { input.latitude = -90.5; }
    SUBCASE("longitude below -180")  { input.longitude = -181.0; }
    SUBCASE("longitude above 180")   { input.longitude = 180.5; }
    SUBCASE("latitude not a number") { input.latitude = std::numeric_limits<f64>::quiet_NaN(); }

    CHECK_THROWS_AS(Chart(input, table), core::InputError);
}

TEST_CASE("Unknown system names raise ConfigurationError")
{
    CHECK_THROWS_AS((void)BirthInput::from_names("1990-05-15T09:00:00Z", 28.6, 77.2, "Lahiri", "Placidus"),
                    core::ConfigurationError);
    CHECK_THROWS_AS((void)BirthInput::from_names("1990-05-15T09:00:00Z", 28.6, 77.2, "Sassanian", "Equal"),
                    core::ConfigurationError);

    const BirthInput ok = BirthInput::from_names("1990-05-15T09:00:00Z", 28.6, 77.2, "raman", "equal");
    CHECK(ok.ayanamsa == astro::AyanamsaSystem::Raman);
    CHECK(ok.house_system == HouseSystem::Equal);
}

TEST_CASE("Provider failures raise EphemerisError")
{
    SUBCASE("missing body")
    {
        auto table = test::table_from(test::kSampleTropical);
        table.erase(Graha::Moon);
        CHECK_THROWS_AS(Chart(delhi_1990(), table), core::EphemerisError);
    }

    SUBCASE("longitude out of range")
    {
        auto table = test::table_from(test::kSampleTropical);
        table.set(Graha::Mars, 400.0);
        CHECK_THROWS_AS(Chart(delhi_1990(), table), core::EphemerisError);
    }

    SUBCASE("provider throws a non-standard value")
    {
        const test::NonStandardThrowEphemeris throwing(Graha::Saturn);
        try
        {
            const Chart chart(delhi_1990(), throwing);
            FAIL("expected EphemerisError");
        }
        catch (const core::EphemerisError& e)
        {
            CHECK(e.body() == "Saturn");
            CHECK(std::string(e.what()).find("unknown exception") != std::string::npos);
        }
    }

    SUBCASE("provider throws a foreign exception")
    {
        const ThrowingEphemeris throwing;
        try
        {
            const Chart chart(delhi_1990(), throwing);
            FAIL("expected EphemerisError");
        }
        catch (const core::EphemerisError& e)
        {
            CHECK(e.body() == "Jupiter");
            CHECK(std::string(e.what()).find("data file unavailable") != std::string::npos);
        }
    }

    SUBCASE("implausible obliquity")
    {
        const ObliquityEphemeris bad(45.0);
        try
        {
            const Chart chart(delhi_1990(), bad);
            FAIL("expected EphemerisError");
        }
        catch (const core::EphemerisError& e)
        {
            CHECK(e.body() == "Obliquity");
        }
    }

    SUBCASE("obliquity lookup throws")
    {
        const ObliquityEphemeris failing(23.44, true);
        CHECK_THROWS_AS(Chart(delhi_1990(), failing), core::EphemerisError);
    }
}

TEST_CASE("A custom obliquity within range is used as given")
{
    const ObliquityEphemeris custom(23.0);
    const Chart chart(delhi_1990(), custom);
    CHECK(chart.obliquity() == 23.0);
}
