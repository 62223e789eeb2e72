// src/main.cpp - Jyotish birth-chart engine entry point
//
// Without arguments, computes a reference chart and prints:
//  1. Ascendant and chart settings
//  2. Graha table
//  3. Bhava table
//  4. Yogas and chara karakas
//  5. Panchanga
//  6. Summary
//
// With --batch <lat> <lon> <instant>..., computes one chart per instant in parallel.

#include "astro/coordinates.hpp"
#include "batch/batch_runner.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "ephemeris/mean_element_ephemeris.hpp"
#include "vedic/chart.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace jyotish;

namespace
{
    constexpr const char* kDemoInstant = "1990-05-15T09:00:00Z";
    constexpr f64 kDemoLatitude  = 28.6139;  // New Delhi
    constexpr f64 kDemoLongitude = 77.2090;

    std::optional<f64> parse_degrees(std::string_view sv)
    {
        f64 value = 0.0;
        auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc{} || ptr != sv.data() + sv.size())
        {
            return std::nullopt;
        }
        return value;
    }

    void print_point(const char* label, const vedic::ZodiacPoint& p)
    {
        auto dms = astro::Coordinates::to_dms(p.degree_in_rasi);
        std::cout << "  " << std::left << std::setw(16) << label << std::right
                  << std::setw(3) << dms.degrees << "d " << std::setw(2) << dms.minutes << "' "
                  << std::left << std::setw(12) << rasi_name(p.rasi) << std::right
                  << "(" << std::fixed << std::setprecision(4) << p.longitude << ")\n";
    }

    void print_chart(const vedic::Chart& chart, const vedic::ReferenceTables& tables)
    {
        // -----------------------------------------------------------------------
        // 1. Ascendant and settings
        // -----------------------------------------------------------------------
        std::cout << "Birth: " << astro::TimeSystem::to_iso8601(chart.birth_instant())
                  << "  lat " << std::fixed << std::setprecision(4) << chart.latitude()
                  << "  lon " << chart.longitude() << "\n"
                  << "  JD " << std::setprecision(5) << chart.julian_day()
                  << "  ayanamsa " << astro::ayanamsa_name(chart.ayanamsa())
                  << " " << std::setprecision(4) << chart.ayanamsa_offset() << " deg"
                  << "  houses " << vedic::house_system_name(chart.house_system()) << "\n\n";

        print_point("Ascendant", chart.get_ascendant());
        print_point("Midheaven", chart.special_points().midheaven);
        print_point("Fortune", chart.special_points().part_of_fortune);
        std::cout << "\n";

        // -----------------------------------------------------------------------
        // 2. Grahas
        // -----------------------------------------------------------------------
        std::cout << "Graha     Longitude  Rasi         Nakshatra          Pada  House  R  C  "
                     "Dignity        Strength  Nature\n";
        for (const auto& g : chart.get_graha_positions())
        {
            const auto& p = g.position.point;
            std::cout << std::left << std::setw(9) << graha_name(g.position.graha) << std::right
                      << std::setw(10) << std::setprecision(4) << p.longitude << "  "
                      << std::left << std::setw(12) << rasi_name(p.rasi) << " "
                      << std::setw(18) << tables.nakshatra_name(p.nakshatra) << std::right
                      << std::setw(5) << p.pada << std::setw(7) << g.position.house
                      << "  " << (g.position.is_retrograde ? 'R' : '-')
                      << "  " << (g.is_combust ? 'C' : '-') << "  "
                      << std::left << std::setw(14) << vedic::dignity_status_name(g.dignity.status)
                      << std::right << std::setw(9) << std::setprecision(3) << g.strength.score
                      << "  " << vedic::functional_nature_name(g.functional_nature) << "\n";
        }
        std::cout << "\n";

        // -----------------------------------------------------------------------
        // 3. Bhavas
        // -----------------------------------------------------------------------
        std::cout << "House  Cusp      Rasi         Lord     In  Strength  Category      Occupants\n";
        for (const auto& b : chart.get_bhavas())
        {
            std::cout << std::setw(5) << b.bhava.number
                      << std::setw(10) << std::setprecision(4) << b.bhava.cusp << "  "
                      << std::left << std::setw(12) << rasi_name(b.bhava.rasi) << " "
                      << std::setw(8) << graha_name(b.bhava.lord) << std::right
                      << std::setw(3) << b.lord_placement
                      << std::setw(10) << std::setprecision(3) << b.strength.score << "  "
                      << std::left << std::setw(13) << vedic::strength_category_name(b.strength.category)
                      << std::right << " ";
            for (Graha g : b.bhava.occupants)
            {
                std::cout << graha_name(g) << " ";
            }
            std::cout << "\n";
        }
        std::cout << "\n";

        // -----------------------------------------------------------------------
        // 4. Yogas and karakas
        // -----------------------------------------------------------------------
        std::cout << "Yogas (" << chart.yogas().size() << "):\n";
        for (const auto& y : chart.yogas())
        {
            std::cout << "  [" << vedic::yoga_category_name(y.category) << "] "
                      << y.name << " - " << y.description << "\n";
        }
        std::cout << "\nChara karakas:\n";
        for (const auto& k : chart.chara_karakas())
        {
            std::cout << "  " << std::left << std::setw(4) << vedic::chara_karaka_abbreviation(k.karaka)
                      << std::setw(9) << graha_name(k.graha) << std::right
                      << std::setprecision(3) << k.effective_degree << "\n";
        }
        std::cout << "\n";

        // -----------------------------------------------------------------------
        // 5. Panchanga
        // -----------------------------------------------------------------------
        const auto& pan = chart.panchanga();
        std::cout << "Panchanga:\n"
                  << "  Vara:      " << vedic::vara_name(pan.vara.weekday)
                  << " (" << graha_name(pan.vara.lord) << ")\n"
                  << "  Tithi:     " << vedic::paksha_name(pan.tithi.paksha) << " "
                  << vedic::tithi_name(pan.tithi.number) << " (" << graha_name(pan.tithi.lord) << ")\n"
                  << "  Nakshatra: " << tables.nakshatra_name(pan.nakshatra.index)
                  << " pada " << pan.nakshatra.pada << " (" << graha_name(pan.nakshatra.lord) << ")\n"
                  << "  Yoga:      " << vedic::nitya_yoga_name(pan.yoga.index)
                  << (pan.yoga.is_benefic ? " (benefic)" : " (malefic)") << "\n"
                  << "  Karana:    " << vedic::karana_name(pan.karana.karana)
                  << (pan.karana.is_benefic ? " (benefic)" : " (malefic)") << "\n\n";

        // -----------------------------------------------------------------------
        // 6. Summary
        // -----------------------------------------------------------------------
        const auto summary = chart.get_chart_summary();
        std::cout << "Summary:\n"
                  << "  Moon: " << rasi_name(summary.moon_rasi) << ", "
                  << tables.nakshatra_name(summary.moon_nakshatra) << "\n"
                  << "  Atmakaraka: " << graha_name(summary.atmakaraka) << "\n"
                  << "  Aspects: " << summary.aspect_count
                  << "  Conjunctions: " << summary.conjunction_count
                  << "  Yogas: " << summary.yoga_count << "\n"
                  << "  Overall strength: " << std::setprecision(3) << summary.overall_strength
                  << " (" << vedic::strength_category_name(summary.overall_category) << ")\n";
        std::cout << "  Strongest grahas:";
        for (Graha g : summary.strongest_grahas)
        {
            std::cout << " " << graha_name(g);
        }
        std::cout << "\n  Strongest bhavas:";
        for (i32 h : summary.strongest_bhavas)
        {
            std::cout << " " << h;
        }
        std::cout << "\n";
    }

    int run_batch(const ephemeris::EphemerisProvider& provider, int argc, char** argv)
    {
        if (argc < 5)
        {
            std::cerr << "usage: jyotish --batch <lat> <lon> <instant>...\n";
            return 2;
        }

        auto lat = parse_degrees(argv[2]);
        auto lon = parse_degrees(argv[3]);
        if (!lat || !lon)
        {
            JYO_ERROR("Invalid location '{}' '{}'", argv[2], argv[3]);
            return 2;
        }

        std::vector<vedic::BirthInput> inputs;
        for (int i = 4; i < argc; ++i)
        {
            inputs.push_back(vedic::BirthInput{
                .utc_instant = argv[i],
                .latitude = *lat,
                .longitude = *lon,
            });
        }

        batch::BatchRunner runner(provider);
        const auto report = runner.run(inputs);

        for (const auto& outcome : report.outcomes)
        {
            std::cout << std::setw(4) << outcome.index << "  "
                      << std::left << std::setw(28) << inputs[outcome.index].utc_instant << std::right
                      << std::setw(10) << batch::task_status_name(outcome.status) << "  ";
            if (outcome.chart)
            {
                const auto& asc = outcome.chart->get_ascendant();
                const auto& moon = outcome.chart->graha(Graha::Moon).position.point;
                std::cout << "Asc " << rasi_name(asc.rasi) << " " << std::fixed << std::setprecision(2)
                          << asc.degree_in_rasi << "  Moon " << rasi_name(moon.rasi);
            }
            else
            {
                std::cout << outcome.error;
            }
            std::cout << "\n";
        }

        return report.count(batch::TaskStatus::Failed) == 0 ? 0 : 1;
    }

} // namespace

int main(int argc, char** argv)
{
    core::Logger::init();

    int status = 0;
    try
    {
        ephemeris::MeanElementEphemeris provider;

        if (argc > 1 && std::string_view(argv[1]) == "--batch")
        {
            status = run_batch(provider, argc, argv);
        }
        else
        {
            std::cout << "================================================================\n"
                      << "  JYOTISH v0.1 - Vedic Birth Chart Engine\n"
                      << "================================================================\n\n";

            const vedic::BirthInput input{
                .utc_instant = kDemoInstant,
                .latitude = kDemoLatitude,
                .longitude = kDemoLongitude,
            };
            const vedic::Chart chart(input, provider);
            print_chart(chart, vedic::ReferenceTables::instance());
        }
    }
    catch (const core::JyotishError& e)
    {
        JYO_CRITICAL("{}: {}", core::error_kind_name(e.kind()), e.what());
        status = 1;
    }
    catch (const std::exception& e)
    {
        JYO_CRITICAL("Fatal error: {}", e.what());
        status = 1;
    }

    core::Logger::shutdown();
    return status;
}
