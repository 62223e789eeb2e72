/// @file test_batch.cpp
/// @brief Unit tests for the batch worker pool: ordering, error policies and cancellation.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include "batch/batch_runner.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "ephemeris/mean_element_ephemeris.hpp"
#include "vedic/chart.hpp"

#include <spdlog/fmt/fmt.h>

#include <string>
#include <vector>

using namespace jyotish;
using namespace jyotish::batch;

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
    vedic::BirthInput birth(i32 n)
    {
        return vedic::BirthInput{
            .utc_instant = fmt::format("19{:02d}-{:02d}-{:02d}T{:02d}:15:00Z",
                                       50 + n % 50, 1 + n % 12, 1 + (n * 7) % 28, (n * 5) % 24),
            .latitude    = -60.0 + 6.0 * (n % 20),
            .longitude   = -170.0 + 17.0 * (n % 20),
        };
    }

    std::vector<vedic::BirthInput> births(i32 count)
    {
        std::vector<vedic::BirthInput> inputs;
        for (i32 n = 0; n < count; ++n)
        {
            inputs.push_back(birth(n));
        }
        return inputs;
    }

    std::vector<TaskStatus> statuses(const BatchReport& report)
    {
        std::vector<TaskStatus> result;
        for (const BatchOutcome& o : report.outcomes)
        {
            result.push_back(o.status);
        }
        return result;
    }
}

// =================================================================
// Error policies
// =================================================================

TEST_CASE("SkipAndLog records the failure and keeps going")
{
    const ephemeris::MeanElementEphemeris provider;
    BatchRunner runner(provider, BatchConfig{.worker_count = 1, .error_policy = ErrorPolicy::SkipAndLog});

    std::vector<vedic::BirthInput> inputs = births(4);
    inputs[1].latitude = 95.0;

    const BatchReport report = runner.run(inputs);

    const std::vector<TaskStatus> expected = {
        TaskStatus::Completed, TaskStatus::Failed, TaskStatus::Completed, TaskStatus::Completed,
    };
    CHECK(statuses(report) == expected);

    const BatchOutcome& failed = report.outcomes[1];
    REQUIRE(failed.error_kind.has_value());
    CHECK(*failed.error_kind == core::ErrorKind::Input);
    CHECK_FALSE(failed.error.empty());
    CHECK_FALSE(failed.chart.has_value());

    CHECK(report.outcomes[0].chart.has_value());
    CHECK(report.count(TaskStatus::Completed) == 3);
    CHECK(report.count(TaskStatus::Failed) == 1);
}

TEST_CASE("AbortBatch cancels every task not yet started")
{
    const ephemeris::MeanElementEphemeris provider;
    BatchRunner runner(provider, BatchConfig{.worker_count = 1, .error_policy = ErrorPolicy::AbortBatch});

    std::vector<vedic::BirthInput> inputs = births(4);
    inputs[1].utc_instant = "not-a-date";

    const BatchReport report = runner.run(inputs);

    const std::vector<TaskStatus> expected = {
        TaskStatus::Completed, TaskStatus::Failed, TaskStatus::Cancelled, TaskStatus::Cancelled,
    };
    CHECK(statuses(report) == expected);
    CHECK(report.outcomes[2].error.empty());
    CHECK_FALSE(report.outcomes[3].chart.has_value());

    // The flag does not leak into the next run
    CHECK_FALSE(runner.is_cancelled());
    const BatchReport again = runner.run(births(2));
    CHECK(again.count(TaskStatus::Completed) == 2);
}

TEST_CASE("Ephemeris failures are reported per task")
{
    auto table = test::table_from(test::kSampleTropical);
    table.erase(Graha::Saturn);

    BatchRunner runner(table, BatchConfig{.worker_count = 3});
    const BatchReport report = runner.run(births(6));

    CHECK(report.count(TaskStatus::Failed) == 6);
    for (const BatchOutcome& o : report.outcomes)
    {
        REQUIRE(o.error_kind.has_value());
        CHECK(*o.error_kind == core::ErrorKind::Ephemeris);
    }
}

TEST_CASE("A provider throwing a non-standard value fails only its own tasks")
{
    const test::NonStandardThrowEphemeris throwing(Graha::Mars);
    BatchRunner runner(throwing, BatchConfig{.worker_count = 2});

    const BatchReport report = runner.run(births(5));

    REQUIRE(report.outcomes.size() == 5);
    CHECK(report.count(TaskStatus::Failed) == 5);
    for (const BatchOutcome& o : report.outcomes)
    {
        REQUIRE(o.error_kind.has_value());
        CHECK(*o.error_kind == core::ErrorKind::Ephemeris);
        CHECK(o.error.find("unknown exception") != std::string::npos);
    }
}

// =================================================================
// Parallel execution
// =================================================================

TEST_CASE("Results keep input order and match sequential charts")
{
    const ephemeris::MeanElementEphemeris provider;
    BatchRunner runner(provider, BatchConfig{.worker_count = 4});

    const std::vector<vedic::BirthInput> inputs = births(20);
    const BatchReport report = runner.run(inputs);

    REQUIRE(report.outcomes.size() == inputs.size());
    for (std::size_t i = 0; i < inputs.size(); ++i)
    {
        CAPTURE(i);
        const BatchOutcome& o = report.outcomes[i];
        CHECK(o.index == i);
        REQUIRE(o.status == TaskStatus::Completed);
        REQUIRE(o.chart.has_value());
        CHECK(*o.chart == vedic::Chart(inputs[i], provider));
    }
}

TEST_CASE("The completion callback fires once per task")
{
    const ephemeris::MeanElementEphemeris provider;
    BatchRunner runner(provider, BatchConfig{.worker_count = 4});

    std::vector<i32> seen(12, 0);
    runner.set_completion_callback([&seen](const BatchOutcome& o) { ++seen[o.index]; });

    std::vector<vedic::BirthInput> inputs = births(12);
    inputs[5].longitude = 200.0;
    const BatchReport report = runner.run(inputs);

    for (const i32 count : seen)
    {
        CHECK(count == 1);
    }
    CHECK(report.count(TaskStatus::Failed) == 1);
}

TEST_CASE("Cancelling from the callback abandons the remaining tasks")
{
    const ephemeris::MeanElementEphemeris provider;
    BatchRunner runner(provider, BatchConfig{.worker_count = 1});

    i32 settled = 0;
    runner.set_completion_callback([&runner, &settled](const BatchOutcome&)
    {
        if (++settled == 3)
        {
            runner.cancel();
        }
    });

    const BatchReport report = runner.run(births(10));

    CHECK(settled == 10);
    CHECK(report.count(TaskStatus::Completed) == 3);
    CHECK(report.count(TaskStatus::Cancelled) == 7);
    for (std::size_t i = 3; i < report.outcomes.size(); ++i)
    {
        CHECK(report.outcomes[i].status == TaskStatus::Cancelled);
    }
    CHECK_FALSE(runner.is_cancelled());
}

TEST_CASE("A cancel between batches does not cancel the next one")
{
    const ephemeris::MeanElementEphemeris provider;
    BatchRunner runner(provider, BatchConfig{.worker_count = 2});

    runner.cancel();
    CHECK(runner.is_cancelled());

    const BatchReport report = runner.run(births(3));
    CHECK(report.count(TaskStatus::Completed) == 3);
    CHECK(report.count(TaskStatus::Cancelled) == 0);
}

TEST_CASE("Worker count resolution")
{
    const ephemeris::MeanElementEphemeris provider;

    const BatchRunner four(provider, BatchConfig{.worker_count = 4});
    CHECK(four.resolved_worker_count(3) == 3);
    CHECK(four.resolved_worker_count(100) == 4);
    CHECK(four.resolved_worker_count(0) == 1);

    const BatchRunner two(provider, BatchConfig{.worker_count = 2});
    CHECK(two.resolved_worker_count(10) == 2);

    const BatchRunner automatic(provider);
    CHECK(automatic.resolved_worker_count(1) == 1);
    CHECK(automatic.resolved_worker_count(1000) >= 1);
}

TEST_CASE("An empty batch completes immediately")
{
    const ephemeris::MeanElementEphemeris provider;
    BatchRunner runner(provider);
    const BatchReport report = runner.run({});
    CHECK(report.outcomes.empty());
}

TEST_CASE("Task status names")
{
    CHECK(std::string(task_status_name(TaskStatus::Completed)) == "Completed");
    CHECK(std::string(task_status_name(TaskStatus::Cancelled)) == "Cancelled");
}
