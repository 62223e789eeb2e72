/// @file batch_runner.cpp
/// @brief Worker-pool implementation of batch chart computation.

#include "batch/batch_runner.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace jyotish::batch
{

const char* task_status_name(TaskStatus status)
{
    switch (status)
    {
        case TaskStatus::Pending:   return "Pending";
        case TaskStatus::Running:   return "Running";
        case TaskStatus::Completed: return "Completed";
        case TaskStatus::Failed:    return "Failed";
        case TaskStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::size_t BatchReport::count(TaskStatus status) const
{
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [status](const BatchOutcome& o) { return o.status == status; }));
}

BatchRunner::BatchRunner(const ephemeris::EphemerisProvider& provider,
                         BatchConfig config,
                         const vedic::ReferenceTables& tables,
                         vedic::StrengthWeights weights)
    : m_provider(provider)
    , m_config(config)
    , m_tables(tables)
    , m_weights(weights)
{
}

u32 BatchRunner::resolved_worker_count(std::size_t task_count) const
{
    u32 workers = m_config.worker_count;
    if (workers == 0)
    {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return static_cast<u32>(std::clamp<std::size_t>(task_count, 1, workers));
}

void BatchRunner::cancel()
{
    m_cancelled.store(true);
}

// -----------------------------------------------------------------
// Run
// -----------------------------------------------------------------

BatchReport BatchRunner::run(const std::vector<vedic::BirthInput>& inputs)
{
    BatchReport report;
    report.outcomes.resize(inputs.size());
    for (std::size_t i = 0; i < inputs.size(); ++i)
    {
        report.outcomes[i].index = i;
    }

    m_next.store(0);
    m_cancelled.store(false);
    const u32 workers = resolved_worker_count(inputs.size());
    JYO_INFO("Batch: {} charts on {} workers", inputs.size(), workers);

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (u32 w = 0; w < workers; ++w)
    {
        pool.emplace_back([this, &inputs, &report] { worker(inputs, report.outcomes); });
    }
    for (std::thread& t : pool)
    {
        t.join();
    }

    JYO_INFO("Batch finished: {} completed, {} failed, {} cancelled",
             report.count(TaskStatus::Completed),
             report.count(TaskStatus::Failed),
             report.count(TaskStatus::Cancelled));

    m_cancelled.store(false);
    return report;
}

void BatchRunner::worker(const std::vector<vedic::BirthInput>& inputs, std::vector<BatchOutcome>& outcomes)
{
    for (;;)
    {
        const std::size_t i = m_next.fetch_add(1);
        if (i >= inputs.size())
        {
            return;
        }

        BatchOutcome& outcome = outcomes[i];
        if (m_cancelled.load())
        {
            outcome.status = TaskStatus::Cancelled;
            settle(outcome);
            continue;
        }

        outcome.status = TaskStatus::Running;
        execute(inputs[i], outcome);
        settle(outcome);
    }
}

void BatchRunner::execute(const vedic::BirthInput& input, BatchOutcome& outcome)
{
    try
    {
        outcome.chart.emplace(input, m_provider, m_tables, m_weights);
        outcome.status = TaskStatus::Completed;
        return;
    }
    catch (const core::JyotishError& e)
    {
        outcome.error_kind = e.kind();
        outcome.error = e.what();
    }
    catch (const std::exception& e)
    {
        outcome.error = e.what();
    }
    catch (...)
    {
        outcome.error = "unknown exception";
    }

    outcome.chart.reset();
    outcome.status = TaskStatus::Failed;

    const char* kind = outcome.error_kind ? core::error_kind_name(*outcome.error_kind) : "error";
    if (m_config.error_policy == ErrorPolicy::AbortBatch)
    {
        JYO_ERROR("Batch task {} ({}) failed, aborting batch: {}: {}",
                  outcome.index, input.utc_instant, kind, outcome.error);
        cancel();
    }
    else
    {
        JYO_WARN("Batch task {} ({}) skipped: {}: {}", outcome.index, input.utc_instant, kind, outcome.error);
    }
}

void BatchRunner::settle(const BatchOutcome& outcome)
{
    if (!m_on_complete)
    {
        return;
    }
    const std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_on_complete(outcome);
}

} // namespace jyotish::batch
