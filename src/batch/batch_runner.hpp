#pragma once

/// @file batch_runner.hpp
/// @brief Parallel chart computation over independent births.

#include "core/errors.hpp"
#include "core/types.hpp"
#include "ephemeris/ephemeris_provider.hpp"
#include "vedic/chart.hpp"
#include "vedic/reference_tables.hpp"
#include "vedic/strength.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace jyotish::batch
{
    enum class TaskStatus
    {
        Pending,
        Running,
        Completed,
        Failed,
        Cancelled,
    };

    [[nodiscard]] const char* task_status_name(TaskStatus status);

    /// @brief What the batch does when one chart fails.
    enum class ErrorPolicy
    {
        SkipAndLog,  ///< Record the failure, keep going
        AbortBatch,  ///< Record the failure, cancel every task not yet started
    };

    struct BatchConfig
    {
        u32         worker_count = 0;  ///< 0 = hardware concurrency
        ErrorPolicy error_policy = ErrorPolicy::SkipAndLog;
    };

    /// @brief Result of one task, stored at the task's input index.
    struct BatchOutcome
    {
        std::size_t                    index = 0;
        TaskStatus                     status = TaskStatus::Pending;
        std::optional<vedic::Chart>    chart;
        std::optional<core::ErrorKind> error_kind;  ///< Set for engine errors
        std::string                    error;
    };

    struct BatchReport
    {
        std::vector<BatchOutcome> outcomes;  ///< Input order

        [[nodiscard]] std::size_t count(TaskStatus status) const;
    };

    /// @brief Worker pool computing one Chart per BirthInput.
    ///
    /// Tasks share nothing mutable except the next-task index, their own
    /// result slot and the cancellation flag. Cancellation abandons tasks that
    /// have not started; a task already running completes or fails on its own.
    class BatchRunner
    {
    public:
        using CompletionCallback = std::function<void(const BatchOutcome&)>;

        BatchRunner(const ephemeris::EphemerisProvider& provider,
                    BatchConfig config = {},
                    const vedic::ReferenceTables& tables = vedic::ReferenceTables::instance(),
                    vedic::StrengthWeights weights = {});

        /// @brief Compute every chart and block until all tasks are settled.
        [[nodiscard]] BatchReport run(const std::vector<vedic::BirthInput>& inputs);

        /// @brief Abandon tasks of the running batch that have not started.
        /// Thread-safe; may be called from a completion callback. Cleared when
        /// run() starts and when it returns, so a cancel() between batches is a no-op.
        void cancel();

        [[nodiscard]] bool is_cancelled() const { return m_cancelled.load(); }

        /// @brief Invoked once per settled task. Calls are serialized.
        void set_completion_callback(CompletionCallback callback) { m_on_complete = std::move(callback); }

        [[nodiscard]] u32 resolved_worker_count(std::size_t task_count) const;

    private:
        void worker(const std::vector<vedic::BirthInput>& inputs, std::vector<BatchOutcome>& outcomes);
        void execute(const vedic::BirthInput& input, BatchOutcome& outcome);
        void settle(const BatchOutcome& outcome);

        const ephemeris::EphemerisProvider& m_provider;
        BatchConfig                         m_config;
        const vedic::ReferenceTables&       m_tables;
        vedic::StrengthWeights              m_weights;

        std::atomic<std::size_t> m_next{0};
        std::atomic<bool>        m_cancelled{false};
        std::mutex               m_callback_mutex;
        CompletionCallback       m_on_complete;
    };

} // namespace jyotish::batch
