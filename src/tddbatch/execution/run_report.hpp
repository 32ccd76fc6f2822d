/**
 * @file run_report.hpp
 * @brief Definition of RunReport returned by ExecutionCoordinator::run().
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/task.hpp"
#include "tddbatch/execution/execution_record.hpp"

namespace tddbatch
{

/// Process exit codes of the `tddbatch` executable.
constexpr int k_exit_success = 0;
constexpr int k_exit_preflight_error = 1;
constexpr int k_exit_tasks_unsettled = 2;
constexpr int k_exit_aborted = 3;

/**
 * @brief Result of executing a schedule.
 *
 * @details
 * Every task of the schedule appears in exactly one of the task lists.
 * Lists follow the input order.
 */
struct RunReport
{
    /**
     * @brief Tasks completed in this run.
     */
    std::vector<TaskId> completed;

    /**
     * @brief Tasks whose execution or acceptance failed and were rolled back.
     */
    std::vector<TaskId> failed;

    /**
     * @brief Tasks that could not start.
     */
    std::vector<TaskId> blocked;

    /**
     * @brief Tasks already Completed by an earlier run.
     */
    std::vector<TaskId> skipped;

    /**
     * @brief Tasks never reached because the run stopped early.
     */
    std::vector<TaskId> not_run;

    /**
     * @brief Checkpoints created by this run.
     */
    std::vector<Checkpoint> checkpoints;

    /**
     * @brief Failure ledger entries recorded by this run.
     */
    std::vector<FailureEntry> failures;

    /**
     * @brief Whether a fatal error stopped the run before the last group.
     */
    bool aborted{false};

    std::string abort_reason;

    /**
     * @brief True only if every task is Completed (now or earlier).
     */
    bool success() const noexcept
    {
        return !aborted && failed.empty() && blocked.empty() && not_run.empty();
    }

    /**
     * @brief Exit code for the CLI.
     * @details 3 when aborted, 2 when any task did not complete, else 0.
     */
    int exit_code() const noexcept
    {
        if (aborted)
        {
            return k_exit_aborted;
        }
        return success() ? k_exit_success : k_exit_tasks_unsettled;
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result;
        if (success())
        {
            result = "Run succeeded";
        }
        else if (aborted)
        {
            result = "Run aborted";
        }
        else
        {
            result = "Run incomplete";
        }
        result += " (completed=" + std::to_string(completed.size());
        result += ", skipped=" + std::to_string(skipped.size());
        result += ", failed=" + std::to_string(failed.size());
        result += ", blocked=" + std::to_string(blocked.size());
        result += ", not_run=" + std::to_string(not_run.size());
        result += ", checkpoints=" + std::to_string(checkpoints.size()) + ")";
        return result;
    }
};

/**
 * @brief Multi-line human-readable report for stdout.
 */
std::string format_report(const RunReport& report);

} // namespace tddbatch
