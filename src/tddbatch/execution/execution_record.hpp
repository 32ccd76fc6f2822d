/**
 * @file execution_record.hpp
 * @brief Mutable execution state: records, checkpoints, failure entries.
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/task.hpp"

namespace tddbatch
{

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Execution status of a task.
 *
 * @details
 * Transitions:
 * - Pending -> InProgress -> Completed | Failed
 * - Pending -> Blocked (predecessor not Completed, or guard precondition failed)
 *
 * Completed, Failed and Blocked are terminal within one run.
 */
enum class TaskStatus
{
    Pending,
    InProgress,
    Completed,
    Failed,
    Blocked
};

const char* to_string(TaskStatus status) noexcept;

std::optional<TaskStatus> task_status_from_string(const std::string& name);

inline bool is_terminal(TaskStatus status) noexcept
{
    return status == TaskStatus::Completed ||
           status == TaskStatus::Failed ||
           status == TaskStatus::Blocked;
}

/**
 * @brief Latest known state of one task.
 */
struct ExecutionRecord
{
    TaskId task_id;
    TaskStatus status{TaskStatus::Pending};

    /// Checkpoint commit that captured the task's change (Completed only).
    std::optional<std::string> commit_ref;

    /// Free-form test-run summary supplied with the result.
    std::string evidence;

    /// Failure or block reason (Failed and Blocked only).
    std::string reason;

    Timestamp timestamp{};
};

/**
 * @brief One group-level commit.
 */
struct Checkpoint
{
    size_t group_index{0};
    std::string commit_ref;
    Timestamp timestamp{};

    /// Tasks whose changes the commit captured.
    std::vector<TaskId> task_ids;
};

/**
 * @brief One entry of the append-only failure ledger.
 */
struct FailureEntry
{
    TaskId task_id;
    std::string reason;
    Timestamp timestamp{};
};

/**
 * @brief Milliseconds since the Unix epoch, for persisted timestamps.
 */
int64_t to_epoch_millis(Timestamp timestamp) noexcept;

Timestamp from_epoch_millis(int64_t millis) noexcept;

/**
 * @brief ISO-8601 UTC rendering (`2025-01-31T12:00:00.000Z`) for reports.
 */
std::string format_timestamp(Timestamp timestamp);

} // namespace tddbatch
