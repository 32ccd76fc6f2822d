/**
 * @file batch_scheduler.hpp
 * @brief BatchScheduler packs validated tasks into batches and groups.
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/task.hpp"

namespace tddbatch
{

/// Default upper bound on the number of tasks in a Parallel batch.
constexpr size_t k_default_max_batch_size = 4;

/// Default upper bound on the number of batches in a group.
constexpr size_t k_default_max_group_size = 3;

/**
 * @brief Dispatch mode of a batch.
 */
enum class BatchMode
{
    Sequential,  ///< Exactly one phase-bound task.
    Parallel     ///< One or more independent (phase None) tasks of one domain.
};

const char* to_string(BatchMode mode) noexcept;

/**
 * @brief A unit of work dispatched to one worker.
 *
 * @par Invariants
 * - `tasks` is non-empty.
 * - If any task is phase-bound, the batch holds exactly that one task and
 *   `mode` is Sequential.
 * - A Parallel batch holds only phase None tasks, all of the same domain,
 *   and at most the configured maximum batch size.
 */
struct Batch
{
    std::vector<Task> tasks;
    BatchMode mode{BatchMode::Parallel};

    std::vector<TaskId> task_ids() const
    {
        std::vector<TaskId> ids;
        ids.reserve(tasks.size());
        for (const auto& task : tasks)
        {
            ids.push_back(task.id);
        }
        return ids;
    }
};

/**
 * @brief A bounded set of batches that run concurrently, followed by a
 *        barrier and one checkpoint.
 */
struct Group
{
    size_t index{0};
    std::vector<Batch> batches;

    std::vector<TaskId> task_ids() const
    {
        std::vector<TaskId> ids;
        for (const auto& batch : batches)
        {
            for (const auto& task : batch.tasks)
            {
                ids.push_back(task.id);
            }
        }
        return ids;
    }

    size_t task_count() const noexcept
    {
        size_t count = 0;
        for (const auto& batch : batches)
        {
            count += batch.tasks.size();
        }
        return count;
    }
};

/**
 * @brief Order-preserving batch and group packer.
 *
 * @details
 * A single linear pass over the task list with one open accumulator batch:
 * - A phase-bound task flushes the accumulator (if non-empty) and is emitted
 *   as its own Sequential batch.
 * - A phase None task joins the accumulator when it is empty, or when the
 *   domain matches and there is room; otherwise the accumulator is flushed
 *   and a new one starts with this task.
 * - The accumulator is flushed at end of input.
 *
 * The batch sequence is then cut into groups of at most `max_group_size`
 * consecutive batches. Nothing is ever reordered: concatenating the groups'
 * batches' tasks reproduces the input exactly.
 *
 * @par Thread Safety
 * - Immutable after construction; concurrent calls are safe.
 */
class BatchScheduler
{
public:
    /**
     * @brief Construct a scheduler.
     * @throws ConfigError if either limit is zero.
     */
    explicit BatchScheduler(size_t max_batch_size = k_default_max_batch_size,
                            size_t max_group_size = k_default_max_group_size);

    /**
     * @brief Pack tasks into batches, preserving order.
     */
    std::vector<Batch> make_batches(const TaskList& tasks) const;

    /**
     * @brief Chunk batches into groups, preserving order.
     */
    std::vector<Group> make_groups(std::vector<Batch> batches) const;

    /**
     * @brief make_batches() followed by make_groups().
     */
    std::vector<Group> schedule(const TaskList& tasks) const;

    size_t max_batch_size() const noexcept { return m_max_batch_size; }
    size_t max_group_size() const noexcept { return m_max_group_size; }

private:
    size_t m_max_batch_size;
    size_t m_max_group_size;
};

/**
 * @brief Render a plan as text, one group per paragraph.
 *
 * @details
 * Example:
 * @code
 * group 0
 *   batch [sequential] T001
 *   batch [parallel] T003 T004
 * @endcode
 */
std::string describe_plan(const std::vector<Group>& groups);

} // namespace tddbatch
