/**
 * @file task_wrapper.hpp
 * @brief TaskWrapper runs one task through guard, worker and rollback.
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/task.hpp"
#include "tddbatch/execution/rollback_manager.hpp"
#include "tddbatch/execution/status_tracker.hpp"
#include "tddbatch/execution/tdd_guard.hpp"
#include "tddbatch/execution/worker.hpp"
#include "tddbatch/execution/workspace.hpp"

#include <future>

namespace tddbatch
{

class TaskWrapper;

using TaskWrapperPtr = std::shared_ptr<TaskWrapper>;
using TaskWrapperWeakPtr = std::weak_ptr<TaskWrapper>;

/**
 * @brief How one task ended in the current run.
 */
enum class RunOutcome
{
    Pending,    ///< run() has not finished.
    Skipped,    ///< Already Completed by an earlier run.
    Completed,
    Failed,
    Blocked
};

const char* to_string(RunOutcome outcome) noexcept;

/**
 * @brief Collaborators shared by all TaskWrappers of a run.
 */
struct TaskContext
{
    StatusTrackerPtr tracker;
    WorkerPtr worker;
    TDDGuardPtr guard;
    RollbackManagerPtr rollback;

    /// Receives the paths of each completed task; may be null.
    WorkspacePtr workspace;

    /// Deadline passed to the worker.
    std::chrono::seconds task_timeout{std::chrono::minutes(30)};

    /// Extra time allowed for the worker to report after its deadline.
    std::chrono::seconds deadline_grace{std::chrono::seconds(10)};
};

/**
 * @brief Wraps a Task for execution with pre/post orchestration.
 *
 * @details
 * TaskWrapper is the unit of work inside a batch job. run() performs:
 * 1. Wait for the same-group predecessor wrapper, if any, to settle.
 * 2. Skip the task if the tracker already has it Completed.
 * 3. Guard precondition; on rejection the task is Blocked.
 * 4. Mark InProgress and call the worker under a deadline.
 * 5. Guard acceptance of the evidence; on rejection the task is rolled back.
 * 6. Stage the reported paths in the workspace and mark Completed (without
 *    a commit ref until the group's checkpoint).
 * 7. Settle, releasing any dependent waiting in step 1.
 *
 * A worker that overruns `task_timeout + deadline_grace` fails the task, but
 * the wrapper still waits for the call to return so that the paths it reports
 * are rolled back before the task settles. IWorker implementations stop on
 * their own once their deadline has passed.
 *
 * Worker and test-runner exceptions become the task's failure. Fatal
 * scheduler errors (CommitError, TrackerInconsistencyError) are captured
 * and exposed through fatal_error() for the coordinator to act on.
 *
 * @par Ownership Model
 * - The coordinator owns all TaskWrapper instances of a group.
 * - A wrapper holds a weak_ptr to its same-group predecessor.
 *
 * @par Thread Safety
 * - run() is called once, from a dispatcher thread.
 * - wait_settled() may be called from any thread.
 * - Result accessors are valid once the task has settled.
 */
class TaskWrapper : public std::enable_shared_from_this<TaskWrapper>
{
public:
    TaskWrapper(Task task, std::shared_ptr<const TaskContext> context);

    TaskWrapper(const TaskWrapper&) = delete;
    TaskWrapper(TaskWrapper&&) = delete;
    TaskWrapper& operator=(const TaskWrapper&) = delete;
    TaskWrapper& operator=(TaskWrapper&&) = delete;

    /**
     * @brief Set the predecessor running in the same group.
     * @note Must be called during setup, before execution starts.
     */
    void set_predecessor(TaskWrapperWeakPtr predecessor);

    /**
     * @brief Execute this task. Never throws.
     */
    void run() noexcept;

    /**
     * @brief Block until run() has finished.
     */
    void wait_settled() const;

    RunOutcome outcome() const noexcept
    {
        return m_outcome.load(std::memory_order_acquire);
    }

    const Task& task() const noexcept
    {
        return m_task;
    }

    /// Paths the worker reported, empty if it never returned.
    const std::vector<std::string>& touched_paths() const noexcept
    {
        return m_touched_paths;
    }

    /// Whether the worker returned at all (touched_paths is meaningful).
    bool worker_reported() const noexcept
    {
        return m_worker_reported;
    }

    /// Whether the worker was called, so the task may have changed the tree.
    bool worker_started() const noexcept
    {
        return m_worker_started;
    }

    /// Why the task ended Failed or Blocked.
    const std::string& reason() const noexcept
    {
        return m_reason;
    }

    /// Fatal error raised while running, or nullptr.
    std::exception_ptr fatal_error() const noexcept
    {
        return m_fatal_error;
    }

    /// A fresh test run found the suite unable to run.
    bool suite_broken() const noexcept
    {
        return m_suite_broken;
    }

private:
    RunOutcome execute();

    WorkerResult call_worker();

    RunOutcome fail(const std::string& reason);

    RunOutcome block(const std::string& reason);

    void settle(RunOutcome outcome);

    Task m_task;
    std::shared_ptr<const TaskContext> m_context;
    TaskWrapperWeakPtr m_predecessor;

    std::atomic<RunOutcome> m_outcome{RunOutcome::Pending};
    std::promise<void> m_settled_promise;
    std::shared_future<void> m_settled;

    // Results (written once before settling)
    std::vector<std::string> m_touched_paths;
    bool m_worker_started{false};
    bool m_worker_reported{false};
    std::string m_reason;
    std::exception_ptr m_fatal_error{};
    bool m_suite_broken{false};
};

} // namespace tddbatch
