/**
 * @file execution_coordinator.hpp
 * @brief ExecutionCoordinator drives a schedule group by group.
 */
#pragma once
#include "tddbatch/common/batch_scheduler.hpp"
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/evidence_classifier.hpp"
#include "tddbatch/common/scheduler_config.hpp"
#include "tddbatch/execution/dispatcher.hpp"
#include "tddbatch/execution/rollback_manager.hpp"
#include "tddbatch/execution/run_report.hpp"
#include "tddbatch/execution/status_tracker.hpp"
#include "tddbatch/execution/task_wrapper.hpp"
#include "tddbatch/execution/test_runner.hpp"
#include "tddbatch/execution/worker.hpp"
#include "tddbatch/execution/workspace.hpp"

namespace tddbatch
{

/**
 * @brief Everything the coordinator talks to.
 *
 * @details
 * `tracker` and `worker` are required. The others fall back as follows:
 * - `test_runner`: none; Cleanup tasks then cannot start.
 * - `workspace`: none; no rollback discards and no checkpoints.
 * - `dispatcher`: `make_dispatcher(config.effective_worker_threads())`.
 * - `rollback`: a RollbackManager over tracker and workspace, ledger in
 *   memory only.
 * - `evidence_classifier`: MarkerEvidenceClassifier with the config's markers.
 */
struct ExecutionCollaborators
{
    StatusTrackerPtr tracker;
    WorkerPtr worker;
    TestRunnerPtr test_runner;
    WorkspacePtr workspace;
    DispatcherPtr dispatcher;
    RollbackManagerPtr rollback;
    EvidenceClassifierPtr evidence_classifier;
};

/**
 * @brief Runs groups in order with a barrier and one checkpoint per group.
 *
 * @details
 * For each group every batch becomes one dispatcher job whose tasks run in
 * order through their TaskWrapper. When the dispatcher returns, the group
 * has settled: failed tasks are already rolled back, and the remaining
 * changes are committed as the group's checkpoint.
 *
 * Checkpoint rules:
 * - No changes in the workspace: no checkpoint; not an error.
 * - Only the changed paths claimed by completed tasks are committed.
 * - Unclaimed changes next to a failed task that reported no paths cannot be
 *   attributed: CommitError.
 * - Otherwise, unclaimed changes next to a completed task that reported no
 *   paths are committed with it.
 * - Any other unclaimed change is a CommitError with `strict_checkpoint`,
 *   and is left uncommitted without it.
 * - No task completed, or no claimed path changed: no checkpoint.
 * - A locked repository or a failing commit is a CommitError.
 *
 * Hard stops (CommitError, TrackerInconsistencyError, a broken test suite)
 * let the current group settle, then the run ends; later groups are
 * reported as not run.
 *
 * On start, records an interrupted run left InProgress are marked Failed
 * with reason `interrupted`, which makes them eligible to run again.
 *
 * @par Thread Safety
 * - run() must not be called concurrently with itself.
 */
class ExecutionCoordinator
{
public:
    /**
     * @throws ConfigError if the config is invalid or a required collaborator
     *         is missing.
     */
    ExecutionCoordinator(SchedulerConfig config, ExecutionCollaborators collaborators);

    RunReport run(const std::vector<Group>& groups);

    /**
     * @brief Extra time a worker gets to report after its deadline.
     */
    void set_deadline_grace(std::chrono::seconds grace);

    const RollbackManagerPtr& rollback_manager() const noexcept
    {
        return m_collaborators.rollback;
    }

private:
    void recover_interrupted();

    /**
     * @brief Commit the group's settled changes.
     * @return The checkpoint, or std::nullopt when nothing was committed.
     * @throws CommitError, TrackerInconsistencyError
     */
    std::optional<Checkpoint> checkpoint(const Group& group,
                                         const std::vector<TaskWrapperPtr>& wrappers);

    SchedulerConfig m_config;
    ExecutionCollaborators m_collaborators;
    std::shared_ptr<TaskContext> m_context;
    std::mutex m_commit_mutex;
};

/**
 * @brief Commit message for a group checkpoint.
 */
std::string checkpoint_message(size_t group_index, const std::vector<TaskId>& task_ids);

/**
 * @brief Changed paths not covered by any claimed path.
 * @details A claimed path covers itself and, as a directory, everything
 *          below it.
 */
std::vector<std::string> unclaimed_paths(const std::vector<std::string>& changed,
                                         const std::vector<std::string>& claimed);

} // namespace tddbatch
