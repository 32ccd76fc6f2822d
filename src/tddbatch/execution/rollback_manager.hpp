/**
 * @file rollback_manager.hpp
 * @brief RollbackManager: per-task discard and the failure ledger.
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/task.hpp"
#include "tddbatch/execution/execution_record.hpp"
#include "tddbatch/execution/status_tracker.hpp"
#include "tddbatch/execution/workspace.hpp"

namespace tddbatch
{

/**
 * @brief Undoes a failed task's changes and records why it failed.
 *
 * @details
 * `rollback()` discards exactly the paths the task reported, so sibling
 * tasks running in the same group keep their work. A task that reported no
 * paths has nothing discarded.
 *
 * The ledger is append-only. When a ledger file is configured every entry is
 * also appended to it as one JSON object per line:
 * @code
 * {"task_id":"T002","reason":"worker exceeded deadline","timestamp_ms":1700000000000}
 * @endcode
 *
 * Dependents of a Failed or Blocked task are not touched here. They become
 * Blocked when their own turn comes, because their predecessor is never
 * Completed.
 *
 * @par Thread Safety
 * - All methods may be called from any dispatcher thread. Workspace
 *   operations are serialized.
 */
class RollbackManager
{
public:
    /**
     * @param tracker Receives the Failed and Blocked marks.
     * @param workspace Working tree to discard from; may be null.
     * @param ledger_file JSON-lines mirror of the ledger; empty for none.
     * @throws ConfigError if the ledger file cannot be opened for appending.
     */
    RollbackManager(StatusTrackerPtr tracker,
                    WorkspacePtr workspace,
                    std::string ledger_file = {});

    RollbackManager(const RollbackManager&) = delete;
    RollbackManager& operator=(const RollbackManager&) = delete;

    /**
     * @brief Mark the task Failed, discard its paths and record the failure.
     * @throws CommitError if the workspace cannot be restored. The task is
     *         already marked Failed and recorded when this is thrown.
     * @throws ConfigError if the ledger file cannot be appended to.
     */
    void rollback(const Task& task,
                  const std::string& reason,
                  const std::vector<std::string>& touched_paths);

    /**
     * @brief Mark the task Blocked and record why.
     * @throws ConfigError if the ledger file cannot be appended to.
     */
    void block(const Task& task, const std::string& reason);

    /**
     * @brief Add a ledger entry without touching the tracker or workspace.
     */
    void record_failure(const TaskId& task_id, const std::string& reason);

    std::vector<FailureEntry> ledger() const;

private:
    void discard(const Task& task, const std::vector<std::string>& touched_paths);

    /// The in-memory entry is kept even when the file write throws.
    void append_locked(const FailureEntry& entry);

    StatusTrackerPtr m_tracker;
    WorkspacePtr m_workspace;
    std::string m_ledger_file;

    mutable std::mutex m_ledger_mutex;
    std::vector<FailureEntry> m_ledger;

    std::mutex m_workspace_mutex;
};

using RollbackManagerPtr = std::shared_ptr<RollbackManager>;

} // namespace tddbatch
