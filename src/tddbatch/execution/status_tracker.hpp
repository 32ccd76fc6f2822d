/**
 * @file status_tracker.hpp
 * @brief IStatusTracker interface and its in-memory and JSON-file implementations.
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/execution/execution_record.hpp"

namespace tddbatch
{

/**
 * @brief Authoritative store of task execution state.
 *
 * @details
 * The coordinator queries the tracker before dispatching every task instead
 * of trusting in-process memory, so a restarted run skips tasks that a
 * previous run completed.
 *
 * @par Thread Safety
 * - Implementations must be safe to call from any worker thread.
 */
class IStatusTracker
{
public:
    virtual ~IStatusTracker() = default;

    virtual void mark_in_progress(const TaskId& task_id) = 0;

    /**
     * @brief Mark a task Completed.
     * @param commit_ref Checkpoint commit, or std::nullopt before the group's
     *        checkpoint exists. A later call may attach the ref; a missing ref
     *        never erases a known one.
     */
    virtual void mark_completed(const TaskId& task_id,
                                const std::optional<std::string>& commit_ref,
                                const std::string& evidence) = 0;

    virtual void mark_failed(const TaskId& task_id, const std::string& reason) = 0;

    virtual void mark_blocked(const TaskId& task_id, const std::string& reason) = 0;

    /**
     * @brief Latest record of a task; unknown tasks are Pending.
     */
    virtual ExecutionRecord query_status(const TaskId& task_id) const = 0;

    /**
     * @brief All known records, in first-seen order.
     */
    virtual std::vector<ExecutionRecord> records() const = 0;

    virtual void record_checkpoint(const Checkpoint& checkpoint) = 0;

    virtual std::vector<Checkpoint> checkpoints() const = 0;
};

using StatusTrackerPtr = std::shared_ptr<IStatusTracker>;

/**
 * @brief Mutex-protected in-memory tracker.
 *
 * @details
 * Also the base of JsonFileStatusTracker: every mutation calls
 * `persist_locked()` while still holding the lock, so a derived class sees a
 * consistent snapshot.
 */
class InMemoryStatusTracker : public IStatusTracker
{
public:
    InMemoryStatusTracker() = default;

    InMemoryStatusTracker(const InMemoryStatusTracker&) = delete;
    InMemoryStatusTracker& operator=(const InMemoryStatusTracker&) = delete;

    void mark_in_progress(const TaskId& task_id) override;
    void mark_completed(const TaskId& task_id,
                        const std::optional<std::string>& commit_ref,
                        const std::string& evidence) override;
    void mark_failed(const TaskId& task_id, const std::string& reason) override;
    void mark_blocked(const TaskId& task_id, const std::string& reason) override;

    ExecutionRecord query_status(const TaskId& task_id) const override;
    std::vector<ExecutionRecord> records() const override;

    void record_checkpoint(const Checkpoint& checkpoint) override;
    std::vector<Checkpoint> checkpoints() const override;

protected:
    /**
     * @brief Hook called after each mutation, with m_mutex held.
     */
    virtual void persist_locked() {}

    /**
     * @brief Replace all state (used when loading), with m_mutex held.
     */
    void load_locked(std::vector<ExecutionRecord> records, std::vector<Checkpoint> checkpoints);

    ExecutionRecord& record_locked(const TaskId& task_id);

    mutable std::mutex m_mutex;
    std::unordered_map<TaskId, size_t> m_index;
    std::vector<ExecutionRecord> m_records;
    std::vector<Checkpoint> m_checkpoints;
};

/**
 * @brief Tracker persisted to a JSON document.
 *
 * @details
 * The document is loaded on construction (a missing file is an empty
 * tracker) and rewritten after every mutation by writing a sibling temporary
 * file and renaming it over the original, so a crash never leaves a torn
 * file behind.
 *
 * @code
 * {
 *   "version": 1,
 *   "records": [{"task_id": "T001", "status": "completed", "commit_ref": "ab12",
 *                "evidence": "...", "reason": "", "timestamp_ms": 1700000000000}],
 *   "checkpoints": [{"group_index": 0, "commit_ref": "ab12",
 *                    "timestamp_ms": 1700000000000, "task_ids": ["T001"]}]
 * }
 * @endcode
 */
class JsonFileStatusTracker : public InMemoryStatusTracker
{
public:
    /**
     * @throws ConfigError if an existing file cannot be parsed.
     */
    explicit JsonFileStatusTracker(std::string path);

    const std::string& path() const noexcept
    {
        return m_path;
    }

protected:
    void persist_locked() override;

private:
    void load();

    std::string m_path;
};

} // namespace tddbatch
