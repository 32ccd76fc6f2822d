/**
 * @file worker.hpp
 * @brief IWorker interface and the shell-command worker.
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/task.hpp"

namespace tddbatch
{

/**
 * @brief What a worker reports after attempting one task.
 */
struct WorkerResult
{
    bool success{false};

    /// Test-run output produced while performing the task.
    std::string evidence;

    /// Workspace-relative paths the task modified, created or deleted.
    std::vector<std::string> touched_paths;
};

/**
 * @brief External executor that performs the actual change for a task.
 *
 * @details
 * The scheduler never inspects or produces the change itself; it only hands
 * the task to a worker and judges the returned evidence.
 *
 * @par Thread Safety
 * - execute() is called concurrently from several dispatcher threads, once
 *   per task.
 */
class IWorker
{
public:
    virtual ~IWorker() = default;

    /**
     * @brief Perform the task.
     * @param task The task to perform.
     * @param deadline Wall-clock budget. Implementations must return soon
     *        after it has passed: the caller fails the task once the budget
     *        and a grace period are spent, but waits for the call to return
     *        so that the reported paths can be rolled back.
     * @return The result; exceptions are treated as a failed result.
     */
    virtual WorkerResult execute(const Task& task, std::chrono::seconds deadline) = 0;
};

using WorkerPtr = std::shared_ptr<IWorker>;

/**
 * @brief Worker that runs a shell command per task.
 *
 * @details
 * The command runs in `working_directory` with these variables exported:
 * - `TDDBATCH_TASK_ID`
 * - `TDDBATCH_TASK_PHASE` (none, failing-test, make-pass, cleanup)
 * - `TDDBATCH_TASK_DOMAIN`
 * - `TDDBATCH_TASK_DESCRIPTION`
 * - `TDDBATCH_TASK_PREDECESSOR` (empty when none)
 *
 * Output lines of the form `TDDBATCH_TOUCHED <path>` declare touched paths;
 * all other output is the evidence. Exit status 0 is success.
 */
class CommandWorker : public IWorker
{
public:
    CommandWorker(std::string command, std::string working_directory);

    WorkerResult execute(const Task& task, std::chrono::seconds deadline) override;

private:
    std::string m_command;
    std::string m_working_directory;
};

/**
 * @brief Split worker output into evidence and `TDDBATCH_TOUCHED` paths.
 */
WorkerResult parse_worker_output(const std::string& output, bool success);

} // namespace tddbatch
