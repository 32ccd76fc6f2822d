/**
 * @file execution_coordinator.cpp
 */
#include "tddbatch/execution/execution_coordinator.hpp"
#include "tddbatch/common/scheduler_errors.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iterator>

namespace tddbatch
{

namespace
{

const std::string k_interrupted_reason = "interrupted";

bool covers(const std::string& claimed, const std::string& path)
{
    if (claimed == path)
    {
        return true;
    }
    std::string dir = claimed;
    if (dir.empty() || dir == ".")
    {
        return true;
    }
    if (dir.back() != '/')
    {
        dir += '/';
    }
    return path.compare(0, dir.size(), dir) == 0;
}

} // namespace

std::string checkpoint_message(size_t group_index, const std::vector<TaskId>& task_ids)
{
    return fmt::format("checkpoint: group {} ({})", group_index, join_ids(task_ids));
}

std::vector<std::string> unclaimed_paths(const std::vector<std::string>& changed,
                                         const std::vector<std::string>& claimed)
{
    std::vector<std::string> result;
    for (const auto& path : changed)
    {
        const bool is_claimed = std::any_of(claimed.begin(), claimed.end(),
                                            [&path](const std::string& c) { return covers(c, path); });
        if (!is_claimed)
        {
            result.push_back(path);
        }
    }
    return result;
}

// ============================================================================
// ExecutionCoordinator
// ============================================================================

ExecutionCoordinator::ExecutionCoordinator(SchedulerConfig config,
                                           ExecutionCollaborators collaborators)
    : m_config{std::move(config)}
    , m_collaborators{std::move(collaborators)}
{
    m_config.validate();
    if (!m_collaborators.tracker)
    {
        throw ConfigError("execution requires a status tracker");
    }
    if (!m_collaborators.worker)
    {
        throw ConfigError("execution requires a worker (set worker_command)");
    }
    if (!m_collaborators.dispatcher)
    {
        m_collaborators.dispatcher = make_dispatcher(m_config.effective_worker_threads());
    }
    if (!m_collaborators.rollback)
    {
        m_collaborators.rollback =
            std::make_shared<RollbackManager>(m_collaborators.tracker, m_collaborators.workspace);
    }
    if (!m_collaborators.evidence_classifier)
    {
        m_collaborators.evidence_classifier =
            std::make_shared<MarkerEvidenceClassifier>(m_config.evidence_markers);
    }

    m_context = std::make_shared<TaskContext>();
    m_context->tracker = m_collaborators.tracker;
    m_context->worker = m_collaborators.worker;
    m_context->guard = std::make_shared<TDDGuard>(m_collaborators.tracker,
                                                  m_collaborators.test_runner,
                                                  m_collaborators.evidence_classifier);
    m_context->rollback = m_collaborators.rollback;
    m_context->workspace = m_collaborators.workspace;
    m_context->task_timeout = m_config.task_timeout;
}

void ExecutionCoordinator::set_deadline_grace(std::chrono::seconds grace)
{
    m_context->deadline_grace = grace;
}

void ExecutionCoordinator::recover_interrupted()
{
    for (const auto& record : m_collaborators.tracker->records())
    {
        if (record.status != TaskStatus::InProgress)
        {
            continue;
        }
        spdlog::warn("{} was left in progress by an earlier run; marking it failed", record.task_id);
        m_collaborators.tracker->mark_failed(record.task_id, k_interrupted_reason);
        m_collaborators.rollback->record_failure(record.task_id, k_interrupted_reason);
    }
}

RunReport ExecutionCoordinator::run(const std::vector<Group>& groups)
{
    RunReport report;
    const size_t ledger_start = m_collaborators.rollback->ledger().size();

    try
    {
        recover_interrupted();
    }
    catch (const std::exception& e)
    {
        report.aborted = true;
        report.abort_reason = std::string("cannot recover interrupted tasks: ") + e.what();
    }

    for (const auto& group : groups)
    {
        if (report.aborted)
        {
            const auto ids = group.task_ids();
            report.not_run.insert(report.not_run.end(), ids.begin(), ids.end());
            continue;
        }

        spdlog::info("group {}: {} batch(es), {} task(s)",
                     group.index, group.batches.size(), group.task_count());

        // Create wrappers, linking same-group predecessors.
        std::vector<TaskWrapperPtr> wrappers;
        std::unordered_map<TaskId, TaskWrapperPtr> by_id;
        std::vector<DispatchJob> jobs;
        for (const auto& batch : group.batches)
        {
            std::vector<TaskWrapperPtr> batch_wrappers;
            for (const auto& task : batch.tasks)
            {
                auto wrapper = std::make_shared<TaskWrapper>(task, m_context);
                if (task.predecessor)
                {
                    auto it = by_id.find(*task.predecessor);
                    if (it != by_id.end())
                    {
                        wrapper->set_predecessor(it->second);
                    }
                }
                by_id.emplace(task.id, wrapper);
                wrappers.push_back(wrapper);
                batch_wrappers.push_back(wrapper);
            }
            jobs.emplace_back([batch_wrappers]() {
                for (const auto& wrapper : batch_wrappers)
                {
                    wrapper->run();
                }
            });
        }

        m_collaborators.dispatcher->dispatch(std::move(jobs));

        // Barrier reached; collect outcomes.
        std::exception_ptr fatal;
        std::string stop_reason;
        for (const auto& wrapper : wrappers)
        {
            const TaskId& id = wrapper->task().id;
            switch (wrapper->outcome())
            {
                case RunOutcome::Completed:
                    report.completed.push_back(id);
                    break;
                case RunOutcome::Skipped:
                    report.skipped.push_back(id);
                    break;
                case RunOutcome::Failed:
                    report.failed.push_back(id);
                    break;
                case RunOutcome::Blocked:
                    report.blocked.push_back(id);
                    break;
                case RunOutcome::Pending:
                    report.not_run.push_back(id);
                    break;
            }
            if (wrapper->fatal_error() && !fatal)
            {
                fatal = wrapper->fatal_error();
                stop_reason = wrapper->reason();
            }
            if (wrapper->suite_broken() && stop_reason.empty())
            {
                stop_reason = fmt::format("test suite is broken ({}: {})", id, wrapper->reason());
            }
        }

        if (!fatal)
        {
            try
            {
                if (auto cp = checkpoint(group, wrappers))
                {
                    report.checkpoints.push_back(std::move(*cp));
                }
            }
            catch (const std::exception& e)
            {
                spdlog::error("checkpoint of group {} failed: {}", group.index, e.what());
                stop_reason = e.what();
            }
        }

        if (!stop_reason.empty())
        {
            spdlog::error("stopping after group {}: {}", group.index, stop_reason);
            report.aborted = true;
            report.abort_reason = stop_reason;
        }
    }

    const auto ledger = m_collaborators.rollback->ledger();
    report.failures.assign(ledger.begin() + static_cast<std::ptrdiff_t>(ledger_start), ledger.end());

    spdlog::info("{}", report.summary());
    return report;
}

std::optional<Checkpoint> ExecutionCoordinator::checkpoint(
    const Group& group, const std::vector<TaskWrapperPtr>& wrappers)
{
    const auto& workspace = m_collaborators.workspace;
    if (!workspace)
    {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_commit_mutex);

    std::vector<TaskId> ids;
    std::vector<std::string> claimed;
    std::vector<TaskId> silent_completed;
    std::vector<TaskId> silent_failed;
    for (const auto& wrapper : wrappers)
    {
        const TaskId& id = wrapper->task().id;
        const auto& touched = wrapper->touched_paths();
        if (wrapper->outcome() == RunOutcome::Completed)
        {
            ids.push_back(id);
            claimed.insert(claimed.end(), touched.begin(), touched.end());
            if (touched.empty())
            {
                silent_completed.push_back(id);
            }
        }
        else if (wrapper->outcome() == RunOutcome::Failed && wrapper->worker_started() &&
                 touched.empty())
        {
            silent_failed.push_back(id);
        }
    }

    const std::vector<std::string> changed = workspace->changed_paths();
    if (changed.empty())
    {
        spdlog::info("group {}: no changes; no checkpoint", group.index);
        return std::nullopt;
    }

    const std::vector<std::string> stray = unclaimed_paths(changed, claimed);
    std::vector<std::string> to_commit;
    std::copy_if(changed.begin(), changed.end(), std::back_inserter(to_commit),
                 [&stray](const std::string& path) {
                     return std::find(stray.begin(), stray.end(), path) == stray.end();
                 });
    if (!stray.empty())
    {
        if (!silent_failed.empty())
        {
            // Those tasks' leftovers cannot be told apart from anyone else's.
            throw CommitError(fmt::format(
                "group {}: cannot attribute changes {}; failed task(s) {} reported no paths",
                group.index, join_ids(stray), join_ids(silent_failed)));
        }
        if (!silent_completed.empty())
        {
            spdlog::warn("group {}: {} reported no paths; committing {} unclaimed path(s) "
                         "with them", group.index, join_ids(silent_completed), stray.size());
            to_commit = changed;
        }
        else if (m_config.strict_checkpoint)
        {
            throw CommitError(fmt::format(
                "group {}: changes not claimed by any completed task: {}",
                group.index, join_ids(stray)));
        }
        else
        {
            spdlog::warn("group {}: leaving {} unclaimed path(s) uncommitted: {}",
                         group.index, stray.size(), join_ids(stray));
        }
    }

    if (ids.empty() || to_commit.empty())
    {
        spdlog::info("group {}: nothing completed changed the tree; no checkpoint", group.index);
        return std::nullopt;
    }

    if (workspace->is_locked())
    {
        throw CommitError("repository is locked by another git process");
    }

    Checkpoint cp;
    cp.group_index = group.index;
    cp.commit_ref = workspace->commit(checkpoint_message(group.index, ids), to_commit);
    cp.timestamp = std::chrono::system_clock::now();
    cp.task_ids = ids;
    spdlog::info("group {}: checkpoint {}", group.index, cp.commit_ref);

    const auto& tracker = m_collaborators.tracker;
    tracker->record_checkpoint(cp);
    for (const auto& id : ids)
    {
        tracker->mark_completed(id, cp.commit_ref, {});
        const ExecutionRecord record = tracker->query_status(id);
        if (record.status != TaskStatus::Completed || record.commit_ref != cp.commit_ref)
        {
            throw TrackerInconsistencyError(
                id, fmt::format("checkpoint {} not reflected by the tracker", cp.commit_ref));
        }
    }
    return cp;
}

} // namespace tddbatch
