/**
 * @file task_wrapper.cpp
 */
#include "tddbatch/execution/task_wrapper.hpp"
#include "tddbatch/common/scheduler_errors.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <thread>

namespace tddbatch
{

namespace
{

std::string last_line(const std::string& text)
{
    size_t end = text.find_last_not_of("\r\n ");
    if (end == std::string::npos)
    {
        return {};
    }
    size_t begin = text.rfind('\n', end);
    begin = begin == std::string::npos ? 0 : begin + 1;
    return text.substr(begin, end - begin + 1);
}

} // namespace

const char* to_string(RunOutcome outcome) noexcept
{
    switch (outcome)
    {
        case RunOutcome::Pending:
            return "pending";
        case RunOutcome::Skipped:
            return "skipped";
        case RunOutcome::Completed:
            return "completed";
        case RunOutcome::Failed:
            return "failed";
        case RunOutcome::Blocked:
            return "blocked";
    }
    return "unknown";
}

TaskWrapper::TaskWrapper(Task task, std::shared_ptr<const TaskContext> context)
    : m_task{std::move(task)}
    , m_context{std::move(context)}
    , m_settled{m_settled_promise.get_future().share()}
{
}

void TaskWrapper::set_predecessor(TaskWrapperWeakPtr predecessor)
{
    m_predecessor = std::move(predecessor);
}

void TaskWrapper::run() noexcept
{
    RunOutcome outcome = RunOutcome::Failed;
    try
    {
        outcome = execute();
    }
    catch (const SchedulerError& e)
    {
        spdlog::error("{} aborted: {}", m_task.id, e.what());
        m_reason = e.what();
        m_fatal_error = std::current_exception();
    }
    catch (const std::exception& e)
    {
        // Only reachable when the tracker or rollback itself fails.
        spdlog::error("{} aborted: {}", m_task.id, e.what());
        m_reason = e.what();
        m_fatal_error = std::make_exception_ptr(
            TrackerInconsistencyError(m_task.id, std::string("bookkeeping failed: ") + e.what()));
    }
    settle(outcome);
}

void TaskWrapper::wait_settled() const
{
    m_settled.wait();
}

RunOutcome TaskWrapper::execute()
{
    const TaskContext& ctx = *m_context;

    if (auto predecessor = m_predecessor.lock())
    {
        spdlog::debug("{} waiting for {}", m_task.id, predecessor->task().id);
        predecessor->wait_settled();
    }

    const ExecutionRecord existing = ctx.tracker->query_status(m_task.id);
    if (existing.status == TaskStatus::Completed)
    {
        if (m_task.predecessor &&
            ctx.tracker->query_status(*m_task.predecessor).status != TaskStatus::Completed)
        {
            throw TrackerInconsistencyError(
                m_task.id,
                fmt::format("recorded completed but its predecessor {} is not",
                            *m_task.predecessor));
        }
        spdlog::info("{} already completed; skipping", m_task.id);
        return RunOutcome::Skipped;
    }

    GuardDecision start;
    try
    {
        start = ctx.guard->can_start(m_task);
    }
    catch (const SchedulerError& e)
    {
        if (e.is_fatal())
        {
            throw;
        }
        return block(e.what());
    }
    catch (const std::exception& e)
    {
        return block(std::string("precondition check failed: ") + e.what());
    }
    if (!start.allowed)
    {
        m_suite_broken = start.suite_broken;
        return block(start.reason);
    }

    ctx.tracker->mark_in_progress(m_task.id);
    spdlog::info("{} started ({}, {})", m_task.id, to_string(m_task.phase), to_string(m_task.domain));

    try
    {
        WorkerResult result = call_worker();
        if (!result.success)
        {
            const std::string detail = last_line(result.evidence);
            throw ExecutionError(m_task.id, detail.empty() ? "worker reported failure"
                                                           : "worker reported failure: " + detail);
        }

        const ExecutionRecord during = ctx.tracker->query_status(m_task.id);
        if (during.status != TaskStatus::InProgress)
        {
            throw TrackerInconsistencyError(
                m_task.id, fmt::format("status changed to {} while running", to_string(during.status)));
        }

        GuardDecision verdict = ctx.guard->accept(m_task, result.evidence);
        if (!verdict.allowed)
        {
            m_suite_broken = verdict.suite_broken;
            return fail(verdict.reason);
        }

        if (ctx.workspace && !m_touched_paths.empty())
        {
            ctx.workspace->stage(m_touched_paths);
        }
        ctx.tracker->mark_completed(m_task.id, std::nullopt, result.evidence);
    }
    catch (const SchedulerError& e)
    {
        if (e.is_fatal())
        {
            throw;
        }
        return fail(e.what());
    }
    catch (const std::exception& e)
    {
        return fail(e.what());
    }

    const ExecutionRecord after = ctx.tracker->query_status(m_task.id);
    if (after.status != TaskStatus::Completed)
    {
        throw TrackerInconsistencyError(
            m_task.id, fmt::format("marked completed but tracker reports {}", to_string(after.status)));
    }
    spdlog::info("{} completed", m_task.id);
    return RunOutcome::Completed;
}

WorkerResult TaskWrapper::call_worker()
{
    const TaskContext& ctx = *m_context;
    m_worker_started = true;

    std::promise<WorkerResult> promise;
    std::future<WorkerResult> future = promise.get_future();
    std::thread runner([&promise, &ctx, this]() {
        try
        {
            promise.set_value(ctx.worker->execute(m_task, ctx.task_timeout));
        }
        catch (...)
        {
            promise.set_exception(std::current_exception());
        }
    });

    const bool in_time =
        future.wait_for(ctx.task_timeout + ctx.deadline_grace) == std::future_status::ready;
    if (!in_time)
    {
        spdlog::warn("{} exceeded deadline of {}s; waiting for its worker to stop",
                     m_task.id, ctx.task_timeout.count());
    }
    runner.join();

    const std::string overrun =
        fmt::format("worker exceeded deadline of {}s", ctx.task_timeout.count());
    WorkerResult result;
    try
    {
        result = future.get();
    }
    catch (const std::exception&)
    {
        if (!in_time)
        {
            throw ExecutionError(m_task.id, overrun);
        }
        throw;
    }

    m_touched_paths = result.touched_paths;
    m_worker_reported = true;
    if (!in_time)
    {
        throw ExecutionError(m_task.id, overrun);
    }
    return result;
}

RunOutcome TaskWrapper::fail(const std::string& reason)
{
    m_reason = reason;
    m_context->rollback->rollback(m_task, reason, m_touched_paths);
    return RunOutcome::Failed;
}

RunOutcome TaskWrapper::block(const std::string& reason)
{
    m_reason = reason;
    m_context->rollback->block(m_task, reason);
    return RunOutcome::Blocked;
}

void TaskWrapper::settle(RunOutcome outcome)
{
    m_outcome.store(outcome, std::memory_order_release);
    m_settled_promise.set_value();
}

} // namespace tddbatch
