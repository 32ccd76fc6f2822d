/**
 * @file tdd_guard.cpp
 */
#include "tddbatch/execution/tdd_guard.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace tddbatch
{

TDDGuard::TDDGuard(StatusTrackerPtr tracker,
                   TestRunnerPtr test_runner,
                   EvidenceClassifierPtr classifier)
    : m_tracker{std::move(tracker)}
    , m_test_runner{std::move(test_runner)}
    , m_classifier{classifier ? std::move(classifier)
                              : std::make_shared<MarkerEvidenceClassifier>()}
{
    if (!m_tracker)
    {
        throw std::invalid_argument("TDDGuard requires a status tracker");
    }
}

GuardDecision TDDGuard::can_start(const Task& task) const
{
    if (task.predecessor)
    {
        const ExecutionRecord pred = m_tracker->query_status(*task.predecessor);
        if (pred.status != TaskStatus::Completed)
        {
            return GuardDecision::reject(fmt::format(
                "predecessor {} is {}, not completed", *task.predecessor, to_string(pred.status)));
        }
    }
    else if (task.is_phase_bound() && task.phase != TddPhase::FailingTest)
    {
        return GuardDecision::reject(
            fmt::format("{} task has no predecessor", to_string(task.phase)));
    }

    if (task.phase == TddPhase::Cleanup)
    {
        return require_fresh_pass("before cleanup");
    }
    return GuardDecision::allow();
}

GuardDecision TDDGuard::accept(const Task& task, const std::string& evidence) const
{
    const TestEvidence classified = m_classifier->classify(evidence);
    spdlog::debug("{} evidence classified as {}", task.id, to_string(classified.outcome));

    switch (task.phase)
    {
        case TddPhase::FailingTest:
            if (classified.outcome == TestOutcome::ExpectedFailure)
            {
                return GuardDecision::allow();
            }
            if (classified.outcome == TestOutcome::Passed)
            {
                return GuardDecision::reject(
                    "failing-test evidence shows the tests passing; the defect is not demonstrated");
            }
            return GuardDecision::reject(fmt::format(
                "failing-test evidence is {}, expected an assertion failure",
                to_string(classified.outcome)));

        case TddPhase::MakePass:
            if (classified.passed())
            {
                return GuardDecision::allow();
            }
            return GuardDecision::reject(fmt::format(
                "make-pass evidence is {}, expected passing tests", to_string(classified.outcome)));

        case TddPhase::Cleanup:
            if (!classified.passed())
            {
                return GuardDecision::reject(fmt::format(
                    "cleanup evidence is {}, expected passing tests",
                    to_string(classified.outcome)));
            }
            return require_fresh_pass("after cleanup");

        case TddPhase::None:
            break;
    }

    if (classified.outcome == TestOutcome::SetupError)
    {
        return GuardDecision::reject("evidence shows a test setup error");
    }
    return GuardDecision::allow();
}

GuardDecision TDDGuard::require_fresh_pass(const char* stage) const
{
    if (!m_test_runner)
    {
        return GuardDecision::reject(
            fmt::format("no test command configured for the fresh run {}", stage));
    }

    const TestEvidence fresh = m_test_runner->run();
    if (fresh.passed())
    {
        return GuardDecision::allow();
    }
    const bool broken = fresh.outcome == TestOutcome::SetupError;
    return GuardDecision::reject(
        fmt::format("fresh test run {} is {}", stage, to_string(fresh.outcome)), broken);
}

} // namespace tddbatch
