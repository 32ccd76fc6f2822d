/**
 * @file tdd_guard.hpp
 * @brief TDDGuard enforces phase preconditions and postconditions.
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/evidence_classifier.hpp"
#include "tddbatch/common/task.hpp"
#include "tddbatch/execution/status_tracker.hpp"
#include "tddbatch/execution/test_runner.hpp"

namespace tddbatch
{

/**
 * @brief Outcome of a guard check.
 */
struct GuardDecision
{
    bool allowed{false};

    /// Why the check failed; empty when allowed.
    std::string reason;

    /// A fresh test run could not execute at all (SetupError).
    bool suite_broken{false};

    static GuardDecision allow()
    {
        GuardDecision decision;
        decision.allowed = true;
        return decision;
    }

    static GuardDecision reject(std::string reason, bool suite_broken = false)
    {
        GuardDecision decision;
        decision.reason = std::move(reason);
        decision.suite_broken = suite_broken;
        return decision;
    }
};

/**
 * @brief The TDD state machine's gatekeeper.
 *
 * @details
 * | Phase       | can_start                         | accept                               |
 * |-------------|-----------------------------------|--------------------------------------|
 * | None        | predecessor Completed (if any)    | evidence is not SetupError           |
 * | FailingTest | predecessor Completed (if any)    | evidence is ExpectedFailure          |
 * | MakePass    | predecessor Completed             | evidence is Passed                   |
 * | Cleanup     | predecessor Completed, fresh Pass | evidence is Passed, fresh run Passed |
 *
 * A FailingTest whose evidence shows the tests passing is rejected: the test
 * does not demonstrate the defect it was written for.
 *
 * Fresh runs go through the ITestRunner every time; a Cleanup task cannot
 * start or be accepted when no test runner is configured.
 *
 * @par Thread Safety
 * - Both checks may run concurrently; collaborators are internally
 *   synchronized.
 */
class TDDGuard
{
public:
    /**
     * @param tracker Queried for predecessor status.
     * @param test_runner Used for Cleanup's fresh runs; may be null.
     * @param classifier Classifies the evidence handed to accept().
     */
    TDDGuard(StatusTrackerPtr tracker,
             TestRunnerPtr test_runner,
             EvidenceClassifierPtr classifier);

    GuardDecision can_start(const Task& task) const;

    GuardDecision accept(const Task& task, const std::string& evidence) const;

private:
    GuardDecision require_fresh_pass(const char* stage) const;

    StatusTrackerPtr m_tracker;
    TestRunnerPtr m_test_runner;
    EvidenceClassifierPtr m_classifier;
};

using TDDGuardPtr = std::shared_ptr<const TDDGuard>;

} // namespace tddbatch
