/**
 * @file dependency_resolver.hpp
 * @brief DependencyResolver validates and links TDD phase chains.
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/dependency_diagnostics.hpp"
#include "tddbatch/common/scheduler_errors.hpp"
#include "tddbatch/common/task.hpp"

namespace tddbatch
{

/**
 * @brief Validates phase chains and resolves predecessor references.
 *
 * @details
 * The resolver walks the task list once, in order, and never reorders it:
 * the author's ordering is the scheduling backbone. For each chain key (the
 * task's domain) it keeps the FailingTest tasks that no MakePass has
 * consumed yet, and the MakePass tasks that no Cleanup has consumed yet.
 *
 * @par Explicit references
 * The referenced task must exist and precede the referencing task. A
 * MakePass must reference a FailingTest and a Cleanup must reference a
 * MakePass. Tasks with phase None or FailingTest may reference any earlier
 * task.
 *
 * @par Inference
 * A MakePass (Cleanup) task without a reference is linked to the single open
 * FailingTest (MakePass) of its own domain chain. When its own chain has no
 * open candidate, the open candidates of all chains are considered. Inference
 * fails closed: no candidate is a Missing* error and more than one candidate
 * is an AmbiguousPredecessor error; the resolver never guesses a tie-break.
 *
 * @par Usage
 * 1. Optionally call get_diagnostics() to inspect errors and warnings.
 * 2. Call resolve() to obtain the annotated task list.
 *
 * @par Thread Safety
 * - Stateless; concurrent calls are safe.
 */
class DependencyResolver
{
public:
    /**
     * @brief Validate the task list and return annotated copies.
     *
     * @return Tasks in input order with `predecessor` and
     *         `predecessor_origin` resolved.
     * @throws DependencyError enumerating every broken chain.
     */
    TaskList resolve(const TaskList& tasks) const;

    /**
     * @brief Get diagnostics without throwing.
     */
    std::shared_ptr<DependencyDiagnostics> get_diagnostics(const TaskList& tasks) const;

private:
    TaskList analyze(const TaskList& tasks, DependencyDiagnostics& diagnostics) const;
};

} // namespace tddbatch
