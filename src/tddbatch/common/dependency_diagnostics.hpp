/**
 * @file dependency_diagnostics.hpp
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/task.hpp"

namespace tddbatch
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< Blocking issue that prevents scheduling.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    UnknownPredecessor,     ///< Explicit reference to an id not in the list.
    ForwardReference,       ///< Explicit reference to a task that comes later.
    SelfReference,          ///< Task references itself.
    PhaseMismatch,          ///< Referenced task has the wrong phase for the chain.
    MissingFailingTest,     ///< MakePass with no open FailingTest in its chain.
    MissingMakePass,        ///< Cleanup with no open MakePass in its chain.
    AmbiguousPredecessor,   ///< Several open candidates; an explicit reference is required.
    UnpairedFailingTest     ///< FailingTest that no MakePass ever consumes.
};

const char* to_string(DiagnosticCategory category) noexcept;

/**
 * @brief A single diagnostic item (error or warning).
 *
 * @details
 * `involved_tasks` lists the offending task first, followed by any
 * candidate or referenced tasks relevant to the issue.
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Task ids involved in this issue, offending task first.
    std::vector<TaskId> involved_tasks;

    /// Origin of the reference that caused the issue (if any).
    RefOrigin origin{RefOrigin::None};
};

// ============================================================================
// DependencyDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected while resolving phase chains.
 *
 * @details
 * `DependencyDiagnostics` contains all errors and warnings detected by
 * `DependencyResolver::resolve()`. The resolver always walks the whole task
 * list before reporting, so every broken chain is enumerated, not just the
 * first one.
 *
 * @par Error vs Warning
 * - **Errors** prevent scheduling: no task is dispatched while any error is
 *   present.
 * - **Warnings** are reported but do not block, for example a FailingTest
 *   task that is never paired with a MakePass task.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class DependencyDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if the task list can be scheduled.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Ids of every task named as the offender of an error item.
     * @return Ids in the order the errors were found, without duplicates.
     */
    std::vector<TaskId> offending_tasks() const
    {
        std::vector<TaskId> result;
        for (const auto& item : m_errors)
        {
            if (!item.involved_tasks.empty() &&
                std::find(result.begin(), result.end(), item.involved_tasks.front()) == result.end())
            {
                result.push_back(item.involved_tasks.front());
            }
        }
        return result;
    }

    // Allow DependencyResolver to populate diagnostics
    friend class DependencyResolver;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace tddbatch
