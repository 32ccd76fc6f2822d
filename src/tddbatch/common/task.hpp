/**
 * @file task.hpp
 */
#pragma once
#include "tddbatch/common/common.hpp"

namespace tddbatch
{

// ============================================================================
// Identifier type aliases
// ============================================================================

/**
 * @brief Type alias for task identifiers.
 *
 * @details
 * `TaskId` is the identifier exactly as written in the raw task list, for
 * example `T001`. The numeric part is kept separately in `Task::number` and
 * is what the parser checks for strict monotonicity.
 */
using TaskId = std::string;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief TDD phase a task may declare.
 *
 * @details
 * A complete chain is FailingTest -> MakePass -> Cleanup. Tasks with phase
 * `None` are ordinary independent work and are the only tasks that may share
 * a batch with other tasks.
 */
enum class TddPhase
{
    None,
    FailingTest,
    MakePass,
    Cleanup
};

/**
 * @brief Domain classification of a task.
 *
 * @details
 * Domains are produced by an `IDomainClassifier` from the task description.
 * Classification is heuristic; the only scheduling consequence is that
 * independent tasks are only batched together when their domains match.
 */
enum class DomainTag
{
    Backend,
    Frontend,
    Database,
    Test,
    General
};

/**
 * @brief How a task's predecessor reference was obtained.
 *
 * @details
 * Explicit references come from the task list author. Inferred references
 * are produced by the DependencyResolver when a MakePass or Cleanup task has
 * exactly one open candidate in its chain. Diagnostics name inferred
 * references so that a wrong inference can be corrected by making it
 * explicit.
 */
enum class RefOrigin
{
    None,
    Explicit,
    Inferred
};

// ============================================================================
// Task
// ============================================================================

/**
 * @brief One declarative work item from the task list.
 *
 * @details
 * Tasks are created by `TaskParser` and are never mutated afterwards. The
 * `DependencyResolver` returns annotated copies with `predecessor` and
 * `predecessor_origin` filled in.
 */
struct Task
{
    TaskId id;
    uint64_t number{0};
    std::string description;
    TddPhase phase{TddPhase::None};
    DomainTag domain{DomainTag::General};
    std::optional<TaskId> predecessor;
    RefOrigin predecessor_origin{RefOrigin::None};

    /// 1-based line number in the raw task list (0 when built in code).
    size_t line_number{0};

    bool is_phase_bound() const noexcept
    {
        return phase != TddPhase::None;
    }
};

using TaskList = std::vector<Task>;

// ============================================================================
// String conversions
// ============================================================================

const char* to_string(TddPhase phase) noexcept;
const char* to_string(DomainTag domain) noexcept;
const char* to_string(RefOrigin origin) noexcept;

/**
 * @brief Parse a domain name (case-insensitive).
 * @return The domain, or std::nullopt if the name is not recognized.
 */
std::optional<DomainTag> domain_from_string(const std::string& name);

/**
 * @brief Join task ids with a separator, for log and error messages.
 */
std::string join_ids(const std::vector<TaskId>& ids, const std::string& separator = ", ");

} // namespace tddbatch
