/**
 * @file dependency_resolver.cpp
 */
#include "tddbatch/common/dependency_resolver.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace tddbatch
{

const char* to_string(DiagnosticCategory category) noexcept
{
    switch (category)
    {
        case DiagnosticCategory::UnknownPredecessor:
            return "unknown-predecessor";
        case DiagnosticCategory::ForwardReference:
            return "forward-reference";
        case DiagnosticCategory::SelfReference:
            return "self-reference";
        case DiagnosticCategory::PhaseMismatch:
            return "phase-mismatch";
        case DiagnosticCategory::MissingFailingTest:
            return "missing-failing-test";
        case DiagnosticCategory::MissingMakePass:
            return "missing-make-pass";
        case DiagnosticCategory::AmbiguousPredecessor:
            return "ambiguous-predecessor";
        case DiagnosticCategory::UnpairedFailingTest:
            return "unpaired-failing-test";
    }
    return "unknown";
}

namespace
{

/// Open (not yet consumed) chain members, per domain, in list order.
using OpenChains = std::map<DomainTag, std::vector<TaskId>>;

void erase_open(OpenChains& chains, const TaskId& id)
{
    for (auto& [domain, ids] : chains)
    {
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    }
}

std::vector<TaskId> all_open(const OpenChains& chains, const TaskList& tasks,
                             const std::unordered_map<TaskId, size_t>& index)
{
    std::vector<TaskId> result;
    for (const auto& [domain, ids] : chains)
    {
        result.insert(result.end(), ids.begin(), ids.end());
    }
    // Report candidates in list order regardless of domain.
    std::sort(result.begin(), result.end(),
              [&](const TaskId& a, const TaskId& b) { return index.at(a) < index.at(b); });
    return result;
}

DiagnosticItem make_error(DiagnosticCategory category, std::string message,
                          std::vector<TaskId> involved, RefOrigin origin)
{
    return DiagnosticItem{DiagnosticSeverity::Error, category, std::move(message),
                          std::move(involved), origin};
}

} // namespace

TaskList DependencyResolver::analyze(const TaskList& tasks, DependencyDiagnostics& diagnostics) const
{
    std::unordered_map<TaskId, size_t> index;
    for (size_t i = 0; i < tasks.size(); ++i)
    {
        index.emplace(tasks[i].id, i);
    }

    OpenChains open_failing;
    OpenChains open_make_pass;

    TaskList resolved;
    resolved.reserve(tasks.size());

    for (size_t i = 0; i < tasks.size(); ++i)
    {
        Task task = tasks[i];
        const bool needs_chain = task.phase == TddPhase::MakePass || task.phase == TddPhase::Cleanup;
        const TddPhase wanted = task.phase == TddPhase::MakePass ? TddPhase::FailingTest
                                                                 : TddPhase::MakePass;
        OpenChains& candidates_by_domain =
            task.phase == TddPhase::MakePass ? open_failing : open_make_pass;

        if (task.predecessor)
        {
            const TaskId& ref = *task.predecessor;
            auto it = index.find(ref);
            if (ref == task.id)
            {
                diagnostics.m_errors.push_back(make_error(
                    DiagnosticCategory::SelfReference,
                    task.id + " references itself as its predecessor",
                    {task.id}, task.predecessor_origin));
            }
            else if (it == index.end())
            {
                diagnostics.m_errors.push_back(make_error(
                    DiagnosticCategory::UnknownPredecessor,
                    task.id + " references unknown task " + ref,
                    {task.id, ref}, task.predecessor_origin));
            }
            else if (it->second > i)
            {
                diagnostics.m_errors.push_back(make_error(
                    DiagnosticCategory::ForwardReference,
                    task.id + " references " + ref + ", which comes later in the list",
                    {task.id, ref}, task.predecessor_origin));
            }
            else if (needs_chain && tasks[it->second].phase != wanted)
            {
                diagnostics.m_errors.push_back(make_error(
                    DiagnosticCategory::PhaseMismatch,
                    std::string(task.id) + " (" + to_string(task.phase) + ") must follow a " +
                        to_string(wanted) + " task, but " + ref + " is " +
                        to_string(tasks[it->second].phase),
                    {task.id, ref}, task.predecessor_origin));
            }
            else if (needs_chain)
            {
                erase_open(candidates_by_domain, ref);
            }
        }
        else if (needs_chain)
        {
            std::vector<TaskId> candidates = candidates_by_domain[task.domain];
            if (candidates.empty())
            {
                candidates = all_open(candidates_by_domain, tasks, index);
            }

            if (candidates.size() == 1)
            {
                task.predecessor = candidates.front();
                task.predecessor_origin = RefOrigin::Inferred;
                erase_open(candidates_by_domain, candidates.front());
                spdlog::debug("inferred predecessor {} for {} ({})",
                              candidates.front(), task.id, to_string(task.phase));
            }
            else if (candidates.empty())
            {
                const auto category = task.phase == TddPhase::MakePass
                                          ? DiagnosticCategory::MissingFailingTest
                                          : DiagnosticCategory::MissingMakePass;
                diagnostics.m_errors.push_back(make_error(
                    category,
                    std::string(task.id) + " (" + to_string(task.phase) + ") has no preceding open " +
                        to_string(wanted) + " task in its chain",
                    {task.id}, RefOrigin::None));
            }
            else
            {
                std::vector<TaskId> involved{task.id};
                involved.insert(involved.end(), candidates.begin(), candidates.end());
                diagnostics.m_errors.push_back(make_error(
                    DiagnosticCategory::AmbiguousPredecessor,
                    std::string(task.id) + " (" + to_string(task.phase) + ") could follow any of " +
                        join_ids(candidates) + "; add an explicit reference",
                    std::move(involved), RefOrigin::None));
            }
        }

        if (task.phase == TddPhase::FailingTest)
        {
            open_failing[task.domain].push_back(task.id);
        }
        else if (task.phase == TddPhase::MakePass)
        {
            // Even a broken MakePass opens its chain, so a following Cleanup
            // is not reported a second time for the same break.
            open_make_pass[task.domain].push_back(task.id);
        }

        resolved.push_back(std::move(task));
    }

    for (const auto& id : all_open(open_failing, tasks, index))
    {
        diagnostics.m_warnings.push_back(DiagnosticItem{
            DiagnosticSeverity::Warning, DiagnosticCategory::UnpairedFailingTest,
            id + " is a failing-test task that no make-pass task follows", {id},
            RefOrigin::None});
    }

    return resolved;
}

std::shared_ptr<DependencyDiagnostics> DependencyResolver::get_diagnostics(const TaskList& tasks) const
{
    auto diagnostics = std::make_shared<DependencyDiagnostics>();
    analyze(tasks, *diagnostics);
    return diagnostics;
}

TaskList DependencyResolver::resolve(const TaskList& tasks) const
{
    auto diagnostics = std::make_shared<DependencyDiagnostics>();
    TaskList resolved = analyze(tasks, *diagnostics);

    for (const auto& warning : diagnostics->warnings())
    {
        spdlog::warn("dependency check: {}", warning.message);
    }

    if (diagnostics->has_errors())
    {
        std::ostringstream oss;
        oss << "Dependency validation failed with " << diagnostics->errors().size() << " error(s):\n";
        for (const auto& err : diagnostics->errors())
        {
            oss << "  - [" << to_string(err.category) << "] " << err.message << "\n";
        }
        throw DependencyError(oss.str(), diagnostics);
    }
    return resolved;
}

} // namespace tddbatch
