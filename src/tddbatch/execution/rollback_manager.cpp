/**
 * @file rollback_manager.cpp
 */
#include "tddbatch/execution/rollback_manager.hpp"
#include "tddbatch/common/scheduler_errors.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace tddbatch
{

namespace fs = std::filesystem;
using json = nlohmann::json;

RollbackManager::RollbackManager(StatusTrackerPtr tracker,
                                 WorkspacePtr workspace,
                                 std::string ledger_file)
    : m_tracker{std::move(tracker)}
    , m_workspace{std::move(workspace)}
    , m_ledger_file{std::move(ledger_file)}
{
    if (!m_tracker)
    {
        throw std::invalid_argument("RollbackManager requires a status tracker");
    }
    if (m_ledger_file.empty())
    {
        return;
    }

    const fs::path parent = fs::path{m_ledger_file}.parent_path();
    std::error_code ec;
    if (!parent.empty())
    {
        fs::create_directories(parent, ec);
    }
    std::ofstream ledger(m_ledger_file, std::ios::app);
    if (!ledger)
    {
        throw ConfigError("cannot open failure ledger " + m_ledger_file);
    }
}

void RollbackManager::rollback(const Task& task,
                               const std::string& reason,
                               const std::vector<std::string>& touched_paths)
{
    spdlog::warn("rolling back {}: {}", task.id, reason);
    m_tracker->mark_failed(task.id, reason);

    // The ledger entry is written even when the discard fails.
    std::exception_ptr discard_error;
    try
    {
        discard(task, touched_paths);
    }
    catch (const CommitError&)
    {
        discard_error = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lock(m_ledger_mutex);
        append_locked(FailureEntry{task.id, reason, std::chrono::system_clock::now()});
    }
    if (discard_error)
    {
        std::rethrow_exception(discard_error);
    }
}

void RollbackManager::discard(const Task& task, const std::vector<std::string>& touched_paths)
{
    if (!m_workspace)
    {
        return;
    }
    if (touched_paths.empty())
    {
        spdlog::debug("{} reported no touched paths; nothing to discard", task.id);
        return;
    }

    std::lock_guard<std::mutex> lock(m_workspace_mutex);
    m_workspace->discard(touched_paths);
    spdlog::info("discarded {} path(s) touched by {}", touched_paths.size(), task.id);
}

void RollbackManager::block(const Task& task, const std::string& reason)
{
    spdlog::warn("blocking {}: {}", task.id, reason);
    m_tracker->mark_blocked(task.id, reason);

    std::lock_guard<std::mutex> lock(m_ledger_mutex);
    append_locked(FailureEntry{task.id, reason, std::chrono::system_clock::now()});
}

void RollbackManager::record_failure(const TaskId& task_id, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(m_ledger_mutex);
    append_locked(FailureEntry{task_id, reason, std::chrono::system_clock::now()});
}

std::vector<FailureEntry> RollbackManager::ledger() const
{
    std::lock_guard<std::mutex> lock(m_ledger_mutex);
    return m_ledger;
}

void RollbackManager::append_locked(const FailureEntry& entry)
{
    m_ledger.push_back(entry);
    if (!m_ledger_file.empty())
    {
        json line = {
            {"task_id", entry.task_id},
            {"reason", entry.reason},
            {"timestamp_ms", to_epoch_millis(entry.timestamp)},
        };
        std::ofstream out(m_ledger_file, std::ios::app);
        out << line.dump() << '\n';
        out.flush();
        if (!out)
        {
            throw ConfigError(fmt::format("cannot append {} to failure ledger {}",
                                          entry.task_id, m_ledger_file));
        }
    }
}

} // namespace tddbatch
