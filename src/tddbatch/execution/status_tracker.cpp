/**
 * @file status_tracker.cpp
 */
#include "tddbatch/execution/status_tracker.hpp"
#include "tddbatch/common/scheduler_errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace tddbatch
{

namespace fs = std::filesystem;
using json = nlohmann::json;

// ============================================================================
// InMemoryStatusTracker
// ============================================================================

ExecutionRecord& InMemoryStatusTracker::record_locked(const TaskId& task_id)
{
    auto it = m_index.find(task_id);
    if (it == m_index.end())
    {
        ExecutionRecord record;
        record.task_id = task_id;
        m_records.push_back(std::move(record));
        it = m_index.emplace(task_id, m_records.size() - 1).first;
    }
    return m_records[it->second];
}

void InMemoryStatusTracker::mark_in_progress(const TaskId& task_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& record = record_locked(task_id);
    record.status = TaskStatus::InProgress;
    record.commit_ref.reset();
    record.reason.clear();
    record.evidence.clear();
    record.timestamp = std::chrono::system_clock::now();
    persist_locked();
}

void InMemoryStatusTracker::mark_completed(const TaskId& task_id,
                                           const std::optional<std::string>& commit_ref,
                                           const std::string& evidence)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& record = record_locked(task_id);
    record.status = TaskStatus::Completed;
    if (commit_ref)
    {
        record.commit_ref = commit_ref;
    }
    if (!evidence.empty())
    {
        record.evidence = evidence;
    }
    record.reason.clear();
    record.timestamp = std::chrono::system_clock::now();
    persist_locked();
}

void InMemoryStatusTracker::mark_failed(const TaskId& task_id, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& record = record_locked(task_id);
    record.status = TaskStatus::Failed;
    record.commit_ref.reset();
    record.reason = reason;
    record.timestamp = std::chrono::system_clock::now();
    persist_locked();
}

void InMemoryStatusTracker::mark_blocked(const TaskId& task_id, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& record = record_locked(task_id);
    record.status = TaskStatus::Blocked;
    record.commit_ref.reset();
    record.reason = reason;
    record.timestamp = std::chrono::system_clock::now();
    persist_locked();
}

ExecutionRecord InMemoryStatusTracker::query_status(const TaskId& task_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(task_id);
    if (it == m_index.end())
    {
        ExecutionRecord record;
        record.task_id = task_id;
        return record;
    }
    return m_records[it->second];
}

std::vector<ExecutionRecord> InMemoryStatusTracker::records() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

void InMemoryStatusTracker::record_checkpoint(const Checkpoint& checkpoint)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_checkpoints.push_back(checkpoint);
    persist_locked();
}

std::vector<Checkpoint> InMemoryStatusTracker::checkpoints() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_checkpoints;
}

void InMemoryStatusTracker::load_locked(std::vector<ExecutionRecord> records,
                                        std::vector<Checkpoint> checkpoints)
{
    m_index.clear();
    m_records = std::move(records);
    for (size_t i = 0; i < m_records.size(); ++i)
    {
        m_index[m_records[i].task_id] = i;
    }
    m_checkpoints = std::move(checkpoints);
}

// ============================================================================
// JsonFileStatusTracker
// ============================================================================

JsonFileStatusTracker::JsonFileStatusTracker(std::string path)
    : m_path{std::move(path)}
{
    load();
}

void JsonFileStatusTracker::load()
{
    std::ifstream input(m_path);
    if (!input)
    {
        spdlog::debug("status file {} not found, starting empty", m_path);
        return;
    }

    std::vector<ExecutionRecord> records;
    std::vector<Checkpoint> checkpoints;
    try
    {
        json doc = json::parse(input);
        for (const auto& item : doc.at("records"))
        {
            ExecutionRecord record;
            record.task_id = item.at("task_id").get<std::string>();
            auto status = task_status_from_string(item.at("status").get<std::string>());
            if (!status)
            {
                throw ConfigError("status file " + m_path + ": unknown status for " + record.task_id);
            }
            record.status = *status;
            if (item.contains("commit_ref") && !item.at("commit_ref").is_null())
            {
                record.commit_ref = item.at("commit_ref").get<std::string>();
            }
            record.evidence = item.value("evidence", std::string{});
            record.reason = item.value("reason", std::string{});
            record.timestamp = from_epoch_millis(item.value("timestamp_ms", int64_t{0}));
            records.push_back(std::move(record));
        }
        if (doc.contains("checkpoints"))
        {
            for (const auto& item : doc.at("checkpoints"))
            {
                Checkpoint checkpoint;
                checkpoint.group_index = item.at("group_index").get<size_t>();
                checkpoint.commit_ref = item.at("commit_ref").get<std::string>();
                checkpoint.timestamp = from_epoch_millis(item.value("timestamp_ms", int64_t{0}));
                checkpoint.task_ids = item.value("task_ids", std::vector<std::string>{});
                checkpoints.push_back(std::move(checkpoint));
            }
        }
    }
    catch (const json::exception& e)
    {
        throw ConfigError("status file " + m_path + " is corrupt: " + e.what());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    spdlog::info("loaded {} record(s) and {} checkpoint(s) from {}",
                 records.size(), checkpoints.size(), m_path);
    load_locked(std::move(records), std::move(checkpoints));
}

void JsonFileStatusTracker::persist_locked()
{
    json doc;
    doc["version"] = 1;
    doc["records"] = json::array();
    for (const auto& record : m_records)
    {
        json item;
        item["task_id"] = record.task_id;
        item["status"] = to_string(record.status);
        item["commit_ref"] = record.commit_ref ? json(*record.commit_ref) : json(nullptr);
        item["evidence"] = record.evidence;
        item["reason"] = record.reason;
        item["timestamp_ms"] = to_epoch_millis(record.timestamp);
        doc["records"].push_back(std::move(item));
    }
    doc["checkpoints"] = json::array();
    for (const auto& checkpoint : m_checkpoints)
    {
        json item;
        item["group_index"] = checkpoint.group_index;
        item["commit_ref"] = checkpoint.commit_ref;
        item["timestamp_ms"] = to_epoch_millis(checkpoint.timestamp);
        item["task_ids"] = checkpoint.task_ids;
        doc["checkpoints"].push_back(std::move(item));
    }

    const fs::path target{m_path};
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path());
    }
    const fs::path temp{m_path + ".tmp"};
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output)
        {
            throw std::runtime_error("cannot write status file " + temp.string());
        }
        output << doc.dump(2) << "\n";
        if (!output)
        {
            throw std::runtime_error("failed writing status file " + temp.string());
        }
    }
    fs::rename(temp, target);
}

} // namespace tddbatch
